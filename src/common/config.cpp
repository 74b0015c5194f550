#include "common/config.hpp"
#include "common/errors.hpp"
#include <fstream>

using json = nlohmann::json;

void from_json(const json& j, KeyMaterial& keys) {
    keys.sm2_private_key = j.value("sm2_private_key", "");
    keys.sm2_bank_public_key = j.value("sm2_bank_public_key", "");
    keys.sm4_key = j.value("sm4_key", "");
    keys.sm4_iv = j.value("sm4_iv", "");
}

void from_json(const json& j, ClientConfig& c) {
    c.app_id = j.value("app_id", "");
    c.bank_id = j.value("bank_id", c.bank_id);
    c.base_url = j.value("base_url", c.base_url);
    c.timeout = std::chrono::seconds(j.value("timeout_seconds", static_cast<long>(c.timeout.count())));
    c.debug = j.value("debug", c.debug);
    c.verify_response_signature = j.value("verify_response_signature", c.verify_response_signature);
    c.require_response_signature = j.value("require_response_signature", c.require_response_signature);
    c.inject_message_metadata = j.value("inject_message_metadata", c.inject_message_metadata);
    c.log_file = j.value("log_file", c.log_file);
    c.ca_file = j.value("ca_file", c.ca_file);
    if (j.contains("keys")) {
        j.at("keys").get_to(c.keys);
    }
}

ClientConfig config_from_json(const json& j) {
    if (!j.is_object()) {
        throw ConfigError("Configuration must be a JSON object");
    }
    ClientConfig config;
    try {
        from_json(j, config);
    } catch (const json::exception& e) {
        throw ConfigError(std::string("Invalid configuration value: ") + e.what());
    }
    validate_config(config);
    return config;
}

ClientConfig load_config(const std::string& path) {
    std::ifstream read_file(path);
    if (!read_file.is_open()) {
        throw ConfigError("Cannot open configuration file: " + path);
    }
    json config_json;
    try {
        config_json = json::parse(read_file);
    } catch (const json::parse_error& e) {
        throw ConfigError("Could not parse configuration file " + path + ": " + e.what());
    }
    return config_from_json(config_json);
}

void validate_config(ClientConfig& config) {
    if (config.app_id.empty()) {
        throw ConfigError("app_id is required");
    }
    if (config.bank_id.empty()) {
        throw ConfigError("bank_id must not be empty");
    }
    if (config.base_url.empty()) {
        throw ConfigError("base_url must not be empty");
    }
    if (config.timeout.count() <= 0) {
        throw ConfigError("timeout_seconds must be positive");
    }
    if (config.keys.sm2_private_key.empty()) {
        throw ConfigError("keys.sm2_private_key is required");
    }
    if (config.keys.sm4_key.empty() || config.keys.sm4_iv.empty()) {
        throw ConfigError("keys.sm4_key and keys.sm4_iv are required");
    }
    while (!config.base_url.empty() && config.base_url.back() == '/') {
        config.base_url.pop_back();
    }
    config.base_url += '/';
}
