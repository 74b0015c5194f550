#ifndef WZB_CONFIG_HPP
#define WZB_CONFIG_HPP

#include <chrono>
#include <string>
#include "nlohmann/json.hpp"

#include "../crypto/crypto_provider.hpp"

constexpr const char* DEFAULT_BANK_ID = "WZB";
constexpr const char* DEFAULT_BASE_URL = "https://openapi.wzbank.cn/prdApiGW/";

struct ClientConfig {
    std::string app_id;
    std::string bank_id = DEFAULT_BANK_ID;
    std::string base_url = DEFAULT_BASE_URL;
    std::chrono::seconds timeout{30};
    bool debug = false;

    // Verify x-aob-signature on responses when the bank sends one.
    bool verify_response_signature = true;
    // Treat a response without x-aob-signature as a SignatureError instead of skipping.
    bool require_response_signature = false;
    // Fill in mesgId/mesgDate/mesgTime the caller did not provide.
    bool inject_message_metadata = true;

    std::string log_file;
    std::string ca_file;

    KeyMaterial keys;
};

/**
 * @brief Loads a client configuration from a JSON file.
 *
 * Unknown keys are ignored; missing optional keys keep their defaults.
 * @throws ConfigError if the file is unreadable, not JSON, or lacks required values.
 */
ClientConfig load_config(const std::string& path);

// Same, from an already parsed document.
ClientConfig config_from_json(const nlohmann::json& j);

/**
 * @brief Checks required values and normalizes base_url to end in exactly one '/'.
 * @throws ConfigError on the first problem found.
 */
void validate_config(ClientConfig& config);

#endif // WZB_CONFIG_HPP
