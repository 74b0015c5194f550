#include "cli/cli.hpp"
#include "client/bank_client.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "crypto/hasher.hpp"
#include "network/http_client.hpp"
#include <fstream>
#include <sstream>

namespace {

class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& usage) : std::runtime_error(usage) {}
};

void expect_args(const std::vector<std::string>& args, size_t count, const char* usage) {
    if (args.size() != count) {
        throw UsageError(usage);
    }
}

} // namespace

FieldMap read_body_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw RequestError("Cannot open body file: " + path);
    }
    std::stringstream content;
    content << file.rdbuf();
    try {
        return CanonicalJson::decode(content.str());
    } catch (const DecodeError& e) {
        throw RequestError("Body file " + path + " is not a JSON object: " + e.what());
    }
}

CLI::CLI(ClientConfig config, std::shared_ptr<Transport> transport, std::ostream& out)
    : config_(std::move(config)),
      crypto_(std::make_shared<SmCryptoProvider>(config_.keys)),
      transport_(std::move(transport)),
      out_(out) {
    if (!transport_) {
        transport_ = std::make_shared<HttpClient>(HttpClient::Options{config_.ca_file, true});
    }
}

void CLI::print_help(std::ostream& out) {
    out << "Usage: wzbank <command> <config.json> [args]\n"
        << "Commands:\n"
        << "  sign <path> <body.json>   - Build and sign a request offline\n"
        << "  decrypt <hex>             - Decrypt a bizContent value\n"
        << "  pubkey                    - Show the public key and ZA for the private key\n"
        << "  post <path> <body.json>   - Send a request to the gateway\n";
}

int CLI::run(const std::string& command, const std::vector<std::string>& args) {
    try {
        if (command == "sign") cmd_sign(args);
        else if (command == "decrypt") cmd_decrypt(args);
        else if (command == "pubkey") cmd_pubkey(args);
        else if (command == "post") cmd_post(args);
        else {
            std::cerr << "Unknown command: " << command << std::endl;
            print_help(std::cerr);
            return 1;
        }
    } catch (const UsageError& e) {
        std::cerr << "Usage: " << e.what() << std::endl;
        return 1;
    } catch (const HttpError& e) {
        std::cerr << "HTTP error " << e.status_code() << " (" << phase_to_string(e.phase()) << "): "
                  << e.body() << std::endl;
        return 3;
    } catch (const BankError& e) {
        std::cerr << "Error (" << phase_to_string(e.phase()) << "): " << e.what() << std::endl;
        return 2;
    }
    return 0;
}

void CLI::cmd_sign(const std::vector<std::string>& args) {
    expect_args(args, 2, "sign <path> <body.json>");
    FieldMap body = read_body_file(args[1]);

    BankClient client(config_, crypto_, transport_);
    PreparedRequest prepared = client.prepare(args[0], body);

    out_ << "Public key: " << Hasher::to_hex(crypto_->signer().public_key()) << "\n"
         << "URL: " << prepared.http.url << "\n"
         << "Headers:\n";
    for (const auto& header : prepared.http.headers) {
        out_ << "  " << header.first << ": " << header.second << "\n";
    }
    out_ << "Plain body: " << CanonicalJson::encode(prepared.body) << "\n"
         << "Signed data: " << CanonicalJson::encode(prepared.sign_map) << "\n"
         << "bizContent: " << prepared.biz_content << "\n"
         << "Request body: " << prepared.http.body << "\n";

    bool round_trip = CanonicalJson::encode(crypto_->codec().decrypt_body(prepared.biz_content)) ==
                      CanonicalJson::encode(prepared.body);
    bool self_verify = crypto_->signer().verify(CanonicalJson::encode(prepared.sign_map), prepared.signature);
    out_ << "Decryption check: " << (round_trip ? "OK" : "MISMATCH") << "\n"
         << "Signature self-check: " << (self_verify ? "OK" : "FAILED") << std::endl;
}

void CLI::cmd_decrypt(const std::vector<std::string>& args) {
    expect_args(args, 1, "decrypt <hex>");
    out_ << CanonicalJson::encode(crypto_->codec().decrypt_body(args[0])) << std::endl;
}

void CLI::cmd_pubkey(const std::vector<std::string>& args) {
    expect_args(args, 0, "pubkey");
    out_ << "Public key: " << Hasher::to_hex(crypto_->signer().public_key()) << "\n"
         << "ZA: " << Hasher::to_hex(crypto_->signer().identity_digest()) << std::endl;
}

void CLI::cmd_post(const std::vector<std::string>& args) {
    expect_args(args, 2, "post <path> <body.json>");
    FieldMap body = read_body_file(args[1]);

    BankClient client(config_, crypto_, transport_);
    BankResponse response = client.post(args[0], body);

    out_ << "HTTP " << response.http_status << "\n"
         << "Signature: " << verification_to_string(response.verification) << "\n"
         << "Decrypted: " << (response.decrypted ? "yes" : "no") << "\n"
         << response.data.dump(2, ' ', false, nlohmann::ordered_json::error_handler_t::replace) << std::endl;
}
