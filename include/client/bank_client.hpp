#ifndef WZB_BANK_CLIENT_HPP
#define WZB_BANK_CLIENT_HPP

#include <memory>
#include <string>
#include <vector>

#include "message_metadata.hpp"
#include "../common/canonical_json.hpp"
#include "../common/config.hpp"
#include "../crypto/crypto_provider.hpp"
#include "../network/protocol.hpp"
#include "../network/transport.hpp"

// States one gateway call moves through. FAILED is terminal and reachable from any state.
enum class CallState {
    BUILDING,
    BODY_ENCRYPTED,
    SIGNED,
    SENT,
    RESPONSE_PARSED,
    VERIFIED,
    VERIFY_SKIPPED,
    DECRYPTED,
    DONE,
    FAILED
};

const char* state_to_string(CallState state);

// How the response signature was treated. Anything but VERIFIED means the
// caller is trusting the response on the strength of TLS alone.
enum class Verification {
    VERIFIED,
    SKIPPED_NO_SIGNATURE,
    SKIPPED_BY_CALLER
};

const char* verification_to_string(Verification verification);

struct BankResponse {
    FieldMap data;
    // false when the response had no bizContent and `data` is the raw body.
    bool decrypted = false;
    Verification verification = Verification::SKIPPED_BY_CALLER;
    int http_status = 0;
    std::vector<CallState> trace;
};

struct PostOptions {
    // Extra request headers; allow-listed ones take part in the signature.
    HeaderList headers;
    bool verify_response_signature = true;
    bool inject_metadata = true;
};

// The signed request, ready for the transport.
struct PreparedRequest {
    HttpRequest http;
    FieldMap body;  // plain business body after metadata injection
    std::string biz_content;
    FieldMap sign_map;
    std::string signature;
};

/**
 * @brief Turns business bodies into signed, encrypted gateway calls and back.
 *
 * Holds only immutable configuration and shared, read-only collaborators, so
 * one instance may serve concurrent calls. Nothing is retried.
 */
class BankClient {
public:
    BankClient(ClientConfig config,
               std::shared_ptr<CryptoProvider> crypto,
               std::shared_ptr<Transport> transport,
               std::shared_ptr<MetadataSource> metadata = std::make_shared<ClockMetadataSource>());

    // Wires SmCryptoProvider and HttpClient from the configuration.
    explicit BankClient(ClientConfig config);

    /**
     * @brief Runs one full call: encrypt, sign, send, verify, decrypt.
     * @param path Endpoint path, with or without a leading '/'.
     * @throws BankError subclasses identifying the failed phase.
     */
    BankResponse post(const std::string& path, const FieldMap& body, const PostOptions& options = {}) const;

    // Request half only (no network). Used for offline signature generation.
    PreparedRequest prepare(const std::string& path, const FieldMap& body, const PostOptions& options = {}) const;

    const ClientConfig& config() const { return config_; }

private:
    class CallTrace;

    PreparedRequest prepare(const std::string& path, const FieldMap& body, const PostOptions& options,
                            CallTrace& trace) const;
    BankResponse receive(const HttpResponse& response, bool verify, CallTrace& trace) const;

    std::string endpoint_url(const std::string& path) const;
    HeaderList request_headers(const HeaderList& extra) const;

    ClientConfig config_;
    std::shared_ptr<CryptoProvider> crypto_;
    std::shared_ptr<Transport> transport_;
    std::shared_ptr<MetadataSource> metadata_;
};

#endif // WZB_BANK_CLIENT_HPP
