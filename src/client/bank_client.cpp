#include "client/bank_client.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "network/http_client.hpp"
#include <sstream>

const char* state_to_string(CallState state) {
    switch (state) {
        case CallState::BUILDING: return "Building";
        case CallState::BODY_ENCRYPTED: return "BodyEncrypted";
        case CallState::SIGNED: return "Signed";
        case CallState::SENT: return "Sent";
        case CallState::RESPONSE_PARSED: return "ResponseParsed";
        case CallState::VERIFIED: return "Verified";
        case CallState::VERIFY_SKIPPED: return "VerifySkipped";
        case CallState::DECRYPTED: return "Decrypted";
        case CallState::DONE: return "Done";
        case CallState::FAILED: return "Failed";
    }
    return "Unknown";
}

const char* verification_to_string(Verification verification) {
    switch (verification) {
        case Verification::VERIFIED: return "verified";
        case Verification::SKIPPED_NO_SIGNATURE: return "skipped (no signature)";
        case Verification::SKIPPED_BY_CALLER: return "skipped (disabled)";
    }
    return "unknown";
}

// Per-call state record. Lives on the stack of one post() call.
class BankClient::CallTrace {
public:
    CallTrace() { states_.push_back(CallState::BUILDING); }

    void advance(CallState next) {
        LOG_DEBUG("Call state ", state_to_string(states_.back()), " -> ", state_to_string(next));
        states_.push_back(next);
    }

    CallState current() const { return states_.back(); }
    const std::vector<CallState>& states() const { return states_; }

private:
    std::vector<CallState> states_;
};

namespace {

std::string dump_headers(const HeaderList& headers) {
    std::stringstream ss;
    for (const auto& header : headers) {
        ss << "\n  " << header.first << ": ";
        if (header.first == HEADER_SIGNATURE || header.first == HEADER_AUTHORIZATION ||
            header.first == HEADER_ACCESS_TOKEN) {
            ss << MASKED;
        } else {
            ss << header.second;
        }
    }
    return ss.str();
}

} // namespace

BankClient::BankClient(ClientConfig config,
                       std::shared_ptr<CryptoProvider> crypto,
                       std::shared_ptr<Transport> transport,
                       std::shared_ptr<MetadataSource> metadata)
    : config_(std::move(config)),
      crypto_(std::move(crypto)),
      transport_(std::move(transport)),
      metadata_(std::move(metadata)) {
    if (!crypto_ || !transport_) {
        throw ConfigError("BankClient needs a crypto provider and a transport");
    }
    if (config_.inject_message_metadata && !metadata_) {
        throw ConfigError("Message metadata injection is enabled but no metadata source was given");
    }
    validate_config(config_);
}

BankClient::BankClient(ClientConfig config)
    : BankClient(config,
                 std::make_shared<SmCryptoProvider>(config.keys),
                 std::make_shared<HttpClient>(HttpClient::Options{config.ca_file, true})) {}

std::string BankClient::endpoint_url(const std::string& path) const {
    size_t start = 0;
    while (start < path.size() && path[start] == '/') {
        ++start;
    }
    return config_.base_url + path.substr(start);
}

HeaderList BankClient::request_headers(const HeaderList& extra) const {
    HeaderList headers = {
        {HEADER_CONTENT_TYPE, CONTENT_TYPE_JSON},
        {HEADER_ACCEPT, CONTENT_TYPE_JSON},
        {HEADER_APP_ID, config_.app_id},
        {HEADER_BANK_ID, config_.bank_id}
    };
    for (const auto& header : extra) {
        set_header(headers, header.first, header.second);
    }
    return headers;
}

PreparedRequest BankClient::prepare(const std::string& path, const FieldMap& body,
                                    const PostOptions& options) const {
    CallTrace trace;
    return prepare(path, body, options, trace);
}

PreparedRequest BankClient::prepare(const std::string& path, const FieldMap& body,
                                    const PostOptions& options, CallTrace& trace) const {
    if (!body.is_object()) {
        throw RequestError("Request body must be a JSON object");
    }

    PreparedRequest prepared;
    prepared.body = body;
    if (config_.inject_message_metadata && options.inject_metadata) {
        MessageMetadata metadata;
        try {
            metadata = metadata_->next();
        } catch (const BankError&) {
            throw;
        } catch (const std::exception& e) {
            throw RequestError(std::string("Message metadata generation failed: ") + e.what());
        }
        int added = inject_metadata(prepared.body, metadata);
        if (added > 0) {
            LOG_DEBUG("Added ", added, " message metadata field(s)");
        }
    }

    std::string plain = CanonicalJson::encode(prepared.body);
    LOG_DEBUG("Request ", path, " business body: ", plain);

    try {
        prepared.biz_content = crypto_->encrypt(plain);
    } catch (const BankError&) {
        throw;
    } catch (const std::exception& e) {
        throw EncryptError(std::string("Body encryption failed: ") + e.what());
    }
    trace.advance(CallState::BODY_ENCRYPTED);

    HeaderList headers = request_headers(options.headers);
    prepared.sign_map = build_sign_map(headers, prepared.biz_content);
    std::string signed_text = CanonicalJson::encode(prepared.sign_map);
    LOG_DEBUG("Signing: ", signed_text);

    try {
        prepared.signature = crypto_->sign(signed_text);
    } catch (const BankError&) {
        throw;
    } catch (const std::exception& e) {
        throw SignatureError(CallPhase::SIGN, std::string("Signing failed: ") + e.what());
    }
    set_header(headers, HEADER_SIGNATURE, prepared.signature);
    trace.advance(CallState::SIGNED);

    prepared.http.method = "POST";
    prepared.http.url = endpoint_url(path);
    prepared.http.headers = std::move(headers);
    prepared.http.body = CanonicalJson::encode(make_envelope_body(prepared.biz_content));
    prepared.http.timeout = config_.timeout;
    return prepared;
}

BankResponse BankClient::receive(const HttpResponse& response, bool verify, CallTrace& trace) const {
    if (!response.ok()) {
        throw HttpError(response.status, response.body);
    }

    FieldMap payload;
    try {
        payload = FieldMap::parse(response.body);
    } catch (const nlohmann::json::parse_error&) {
        throw HttpError(response.status, "Invalid JSON response: " + response.body, CallPhase::PARSE);
    }
    if (!payload.is_object()) {
        throw HttpError(response.status, "Response is not a JSON object: " + response.body, CallPhase::PARSE);
    }
    trace.advance(CallState::RESPONSE_PARSED);

    BankResponse result;
    result.http_status = response.status;

    const FieldMap* biz = nullptr;
    auto it = payload.find(FIELD_BIZ_CONTENT);
    if (it != payload.end() && !it->is_null()) {
        biz = &*it;
    }

    const std::string* signature = find_header_ci(response.headers, HEADER_SIGNATURE);
    if (!verify) {
        result.verification = Verification::SKIPPED_BY_CALLER;
        trace.advance(CallState::VERIFY_SKIPPED);
    } else if (signature == nullptr || signature->empty()) {
        if (config_.require_response_signature) {
            throw SignatureError(CallPhase::VERIFY, "Response carries no x-aob-signature header");
        }
        LOG_WARN("Response carries no x-aob-signature header; accepting it unverified");
        result.verification = Verification::SKIPPED_NO_SIGNATURE;
        trace.advance(CallState::VERIFY_SKIPPED);
    } else {
        FieldMap signed_map;
        signed_map[FIELD_BIZ_CONTENT] = biz != nullptr ? *biz : FieldMap(nullptr);
        std::string signed_text = CanonicalJson::encode(signed_map);
        bool valid = false;
        try {
            valid = crypto_->verify(signed_text, *signature);
        } catch (const BankError&) {
            throw;
        } catch (const std::exception& e) {
            throw SignatureError(CallPhase::VERIFY, std::string("Signature check failed: ") + e.what());
        }
        if (!valid) {
            throw SignatureError(CallPhase::VERIFY, "Response signature verification failed");
        }
        result.verification = Verification::VERIFIED;
        trace.advance(CallState::VERIFIED);
    }

    if (biz == nullptr) {
        LOG_WARN("Response has no bizContent; returning the body as received");
        result.data = std::move(payload);
        result.decrypted = false;
        return result;
    }
    if (!biz->is_string()) {
        throw DecryptError("bizContent is not a string");
    }

    std::vector<uint8_t> plain;
    try {
        plain = crypto_->decrypt(biz->get<std::string>());
    } catch (const BankError&) {
        throw;
    } catch (const std::exception& e) {
        throw DecryptError(std::string("Response decryption failed: ") + e.what());
    }
    try {
        result.data = CanonicalJson::decode(plain);
    } catch (const DecodeError& e) {
        throw DecryptError(std::string("Decrypted bizContent is not a JSON object: ") + e.what());
    }
    result.decrypted = true;
    trace.advance(CallState::DECRYPTED);
    return result;
}

BankResponse BankClient::post(const std::string& path, const FieldMap& body, const PostOptions& options) const {
    CallTrace trace;
    try {
        PreparedRequest prepared = prepare(path, body, options, trace);
        LOG_DEBUG("POST ", prepared.http.url, dump_headers(prepared.http.headers), "\n  body: ", prepared.http.body);

        HttpResponse response;
        try {
            response = transport_->send(prepared.http);
        } catch (const BankError&) {
            throw;
        } catch (const std::exception& e) {
            throw TransportError(std::string("Transport failed: ") + e.what());
        }
        trace.advance(CallState::SENT);
        LOG_DEBUG("Response ", response.status, " from ", path, dump_headers(response.headers),
                  "\n  body: ", response.body);

        bool verify = config_.verify_response_signature && options.verify_response_signature;
        BankResponse result = receive(response, verify, trace);
        trace.advance(CallState::DONE);
        result.trace = trace.states();
        LOG_INFO("Call ", path, " done: HTTP ", result.http_status, ", signature ",
                 verification_to_string(result.verification),
                 result.decrypted ? ", body decrypted" : ", plain body");
        return result;
    } catch (const BankError& e) {
        LOG_ERR("Call ", path, " failed in ", phase_to_string(e.phase()), " phase (last state ",
                state_to_string(trace.current()), "): ", e.what());
        trace.advance(CallState::FAILED);
        throw;
    }
}
