#ifndef WZB_PROTOCOL_HPP
#define WZB_PROTOCOL_HPP

#include <array>
#include <string>
#include <utility>
#include <vector>

#include "../common/canonical_json.hpp"

// Header and field names are fixed by the gateway and compared byte for byte.
constexpr const char* HEADER_AUTHORIZATION = "Authorization";
constexpr const char* HEADER_APP_ID = "x-aob-appID";
constexpr const char* HEADER_BANK_ID = "x-aob-bankID";
constexpr const char* HEADER_LAST_LOGON_TIME = "x-aob-customer-last-logger-time";
constexpr const char* HEADER_CUSTOMER_IP = "x-aob-customer-ip-address";
constexpr const char* HEADER_INTERACTION_ID = "x-aob-interaction-id";
constexpr const char* HEADER_ACCESS_TOKEN = "x-aob-access-token";
constexpr const char* HEADER_USER_AGENT = "x-customer-user-agent";
constexpr const char* HEADER_IDEMPOTENCY_KEY = "x-idempotency-key";
constexpr const char* HEADER_SIGNATURE = "x-aob-signature";
constexpr const char* HEADER_CONTENT_TYPE = "Content-Type";
constexpr const char* HEADER_ACCEPT = "Accept";

constexpr const char* CONTENT_TYPE_JSON = "application/json";
constexpr const char* FIELD_BIZ_CONTENT = "bizContent";

// Headers that take part in the signature, in signing order.
constexpr std::array<const char*, 9> SIGNED_HEADERS = {
    HEADER_AUTHORIZATION,
    HEADER_APP_ID,
    HEADER_BANK_ID,
    HEADER_LAST_LOGON_TIME,
    HEADER_CUSTOMER_IP,
    HEADER_INTERACTION_ID,
    HEADER_ACCESS_TOKEN,
    HEADER_USER_AGENT,
    HEADER_IDEMPOTENCY_KEY
};

// Ordered (name, value) pairs as they go on the wire.
using HeaderList = std::vector<std::pair<std::string, std::string>>;

// Exact-name lookup; returns nullptr when absent.
const std::string* find_header(const HeaderList& headers, const std::string& name);

// ASCII case-insensitive lookup, for headers coming back from HTTP peers.
const std::string* find_header_ci(const HeaderList& headers, const std::string& name);

// Replaces the value of an existing header in place, or appends it.
void set_header(HeaderList& headers, const std::string& name, const std::string& value);

/**
 * @brief Builds the ordered map that gets canonicalized and signed.
 *
 * Signed headers that are present and non-empty come first in SIGNED_HEADERS
 * order, followed by bizContent. An empty bizContent is left out.
 * The order is a wire contract and is never sorted.
 */
FieldMap build_sign_map(const HeaderList& headers, const std::string& biz_content);

// Same selection with a caller-supplied allow-list.
FieldMap build_sign_map(const HeaderList& headers, const std::vector<std::string>& allow_list,
                        const std::string& biz_content);

// The request body: {"bizContent":"<hex>"}.
FieldMap make_envelope_body(const std::string& biz_content);

#endif //WZB_PROTOCOL_HPP
