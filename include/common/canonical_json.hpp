#ifndef WZB_CANONICAL_JSON_HPP
#define WZB_CANONICAL_JSON_HPP

#include <string>
#include <vector>
#include <cstdint>
#include "nlohmann/json.hpp"

// Ordered key/value map. Insertion order is part of the wire contract:
// it decides the canonical bytes and therefore every digest and signature.
using FieldMap = nlohmann::ordered_json;

namespace CanonicalJson {

/**
 * @brief Renders a field map as whitespace-free UTF-8 JSON, keys in insertion order.
 *
 * Non-ASCII characters are emitted raw; only the escapes JSON requires are applied.
 * @throws EncodeError if the map is not an object or holds invalid UTF-8.
 */
std::string encode(const FieldMap& map);

/**
 * @brief Parses canonical JSON text back into an order-preserving field map.
 * @throws DecodeError on invalid JSON, invalid UTF-8 or a non-object top level.
 */
FieldMap decode(const std::string& text);

FieldMap decode(const std::vector<uint8_t>& bytes);

} // namespace CanonicalJson

#endif // WZB_CANONICAL_JSON_HPP
