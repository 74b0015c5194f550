#include "common/canonical_json.hpp"
#include "common/errors.hpp"

namespace CanonicalJson {

std::string encode(const FieldMap& map) {
    if (!map.is_object()) {
        throw EncodeError(std::string("Canonical encoding requires a JSON object, got ") + map.type_name());
    }
    try {
        // indent -1 selects the compact "," / ":" separators; ensure_ascii off keeps UTF-8 raw.
        return map.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::strict);
    } catch (const nlohmann::ordered_json::type_error& e) {
        throw EncodeError(std::string("Field map is not valid UTF-8: ") + e.what());
    }
}

FieldMap decode(const std::string& text) {
    FieldMap map;
    try {
        map = FieldMap::parse(text);
    } catch (const nlohmann::ordered_json::parse_error& e) {
        throw DecodeError(std::string("Invalid canonical JSON: ") + e.what());
    }
    if (!map.is_object()) {
        throw DecodeError(std::string("Canonical JSON must be an object, got ") + map.type_name());
    }
    return map;
}

FieldMap decode(const std::vector<uint8_t>& bytes) {
    return decode(std::string(bytes.begin(), bytes.end()));
}

} // namespace CanonicalJson
