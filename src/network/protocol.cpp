#include "network/protocol.hpp"
#include <algorithm>
#include <cctype>

namespace {
    bool iequals(const std::string& a, const std::string& b) {
        return a.size() == b.size() &&
               std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
                   return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
               });
    }
}

const std::string* find_header(const HeaderList& headers, const std::string& name) {
    for (const auto& [key, value] : headers) {
        if (key == name) {
            return &value;
        }
    }
    return nullptr;
}

const std::string* find_header_ci(const HeaderList& headers, const std::string& name) {
    for (const auto& [key, value] : headers) {
        if (iequals(key, name)) {
            return &value;
        }
    }
    return nullptr;
}

void set_header(HeaderList& headers, const std::string& name, const std::string& value) {
    for (auto& [key, existing] : headers) {
        if (key == name) {
            existing = value;
            return;
        }
    }
    headers.emplace_back(name, value);
}

FieldMap build_sign_map(const HeaderList& headers, const std::vector<std::string>& allow_list,
                        const std::string& biz_content) {
    FieldMap sign_map = FieldMap::object();
    for (const auto& name : allow_list) {
        const std::string* value = find_header(headers, name);
        if (value && !value->empty()) {
            sign_map[name] = *value;
        }
    }
    if (!biz_content.empty()) {
        sign_map[FIELD_BIZ_CONTENT] = biz_content;
    }
    return sign_map;
}

FieldMap build_sign_map(const HeaderList& headers, const std::string& biz_content) {
    static const std::vector<std::string> allow_list(SIGNED_HEADERS.begin(), SIGNED_HEADERS.end());
    return build_sign_map(headers, allow_list, biz_content);
}

FieldMap make_envelope_body(const std::string& biz_content) {
    FieldMap body = FieldMap::object();
    body[FIELD_BIZ_CONTENT] = biz_content;
    return body;
}
