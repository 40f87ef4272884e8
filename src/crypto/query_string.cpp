#include "crypto/query_string.hpp"

#include <cctype>

namespace sysupdate {

namespace {

std::string ScalarToString(const nlohmann::ordered_json& v) {
    if (v.is_string()) return v.get<std::string>();
    if (v.is_boolean()) return v.get<bool>() ? "1" : "0";
    return v.dump();
}

void AppendPairs(const std::string& prefix,
                 const nlohmann::ordered_json& value,
                 std::string& out) {
    if (value.is_null()) return;

    if (value.is_object()) {
        for (const auto& [key, child] : value.items()) {
            AppendPairs(prefix + "[" + key + "]", child, out);
        }
        return;
    }
    if (value.is_array()) {
        for (size_t i = 0; i < value.size(); ++i) {
            AppendPairs(prefix + "[" + std::to_string(i) + "]", value[i], out);
        }
        return;
    }

    if (!out.empty()) out.push_back('&');
    out += UrlEncode(prefix);
    out.push_back('=');
    out += UrlEncode(ScalarToString(value));
}

} // namespace

std::string UrlEncode(std::string_view value) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size() * 3);
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.') {
            out.push_back(static_cast<char>(c));
        } else if (c == ' ') {
            out.push_back('+');
        } else {
            out.push_back('%');
            out.push_back(kHex[(c >> 4) & 0xF]);
            out.push_back(kHex[c & 0xF]);
        }
    }
    return out;
}

std::string BuildQueryString(const nlohmann::ordered_json& params) {
    std::string out;
    if (!params.is_object()) return out;

    for (const auto& [key, value] : params.items()) {
        if (value.is_object() || value.is_array()) {
            AppendPairs(key, value, out);
            continue;
        }
        if (value.is_null()) continue;
        if (!out.empty()) out.push_back('&');
        out += UrlEncode(key);
        out.push_back('=');
        out += UrlEncode(ScalarToString(value));
    }
    return out;
}

} // namespace sysupdate
