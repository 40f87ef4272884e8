#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

namespace sysupdate {

// Normalize archive entry path to a clean relative form:
// - strip leading "./"
// - strip leading "/" (avoid absolute)
// - collapse duplicate slashes
inline std::string NormalizeArchivePath(std::string s) {
    while (s.rfind("./", 0) == 0) s.erase(0, 2);
    while (!s.empty() && s.front() == '/') s.erase(0, 1);

    std::string out;
    out.reserve(s.size());
    bool prev_slash = false;
    for (char c : s) {
        const bool slash = (c == '/');
        if (slash && prev_slash) continue;
        out.push_back(c);
        prev_slash = slash;
    }
    return out;
}

inline std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

// "Acme.Blog" -> "acme<sep>blog"
inline std::string NamespacedToPath(std::string_view identifier, char separator) {
    std::string out = ToLower(std::string(identifier));
    std::replace(out.begin(), out.end(), '.', separator);
    return out;
}

} // namespace sysupdate
