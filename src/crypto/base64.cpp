#include "crypto/base64.hpp"

#include <openssl/evp.h>

#include <cctype>
#include <vector>

namespace sysupdate {

std::string Base64Encode(std::string_view data) {
    if (data.empty()) return {};
    std::vector<unsigned char> out(4 * ((data.size() + 2) / 3) + 1);
    const int n = EVP_EncodeBlock(out.data(),
                                  reinterpret_cast<const unsigned char*>(data.data()),
                                  static_cast<int>(data.size()));
    if (n < 0) return {};
    return std::string(reinterpret_cast<const char*>(out.data()), static_cast<size_t>(n));
}

std::optional<std::string> Base64Decode(std::string_view text) {
    std::string clean;
    clean.reserve(text.size() + 3);
    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) continue;
        clean.push_back(c);
    }
    if (clean.empty()) return std::string{};
    if (clean.size() % 4 == 1) return std::nullopt;
    while (clean.size() % 4 != 0) clean.push_back('=');

    size_t padding = 0;
    if (clean[clean.size() - 1] == '=') ++padding;
    if (clean[clean.size() - 2] == '=') ++padding;

    std::vector<unsigned char> out(3 * (clean.size() / 4));
    const int n = EVP_DecodeBlock(out.data(),
                                  reinterpret_cast<const unsigned char*>(clean.data()),
                                  static_cast<int>(clean.size()));
    if (n < 0) return std::nullopt;
    const size_t len = static_cast<size_t>(n) - padding;
    return std::string(reinterpret_cast<const char*>(out.data()), len);
}

} // namespace sysupdate
