#pragma once

#include "util/result.hpp"

#include <string>
#include <string_view>

namespace sysupdate {

std::string Md5Hex(std::string_view data);
std::string Sha256Hex(std::string_view data);
Result Md5HexFile(const std::string& path, std::string& out_hex);

// Raw (binary) HMAC-SHA512 of data under key; empty on failure.
std::string HmacSha512(std::string_view key, std::string_view data);

} // namespace sysupdate
