#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace sysupdate {

std::string Base64Encode(std::string_view data);

// Whitespace is ignored and missing padding is tolerated; any other
// character outside the alphabet yields nullopt.
std::optional<std::string> Base64Decode(std::string_view text);

} // namespace sysupdate
