#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

namespace sysupdate {

// RFC 1738 encoding: alphanumerics and "-_." pass through, space becomes
// '+', everything else is %XX.
std::string UrlEncode(std::string_view value);

// Form-encodes a JSON object in insertion order. Nested arrays and objects
// become "key[index]" / "key[sub]" pairs, booleans become 1/0 and nulls are
// omitted. This is both the POST body and the signed canonical form.
std::string BuildQueryString(const nlohmann::ordered_json& params);

} // namespace sysupdate
