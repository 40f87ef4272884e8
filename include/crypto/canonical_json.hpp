#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace sysupdate {

// Serializes the way the gateway does before signing: compact, keys in
// insertion order, non-ASCII as \uXXXX and '/' escaped as "\/".
std::string CanonicalJson(const nlohmann::ordered_json& value);

} // namespace sysupdate
