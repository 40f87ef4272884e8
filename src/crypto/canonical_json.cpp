#include "crypto/canonical_json.hpp"

namespace sysupdate {

std::string CanonicalJson(const nlohmann::ordered_json& value) {
    const std::string compact = value.dump(-1, ' ', /*ensure_ascii=*/true);

    // '/' is only legal inside string literals, so a blind rewrite is exact.
    std::string out;
    out.reserve(compact.size() + 8);
    for (char c : compact) {
        if (c == '/') out.push_back('\\');
        out.push_back(c);
    }
    return out;
}

} // namespace sysupdate
