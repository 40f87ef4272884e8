#pragma once

#include <string>

namespace sysupdate {

// Dot-separated numeric comparison; a leading "v" is ignored and missing
// components count as zero, so "1.0" == "v1.0.0".
class VersionComparator {
public:
    static int Compare(const std::string& lhs, const std::string& rhs);
};

} // namespace sysupdate
