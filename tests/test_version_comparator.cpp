#include <gtest/gtest.h>

#include "util/version_comparator.hpp"

namespace sysupdate {

TEST(VersionComparatorTest, OrdersNumericComponents) {
    EXPECT_LT(VersionComparator::Compare("1.0.9", "1.0.10"), 0);
    EXPECT_GT(VersionComparator::Compare("2.0.0", "1.99.99"), 0);
    EXPECT_EQ(VersionComparator::Compare("1.2.3", "1.2.3"), 0);
}

TEST(VersionComparatorTest, MissingComponentsCountAsZero) {
    EXPECT_EQ(VersionComparator::Compare("1.0", "1.0.0"), 0);
    EXPECT_LT(VersionComparator::Compare("1.0", "1.0.1"), 0);
}

TEST(VersionComparatorTest, IgnoresLeadingV) {
    EXPECT_EQ(VersionComparator::Compare("v1.0.1", "1.0.1"), 0);
    EXPECT_GT(VersionComparator::Compare("V1.1", "v1.0.9"), 0);
}

} // namespace sysupdate
