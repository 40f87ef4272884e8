#include <gtest/gtest.h>

#include "util/path_utils.hpp"

namespace sysupdate {

TEST(PathUtilsTest, NormalizeArchivePathCleansInput) {
    EXPECT_EQ(NormalizeArchivePath("./updates/version.json"), "updates/version.json");
    EXPECT_EQ(NormalizeArchivePath("/assets//css///site.css"), "assets/css/site.css");
    EXPECT_EQ(NormalizeArchivePath(""), "");
}

TEST(PathUtilsTest, NamespacedToPathLowercases) {
    EXPECT_EQ(NamespacedToPath("Acme.Blog", '/'), "acme/blog");
    EXPECT_EQ(NamespacedToPath("Acme.Demo", '-'), "acme-demo");
    EXPECT_EQ(ToLower("RainLab"), "rainlab");
}

} // namespace sysupdate
