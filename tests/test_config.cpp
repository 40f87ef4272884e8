#include <gtest/gtest.h>

#include "testing.hpp"
#include "util/update_config.hpp"

namespace sysupdate {

TEST(UpdateConfigTest, DefaultsMatchGateway) {
    UpdateConfig cfg;
    EXPECT_EQ(cfg.update_server, "https://gateway.octobercms.com/api");
    EXPECT_TRUE(cfg.disable_core_updates);
    EXPECT_EQ(cfg.migration_table, "migrations");
    ASSERT_EQ(cfg.load_modules.size(), 3u);
    EXPECT_EQ(cfg.load_modules[0], "System");
    EXPECT_EQ(cfg.DatabasePath(), "./storage/sysupdate.sqlite");
    EXPECT_NE(cfg.gateway_public_key.find("BEGIN PUBLIC KEY"), std::string::npos);
}

TEST(UpdateConfigTest, ReadsKnownKeysAndIgnoresOthers) {
    nlohmann::json j = {
        {"update_server", "https://example.test/api"},
        {"disable_core_updates", false},
        {"edge_updates", true},
        {"update_auth", "alice:s3:cret"},
        {"load_modules", {"System"}},
        {"base_dir", "/srv/app"},
        {"something_else", 42},
    };

    UpdateConfig cfg;
    auto r = UpdateConfig::FromJson(j, cfg);
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_EQ(cfg.update_server, "https://example.test/api");
    EXPECT_FALSE(cfg.disable_core_updates);
    EXPECT_TRUE(cfg.edge_updates);
    ASSERT_TRUE(cfg.update_auth.has_value());
    EXPECT_EQ(cfg.update_auth->user, "alice");
    EXPECT_EQ(cfg.update_auth->password, "s3:cret");
    EXPECT_EQ(cfg.load_modules, std::vector<std::string>{"System"});
    EXPECT_EQ(cfg.PluginsDir(), "/srv/app/plugins");
    EXPECT_EQ(cfg.ThemesDir(), "/srv/app/themes");
}

TEST(UpdateConfigTest, RejectsMalformedAuth) {
    UpdateConfig cfg;
    auto r = UpdateConfig::FromJson({{"update_auth", "nocolon"}}, cfg);
    ASSERT_FALSE(r.is_ok());
    EXPECT_EQ(r.code(), ErrorCode::Config);
}

TEST(UpdateConfigTest, RejectsUnsafeMigrationTable) {
    UpdateConfig cfg;
    auto r = UpdateConfig::FromJson({{"migration_table", "x; DROP TABLE y"}}, cfg);
    ASSERT_FALSE(r.is_ok());
    EXPECT_EQ(r.code(), ErrorCode::Config);
}

TEST(UpdateConfigTest, LoadFromFileReportsPath) {
    testutil::TemporaryDirectory dir;
    const std::string path = dir.Path() + "/sysupdate.json";
    testutil::WriteFile(path, "{ not json");

    UpdateConfig cfg;
    auto r = UpdateConfig::LoadFromFile(path, cfg);
    ASSERT_FALSE(r.is_ok());
    EXPECT_NE(r.msg.find(path), std::string::npos);

    testutil::WriteFile(path, R"({"client_name": "acme-site"})");
    r = UpdateConfig::LoadFromFile(path, cfg);
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_EQ(cfg.client_name, "acme-site");
}

} // namespace sysupdate
