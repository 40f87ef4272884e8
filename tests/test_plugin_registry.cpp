#include <gtest/gtest.h>

#include "registry/module_registry.hpp"
#include "registry/plugin_registry.hpp"
#include "registry/theme_registry.hpp"
#include "testing.hpp"

namespace sysupdate {

TEST(ParseVersionFileTest, SplitsNotesAndScripts) {
    auto j = nlohmann::ordered_json::parse(R"({
        "1.0.2": ["Create tables", "create_posts.sql", "create_tags.sql"],
        "1.0.1": "First version",
        "1.0.10": ["Fix", "Second note"]
    })");

    auto parsed = ParseVersionFile(j);
    ASSERT_TRUE(parsed.has_value()) << parsed.error();
    ASSERT_EQ(parsed->size(), 3u);

    const auto& v = *parsed;
    EXPECT_EQ(v[0].version, "1.0.1");
    EXPECT_EQ(v[0].notes, (std::vector<std::string>{"First version"}));
    EXPECT_EQ(v[1].version, "1.0.2");
    EXPECT_EQ(v[1].scripts, (std::vector<std::string>{"create_posts.sql", "create_tags.sql"}));
    EXPECT_EQ(v[1].notes, (std::vector<std::string>{"Create tables"}));
    EXPECT_EQ(v[2].version, "1.0.10");
    EXPECT_TRUE(v[2].scripts.empty());
}

TEST(ParseVersionFileTest, RejectsMalformedDocuments) {
    EXPECT_FALSE(ParseVersionFile(nlohmann::ordered_json::array()).has_value());
    EXPECT_FALSE(ParseVersionFile(nlohmann::ordered_json::parse(R"({"1.0.1": 5})")).has_value());
    EXPECT_FALSE(ParseVersionFile(nlohmann::ordered_json::parse(R"({"1.0.1": ["ok", 3]})")).has_value());

    auto empty = ParseVersionFile(nullptr);
    ASSERT_TRUE(empty.has_value());
    EXPECT_TRUE(empty->empty());
}

TEST(PluginRegistryTest, DiscoversPluginDirectories) {
    testutil::TemporaryDirectory dir;
    const std::string plugins = dir.Path() + "/plugins";
    testutil::WritePlugin(plugins, "rainlab/user", R"({"1.0.1": "Users"})");
    const auto blog = testutil::WritePlugin(plugins, "acme/blog", R"({"1.0.1": "Blog"})");
    testutil::WriteFile(blog + "/plugin.json", R"({"name": "Blog", "icon": "icon-pencil", "disabled": true})");
    std::filesystem::create_directories(plugins + "/acme/empty");

    PluginRegistry registry;
    ASSERT_TRUE(registry.DiscoverDirectory(plugins).is_ok());

    auto all = registry.GetPlugins();
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0]->Identifier(), "acme.blog");
    EXPECT_EQ(all[1]->Identifier(), "rainlab.user");

    IPlugin* found = registry.FindByIdentifier("Acme.Blog");
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(found->Name(), "Blog");
    EXPECT_EQ(found->Icon(), "icon-pencil");
    EXPECT_TRUE(found->IsDisabled());
    EXPECT_EQ(registry.FindByIdentifier("Acme.Missing"), nullptr);
}

TEST(PluginRegistryTest, MissingDirectoryRegistersNothing) {
    PluginRegistry registry;
    ASSERT_TRUE(registry.DiscoverDirectory("/nonexistent/plugins").is_ok());
    EXPECT_TRUE(registry.GetPlugins().empty());
}

TEST(PluginRegistryTest, RejectsDuplicateIdentifier) {
    testutil::TemporaryDirectory dir;
    const auto path = testutil::WritePlugin(dir.Path(), "acme/blog", "{}");

    PluginRegistry registry;
    std::unique_ptr<DirectoryPlugin> first;
    std::unique_ptr<DirectoryPlugin> second;
    ASSERT_TRUE(DirectoryPlugin::Load("Acme.Blog", path, first).is_ok());
    ASSERT_TRUE(DirectoryPlugin::Load("acme.blog", path, second).is_ok());

    ASSERT_TRUE(registry.Register(std::move(first)).is_ok());
    auto r = registry.Register(std::move(second));
    ASSERT_FALSE(r.is_ok());
    EXPECT_EQ(r.code(), ErrorCode::Config);
}

TEST(PluginRegistryTest, BadVersionFileFailsLoad) {
    testutil::TemporaryDirectory dir;
    const auto path = testutil::WritePlugin(dir.Path(), "acme/blog", "{not json");

    std::unique_ptr<DirectoryPlugin> plugin;
    auto r = DirectoryPlugin::Load("Acme.Blog", path, plugin);
    ASSERT_FALSE(r.is_ok());
    EXPECT_EQ(r.code(), ErrorCode::Config);
}

TEST(ModuleRegistryTest, LoadsSqlAndCodeMigrationsOnce) {
    testutil::TemporaryDirectory dir;
    ModuleRegistry modules(dir.Path());
    const std::string sql_dir = modules.MigrationsDir("System");
    EXPECT_EQ(sql_dir, dir.Path() + "/modules/system/database/migrations");

    std::filesystem::create_directories(sql_dir);
    testutil::WriteFile(sql_dir + "/001_parameters.up.sql", "CREATE TABLE p (id INTEGER);");

    modules.Register({.name = "System",
                      .migrations = {std::make_shared<testutil::TableMigration>("002_jobs", "jobs")}});

    MigrationCatalog catalog;
    ASSERT_TRUE(modules.LoadInto("system", catalog).is_ok());
    ASSERT_TRUE(modules.LoadInto("System", catalog).is_ok());

    auto list = catalog.For(ModuleRegistry::UnitPath("System"));
    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(list[0]->Name(), "001_parameters");
    EXPECT_EQ(list[1]->Name(), "002_jobs");
}

TEST(ThemeRegistryTest, RecordsInstalledThemes) {
    testutil::TestStores s;
    ThemeRegistry themes(s.params);

    bool installed = true;
    ASSERT_TRUE(themes.IsInstalled("Acme.Demo", installed).is_ok());
    EXPECT_FALSE(installed);

    ASSERT_TRUE(themes.SetInstalled("Acme.Demo", "acme-demo").is_ok());
    ASSERT_TRUE(themes.IsInstalled("Acme.Demo", installed).is_ok());
    EXPECT_TRUE(installed);

    std::vector<std::string> codes;
    ASSERT_TRUE(themes.Installed(codes).is_ok());
    EXPECT_EQ(codes, (std::vector<std::string>{"Acme.Demo"}));
}

} // namespace sysupdate
