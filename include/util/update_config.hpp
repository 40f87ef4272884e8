#pragma once

#include "util/result.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace sysupdate {

extern const char kDefaultGatewayPublicKey[];

struct BasicAuth {
    std::string user;
    std::string password;
};

struct UpdateConfig {
    std::string update_server = "https://gateway.octobercms.com/api";
    std::string changelog_url = "https://octobercms.com/changelog?json";
    bool disable_core_updates = true;
    std::optional<BasicAuth> update_auth;
    bool edge_updates = false;
    std::string gateway_public_key = kDefaultGatewayPublicKey;
    std::string migration_table = "migrations";
    std::vector<std::string> load_modules{"System", "Backend", "Cms"};

    std::string base_dir = ".";
    std::string temp_dir = "/tmp/sysupdate";
    std::string database;  // empty => {base_dir}/storage/sysupdate.sqlite

    std::string app_url = "http://localhost/";
    std::string client_ip = "127.0.0.1";
    std::string client_name = "sysupdate";

    std::string api_key;
    std::string api_secret;

    std::string log_level = "info";

    std::string DatabasePath() const;
    std::string PluginsDir() const;
    std::string ThemesDir() const;

    static Result LoadFromFile(const std::string& path, UpdateConfig& out);
    static Result FromJson(const nlohmann::json& j, UpdateConfig& out);
};

} // namespace sysupdate
