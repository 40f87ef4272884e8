#include "util/update_config.hpp"

#include <cctype>
#include <fstream>

namespace sysupdate {

const char kDefaultGatewayPublicKey[] =
    "-----BEGIN PUBLIC KEY-----\n"
    "MIIBIjANBgkqhkiG9w0BAQEFAAOCAQ8AMIIBCgKCAQEAt+KwvTXqC8Mz9vV4KIvX\n"
    "3y+aZusrlg26jdbNVUuhXNFbt1VisjJydHW2+WGsiEHSy2s61ZAV2dICR6f3huSw\n"
    "jY/MH9j23Oo/u61CBpvIS3Q8uC+TLtJl4/F9eqlnzocfMoKe8NmcBbUR3TKQoIok\n"
    "xbSMl6jiE2k5TJdzhHUxjZRIeeLDLMKYX6xt37LdhuM8zO6sXQmCGg4J6LmHTJph\n"
    "96H11gBvcFSFJSmIiDykJOELZl/aVcY1g3YgpL0mw5Bw1VTmKaRdz1eBi9DmKrKX\n"
    "UijG4gD8eLRV/FS/sZCFNR/evbQXvTBxO0TOIVi85PlQEcMl4SBj0CoTyNbcAGtz\n"
    "4wIDAQAB\n"
    "-----END PUBLIC KEY-----\n";

namespace {

bool GetStringIfPresent(const nlohmann::json& j, const char* key, std::string& out) {
    auto it = j.find(key);
    if (it == j.end())
        return false;
    if (!it->is_string())
        return false;
    out = it->get<std::string>();
    return true;
}

bool GetBoolIfPresent(const nlohmann::json& j, const char* key, bool& out) {
    auto it = j.find(key);
    if (it == j.end())
        return false;
    if (!it->is_boolean())
        return false;
    out = it->get<bool>();
    return true;
}

bool GetStringListIfPresent(const nlohmann::json& j,
                            const char* key,
                            std::vector<std::string>& out,
                            std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_array()) {
        err = std::string(key) + " must be an array of strings";
        return false;
    }
    std::vector<std::string> values;
    for (const auto& item : *it) {
        if (!item.is_string()) {
            err = std::string(key) + " must be an array of strings";
            return false;
        }
        values.push_back(item.get<std::string>());
    }
    out = std::move(values);
    return true;
}

} // namespace

std::string UpdateConfig::DatabasePath() const {
    if (!database.empty())
        return database;
    return base_dir + "/storage/sysupdate.sqlite";
}

std::string UpdateConfig::PluginsDir() const { return base_dir + "/plugins"; }

std::string UpdateConfig::ThemesDir() const { return base_dir + "/themes"; }

Result UpdateConfig::FromJson(const nlohmann::json& j, UpdateConfig& out) {
    if (!j.is_object()) {
        return Result::Fail(ErrorCode::Config, "config root must be JSON object");
    }

    UpdateConfig cfg;
    GetStringIfPresent(j, "update_server", cfg.update_server);
    GetStringIfPresent(j, "changelog_url", cfg.changelog_url);
    GetBoolIfPresent(j, "disable_core_updates", cfg.disable_core_updates);
    GetBoolIfPresent(j, "edge_updates", cfg.edge_updates);
    GetStringIfPresent(j, "gateway_public_key", cfg.gateway_public_key);
    GetStringIfPresent(j, "migration_table", cfg.migration_table);
    GetStringIfPresent(j, "base_dir", cfg.base_dir);
    GetStringIfPresent(j, "temp_dir", cfg.temp_dir);
    GetStringIfPresent(j, "database", cfg.database);
    GetStringIfPresent(j, "app_url", cfg.app_url);
    GetStringIfPresent(j, "client_ip", cfg.client_ip);
    GetStringIfPresent(j, "client_name", cfg.client_name);
    GetStringIfPresent(j, "api_key", cfg.api_key);
    GetStringIfPresent(j, "api_secret", cfg.api_secret);
    GetStringIfPresent(j, "log_level", cfg.log_level);

    std::string err;
    if (!GetStringListIfPresent(j, "load_modules", cfg.load_modules, err)) {
        return Result::Fail(ErrorCode::Config, err);
    }

    std::string auth;
    if (GetStringIfPresent(j, "update_auth", auth) && !auth.empty()) {
        const auto colon = auth.find(':');
        if (colon == std::string::npos) {
            return Result::Fail(ErrorCode::Config, "update_auth must be \"user:password\"");
        }
        cfg.update_auth = BasicAuth{auth.substr(0, colon), auth.substr(colon + 1)};
    }

    if (cfg.update_server.empty()) {
        return Result::Fail(ErrorCode::Config, "update_server must not be empty");
    }
    if (cfg.migration_table.empty()) {
        return Result::Fail(ErrorCode::Config, "migration_table must not be empty");
    }
    for (unsigned char c : cfg.migration_table) {
        if (!std::isalnum(c) && c != '_') {
            return Result::Fail(ErrorCode::Config, "migration_table must be a plain identifier");
        }
    }

    out = std::move(cfg);
    return Result::Ok();
}

Result UpdateConfig::LoadFromFile(const std::string& path, UpdateConfig& out) {
    std::ifstream is(path);
    if (!is.good()) {
        return Result::Fail(ErrorCode::Config, "cannot open config: " + path);
    }

    nlohmann::json j;
    try {
        is >> j;
    } catch (const std::exception& e) {
        return Result::Fail(ErrorCode::Config, std::string("invalid JSON in ") + path + ": " + e.what());
    }

    auto r = FromJson(j, out);
    if (!r.is_ok()) {
        return Result::Fail(r.err, r.msg + " in " + path);
    }
    return Result::Ok();
}

} // namespace sysupdate
