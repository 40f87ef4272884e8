#include "registry/plugin_registry.hpp"

#include "migration/sql_file_migration.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"
#include "util/version_comparator.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>

namespace sysupdate {

namespace {

bool IsScriptEntry(const std::string& s) {
    return s.size() > 4 && s.compare(s.size() - 4, 4, ".sql") == 0;
}

Result ReadJsonFile(const std::string& path, nlohmann::ordered_json& out) {
    std::ifstream is(path);
    if (!is.good()) return Result::Fail(ErrorCode::Io, "cannot open " + path);

    out = nlohmann::ordered_json::parse(is, nullptr, /*allow_exceptions=*/false);
    if (out.is_discarded()) {
        return Result::Fail(ErrorCode::Config, "invalid JSON in " + path);
    }
    return Result::Ok();
}

} // namespace

std::expected<std::vector<PluginVersion>, std::string> ParseVersionFile(const nlohmann::ordered_json& j) {
    if (j.is_null()) return std::vector<PluginVersion>{};
    if (!j.is_object()) {
        return std::unexpected("version file must be an object");
    }

    std::vector<PluginVersion> versions;
    for (auto it = j.begin(); it != j.end(); ++it) {
        PluginVersion v;
        v.version = it.key();

        const auto& value = it.value();
        if (value.is_string()) {
            v.notes.push_back(value.get<std::string>());
        } else if (value.is_array()) {
            for (const auto& entry : value) {
                if (!entry.is_string()) {
                    return std::unexpected("version " + v.version + ": entries must be strings");
                }
                auto s = entry.get<std::string>();
                if (IsScriptEntry(s)) {
                    v.scripts.push_back(std::move(s));
                } else {
                    v.notes.push_back(std::move(s));
                }
            }
        } else if (!value.is_null()) {
            return std::unexpected("version " + v.version + ": expected a string or a list");
        }
        versions.push_back(std::move(v));
    }

    std::stable_sort(versions.begin(), versions.end(), [](const PluginVersion& a, const PluginVersion& b) {
        return VersionComparator::Compare(a.version, b.version) < 0;
    });
    return versions;
}

Result DirectoryPlugin::Load(const std::string& identifier,
                             const std::string& plugin_dir,
                             std::unique_ptr<DirectoryPlugin>& out) {
    namespace fs = std::filesystem;

    auto plugin = std::make_unique<DirectoryPlugin>();
    plugin->identifier_ = identifier;
    plugin->name_ = identifier;
    plugin->updates_dir_ = (fs::path(plugin_dir) / "updates").string();

    std::error_code ec;
    const std::string version_file = (fs::path(plugin->updates_dir_) / "version.json").string();
    if (fs::exists(version_file, ec)) {
        nlohmann::ordered_json j;
        auto r = ReadJsonFile(version_file, j);
        if (!r.is_ok()) return r;

        auto parsed = ParseVersionFile(j);
        if (!parsed) {
            return Result::Fail(ErrorCode::Config, version_file + ": " + parsed.error());
        }
        plugin->versions_ = std::move(*parsed);
    }

    const std::string details_file = (fs::path(plugin_dir) / "plugin.json").string();
    if (fs::exists(details_file, ec)) {
        nlohmann::ordered_json j;
        auto r = ReadJsonFile(details_file, j);
        if (!r.is_ok()) return r;

        if (auto it = j.find("name"); it != j.end() && it->is_string()) plugin->name_ = it->get<std::string>();
        if (auto it = j.find("icon"); it != j.end() && it->is_string()) plugin->icon_ = it->get<std::string>();
        if (auto it = j.find("disabled"); it != j.end() && it->is_boolean()) plugin->disabled_ = it->get<bool>();
    }

    out = std::move(plugin);
    return Result::Ok();
}

Result DirectoryPlugin::LoadMigration(const std::string& script, std::shared_ptr<IMigration>& out) const {
    return SqlFileMigration::FromScript(updates_dir_, script, out);
}

Result PluginRegistry::Register(std::unique_ptr<IPlugin> plugin) {
    if (!plugin) return Result::Fail(ErrorCode::Config, "null plugin");
    if (FindByIdentifier(plugin->Identifier())) {
        return Result::Fail(ErrorCode::Config, "plugin already registered: " + plugin->Identifier());
    }
    plugins_.push_back(std::move(plugin));
    return Result::Ok();
}

IPlugin* PluginRegistry::FindByIdentifier(const std::string& identifier) const {
    const std::string wanted = ToLower(identifier);
    for (const auto& p : plugins_) {
        if (ToLower(p->Identifier()) == wanted) return p.get();
    }
    return nullptr;
}

std::vector<IPlugin*> PluginRegistry::GetPlugins() const {
    std::vector<IPlugin*> out;
    out.reserve(plugins_.size());
    for (const auto& p : plugins_) out.push_back(p.get());
    return out;
}

Result PluginRegistry::DiscoverDirectory(const std::string& plugins_dir) {
    namespace fs = std::filesystem;

    std::error_code ec;
    if (!fs::is_directory(plugins_dir, ec)) {
        LogDebug("No plugins directory at %s", plugins_dir.c_str());
        return Result::Ok();
    }

    std::vector<std::pair<std::string, fs::path>> found;
    for (fs::directory_iterator authors(plugins_dir, ec), end; !ec && authors != end; authors.increment(ec)) {
        if (!authors->is_directory(ec)) continue;
        std::error_code inner;
        for (fs::directory_iterator names(authors->path(), inner); !inner && names != end; names.increment(inner)) {
            if (!fs::exists(names->path() / "updates" / "version.json", inner)) continue;
            const std::string identifier =
                authors->path().filename().string() + "." + names->path().filename().string();
            found.emplace_back(identifier, names->path());
        }
        if (inner) {
            return Result::Fail(ErrorCode::Io, "cannot list " + authors->path().string() + ": " + inner.message());
        }
    }
    if (ec) {
        return Result::Fail(ErrorCode::Io, "cannot list " + plugins_dir + ": " + ec.message());
    }

    std::sort(found.begin(), found.end());
    for (const auto& [identifier, dir] : found) {
        std::unique_ptr<DirectoryPlugin> plugin;
        auto r = DirectoryPlugin::Load(identifier, dir.string(), plugin);
        if (!r.is_ok()) return r;
        r = Register(std::move(plugin));
        if (!r.is_ok()) return r;
        LogDebug("Discovered plugin %s", identifier.c_str());
    }
    return Result::Ok();
}

} // namespace sysupdate
