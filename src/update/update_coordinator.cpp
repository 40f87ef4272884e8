#include "update/update_coordinator.hpp"

#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <filesystem>

namespace sysupdate {

const char* ToString(UnitKind kind) {
    switch (kind) {
        case UnitKind::Core:
            return "core";
        case UnitKind::Plugin:
            return "plugin";
        case UnitKind::Theme:
            return "theme";
    }
    return "unknown";
}

std::optional<UnitKind> ParseUnitKind(const std::string& name) {
    const std::string n = ToLower(name);
    if (n == "core") return UnitKind::Core;
    if (n == "plugin") return UnitKind::Plugin;
    if (n == "theme") return UnitKind::Theme;
    return std::nullopt;
}

void UpdateCoordinator::SetNotesOutput(INotesOutput* out) {
    notes_ = out;
    engine_.SetNotesOutput(out);
}

void UpdateCoordinator::Note(const std::string& line) {
    if (notes_) notes_->WriteLine(line);
}

Result UpdateCoordinator::RunFullUpdate() {
    bool exists = false;
    auto r = ledger_.Exists(exists);
    if (!r.is_ok()) return r;

    const bool first_up = !exists;
    if (first_up) {
        r = ledger_.Create();
        if (!r.is_ok()) return r;
        Note("Migration table created");
    }

    for (const auto& module : cfg_.load_modules) {
        Note(module);
        std::vector<std::string> applied;
        r = engine_.ApplyModule(module, applied);
        if (!r.is_ok()) return r;
    }

    for (IPlugin* plugin : plugins_.GetPlugins()) {
        r = UpdatePlugin(plugin->Identifier());
        if (!r.is_ok()) return r;
    }

    r = params_.Set(params::kUpdateCount, 0);
    if (!r.is_ok()) return r;

    r = cache_.Flush();
    if (!r.is_ok()) return r;

    if (first_up) {
        for (const auto& module : cfg_.load_modules) {
            bool seeded = false;
            r = engine_.Seed(module, seeded);
            if (!r.is_ok()) return r;
            if (seeded) Note("Seeded " + module);
        }
    }

    notices_.Print(notes_);
    notices_.Clear();

    LogInfo("Update finished");
    return Result::Ok();
}

Result UpdateCoordinator::UninstallAll() {
    auto r = ledger_.Create();
    if (!r.is_ok()) return r;

    const auto plugins = plugins_.GetPlugins();
    for (auto it = plugins.rbegin(); it != plugins.rend(); ++it) {
        r = RollbackPlugin((*it)->Identifier(), std::nullopt);
        if (!r.is_ok()) return r;
    }

    int rolled_back = 0;
    r = engine_.RollbackModules(cfg_.load_modules, rolled_back);
    if (!r.is_ok()) return r;
    LogInfo("Rolled back %d module migration(s)", rolled_back);

    return ledger_.Drop();
}

Result UpdateCoordinator::Download(UnitKind kind,
                                   const std::string& identifier,
                                   const std::string& hash,
                                   std::string& file_path) {
    std::string file_code;
    nlohmann::ordered_json extra = nlohmann::ordered_json::object();
    std::string endpoint;

    switch (kind) {
        case UnitKind::Core:
            endpoint = "core/get";
            file_code = "core";
            extra["type"] = "update";
            break;
        case UnitKind::Plugin:
            endpoint = "plugin/get";
            file_code = identifier + hash;
            extra["name"] = identifier;
            extra["installation"] = 0;
            break;
        case UnitKind::Theme:
            endpoint = "theme/get";
            file_code = identifier + hash;
            extra["name"] = identifier;
            break;
    }

    file_path = gateway_.FilePath(file_code);
    return gateway_.RequestFile(endpoint, file_code, hash, extra);
}

Result UpdateCoordinator::DownloadAndExtract(UnitKind kind, const std::string& identifier, const std::string& hash) {
    namespace fs = std::filesystem;

    std::string file_path;
    auto r = Download(kind, identifier, hash, file_path);
    if (!r.is_ok()) return r;

    std::string destination;
    std::string theme_dir;
    switch (kind) {
        case UnitKind::Core:
            destination = cfg_.base_dir;
            break;
        case UnitKind::Plugin:
            destination = (fs::path(cfg_.PluginsDir()) / NamespacedToPath(identifier, '/')).string();
            break;
        case UnitKind::Theme:
            theme_dir = NamespacedToPath(identifier, '-');
            destination = (fs::path(cfg_.ThemesDir()) / theme_dir).string();
            break;
    }

    r = extractor_.ExtractFile(file_path, destination);
    if (!r.is_ok()) {
        LogError("%s", r.msg.c_str());
        return r;
    }

    if (kind == UnitKind::Theme && themes_) {
        r = themes_->SetInstalled(identifier, theme_dir);
        if (!r.is_ok()) return r;
    }

    std::error_code ec;
    fs::remove(file_path, ec);
    if (ec) LogWarn("Could not remove %s: %s", file_path.c_str(), ec.message().c_str());

    LogInfo("Installed %s %s into %s", ToString(kind), identifier.c_str(), destination.c_str());
    return Result::Ok();
}

Result UpdateCoordinator::UpdatePlugin(const std::string& code) {
    IPlugin* plugin = plugins_.FindByIdentifier(code);
    if (!plugin) {
        Note("Unable to find: " + code);
        return Result::Fail(ErrorCode::UnitNotFound, "Unable to find plugin: " + code);
    }

    Note(plugin->Identifier());
    return engine_.ApplyPlugin(*plugin);
}

Result UpdateCoordinator::RollbackPlugin(const std::string& code, const std::optional<std::string>& stop_on_version) {
    IPlugin* plugin = plugins_.FindByIdentifier(code);
    if (!plugin) {
        bool purged = false;
        auto r = engine_.PurgePlugin(code, purged);
        if (!r.is_ok()) return r;
        if (purged) {
            Note("Purged from database: " + code);
            return Result::Ok();
        }
        Note("Unable to find: " + code);
        return Result::Fail(ErrorCode::UnitNotFound, "Unable to find plugin: " + code);
    }

    bool removed = false;
    if (stop_on_version) {
        auto r = engine_.RollbackToVersion(*plugin, *stop_on_version, removed);
        if (!r.is_ok()) return r;
    } else {
        auto r = engine_.RollbackPlugin(*plugin, removed);
        if (!r.is_ok()) return r;
    }

    if (!removed) {
        Note("Unable to find: " + code);
        return Result::Ok();
    }

    Note("Rolled back: " + code);

    std::optional<std::string> current;
    std::string note;
    auto r = engine_.CurrentVersion(plugin->Identifier(), current, note);
    if (!r.is_ok()) return r;
    if (current) Note("Current Version: " + *current + " (" + note + ")");
    return Result::Ok();
}

Result UpdateCoordinator::SetBuild(const std::string& build, const std::optional<std::string>& hash, bool modified) {
    auto r = params_.Set(params::kCoreBuild, build);
    if (!r.is_ok()) return r;
    r = params_.Set(params::kCoreModified, modified);
    if (!r.is_ok()) return r;
    if (hash && !hash->empty()) {
        r = params_.Set(params::kCoreHash, *hash);
        if (!r.is_ok()) return r;
    }
    return Result::Ok();
}

Result UpdateCoordinator::GetHash(std::string& out) { return negotiator_.CoreHash(out); }

Result UpdateCoordinator::CheckForUpdates(bool force, int& count) { return negotiator_.Check(force, count); }

Result UpdateCoordinator::ListUpdates(bool force, UpdateNegotiationResult& out) {
    return negotiator_.Negotiate(force, out);
}

Result UpdateCoordinator::RequestProjectDetails(const std::string& project_id, nlohmann::ordered_json& out) {
    nlohmann::ordered_json extra;
    extra["id"] = project_id;
    return gateway_.RequestData("project/detail", extra, out);
}

Result UpdateCoordinator::RequestPluginDetails(const std::string& name, nlohmann::ordered_json& out) {
    nlohmann::ordered_json extra;
    extra["name"] = name;
    return gateway_.RequestData("plugin/detail", extra, out);
}

Result UpdateCoordinator::RequestPluginContent(const std::string& name, nlohmann::ordered_json& out) {
    nlohmann::ordered_json extra;
    extra["name"] = name;
    return gateway_.RequestData("plugin/content", extra, out);
}

Result UpdateCoordinator::RequestThemeDetails(const std::string& name, nlohmann::ordered_json& out) {
    nlohmann::ordered_json extra;
    extra["name"] = name;
    return gateway_.RequestData("theme/detail", extra, out);
}

Result UpdateCoordinator::RequestProductDetails(ProductType type,
                                                const std::vector<std::string>& codes,
                                                std::vector<nlohmann::ordered_json>& out) {
    return products_.Lookup(type, codes, out);
}

Result UpdateCoordinator::RequestPopularProducts(ProductType type, nlohmann::ordered_json& out) {
    return products_.Popular(type, out);
}

Result UpdateCoordinator::RequestChangelog(nlohmann::ordered_json& out) { return gateway_.RequestChangelog(out); }

} // namespace sysupdate
