#include "migration/migration_engine.hpp"

#include "util/logger.hpp"

namespace sysupdate {

Result MigrationEngine::Apply(const std::string& unit_path, std::vector<std::string>& applied) {
    return migrator_.Run(unit_path, Migrator::Options{}, applied);
}

Result MigrationEngine::ApplyModule(const std::string& module, std::vector<std::string>& applied) {
    auto r = modules_.LoadInto(module, catalog_);
    if (!r.is_ok()) return r;
    return Apply(ModuleRegistry::UnitPath(module), applied);
}

Result MigrationEngine::Seed(const std::string& module, bool& seeded) {
    seeded = false;

    const ModuleDefinition* def = modules_.Find(module);
    if (!def || !def->seeder) {
        LogDebug("No seeder for module %s", module.c_str());
        return Result::Ok();
    }

    std::vector<std::string> messages;
    auto r = def->seeder->Seed(db_, messages);
    if (!r.is_ok()) {
        LogError("Seeding %s failed: %s", module.c_str(), r.msg.c_str());
        return r;
    }

    notices_.Add(def->seeder->Name(), messages);
    seeded = true;
    return Result::Ok();
}

Result MigrationEngine::Rollback(const std::vector<std::string>& unit_paths, int& rolled_back) {
    rolled_back = 0;
    while (true) {
        std::vector<std::string> batch;
        std::vector<std::string> dropped;
        auto r = migrator_.Rollback(unit_paths, batch, &dropped);
        if (!r.is_ok()) return r;
        if (batch.empty() && dropped.empty()) break;
        rolled_back += static_cast<int>(batch.size());
    }
    return Result::Ok();
}

Result MigrationEngine::RollbackModules(const std::vector<std::string>& modules, int& rolled_back) {
    std::vector<std::string> paths;
    for (const auto& module : modules) {
        auto r = modules_.LoadInto(module, catalog_);
        if (!r.is_ok()) return r;
        paths.push_back(ModuleRegistry::UnitPath(module));
    }
    return Rollback(paths, rolled_back);
}

Result MigrationEngine::ApplyPlugin(const IPlugin& plugin) {
    return versions_.UpdatePlugin(plugin);
}

Result MigrationEngine::RollbackToVersion(const IPlugin& plugin, const std::string& target_version, bool& removed) {
    removed = false;
    bool found = false;
    auto r = versions_.HasDatabaseVersion(plugin.Identifier(), target_version, found);
    if (!r.is_ok()) return r;
    if (!found) {
        return Result::Fail(ErrorCode::VersionNotFound,
                            "Plugin version not found: " + plugin.Identifier() + " " + target_version);
    }

    return versions_.RemovePlugin(plugin, target_version, removed);
}

Result MigrationEngine::RollbackPlugin(const IPlugin& plugin, bool& removed) {
    return versions_.RemovePlugin(plugin, std::nullopt, removed);
}

Result MigrationEngine::PurgePlugin(const std::string& code, bool& purged) {
    return versions_.PurgePlugin(code, purged);
}

Result MigrationEngine::CurrentVersion(const std::string& code, std::optional<std::string>& version, std::string& note) {
    note.clear();
    auto r = versions_.CurrentVersion(code, version);
    if (!r.is_ok() || !version) return r;
    return versions_.CurrentVersionNote(code, note);
}

} // namespace sysupdate
