#pragma once

#include "migration/migration_catalog.hpp"
#include "migration/migrator.hpp"
#include "migration/notice_collector.hpp"
#include "migration/version_manager.hpp"
#include "registry/module_registry.hpp"
#include "registry/plugin_registry.hpp"
#include "store/database.hpp"
#include "util/result.hpp"

#include <optional>
#include <string>
#include <vector>

namespace sysupdate {

// Unit-level migration operations for modules and plugins.
class MigrationEngine {
  public:
    MigrationEngine(Database& db,
                    Migrator& migrator,
                    VersionManager& versions,
                    MigrationCatalog& catalog,
                    const ModuleRegistry& modules,
                    NoticeCollector& notices)
        : db_(db), migrator_(migrator), versions_(versions), catalog_(catalog), modules_(modules),
          notices_(notices) {}

    void SetNotesOutput(INotesOutput* out) {
        migrator_.SetNotesOutput(out);
        versions_.SetNotesOutput(out);
    }

    // Runs everything pending under `unit_path` as one new batch.
    Result Apply(const std::string& unit_path, std::vector<std::string>& applied);
    Result ApplyModule(const std::string& module, std::vector<std::string>& applied);

    // Runs the module's seeder if it has one.
    Result Seed(const std::string& module, bool& seeded);

    // Reverses batches until nothing under `unit_paths` remains.
    Result Rollback(const std::vector<std::string>& unit_paths, int& rolled_back);
    Result RollbackModules(const std::vector<std::string>& modules, int& rolled_back);

    Result ApplyPlugin(const IPlugin& plugin);

    // VersionNotFound when `target_version` was never installed.
    Result RollbackToVersion(const IPlugin& plugin, const std::string& target_version, bool& removed);
    Result RollbackPlugin(const IPlugin& plugin, bool& removed);
    Result PurgePlugin(const std::string& code, bool& purged);

    // Installed version and its first note, for operator output.
    Result CurrentVersion(const std::string& code, std::optional<std::string>& version, std::string& note);

  private:
    Database& db_;
    Migrator& migrator_;
    VersionManager& versions_;
    MigrationCatalog& catalog_;
    const ModuleRegistry& modules_;
    NoticeCollector& notices_;
};

} // namespace sysupdate
