#pragma once

#include "migration/migration_catalog.hpp"
#include "migration/migrator.hpp"
#include "registry/plugin_registry.hpp"
#include "store/plugin_history.hpp"
#include "store/unit_repository.hpp"
#include "util/clock.hpp"
#include "util/notes_output.hpp"
#include "util/result.hpp"

#include <optional>
#include <string>

namespace sysupdate {

// Moves plugins between declared versions. Each version's scripts run as
// one migration batch and are recorded in the plugin history, which is
// what later rollbacks walk.
class VersionManager {
  public:
    VersionManager(Migrator& migrator,
                   MigrationCatalog& catalog,
                   UnitRepository& units,
                   PluginHistory& history,
                   const IClock& clock)
        : migrator_(migrator), catalog_(catalog), units_(units), history_(history), clock_(clock) {}

    void SetNotesOutput(INotesOutput* out) { notes_ = out; }

    // Ledger key of a plugin: "plugins/<author>/<name>".
    static std::string UnitPath(const std::string& identifier);

    // Applies every declared version newer than the installed one.
    Result UpdatePlugin(const IPlugin& plugin);

    /**
     * @brief Reverse versions newest first.
     *
     * Stops before `stop_on_version` and makes it the installed version;
     * without it every version goes and the unit record is deleted.
     * `removed` reports whether anything was recorded for the plugin.
     */
    Result RemovePlugin(const IPlugin& plugin, const std::optional<std::string>& stop_on_version, bool& removed);

    // Deletes history and unit record without running any script.
    Result PurgePlugin(const std::string& code, bool& purged);

    Result HasDatabaseVersion(const std::string& code, const std::string& version, bool& found);
    Result CurrentVersion(const std::string& code, std::optional<std::string>& out);
    // First comment recorded for the installed version, empty when none.
    Result CurrentVersionNote(const std::string& code, std::string& out);

  private:
    Result EnsureCatalog(const IPlugin& plugin);
    Result ApplyVersion(const IPlugin& plugin, const PluginVersion& version, bool& unit_exists);
    void Note(const std::string& line);

    Migrator& migrator_;
    MigrationCatalog& catalog_;
    UnitRepository& units_;
    PluginHistory& history_;
    const IClock& clock_;
    INotesOutput* notes_ = nullptr;
};

} // namespace sysupdate
