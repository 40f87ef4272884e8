#pragma once

#include "archive/archive_extractor.hpp"
#include "gateway/gateway_client.hpp"
#include "migration/migration_engine.hpp"
#include "migration/notice_collector.hpp"
#include "registry/plugin_registry.hpp"
#include "registry/theme_registry.hpp"
#include "store/cache_store.hpp"
#include "store/migration_ledger.hpp"
#include "store/parameter_store.hpp"
#include "update/product_cache.hpp"
#include "update/update_negotiator.hpp"
#include "util/notes_output.hpp"
#include "util/result.hpp"
#include "util/update_config.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace sysupdate {

enum class UnitKind { Core, Plugin, Theme };

// "core" / "plugin" / "theme"
const char* ToString(UnitKind kind);
std::optional<UnitKind> ParseUnitKind(const std::string& name);

// Top-level update, uninstall and download flows.
class UpdateCoordinator {
  public:
    UpdateCoordinator(const UpdateConfig& cfg,
                      GatewayClient& gateway,
                      ParameterStore& params,
                      MigrationLedger& ledger,
                      MigrationEngine& engine,
                      NoticeCollector& notices,
                      PluginRegistry& plugins,
                      ThemeRegistry* themes,
                      ICacheStore& cache,
                      UpdateNegotiator& negotiator,
                      ProductDetailCache& products)
        : cfg_(cfg), gateway_(gateway), params_(params), ledger_(ledger), engine_(engine), notices_(notices),
          plugins_(plugins), themes_(themes), cache_(cache), negotiator_(negotiator), products_(products) {}

    void SetNotesOutput(INotesOutput* out);

    /**
     * @brief Bring modules and plugins up to date.
     *
     * Creates the ledger on first run, migrates each configured module,
     * updates every registered plugin, resets the pending count and
     * flushes the cache. Modules are seeded only on the first run.
     * Collected notices are printed at the end.
     */
    Result RunFullUpdate();

    // Plugins in reverse registration order, then modules, then the ledger table.
    Result UninstallAll();

    Result DownloadAndExtract(UnitKind kind, const std::string& identifier, const std::string& hash);

    // UnitNotFound when the plugin is not registered.
    Result UpdatePlugin(const std::string& code);

    /**
     * @brief Roll a plugin back entirely or down to `stop_on_version`.
     *
     * A plugin missing from the registry is purged from the database
     * instead; UnitNotFound when there is nothing to purge either.
     */
    Result RollbackPlugin(const std::string& code, const std::optional<std::string>& stop_on_version);

    Result SetBuild(const std::string& build, const std::optional<std::string>& hash, bool modified);
    Result GetHash(std::string& out);

    Result CheckForUpdates(bool force, int& count);
    Result ListUpdates(bool force, UpdateNegotiationResult& out);

    Result RequestProjectDetails(const std::string& project_id, nlohmann::ordered_json& out);
    Result RequestPluginDetails(const std::string& name, nlohmann::ordered_json& out);
    Result RequestPluginContent(const std::string& name, nlohmann::ordered_json& out);
    Result RequestThemeDetails(const std::string& name, nlohmann::ordered_json& out);
    Result RequestProductDetails(ProductType type,
                                 const std::vector<std::string>& codes,
                                 std::vector<nlohmann::ordered_json>& out);
    Result RequestPopularProducts(ProductType type, nlohmann::ordered_json& out);
    Result RequestChangelog(nlohmann::ordered_json& out);

  private:
    Result Download(UnitKind kind, const std::string& identifier, const std::string& hash, std::string& file_path);
    void Note(const std::string& line);

    const UpdateConfig& cfg_;
    GatewayClient& gateway_;
    ParameterStore& params_;
    MigrationLedger& ledger_;
    MigrationEngine& engine_;
    NoticeCollector& notices_;
    PluginRegistry& plugins_;
    ThemeRegistry* themes_;
    ICacheStore& cache_;
    UpdateNegotiator& negotiator_;
    ProductDetailCache& products_;
    ArchiveExtractor extractor_;
    INotesOutput* notes_ = nullptr;
};

} // namespace sysupdate
