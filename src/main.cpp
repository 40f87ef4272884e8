#include "gateway/curl_transport.hpp"
#include "gateway/gateway_client.hpp"
#include "migration/migration_catalog.hpp"
#include "migration/migration_engine.hpp"
#include "migration/migrator.hpp"
#include "migration/notice_collector.hpp"
#include "migration/version_manager.hpp"
#include "registry/module_registry.hpp"
#include "registry/plugin_registry.hpp"
#include "registry/theme_registry.hpp"
#include "store/cache_store.hpp"
#include "store/database.hpp"
#include "store/migration_ledger.hpp"
#include "store/parameter_store.hpp"
#include "store/plugin_history.hpp"
#include "store/unit_repository.hpp"
#include "update/product_cache.hpp"
#include "update/update_coordinator.hpp"
#include "update/update_negotiator.hpp"
#include "util/clock.hpp"
#include "util/logger.hpp"
#include "util/notes_output.hpp"
#include "util/update_config.hpp"

#include <curl/curl.h>

#include <cstdio>
#include <cstring>
#include <filesystem>
#include <getopt.h>
#include <optional>
#include <string>
#include <vector>

namespace {

constexpr const char *kDefaultConfigPath = "/etc/sysupdate/sysupdate.json";

void PrintUsage(const char *argv) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s [-c <config>] [-v] <command> [args]\n"
        "\n"
        "Commands:\n"
        "  update                              Migrate modules and update all plugins\n"
        "  check [--force]                     Print the number of pending updates\n"
        "  list-updates [--force]              Print the filtered update offers\n"
        "  uninstall                           Roll back every plugin and module\n"
        "  update-plugin <code>                Apply pending versions of one plugin\n"
        "  rollback-plugin <code> [version]    Roll a plugin back, optionally to a version\n"
        "  download <core|plugin|theme> <code> <hash>\n"
        "                                      Download and extract an artifact\n"
        "  set-build <build> [hash]            Record the installed core build\n"
        "  details <plugin|theme> <code>...    Print marketplace details\n"
        "  popular <plugin|theme>              Print popular products\n"
        "  changelog                           Print the changelog\n"
        "\n"
        "Options:\n"
        "  -c, --config    Config file (default %s)\n"
        "  -f, --force     Ignore the retry timer / ask for every update\n"
        "  -v, --verbose   Debug logging\n"
        "  -h, --help      Show this help\n",
        argv, kDefaultConfigPath);
}

int Fail(const sysupdate::Result &r) {
    std::fprintf(stderr, "ERROR: %s (%s)\n", r.msg.c_str(), sysupdate::ToString(r.code()));
    return 1;
}

std::optional<sysupdate::ProductType> ParseProductType(const std::string &s) {
    if (s == "plugin") return sysupdate::ProductType::Plugin;
    if (s == "theme") return sysupdate::ProductType::Theme;
    return std::nullopt;
}

void PrintOffers(const char *title, const std::vector<sysupdate::UpdateOffer> &offers) {
    for (const auto &o : offers) {
        std::printf("%s %s %s -> %s\n", title, o.code.c_str(),
                    o.old_version ? o.old_version->c_str() : "-", o.target_version.c_str());
    }
}

// Owns the object graph for one run.
class App {
public:
    explicit App(const sysupdate::UpdateConfig &cfg)
        : cfg_(cfg),
          params_(db_),
          units_(db_),
          history_(db_),
          cache_(db_, clock_),
          ledger_(db_, cfg.migration_table),
          gateway_(sysupdate::GatewayOptions::FromConfig(cfg), transport_, params_, units_, clock_),
          modules_(cfg.base_dir),
          themes_(params_),
          migrator_(db_, ledger_, catalog_, notices_),
          versions_(migrator_, catalog_, units_, history_, clock_),
          engine_(db_, migrator_, versions_, catalog_, modules_, notices_),
          negotiator_(gateway_, params_, units_, &themes_, clock_, cfg.disable_core_updates),
          products_(gateway_, cache_, clock_),
          coordinator_(cfg, gateway_, params_, ledger_, engine_, notices_, plugins_, &themes_, cache_,
                       negotiator_, products_) {}

    sysupdate::Result Open() {
        const std::string db_path = cfg_.DatabasePath();
        std::error_code ec;
        const auto parent = std::filesystem::path(db_path).parent_path();
        if (!parent.empty()) std::filesystem::create_directories(parent, ec);
        if (ec) {
            return sysupdate::Result::Fail(sysupdate::ErrorCode::Io,
                                           "cannot create " + parent.string() + ": " + ec.message());
        }

        auto r = sysupdate::Database::Open(db_path, db_);
        if (!r.is_ok()) return r;
        if (r = params_.Init(); !r.is_ok()) return r;
        if (r = units_.Init(); !r.is_ok()) return r;
        if (r = history_.Init(); !r.is_ok()) return r;
        if (r = cache_.Init(); !r.is_ok()) return r;
        if (r = plugins_.DiscoverDirectory(cfg_.PluginsDir()); !r.is_ok()) return r;

        gateway_.SetSecurity(cfg_.api_key, cfg_.api_secret);
        coordinator_.SetNotesOutput(&notes_);
        return sysupdate::Result::Ok();
    }

    sysupdate::UpdateCoordinator &Coordinator() { return coordinator_; }

private:
    const sysupdate::UpdateConfig &cfg_;
    sysupdate::SystemClock clock_;
    sysupdate::CurlTransport transport_;
    sysupdate::ConsoleNotes notes_;
    sysupdate::Database db_;
    sysupdate::ParameterStore params_;
    sysupdate::UnitRepository units_;
    sysupdate::PluginHistory history_;
    sysupdate::SqliteCacheStore cache_;
    sysupdate::MigrationLedger ledger_;
    sysupdate::GatewayClient gateway_;
    sysupdate::PluginRegistry plugins_;
    sysupdate::ModuleRegistry modules_;
    sysupdate::ThemeRegistry themes_;
    sysupdate::MigrationCatalog catalog_;
    sysupdate::NoticeCollector notices_;
    sysupdate::Migrator migrator_;
    sysupdate::VersionManager versions_;
    sysupdate::MigrationEngine engine_;
    sysupdate::UpdateNegotiator negotiator_;
    sysupdate::ProductDetailCache products_;
    sysupdate::UpdateCoordinator coordinator_;
};

int RunCommand(sysupdate::UpdateCoordinator &co, const std::vector<std::string> &args, bool force, const char *argv0) {
    using sysupdate::Result;

    const std::string &cmd = args[0];
    const size_t argc = args.size();

    if (cmd == "update" && argc == 1) {
        auto r = co.RunFullUpdate();
        return r.is_ok() ? 0 : Fail(r);
    }
    if (cmd == "check" && argc == 1) {
        int count = 0;
        auto r = co.CheckForUpdates(force, count);
        if (!r.is_ok()) return Fail(r);
        std::printf("%d\n", count);
        return 0;
    }
    if (cmd == "list-updates" && argc == 1) {
        sysupdate::UpdateNegotiationResult res;
        auto r = co.ListUpdates(force, res);
        if (!r.is_ok()) return Fail(r);
        if (res.core) {
            std::printf("core %s -> %s\n", res.core->old_build ? res.core->old_build->c_str() : "-",
                        res.core->target_build.c_str());
        }
        PrintOffers("plugin", res.plugins);
        PrintOffers("theme", res.themes);
        std::printf("%d update(s)\n", res.update_count);
        return 0;
    }
    if (cmd == "uninstall" && argc == 1) {
        auto r = co.UninstallAll();
        return r.is_ok() ? 0 : Fail(r);
    }
    if (cmd == "update-plugin" && argc == 2) {
        auto r = co.UpdatePlugin(args[1]);
        return r.is_ok() ? 0 : Fail(r);
    }
    if (cmd == "rollback-plugin" && (argc == 2 || argc == 3)) {
        std::optional<std::string> stop;
        if (argc == 3) stop = args[2];
        auto r = co.RollbackPlugin(args[1], stop);
        return r.is_ok() ? 0 : Fail(r);
    }
    if (cmd == "download" && argc == 4) {
        auto kind = sysupdate::ParseUnitKind(args[1]);
        if (!kind) {
            std::fprintf(stderr, "Unknown unit kind: %s\n", args[1].c_str());
            return 2;
        }
        auto r = co.DownloadAndExtract(*kind, args[2], args[3]);
        return r.is_ok() ? 0 : Fail(r);
    }
    if (cmd == "set-build" && (argc == 2 || argc == 3)) {
        std::optional<std::string> hash;
        if (argc == 3) hash = args[2];
        auto r = co.SetBuild(args[1], hash, false);
        return r.is_ok() ? 0 : Fail(r);
    }
    if (cmd == "details" && argc >= 3) {
        auto type = ParseProductType(args[1]);
        if (!type) {
            std::fprintf(stderr, "Unknown product type: %s\n", args[1].c_str());
            return 2;
        }
        std::vector<nlohmann::ordered_json> details;
        auto r = co.RequestProductDetails(*type, std::vector<std::string>(args.begin() + 2, args.end()), details);
        if (!r.is_ok()) return Fail(r);
        std::printf("%s\n", nlohmann::ordered_json(details).dump(4).c_str());
        return 0;
    }
    if (cmd == "popular" && argc == 2) {
        auto type = ParseProductType(args[1]);
        if (!type) {
            std::fprintf(stderr, "Unknown product type: %s\n", args[1].c_str());
            return 2;
        }
        nlohmann::ordered_json popular;
        auto r = co.RequestPopularProducts(*type, popular);
        if (!r.is_ok()) return Fail(r);
        std::printf("%s\n", popular.dump(4).c_str());
        return 0;
    }
    if (cmd == "changelog" && argc == 1) {
        nlohmann::ordered_json changelog;
        auto r = co.RequestChangelog(changelog);
        if (!r.is_ok()) return Fail(r);
        std::printf("%s\n", changelog.dump(4).c_str());
        return 0;
    }

    PrintUsage(argv0);
    return 2;
}

} // namespace

int main(int argc, char **argv) {
    std::string config_path = kDefaultConfigPath;
    bool config_given = false;
    bool verbose = false;
    bool force = false;

    static option long_opts[] = {
        {"config", required_argument, nullptr, 'c'},
        {"force", no_argument, nullptr, 'f'},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "hc:fv", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return 0;

            case 'c':
                config_path = optarg;
                config_given = true;
                break;

            case 'f':
                force = true;
                break;

            case 'v':
                verbose = true;
                break;

            default:
                PrintUsage(argv[0]);
                return 2;
        }
    }

    if (optind >= argc) {
        PrintUsage(argv[0]);
        return 2;
    }
    std::vector<std::string> args(argv + optind, argv + argc);

    sysupdate::UpdateConfig cfg;
    std::error_code ec;
    if (config_given || std::filesystem::exists(config_path, ec)) {
        if (auto r = sysupdate::UpdateConfig::LoadFromFile(config_path, cfg); !r.is_ok()) {
            std::fprintf(stderr, "ERROR: cannot load config: %s\n", r.msg.c_str());
            return 1;
        }
    }

    auto level = sysupdate::ParseLogLevel(cfg.log_level);
    if (!level) {
        std::fprintf(stderr, "WARN: unknown log_level '%s', using info\n", cfg.log_level.c_str());
        level = sysupdate::LogLevel::Info;
    }
    sysupdate::Logger::Instance().SetLevel(verbose ? sysupdate::LogLevel::Debug : *level);

    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        std::fprintf(stderr, "ERROR: curl_global_init failed\n");
        return 1;
    }

    int rc = 0;
    {
        App app(cfg);
        if (auto r = app.Open(); !r.is_ok()) {
            rc = Fail(r);
        } else {
            rc = RunCommand(app.Coordinator(), args, force, argv[0]);
        }
    }

    curl_global_cleanup();
    return rc;
}
