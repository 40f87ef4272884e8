#pragma once

#include "migration/migration_catalog.hpp"
#include "migration/notice_collector.hpp"
#include "store/database.hpp"
#include "store/migration_ledger.hpp"
#include "util/notes_output.hpp"
#include "util/result.hpp"

#include <string>
#include <vector>

namespace sysupdate {

// Applies pending migrations as numbered batches and reverses them one
// batch at a time. Each migration commits together with its ledger row;
// a failure stops the run and keeps the rows of migrations already done.
class Migrator {
  public:
    struct Options {
        // When non-empty only these migrations run, in the listed order.
        std::vector<std::string> only;
    };

    Migrator(Database& db, MigrationLedger& ledger, const MigrationCatalog& catalog, NoticeCollector& notices)
        : db_(db), ledger_(ledger), catalog_(catalog), notices_(notices) {}

    void SetNotesOutput(INotesOutput* out) { notes_ = out; }

    Result Run(const std::string& unit_path, const Options& opt, std::vector<std::string>& applied);
    Result Run(const std::vector<std::string>& unit_paths, const Options& opt, std::vector<std::string>& applied);

    // Reverses the newest batch touching `unit_paths`. Ledger rows the
    // catalog does not know are deleted without running anything and
    // reported in `dropped`. Both are empty when nothing was left.
    Result Rollback(const std::vector<std::string>& unit_paths,
                    std::vector<std::string>& rolled_back,
                    std::vector<std::string>* dropped = nullptr);

    // Reverses `names` of one unit, last name first, whatever batch they
    // ran in. Names without a ledger row are skipped.
    Result RollbackNamed(const std::string& unit_path,
                         const std::vector<std::string>& names,
                         std::vector<std::string>& rolled_back,
                         std::vector<std::string>* dropped = nullptr);

  private:
    struct Pending {
        std::string unit_path;
        IMigration* migration = nullptr;
    };

    Result CollectPending(const std::vector<std::string>& unit_paths,
                          const Options& opt,
                          std::vector<Pending>& out);
    Result RunUp(const Pending& p, int batch);
    Result RunDown(const LedgerEntry& entry, IMigration& migration);
    // Down plus ledger delete; a row the catalog does not know is only deleted.
    Result Reverse(const LedgerEntry& entry, bool& reversed);
    void Note(const std::string& line);

    Database& db_;
    MigrationLedger& ledger_;
    const MigrationCatalog& catalog_;
    NoticeCollector& notices_;
    INotesOutput* notes_ = nullptr;
};

} // namespace sysupdate
