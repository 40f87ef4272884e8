#pragma once

#include "store/database.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace sysupdate {

struct LedgerEntry {
    std::int64_t id = 0;
    std::string unit_path;
    std::string migration;
    int batch = 0;
};

// Persisted record of applied migrations. The table's existence is the
// "already initialized" signal.
class MigrationLedger {
public:
    MigrationLedger(Database& db, std::string table) : db_(db), table_(std::move(table)) {}

    const std::string& Table() const { return table_; }

    Result Exists(bool& exists);
    Result Create();
    Result Drop();

    Result Ran(const std::string& unit_path, std::vector<std::string>& names);

    // Highest batch number across the whole ledger, 0 when empty.
    Result LastBatchNumber(int& out);

    // Entries of the newest batch that touches any of `unit_paths`,
    // restricted to those paths, newest first.
    Result Last(const std::vector<std::string>& unit_paths, std::vector<LedgerEntry>& out);

    Result Log(const std::string& unit_path, const std::string& migration, int batch);
    Result Delete(const std::string& unit_path, const std::string& migration);

    Result All(std::vector<LedgerEntry>& out);

private:
    Database& db_;
    std::string table_;
};

} // namespace sysupdate
