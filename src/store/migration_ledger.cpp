#include "store/migration_ledger.hpp"

namespace sysupdate {

namespace {

std::string Placeholders(size_t n) {
    std::string out;
    for (size_t i = 0; i < n; ++i) {
        if (i) out += ", ";
        out += "?";
    }
    return out;
}

Result BindPaths(Statement& stmt, const std::vector<std::string>& paths, int first_index) {
    int idx = first_index;
    for (const auto& p : paths) {
        auto r = stmt.Bind(idx++, p);
        if (!r.is_ok()) return r;
    }
    return Result::Ok();
}

} // namespace

Result MigrationLedger::Exists(bool& exists) { return db_.TableExists(table_, exists); }

Result MigrationLedger::Create() {
    return db_.Exec("CREATE TABLE IF NOT EXISTS " + QuoteIdentifier(table_) +
                    " (id INTEGER PRIMARY KEY AUTOINCREMENT,"
                    " unit_path TEXT NOT NULL,"
                    " migration TEXT NOT NULL,"
                    " batch INTEGER NOT NULL)");
}

Result MigrationLedger::Drop() { return db_.Exec("DROP TABLE IF EXISTS " + QuoteIdentifier(table_)); }

Result MigrationLedger::Ran(const std::string& unit_path, std::vector<std::string>& names) {
    names.clear();
    Statement stmt;
    auto r = db_.Prepare("SELECT migration FROM " + QuoteIdentifier(table_) +
                             " WHERE unit_path = ? ORDER BY batch, migration",
                         stmt);
    if (!r.is_ok()) return r;
    if (r = stmt.Bind(1, unit_path); !r.is_ok()) return r;

    bool has_row = false;
    while (true) {
        if (r = stmt.Step(has_row); !r.is_ok()) return r;
        if (!has_row) break;
        names.push_back(stmt.ColumnText(0));
    }
    return Result::Ok();
}

Result MigrationLedger::LastBatchNumber(int& out) {
    out = 0;
    Statement stmt;
    auto r = db_.Prepare("SELECT COALESCE(MAX(batch), 0) FROM " + QuoteIdentifier(table_), stmt);
    if (!r.is_ok()) return r;

    bool has_row = false;
    if (r = stmt.Step(has_row); !r.is_ok()) return r;
    if (has_row) out = static_cast<int>(stmt.ColumnInt64(0));
    return Result::Ok();
}

Result MigrationLedger::Last(const std::vector<std::string>& unit_paths, std::vector<LedgerEntry>& out) {
    out.clear();
    if (unit_paths.empty()) return Result::Ok();

    const std::string table = QuoteIdentifier(table_);
    const std::string in = "(" + Placeholders(unit_paths.size()) + ")";
    Statement stmt;
    auto r = db_.Prepare("SELECT id, unit_path, migration, batch FROM " + table +
                             " WHERE unit_path IN " + in +
                             " AND batch = (SELECT MAX(batch) FROM " + table +
                             " WHERE unit_path IN " + in + ")"
                             " ORDER BY id DESC",
                         stmt);
    if (!r.is_ok()) return r;
    if (r = BindPaths(stmt, unit_paths, 1); !r.is_ok()) return r;
    if (r = BindPaths(stmt, unit_paths, static_cast<int>(unit_paths.size()) + 1); !r.is_ok()) return r;

    bool has_row = false;
    while (true) {
        if (r = stmt.Step(has_row); !r.is_ok()) return r;
        if (!has_row) break;
        LedgerEntry e;
        e.id = stmt.ColumnInt64(0);
        e.unit_path = stmt.ColumnText(1);
        e.migration = stmt.ColumnText(2);
        e.batch = static_cast<int>(stmt.ColumnInt64(3));
        out.push_back(std::move(e));
    }
    return Result::Ok();
}

Result MigrationLedger::Log(const std::string& unit_path, const std::string& migration, int batch) {
    Statement stmt;
    auto r = db_.Prepare("INSERT INTO " + QuoteIdentifier(table_) +
                             " (unit_path, migration, batch) VALUES (?, ?, ?)",
                         stmt);
    if (!r.is_ok()) return r;
    if (r = stmt.Bind(1, unit_path); !r.is_ok()) return r;
    if (r = stmt.Bind(2, migration); !r.is_ok()) return r;
    if (r = stmt.Bind(3, static_cast<std::int64_t>(batch)); !r.is_ok()) return r;
    return stmt.Run();
}

Result MigrationLedger::Delete(const std::string& unit_path, const std::string& migration) {
    Statement stmt;
    auto r = db_.Prepare("DELETE FROM " + QuoteIdentifier(table_) +
                             " WHERE unit_path = ? AND migration = ?",
                         stmt);
    if (!r.is_ok()) return r;
    if (r = stmt.Bind(1, unit_path); !r.is_ok()) return r;
    if (r = stmt.Bind(2, migration); !r.is_ok()) return r;
    return stmt.Run();
}

Result MigrationLedger::All(std::vector<LedgerEntry>& out) {
    out.clear();
    Statement stmt;
    auto r = db_.Prepare("SELECT id, unit_path, migration, batch FROM " + QuoteIdentifier(table_) +
                             " ORDER BY id",
                         stmt);
    if (!r.is_ok()) return r;

    bool has_row = false;
    while (true) {
        if (r = stmt.Step(has_row); !r.is_ok()) return r;
        if (!has_row) break;
        LedgerEntry e;
        e.id = stmt.ColumnInt64(0);
        e.unit_path = stmt.ColumnText(1);
        e.migration = stmt.ColumnText(2);
        e.batch = static_cast<int>(stmt.ColumnInt64(3));
        out.push_back(std::move(e));
    }
    return Result::Ok();
}

} // namespace sysupdate
