#include "store/unit_repository.hpp"

namespace sysupdate {

namespace {

constexpr const char kSelectColumns[] =
    "SELECT code, name, version, icon, is_frozen, is_updatable, is_disabled, created_at"
    " FROM plugin_versions";

InstalledUnit ReadRow(const Statement& stmt) {
    InstalledUnit u;
    u.code = stmt.ColumnText(0);
    u.name = stmt.ColumnText(1);
    u.version = stmt.ColumnText(2);
    u.icon = stmt.ColumnText(3);
    u.is_frozen = stmt.ColumnInt64(4) != 0;
    u.is_updatable = stmt.ColumnInt64(5) != 0;
    u.is_disabled = stmt.ColumnInt64(6) != 0;
    u.created_at = stmt.ColumnText(7);
    return u;
}

} // namespace

Result UnitRepository::Init() {
    return db_.Exec("CREATE TABLE IF NOT EXISTS plugin_versions ("
                    " code TEXT PRIMARY KEY,"
                    " name TEXT NOT NULL DEFAULT '',"
                    " version TEXT NOT NULL,"
                    " icon TEXT NOT NULL DEFAULT '',"
                    " is_frozen INTEGER NOT NULL DEFAULT 0,"
                    " is_updatable INTEGER NOT NULL DEFAULT 1,"
                    " is_disabled INTEGER NOT NULL DEFAULT 0,"
                    " created_at TEXT NOT NULL DEFAULT '')");
}

Result UnitRepository::All(std::vector<InstalledUnit>& out) {
    out.clear();
    Statement stmt;
    auto r = db_.Prepare(std::string(kSelectColumns) + " ORDER BY created_at, rowid", stmt);
    if (!r.is_ok()) return r;

    bool has_row = false;
    while (true) {
        if (r = stmt.Step(has_row); !r.is_ok()) return r;
        if (!has_row) break;
        out.push_back(ReadRow(stmt));
    }
    return Result::Ok();
}

Result UnitRepository::Find(const std::string& code, std::optional<InstalledUnit>& out) {
    out.reset();
    Statement stmt;
    auto r = db_.Prepare(std::string(kSelectColumns) + " WHERE code = ?", stmt);
    if (!r.is_ok()) return r;
    if (r = stmt.Bind(1, code); !r.is_ok()) return r;

    bool has_row = false;
    if (r = stmt.Step(has_row); !r.is_ok()) return r;
    if (has_row) out = ReadRow(stmt);
    return Result::Ok();
}

Result UnitRepository::Save(const InstalledUnit& unit) {
    Statement stmt;
    auto r = db_.Prepare(
        "INSERT INTO plugin_versions"
        " (code, name, version, icon, is_frozen, is_updatable, is_disabled, created_at)"
        " VALUES (?, ?, ?, ?, ?, ?, ?, ?)"
        " ON CONFLICT(code) DO UPDATE SET name = excluded.name, version = excluded.version,"
        " icon = excluded.icon, is_frozen = excluded.is_frozen,"
        " is_updatable = excluded.is_updatable, is_disabled = excluded.is_disabled",
        stmt);
    if (!r.is_ok()) return r;

    if (r = stmt.Bind(1, unit.code); !r.is_ok()) return r;
    if (r = stmt.Bind(2, unit.name); !r.is_ok()) return r;
    if (r = stmt.Bind(3, unit.version); !r.is_ok()) return r;
    if (r = stmt.Bind(4, unit.icon); !r.is_ok()) return r;
    if (r = stmt.Bind(5, std::int64_t{unit.is_frozen ? 1 : 0}); !r.is_ok()) return r;
    if (r = stmt.Bind(6, std::int64_t{unit.is_updatable ? 1 : 0}); !r.is_ok()) return r;
    if (r = stmt.Bind(7, std::int64_t{unit.is_disabled ? 1 : 0}); !r.is_ok()) return r;
    if (r = stmt.Bind(8, unit.created_at); !r.is_ok()) return r;
    return stmt.Run();
}

Result UnitRepository::SetVersion(const std::string& code, const std::string& version) {
    Statement stmt;
    auto r = db_.Prepare("UPDATE plugin_versions SET version = ? WHERE code = ?", stmt);
    if (!r.is_ok()) return r;
    if (r = stmt.Bind(1, version); !r.is_ok()) return r;
    if (r = stmt.Bind(2, code); !r.is_ok()) return r;
    return stmt.Run();
}

Result UnitRepository::Remove(const std::string& code) {
    Statement stmt;
    auto r = db_.Prepare("DELETE FROM plugin_versions WHERE code = ?", stmt);
    if (!r.is_ok()) return r;
    if (r = stmt.Bind(1, code); !r.is_ok()) return r;
    return stmt.Run();
}

Result UnitRepository::OldestCreatedAt(std::optional<std::string>& out) {
    out.reset();
    Statement stmt;
    auto r = db_.Prepare("SELECT created_at FROM plugin_versions"
                         " WHERE created_at != '' ORDER BY created_at LIMIT 1",
                         stmt);
    if (!r.is_ok()) return r;

    bool has_row = false;
    if (r = stmt.Step(has_row); !r.is_ok()) return r;
    if (has_row) out = stmt.ColumnText(0);
    return Result::Ok();
}

} // namespace sysupdate
