#include "store/plugin_history.hpp"

namespace sysupdate {

namespace {

const char* TypeName(HistoryEntry::Type t) {
    return t == HistoryEntry::Type::Script ? "script" : "comment";
}

} // namespace

Result PluginHistory::Init() {
    return db_.Exec("CREATE TABLE IF NOT EXISTS plugin_history ("
                    " id INTEGER PRIMARY KEY AUTOINCREMENT,"
                    " code TEXT NOT NULL,"
                    " type TEXT NOT NULL,"
                    " version TEXT NOT NULL,"
                    " detail TEXT NOT NULL DEFAULT '')");
}

Result PluginHistory::Add(const HistoryEntry& entry) {
    Statement stmt;
    auto r = db_.Prepare("INSERT INTO plugin_history (code, type, version, detail) VALUES (?, ?, ?, ?)",
                         stmt);
    if (!r.is_ok()) return r;
    if (r = stmt.Bind(1, entry.code); !r.is_ok()) return r;
    if (r = stmt.Bind(2, std::string(TypeName(entry.type))); !r.is_ok()) return r;
    if (r = stmt.Bind(3, entry.version); !r.is_ok()) return r;
    if (r = stmt.Bind(4, entry.detail); !r.is_ok()) return r;
    return stmt.Run();
}

Result PluginHistory::ForPlugin(const std::string& code, std::vector<HistoryEntry>& out) {
    out.clear();
    Statement stmt;
    auto r = db_.Prepare("SELECT id, code, type, version, detail FROM plugin_history"
                         " WHERE code = ? ORDER BY id",
                         stmt);
    if (!r.is_ok()) return r;
    if (r = stmt.Bind(1, code); !r.is_ok()) return r;

    bool has_row = false;
    while (true) {
        if (r = stmt.Step(has_row); !r.is_ok()) return r;
        if (!has_row) break;
        HistoryEntry e;
        e.id = stmt.ColumnInt64(0);
        e.code = stmt.ColumnText(1);
        e.type = stmt.ColumnText(2) == "script" ? HistoryEntry::Type::Script
                                                : HistoryEntry::Type::Comment;
        e.version = stmt.ColumnText(3);
        e.detail = stmt.ColumnText(4);
        out.push_back(std::move(e));
    }
    return Result::Ok();
}

Result PluginHistory::Versions(const std::string& code, std::vector<std::string>& out) {
    out.clear();
    Statement stmt;
    auto r = db_.Prepare("SELECT version FROM plugin_history WHERE code = ?"
                         " GROUP BY version ORDER BY MIN(id)",
                         stmt);
    if (!r.is_ok()) return r;
    if (r = stmt.Bind(1, code); !r.is_ok()) return r;

    bool has_row = false;
    while (true) {
        if (r = stmt.Step(has_row); !r.is_ok()) return r;
        if (!has_row) break;
        out.push_back(stmt.ColumnText(0));
    }
    return Result::Ok();
}

Result PluginHistory::HasVersion(const std::string& code, const std::string& version, bool& found) {
    found = false;
    Statement stmt;
    auto r = db_.Prepare("SELECT 1 FROM plugin_history WHERE code = ? AND version = ? LIMIT 1", stmt);
    if (!r.is_ok()) return r;
    if (r = stmt.Bind(1, code); !r.is_ok()) return r;
    if (r = stmt.Bind(2, version); !r.is_ok()) return r;
    return stmt.Step(found);
}

Result PluginHistory::RemoveVersion(const std::string& code, const std::string& version) {
    Statement stmt;
    auto r = db_.Prepare("DELETE FROM plugin_history WHERE code = ? AND version = ?", stmt);
    if (!r.is_ok()) return r;
    if (r = stmt.Bind(1, code); !r.is_ok()) return r;
    if (r = stmt.Bind(2, version); !r.is_ok()) return r;
    return stmt.Run();
}

Result PluginHistory::RemoveAll(const std::string& code, int& removed) {
    removed = 0;
    Statement stmt;
    auto r = db_.Prepare("DELETE FROM plugin_history WHERE code = ?", stmt);
    if (!r.is_ok()) return r;
    if (r = stmt.Bind(1, code); !r.is_ok()) return r;
    if (r = stmt.Run(); !r.is_ok()) return r;
    removed = db_.Changes();
    return Result::Ok();
}

} // namespace sysupdate
