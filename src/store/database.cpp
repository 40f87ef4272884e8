#include "store/database.hpp"

#include "util/logger.hpp"

namespace sysupdate {

namespace {

Result Check(int rc, sqlite3* db, const char* what) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();
    return Result::Fail(ErrorCode::Database,
                        std::string(what) + ": " + (db ? sqlite3_errmsg(db) : sqlite3_errstr(rc)));
}

} // namespace

Result Statement::Bind(int index, const std::string& value) {
    return Check(sqlite3_bind_text(stmt_.get(), index, value.c_str(),
                                   static_cast<int>(value.size()), SQLITE_TRANSIENT),
                 db_, "sqlite bind");
}

Result Statement::Bind(int index, std::int64_t value) {
    return Check(sqlite3_bind_int64(stmt_.get(), index, static_cast<sqlite3_int64>(value)),
                 db_, "sqlite bind");
}

Result Statement::BindNull(int index) {
    return Check(sqlite3_bind_null(stmt_.get(), index), db_, "sqlite bind");
}

Result Statement::Step(bool& has_row) {
    has_row = false;
    if (!stmt_) return Result::Fail(ErrorCode::Database, "step on unprepared statement");
    const int rc = sqlite3_step(stmt_.get());
    if (rc == SQLITE_ROW) {
        has_row = true;
        return Result::Ok();
    }
    return Check(rc, db_, "sqlite step");
}

Result Statement::Run() {
    bool has_row = false;
    do {
        auto r = Step(has_row);
        if (!r.is_ok()) return r;
    } while (has_row);
    return Result::Ok();
}

std::string Statement::ColumnText(int index) const {
    const unsigned char* text = sqlite3_column_text(stmt_.get(), index);
    if (!text) return {};
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<size_t>(sqlite3_column_bytes(stmt_.get(), index)));
}

std::int64_t Statement::ColumnInt64(int index) const {
    return static_cast<std::int64_t>(sqlite3_column_int64(stmt_.get(), index));
}

bool Statement::ColumnIsNull(int index) const {
    return sqlite3_column_type(stmt_.get(), index) == SQLITE_NULL;
}

Result Database::Open(const std::string& path, Database& out) {
    sqlite3* raw = nullptr;
    const int rc = sqlite3_open_v2(path.c_str(), &raw,
                                   SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    std::unique_ptr<sqlite3, Closer> db(raw);
    if (rc != SQLITE_OK) {
        return Result::Fail(ErrorCode::Database,
                            "cannot open database " + path + ": " +
                                (raw ? sqlite3_errmsg(raw) : sqlite3_errstr(rc)));
    }

    // wait for locks instead of failing immediately
    auto r = Check(sqlite3_busy_timeout(db.get(), 5000), db.get(), "busy_timeout");
    if (!r.is_ok()) return r;

    out.db_ = std::move(db);
    out.path_ = path;

    r = out.Exec("PRAGMA foreign_keys=ON;");
    if (!r.is_ok()) return r;

    LogDebug("Opened database %s", path.c_str());
    return Result::Ok();
}

Result Database::Exec(const std::string& sql) {
    char* err = nullptr;
    const int rc = sqlite3_exec(db_.get(), sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err ? err : "sqlite exec failed";
        sqlite3_free(err);
        return Result::Fail(ErrorCode::Database, msg);
    }
    return Result::Ok();
}

Result Database::Prepare(const std::string& sql, Statement& out) {
    sqlite3_stmt* stmt = nullptr;
    const int rc = sqlite3_prepare_v2(db_.get(), sql.c_str(), -1, &stmt, nullptr);
    out.stmt_.reset(stmt);
    out.db_ = db_.get();
    return Check(rc, db_.get(), "sqlite prepare");
}

Result Database::TableExists(const std::string& name, bool& exists) {
    exists = false;
    Statement stmt;
    auto r = Prepare("SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = ?", stmt);
    if (!r.is_ok()) return r;
    r = stmt.Bind(1, name);
    if (!r.is_ok()) return r;
    return stmt.Step(exists);
}

std::int64_t Database::LastInsertId() const {
    return static_cast<std::int64_t>(sqlite3_last_insert_rowid(db_.get()));
}

int Database::Changes() const { return sqlite3_changes(db_.get()); }

Transaction::~Transaction() {
    if (active_) {
        auto r = db_.Exec("ROLLBACK");
        if (!r.is_ok()) LogError("Rollback failed: %s", r.msg.c_str());
    }
}

Result Transaction::Begin() {
    auto r = db_.Exec("BEGIN");
    if (r.is_ok()) active_ = true;
    return r;
}

Result Transaction::Commit() {
    auto r = db_.Exec("COMMIT");
    if (r.is_ok()) active_ = false;
    return r;
}

std::string QuoteIdentifier(const std::string& name) {
    std::string out = "\"";
    for (char c : name) {
        if (c == '"') out.push_back('"');
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

} // namespace sysupdate
