#include "store/cache_store.hpp"

namespace sysupdate {

Result SqliteCacheStore::Init() {
    return db_.Exec("CREATE TABLE IF NOT EXISTS cache ("
                    " key TEXT PRIMARY KEY,"
                    " value TEXT NOT NULL,"
                    " expiration INTEGER NOT NULL)");
}

Result SqliteCacheStore::Get(const std::string& key, std::optional<std::string>& out) {
    out.reset();
    Statement stmt;
    auto r = db_.Prepare("SELECT value, expiration FROM cache WHERE key = ?", stmt);
    if (!r.is_ok()) return r;
    if (r = stmt.Bind(1, key); !r.is_ok()) return r;

    bool has_row = false;
    if (r = stmt.Step(has_row); !r.is_ok()) return r;
    if (!has_row) return Result::Ok();

    if (stmt.ColumnInt64(1) <= clock_.NowSeconds()) {
        return Forget(key);
    }
    out = stmt.ColumnText(0);
    return Result::Ok();
}

Result SqliteCacheStore::Put(const std::string& key, const std::string& value, std::int64_t expires_at) {
    Statement stmt;
    auto r = db_.Prepare("INSERT INTO cache (key, value, expiration) VALUES (?, ?, ?)"
                         " ON CONFLICT(key) DO UPDATE SET value = excluded.value,"
                         " expiration = excluded.expiration",
                         stmt);
    if (!r.is_ok()) return r;
    if (r = stmt.Bind(1, key); !r.is_ok()) return r;
    if (r = stmt.Bind(2, value); !r.is_ok()) return r;
    if (r = stmt.Bind(3, expires_at); !r.is_ok()) return r;
    return stmt.Run();
}

Result SqliteCacheStore::Forget(const std::string& key) {
    Statement stmt;
    auto r = db_.Prepare("DELETE FROM cache WHERE key = ?", stmt);
    if (!r.is_ok()) return r;
    if (r = stmt.Bind(1, key); !r.is_ok()) return r;
    return stmt.Run();
}

Result SqliteCacheStore::Flush() { return db_.Exec("DELETE FROM cache"); }

} // namespace sysupdate
