#pragma once

#include "util/result.hpp"

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace sysupdate {

class Statement {
public:
    Statement() = default;
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;
    Statement(Statement&&) noexcept = default;
    Statement& operator=(Statement&&) noexcept = default;

    Result Bind(int index, const std::string& value);
    Result Bind(int index, std::int64_t value);
    Result BindNull(int index);

    // Advances the cursor; `has_row` is false once the statement is done.
    Result Step(bool& has_row);
    // For statements that produce no rows.
    Result Run();

    std::string ColumnText(int index) const;
    std::int64_t ColumnInt64(int index) const;
    bool ColumnIsNull(int index) const;

private:
    friend class Database;

    struct Finalizer {
        void operator()(sqlite3_stmt* s) const {
            if (s) sqlite3_finalize(s);
        }
    };

    std::unique_ptr<sqlite3_stmt, Finalizer> stmt_;
    sqlite3* db_ = nullptr;
};

class Database {
public:
    static Result Open(const std::string& path, Database& out);

    Database() = default;
    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;
    Database(Database&&) noexcept = default;
    Database& operator=(Database&&) noexcept = default;

    bool IsOpen() const { return db_ != nullptr; }
    const std::string& Path() const { return path_; }

    Result Exec(const std::string& sql);
    Result Prepare(const std::string& sql, Statement& out);
    Result TableExists(const std::string& name, bool& exists);

    std::int64_t LastInsertId() const;
    int Changes() const;

private:
    struct Closer {
        void operator()(sqlite3* db) const {
            if (db) sqlite3_close(db);
        }
    };

    std::unique_ptr<sqlite3, Closer> db_;
    std::string path_;
};

// Rolls back unless Commit() succeeded.
class Transaction {
public:
    explicit Transaction(Database& db) : db_(db) {}
    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;
    ~Transaction();

    Result Begin();
    Result Commit();

private:
    Database& db_;
    bool active_ = false;
};

// Double-quoted SQL identifier; table names come from configuration.
std::string QuoteIdentifier(const std::string& name);

} // namespace sysupdate
