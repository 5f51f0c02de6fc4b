#pragma once
#include <sqlite3.h>
#include <cstdint>
#include <optional>
#include <string>

namespace mahilo::store {

// Thin RAII wrapper around a sqlite3 connection.
class SqliteDb {
public:
    explicit SqliteDb(std::string path);
    ~SqliteDb();

    // Non-copyable
    SqliteDb(const SqliteDb&) = delete;
    SqliteDb& operator=(const SqliteDb&) = delete;

    sqlite3* handle() const { return db_; }
    const std::string& path() const { return path_; }

    // Execute a SQL string (pragmas, migrations, transaction control).
    // Throws std::runtime_error on failure.
    void exec(const std::string& sql);

    // Rows touched by the last INSERT/UPDATE/DELETE
    int changes() const { return sqlite3_changes(db_); }

private:
    void configure();

    sqlite3* db_ = nullptr;
    std::string path_;
};

// Prepared statement, finalized on destruction. Bind indexes are 1-based,
// column indexes 0-based.
class Statement {
public:
    Statement(SqliteDb& db, const char* sql);
    ~Statement();

    // Non-copyable
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    bool ok() const { return stmt_ != nullptr; }
    int prepare_rc() const { return prepare_rc_; }

    void bind(int idx, const std::string& value);
    void bind(int idx, const std::optional<std::string>& value);
    void bind(int idx, int value);
    void bind(int idx, int64_t value);
    void bind_null(int idx);

    // Returns SQLITE_ROW, SQLITE_DONE or an error code
    int step();

    std::string text(int col) const;
    std::optional<std::string> optional_text(int col) const;
    int integer(int col) const;
    int64_t int64(int col) const;
    bool is_null(int col) const;

private:
    sqlite3_stmt* stmt_ = nullptr;
    int prepare_rc_ = SQLITE_OK;
};

// BEGIN IMMEDIATE on construction; rolls back unless committed.
class Transaction {
public:
    explicit Transaction(SqliteDb& db);
    ~Transaction();

    // Non-copyable
    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit();

private:
    SqliteDb& db_;
    bool done_ = false;
};

} // namespace mahilo::store
