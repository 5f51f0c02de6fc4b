#include "store/sqlite_db.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <utility>

namespace mahilo::store {

namespace {

void throw_if(int rc, sqlite3* db, const char* what) {
    if (rc != SQLITE_OK) {
        throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
    }
}

} // namespace

// ============================================================================
// SqliteDb
// ============================================================================

SqliteDb::SqliteDb(std::string path) : path_(std::move(path)) {
    int rc = sqlite3_open_v2(path_.c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
        if (db_) {
            sqlite3_close(db_);
        }
        db_ = nullptr;
        throw std::runtime_error("failed to open " + path_ + ": " + msg);
    }

    configure();
}

SqliteDb::~SqliteDb() {
    if (db_) {
        sqlite3_close(db_);
    }
}

void SqliteDb::exec(const std::string& sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err ? err : "sqlite exec failed";
        sqlite3_free(err);
        throw std::runtime_error(msg);
    }
}

void SqliteDb::configure() {
    // WAL lets readers proceed while the retry tick holds the write lock
    exec("PRAGMA journal_mode=WAL;");
    exec("PRAGMA synchronous=NORMAL;");
    exec("PRAGMA foreign_keys=ON;");
    throw_if(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");
    exec("PRAGMA temp_store=MEMORY;");
}

// ============================================================================
// Statement
// ============================================================================

Statement::Statement(SqliteDb& db, const char* sql) {
    prepare_rc_ = sqlite3_prepare_v2(db.handle(), sql, -1, &stmt_, nullptr);
    if (prepare_rc_ != SQLITE_OK) {
        spdlog::error("sqlite prepare failed: {} ({})", sqlite3_errmsg(db.handle()), sql);
        sqlite3_finalize(stmt_);
        stmt_ = nullptr;
    }
}

Statement::~Statement() {
    if (stmt_) {
        sqlite3_finalize(stmt_);
    }
}

void Statement::bind(int idx, const std::string& value) {
    sqlite3_bind_text(stmt_, idx, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

void Statement::bind(int idx, const std::optional<std::string>& value) {
    if (value) {
        bind(idx, *value);
    } else {
        bind_null(idx);
    }
}

void Statement::bind(int idx, int value) {
    sqlite3_bind_int(stmt_, idx, value);
}

void Statement::bind(int idx, int64_t value) {
    sqlite3_bind_int64(stmt_, idx, static_cast<sqlite3_int64>(value));
}

void Statement::bind_null(int idx) {
    sqlite3_bind_null(stmt_, idx);
}

int Statement::step() {
    if (!stmt_) {
        return prepare_rc_ == SQLITE_OK ? SQLITE_ERROR : prepare_rc_;
    }
    return sqlite3_step(stmt_);
}

std::string Statement::text(int col) const {
    const unsigned char* t = sqlite3_column_text(stmt_, col);
    if (!t) {
        return "";
    }
    return std::string(reinterpret_cast<const char*>(t),
                       static_cast<std::size_t>(sqlite3_column_bytes(stmt_, col)));
}

std::optional<std::string> Statement::optional_text(int col) const {
    if (is_null(col)) {
        return std::nullopt;
    }
    return text(col);
}

int Statement::integer(int col) const {
    return sqlite3_column_int(stmt_, col);
}

int64_t Statement::int64(int col) const {
    return static_cast<int64_t>(sqlite3_column_int64(stmt_, col));
}

bool Statement::is_null(int col) const {
    return sqlite3_column_type(stmt_, col) == SQLITE_NULL;
}

// ============================================================================
// Transaction
// ============================================================================

Transaction::Transaction(SqliteDb& db) : db_(db) {
    db_.exec("BEGIN IMMEDIATE;");
}

Transaction::~Transaction() {
    if (done_) {
        return;
    }
    char* err = nullptr;
    if (sqlite3_exec(db_.handle(), "ROLLBACK;", nullptr, nullptr, &err) != SQLITE_OK) {
        spdlog::error("sqlite rollback failed: {}", err ? err : "unknown error");
        sqlite3_free(err);
    }
}

void Transaction::commit() {
    db_.exec("COMMIT;");
    done_ = true;
}

} // namespace mahilo::store
