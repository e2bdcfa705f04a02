#pragma once
// Database: one SQLite connection shared by every store
//
// Opened lazily on first use (WAL, busy timeout). close() drops the
// cached handle so the next use reopens; tests use it as the reset hook.
// Failures throw DatabaseError; stores catch at their public boundary.

#include <sqlite3.h>
#include <cstdint>
#include <iostream>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <sys/stat.h>

namespace smriti {

class DatabaseError : public std::runtime_error {
public:
    explicit DatabaseError(const std::string& msg) : std::runtime_error(msg) {}
};

// Prepared statement, finalized on scope exit
class Statement {
public:
    Statement(sqlite3* db, const std::string& sql) : db_(db) {
        if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
            std::string msg = "prepare failed: ";
            msg += sqlite3_errmsg(db);
            msg += " [" + sql + "]";
            stmt_ = nullptr;
            throw DatabaseError(msg);
        }
    }

    ~Statement() {
        if (stmt_) sqlite3_finalize(stmt_);
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    // Parameters are 1-based, as in sqlite3_bind_*
    Statement& bind(int idx, const std::string& value) {
        check(sqlite3_bind_text(stmt_, idx, value.c_str(),
                                static_cast<int>(value.size()), SQLITE_TRANSIENT));
        return *this;
    }

    Statement& bind(int idx, const char* value) {
        check(sqlite3_bind_text(stmt_, idx, value, -1, SQLITE_TRANSIENT));
        return *this;
    }

    Statement& bind(int idx, int64_t value) {
        check(sqlite3_bind_int64(stmt_, idx, value));
        return *this;
    }

    Statement& bind(int idx, int value) {
        check(sqlite3_bind_int(stmt_, idx, value));
        return *this;
    }

    Statement& bind(int idx, double value) {
        check(sqlite3_bind_double(stmt_, idx, value));
        return *this;
    }

    Statement& bind_blob(int idx, const void* data, size_t size) {
        check(sqlite3_bind_blob(stmt_, idx, data, static_cast<int>(size), SQLITE_TRANSIENT));
        return *this;
    }

    Statement& bind_null(int idx) {
        check(sqlite3_bind_null(stmt_, idx));
        return *this;
    }

    Statement& bind(int idx, const std::optional<std::string>& value) {
        return value ? bind(idx, *value) : bind_null(idx);
    }

    // true while rows remain
    bool step() {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        throw DatabaseError(std::string("step failed: ") + sqlite3_errmsg(db_));
    }

    // Run to completion, for statements without results
    void run() {
        while (step()) {}
    }

    void reset() {
        sqlite3_reset(stmt_);
        sqlite3_clear_bindings(stmt_);
    }

    std::string column_text(int col) const {
        const unsigned char* text = sqlite3_column_text(stmt_, col);
        if (!text) return {};
        return std::string(reinterpret_cast<const char*>(text),
                           static_cast<size_t>(sqlite3_column_bytes(stmt_, col)));
    }

    std::optional<std::string> column_optional_text(int col) const {
        if (column_is_null(col)) return std::nullopt;
        return column_text(col);
    }

    int64_t column_int64(int col) const { return sqlite3_column_int64(stmt_, col); }
    double column_double(int col) const { return sqlite3_column_double(stmt_, col); }
    bool column_is_null(int col) const { return sqlite3_column_type(stmt_, col) == SQLITE_NULL; }

    const void* column_blob(int col) const { return sqlite3_column_blob(stmt_, col); }
    size_t column_bytes(int col) const {
        return static_cast<size_t>(sqlite3_column_bytes(stmt_, col));
    }

private:
    void check(int rc) {
        if (rc != SQLITE_OK) {
            throw DatabaseError(std::string("bind failed: ") + sqlite3_errmsg(db_));
        }
    }

    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;
};

class Database {
public:
    explicit Database(std::string path, int busy_timeout_ms = 5000)
        : path_(std::move(path)), busy_timeout_ms_(busy_timeout_ms) {}

    ~Database() { close(); }

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    // Connection, opened on first call
    sqlite3* handle() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (db_) return db_;

        if (path_ != ":memory:") ensure_parent_dir(path_);

        sqlite3* db = nullptr;
        if (sqlite3_open(path_.c_str(), &db) != SQLITE_OK) {
            std::string msg = "cannot open " + path_ + ": " +
                              (db ? sqlite3_errmsg(db) : "out of memory");
            if (db) sqlite3_close(db);
            throw DatabaseError(msg);
        }
        sqlite3_busy_timeout(db, busy_timeout_ms_);
        try {
            exec_on(db, "PRAGMA journal_mode=WAL");
            exec_on(db, "PRAGMA synchronous=NORMAL");
            // FTS5 triggers write shadow tables
            exec_on(db, "PRAGMA trusted_schema=ON");
        } catch (const DatabaseError&) {
            sqlite3_close_v2(db);
            throw;
        }
        db_ = db;
        return db_;
    }

    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (db_) {
            sqlite3_close_v2(db_);
            db_ = nullptr;
        }
    }

    const std::string& path() const { return path_; }

    void exec(const std::string& sql) { exec_on(handle(), sql); }

    Statement prepare(const std::string& sql) { return Statement(handle(), sql); }

    int64_t last_insert_rowid() { return sqlite3_last_insert_rowid(handle()); }
    int changes() { return sqlite3_changes(handle()); }

private:
    static void exec_on(sqlite3* db, const std::string& sql) {
        char* err = nullptr;
        if (sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
            std::string msg = err ? err : "unknown error";
            sqlite3_free(err);
            throw DatabaseError("exec failed: " + msg + " [" + sql + "]");
        }
    }

    static void ensure_parent_dir(const std::string& path) {
        auto slash = path.find_last_of('/');
        if (slash == std::string::npos || slash == 0) return;
        std::string dir = path.substr(0, slash);
        // mkdir -p
        for (size_t pos = 1; pos <= dir.size(); ++pos) {
            if (pos == dir.size() || dir[pos] == '/') {
                std::string part = dir.substr(0, pos);
                struct stat st;
                if (stat(part.c_str(), &st) != 0 && mkdir(part.c_str(), 0755) != 0) {
                    std::cerr << "[Database] Warning: cannot create " << part << "\n";
                    return;
                }
            }
        }
    }

    std::string path_;
    int busy_timeout_ms_;
    sqlite3* db_ = nullptr;
    mutable std::mutex mutex_;
};

// BEGIN IMMEDIATE; rolls back on scope exit unless committed
class Transaction {
public:
    explicit Transaction(Database& db) : db_(db) {
        db_.exec("BEGIN IMMEDIATE");
        active_ = true;
    }

    ~Transaction() {
        if (active_) {
            try {
                db_.exec("ROLLBACK");
            } catch (const DatabaseError& e) {
                std::cerr << "[Database] Warning: rollback failed: " << e.what() << "\n";
            }
        }
    }

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit() {
        db_.exec("COMMIT");
        active_ = false;
    }

private:
    Database& db_;
    bool active_ = false;
};

} // namespace smriti
