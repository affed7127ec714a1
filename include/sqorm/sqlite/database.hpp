/**
 * sqorm/sqlite/database.hpp - RAII SQLite connection with parameterized queries
 *
 * Part of sqorm - a declarative object-relational mapping layer.
 *
 * Example usage:
 *
 *   sqorm::sqlite::Database db;
 *   if (!db.open("app.db")) {
 *       fprintf(stderr, "Error: %s\n", db.last_error().c_str());
 *       return 1;
 *   }
 *
 *   auto result = db.query("SELECT name FROM person WHERE id > ?", {10});
 *   if (!result.ok()) {
 *       fprintf(stderr, "Query error: %s\n", result.error.c_str());
 *       return 1;
 *   }
 *
 *   for (const auto& row : result.rows) {
 *       printf("%s\n", row.get("name").to_string().c_str());
 *   }
 */

#pragma once

#include "../row.hpp"
#include "values.hpp"
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace sqorm::sqlite {

// ============================================================================
// Query Result
// ============================================================================

struct Result {
    std::vector<std::string> columns;
    std::vector<Row> rows;
    std::string error;

    bool ok() const { return error.empty(); }
    size_t size() const { return rows.size(); }
    bool empty() const { return rows.empty(); }

    const Row& operator[](size_t i) const { return rows[i]; }

    // Iterator support
    auto begin() const { return rows.begin(); }
    auto end() const { return rows.end(); }
};

// ============================================================================
// Database Wrapper
// ============================================================================

class Database {
public:
    Database() { open(":memory:"); }

    explicit Database(const char* path) { open(path); }
    ~Database() { close(); }

    // Non-copyable
    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    // Movable
    Database(Database&& other) noexcept
        : db_(other.db_), last_error_(std::move(other.last_error_)) {
        other.db_ = nullptr;
    }

    Database& operator=(Database&& other) noexcept {
        if (this != &other) {
            close();
            db_ = other.db_;
            last_error_ = std::move(other.last_error_);
            other.db_ = nullptr;
        }
        return *this;
    }

    // ========================================================================
    // Open/Close
    // ========================================================================

    bool open(const char* path = ":memory:") {
        close();
        int rc = sqlite3_open(path, &db_);
        if (rc != SQLITE_OK) {
            last_error_ = db_ ? sqlite3_errmsg(db_) : "Failed to allocate database";
            if (db_) {
                sqlite3_close(db_);
                db_ = nullptr;
            }
            return false;
        }
        last_error_.clear();
        return true;
    }

    void close() {
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
    }

    bool is_open() const { return db_ != nullptr; }

    int busy_timeout(int ms) {
        if (!db_) {
            last_error_ = "Database not open";
            return SQLITE_ERROR;
        }
        return sqlite3_busy_timeout(db_, ms);
    }

    // ========================================================================
    // Query Execution
    // ========================================================================

    Result query(const std::string& sql, const std::vector<Value>& params = {}) {
        Result result;

        StmtPtr stmt = prepare(sql, params, result.error);
        if (!stmt) return result;

        int col_count = sqlite3_column_count(stmt.get());
        result.columns.reserve(col_count);
        for (int i = 0; i < col_count; ++i) {
            const char* name = sqlite3_column_name(stmt.get(), i);
            result.columns.push_back(name ? name : "");
        }

        int rc;
        while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
            Row row;
            for (int i = 0; i < col_count; ++i) {
                row.set(result.columns[i], column_value(stmt.get(), i));
            }
            result.rows.push_back(std::move(row));
        }

        if (rc != SQLITE_DONE) {
            result.error = sqlite3_errmsg(db_);
        }
        return result;
    }

    /**
     * Run a statement that returns no rows. Returns an SQLite result code
     * (SQLITE_OK on success) and records last_error() on failure.
     */
    int run(const std::string& sql, const std::vector<Value>& params = {}) {
        std::string error;
        StmtPtr stmt = prepare(sql, params, error);
        if (!stmt) {
            last_error_ = error;
            return SQLITE_ERROR;
        }

        int rc;
        while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {}

        if (rc != SQLITE_DONE) {
            last_error_ = sqlite3_errmsg(db_);
            return rc;
        }
        last_error_.clear();
        return SQLITE_OK;
    }

    int exec(const char* sql) {
        if (!db_) {
            last_error_ = "Database not open";
            return SQLITE_ERROR;
        }

        char* err = nullptr;
        int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
        if (err) {
            last_error_ = err;
            sqlite3_free(err);
        } else if (rc != SQLITE_OK) {
            last_error_ = sqlite3_errmsg(db_);
        } else {
            last_error_.clear();
        }
        return rc;
    }

    int exec(const std::string& sql) {
        return exec(sql.c_str());
    }

    // ========================================================================
    // Direct Access
    // ========================================================================

    sqlite3* handle() const { return db_; }
    const std::string& last_error() const { return last_error_; }

    // ========================================================================
    // Utility
    // ========================================================================

    int64_t last_insert_rowid() const {
        return db_ ? sqlite3_last_insert_rowid(db_) : 0;
    }

    int changes() const {
        return db_ ? sqlite3_changes(db_) : 0;
    }

private:
    using StmtPtr = std::unique_ptr<sqlite3_stmt, int (*)(sqlite3_stmt*)>;

    sqlite3* db_ = nullptr;
    std::string last_error_;

    StmtPtr prepare(const std::string& sql, const std::vector<Value>& params, std::string& error) {
        StmtPtr none(nullptr, sqlite3_finalize);
        if (!db_) {
            error = "Database not open";
            return none;
        }

        sqlite3_stmt* raw = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &raw, nullptr);
        if (rc != SQLITE_OK) {
            error = sqlite3_errmsg(db_);
            return none;
        }
        StmtPtr stmt(raw, sqlite3_finalize);

        for (size_t i = 0; i < params.size(); ++i) {
            rc = bind_value(stmt.get(), static_cast<int>(i + 1), params[i]);
            if (rc != SQLITE_OK) {
                error = sqlite3_errmsg(db_);
                return none;
            }
        }
        return stmt;
    }
};

} // namespace sqorm::sqlite
