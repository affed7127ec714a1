/**
 * sqorm/sqlite/driver.hpp - Driver implementation backed by SQLite
 *
 * Part of sqorm - a declarative object-relational mapping layer.
 *
 * Example usage:
 *
 *   sqorm::sqlite::Config config;
 *   config.path = "app.db";
 *   config.on_statement = [](const std::string& sql) {
 *       fprintf(stderr, "SQL: %s\n", sql.c_str());
 *   };
 *
 *   auto db = std::make_shared<sqorm::sqlite::SqliteDriver>(config);
 *
 * Statements are rendered with '?' placeholders and run on the calling
 * thread, so every future returned here is already satisfied. A mutex
 * serializes access to the connection.
 */

#pragma once

#include "../table.hpp"
#include "database.hpp"
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace sqorm::sqlite {

// ============================================================================
// Errors and Configuration
// ============================================================================

class DriverError : public std::runtime_error {
public:
    DriverError(int code, const std::string& msg)
        : std::runtime_error(msg), code_(code) {}

    // SQLite result code
    int code() const { return code_; }

private:
    int code_;
};

struct Config {
    std::string path = ":memory:";
    int busy_timeout_ms = 0;
    bool foreign_keys = true;

    // Optional: receives each SQL statement before it runs
    std::function<void(const std::string& sql)> on_statement;
};

// SQL text plus its positional parameters
struct Rendered {
    std::string sql;
    std::vector<Value> params;
};

// ============================================================================
// Rendering
// ============================================================================

inline const char* column_affinity(FieldType type) {
    switch (type) {
        case FieldType::TinyInt:
        case FieldType::SmallInt:
        case FieldType::Int:
        case FieldType::BigInt:
        case FieldType::Bool:
            return "INTEGER";
        case FieldType::Float:
        case FieldType::Double:
            return "REAL";
        case FieldType::Decimal:
            return "NUMERIC";
        case FieldType::Blob:
            return "BLOB";
        default:
            return "TEXT";
    }
}

inline std::string column_definition(const Field& field, const PrimaryKey& pk) {
    std::string sql = quote_ident(field.name()) + " " + column_affinity(field.type());
    if (field.name() == pk.field) {
        // AUTOINCREMENT is only valid on an INTEGER PRIMARY KEY (rowid alias)
        if (pk.auto_increment) return sql + " PRIMARY KEY AUTOINCREMENT";
        sql += " PRIMARY KEY";
    }
    if (!field.nullable()) sql += " NOT NULL";
    if (field.has_static_default()) sql += " DEFAULT " + literal_sql(field.make_default());
    return sql;
}

inline void render_expr(const ExprNode& n, Rendered& out) {
    switch (n.op) {
        case ExprOp::Column:
            out.sql += quote_ident(n.column);
            return;
        case ExprOp::Literal:
            out.sql += "?";
            out.params.push_back(n.values.front());
            return;
        case ExprOp::Not:
            out.sql += "(NOT ";
            render_expr(*n.children[0], out);
            out.sql += ")";
            return;
        case ExprOp::IsNull:
        case ExprOp::IsNotNull:
            out.sql += "(";
            render_expr(*n.children[0], out);
            out.sql += std::string(" ") + expr_op_sql(n.op) + ")";
            return;
        case ExprOp::In:
        case ExprOp::NotIn:
            // An empty list matches nothing (IN) or everything (NOT IN)
            if (n.values.empty()) {
                out.sql += n.op == ExprOp::In ? "0" : "1";
                return;
            }
            out.sql += "(";
            render_expr(*n.children[0], out);
            out.sql += std::string(" ") + expr_op_sql(n.op) + " (";
            for (size_t i = 0; i < n.values.size(); ++i) {
                if (i > 0) out.sql += ", ";
                out.sql += "?";
                out.params.push_back(n.values[i]);
            }
            out.sql += "))";
            return;
        case ExprOp::Between:
            out.sql += "(";
            render_expr(*n.children[0], out);
            out.sql += " BETWEEN ? AND ?)";
            out.params.push_back(n.values[0]);
            out.params.push_back(n.values[1]);
            return;
        default:
            break;
    }

    const ExprNode& rhs = *n.children[1];
    bool null_rhs = rhs.op == ExprOp::Literal && rhs.values.front().is_null();
    if (null_rhs && (n.op == ExprOp::Eq || n.op == ExprOp::Ne)) {
        out.sql += "(";
        render_expr(*n.children[0], out);
        out.sql += n.op == ExprOp::Eq ? " IS NULL)" : " IS NOT NULL)";
        return;
    }

    out.sql += "(";
    render_expr(*n.children[0], out);
    out.sql += std::string(" ") + expr_op_sql(n.op) + " ";
    render_expr(rhs, out);
    out.sql += ")";
}

inline void render_where(const Expr& where, Rendered& out) {
    if (where.empty()) return;
    out.sql += " WHERE ";
    render_expr(where.node(), out);
}

inline std::string column_list(const std::vector<std::string>& columns) {
    std::string sql;
    for (size_t i = 0; i < columns.size(); ++i) {
        if (i > 0) sql += ", ";
        sql += quote_ident(columns[i]);
    }
    return sql;
}

inline Rendered render_select(const Statement& stmt) {
    Rendered out;
    out.sql = stmt.distinct ? "SELECT DISTINCT " : "SELECT ";
    out.sql += stmt.columns.empty() ? "*" : column_list(stmt.columns);
    out.sql += " FROM " + quote_ident(stmt.table);
    render_where(stmt.where, out);

    for (size_t i = 0; i < stmt.order_by.size(); ++i) {
        out.sql += i == 0 ? " ORDER BY " : ", ";
        out.sql += quote_ident(stmt.order_by[i].column);
        if (stmt.order_by[i].descending) out.sql += " DESC";
    }

    if (stmt.limit) {
        out.sql += " LIMIT " + std::to_string(*stmt.limit);
    } else if (stmt.offset) {
        out.sql += " LIMIT -1";
    }
    if (stmt.offset) out.sql += " OFFSET " + std::to_string(*stmt.offset);
    return out;
}

/**
 * Render INSERT or REPLACE. A batch without columns becomes one
 * DEFAULT VALUES statement per row, so the result may hold several.
 */
inline std::vector<Rendered> render_insert(const Statement& stmt) {
    std::string head = stmt.kind == StatementKind::Replace ? "INSERT OR REPLACE INTO "
                                                           : "INSERT INTO ";
    head += quote_ident(stmt.table);

    std::vector<Rendered> out;
    const RowBatch& batch = stmt.rows;
    if (batch.empty()) return out;

    if (batch.columns().empty()) {
        for (size_t i = 0; i < batch.size(); ++i) {
            out.push_back(Rendered{head + " DEFAULT VALUES", {}});
        }
        return out;
    }

    std::string placeholders = "(";
    for (size_t i = 0; i < batch.columns().size(); ++i) {
        placeholders += i == 0 ? "?" : ", ?";
    }
    placeholders += ")";

    Rendered r;
    r.sql = head + " (" + column_list(batch.columns()) + ") VALUES ";
    for (size_t i = 0; i < batch.size(); ++i) {
        if (i > 0) r.sql += ", ";
        r.sql += placeholders;
        for (const auto& v : batch.values()[i]) r.params.push_back(v);
    }
    out.push_back(std::move(r));
    return out;
}

inline Rendered render_update(const Statement& stmt) {
    Rendered out;
    out.sql = "UPDATE " + quote_ident(stmt.table) + " SET ";
    bool first = true;
    for (const auto& e : stmt.assignments) {
        if (!first) out.sql += ", ";
        first = false;
        out.sql += quote_ident(e.first) + " = ?";
        out.params.push_back(e.second);
    }
    render_where(stmt.where, out);
    return out;
}

inline Rendered render_delete(const Statement& stmt) {
    Rendered out;
    out.sql = "DELETE FROM " + quote_ident(stmt.table);
    render_where(stmt.where, out);
    return out;
}

inline std::vector<std::string> create_table_sql(const Table& table, const TableOptions& options) {
    std::vector<std::string> out;
    std::string sql = "CREATE TABLE ";
    if (options.if_not_exists) sql += "IF NOT EXISTS ";
    sql += quote_ident(table.name()) + " (";
    for (size_t i = 0; i < table.fields().size(); ++i) {
        if (i > 0) sql += ", ";
        sql += column_definition(table.fields()[i], table.primary_key());
    }
    sql += ")";
    out.push_back(std::move(sql));

    for (const auto& index : table.indexes()) {
        std::string idx = index.unique ? "CREATE UNIQUE INDEX " : "CREATE INDEX ";
        if (options.if_not_exists) idx += "IF NOT EXISTS ";
        idx += quote_ident(index.name) + " ON " + quote_ident(table.name()) +
               " (" + column_list(index.columns) + ")";
        out.push_back(std::move(idx));
    }
    return out;
}

inline std::vector<std::string> alter_table_sql(const Table& table, const AlterSpec& spec) {
    std::vector<std::string> out;
    std::string head = "ALTER TABLE " + quote_ident(table.name());
    PrimaryKey no_pk;

    for (const auto& rename : spec.rename_columns) {
        out.push_back(head + " RENAME COLUMN " + quote_ident(rename.first) +
                      " TO " + quote_ident(rename.second));
    }
    for (const auto& field : spec.add_columns) {
        out.push_back(head + " ADD COLUMN " + column_definition(field, no_pk));
    }
    for (const auto& column : spec.drop_columns) {
        out.push_back(head + " DROP COLUMN " + quote_ident(column));
    }
    if (spec.rename_to) {
        out.push_back(head + " RENAME TO " + quote_ident(*spec.rename_to));
    }
    return out;
}

// ============================================================================
// SqliteDriver
// ============================================================================

class SqliteDriver : public Driver {
public:
    explicit SqliteDriver(Config config = {}) : config_(std::move(config)) {
        if (!db_.open(config_.path.c_str())) {
            throw DriverError(SQLITE_CANTOPEN, "Cannot open database '" + config_.path +
                                               "': " + db_.last_error());
        }
        if (config_.busy_timeout_ms > 0) {
            check(db_.busy_timeout(config_.busy_timeout_ms));
        }
        if (config_.foreign_keys) {
            check(db_.exec("PRAGMA foreign_keys = ON"));
        }
    }

    const Config& config() const { return config_; }

    // Raw connection access. Calls made through it are not serialized.
    Database& connection() { return db_; }

    // ========================================================================
    // Statements
    // ========================================================================

    std::future<ExecResult> execute(const Statement& stmt) override {
        return settle([&] {
            std::lock_guard<std::mutex> lock(mutex_);
            switch (stmt.kind) {
                case StatementKind::Insert:
                case StatementKind::Replace:
                    return write(render_insert(stmt), stmt.generated_key);
                case StatementKind::Update:
                    return write({render_update(stmt)}, false);
                case StatementKind::Delete:
                    return write({render_delete(stmt)}, false);
                case StatementKind::Select:
                    break;
            }
            throw DriverError(SQLITE_MISUSE, "execute() cannot run a SELECT statement");
        });
    }

    std::future<RawResult> fetch(const Statement& stmt) override {
        return settle([&]() -> RawResult {
            if (stmt.kind != StatementKind::Select) {
                throw DriverError(SQLITE_MISUSE, std::string("fetch() cannot run a ") +
                                                 statement_kind_name(stmt.kind) + " statement");
            }
            std::lock_guard<std::mutex> lock(mutex_);
            Result result = query(render_select(stmt));
            if (stmt.fetch_one) {
                if (result.empty()) return std::monostate{};
                return result.rows.front();
            }
            return std::move(result.rows);
        });
    }

    // ========================================================================
    // DDL
    // ========================================================================

    std::future<ExecResult> create_table(const Table& table, const TableOptions& options) override {
        return settle([&] {
            std::lock_guard<std::mutex> lock(mutex_);
            run_all(create_table_sql(table, options));
            return ExecResult{};
        });
    }

    std::future<ExecResult> drop_table(const Table& table, const TableOptions& options) override {
        return settle([&] {
            std::lock_guard<std::mutex> lock(mutex_);
            std::string sql = "DROP TABLE ";
            if (options.if_exists) sql += "IF EXISTS ";
            run_all({sql + quote_ident(table.name())});
            return ExecResult{};
        });
    }

    ExecResult alter_table(const Table& table, const AlterSpec& spec) override {
        std::lock_guard<std::mutex> lock(mutex_);
        run_all(alter_table_sql(table, spec));
        return ExecResult{};
    }

    TableInfo show_table(const Table& table) override {
        std::lock_guard<std::mutex> lock(mutex_);
        TableInfo info;
        info.name = table.name();

        Result columns = query({"PRAGMA table_info(" + quote_ident(table.name()) + ")", {}});
        if (columns.empty()) {
            throw DriverError(SQLITE_ERROR, "no such table: " + table.name());
        }
        for (const auto& row : columns) {
            ColumnInfo c;
            c.name = row.get("name").as_text();
            c.type = row.get("type").as_text();
            c.not_null = row.get("notnull").as_int() != 0;
            c.primary_key = row.get("pk").as_int() != 0;
            c.default_value = row.get("dflt_value");
            info.columns.push_back(std::move(c));
        }

        Result indexes = query({"PRAGMA index_list(" + quote_ident(table.name()) + ")", {}});
        for (const auto& row : indexes) {
            // Only indexes created by CREATE INDEX, not constraint-backed ones
            if (row.get("origin") == Value("c")) {
                info.indexes.push_back(row.get("name").as_text());
            }
        }
        return info;
    }

private:
    Config config_;
    Database db_;
    std::mutex mutex_;

    template<typename Fn>
    static auto settle(Fn fn) -> std::future<decltype(fn())> {
        std::promise<decltype(fn())> p;
        try {
            p.set_value(fn());
        } catch (...) {
            p.set_exception(std::current_exception());
        }
        return p.get_future();
    }

    void trace(const std::string& sql) const {
        if (config_.on_statement) config_.on_statement(sql);
    }

    void check(int rc) {
        if (rc != SQLITE_OK) throw DriverError(rc, db_.last_error());
    }

    Result query(const Rendered& r) {
        trace(r.sql);
        Result result = db_.query(r.sql, r.params);
        if (!result.ok()) throw DriverError(SQLITE_ERROR, result.error);
        return result;
    }

    void run_all(const std::vector<std::string>& statements) {
        for (const auto& sql : statements) {
            trace(sql);
            check(db_.exec(sql));
        }
    }

    ExecResult write(const std::vector<Rendered>& statements, bool generated_key) {
        ExecResult result;
        for (const auto& r : statements) {
            trace(r.sql);
            check(db_.run(r.sql, r.params));
            result.affected += static_cast<uint64_t>(db_.changes());
        }
        if (generated_key && !statements.empty()) {
            result.last_id = db_.last_insert_rowid();
        }
        return result;
    }
};

} // namespace sqorm::sqlite
