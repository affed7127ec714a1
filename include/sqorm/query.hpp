/**
 * sqorm/query.hpp - Statement builders
 *
 * Part of sqorm - a declarative object-relational mapping layer.
 *
 * Builders are values. Chaining methods are const and return a modified
 * copy; nothing touches the driver until a terminal method runs.
 *
 * Example usage:
 *
 *   auto adults = sqorm::Select<>(table, {"id", "name"})
 *       .where(sqorm::col("age") >= 18)
 *       .order_by("name")
 *       .limit(10);
 *
 *   FetchResult<Record> rows = adults.all().get();
 *   ExecResult r = sqorm::Delete(table).where(sqorm::col("id") == 3).exec().get();
 */

#pragma once

#include "codec.hpp"
#include <string>
#include <utility>
#include <vector>

namespace sqorm {

namespace detail {

inline void check_columns(const Table& table, const std::vector<std::string>& columns) {
    for (const auto& c : columns) {
        if (!table.has_field(c)) {
            throw UnknownFieldError("Table `" + table.name() + "` has no field `" + c + "`");
        }
    }
}

inline Statement base_statement(StatementKind kind, const Table& table) {
    Statement stmt;
    stmt.kind = kind;
    stmt.table = table.name();
    return stmt;
}

} // namespace detail

// ============================================================================
// SELECT
// ============================================================================

template<typename M = Record>
class Select {
public:
    explicit Select(TablePtr table, std::vector<std::string> columns = {}, bool distinct = false)
        : table_(std::move(table)) {
        if (columns.empty()) columns = table_->columns();
        detail::check_columns(*table_, columns);
        stmt_ = detail::base_statement(StatementKind::Select, *table_);
        stmt_.columns = std::move(columns);
        stmt_.distinct = distinct;
    }

    // Successive where() calls are combined with AND
    Select where(const Expr& predicate) const {
        detail::check_columns(*table_, predicate.columns());
        Select next = *this;
        next.stmt_.where = stmt_.where && predicate;
        return next;
    }

    Select order_by(const std::string& column, bool descending = false) const {
        detail::check_columns(*table_, {column});
        Select next = *this;
        next.stmt_.order_by.push_back(OrderTerm{column, descending});
        return next;
    }

    Select limit(size_t n) const {
        Select next = *this;
        next.stmt_.limit = n;
        return next;
    }

    Select offset(size_t n) const {
        Select next = *this;
        next.stmt_.offset = n;
        return next;
    }

    const Statement& statement() const { return stmt_; }
    const TablePtr& table() const { return table_; }

    // ========================================================================
    // Terminals
    // ========================================================================

    /**
     * At most one record. No match yields a fresh, unpopulated M.
     */
    [[nodiscard]] std::future<M> first() const { return fetch_first<M>(); }

    /**
     * Every matching record; empty FetchResult when nothing matches
     */
    [[nodiscard]] std::future<FetchResult<M>> all() const { return fetch_all<M>(); }

    // Generic-mapping variants of first()/all()
    [[nodiscard]] std::future<Row> first_row() const { return fetch_first<Row>(); }
    [[nodiscard]] std::future<FetchResult<Row>> all_rows() const { return fetch_all<Row>(); }

private:
    TablePtr table_;
    Statement stmt_;

    template<typename T>
    std::future<T> fetch_first() const {
        Statement stmt = stmt_;
        stmt.fetch_one = true;
        stmt.limit = 1;
        TablePtr table = table_;
        return detail::then(table_->driver().fetch(stmt),
            [table](RawResult raw) { return codec::load_one<T>(raw, table); });
    }

    template<typename T>
    std::future<FetchResult<T>> fetch_all() const {
        TablePtr table = table_;
        return detail::then(table_->driver().fetch(stmt_),
            [table](RawResult raw) { return codec::load_many<T>(raw, table); });
    }
};

// ============================================================================
// Write Statements
// ============================================================================

class WriteStatement {
public:
    const Statement& statement() const { return stmt_; }
    const TablePtr& table() const { return table_; }

    [[nodiscard]] std::future<ExecResult> exec() const {
        return table_->driver().execute(stmt_);
    }

protected:
    WriteStatement(TablePtr table, StatementKind kind)
        : table_(std::move(table)), stmt_(detail::base_statement(kind, *table_)) {}

    TablePtr table_;
    Statement stmt_;
};

class Insert : public WriteStatement {
public:
    Insert(TablePtr table, RowBatch rows)
        : WriteStatement(std::move(table), StatementKind::Insert) {
        detail::check_columns(*table_, rows.columns());
        stmt_.rows = std::move(rows);
        stmt_.generated_key = table_->primary_key().auto_increment;
    }
};

// Upsert keyed on the primary key
class Replace : public WriteStatement {
public:
    Replace(TablePtr table, RowBatch rows)
        : WriteStatement(std::move(table), StatementKind::Replace) {
        detail::check_columns(*table_, rows.columns());
        stmt_.rows = std::move(rows);
        stmt_.generated_key = table_->primary_key().auto_increment;
    }
};

class Update : public WriteStatement {
public:
    Update(TablePtr table, Row values)
        : WriteStatement(std::move(table), StatementKind::Update) {
        if (values.empty()) throw ValueError("UPDATE of `" + table_->name() + "` sets no fields");
        detail::check_columns(*table_, values.keys());
        stmt_.assignments = std::move(values);
    }

    Update where(const Expr& predicate) const {
        detail::check_columns(*table_, predicate.columns());
        Update next = *this;
        next.stmt_.where = stmt_.where && predicate;
        return next;
    }
};

class Delete : public WriteStatement {
public:
    explicit Delete(TablePtr table)
        : WriteStatement(std::move(table), StatementKind::Delete) {}

    Delete where(const Expr& predicate) const {
        detail::check_columns(*table_, predicate.columns());
        Delete next = *this;
        next.stmt_.where = stmt_.where && predicate;
        return next;
    }
};

} // namespace sqorm
