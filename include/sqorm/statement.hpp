/**
 * sqorm/statement.hpp - Structured statement handed to a driver
 *
 * Part of sqorm - a declarative object-relational mapping layer.
 *
 * A Statement carries no SQL text. Each driver renders it in its own
 * dialect; the builders in query.hpp only fill it in.
 */

#pragma once

#include "expr.hpp"
#include "row_batch.hpp"
#include <optional>
#include <string>
#include <vector>

namespace sqorm {

enum class StatementKind {
    Select,
    Insert,
    Replace,
    Update,
    Delete
};

inline const char* statement_kind_name(StatementKind k) {
    switch (k) {
        case StatementKind::Select:  return "SELECT";
        case StatementKind::Insert:  return "INSERT";
        case StatementKind::Replace: return "REPLACE";
        case StatementKind::Update:  return "UPDATE";
        case StatementKind::Delete:  return "DELETE";
    }
    return "SELECT";
}

struct OrderTerm {
    std::string column;
    bool descending = false;
};

struct Statement {
    StatementKind kind = StatementKind::Select;
    std::string table;

    // SELECT
    std::vector<std::string> columns;
    bool distinct = false;
    std::vector<OrderTerm> order_by;
    std::optional<size_t> limit;
    std::optional<size_t> offset;
    bool fetch_one = false;

    // SELECT / UPDATE / DELETE
    Expr where;

    // INSERT / REPLACE
    RowBatch rows;
    bool generated_key = false;  // report last_id after the write

    // UPDATE
    Row assignments;
};

} // namespace sqorm
