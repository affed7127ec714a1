/**
 * sqorm/sqlite/values.hpp - Moving sqorm::Value in and out of SQLite
 *
 * Part of sqorm - a declarative object-relational mapping layer.
 */

#pragma once

#include "../types.hpp"
#include <sqlite3.h>
#include <iomanip>
#include <limits>
#include <sstream>
#include <string>

namespace sqorm::sqlite {

// ============================================================================
// Parameter Binding
// ============================================================================

inline int bind_value(sqlite3_stmt* stmt, int index, const Value& value) {
    switch (value.kind()) {
        case ValueKind::Null:
            return sqlite3_bind_null(stmt, index);
        case ValueKind::Integer:
            return sqlite3_bind_int64(stmt, index, value.as_int());
        case ValueKind::Real:
            return sqlite3_bind_double(stmt, index, value.as_double());
        case ValueKind::Text: {
            const std::string& text = value.as_text();
            return sqlite3_bind_text(stmt, index, text.c_str(),
                                     static_cast<int>(text.size()), SQLITE_TRANSIENT);
        }
        case ValueKind::Blob: {
            const Blob& blob = value.as_blob();
            return sqlite3_bind_blob(stmt, index, blob.data(),
                                     static_cast<int>(blob.size()), SQLITE_TRANSIENT);
        }
    }
    return SQLITE_MISUSE;
}

// ============================================================================
// Column Extraction
// ============================================================================

inline Value column_value(sqlite3_stmt* stmt, int col) {
    switch (sqlite3_column_type(stmt, col)) {
        case SQLITE_INTEGER:
            return Value(static_cast<int64_t>(sqlite3_column_int64(stmt, col)));
        case SQLITE_FLOAT:
            return Value(sqlite3_column_double(stmt, col));
        case SQLITE_TEXT: {
            const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
            int bytes = sqlite3_column_bytes(stmt, col);
            return Value(std::string(text ? text : "", text ? static_cast<size_t>(bytes) : 0));
        }
        case SQLITE_BLOB: {
            const auto* data = static_cast<const uint8_t*>(sqlite3_column_blob(stmt, col));
            int bytes = sqlite3_column_bytes(stmt, col);
            return Value(Blob(data, data + bytes));
        }
        default:
            return Value();
    }
}

// ============================================================================
// SQL Literals (DEFAULT clauses)
// ============================================================================

inline std::string quote_text(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') out += "''";
        else out += c;
    }
    out += "'";
    return out;
}

inline std::string quote_ident(const std::string& s) {
    std::string out = "\"";
    for (char c : s) {
        if (c == '"') out += "\"\"";
        else out += c;
    }
    out += "\"";
    return out;
}

// Shortest form that reads back as the same double, kept a REAL literal
inline std::string real_sql(double v) {
    std::ostringstream ss;
    ss << std::setprecision(std::numeric_limits<double>::max_digits10) << v;
    std::string out = ss.str();
    if (out.find_first_not_of("-0123456789") == std::string::npos) out += ".0";
    return out;
}

inline std::string literal_sql(const Value& value) {
    switch (value.kind()) {
        case ValueKind::Null:    return "NULL";
        case ValueKind::Integer: return std::to_string(value.as_int());
        case ValueKind::Real:    return real_sql(value.as_double());
        case ValueKind::Text:    return quote_text(value.as_text());
        case ValueKind::Blob:    return "X'" + value.to_string() + "'";
    }
    return "NULL";
}

} // namespace sqorm::sqlite
