/**
 * sqorm/types.hpp - Core types: field type tags and runtime values
 *
 * Part of sqorm - a declarative object-relational mapping layer.
 */

#pragma once

#include "errors.hpp"
#include <cstdint>
#include <limits>
#include <string>
#include <vector>
#include <variant>
#include <type_traits>
#include <utility>

namespace sqorm {

// ============================================================================
// Field Types
// ============================================================================

enum class FieldType {
    TinyInt,
    SmallInt,
    Int,
    BigInt,
    Float,
    Double,
    Decimal,
    Char,
    VarChar,
    Text,
    Blob,
    Date,
    DateTime,
    Timestamp,
    Bool
};

inline const char* field_type_sql(FieldType t) {
    switch (t) {
        case FieldType::TinyInt:   return "TINYINT";
        case FieldType::SmallInt:  return "SMALLINT";
        case FieldType::Int:       return "INT";
        case FieldType::BigInt:    return "BIGINT";
        case FieldType::Float:     return "FLOAT";
        case FieldType::Double:    return "DOUBLE";
        case FieldType::Decimal:   return "DECIMAL";
        case FieldType::Char:      return "CHAR";
        case FieldType::VarChar:   return "VARCHAR";
        case FieldType::Text:      return "TEXT";
        case FieldType::Blob:      return "BLOB";
        case FieldType::Date:      return "DATE";
        case FieldType::DateTime:  return "DATETIME";
        case FieldType::Timestamp: return "TIMESTAMP";
        case FieldType::Bool:      return "BOOL";
    }
    return "TEXT";
}

inline bool is_integer_type(FieldType t) {
    switch (t) {
        case FieldType::TinyInt:
        case FieldType::SmallInt:
        case FieldType::Int:
        case FieldType::BigInt:
        case FieldType::Bool:
            return true;
        default:
            return false;
    }
}

// ============================================================================
// Runtime Value
// ============================================================================

using Blob = std::vector<uint8_t>;

enum class ValueKind {
    Null,
    Integer,
    Real,
    Text,
    Blob
};

inline const char* value_kind_name(ValueKind k) {
    switch (k) {
        case ValueKind::Null:    return "null";
        case ValueKind::Integer: return "integer";
        case ValueKind::Real:    return "real";
        case ValueKind::Text:    return "text";
        case ValueKind::Blob:    return "blob";
    }
    return "null";
}

/**
 * A single column value. Unset record fields read back as a null Value.
 */
class Value {
public:
    Value() = default;
    Value(std::nullptr_t) {}

    template<typename T,
             std::enable_if_t<std::is_integral_v<T>, int> = 0>
    Value(T v) : data_(to_int64(v)) {}

    template<typename T,
             std::enable_if_t<std::is_floating_point_v<T>, int> = 0>
    Value(T v) : data_(static_cast<double>(v)) {}

    Value(const char* s) : data_(std::string(s ? s : "")) {}
    Value(std::string s) : data_(std::move(s)) {}
    Value(Blob b) : data_(std::move(b)) {}

    ValueKind kind() const {
        return static_cast<ValueKind>(data_.index());
    }

    bool is_null() const { return kind() == ValueKind::Null; }
    bool is_int() const { return kind() == ValueKind::Integer; }
    bool is_real() const { return kind() == ValueKind::Real; }
    bool is_text() const { return kind() == ValueKind::Text; }
    bool is_blob() const { return kind() == ValueKind::Blob; }

    int64_t as_int() const {
        if (!is_int()) throw mismatch("integer");
        return std::get<int64_t>(data_);
    }

    double as_double() const {
        if (is_int()) return static_cast<double>(std::get<int64_t>(data_));
        if (!is_real()) throw mismatch("real");
        return std::get<double>(data_);
    }

    const std::string& as_text() const {
        if (!is_text()) throw mismatch("text");
        return std::get<std::string>(data_);
    }

    const Blob& as_blob() const {
        if (!is_blob()) throw mismatch("blob");
        return std::get<Blob>(data_);
    }

    /**
     * Human-readable rendering (NULL for null, hex for blobs)
     */
    std::string to_string() const {
        switch (kind()) {
            case ValueKind::Null:    return "NULL";
            case ValueKind::Integer: return std::to_string(std::get<int64_t>(data_));
            case ValueKind::Real:    return std::to_string(std::get<double>(data_));
            case ValueKind::Text:    return std::get<std::string>(data_);
            case ValueKind::Blob:    return hex(std::get<Blob>(data_));
        }
        return "NULL";
    }

    bool operator==(const Value& other) const { return data_ == other.data_; }
    bool operator!=(const Value& other) const { return data_ != other.data_; }

private:
    // Alternative order must match ValueKind
    std::variant<std::monostate, int64_t, double, std::string, Blob> data_;

    template<typename T>
    static int64_t to_int64(T v) {
        if constexpr (std::is_unsigned_v<T> && sizeof(T) >= sizeof(int64_t)) {
            if (v > static_cast<T>(std::numeric_limits<int64_t>::max())) {
                throw ValueError("Unsigned value " + std::to_string(v) +
                                 " does not fit a signed 64-bit integer");
            }
        }
        return static_cast<int64_t>(v);
    }

    ValueError mismatch(const char* wanted) const {
        return ValueError(std::string("Value is ") + value_kind_name(kind()) +
                          ", not " + wanted);
    }

    static std::string hex(const Blob& b) {
        static const char digits[] = "0123456789abcdef";
        std::string out;
        out.reserve(b.size() * 2);
        for (uint8_t byte : b) {
            out += digits[byte >> 4];
            out += digits[byte & 0x0F];
        }
        return out;
    }
};

} // namespace sqorm
