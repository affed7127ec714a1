/**
 * sqorm/field.hpp - Column descriptors and index definitions
 *
 * Part of sqorm - a declarative object-relational mapping layer.
 *
 * Example usage:
 *
 *   auto id   = sqorm::Field::integer().primary_key().auto_increment();
 *   auto name = sqorm::Field::varchar(64).not_null().comment("display name");
 *   auto seen = sqorm::Field::timestamp().default_factory(now_string);
 *
 * A field without a name is named from its declaration key when the model
 * is registered. Once attached to a Table a field is never modified.
 */

#pragma once

#include "expr.hpp"
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace sqorm {

// ============================================================================
// Field Descriptor
// ============================================================================

class Field {
public:
    using Factory = std::function<Value()>;

    Field() = default;
    explicit Field(FieldType type) : type_(type) {}

    // Factory helpers
    static Field tinyint() { return Field(FieldType::TinyInt); }
    static Field smallint() { return Field(FieldType::SmallInt); }
    static Field integer() { return Field(FieldType::Int); }
    static Field bigint() { return Field(FieldType::BigInt); }
    static Field real() { return Field(FieldType::Double); }
    static Field floating() { return Field(FieldType::Float); }
    static Field decimal() { return Field(FieldType::Decimal); }
    static Field boolean() { return Field(FieldType::Bool); }
    static Field text() { return Field(FieldType::Text); }
    static Field blob() { return Field(FieldType::Blob); }
    static Field date() { return Field(FieldType::Date); }
    static Field datetime() { return Field(FieldType::DateTime); }
    static Field timestamp() { return Field(FieldType::Timestamp); }

    static Field varchar(unsigned length) {
        Field f(FieldType::VarChar);
        f.length_ = length;
        return f;
    }

    static Field fixed_char(unsigned length) {
        Field f(FieldType::Char);
        f.length_ = length;
        return f;
    }

    // ========================================================================
    // Declaration (fluent)
    // ========================================================================

    Field& name(std::string n) { name_ = std::move(n); return *this; }
    Field& length(unsigned n) { length_ = n; return *this; }
    Field& as_unsigned(bool u = true) { unsigned_ = u; return *this; }
    Field& not_null() { nullable_ = false; return *this; }
    Field& comment(std::string c) { comment_ = std::move(c); return *this; }

    Field& primary_key(bool pk = true) {
        primary_key_ = pk;
        if (pk) nullable_ = false;
        return *this;
    }

    // Only meaningful on the primary key
    Field& auto_increment(bool ai = true) { auto_increment_ = ai; return *this; }

    Field& default_value(Value v) {
        default_value_ = std::move(v);
        default_factory_ = nullptr;
        return *this;
    }

    Field& default_factory(Factory fn) {
        default_factory_ = std::move(fn);
        default_value_.reset();
        return *this;
    }

    // ========================================================================
    // Accessors
    // ========================================================================

    const std::string& name() const { return name_; }
    FieldType type() const { return type_; }
    unsigned length() const { return length_; }
    bool is_unsigned() const { return unsigned_; }
    bool nullable() const { return nullable_; }
    bool is_primary_key() const { return primary_key_; }
    bool is_auto_increment() const { return auto_increment_; }
    const std::string& comment() const { return comment_; }

    bool has_default() const {
        return default_value_.has_value() || static_cast<bool>(default_factory_);
    }

    bool has_static_default() const { return default_value_.has_value(); }

    /**
     * Produce the default: the static value, or the factory's output,
     * or null when the field declares neither
     */
    Value make_default() const {
        if (default_value_) return *default_value_;
        if (default_factory_) return default_factory_();
        return Value();
    }

    // ========================================================================
    // Predicates
    // ========================================================================

    Expr column() const { return Expr::column(name_); }

    Expr in(std::vector<Value> values) const { return column().in(std::move(values)); }
    Expr not_in(std::vector<Value> values) const { return column().not_in(std::move(values)); }
    Expr like(const std::string& pattern) const { return column().like(pattern); }
    Expr between(const Value& low, const Value& high) const { return column().between(low, high); }
    Expr is_null() const { return column().is_null(); }
    Expr is_not_null() const { return column().is_not_null(); }

private:
    std::string name_;
    FieldType type_ = FieldType::Text;
    unsigned length_ = 0;
    bool unsigned_ = false;
    bool nullable_ = true;
    bool primary_key_ = false;
    bool auto_increment_ = false;
    std::optional<Value> default_value_;
    Factory default_factory_;
    std::string comment_;
};

inline Expr operator==(const Field& f, const Value& v) { return f.column() == v; }
inline Expr operator!=(const Field& f, const Value& v) { return f.column() != v; }
inline Expr operator<(const Field& f, const Value& v)  { return f.column() < v; }
inline Expr operator<=(const Field& f, const Value& v) { return f.column() <= v; }
inline Expr operator>(const Field& f, const Value& v)  { return f.column() > v; }
inline Expr operator>=(const Field& f, const Value& v) { return f.column() >= v; }

// ============================================================================
// Index Definition
// ============================================================================

struct Index {
    std::string name;
    std::vector<std::string> columns;
    bool unique = false;

    static Index key(std::string name, std::vector<std::string> columns) {
        return Index{std::move(name), std::move(columns), false};
    }

    static Index unique_key(std::string name, std::vector<std::string> columns) {
        return Index{std::move(name), std::move(columns), true};
    }
};

} // namespace sqorm
