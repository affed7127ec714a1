/**
 * sqorm/record.hpp - Runtime rows bound to a Table
 *
 * Part of sqorm - a declarative object-relational mapping layer.
 *
 * A Record holds values for the fields of exactly one Table. The public
 * write path only accepts declared fields and refuses to touch an
 * auto-increment primary key; Loader is the trusted path used when values
 * come back from the database.
 */

#pragma once

#include "table.hpp"
#include <initializer_list>
#include <string>
#include <utility>

namespace sqorm {

class Loader;

class Record {
public:
    explicit Record(TablePtr table, std::string class_name = "Record")
        : table_(std::move(table)), class_name_(std::move(class_name)) {
        if (!table_) throw ValueError("'" + class_name_ + "' object needs a table");
    }

    Record(TablePtr table, std::initializer_list<Row::Entry> values,
           std::string class_name = "Record")
        : Record(std::move(table), std::move(class_name)) {
        for (const auto& v : values) set_value(v.first, v.second);
    }

    const Table& table() const { return *table_; }
    const TablePtr& table_ptr() const { return table_; }
    const std::string& class_name() const { return class_name_; }

    // ========================================================================
    // Field Access
    // ========================================================================

    /**
     * Stored value, null for a declared field that is unset
     */
    Value value(const std::string& name) const {
        if (const Value* v = values_.find(name)) return *v;
        if (table_->has_field(name)) return Value();
        throw UnknownFieldError("'" + class_name_ + "' object has no attribute '" + name + "'");
    }

    void set_value(const std::string& name, Value value) {
        const PrimaryKey& pk = table_->primary_key();
        if (pk.auto_increment && name == pk.field) {
            throw ImmutablePrimaryKeyError("AUTO_INCREMENT table `" + table_->name() +
                                           "` does not allow modifying primary key `" +
                                           name + "`");
        }
        if (!table_->has_field(name)) {
            throw UnknownFieldError("'" + class_name_ + "' object does not allow setting attribute '" +
                                    name + "'");
        }
        values_.set(name, std::move(value));
    }

    bool is_set(const std::string& name) const {
        const Value* v = values_.find(name);
        return v && !v->is_null();
    }

    Value primary_key_value() const { return value(table_->primary_key().field); }

    // Everything stored so far, in write order
    const Row& values() const { return values_; }

    /**
     * Field values in declaration order, with defaults applied to null
     * fields. Fields that are still null are left out.
     */
    Row snapshot() const {
        Row out;
        for (const auto& f : table_->fields()) {
            Value v = value(f.name());
            if (v.is_null() && f.has_default()) v = f.make_default();
            if (!v.is_null()) out.set(f.name(), std::move(v));
        }
        return out;
    }

    // ========================================================================
    // Rendering
    // ========================================================================

    std::string repr() const {
        return "<" + class_name_ + "(table '" + table_->name() + "': " +
               table_->comment().value_or("") + ")>";
    }

    ordered_json to_json() const {
        ordered_json j = ordered_json::object();
        for (const auto& f : table_->fields()) j[f.name()] = value(f.name());
        for (const auto& e : values_) {
            if (!table_->has_field(e.first)) j[e.first] = e.second;
        }
        return j;
    }

    bool operator==(const Record& other) const {
        return table_ == other.table_ && values_ == other.values_;
    }
    bool operator!=(const Record& other) const { return !(*this == other); }

private:
    friend class Loader;

    TablePtr table_;
    std::string class_name_;
    Row values_;

    void load_value(const std::string& name, Value value) {
        values_.set(name, std::move(value));
    }
};

// ============================================================================
// Trusted Write Path
// ============================================================================

/**
 * Writes values into records without the public checks. Used for rows read
 * from the driver and for keys the driver generated.
 */
class Loader {
public:
    static void set(Record& record, const std::string& name, Value value) {
        record.load_value(name, std::move(value));
    }

    static void load(Record& record, const Row& row) {
        for (const auto& e : row) record.load_value(e.first, e.second);
    }
};

} // namespace sqorm
