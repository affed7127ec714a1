/**
 * sqorm/registrar.hpp - Model declaration and schema registration
 *
 * Part of sqorm - a declarative object-relational mapping layer.
 *
 * A ModelDecl is the attribute set of a model class as written by the user:
 * an ordered list of (key, attribute) pairs. register_model() turns it into
 * an immutable Table wrapped in a ModelClass, or throws a SchemaError.
 *
 * Example usage:
 *
 *   auto person = sqorm::ModelDecl("Person")
 *       .bind(driver)
 *       .table("person")
 *       .indexes({sqorm::Index::key("idx_name", {"name"})})
 *       .field("id", sqorm::Field::integer().primary_key().auto_increment())
 *       .field("name", sqorm::Field::varchar(64))
 *       .build();
 *
 *   person.table()->columns();           // {"id", "name"}
 *   person.set_attribute("x", 1);        // throws SchemaFrozenError
 */

#pragma once

#include "diagnostics.hpp"
#include "table.hpp"
#include <algorithm>
#include <cctype>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace sqorm {

using Attribute = std::variant<Field, Value, std::vector<Index>, std::shared_ptr<Driver>>;

// ============================================================================
// Reserved Declaration Keys
// ============================================================================

namespace keys {

constexpr const char* kDatabase = "__db__";
constexpr const char* kTable    = "__table__";
constexpr const char* kIndexes  = "__indexes__";
constexpr const char* kCharset  = "__charset__";
constexpr const char* kComment  = "__comment__";

// Plain (non-field) attributes a model class may carry
inline bool is_framework_attribute(const std::string& key) {
    return key == "__doc__" || key == "__module__" || key == "__qualname__";
}

} // namespace keys

// ============================================================================
// Registered Model Class
// ============================================================================

class ModelClass {
public:
    ModelClass(std::string name, TablePtr table, Row attributes,
               std::vector<std::pair<std::string, std::string>> field_keys)
        : name_(std::move(name)),
          table_(std::move(table)),
          attributes_(std::move(attributes)),
          field_keys_(std::move(field_keys)) {}

    const std::string& name() const { return name_; }
    const TablePtr& table() const { return table_; }

    /**
     * Class attribute lookup: plain class attributes first, then declared
     * fields by declaration key or column name.
     */
    Attribute attribute(const std::string& key) const {
        if (const Value* v = attributes_.find(key)) return *v;
        for (const auto& fk : field_keys_) {
            if (fk.first == key) return table_->field(fk.second);
        }
        if (const Field* f = table_->find_field(key)) return *f;
        throw AttributeUnknown("'" + name_ + "' class does not have `" + key + "` attribute");
    }

    /**
     * Declared field by declaration key or column name
     */
    const Field& field(const std::string& key) const {
        for (const auto& fk : field_keys_) {
            if (fk.first == key) return table_->field(fk.second);
        }
        if (const Field* f = table_->find_field(key)) return *f;
        throw AttributeUnknown("'" + name_ + "' class does not have field `" + key + "`");
    }

    void set_attribute(const std::string& key, const Attribute&) const {
        throw SchemaFrozenError("'" + name_ + "' class does not allow setting attribute `" +
                                key + "`");
    }

private:
    std::string name_;
    TablePtr table_;
    Row attributes_;
    std::vector<std::pair<std::string, std::string>> field_keys_;
};

// ============================================================================
// Model Declaration
// ============================================================================

class ModelDecl;
inline ModelClass register_model(const ModelDecl& decl, const DiagnosticSink& sink);

class ModelDecl {
public:
    using Entry = std::pair<std::string, Attribute>;

    explicit ModelDecl(std::string class_name)
        : class_name_(std::move(class_name)), sink_(default_diagnostic_sink()) {}

    ModelDecl& bind(std::shared_ptr<Driver> database) {
        return attr(keys::kDatabase, std::move(database));
    }

    ModelDecl& table(const std::string& name) { return attr(keys::kTable, Value(name)); }
    ModelDecl& charset(const std::string& cs) { return attr(keys::kCharset, Value(cs)); }
    ModelDecl& comment(const std::string& c) { return attr(keys::kComment, Value(c)); }

    ModelDecl& indexes(std::vector<Index> list) {
        return attr(keys::kIndexes, std::move(list));
    }

    ModelDecl& field(std::string key, Field f) {
        return attr(std::move(key), std::move(f));
    }

    ModelDecl& attr(std::string key, Attribute value) {
        check_mutable(key);
        entries_.emplace_back(std::move(key), std::move(value));
        return *this;
    }

    // Sink for this declaration's registration notices
    ModelDecl& diagnostics(DiagnosticSink sink) {
        check_mutable("diagnostics");
        sink_ = std::move(sink);
        return *this;
    }

    const std::string& class_name() const { return class_name_; }
    const std::vector<Entry>& entries() const { return entries_; }
    const DiagnosticSink& sink() const { return sink_; }
    bool frozen() const { return frozen_; }

    /**
     * Register this declaration and freeze it
     */
    ModelClass build() { return build(sink_); }

    ModelClass build(const DiagnosticSink& sink) {
        check_mutable("build");
        ModelClass cls = register_model(*this, sink);
        frozen_ = true;
        return cls;
    }

private:
    std::string class_name_;
    std::vector<Entry> entries_;
    DiagnosticSink sink_;
    bool frozen_ = false;

    void check_mutable(const std::string& key) const {
        if (frozen_) {
            throw SchemaFrozenError("'" + class_name_ + "' is registered; cannot set `" +
                                    key + "`");
        }
    }
};

// ============================================================================
// Registration
// ============================================================================

namespace detail {

inline std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

inline std::string reserved_text(const std::string& cls, const ModelDecl::Entry& e) {
    const Value* v = std::get_if<Value>(&e.second);
    if (!v || !v->is_text()) {
        throw InvalidFieldType("'" + cls + "' declares `" + e.first + "` with a non-text value");
    }
    return v->as_text();
}

inline void emit(const DiagnosticSink& sink, const std::string& message) {
    if (sink) sink(message);
}

} // namespace detail

inline ModelClass register_model(const ModelDecl& decl, const DiagnosticSink& sink) {
    const std::string& cls = decl.class_name();

    // Capture reserved declaration keys
    std::shared_ptr<Driver> bound;
    std::optional<std::string> table_name;
    std::optional<std::string> charset;
    std::optional<std::string> comment;
    std::vector<Index> indexes;
    std::vector<const ModelDecl::Entry*> declared;
    std::set<std::string> seen_keys;

    for (const auto& entry : decl.entries()) {
        if (!seen_keys.insert(entry.first).second) {
            throw DuplicateFieldName("Duplicate field name `" + entry.first + "` in '" + cls + "'");
        }

        if (entry.first == keys::kDatabase) {
            const auto* db = std::get_if<std::shared_ptr<Driver>>(&entry.second);
            if (!db) throw InvalidFieldType("'" + cls + "' binds `__db__` to a non-driver value");
            bound = *db;
        } else if (entry.first == keys::kTable) {
            table_name = detail::reserved_text(cls, entry);
        } else if (entry.first == keys::kCharset) {
            charset = detail::reserved_text(cls, entry);
        } else if (entry.first == keys::kComment) {
            comment = detail::reserved_text(cls, entry);
        } else if (entry.first == keys::kIndexes) {
            const auto* list = std::get_if<std::vector<Index>>(&entry.second);
            if (!list) throw InvalidFieldType("'" + cls + "' declares `__indexes__` without indexes");
            indexes = *list;
        } else {
            declared.push_back(&entry);
        }
    }

    if (!table_name || table_name->empty()) {
        table_name = detail::to_lower(cls);
        detail::emit(sink, "Did not give the table name, use the model name `" + *table_name + "`");
    }

    // Partition fields from plain attributes
    std::vector<Field> fields;
    std::set<std::string> field_names;
    std::vector<std::pair<std::string, std::string>> field_keys;
    Row plain;
    PrimaryKey pk;
    bool have_pk = false;

    for (const auto* entry : declared) {
        const std::string& key = entry->first;

        if (const auto* declared_field = std::get_if<Field>(&entry->second)) {
            Field f = *declared_field;
            if (f.name().empty()) f.name(key);

            if (!field_names.insert(f.name()).second) {
                throw DuplicateFieldName("Duplicate field name `" + f.name() + "` in '" + cls + "'");
            }

            if (f.is_primary_key()) {
                if (have_pk) {
                    throw DuplicatePrimaryKey("Duplicate primary key found for field `" +
                                              f.name() + "` in '" + cls + "'");
                }
                have_pk = true;
                pk.field = f.name();
                if (f.is_auto_increment()) {
                    if (!is_integer_type(f.type())) {
                        throw InvalidFieldType("AUTO_INCREMENT primary key `" + f.name() + "` in '" +
                                               cls + "' must have an integer type");
                    }
                    pk.auto_increment = true;
                    if (f.name() != Table::kAutoIncrementKey) {
                        detail::emit(sink, "The field name of AUTO_INCREMENT primary key is suggested "
                                           "to use `id` instead of `" + f.name() + "`");
                    }
                }
            }

            field_keys.emplace_back(key, f.name());
            fields.push_back(std::move(f));
        } else if (std::holds_alternative<Value>(entry->second) &&
                   keys::is_framework_attribute(key)) {
            plain.set(key, std::get<Value>(entry->second));
        } else {
            throw InvalidFieldType("Invalid model field `" + key + "` in '" + cls + "'");
        }
    }

    if (!have_pk) {
        throw NoPrimaryKey("Primary key not found for table `" + *table_name + "`");
    }

    for (const auto& index : indexes) {
        if (index.columns.empty()) {
            throw InvalidFieldType("Index `" + index.name + "` has no columns");
        }
        for (const auto& column : index.columns) {
            if (!field_names.count(column)) {
                throw InvalidFieldType("Index `" + index.name + "` references unknown field `" +
                                       column + "`");
            }
        }
    }

    auto table = std::make_shared<const Table>(
        *table_name, std::move(fields), std::move(pk), std::move(indexes),
        std::move(charset), std::move(comment), std::move(bound));

    return ModelClass(cls, std::move(table), std::move(plain), std::move(field_keys));
}

inline ModelClass register_model(const ModelDecl& decl) {
    return register_model(decl, decl.sink());
}

} // namespace sqorm
