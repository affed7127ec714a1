/**
 * sqorm/table.hpp - Immutable table metadata and DDL passthroughs
 *
 * Part of sqorm - a declarative object-relational mapping layer.
 *
 * Tables are produced by register_model() and shared as TablePtr. Nothing
 * mutates a Table after construction, so one instance may be read from any
 * number of threads.
 */

#pragma once

#include "driver.hpp"
#include "field.hpp"
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace sqorm {

// ============================================================================
// DDL Option Types
// ============================================================================

struct TableOptions {
    bool if_not_exists = false;  // create
    bool if_exists = false;      // drop
};

/**
 * A schema change applied by Table::alter(). Operations run in the order:
 * renamed columns, added columns, dropped columns, table rename.
 */
struct AlterSpec {
    std::vector<Field> add_columns;
    std::vector<std::string> drop_columns;
    std::vector<std::pair<std::string, std::string>> rename_columns;
    std::optional<std::string> rename_to;

    AlterSpec& add_column(Field f) { add_columns.push_back(std::move(f)); return *this; }
    AlterSpec& drop_column(std::string name) { drop_columns.push_back(std::move(name)); return *this; }
    AlterSpec& rename_column(std::string from, std::string to) {
        rename_columns.emplace_back(std::move(from), std::move(to));
        return *this;
    }
    AlterSpec& rename_table(std::string to) { rename_to = std::move(to); return *this; }

    bool empty() const {
        return add_columns.empty() && drop_columns.empty() &&
               rename_columns.empty() && !rename_to;
    }
};

struct ColumnInfo {
    std::string name;
    std::string type;
    bool not_null = false;
    bool primary_key = false;
    Value default_value;
};

struct TableInfo {
    std::string name;
    std::vector<ColumnInfo> columns;
    std::vector<std::string> indexes;

    const ColumnInfo* find_column(const std::string& column) const {
        for (const auto& c : columns) {
            if (c.name == column) return &c;
        }
        return nullptr;
    }
};

// ============================================================================
// Table
// ============================================================================

struct PrimaryKey {
    std::string field;
    bool auto_increment = false;
};

class Table {
public:
    // Conventional name for an auto-increment primary key
    static constexpr const char* kAutoIncrementKey = "id";

    Table(std::string name,
          std::vector<Field> fields,
          PrimaryKey pk,
          std::vector<Index> indexes,
          std::optional<std::string> charset,
          std::optional<std::string> comment,
          std::shared_ptr<Driver> database)
        : name_(std::move(name)),
          fields_(std::move(fields)),
          pk_(std::move(pk)),
          indexes_(std::move(indexes)),
          charset_(std::move(charset)),
          comment_(std::move(comment)),
          database_(std::move(database)) {
        for (size_t i = 0; i < fields_.size(); ++i) {
            positions_.emplace(fields_[i].name(), i);
            columns_.push_back(fields_[i].name());
        }
    }

    Table(const Table&) = delete;
    Table& operator=(const Table&) = delete;

    // ========================================================================
    // Metadata
    // ========================================================================

    const std::string& name() const { return name_; }
    const std::vector<Field>& fields() const { return fields_; }
    const std::vector<std::string>& columns() const { return columns_; }
    const PrimaryKey& primary_key() const { return pk_; }
    const std::vector<Index>& indexes() const { return indexes_; }
    const std::optional<std::string>& charset() const { return charset_; }
    const std::optional<std::string>& comment() const { return comment_; }
    const std::shared_ptr<Driver>& database() const { return database_; }

    const Field* find_field(const std::string& name) const {
        auto it = positions_.find(name);
        return it == positions_.end() ? nullptr : &fields_[it->second];
    }

    bool has_field(const std::string& name) const {
        return positions_.count(name) != 0;
    }

    const Field& field(const std::string& name) const {
        const Field* f = find_field(name);
        if (!f) {
            throw UnknownFieldError("Table `" + name_ + "` has no field `" + name + "`");
        }
        return *f;
    }

    const Field& pk_field() const { return field(pk_.field); }

    // ========================================================================
    // DDL (delegated to the bound driver)
    // ========================================================================

    [[nodiscard]] std::future<ExecResult> create(const TableOptions& options = {}) const {
        return driver().create_table(*this, options);
    }

    [[nodiscard]] std::future<ExecResult> drop(const TableOptions& options = {}) const {
        return driver().drop_table(*this, options);
    }

    /**
     * Apply a schema change to the stored table. The metadata held by this
     * object is not changed.
     */
    ExecResult alter(const AlterSpec& spec) const {
        return driver().alter_table(*this, spec);
    }

    /**
     * Describe the table as the database currently stores it
     */
    TableInfo show() const {
        return driver().show_table(*this);
    }

    Driver& driver() const {
        if (!database_) {
            throw NotBoundError("Table `" + name_ + "` is not bound to a database");
        }
        return *database_;
    }

private:
    std::string name_;
    std::vector<Field> fields_;
    std::vector<std::string> columns_;
    std::unordered_map<std::string, size_t> positions_;
    PrimaryKey pk_;
    std::vector<Index> indexes_;
    std::optional<std::string> charset_;
    std::optional<std::string> comment_;
    std::shared_ptr<Driver> database_;
};

using TablePtr = std::shared_ptr<const Table>;

} // namespace sqorm
