/**
 * sqorm/model.hpp - Typed models on top of Record
 *
 * Part of sqorm - a declarative object-relational mapping layer.
 *
 * Example usage:
 *
 *   struct Person : sqorm::Model<Person> {
 *       using Model::Model;
 *
 *       static sqorm::ModelDecl declare() {
 *           return sqorm::ModelDecl("Person")
 *               .bind(app_database())
 *               .table("person")
 *               .field("id", sqorm::Field::integer().primary_key().auto_increment())
 *               .field("name", sqorm::Field::varchar(64));
 *       }
 *   };
 *
 *   Person::create_table({true}).get();
 *   auto r = Person::add(Person{{"name", "Alice"}}).exec().get();
 *   Person alice = Person::get(*r.last_id).get();
 *
 * The declaration is registered once, the first time the model is used.
 */

#pragma once

#include "query.hpp"
#include "registrar.hpp"
#include <string>
#include <utility>
#include <vector>

namespace sqorm {

template<typename Derived>
class Model : public Record {
public:
    Model() : Record(table_ptr(), model_class().name()) {}

    Model(std::initializer_list<Row::Entry> values)
        : Record(table_ptr(), values, model_class().name()) {}

    // ========================================================================
    // Class Metadata
    // ========================================================================

    static const ModelClass& model_class() {
        static const ModelClass cls = register_model(Derived::declare());
        return cls;
    }

    static const TablePtr& table_ptr() { return model_class().table(); }

    static const Field& field_of(const std::string& key) { return model_class().field(key); }

    static void set_class_attribute(const std::string& key, const Attribute& value) {
        model_class().set_attribute(key, value);
    }

    // ========================================================================
    // DDL
    // ========================================================================

    [[nodiscard]] static std::future<ExecResult> create_table(const TableOptions& options = {}) {
        return table_ptr()->create(options);
    }

    [[nodiscard]] static std::future<ExecResult> drop_table(const TableOptions& options = {}) {
        return table_ptr()->drop(options);
    }

    static ExecResult alter(const AlterSpec& spec) { return table_ptr()->alter(spec); }
    static TableInfo show() { return table_ptr()->show(); }

    // ========================================================================
    // Queries
    // ========================================================================

    [[nodiscard]] static std::future<Derived> get(const Value& id) {
        return Select<Derived>(table_ptr())
            .where(pk_column() == id)
            .first();
    }

    [[nodiscard]] static std::future<FetchResult<Derived>> get_many(std::vector<Value> ids,
                                                      std::vector<std::string> columns = {}) {
        return Select<Derived>(table_ptr(), std::move(columns))
            .where(pk_column().in(std::move(ids)))
            .all();
    }

    static Select<Derived> select(std::vector<std::string> columns = {}, bool distinct = false) {
        return Select<Derived>(table_ptr(), std::move(columns), distinct);
    }

    // ========================================================================
    // Writes
    // ========================================================================

    static Insert add(const Derived& instance) {
        return Insert(table_ptr(), RowBatch(instance.snapshot(), table_ptr()->columns()));
    }

    static Insert add_many(const std::vector<Derived>& instances) {
        std::vector<Row> rows;
        rows.reserve(instances.size());
        for (const auto& instance : instances) rows.push_back(instance.snapshot());
        return Insert(table_ptr(), RowBatch(rows, table_ptr()->columns()));
    }

    static Insert insert(const Row& data) {
        return Insert(table_ptr(), RowBatch(data, table_ptr()->columns()));
    }

    static Insert insert_many(const std::vector<Row>& rows) {
        return Insert(table_ptr(), RowBatch(rows, table_ptr()->columns()));
    }

    static Insert insert_many(std::vector<RowBatch::Tuple> rows, std::vector<std::string> columns) {
        return Insert(table_ptr(), RowBatch(std::move(rows), std::move(columns)));
    }

    static Update update(Row values) {
        return Update(table_ptr(), std::move(values));
    }

    static Delete delete_from() {
        return Delete(table_ptr());
    }

    static Replace replace(const Row& values) {
        return Replace(table_ptr(), RowBatch(values, table_ptr()->columns()));
    }

    // ========================================================================
    // Instance Operations
    // ========================================================================

    /**
     * Replace this record's row and store any generated key back into it.
     * The record must outlive the returned future.
     */
    [[nodiscard]] std::future<ExecResult> save() {
        Row snapshot = this->snapshot();
        auto pending = Replace(table_ptr(), RowBatch(snapshot, table_ptr()->columns())).exec();
        return detail::then(std::move(pending), [this](ExecResult result) {
            const PrimaryKey& pk = table_ptr()->primary_key();
            if (pk.auto_increment && result.last_id) {
                Loader::set(*this, pk.field, *result.last_id);
            }
            return result;
        });
    }

    /**
     * Delete this record's row, matched by its primary key
     */
    [[nodiscard]] std::future<ExecResult> remove() const {
        Value key = primary_key_value();
        if (key.is_null()) {
            throw RemoveWithoutKeyError("Cannot remove '" + model_class().name() +
                                        "' without a primary key value");
        }
        return Delete(table_ptr()).where(pk_column() == key).exec();
    }

private:
    static Expr pk_column() {
        return col(table_ptr()->primary_key().field);
    }
};

} // namespace sqorm
