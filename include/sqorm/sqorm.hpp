/**
 * sqorm/sqorm.hpp - Master include for sqorm
 *
 * sqorm - a declarative object-relational mapping layer
 *
 * Include this single header to get the core:
 *   - Field, Index, Expr - Describe columns and predicates
 *   - ModelDecl, register_model - Turn a declaration into a Table
 *   - Record, Model<Derived> - Rows bound to a Table
 *   - Select, Insert, Update, Delete, Replace - Statement builders
 *
 * The SQLite driver lives in <sqorm/sqlite/driver.hpp> and is not pulled
 * in here; the core only talks to the abstract Driver.
 *
 * Example:
 *
 *   #include <sqorm/sqorm.hpp>
 *   #include <sqorm/sqlite/driver.hpp>
 *
 *   auto db = std::make_shared<sqorm::sqlite::SqliteDriver>();
 *
 *   struct Person : sqorm::Model<Person> {
 *       using Model::Model;
 *       static sqorm::ModelDecl declare() {
 *           return sqorm::ModelDecl("Person")
 *               .bind(db)
 *               .field("id", sqorm::Field::integer().primary_key().auto_increment())
 *               .field("name", sqorm::Field::varchar(64).not_null());
 *       }
 *   };
 *
 *   Person::create_table().get();
 *   Person::add(Person{{"name", "Alice"}}).exec().get();
 *   auto people = Person::select().where(Person::field_of("name").like("A%")).all().get();
 */

#pragma once

#include "errors.hpp"
#include "types.hpp"
#include "json.hpp"
#include "diagnostics.hpp"
#include "expr.hpp"
#include "field.hpp"
#include "row.hpp"
#include "row_batch.hpp"
#include "statement.hpp"
#include "driver.hpp"
#include "table.hpp"
#include "registrar.hpp"
#include "record.hpp"
#include "codec.hpp"
#include "query.hpp"
#include "model.hpp"
