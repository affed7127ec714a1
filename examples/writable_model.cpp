/**
 * writable_model.cpp - Updating, saving and removing rows
 *
 * Demonstrates save(), remove(), update(), the on_statement hook and
 * schema changes through alter()/show().
 */

#include <sqorm/sqorm.hpp>
#include <sqorm/sqlite/driver.hpp>
#include <cstdio>
#include <memory>
#include <string>
#include <vector>

static std::shared_ptr<sqorm::sqlite::SqliteDriver> g_db;

struct Task : sqorm::Model<Task> {
    using Model::Model;

    static sqorm::ModelDecl declare() {
        return sqorm::ModelDecl("Task")
            .bind(g_db)
            .table("tasks")
            .indexes({sqorm::Index::key("idx_tasks_done", {"done"})})
            .field("id", sqorm::Field::integer().primary_key().auto_increment())
            .field("title", sqorm::Field::text().not_null())
            .field("done", sqorm::Field::boolean().default_value(false));
    }
};

static void print_tasks() {
    for (const auto& t : Task::select().order_by("id").all().get()) {
        printf("  [%s] %s: %s\n",
               t.value("done").as_int() ? "x" : " ",
               t.value("id").to_string().c_str(),
               t.value("title").as_text().c_str());
    }
}

int main() {
    sqorm::sqlite::Config config;
    config.on_statement = [](const std::string& sql) {
        printf("[SQL] %s\n", sql.c_str());
    };

    try {
        g_db = std::make_shared<sqorm::sqlite::SqliteDriver>(config);
        Task::create_table({true}).get();

        std::vector<sqorm::RowBatch::Tuple> rows = {
            {"Write documentation", false},
            {"Fix bug #123", false},
            {"Review PR", true},
            {"Deploy to staging", false}
        };
        Task::insert_many(rows, {"title", "done"}).exec().get();

        printf("\nInitial tasks:\n");
        print_tasks();

        // Mark a task done through a model instance
        Task task = Task::get(2).get();
        task.set_value("done", true);
        task.save().get();

        // Bulk update
        auto r = Task::update(sqorm::Row{{"title", "Deploy to production"}})
            .where(Task::field_of("title") == "Deploy to staging")
            .exec().get();
        printf("\nRenamed: %s\n", r.repr().c_str());

        // New task, key written back after save()
        Task extra{{"title", "Celebrate"}};
        extra.save().get();
        printf("New task id: %s\n", extra.primary_key_value().to_string().c_str());

        // Remove finished tasks
        for (const auto& t : Task::select().where(Task::field_of("done") == true).all().get()) {
            t.remove().get();
        }

        printf("\nAfter changes:\n");
        print_tasks();

        Task::alter(sqorm::AlterSpec().add_column(sqorm::Field::datetime().name("due")));
        printf("\nColumns:\n");
        for (const auto& c : Task::show().columns) {
            printf("  %s %s%s\n", c.name.c_str(), c.type.c_str(), c.not_null ? " NOT NULL" : "");
        }
    } catch (const sqorm::sqlite::DriverError& e) {
        fprintf(stderr, "Database error: %s\n", e.what());
        return 1;
    } catch (const sqorm::Error& e) {
        fprintf(stderr, "Error: %s\n", e.what());
        return 1;
    }

    return 0;
}
