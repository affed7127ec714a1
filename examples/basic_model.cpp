/**
 * basic_model.cpp - Declaring a model and querying it
 *
 * Demonstrates ModelDecl, Model<Derived>, add(), get() and select().
 */

#include <sqorm/sqorm.hpp>
#include <sqorm/sqlite/driver.hpp>
#include <cstdio>
#include <memory>
#include <vector>

static std::shared_ptr<sqorm::sqlite::SqliteDriver> g_db;

struct Product : sqorm::Model<Product> {
    using Model::Model;

    static sqorm::ModelDecl declare() {
        return sqorm::ModelDecl("Product")
            .bind(g_db)
            .table("products")
            .comment("catalogue")
            .field("id", sqorm::Field::integer().primary_key().auto_increment())
            .field("name", sqorm::Field::varchar(64).not_null())
            .field("price", sqorm::Field::real());
    }
};

int main() {
    try {
        g_db = std::make_shared<sqorm::sqlite::SqliteDriver>();
        Product::create_table().get();

        // Sample data
        std::vector<Product> products = {
            Product{{"name", "Apple"}, {"price", 1.50}},
            Product{{"name", "Banana"}, {"price", 0.75}},
            Product{{"name", "Cherry"}, {"price", 3.00}},
            Product{{"name", "Date"}, {"price", 2.25}},
            Product{{"name", "Elderberry"}, {"price", 4.50}}
        };
        Product::add_many(products).exec().get();

        // Query: All products
        printf("All products:\n");
        for (const auto& p : Product::select().order_by("id").all().get()) {
            printf("  %s | %s | $%.2f\n",
                   p.value("id").to_string().c_str(),
                   p.value("name").as_text().c_str(),
                   p.value("price").as_double());
        }

        // Query: Filtered
        printf("\nProducts over $2:\n");
        auto pricey = Product::select({"name", "price"})
            .where(Product::field_of("price") > 2.0)
            .all().get();
        for (const auto& p : pricey) {
            printf("  %s: $%.2f\n", p.value("name").as_text().c_str(), p.value("price").as_double());
        }

        // Query: By key
        Product cherry = Product::get(3).get();
        printf("\nProduct 3: %s\n", cherry.to_json().dump().c_str());

        Product missing = Product::get(42).get();
        printf("Product 42 found: %s\n", missing.values().empty() ? "no" : "yes");
    } catch (const sqorm::sqlite::DriverError& e) {
        fprintf(stderr, "Database error: %s\n", e.what());
        return 1;
    } catch (const sqorm::Error& e) {
        fprintf(stderr, "Error: %s\n", e.what());
        return 1;
    }

    return 0;
}
