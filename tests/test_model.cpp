/**
 * test_model.cpp - Tests for typed models end to end
 *
 * Person runs against an in-memory SQLite database; Tag runs against the
 * recording driver so the statements it builds can be inspected.
 */

#include <gtest/gtest.h>
#include <sqorm/sqorm.hpp>
#include <sqorm/sqlite/driver.hpp>
#include "fake_driver.hpp"
#include <memory>
#include <string>
#include <vector>

using namespace sqorm;

namespace {

std::shared_ptr<sqlite::SqliteDriver> person_db() {
    static auto db = std::make_shared<sqlite::SqliteDriver>();
    return db;
}

std::shared_ptr<test::FakeDriver> tag_db() {
    static auto db = std::make_shared<test::FakeDriver>();
    return db;
}

struct Person : Model<Person> {
    using Model::Model;

    static ModelDecl declare() {
        return ModelDecl("Person")
            .bind(person_db())
            .table("person")
            .comment("people")
            .field("id", Field::integer().primary_key().auto_increment())
            .field("name", Field::varchar(64).not_null())
            .field("age", Field::integer());
    }
};

struct Tag : Model<Tag> {
    using Model::Model;

    static ModelDecl declare() {
        return ModelDecl("Tag")
            .bind(tag_db())
            .table("tag")
            .field("code", Field::varchar(16).primary_key())
            .field("label", Field::text().default_value("untitled"));
    }
};

} // namespace

// ============================================================================
// Person (SQLite)
// ============================================================================

class PersonTest : public ::testing::Test {
protected:
    void SetUp() override {
        Person::drop_table({false, true}).get();
        Person::create_table().get();
    }
};

TEST_F(PersonTest, ClassMetadata) {
    EXPECT_EQ(Person::model_class().name(), "Person");
    EXPECT_EQ(Person::table_ptr()->name(), "person");
    EXPECT_EQ(Person::field_of("name").type(), FieldType::VarChar);
    EXPECT_THROW(Person::field_of("email"), AttributeUnknown);
    EXPECT_THROW(Person::set_class_attribute("extra", Value(1)), SchemaFrozenError);
}

TEST_F(PersonTest, InstanceRules) {
    Person p;
    EXPECT_EQ(p.repr(), "<Person(table 'person': people)>");
    EXPECT_TRUE(p.value("name").is_null());
    EXPECT_THROW(p.value("email"), UnknownFieldError);
    EXPECT_THROW(p.set_value("id", 3), ImmutablePrimaryKeyError);
    EXPECT_THROW(p.set_value("email", "x"), UnknownFieldError);
}

TEST_F(PersonTest, AddThenGet) {
    Person alice{{"name", "Alice"}, {"age", 30}};
    ExecResult r = Person::add(alice).exec().get();
    ASSERT_TRUE(r.last_id.has_value());
    EXPECT_EQ(r.affected, 1u);

    Person got = Person::get(*r.last_id).get();
    EXPECT_EQ(got.class_name(), "Person");
    EXPECT_EQ(got.value("id"), Value(*r.last_id));
    EXPECT_EQ(got.value("name"), Value("Alice"));
    EXPECT_EQ(got.value("age"), Value(30));
}

TEST_F(PersonTest, GetMissingYieldsUnpopulatedInstance) {
    Person got = Person::get(404).get();
    EXPECT_TRUE(got.values().empty());
    EXPECT_TRUE(got.primary_key_value().is_null());
}

TEST_F(PersonTest, SelectOnEmptyTable) {
    EXPECT_TRUE(Person::select().all().get().empty());
}

TEST_F(PersonTest, AddManyAndGetMany) {
    std::vector<Person> people = {Person{{"name", "Ann"}}, Person{{"name", "Bob"}, {"age", 20}},
                                  Person{{"name", "Cy"}}};
    EXPECT_EQ(Person::add_many(people).exec().get().affected, 3u);

    auto some = Person::get_many({1, 3}, {"id", "name"}).get();
    ASSERT_EQ(some.size(), 2u);
    EXPECT_EQ(some[0].value("name"), Value("Ann"));
    EXPECT_EQ(some[1].value("name"), Value("Cy"));
    EXPECT_FALSE(some[1].values().contains("age"));
}

TEST_F(PersonTest, InsertForms) {
    Person::insert(Row{{"name", "Ann"}}).exec().get();

    std::vector<Row> rows = {Row{{"name", "Bob"}}, Row{{"name", "Cy"}, {"age", 5}}};
    Person::insert_many(rows).exec().get();

    std::vector<RowBatch::Tuple> tuples = {{Value("Di"), Value(7)}};
    std::vector<std::string> columns = {"name", "age"};
    Person::insert_many(tuples, columns).exec().get();

    auto all = Person::select({"name"}).order_by("name").all_rows().get();
    ASSERT_EQ(all.size(), 4u);
    EXPECT_EQ(all[3].get("name"), Value("Di"));
}

TEST_F(PersonTest, QueryWithPredicates) {
    std::vector<Row> rows = {Row{{"name", "Ann"}, {"age", 15}}, Row{{"name", "Abe"}, {"age", 40}},
                             Row{{"name", "Bob"}, {"age", 50}}};
    Person::insert_many(rows).exec().get();

    auto adults = Person::select()
        .where((Person::field_of("age") >= 18) && Person::field_of("name").like("A%"))
        .all().get();
    ASSERT_EQ(adults.size(), 1u);
    EXPECT_EQ(adults[0].value("name"), Value("Abe"));

    Person oldest = Person::select().order_by("age", true).first().get();
    EXPECT_EQ(oldest.value("name"), Value("Bob"));

    auto page = Person::select({"name"}).order_by("age").limit(1).offset(1).all().get();
    ASSERT_EQ(page.size(), 1u);
    EXPECT_EQ(page[0].value("name"), Value("Abe"));
}

TEST_F(PersonTest, UpdateAndDelete) {
    std::vector<Row> rows = {Row{{"name", "Ann"}}, Row{{"name", "Bob"}}};
    Person::insert_many(rows).exec().get();

    ExecResult upd = Person::update(Row{{"age", 99}})
        .where(Person::field_of("name") == "Bob")
        .exec().get();
    EXPECT_EQ(upd.affected, 1u);
    EXPECT_EQ(Person::get(2).get().value("age"), Value(99));

    EXPECT_EQ(Person::delete_from().exec().get().affected, 2u);
    EXPECT_TRUE(Person::select().all().get().empty());
}

TEST_F(PersonTest, ReplaceUpserts) {
    Person::insert(Row{{"name", "Ann"}}).exec().get();
    Person::replace(Row{{"id", 1}, {"name", "Anna"}}).exec().get();

    auto all = Person::select().all().get();
    ASSERT_EQ(all.size(), 1u);
    EXPECT_EQ(all[0].value("name"), Value("Anna"));
}

TEST_F(PersonTest, SaveWritesGeneratedKeyBack) {
    Person p{{"name", "Zed"}};
    ExecResult first = p.save().get();
    ASSERT_TRUE(first.last_id.has_value());
    EXPECT_EQ(p.primary_key_value(), Value(*first.last_id));

    p.set_value("age", 5);
    p.save().get();

    auto all = Person::select().all().get();
    ASSERT_EQ(all.size(), 1u);
    EXPECT_EQ(all[0].value("age"), Value(5));
}

TEST_F(PersonTest, SaveWritesKeyBackWithoutWaiting) {
    Person p{{"name", "Quinn"}};
    static_cast<void>(p.save());
    ASSERT_FALSE(p.primary_key_value().is_null());

    p.set_value("age", 7);
    static_cast<void>(p.save());
    auto all = Person::select().all().get();
    ASSERT_EQ(all.size(), 1u);
    EXPECT_EQ(all[0].value("age"), Value(7));

    EXPECT_EQ(p.remove().get().affected, 1u);
}

TEST_F(PersonTest, RemoveRequiresKey) {
    Person p{{"name", "Ghost"}};
    EXPECT_THROW(p.remove(), RemoveWithoutKeyError);

    p.save().get();
    EXPECT_EQ(p.remove().get().affected, 1u);
    EXPECT_TRUE(Person::select().all().get().empty());
}

TEST_F(PersonTest, ShowAndAlter) {
    TableInfo info = Person::show();
    ASSERT_EQ(info.columns.size(), 3u);
    EXPECT_EQ(info.columns[0].name, "id");

    Person::alter(AlterSpec().add_column(Field::text().name("email")));
    EXPECT_NE(Person::show().find_column("email"), nullptr);
}

// ============================================================================
// Tag (recording driver)
// ============================================================================

class TagTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto db = tag_db();
        db->executed.clear();
        db->fetched.clear();
        db->results.clear();
        db->next_exec = ExecResult{};
    }
};

TEST_F(TagTest, GetFiltersByPrimaryKey) {
    tag_db()->push(Row{{"code", "cpp"}, {"label", "C++"}});
    Tag t = Tag::get("cpp").get();

    ASSERT_EQ(tag_db()->fetched.size(), 1u);
    const Statement& s = tag_db()->fetched[0];
    EXPECT_EQ(s.table, "tag");
    EXPECT_TRUE(s.fetch_one);
    EXPECT_EQ(s.where.to_string(), "(code = 'cpp')");
    EXPECT_EQ(t.value("label"), Value("C++"));
}

TEST_F(TagTest, SettableNaturalKey) {
    Tag t;
    t.set_value("code", "db");
    EXPECT_EQ(t.primary_key_value(), Value("db"));
}

TEST_F(TagTest, SaveSendsSnapshotWithDefaults) {
    Tag t{{"code", "sql"}};
    tag_db()->next_exec = ExecResult{1, 77};
    t.save().get();

    ASSERT_EQ(tag_db()->executed.size(), 1u);
    const Statement& s = tag_db()->executed[0];
    EXPECT_EQ(s.kind, StatementKind::Replace);
    EXPECT_FALSE(s.generated_key);
    EXPECT_EQ(s.rows.row(0).get("label"), Value("untitled"));

    // Natural keys are never overwritten by a reported id
    EXPECT_EQ(t.primary_key_value(), Value("sql"));
}

TEST_F(TagTest, RemoveDeletesByKey) {
    Tag t{{"code", "old"}};
    t.remove().get();

    ASSERT_EQ(tag_db()->executed.size(), 1u);
    EXPECT_EQ(tag_db()->executed[0].kind, StatementKind::Delete);
    EXPECT_EQ(tag_db()->executed[0].where.to_string(), "(code = 'old')");
}

TEST_F(TagTest, GetManyUsesInList) {
    tag_db()->push(std::vector<Row>{});
    auto tags = Tag::get_many({"a", "b"}).get();
    EXPECT_TRUE(tags.empty());
    EXPECT_EQ(tag_db()->fetched[0].where.to_string(), "(code IN ('a', 'b'))");
}
