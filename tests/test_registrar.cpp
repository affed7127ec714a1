/**
 * test_registrar.cpp - Tests for model declaration and schema registration
 */

#include <gtest/gtest.h>
#include <sqorm/sqorm.hpp>
#include "fake_driver.hpp"
#include <memory>
#include <string>
#include <vector>

using namespace sqorm;

class RegistrarTest : public ::testing::Test {
protected:
    std::shared_ptr<test::FakeDriver> driver_ = std::make_shared<test::FakeDriver>();
    std::vector<std::string> notices_;

    DiagnosticSink sink() {
        return [this](const std::string& msg) { notices_.push_back(msg); };
    }

    ModelDecl person() {
        ModelDecl decl("Person");
        decl.bind(driver_)
            .table("person")
            .comment("people we know")
            .field("id", Field::integer().primary_key().auto_increment())
            .field("name", Field::varchar(64).not_null())
            .field("age", Field::integer());
        return decl;
    }
};

TEST_F(RegistrarTest, BuildsTableInDeclarationOrder) {
    auto cls = register_model(person(), sink());
    const Table& t = *cls.table();

    EXPECT_EQ(cls.name(), "Person");
    EXPECT_EQ(t.name(), "person");
    std::vector<std::string> expected = {"id", "name", "age"};
    EXPECT_EQ(t.columns(), expected);
    EXPECT_EQ(t.primary_key().field, "id");
    EXPECT_TRUE(t.primary_key().auto_increment);
    EXPECT_EQ(t.comment().value_or(""), "people we know");
    EXPECT_EQ(t.database(), driver_);
    EXPECT_TRUE(notices_.empty());
}

TEST_F(RegistrarTest, FieldNamedFromDeclarationKey) {
    auto cls = register_model(person(), sink());
    EXPECT_EQ(cls.table()->field("name").name(), "name");
    EXPECT_EQ(cls.table()->field("name").length(), 64u);
}

TEST_F(RegistrarTest, ExplicitFieldNameWinsOverKey) {
    auto decl = ModelDecl("Account")
        .field("key", Field::bigint().name("account_id").primary_key())
        .field("owner", Field::text());

    auto cls = register_model(decl, sink());
    EXPECT_TRUE(cls.table()->has_field("account_id"));
    EXPECT_FALSE(cls.table()->has_field("key"));
    EXPECT_EQ(cls.field("key").name(), "account_id");
    EXPECT_EQ(cls.field("account_id").name(), "account_id");
}

TEST_F(RegistrarTest, MissingTableNameDerivedFromClassName) {
    auto decl = ModelDecl("AuditLog")
        .field("id", Field::integer().primary_key());

    auto cls = register_model(decl, sink());
    EXPECT_EQ(cls.table()->name(), "auditlog");
    ASSERT_EQ(notices_.size(), 1u);
    EXPECT_NE(notices_[0].find("auditlog"), std::string::npos);
}

TEST_F(RegistrarTest, ExplicitTableNameIsKept) {
    auto decl = ModelDecl("AuditLog")
        .table("audit_log")
        .field("id", Field::integer().primary_key());

    EXPECT_EQ(register_model(decl, sink()).table()->name(), "audit_log");
    EXPECT_TRUE(notices_.empty());
}

TEST_F(RegistrarTest, AutoIncrementKeyNotNamedIdWarns) {
    auto decl = ModelDecl("Ticket")
        .table("ticket")
        .field("ticket_no", Field::integer().primary_key().auto_increment());

    auto cls = register_model(decl, sink());
    EXPECT_TRUE(cls.table()->primary_key().auto_increment);
    ASSERT_EQ(notices_.size(), 1u);
    EXPECT_NE(notices_[0].find("ticket_no"), std::string::npos);
}

TEST_F(RegistrarTest, AutoIncrementKeyMustBeInteger) {
    auto decl = ModelDecl("Slug")
        .table("slug")
        .field("id", Field::varchar(16).primary_key().auto_increment());
    EXPECT_THROW(register_model(decl, sink()), InvalidFieldType);

    auto wide = ModelDecl("Event")
        .table("event")
        .field("id", Field::bigint().primary_key().auto_increment());
    EXPECT_TRUE(register_model(wide, sink()).table()->primary_key().auto_increment);
}

TEST_F(RegistrarTest, SecondPrimaryKeyRejected) {
    auto decl = ModelDecl("Pair")
        .field("a", Field::integer().primary_key())
        .field("b", Field::integer().primary_key());
    EXPECT_THROW(register_model(decl, sink()), DuplicatePrimaryKey);
}

TEST_F(RegistrarTest, MissingPrimaryKeyRejected) {
    auto decl = ModelDecl("Loose")
        .table("loose")
        .field("a", Field::integer());
    EXPECT_THROW(register_model(decl, sink()), NoPrimaryKey);
}

TEST_F(RegistrarTest, PlainAttributeRejected) {
    auto decl = ModelDecl("Odd")
        .field("id", Field::integer().primary_key())
        .attr("limit", Value(10));
    EXPECT_THROW(register_model(decl, sink()), InvalidFieldType);
}

TEST_F(RegistrarTest, FrameworkAttributesAllowed) {
    auto decl = ModelDecl("Doc")
        .attr("__doc__", Value("documented model"))
        .field("id", Field::integer().primary_key());

    auto cls = register_model(decl, sink());
    auto doc = cls.attribute("__doc__");
    ASSERT_TRUE(std::holds_alternative<Value>(doc));
    EXPECT_EQ(std::get<Value>(doc), Value("documented model"));
}

TEST_F(RegistrarTest, ReservedKeyWithWrongPayloadRejected) {
    auto decl = ModelDecl("Bad")
        .attr(keys::kTable, Value(5))
        .field("id", Field::integer().primary_key());
    EXPECT_THROW(register_model(decl, sink()), InvalidFieldType);

    auto no_driver = ModelDecl("Bad")
        .attr(keys::kDatabase, Value("sqlite"))
        .field("id", Field::integer().primary_key());
    EXPECT_THROW(register_model(no_driver, sink()), InvalidFieldType);
}

TEST_F(RegistrarTest, DuplicateKeyRejected) {
    auto decl = ModelDecl("Dup")
        .field("id", Field::integer().primary_key())
        .field("id", Field::text());
    EXPECT_THROW(register_model(decl, sink()), DuplicateFieldName);
}

TEST_F(RegistrarTest, DuplicateResolvedNameRejected) {
    auto decl = ModelDecl("Dup")
        .field("id", Field::integer().primary_key())
        .field("title", Field::text())
        .field("heading", Field::text().name("title"));
    EXPECT_THROW(register_model(decl, sink()), DuplicateFieldName);
}

TEST_F(RegistrarTest, SchemaErrorsShareBase) {
    auto decl = ModelDecl("Loose").field("a", Field::integer());
    EXPECT_THROW(register_model(decl, sink()), SchemaError);
}

TEST_F(RegistrarTest, IndexesValidated) {
    auto ok = person();
    ok.indexes({Index::key("idx_name", {"name"}), Index::unique_key("uk_name_age", {"name", "age"})});
    auto cls = register_model(ok, sink());
    ASSERT_EQ(cls.table()->indexes().size(), 2u);
    EXPECT_TRUE(cls.table()->indexes()[1].unique);

    auto unknown = person();
    unknown.indexes({Index::key("idx_email", {"email"})});
    EXPECT_THROW(register_model(unknown, sink()), InvalidFieldType);

    auto empty = person();
    empty.indexes({Index::key("idx_none", {})});
    EXPECT_THROW(register_model(empty, sink()), InvalidFieldType);
}

TEST_F(RegistrarTest, AttributeLookup) {
    auto cls = register_model(person(), sink());

    auto name = cls.attribute("name");
    ASSERT_TRUE(std::holds_alternative<Field>(name));
    EXPECT_EQ(std::get<Field>(name).type(), FieldType::VarChar);

    EXPECT_THROW(cls.attribute("nickname"), AttributeUnknown);
    EXPECT_THROW(cls.field("nickname"), AttributeUnknown);
}

TEST_F(RegistrarTest, RegisteredClassIsFrozen) {
    auto cls = register_model(person(), sink());
    EXPECT_THROW(cls.set_attribute("extra", Field::text()), SchemaFrozenError);
    EXPECT_THROW(cls.set_attribute("name", Value("x")), SchemaFrozenError);
}

TEST_F(RegistrarTest, BuildFreezesDeclaration) {
    auto decl = person();
    decl.diagnostics(sink());
    auto cls = decl.build();

    EXPECT_TRUE(decl.frozen());
    EXPECT_EQ(cls.table()->name(), "person");
    EXPECT_THROW(decl.field("extra", Field::text()), SchemaFrozenError);
    EXPECT_THROW(decl.table("other"), SchemaFrozenError);
    EXPECT_THROW(decl.build(), SchemaFrozenError);
}

TEST_F(RegistrarTest, BuildWithExplicitSink) {
    auto decl = ModelDecl("Metric").field("id", Field::integer().primary_key());
    auto cls = decl.build(sink());
    EXPECT_EQ(cls.table()->name(), "metric");
    EXPECT_EQ(notices_.size(), 1u);
    EXPECT_TRUE(decl.frozen());
}

TEST_F(RegistrarTest, FailedRegistrationLeavesDeclarationOpen) {
    auto decl = ModelDecl("Loose").diagnostics(sink());
    decl.field("a", Field::integer());
    EXPECT_THROW(decl.build(), NoPrimaryKey);
    EXPECT_FALSE(decl.frozen());

    decl.field("id", Field::integer().primary_key());
    EXPECT_EQ(decl.build().table()->primary_key().field, "id");
}

TEST_F(RegistrarTest, UnboundTableRejectsDdl) {
    auto decl = ModelDecl("Offline")
        .table("offline")
        .field("id", Field::integer().primary_key());
    auto cls = register_model(decl, sink());
    EXPECT_EQ(cls.table()->database(), nullptr);
    EXPECT_THROW(cls.table()->create(), NotBoundError);
    EXPECT_THROW(cls.table()->show(), NotBoundError);
}

TEST_F(RegistrarTest, TableDdlDelegatesToDriver) {
    auto cls = register_model(person(), sink());
    cls.table()->create({true, false}).get();
    cls.table()->drop({false, true}).get();
    cls.table()->alter(AlterSpec().add_column(Field::text().name("email")));
    TableInfo info = cls.table()->show();

    std::vector<std::string> expected = {
        "create person if_not_exists", "drop person if_exists", "alter person", "show person"};
    EXPECT_EQ(driver_->ddl, expected);
    ASSERT_NE(info.find_column("name"), nullptr);
    EXPECT_TRUE(info.find_column("name")->not_null);
}
