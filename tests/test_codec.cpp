/**
 * test_codec.cpp - Tests for decoding raw driver results
 */

#include <gtest/gtest.h>
#include <sqorm/sqorm.hpp>
#include <memory>
#include <string>
#include <vector>

using namespace sqorm;

class CodecTest : public ::testing::Test {
protected:
    TablePtr table_;

    void SetUp() override {
        auto decl = ModelDecl("Item")
            .table("item")
            .field("id", Field::integer().primary_key())
            .field("label", Field::text());
        table_ = register_model(decl, nullptr).table();
    }
};

TEST_F(CodecTest, SingleRowToRecord) {
    RawResult raw = Row{{"id", 1}, {"label", "one"}};
    auto loaded = codec::load<Record>(raw, table_);

    ASSERT_TRUE(std::holds_alternative<Record>(loaded));
    const Record& r = std::get<Record>(loaded);
    EXPECT_EQ(r.value("id"), Value(1));
    EXPECT_EQ(r.value("label"), Value("one"));
    EXPECT_EQ(r.table_ptr(), table_);
}

TEST_F(CodecTest, RowListToRecords) {
    RawResult raw = std::vector<Row>{Row{{"id", 1}}, Row{{"id", 2}}};
    auto loaded = codec::load<Record>(raw, table_);

    ASSERT_TRUE(std::holds_alternative<FetchResult<Record>>(loaded));
    const auto& many = std::get<FetchResult<Record>>(loaded);
    ASSERT_EQ(many.size(), 2u);
    EXPECT_EQ(many[1].value("id"), Value(2));
}

TEST_F(CodecTest, NoRowYieldsFreshRecord) {
    auto loaded = codec::load<Record>(RawResult{}, table_);
    ASSERT_TRUE(std::holds_alternative<Record>(loaded));
    EXPECT_TRUE(std::get<Record>(loaded).values().empty());

    auto from_empty_row = codec::load<Record>(RawResult{Row{}}, table_);
    ASSERT_TRUE(std::holds_alternative<Record>(from_empty_row));
    EXPECT_TRUE(std::get<Record>(from_empty_row).values().empty());
}

TEST_F(CodecTest, RecordModeNeedsTable) {
    EXPECT_THROW(codec::load_one<Record>(RawResult{}), ValueError);
    EXPECT_THROW(codec::load<Record>(RawResult{Row{{"id", 1}}}), ValueError);
    EXPECT_THROW(codec::load_many<Record>(RawResult{std::vector<Row>{Row{{"id", 1}}}}), ValueError);

    // Generic mode has no table to bind
    EXPECT_TRUE(codec::load_one<Row>(RawResult{}).empty());
}

TEST_F(CodecTest, EmptyListYieldsEmptyFetchResult) {
    auto loaded = codec::load<Record>(RawResult{std::vector<Row>{}}, table_);
    ASSERT_TRUE(std::holds_alternative<FetchResult<Record>>(loaded));
    EXPECT_TRUE(std::get<FetchResult<Record>>(loaded).empty());
}

TEST_F(CodecTest, GenericModeEmptyShapes) {
    auto none = codec::load<Row>(RawResult{});
    ASSERT_TRUE(std::holds_alternative<Row>(none));
    EXPECT_TRUE(std::get<Row>(none).empty());

    // An empty list comes back as a list holding one empty mapping
    auto empty_list = codec::load<Row>(RawResult{std::vector<Row>{}});
    ASSERT_TRUE(std::holds_alternative<FetchResult<Row>>(empty_list));
    const auto& rows = std::get<FetchResult<Row>>(empty_list);
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_TRUE(rows[0].empty());
}

TEST_F(CodecTest, GenericModePassesRowsThrough) {
    Row row{{"k", "v"}};
    auto loaded = codec::load<Row>(RawResult{row});
    ASSERT_TRUE(std::holds_alternative<Row>(loaded));
    EXPECT_EQ(std::get<Row>(loaded), row);
}

TEST_F(CodecTest, ScalarResultRejected) {
    EXPECT_THROW(codec::load<Record>(RawResult{Value(3)}, table_), DecodeError);
    EXPECT_THROW(codec::load<Row>(RawResult{Value("x")}), DecodeError);
}

TEST_F(CodecTest, ShapeMismatchRejected) {
    EXPECT_THROW(codec::load_one<Record>(RawResult{std::vector<Row>{}}, table_), DecodeError);
    EXPECT_THROW(codec::load_many<Record>(RawResult{Row{{"id", 1}}}, table_), DecodeError);
}

TEST_F(CodecTest, DecodeErrorIsValueError) {
    EXPECT_THROW(codec::load_one<Row>(RawResult{Value(1)}), ValueError);
}

TEST(FetchResultTest, Access) {
    FetchResult<Row> rows(std::vector<Row>{Row{{"a", 1}}, Row{{"a", 2}}});
    EXPECT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows.at(1).get("a"), Value(2));
    EXPECT_THROW(rows.at(2), std::out_of_range);
    EXPECT_TRUE(rows.contains(Row{{"a", 1}}));
    EXPECT_FALSE(rows.contains(Row{{"a", 3}}));
    EXPECT_EQ(rows.repr(), "<FetchResult(2 rows)>");
    EXPECT_EQ(rows.to_json().dump(), R"([{"a":1},{"a":2}])");

    int total = 0;
    for (const auto& row : rows) total += static_cast<int>(row.get("a").as_int());
    EXPECT_EQ(total, 3);
}
