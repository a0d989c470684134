#include <gtest/gtest.h>
#include "tablewright/data/table.hpp"

using namespace tablewright;

class TableTest : public ::testing::Test {
protected:
    Table sample() {
        return Table({Column::integer("id", {1, 2, 3}), Column::text("name", {"a", "b", "c"})});
    }
};

TEST_F(TableTest, Shape) {
    Table table = sample();
    EXPECT_EQ(table.num_rows(), 3u);
    EXPECT_EQ(table.num_columns(), 2u);
    EXPECT_FALSE(table.empty());
    EXPECT_EQ(table.column_names(), (std::vector<std::string>{"id", "name"}));

    Table none;
    EXPECT_TRUE(none.empty());
    EXPECT_EQ(none.num_rows(), 0u);
}

TEST_F(TableTest, RaggedColumnsRejected) {
    EXPECT_THROW(Table({Column::integer("a", {1, 2}), Column::integer("b", {1})}), TableError);

    auto result = Table::make({Column::integer("a", {1, 2}), Column::integer("b", {1})});
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::SCHEMA_ERROR);
}

TEST_F(TableTest, DuplicateNamesRejected) {
    auto result = Table::make({Column::integer("a", {1}), Column::text("a", {"x"})});
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::SCHEMA_ERROR);
}

TEST_F(TableTest, LookupByName) {
    Table table = sample();
    EXPECT_EQ(table.column_index("name"), 1);
    EXPECT_EQ(table.column_index("missing"), -1);
    ASSERT_NE(table.find_column("id"), nullptr);
    EXPECT_EQ(table.find_column("id")->type(), SemanticType::INTEGER);
    EXPECT_EQ(table.find_column("missing"), nullptr);
}

TEST_F(TableTest, TakeRowsKeepsOrder) {
    Table taken = sample().take_rows({2, 0});
    ASSERT_EQ(taken.num_rows(), 2u);
    EXPECT_EQ(taken.column(0).integers(), (std::vector<int64_t>{3, 1}));
    EXPECT_EQ(*taken.column(1).string_at(0), "c");
}

TEST_F(TableTest, SelectColumns) {
    Table selected = sample().select_columns({1});
    EXPECT_EQ(selected.num_columns(), 1u);
    EXPECT_EQ(selected.column(0).name(), "name");
    EXPECT_EQ(selected.num_rows(), 3u);
}

TEST_F(TableTest, Equality) {
    EXPECT_EQ(sample(), sample());
    EXPECT_NE(sample(), sample().take_rows({0, 1}));
}
