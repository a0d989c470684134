#include <gtest/gtest.h>
#include "tablewright/core/error.hpp"
#include "tablewright/data/column.hpp"

using namespace tablewright;

class ColumnTest : public ::testing::Test {};

TEST_F(ColumnTest, FactoriesSetTypeAndWidth) {
    auto ints = Column::integer("qty", {1, 2, 3});
    EXPECT_EQ(ints.type(), SemanticType::INTEGER);
    EXPECT_EQ(ints.width(), StorageWidth::BITS_64);
    EXPECT_EQ(ints.size(), 3u);
    EXPECT_EQ(ints.null_count(), 0u);

    auto dates = Column::date("when", {0, 1});
    EXPECT_EQ(dates.type(), SemanticType::DATE);
    EXPECT_EQ(dates.width(), StorageWidth::BITS_32);

    auto cats = Column::categorical("region", {"east", "west"}, {0, 1, 0});
    EXPECT_EQ(cats.type(), SemanticType::CATEGORICAL);
    EXPECT_EQ(*cats.string_at(2), "east");
}

TEST_F(ColumnTest, NullableFactoriesBuildMask) {
    auto col = Column::nullable_text("name", {std::string("a"), std::nullopt, std::string("c")});
    EXPECT_EQ(col.null_count(), 1u);
    EXPECT_TRUE(col.is_null(1));
    EXPECT_FALSE(col.string_at(1).has_value());
    EXPECT_EQ(*col.string_at(2), "c");
    EXPECT_FALSE(col.all_null());

    auto empty = Column::nullable_integer("n", {std::nullopt, std::nullopt});
    EXPECT_TRUE(empty.all_null());
}

TEST_F(ColumnTest, MismatchedMaskIsSchemaError) {
    try {
        Column::integer("qty", {1, 2, 3}, NullMask{0, 1});
        FAIL() << "Expected SCHEMA_ERROR";
    } catch (const TableError& e) {
        EXPECT_EQ(e.code(), ErrorCode::SCHEMA_ERROR);
    }
}

TEST_F(ColumnTest, CategoricalCodeOutOfRangeIsSchemaError) {
    EXPECT_THROW(Column::categorical("c", {"x"}, {0, 1}), TableError);
    // Codes under null cells are not checked
    EXPECT_NO_THROW(Column::categorical("c", {"x"}, {0, 7}, NullMask{0, 1}));
}

TEST_F(ColumnTest, DecimalRejectsNarrowWidths) {
    EXPECT_THROW(Column::decimal("d", {1.0}, {}, StorageWidth::BITS_16), TableError);
    EXPECT_NO_THROW(Column::decimal("d", {1.0}, {}, StorageWidth::BITS_32));
}

TEST_F(ColumnTest, WrongAccessorThrowsInvalidArgument) {
    auto col = Column::text("t", {"a"});
    try {
        col.integers();
        FAIL() << "Expected INVALID_ARGUMENT";
    } catch (const TableError& e) {
        EXPECT_EQ(e.code(), ErrorCode::INVALID_ARGUMENT);
    }
    EXPECT_THROW(Column::integer("i", {1}).string_at(0), TableError);
}

TEST_F(ColumnTest, FormatValueRendersEveryType) {
    EXPECT_EQ(*Column::integer("i", {-42}).format_value(0), "-42");
    EXPECT_EQ(*Column::decimal("d", {1234.56}).format_value(0), "1234.56");
    EXPECT_EQ(*Column::date("dt", {19737}).format_value(0), "2024-01-15");
    EXPECT_EQ(*Column::categorical("c", {"red"}, {0}).format_value(0), "red");
    EXPECT_FALSE(Column::nullable_decimal("d", {std::nullopt}).format_value(0).has_value());
}

TEST_F(ColumnTest, TakeGathersRowsAndMask) {
    auto col = Column::nullable_integer("n", {10, std::nullopt, 30, 40});
    auto taken = col.take({3, 1, 0});
    ASSERT_EQ(taken.size(), 3u);
    EXPECT_EQ(taken.integers()[0], 40);
    EXPECT_TRUE(taken.is_null(1));
    EXPECT_EQ(taken.integers()[2], 10);
    EXPECT_EQ(taken.name(), "n");
}

TEST_F(ColumnTest, EqualityIgnoresPayloadUnderNulls) {
    auto a = Column::integer("n", {1, 99}, NullMask{0, 1});
    auto b = Column::integer("n", {1, -5}, NullMask{0, 1});
    EXPECT_EQ(a, b);

    EXPECT_NE(a, a.renamed("m"));
    EXPECT_NE(a, a.with_width(StorageWidth::BITS_8));
    EXPECT_NE(Column::integer("n", {1}), Column::decimal("n", {1.0}));
}

TEST_F(ColumnTest, CategoricalEqualityComparesStrings) {
    auto a = Column::categorical("c", {"x", "y"}, {0, 1});
    auto b = Column::categorical("c", {"y", "x"}, {1, 0});
    EXPECT_EQ(a, b);
}

TEST_F(ColumnTest, TypeNames) {
    EXPECT_EQ(semantic_type_to_string(SemanticType::DECIMAL), "Decimal");
    EXPECT_EQ(semantic_type_to_string(SemanticType::CATEGORICAL), "Categorical");
}
