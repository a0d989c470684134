#include <gtest/gtest.h>
#include <arrow/api.h>
#include "tablewright/data/arrow_bridge.hpp"

using namespace tablewright;

class ArrowBridgeTest : public ::testing::Test {
protected:
    template <typename Builder, typename T>
    std::shared_ptr<arrow::Array> make_array(const std::vector<T>& values,
                                             const std::vector<bool>& valid = {}) {
        Builder builder;
        for (size_t i = 0; i < values.size(); ++i) {
            if (!valid.empty() && !valid[i]) {
                EXPECT_TRUE(builder.AppendNull().ok());
            } else {
                EXPECT_TRUE(builder.Append(values[i]).ok());
            }
        }
        std::shared_ptr<arrow::Array> array;
        EXPECT_TRUE(builder.Finish(&array).ok());
        return array;
    }

    std::shared_ptr<arrow::Table> make_table(
        const std::vector<std::shared_ptr<arrow::Field>>& fields,
        const std::vector<std::shared_ptr<arrow::Array>>& arrays) {
        return arrow::Table::Make(arrow::schema(fields), arrays);
    }
};

TEST_F(ArrowBridgeTest, NullTableRejected) {
    auto result = ArrowBridge::from_arrow(nullptr);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(ArrowBridgeTest, ImportsPrimitiveTypes) {
    auto ids = make_array<arrow::Int16Builder, int16_t>({1, 2, 3});
    auto prices = make_array<arrow::DoubleBuilder, double>({1.5, 0.0, 3.25}, {true, false, true});
    auto names = make_array<arrow::StringBuilder, std::string>({"a", "b", "c"});
    auto flags = make_array<arrow::BooleanBuilder, bool>({true, false, true});
    auto days = make_array<arrow::Date32Builder, int32_t>({0, 19737, 1});

    auto table = make_table({arrow::field("id", arrow::int16()),
                             arrow::field("price", arrow::float64()),
                             arrow::field("name", arrow::utf8()),
                             arrow::field("flag", arrow::boolean()),
                             arrow::field("day", arrow::date32())},
                            {ids, prices, names, flags, days});

    auto result = ArrowBridge::from_arrow(table);
    ASSERT_TRUE(result.is_ok()) << result.error()->what();
    const Table& imported = result.value();

    ASSERT_EQ(imported.num_columns(), 5u);
    EXPECT_EQ(imported.num_rows(), 3u);

    const Column& id = imported.column(0);
    EXPECT_EQ(id.type(), SemanticType::INTEGER);
    EXPECT_EQ(id.width(), StorageWidth::BITS_16);
    EXPECT_EQ(id.integers(), (std::vector<int64_t>{1, 2, 3}));

    const Column& price = imported.column(1);
    EXPECT_EQ(price.type(), SemanticType::DECIMAL);
    EXPECT_TRUE(price.is_null(1));
    EXPECT_DOUBLE_EQ(price.decimals()[2], 3.25);

    EXPECT_EQ(imported.column(2).type(), SemanticType::TEXT);
    EXPECT_EQ(*imported.column(3).string_at(1), "false");
    EXPECT_EQ(imported.column(4).type(), SemanticType::DATE);
    EXPECT_EQ(imported.column(4).dates()[1], 19737);
}

TEST_F(ArrowBridgeTest, ConcatenatesChunks) {
    auto first = make_array<arrow::Int64Builder, int64_t>({1, 2});
    auto second = make_array<arrow::Int64Builder, int64_t>({3});
    auto chunked = std::make_shared<arrow::ChunkedArray>(arrow::ArrayVector{first, second});
    auto table = arrow::Table::Make(arrow::schema({arrow::field("n", arrow::int64())}), {chunked});

    auto result = ArrowBridge::from_arrow(table);
    ASSERT_TRUE(result.is_ok()) << result.error()->what();
    EXPECT_EQ(result.value().column(0).integers(), (std::vector<int64_t>{1, 2, 3}));
}

TEST_F(ArrowBridgeTest, ImportsStringDictionary) {
    auto dictionary = make_array<arrow::StringBuilder, std::string>({"east", "west"});
    auto indices = make_array<arrow::Int8Builder, int8_t>({1, 0, 1}, {true, true, false});
    auto dict_type = arrow::dictionary(arrow::int8(), arrow::utf8());
    auto array = arrow::DictionaryArray::FromArrays(dict_type, indices, dictionary).ValueOrDie();
    auto table = make_table({arrow::field("region", dict_type)}, {array});

    auto result = ArrowBridge::from_arrow(table);
    ASSERT_TRUE(result.is_ok()) << result.error()->what();
    const Column& region = result.value().column(0);
    EXPECT_EQ(region.type(), SemanticType::CATEGORICAL);
    EXPECT_EQ(*region.string_at(0), "west");
    EXPECT_EQ(*region.string_at(1), "east");
    EXPECT_TRUE(region.is_null(2));
}

TEST_F(ArrowBridgeTest, UnsupportedTypeIsConversionError) {
    auto times = make_array<arrow::Int64Builder, int64_t>({1});
    auto ts_type = arrow::timestamp(arrow::TimeUnit::SECOND);
    auto data = times->data()->Copy();
    data->type = ts_type;
    auto table = make_table({arrow::field("ts", ts_type)}, {arrow::MakeArray(data)});

    auto result = ArrowBridge::from_arrow(table);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::CONVERSION_ERROR);
}

TEST_F(ArrowBridgeTest, ExportMaterializesWidths) {
    Table table({Column::integer("small", {1, -2}, {}, StorageWidth::BITS_8),
                 Column::decimal("ratio", {0.5, 0.25}, NullMask{0, 1}, StorageWidth::BITS_32),
                 Column::date("day", {0, 1}),
                 Column::categorical("region", {"east", "west"}, {1, 0}),
                 Column::text("note", {"x", "y"})});

    auto result = ArrowBridge::to_arrow(table);
    ASSERT_TRUE(result.is_ok()) << result.error()->what();
    auto exported = result.value();

    ASSERT_EQ(exported->num_columns(), 5);
    EXPECT_TRUE(exported->schema()->field(0)->type()->Equals(arrow::int8()));
    EXPECT_TRUE(exported->schema()->field(1)->type()->Equals(arrow::float32()));
    EXPECT_TRUE(exported->schema()->field(2)->type()->Equals(arrow::date32()));
    EXPECT_TRUE(exported->schema()->field(3)->type()->Equals(
        arrow::dictionary(arrow::int32(), arrow::utf8())));
    EXPECT_TRUE(exported->schema()->field(4)->type()->Equals(arrow::utf8()));
    EXPECT_EQ(exported->column(1)->null_count(), 1);
}

TEST_F(ArrowBridgeTest, RoundTripPreservesValuesAndWidths) {
    Table table({Column::integer("id", {100, 200, 300}, {}, StorageWidth::BITS_16),
                 Column::nullable_decimal("amount", {1.25, std::nullopt, -3.5}),
                 Column::categorical("kind", {"a", "b"}, {0, 0, 1}),
                 Column::nullable_text("note", {std::string("x"), std::nullopt, std::string("z")})});

    auto exported = ArrowBridge::to_arrow(table);
    ASSERT_TRUE(exported.is_ok()) << exported.error()->what();
    auto imported = ArrowBridge::from_arrow(exported.value());
    ASSERT_TRUE(imported.is_ok()) << imported.error()->what();

    EXPECT_EQ(imported.value(), table);
}
