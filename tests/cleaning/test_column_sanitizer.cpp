#include <gtest/gtest.h>
#include <iostream>
#include <regex>
#include <sstream>
#include "../core/test_base.hpp"
#include "tablewright/cleaning/column_sanitizer.hpp"
#include "tablewright/cleaning/type_inference.hpp"

using namespace tablewright;
using namespace tablewright::testing;

class ColumnSanitizerTest : public TestBase {
protected:
    Table single_row(const std::vector<std::string>& names) {
        std::vector<Column> columns;
        for (size_t i = 0; i < names.size(); ++i) {
            columns.push_back(Column::integer(names[i], {static_cast<int64_t>(i)}));
        }
        return Table(std::move(columns));
    }
};

TEST_F(ColumnSanitizerTest, SpacesAndHyphensBecomeUnderscores) {
    EXPECT_EQ(ColumnSanitizer::sanitize_name("Customer Name"), "Customer_Name");
    EXPECT_EQ(ColumnSanitizer::sanitize_name("order-date"), "order_date");
    EXPECT_EQ(ColumnSanitizer::sanitize_name("  padded  "), "padded");
}

TEST_F(ColumnSanitizerTest, PunctuationRemoved) {
    EXPECT_EQ(ColumnSanitizer::sanitize_name("Unit Price ($)"), "Unit_Price");
    EXPECT_EQ(ColumnSanitizer::sanitize_name("rate%"), "rate");
    EXPECT_EQ(ColumnSanitizer::sanitize_name("a.b/c"), "abc");
    EXPECT_EQ(ColumnSanitizer::sanitize_name("\"quoted\""), "quoted");
    EXPECT_EQ(ColumnSanitizer::sanitize_name("caf\xC3\xA9"), "caf");
}

TEST_F(ColumnSanitizerTest, LiteralUnderscoresKept) {
    EXPECT_EQ(ColumnSanitizer::sanitize_name("_row_id_"), "_row_id_");
    EXPECT_EQ(ColumnSanitizer::sanitize_name("- total -"), "total");
}

TEST_F(ColumnSanitizerTest, ResultUsesIdentifierCharset) {
    const std::regex safe("^[A-Za-z0-9_]*$");
    for (const char* raw : {"Amount (USD)", "#1 item!", "a\tb", "x@y.com", "[key]", "{q}|w"}) {
        std::string name = ColumnSanitizer::sanitize_name(raw);
        EXPECT_TRUE(std::regex_match(name, safe)) << raw << " -> " << name;
    }
}

TEST_F(ColumnSanitizerTest, EmptyNamesGetPositionalNames) {
    Table sanitized = ColumnSanitizer::sanitize(single_row({"id", "#%&", ""}));
    EXPECT_EQ(sanitized.column_names(),
              (std::vector<std::string>{"id", "column_2", "column_3"}));
}

TEST_F(ColumnSanitizerTest, CollisionsGetNumericSuffix) {
    Table sanitized = ColumnSanitizer::sanitize(single_row({"a b", "a-b", "a_b"}));
    EXPECT_EQ(sanitized.column_names(), (std::vector<std::string>{"a_b", "a_b_2", "a_b_3"}));
    // Row data follows its column
    EXPECT_EQ(sanitized.column(1).integers()[0], 1);
}

TEST_F(ColumnSanitizerTest, RowDataUntouched) {
    Table table({Column::nullable_text("Customer Name",
                                       {std::string(" Bob "), std::nullopt, std::string("*")})});
    Table sanitized = ColumnSanitizer::sanitize(table);

    ASSERT_EQ(sanitized.num_columns(), 1u);
    EXPECT_EQ(sanitized.column(0).name(), "Customer_Name");
    EXPECT_EQ(sanitized.column(0), table.column(0).renamed("Customer_Name"));
}

TEST_F(ColumnSanitizerTest, Idempotent) {
    Table once = ColumnSanitizer::sanitize(single_row({"Order ID", "order-id", "!!", "Total ($)"}));
    Table twice = ColumnSanitizer::sanitize(once);
    EXPECT_EQ(once, twice);
}

TEST_F(ColumnSanitizerTest, CollisionWarningTaggedWithSanitizer) {
    // A previous component on this thread must not leak its tag
    TypeInferenceEngine().infer(Table({Column::text("n", {"1", "2"})}));

    Logger::instance().set_level(LogLevel::WARNING);
    std::stringstream captured;
    std::streambuf* original = std::cout.rdbuf(captured.rdbuf());
    ColumnSanitizer::sanitize(single_row({"a b", "a-b"}));
    std::cout.rdbuf(original);

    EXPECT_NE(captured.str().find("[ColumnSanitizer]"), std::string::npos);
    EXPECT_EQ(captured.str().find("[TypeInferenceEngine]"), std::string::npos);
}
