#include <gtest/gtest.h>
#include "tablewright/cleaning/value_parsers.hpp"

using namespace tablewright::parsing;

class ValueParsersTest : public ::testing::Test {};

TEST_F(ValueParsersTest, DefaultNullMarkers) {
    const auto& markers = default_null_markers();
    for (const char* marker : {"*", "N/A", "N.A.", "#N/A", "???", "NULL", "null"}) {
        EXPECT_TRUE(is_null_marker(marker, markers)) << marker;
    }
    EXPECT_FALSE(is_null_marker("", markers));
    EXPECT_FALSE(is_null_marker("Null", markers));
    EXPECT_FALSE(is_null_marker(" N/A", markers));
}

TEST_F(ValueParsersTest, StripWhitespace) {
    EXPECT_EQ(strip_whitespace("  Bob \t"), "Bob");
    EXPECT_EQ(strip_whitespace("\n\r "), "");
    EXPECT_EQ(strip_whitespace("a b"), "a b");
}

TEST_F(ValueParsersTest, PlainNumbers) {
    EXPECT_DOUBLE_EQ(*parse_plain_number("12"), 12.0);
    EXPECT_DOUBLE_EQ(*parse_plain_number("-3.5"), -3.5);
    EXPECT_DOUBLE_EQ(*parse_plain_number("+.25"), 0.25);
    EXPECT_DOUBLE_EQ(*parse_plain_number("7."), 7.0);
    EXPECT_DOUBLE_EQ(*parse_plain_number("007"), 7.0);
}

TEST_F(ValueParsersTest, PlainNumberRejections) {
    for (const char* bad : {"", "-", ".", "1e5", "1,000", " 1", "1 ", "inf", "nan", "0x10", "1.2.3",
                            "$5"}) {
        EXPECT_FALSE(parse_plain_number(bad).has_value()) << bad;
    }
}

TEST_F(ValueParsersTest, PlainNumberRejectsDigitsBeyondDoublePrecision) {
    EXPECT_FALSE(parse_plain_number("9007199254740993").has_value());
    EXPECT_FALSE(parse_plain_number("1234567890.123456").has_value());
    EXPECT_DOUBLE_EQ(*parse_plain_number("123456789012345"), 123456789012345.0);
    EXPECT_DOUBLE_EQ(*parse_plain_number("0000012.5000000000000000"), 12.5);
    EXPECT_DOUBLE_EQ(*parse_plain_number("0.000000000000000001"), 1e-18);
}

TEST_F(ValueParsersTest, ParenthesizedNegative) {
    EXPECT_EQ(*rewrite_parenthesized_negative("(123.45)"), "-123.45");
    EXPECT_EQ(*rewrite_parenthesized_negative(" (1,234.50) "), "-1,234.50");
    EXPECT_FALSE(rewrite_parenthesized_negative("()").has_value());
    EXPECT_FALSE(rewrite_parenthesized_negative("($5)").has_value());
    EXPECT_FALSE(rewrite_parenthesized_negative("123").has_value());
    EXPECT_FALSE(rewrite_parenthesized_negative("(12").has_value());
}

TEST_F(ValueParsersTest, StripCurrency) {
    EXPECT_EQ(strip_currency("$1,234.56"), "1234.56");
    EXPECT_EQ(strip_currency("\xE2\x82\xAC 10"), "10");
    EXPECT_EQ(strip_currency("\xC2\xA3" "5\xC2\xA0" "000"), "5000");
    EXPECT_EQ(strip_currency("-\xC2\xA5" "7"), "-7");
    EXPECT_EQ(strip_currency("12 USD"), "12USD");
}

TEST_F(ValueParsersTest, IsoDates) {
    EXPECT_EQ(*parse_iso_date("1970-01-01"), 0);
    EXPECT_EQ(*parse_iso_date("2024-01-15"), 19737);
    EXPECT_TRUE(parse_iso_date("2024-02-29").has_value());
}

TEST_F(ValueParsersTest, IsoDateRejections) {
    for (const char* bad : {"2023-02-29", "2024-13-01", "2024-00-10", "2024-1-15", "2024/01/15",
                            "15-01-2024", "2024-01-15T00:00", " 2024-01-15", "2024-04-31"}) {
        EXPECT_FALSE(parse_iso_date(bad).has_value()) << bad;
    }
}
