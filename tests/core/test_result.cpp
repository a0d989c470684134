#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>
#include "tablewright/core/error.hpp"

using namespace tablewright;

class ResultTest : public ::testing::Test {};

TEST_F(ResultTest, SuccessfulResults) {
    Result<int> int_result(42);
    EXPECT_TRUE(int_result.is_ok());
    EXPECT_FALSE(int_result.is_error());
    EXPECT_EQ(int_result.value(), 42);

    Result<std::string> string_result("success");
    EXPECT_TRUE(string_result.is_ok());
    EXPECT_EQ(string_result.value(), "success");
}

TEST_F(ResultTest, ErrorCarriesCodeMessageAndComponent) {
    auto error_result =
        make_error<int>(ErrorCode::SCHEMA_ERROR, "Ragged columns", "Table");

    EXPECT_TRUE(error_result.is_error());
    EXPECT_FALSE(error_result.is_ok());
    EXPECT_EQ(error_result.error()->code(), ErrorCode::SCHEMA_ERROR);
    EXPECT_STREQ(error_result.error()->what(), "Ragged columns");
    EXPECT_EQ(error_result.error()->component(), "Table");
}

TEST_F(ResultTest, ValueOnErrorThrows) {
    auto error_result = make_error<int>(ErrorCode::INVALID_ARGUMENT, "bad", "Test");
    EXPECT_THROW(error_result.value(), TableError);

    try {
        error_result.value();
        FAIL() << "value() should throw";
    } catch (const TableError& e) {
        EXPECT_EQ(e.code(), ErrorCode::INVALID_ARGUMENT);
    }
}

TEST_F(ResultTest, MoveOnlyType) {
    auto ptr = std::make_unique<int>(42);
    Result<std::unique_ptr<int>> result(std::move(ptr));

    EXPECT_TRUE(result.is_ok());
    EXPECT_EQ(*result.value(), 42);

    Result<std::unique_ptr<int>> moved = std::move(result);
    EXPECT_TRUE(moved.is_ok());
    EXPECT_EQ(*moved.value(), 42);
}

TEST_F(ResultTest, TakeValueMovesPayloadOut) {
    Result<std::vector<int>> result(std::vector<int>{1, 2, 3});
    std::vector<int> values = result.take_value();
    EXPECT_EQ(values, (std::vector<int>{1, 2, 3}));

    auto error_result = make_error<std::vector<int>>(ErrorCode::UNKNOWN_ERROR, "x");
    EXPECT_THROW(error_result.take_value(), TableError);
}

TEST_F(ResultTest, VoidResult) {
    Result<void> success;
    EXPECT_TRUE(success.is_ok());
    EXPECT_FALSE(success.is_error());
    EXPECT_NO_THROW(success.value());

    auto error = make_error<void>(ErrorCode::CONFIGURATION_ERROR, "Void error", "Test");
    EXPECT_TRUE(error.is_error());
    EXPECT_EQ(error.error()->code(), ErrorCode::CONFIGURATION_ERROR);
    EXPECT_THROW(error.value(), TableError);
}

TEST_F(ResultTest, ErrorCodeNames) {
    EXPECT_EQ(error_code_to_string(ErrorCode::CONVERSION_ERROR), "CONVERSION_ERROR");
    EXPECT_EQ(error_code_to_string(ErrorCode::JSON_PARSE_ERROR), "JSON_PARSE_ERROR");
    EXPECT_EQ(error_code_to_string(ErrorCode::COLUMN_NOT_FOUND), "COLUMN_NOT_FOUND");
}
