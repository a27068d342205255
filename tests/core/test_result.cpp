#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>
#include "data_ngin/core/error.hpp"

using namespace data_ngin;

class ResultTest : public ::testing::Test {};

TEST_F(ResultTest, SuccessfulResults) {
    Result<int> int_result(42);
    EXPECT_TRUE(int_result.is_ok());
    EXPECT_FALSE(int_result.is_error());
    EXPECT_EQ(int_result.value(), 42);

    Result<std::string> string_result("success");
    EXPECT_TRUE(string_result.is_ok());
    EXPECT_EQ(string_result.value(), "success");
    EXPECT_EQ(string_result.error(), nullptr);
}

TEST_F(ResultTest, ErrorCase) {
    auto error_result =
        make_error<int>(ErrorCode::EMPTY_RESULT, "Test error message", "TestComponent");

    EXPECT_TRUE(error_result.is_error());
    EXPECT_FALSE(error_result.is_ok());
    EXPECT_EQ(error_result.error()->code(), ErrorCode::EMPTY_RESULT);
    EXPECT_STREQ(error_result.error()->what(), "Test error message");
    EXPECT_EQ(error_result.error()->component(), "TestComponent");
}

TEST_F(ResultTest, ValueOnErrorThrows) {
    auto error_result = make_error<int>(ErrorCode::WRITE_FAILURE, "disk full", "Writer");
    EXPECT_THROW(error_result.value(), DataError);

    auto void_error = make_error<void>(ErrorCode::WRITE_FAILURE, "disk full", "Writer");
    EXPECT_THROW(void_error.value(), DataError);
}

TEST_F(ResultTest, ErrorToString) {
    DataError error(ErrorCode::CONFIGURATION_ERROR, "bad range", "RequestPlanner");
    EXPECT_EQ(error.to_string(), "Error in RequestPlanner: bad range (CONFIGURATION_ERROR)");
}

TEST_F(ResultTest, MoveOnlyType) {
    auto ptr = std::make_unique<int>(42);
    Result<std::unique_ptr<int>> result(std::move(ptr));

    EXPECT_TRUE(result.is_ok());
    EXPECT_EQ(*result.value(), 42);

    std::unique_ptr<int> taken = result.take_value();
    ASSERT_NE(taken, nullptr);
    EXPECT_EQ(*taken, 42);
}

TEST_F(ResultTest, MoveSemantics) {
    Result<std::vector<int>> source(std::vector<int>{1, 2, 3});
    Result<std::vector<int>> moved = std::move(source);

    EXPECT_TRUE(moved.is_ok());
    EXPECT_EQ(moved.value().size(), 3u);
}

TEST_F(ResultTest, VoidResult) {
    Result<void> success;
    EXPECT_TRUE(success.is_ok());
    EXPECT_NO_THROW(success.value());

    auto error = make_error<void>(ErrorCode::INVALID_ARGUMENT, "Void error", "Test");
    EXPECT_TRUE(error.is_error());
    EXPECT_FALSE(error.is_ok());
}

TEST_F(ResultTest, ForwardErrorKeepsOriginalComponent) {
    auto inner = make_error<int>(ErrorCode::PROVIDER_UNAVAILABLE, "timeout", "CurlHttpClient");
    auto outer = forward_error<std::string>(inner, "PolygonGateway");

    ASSERT_TRUE(outer.is_error());
    EXPECT_EQ(outer.error()->code(), ErrorCode::PROVIDER_UNAVAILABLE);
    EXPECT_STREQ(outer.error()->what(), "timeout");
    EXPECT_EQ(outer.error()->component(), "CurlHttpClient");

    auto anonymous = make_error<void>(ErrorCode::EMPTY_RESULT, "nothing");
    auto tagged = forward_error<int>(anonymous, "Sequencer");
    EXPECT_EQ(tagged.error()->component(), "Sequencer");
}

TEST_F(ResultTest, ErrorCodeNames) {
    EXPECT_EQ(error_code_to_string(ErrorCode::UNSUPPORTED_COMBINATION), "UNSUPPORTED_COMBINATION");
    EXPECT_EQ(error_code_to_string(ErrorCode::PROVIDER_UNAVAILABLE), "PROVIDER_UNAVAILABLE");
    EXPECT_EQ(error_code_to_string(ErrorCode::WRITE_FAILURE), "WRITE_FAILURE");
}
