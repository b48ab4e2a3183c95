#include <gtest/gtest.h>
#include <memory>
#include <string>
#include "canslim_bt/core/error.hpp"

using namespace canslim_bt;

class ResultTest : public ::testing::Test {};

TEST_F(ResultTest, SuccessfulResults) {
    Result<int> int_result(42);
    EXPECT_TRUE(int_result.is_ok());
    EXPECT_FALSE(int_result.is_error());
    EXPECT_EQ(int_result.value(), 42);

    Result<std::string> string_result(std::string("success"));
    EXPECT_TRUE(string_result.is_ok());
    EXPECT_EQ(string_result.value(), "success");

    Result<double> double_result(3.14);
    EXPECT_DOUBLE_EQ(double_result.value(), 3.14);
}

TEST_F(ResultTest, ErrorCarriesCodeMessageAndComponent) {
    auto error_result =
        make_error<int>(ErrorCode::MISSING_COLUMN, "column 'close' not found", "Loader");

    EXPECT_TRUE(error_result.is_error());
    EXPECT_FALSE(error_result.is_ok());
    EXPECT_EQ(error_result.error()->code(), ErrorCode::MISSING_COLUMN);
    EXPECT_STREQ(error_result.error()->what(), "column 'close' not found");
    EXPECT_EQ(error_result.error()->component(), "Loader");
    EXPECT_NE(error_result.error()->to_string().find("Error in Loader"), std::string::npos);
}

TEST_F(ResultTest, ValueThrowsOnError) {
    auto error_result = make_error<double>(ErrorCode::INVALID_DATA, "bad", "Test");
    EXPECT_THROW(error_result.value(), CanslimError);

    try {
        error_result.value();
        FAIL() << "value() should have thrown";
    } catch (const CanslimError& e) {
        EXPECT_EQ(e.code(), ErrorCode::INVALID_DATA);
    }
}

TEST_F(ResultTest, MoveOnlyType) {
    auto ptr = std::make_unique<int>(42);
    Result<std::unique_ptr<int>> result(std::move(ptr));

    EXPECT_TRUE(result.is_ok());
    EXPECT_EQ(*result.value(), 42);

    Result<std::unique_ptr<int>> moved = std::move(result);
    EXPECT_TRUE(moved.is_ok());
    std::unique_ptr<int> taken = moved.take_value();
    ASSERT_NE(taken, nullptr);
    EXPECT_EQ(*taken, 42);
}

TEST_F(ResultTest, VoidResult) {
    Result<void> success;
    EXPECT_TRUE(success.is_ok());
    EXPECT_NO_THROW(success.value());

    auto failure = make_error<void>(ErrorCode::EMPTY_SCHEDULE, "no dates", "Engine");
    EXPECT_TRUE(failure.is_error());
    EXPECT_EQ(failure.error()->code(), ErrorCode::EMPTY_SCHEDULE);
    EXPECT_THROW(failure.value(), CanslimError);
}
