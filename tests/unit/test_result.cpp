/**
 * @file test_result.cpp
 * @brief Unit tests for Result<T, E> and the planner error codes.
 */

#include "core/result.hpp"

#include <gtest/gtest.h>

using namespace task_planner;

TEST(ResultTest, SuccessValue) {
    Result<int> r = 42;
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(*r, 42);
}

TEST(ResultTest, ErrorValue) {
    Result<int> r = Error{ErrorCode::Backend, "store offline"};
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::Backend);
    EXPECT_EQ(r.error().message, "store offline");
}

TEST(ResultTest, MessageOnlyErrorIsInvalidArgument) {
    Error err{"bad input"};
    EXPECT_EQ(err.code, ErrorCode::InvalidArgument);
    EXPECT_EQ(err.what(), "bad input");
}

TEST(ResultTest, BoolConversion) {
    Result<int> success = 1;
    Result<int> failure = Error{"fail"};
    EXPECT_TRUE(static_cast<bool>(success));
    EXPECT_FALSE(static_cast<bool>(failure));
}

TEST(ResultTest, ValueOr) {
    Result<int> success = 42;
    Result<int> failure = Error{"fail"};
    EXPECT_EQ(success.value_or(0), 42);
    EXPECT_EQ(failure.value_or(0), 0);
}

TEST(ResultTest, Map) {
    Result<int> r = 21;
    auto doubled = r.map([](int v) { return v * 2; });
    ASSERT_TRUE(doubled.has_value());
    EXPECT_EQ(*doubled, 42);
}

TEST(ResultTest, MapOnError) {
    Result<int> r = Error{ErrorCode::Parse, "fail"};
    auto doubled = r.map([](int v) { return v * 2; });
    ASSERT_FALSE(doubled.has_value());
    EXPECT_EQ(doubled.error().code, ErrorCode::Parse);
}

TEST(ResultTest, ValueOnErrorThrows) {
    Result<int> r = Error{"fail"};
    EXPECT_THROW((void)r.value(), std::runtime_error);
}

TEST(ResultTest, VoidSuccessAndFailure) {
    Result<void> ok;
    Result<void> failed = Error{ErrorCode::Io, "disk"};
    EXPECT_TRUE(ok.has_value());
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().code, ErrorCode::Io);
}

TEST(ResultTest, TaskNotFoundMessage) {
    auto err = task_not_found(42);
    EXPECT_EQ(err.code, ErrorCode::NotFound);
    EXPECT_EQ(err.message, "task not found: 42");
}

TEST(ErrorCodeTest, ToString) {
    EXPECT_EQ(to_string(ErrorCode::NotFound), "not_found");
    EXPECT_EQ(to_string(ErrorCode::Backend), "backend");
    EXPECT_EQ(to_string(ErrorCode::Parse), "parse");
}
