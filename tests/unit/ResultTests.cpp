#include "core/Result.hpp"

#include <gtest/gtest.h>
#include <string>

using reading_service::core::Result;

TEST(ResultTest, OkHoldsValue) {
    auto result = Result<int, std::string>::Ok(42);

    EXPECT_TRUE(result.IsOk());
    EXPECT_FALSE(result.IsError());
    EXPECT_TRUE(static_cast<bool>(result));
    EXPECT_EQ(result.Value(), 42);
}

TEST(ResultTest, ErrHoldsError) {
    auto result = Result<int, std::string>::Err("failed");

    EXPECT_FALSE(result.IsOk());
    EXPECT_TRUE(result.IsError());
    EXPECT_FALSE(static_cast<bool>(result));
    EXPECT_EQ(result.Error(), "failed");
}

TEST(ResultTest, SameTypeForValueAndError) {
    auto ok = Result<std::string, std::string>::Ok("value");
    auto err = Result<std::string, std::string>::Err("error");

    EXPECT_TRUE(ok.IsOk());
    EXPECT_EQ(ok.Value(), "value");
    EXPECT_TRUE(err.IsError());
    EXPECT_EQ(err.Error(), "error");
}

TEST(ResultTest, ValueCanBeMovedOut) {
    auto result = Result<std::string, int>::Ok(std::string(100, 'a'));
    std::string moved = std::move(result.Value());

    EXPECT_EQ(moved.size(), 100u);
}
