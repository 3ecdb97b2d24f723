#include <gtest/gtest.h>
#include <string>
#include <fmt/format.h>
#include "Orrery/Core/Result.hpp"

class ResultTest : public ::testing::Test
{
protected:
    void SetUp() override {}
    void TearDown() override {}
};

namespace
{
    Orrery::Result<int> ParsePositive(int value)
    {
        if (value <= 0)
            return Orrery::Err(Orrery::ErrorCode::InvalidArgument, "value must be positive");
        return value;
    }

    Orrery::Result<void> Check(bool ok)
    {
        if (!ok)
            return Orrery::Err(Orrery::ErrorCode::NotFound);
        return Orrery::OK;
    }
}

TEST_F(ResultTest, HoldsValue)
{
    auto result = ParsePositive(7);

    ASSERT_TRUE(result);
    EXPECT_TRUE(result.IsOk());
    EXPECT_FALSE(result.IsErr());
    EXPECT_EQ(*result, 7);
    EXPECT_EQ(result.Value(), 7);
    EXPECT_EQ(result.ValueOr(0), 7);
}

TEST_F(ResultTest, HoldsError)
{
    auto result = ParsePositive(-1);

    ASSERT_FALSE(result);
    EXPECT_TRUE(result.IsErr());
    EXPECT_EQ(result.Error().code, Orrery::ErrorCode::InvalidArgument);
    EXPECT_STREQ(result.Error().message, "value must be positive");
    EXPECT_EQ(result.ValueOr(42), 42);
    EXPECT_TRUE(result == Orrery::ErrorCode::InvalidArgument);
}

TEST_F(ResultTest, VoidResult)
{
    auto ok = Check(true);
    auto err = Check(false);

    EXPECT_TRUE(ok);
    ASSERT_FALSE(err);
    EXPECT_EQ(err.Error(), Orrery::ErrorCode::NotFound);
    // Default message is filled in when none is given
    EXPECT_STREQ(err.Error().message, "Item not found");
}

TEST_F(ResultTest, CopyAndMovePreserveState)
{
    Orrery::Result<std::string> value = std::string("orrery");
    Orrery::Result<std::string> copy = value;
    Orrery::Result<std::string> moved = std::move(copy);

    ASSERT_TRUE(moved);
    EXPECT_EQ(*moved, "orrery");
    EXPECT_EQ(moved->size(), 6u);

    Orrery::Result<std::string> error = Orrery::Err(Orrery::ErrorCode::Unknown);
    moved = error;
    EXPECT_TRUE(moved.IsErr());
    EXPECT_EQ(moved.Error(), Orrery::ErrorCode::Unknown);
}

TEST_F(ResultTest, ErrorsFormatWithFmt)
{
    Orrery::Error error(Orrery::ErrorCode::InvalidEntity);
    std::string text = fmt::format("{}", error);

    EXPECT_NE(text.find("Invalid or stale entity handle"), std::string::npos);
}
