#include <gtest/gtest.h>
#include <vector>
#include "Orrery/Container/Bitmap.hpp"


class BitmapTest : public ::testing::Test
{
protected:
    void SetUp() override {}
    void TearDown() override {}
};

// Test basic bit operations
TEST_F(BitmapTest, BasicBitOperations)
{
    Orrery::Bitmap<128> bitmap;

    // Initially all bits should be clear
    EXPECT_TRUE(bitmap.None());
    EXPECT_FALSE(bitmap.Any());
    EXPECT_EQ(bitmap.Count(), 0u);

    bitmap.Set(0);
    bitmap.Set(63);
    bitmap.Set(64);
    bitmap.Set(127);

    EXPECT_TRUE(bitmap.Test(0));
    EXPECT_TRUE(bitmap.Test(63));
    EXPECT_TRUE(bitmap.Test(64));
    EXPECT_TRUE(bitmap.Test(127));
    EXPECT_FALSE(bitmap.Test(1));
    EXPECT_EQ(bitmap.Count(), 4u);

    bitmap.Reset(0);
    bitmap.Reset(127);

    EXPECT_FALSE(bitmap.Test(0));
    EXPECT_FALSE(bitmap.Test(127));
    EXPECT_EQ(bitmap.Count(), 2u);

    bitmap.Clear();
    EXPECT_TRUE(bitmap.None());
}

// Test boundary conditions
TEST_F(BitmapTest, OutOfRangeIsIgnored)
{
    Orrery::Bitmap<100> bitmap;

    bitmap.Set(99);
    EXPECT_TRUE(bitmap.Test(99));

    bitmap.Set(100);
    bitmap.Set(1000);
    EXPECT_FALSE(bitmap.Test(100));
    EXPECT_FALSE(bitmap.Test(1000));
    EXPECT_EQ(bitmap.Count(), 1u);
}

// Subset and intersection queries used by aspect matching
TEST_F(BitmapTest, HasAllAndHasAny)
{
    Orrery::Bitmap<128> entity;
    entity.Set(1);
    entity.Set(2);
    entity.Set(70);

    Orrery::Bitmap<128> required;
    required.Set(1);
    required.Set(70);
    EXPECT_TRUE(entity.HasAll(required));

    required.Set(3);
    EXPECT_FALSE(entity.HasAll(required));
    EXPECT_TRUE(entity.HasAny(required));

    Orrery::Bitmap<128> disjoint;
    disjoint.Set(5);
    disjoint.Set(100);
    EXPECT_FALSE(entity.HasAny(disjoint));

    // Every set contains the empty set and intersects nothing with it
    Orrery::Bitmap<128> empty;
    EXPECT_TRUE(entity.HasAll(empty));
    EXPECT_FALSE(entity.HasAny(empty));
}

// Test bitwise operators
TEST_F(BitmapTest, BitwiseOperators)
{
    Orrery::Bitmap<128> a;
    Orrery::Bitmap<128> b;
    a.Set(1);
    a.Set(65);
    b.Set(65);
    b.Set(100);

    auto both = a & b;
    EXPECT_EQ(both.Count(), 1u);
    EXPECT_TRUE(both.Test(65));

    auto either = a | b;
    EXPECT_EQ(either.Count(), 3u);

    auto inverted = ~a;
    EXPECT_EQ(inverted.Count(), 126u);
    EXPECT_FALSE(inverted.Test(1));

    a |= b;
    EXPECT_EQ(a, either);
    a &= b;
    EXPECT_EQ(a, b);
}

// Inversion must not leak bits past the logical size
TEST_F(BitmapTest, InversionTrimsTail)
{
    Orrery::Bitmap<70> bitmap;
    auto inverted = ~bitmap;

    EXPECT_EQ(inverted.Count(), 70u);
    EXPECT_FALSE(inverted.Test(70));
}

TEST_F(BitmapTest, ForEachSetVisitsInOrder)
{
    Orrery::Bitmap<256> bitmap;
    bitmap.Set(200);
    bitmap.Set(3);
    bitmap.Set(64);

    std::vector<std::size_t> visited;
    bitmap.ForEachSet([&visited](std::size_t index) { visited.push_back(index); });

    EXPECT_EQ(visited, (std::vector<std::size_t>{3, 64, 200}));
}
