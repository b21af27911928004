#include <gtest/gtest.h>
#include <vector>
#include "Strata/Container/Bitmap.hpp"

class BitmapTest : public ::testing::Test
{
};

// Test basic bit operations
TEST_F(BitmapTest, BasicBitOperations)
{
    Strata::Bitmap<128> bitmap;

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

// Superset checks drive query matching
TEST_F(BitmapTest, HasAllAndIntersects)
{
    Strata::Bitmap<64> entity;
    entity.Set(1);
    entity.Set(3);
    entity.Set(5);

    Strata::Bitmap<64> required;
    required.Set(1);
    required.Set(5);
    EXPECT_TRUE(entity.HasAll(required));
    EXPECT_TRUE(entity.Intersects(required));

    required.Set(2);
    EXPECT_FALSE(entity.HasAll(required));
    EXPECT_TRUE(entity.Intersects(required));

    Strata::Bitmap<64> empty;
    EXPECT_TRUE(entity.HasAll(empty));
    EXPECT_FALSE(entity.Intersects(empty));
}

TEST_F(BitmapTest, BitwiseOperators)
{
    Strata::Bitmap<128> a;
    Strata::Bitmap<128> b;
    a.Set(2);
    a.Set(100);
    b.Set(100);
    b.Set(7);

    auto both = a & b;
    EXPECT_EQ(both.Count(), 1u);
    EXPECT_TRUE(both.Test(100));

    auto either = a | b;
    EXPECT_EQ(either.Count(), 3u);

    a |= b;
    EXPECT_EQ(a, either);
    a &= b;
    EXPECT_EQ(a, b);
}

TEST_F(BitmapTest, ForEachSetBitVisitsInOrder)
{
    Strata::Bitmap<192> bitmap;
    bitmap.Set(150);
    bitmap.Set(0);
    bitmap.Set(64);
    bitmap.Set(65);

    std::vector<std::size_t> visited;
    bitmap.ForEachSetBit([&](std::size_t bit) { visited.push_back(bit); });

    EXPECT_EQ(visited, (std::vector<std::size_t>{0, 64, 65, 150}));
}
