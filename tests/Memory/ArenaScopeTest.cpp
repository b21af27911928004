#include <gtest/gtest.h>
#include "Strata/Memory/ArenaScope.hpp"
#include "Strata/Memory/PoolArena.hpp"
#include "Strata/Memory/StackArena.hpp"

using namespace Strata;

class ArenaScopeTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        auto created = StackArena::Create(4096);
        ASSERT_TRUE(created.IsOk());
        m_stack = std::move(created).Value();
    }

    std::unique_ptr<StackArena> m_stack;
};

TEST_F(ArenaScopeTest, RollsBackOnExit)
{
    ASSERT_TRUE(m_stack->Allocate(64).IsOk());
    const std::size_t before = m_stack->GetStats().used;

    {
        ArenaScope scope(*m_stack);
        EXPECT_TRUE(scope.IsActive());
        ASSERT_TRUE(scope.Allocate(128).IsOk());
        ASSERT_TRUE(scope.Allocate(256).IsOk());
        EXPECT_GT(m_stack->GetStats().used, before);
    }

    EXPECT_EQ(m_stack->GetStats().used, before);
    EXPECT_EQ(m_stack->GetStats().liveAllocations, 1u);
}

TEST_F(ArenaScopeTest, Nests)
{
    ArenaScope outer(*m_stack);
    ASSERT_TRUE(outer.Allocate(100).IsOk());
    const std::size_t outerUsed = m_stack->GetStats().used;

    {
        ArenaScope inner(*m_stack);
        ASSERT_TRUE(inner.Allocate(200).IsOk());
    }
    EXPECT_EQ(m_stack->GetStats().used, outerUsed);
}

TEST_F(ArenaScopeTest, ReleaseKeepsAllocations)
{
    {
        ArenaScope scope(*m_stack);
        ASSERT_TRUE(scope.Allocate(32).IsOk());
        scope.Release();
        EXPECT_FALSE(scope.IsActive());
    }
    EXPECT_EQ(m_stack->GetStats().liveAllocations, 1u);
}

TEST_F(ArenaScopeTest, MovedScopeRollsBackOnce)
{
    {
        ArenaScope first(*m_stack);
        ASSERT_TRUE(first.Allocate(32).IsOk());
        ArenaScope second(std::move(first));
        EXPECT_FALSE(first.IsActive());
        EXPECT_TRUE(second.IsActive());
        EXPECT_EQ(&second.GetArena(), m_stack.get());
    }
    EXPECT_EQ(m_stack->GetStats().used, 0u);
}

TEST_F(ArenaScopeTest, InertOnArenaWithoutMarkers)
{
    auto pool = PoolArena::Create(1024, 32);
    ASSERT_TRUE(pool.IsOk());

    {
        ArenaScope scope(*pool.Value());
        EXPECT_FALSE(scope.IsActive());
        ASSERT_TRUE(scope.Allocate(16).IsOk());
    }
    EXPECT_EQ(pool.Value()->GetStats().liveAllocations, 1u);
}
