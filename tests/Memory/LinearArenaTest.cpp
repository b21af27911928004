#include <gtest/gtest.h>
#include "Strata/Memory/LinearArena.hpp"
#include <cstdint>
#include <cstring>

using namespace Strata;

class LinearArenaTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        auto created = LinearArena::Create(1024);
        ASSERT_TRUE(created.IsOk());
        m_arena = std::move(created).Value();
    }

    std::unique_ptr<LinearArena> m_arena;
};

TEST_F(LinearArenaTest, RejectsBadDescriptions)
{
    EXPECT_EQ(LinearArena::Create(0).Code(), ErrorCode::InvalidCapacity);
    EXPECT_EQ(LinearArena::Create(1024, 3).Code(), ErrorCode::InvalidArgument);
}

TEST_F(LinearArenaTest, AllocationsAreAlignedAndDisjoint)
{
    auto a = m_arena->Allocate(10, 8);
    auto b = m_arena->Allocate(20, 64);
    auto c = m_arena->Allocate(1, 1);
    ASSERT_TRUE(a && b && c);

    const auto pa = reinterpret_cast<std::uintptr_t>(a.Value().ptr);
    const auto pb = reinterpret_cast<std::uintptr_t>(b.Value().ptr);
    const auto pc = reinterpret_cast<std::uintptr_t>(c.Value().ptr);

    EXPECT_EQ(pa % 8, 0u);
    EXPECT_EQ(pb % 64, 0u);
    EXPECT_GE(pb, pa + 10);
    EXPECT_GE(pc, pb + 20);

    EXPECT_TRUE(m_arena->Owns(a.Value().ptr));
    EXPECT_EQ(m_arena->GetStats().liveAllocations, 3u);
}

TEST_F(LinearArenaTest, OutOfMemory)
{
    ASSERT_TRUE(m_arena->Allocate(1000, 1).IsOk());

    auto tooBig = m_arena->Allocate(100, 1);
    ASSERT_TRUE(tooBig.IsErr());
    EXPECT_EQ(tooBig.Code(), ErrorCode::OutOfMemory);
    EXPECT_EQ(m_arena->GetStats().failedAllocations, 1u);
}

TEST_F(LinearArenaTest, ZeroSizeIsInvalid)
{
    EXPECT_EQ(m_arena->Allocate(0).Code(), ErrorCode::InvalidArgument);
}

TEST_F(LinearArenaTest, FreeIsReclaimedOnlyByReset)
{
    auto block = m_arena->Allocate(128);
    ASSERT_TRUE(block.IsOk());
    const std::size_t usedBefore = m_arena->GetStats().used;

    EXPECT_TRUE(m_arena->Free(block.Value()).IsOk());
    EXPECT_EQ(m_arena->GetStats().used, usedBefore);

    int foreign = 0;
    auto bad = m_arena->Free(MemoryBlock{&foreign, sizeof(foreign)});
    EXPECT_EQ(bad.Code(), ErrorCode::InvalidRelease);

    ASSERT_TRUE(m_arena->Reset().IsOk());
    EXPECT_EQ(m_arena->GetStats().used, 0u);
    EXPECT_EQ(m_arena->GetStats().liveAllocations, 0u);
    EXPECT_EQ(m_arena->GetStats().peakUsed, usedBefore);

    // Released memory is handed out again from the start
    auto again = m_arena->Allocate(128);
    ASSERT_TRUE(again.IsOk());
    EXPECT_EQ(again.Value().ptr, block.Value().ptr);
}

TEST_F(LinearArenaTest, TryGrowExtendsTopBlockOnly)
{
    auto first = m_arena->Allocate(64);
    auto second = m_arena->Allocate(64);
    ASSERT_TRUE(first && second);

    MemoryBlock firstBlock = first.Value();
    EXPECT_FALSE(m_arena->TryGrow(firstBlock, 128));
    EXPECT_EQ(firstBlock.size, 64u);

    MemoryBlock top = second.Value();
    std::memset(top.ptr, 0x5A, top.size);
    ASSERT_TRUE(m_arena->TryGrow(top, 256));
    EXPECT_EQ(top.size, 256u);
    EXPECT_EQ(top.ptr, second.Value().ptr);
    EXPECT_EQ(static_cast<unsigned char*>(top.ptr)[63], 0x5A);

    EXPECT_FALSE(m_arena->TryGrow(top, 4096));
}
