#include <gtest/gtest.h>
#include "Strata/Memory/ArenaRegistry.hpp"
#include "TestComponents.hpp"
#include <string>
#include <vector>

using namespace Strata;

namespace
{
    ArenaRegistry::Config PlainConfig()
    {
        ArenaRegistry::Config config;
        config.debugArenas = false;
        return config;
    }

    ArenaRegistry::Config DebugConfig()
    {
        ArenaRegistry::Config config;
        config.debugArenas = true;
        return config;
    }
}

class ArenaRegistryTest : public ::testing::Test
{
protected:
    Strata::Test::QuietLogs m_quiet;
    ArenaRegistry m_registry{PlainConfig()};
};

TEST_F(ArenaRegistryTest, CreateAndFind)
{
    auto frame = m_registry.Create("Frame", ArenaDesc{ArenaKind::Linear, 4096});
    auto general = m_registry.Create("General", ArenaDesc{ArenaKind::FreeList, 8192});
    ASSERT_TRUE(frame && general);
    EXPECT_NE(frame.Value(), general.Value());

    auto found = m_registry.Find("General");
    ASSERT_TRUE(found.IsOk());
    EXPECT_EQ(found.Value(), general.Value());

    EXPECT_EQ(m_registry.Find("Missing").Code(), ErrorCode::NotFound);
    EXPECT_EQ(m_registry.Size(), 2u);

    ASSERT_NE(m_registry.Get(frame.Value()), nullptr);
    EXPECT_EQ(m_registry.Get(frame.Value())->Kind(), ArenaKind::Linear);
    EXPECT_EQ(m_registry.GetDebug(frame.Value()), nullptr);
}

TEST_F(ArenaRegistryTest, RejectsBadRequests)
{
    ASSERT_TRUE(m_registry.Create("A", ArenaDesc{ArenaKind::Linear, 1024}).IsOk());

    EXPECT_EQ(m_registry.Create("A", ArenaDesc{ArenaKind::Linear, 1024}).Code(), ErrorCode::AlreadyExists);
    EXPECT_EQ(m_registry.Create("", ArenaDesc{ArenaKind::Linear, 1024}).Code(), ErrorCode::InvalidArgument);
    EXPECT_EQ(m_registry.Create("B", ArenaDesc{ArenaKind::Linear, 1024, 24}).Code(), ErrorCode::InvalidArgument);
    EXPECT_EQ(m_registry.Create("C", ArenaDesc{ArenaKind::Linear, 0}).Code(), ErrorCode::InvalidCapacity);
    EXPECT_EQ(m_registry.Size(), 1u);
}

TEST_F(ArenaRegistryTest, DestroyRefusesLiveArenaUnlessForced)
{
    auto id = m_registry.Create("General", ArenaDesc{ArenaKind::FreeList, 4096});
    ASSERT_TRUE(id.IsOk());

    auto block = m_registry.Allocate(id.Value(), 64);
    ASSERT_TRUE(block.IsOk());

    auto refused = m_registry.Destroy(id.Value());
    ASSERT_TRUE(refused.IsErr());
    EXPECT_EQ(refused.Code(), ErrorCode::ArenaInUse);
    EXPECT_TRUE(m_registry.Contains(id.Value()));

    ASSERT_TRUE(m_registry.Free(id.Value(), block.Value()).IsOk());
    EXPECT_TRUE(m_registry.Destroy(id.Value()).IsOk());
    EXPECT_FALSE(m_registry.Contains(id.Value()));
    EXPECT_EQ(m_registry.Destroy(id.Value()).Code(), ErrorCode::NotFound);
}

TEST_F(ArenaRegistryTest, ForcedDestroyOfLinearArena)
{
    auto id = m_registry.Create("Frame", ArenaDesc{ArenaKind::Linear, 4096});
    ASSERT_TRUE(id.IsOk());
    auto block = m_registry.Allocate(id.Value(), 64);
    ASSERT_TRUE(block.IsOk());

    // Linear frees keep the allocation counted until a reset
    ASSERT_TRUE(m_registry.Free(id.Value(), block.Value()).IsOk());
    EXPECT_EQ(m_registry.Destroy(id.Value()).Code(), ErrorCode::ArenaInUse);
    EXPECT_TRUE(m_registry.Destroy(id.Value(), true).IsOk());
}

TEST_F(ArenaRegistryTest, IdsAreNeverReused)
{
    auto first = m_registry.Create("Temp", ArenaDesc{ArenaKind::Stack, 1024});
    ASSERT_TRUE(first.IsOk());
    ASSERT_TRUE(m_registry.Destroy(first.Value()).IsOk());

    auto second = m_registry.Create("Temp", ArenaDesc{ArenaKind::Stack, 1024});
    ASSERT_TRUE(second.IsOk());
    EXPECT_NE(first.Value(), second.Value());
    EXPECT_EQ(m_registry.Get(first.Value()), nullptr);
    EXPECT_EQ(m_registry.Allocate(first.Value(), 16).Code(), ErrorCode::NotFound);
}

TEST_F(ArenaRegistryTest, PoolSlotLimit)
{
    ArenaDesc desc{ArenaKind::Pool, 32 * 16, 16, 32};
    auto id = m_registry.Create("Particles", desc);
    ASSERT_TRUE(id.IsOk());

    EXPECT_TRUE(m_registry.Allocate(id.Value(), 32).IsOk());
    EXPECT_EQ(m_registry.Allocate(id.Value(), 33).Code(), ErrorCode::SizeMismatch);
}

TEST_F(ArenaRegistryTest, DebugPoolKeepsSlotCount)
{
    ArenaRegistry registry{DebugConfig()};
    ArenaDesc desc{ArenaKind::Pool, 32 * 16, 16, 32};
    auto id = registry.Create("Particles", desc);
    ASSERT_TRUE(id.IsOk());
    ASSERT_NE(registry.GetDebug(id.Value()), nullptr);

    std::vector<MemoryBlock> blocks;
    for (int i = 0; i < 16; ++i)
    {
        auto block = registry.Allocate(id.Value(), 32, 16, "particle");
        ASSERT_TRUE(block.IsOk()) << i;
        blocks.push_back(block.Value());
    }
    EXPECT_EQ(registry.Allocate(id.Value(), 32).Code(), ErrorCode::OutOfMemory);
    EXPECT_EQ(registry.Allocate(id.Value(), 33).Code(), ErrorCode::SizeMismatch);

    for (const MemoryBlock& block : blocks)
        ASSERT_TRUE(registry.Free(id.Value(), block).IsOk());
}

TEST_F(ArenaRegistryTest, DebugArenaReportsCorruption)
{
    ArenaRegistry registry{DebugConfig()};
    auto id = registry.Create("General", ArenaDesc{ArenaKind::FreeList, 4096});
    ASSERT_TRUE(id.IsOk());

    auto block = registry.Allocate(id.Value(), 16);
    ASSERT_TRUE(block.IsOk());
    static_cast<unsigned char*>(block.Value().ptr)[16] = 0;

    EXPECT_EQ(registry.Free(id.Value(), block.Value()).Code(), ErrorCode::CorruptionDetected);
    EXPECT_TRUE(registry.GetDebug(id.Value())->LastCorruption().has_value());
}

TEST_F(ArenaRegistryTest, MarkersThroughRegistry)
{
    auto stack = m_registry.Create("Scratch", ArenaDesc{ArenaKind::Stack, 4096});
    auto pool = m_registry.Create("Pool", ArenaDesc{ArenaKind::Pool, 1024, 16, 64});
    ASSERT_TRUE(stack && pool);

    auto marker = m_registry.Mark(stack.Value());
    ASSERT_TRUE(marker.IsOk());
    ASSERT_TRUE(m_registry.Allocate(stack.Value(), 128).IsOk());
    ASSERT_TRUE(m_registry.ResetTo(stack.Value(), marker.Value()).IsOk());
    EXPECT_EQ(m_registry.Stats(stack.Value()).Value().used, 0u);

    EXPECT_EQ(m_registry.Mark(pool.Value()).Code(), ErrorCode::InvalidState);
}

TEST_F(ArenaRegistryTest, BackEndThroughRegistry)
{
    auto id = m_registry.Create("Level", ArenaDesc{ArenaKind::DoubleEndedStack, 4096});
    auto pool = m_registry.Create("Pool", ArenaDesc{ArenaKind::Pool, 1024, 16, 64});
    ASSERT_TRUE(id && pool);

    auto front = m_registry.Allocate(id.Value(), 64);
    auto back = m_registry.AllocateBack(id.Value(), 64);
    ASSERT_TRUE(front && back);
    EXPECT_LT(front.Value().ptr, back.Value().ptr);
    EXPECT_EQ(m_registry.Stats(id.Value()).Value().liveAllocations, 2u);

    EXPECT_TRUE(m_registry.Free(id.Value(), back.Value()).IsOk());
    EXPECT_TRUE(m_registry.Free(id.Value(), front.Value()).IsOk());

    EXPECT_EQ(m_registry.AllocateBack(pool.Value(), 16).Code(), ErrorCode::InvalidState);
    EXPECT_EQ(m_registry.AllocateBack(INVALID_ARENA, 16).Code(), ErrorCode::NotFound);
}

TEST_F(ArenaRegistryTest, DebugBackEndKeepsGuards)
{
    ArenaRegistry registry{DebugConfig()};
    auto id = registry.Create("Level", ArenaDesc{ArenaKind::DoubleEndedStack, 4096});
    ASSERT_TRUE(id.IsOk());
    DebugArena* debug = registry.GetDebug(id.Value());
    ASSERT_NE(debug, nullptr);

    auto level = registry.AllocateBack(id.Value(), 48, config::DEFAULT_ALIGNMENT, "level");
    ASSERT_TRUE(level.IsOk());
    ASSERT_TRUE(debug->FindRecord(level.Value().ptr).has_value());
    EXPECT_TRUE(debug->FindRecord(level.Value().ptr)->back);

    // Rolling the front back leaves back-end records alone
    auto marker = registry.Mark(id.Value());
    ASSERT_TRUE(marker.IsOk());
    ASSERT_TRUE(registry.Allocate(id.Value(), 32).IsOk());
    ASSERT_TRUE(registry.ResetTo(id.Value(), marker.Value()).IsOk());
    EXPECT_EQ(debug->LiveRecordCount(), 1u);

    static_cast<unsigned char*>(level.Value().ptr)[48] = 0x00;
    EXPECT_EQ(registry.Free(id.Value(), level.Value()).Code(), ErrorCode::CorruptionDetected);
    EXPECT_EQ(debug->LiveRecordCount(), 0u);
    EXPECT_EQ(registry.Stats(id.Value()).Value().liveAllocations, 0u);
}

TEST_F(ArenaRegistryTest, TotalStatsAndForEach)
{
    auto a = m_registry.Create("A", ArenaDesc{ArenaKind::Linear, 1024});
    auto b = m_registry.Create("B", ArenaDesc{ArenaKind::FreeList, 2048});
    ASSERT_TRUE(a && b);
    ASSERT_TRUE(m_registry.Allocate(a.Value(), 100).IsOk());
    ASSERT_TRUE(m_registry.Allocate(b.Value(), 100).IsOk());

    const ArenaStats total = m_registry.TotalStats();
    EXPECT_EQ(total.capacity, 1024u + 2048u);
    EXPECT_EQ(total.liveAllocations, 2u);
    EXPECT_EQ(total.allocationCount, 2u);

    std::vector<std::string> names;
    m_registry.ForEach([&](ArenaId id, std::string_view name, const IArena& arena) {
        EXPECT_EQ(m_registry.Get(id), &arena);
        names.emplace_back(name);
    });
    EXPECT_EQ(names, (std::vector<std::string>{"A", "B"}));

    ASSERT_TRUE(m_registry.Reset(a.Value()).IsOk());
    EXPECT_EQ(m_registry.TotalStats().liveAllocations, 1u);
}

TEST_F(ArenaRegistryTest, DefaultArena)
{
    EXPECT_EQ(m_registry.GetDefault(), INVALID_ARENA);
    EXPECT_EQ(m_registry.SetDefault(7).Code(), ErrorCode::NotFound);

    auto id = m_registry.Create("Main", ArenaDesc{});
    ASSERT_TRUE(id.IsOk());
    ASSERT_TRUE(m_registry.SetDefault(id.Value()).IsOk());
    EXPECT_EQ(m_registry.GetDefault(), id.Value());

    ASSERT_TRUE(m_registry.Destroy(id.Value()).IsOk());
    EXPECT_EQ(m_registry.GetDefault(), INVALID_ARENA);
}
