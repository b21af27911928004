#include <gtest/gtest.h>
#include "Strata/Entity/EntityManager.hpp"
#include <set>
#include <vector>

using namespace Strata;

class EntityManagerTest : public ::testing::Test
{
protected:
    Entity MustCreate()
    {
        auto created = m_manager.Create();
        EXPECT_TRUE(created.IsOk());
        return created.IsOk() ? created.Value() : Entity::Invalid();
    }

    EntityManager m_manager;
};

TEST_F(EntityManagerTest, CreatesSequentialIndices)
{
    for (Entity::IndexType i = 0; i < 10; ++i)
    {
        Entity entity = MustCreate();
        EXPECT_EQ(entity.Index(), i);
        EXPECT_EQ(entity.Generation(), 0u);
        EXPECT_TRUE(m_manager.IsAlive(entity));
    }
    EXPECT_EQ(m_manager.AliveCount(), 10u);
    EXPECT_EQ(m_manager.SlotCount(), 10u);
}

TEST_F(EntityManagerTest, DestroyInvalidatesHandle)
{
    Entity entity = MustCreate();
    ASSERT_TRUE(m_manager.Destroy(entity).IsOk());

    EXPECT_FALSE(m_manager.IsAlive(entity));
    EXPECT_EQ(m_manager.AliveCount(), 0u);
    EXPECT_EQ(m_manager.FreeCount(), 1u);

    auto again = m_manager.Destroy(entity);
    ASSERT_TRUE(again.IsErr());
    EXPECT_EQ(again.Code(), ErrorCode::StaleHandle);
    EXPECT_EQ(m_manager.GetMask(entity).Code(), ErrorCode::StaleHandle);
}

TEST_F(EntityManagerTest, RecycledSlotBumpsGeneration)
{
    Entity first = MustCreate();
    ASSERT_TRUE(m_manager.Destroy(first).IsOk());

    Entity second = MustCreate();
    EXPECT_EQ(second.Index(), first.Index());
    EXPECT_EQ(second.Generation(), first.Generation() + 1);
    EXPECT_FALSE(m_manager.IsAlive(first));
    EXPECT_TRUE(m_manager.IsAlive(second));
}

TEST_F(EntityManagerTest, LowestFreeIndexReusedFirst)
{
    std::vector<Entity> entities;
    for (int i = 0; i < 8; ++i)
        entities.push_back(MustCreate());

    ASSERT_TRUE(m_manager.Destroy(entities[6]).IsOk());
    ASSERT_TRUE(m_manager.Destroy(entities[2]).IsOk());
    ASSERT_TRUE(m_manager.Destroy(entities[4]).IsOk());

    EXPECT_EQ(MustCreate().Index(), 2u);
    EXPECT_EQ(MustCreate().Index(), 4u);
    EXPECT_EQ(MustCreate().Index(), 6u);
    EXPECT_EQ(MustCreate().Index(), 8u);
}

TEST_F(EntityManagerTest, ForgedHandlesAreNotAlive)
{
    Entity entity = MustCreate();
    EXPECT_FALSE(m_manager.IsAlive(Entity(entity.Index(), entity.Generation() + 1)));
    EXPECT_FALSE(m_manager.IsAlive(Entity(500, 0)));
    EXPECT_FALSE(m_manager.IsAlive(Entity::Invalid()));
    EXPECT_EQ(m_manager.Destroy(Entity(500, 0)).Code(), ErrorCode::StaleHandle);
}

TEST_F(EntityManagerTest, ExhaustedSlotsAreRetired)
{
    EntityManager::Config config;
    config.maxGeneration = 3;
    EntityManager manager(config);

    std::set<std::uint64_t> seen;
    for (int round = 0; round < 3; ++round)
    {
        auto created = manager.Create();
        ASSERT_TRUE(created.IsOk());
        EXPECT_EQ(created.Value().Index(), 0u);
        EXPECT_TRUE(seen.insert(created.Value().Pack()).second);
        ASSERT_TRUE(manager.Destroy(created.Value()).IsOk());
    }

    EXPECT_EQ(manager.RetiredCount(), 1u);
    EXPECT_EQ(manager.FreeCount(), 0u);

    auto fresh = manager.Create();
    ASSERT_TRUE(fresh.IsOk());
    EXPECT_EQ(fresh.Value().Index(), 1u);
    EXPECT_EQ(fresh.Value().Generation(), 0u);
}

TEST_F(EntityManagerTest, ComponentBitsFollowTheSlot)
{
    Entity entity = MustCreate();
    m_manager.SetComponentBit(entity.Index(), 3);
    m_manager.SetComponentBit(entity.Index(), 7);

    auto mask = m_manager.GetMask(entity);
    ASSERT_TRUE(mask.IsOk());
    EXPECT_TRUE(mask.Value().Test(3));
    EXPECT_TRUE(mask.Value().Test(7));
    EXPECT_EQ(mask.Value().Count(), 2u);

    m_manager.ClearComponentBit(entity.Index(), 3);
    EXPECT_FALSE(m_manager.GetMask(entity).Value().Test(3));

    // A recycled slot starts with an empty mask
    ASSERT_TRUE(m_manager.Destroy(entity).IsOk());
    Entity recycled = MustCreate();
    EXPECT_TRUE(m_manager.GetMask(recycled).Value().None());
}

TEST_F(EntityManagerTest, ForEachMatchingVisitsInIndexOrder)
{
    std::vector<Entity> entities;
    for (int i = 0; i < 10; ++i)
    {
        Entity entity = MustCreate();
        entities.push_back(entity);
        if (i % 3 == 0)
            m_manager.SetComponentBit(entity.Index(), 1);
    }
    ASSERT_TRUE(m_manager.Destroy(entities[3]).IsOk());

    ComponentMask required;
    required.Set(1);

    std::vector<Entity::IndexType> visited;
    m_manager.ForEachMatching(required, [&](Entity entity) { visited.push_back(entity.Index()); });
    EXPECT_EQ(visited, (std::vector<Entity::IndexType>{0, 6, 9}));

    std::size_t alive = 0;
    m_manager.ForEach([&](Entity) { ++alive; });
    EXPECT_EQ(alive, 9u);
}

TEST_F(EntityManagerTest, HandleAtAndClear)
{
    Entity a = MustCreate();
    Entity b = MustCreate();
    ASSERT_TRUE(m_manager.Destroy(a).IsOk());

    EXPECT_EQ(m_manager.HandleAt(a.Index()), Entity::Invalid());
    EXPECT_EQ(m_manager.HandleAt(b.Index()), b);
    EXPECT_EQ(m_manager.HandleAt(99), Entity::Invalid());

    m_manager.Clear();
    EXPECT_EQ(m_manager.SlotCount(), 2u);
    EXPECT_EQ(m_manager.AliveCount(), 0u);
    EXPECT_EQ(m_manager.FreeCount(), 2u);
    EXPECT_FALSE(m_manager.IsAlive(b));

    // Recycled slots never revive a handle issued before the clear
    Entity first = MustCreate();
    Entity second = MustCreate();
    EXPECT_EQ(first, Entity(0, 1));
    EXPECT_EQ(second, Entity(1, 1));
    EXPECT_FALSE(m_manager.IsAlive(a));
    EXPECT_FALSE(m_manager.IsAlive(b));
}

TEST(EntityManagerConfigTest, ClearRetiresExhaustedSlots)
{
    EntityManager::Config config;
    config.maxGeneration = 1;
    EntityManager manager(config);

    auto a = manager.Create();
    ASSERT_TRUE(a.IsOk());
    manager.Clear();
    EXPECT_EQ(manager.RetiredCount(), 1u);
    EXPECT_EQ(manager.FreeCount(), 0u);

    auto next = manager.Create();
    ASSERT_TRUE(next.IsOk());
    EXPECT_EQ(next.Value().Index(), 1u);
    EXPECT_FALSE(manager.IsAlive(a.Value()));
}
