#include <gtest/gtest.h>
#include "Strata/World/World.hpp"
#include "TestComponents.hpp"
#include <algorithm>
#include <random>
#include <set>
#include <vector>

using namespace Strata;
using namespace Strata::Test;

class QueryTest : public ::testing::Test
{
protected:
    Entity Spawn()
    {
        auto created = m_world.CreateEntity();
        EXPECT_TRUE(created.IsOk());
        return created.IsOk() ? created.Value() : Entity::Invalid();
    }

    Strata::Test::QuietLogs m_quiet;
    World m_world;
};

TEST_F(QueryTest, MatchesBruteForceOverRandomWorld)
{
    std::mt19937 rng(42);
    std::vector<Entity> entities;
    for (int i = 0; i < 500; ++i)
    {
        Entity entity = Spawn();
        entities.push_back(entity);
        if (rng() % 2) ASSERT_TRUE(m_world.AddComponent(entity, Position{float(i), 0.0f, 0.0f}).IsOk());
        if (rng() % 3) ASSERT_TRUE(m_world.AddComponent(entity, Velocity{1.0f, 0.0f, 0.0f}).IsOk());
        if (rng() % 4 == 0) ASSERT_TRUE(m_world.AddComponent(entity, Health{}).IsOk());
    }

    // Churn: drop some components and destroy some entities
    for (int i = 0; i < 150; ++i)
    {
        Entity entity = entities[rng() % entities.size()];
        if (!m_world.IsAlive(entity))
            continue;
        switch (rng() % 3)
        {
            case 0:
                if (m_world.HasComponent<Position>(entity))
                    ASSERT_TRUE(m_world.RemoveComponent<Position>(entity).IsOk());
                break;
            case 1:
                if (m_world.HasComponent<Velocity>(entity))
                    ASSERT_TRUE(m_world.RemoveComponent<Velocity>(entity).IsOk());
                break;
            default:
                ASSERT_TRUE(m_world.DestroyEntity(entity).IsOk());
                break;
        }
    }

    std::set<Entity> expected;
    std::set<Entity> expectedWithHealth;
    for (Entity entity : entities)
    {
        if (m_world.HasComponent<Position>(entity) && m_world.HasComponent<Velocity>(entity))
        {
            expected.insert(entity);
            if (m_world.HasComponent<Health>(entity))
                expectedWithHealth.insert(entity);
        }
    }

    std::set<Entity> actual;
    for (auto [entity, position, velocity] : m_world.Query<Position, Velocity>())
    {
        EXPECT_TRUE(actual.insert(entity).second) << "entity yielded twice";
        EXPECT_EQ(&position, m_world.GetComponent<Position>(entity).Value());
        EXPECT_EQ(&velocity, m_world.GetComponent<Velocity>(entity).Value());
    }
    EXPECT_EQ(actual, expected);

    std::set<Entity> actualWithHealth;
    m_world.Query<Health, Position, Velocity>().ForEach([&](Entity entity, Health&, Position&, Velocity&) {
        actualWithHealth.insert(entity);
    });
    EXPECT_EQ(actualWithHealth, expectedWithHealth);
}

TEST_F(QueryTest, WritesThroughReferences)
{
    for (int i = 0; i < 10; ++i)
    {
        Entity entity = Spawn();
        ASSERT_TRUE(m_world.AddComponent(entity, Position{0.0f, 0.0f, 0.0f}).IsOk());
        ASSERT_TRUE(m_world.AddComponent(entity, Velocity{float(i), 1.0f, 0.0f}).IsOk());
    }

    for (auto [entity, position, velocity] : m_world.Query<Position, Velocity>())
    {
        position.x += velocity.dx;
        position.y += velocity.dy;
    }

    m_world.Query<Position, Velocity>().ForEach([](Position& position, Velocity& velocity) {
        EXPECT_FLOAT_EQ(position.x, velocity.dx);
        EXPECT_FLOAT_EQ(position.y, 1.0f);
    });
}

TEST_F(QueryTest, DrivenBySmallestStorage)
{
    for (int i = 0; i < 100; ++i)
    {
        Entity entity = Spawn();
        ASSERT_TRUE(m_world.AddComponent(entity, Position{}).IsOk());
        if (i % 10 == 0)
            ASSERT_TRUE(m_world.AddComponent(entity, Player{}).IsOk());
    }

    auto view = m_world.Query<Position, Player>();
    ASSERT_NE(view.GetDriver(), nullptr);
    EXPECT_EQ(view.GetDriver(), &m_world.GetStorage<Player>()->Entities());
    EXPECT_EQ(view.Count(), 10u);
}

TEST_F(QueryTest, TypeWithoutStorageYieldsNothing)
{
    Entity entity = Spawn();
    ASSERT_TRUE(m_world.AddComponent(entity, Position{}).IsOk());

    auto view = m_world.Query<Position, Velocity>();
    EXPECT_TRUE(view.Empty());
    EXPECT_EQ(view.Count(), 0u);
    EXPECT_EQ(view.GetDriver(), nullptr);

    // Querying never registers a type
    EXPECT_FALSE(m_world.Components().IsRegistered<Velocity>());
}

TEST_F(QueryTest, LocksStoragesForItsLifetime)
{
    Entity first = Spawn();
    Entity second = Spawn();
    ASSERT_TRUE(m_world.AddComponent(first, Position{}).IsOk());

    {
        auto view = m_world.Query<Position>();
        EXPECT_TRUE(m_world.GetStorage<Position>()->IsLocked());

        auto added = m_world.AddComponent(second, Position{});
        ASSERT_TRUE(added.IsErr());
        EXPECT_EQ(added.Code(), ErrorCode::StorageLocked);
        EXPECT_EQ(m_world.RemoveComponent<Position>(first).Code(), ErrorCode::StorageLocked);
        EXPECT_EQ(m_world.DestroyEntity(first).Code(), ErrorCode::StorageLocked);

        // Unrelated storages stay writable
        EXPECT_TRUE(m_world.AddComponent(second, Velocity{}).IsOk());
    }

    EXPECT_FALSE(m_world.GetStorage<Position>()->IsLocked());
    EXPECT_TRUE(m_world.AddComponent(second, Position{}).IsOk());
    EXPECT_TRUE(m_world.IsAlive(first));
}

TEST_F(QueryTest, MovedViewUnlocksOnce)
{
    Entity entity = Spawn();
    ASSERT_TRUE(m_world.AddComponent(entity, Position{}).IsOk());

    {
        auto view = m_world.Query<Position>();
        auto moved = std::move(view);
        EXPECT_EQ(moved.Count(), 1u);
    }
    EXPECT_FALSE(m_world.GetStorage<Position>()->IsLocked());
}

TEST_F(QueryTest, ViewIsRestartable)
{
    for (int i = 0; i < 5; ++i)
        ASSERT_TRUE(m_world.AddComponent(Spawn(), Health{i, 10}).IsOk());

    auto view = m_world.Query<Health>();
    std::vector<Entity> firstPass;
    std::vector<Entity> secondPass;
    for (auto [entity, health] : view)
        firstPass.push_back(entity);
    for (auto [entity, health] : view)
        secondPass.push_back(entity);

    EXPECT_EQ(firstPass.size(), 5u);
    EXPECT_EQ(firstPass, secondPass);
}

TEST_F(QueryTest, MaskQueryMatchesPresenceBits)
{
    std::vector<Entity> entities;
    for (int i = 0; i < 30; ++i)
    {
        Entity entity = Spawn();
        entities.push_back(entity);
        if (i % 2 == 0) ASSERT_TRUE(m_world.AddComponent(entity, Position{}).IsOk());
        if (i % 3 == 0) ASSERT_TRUE(m_world.AddComponent(entity, Health{}).IsOk());
    }
    ASSERT_TRUE(m_world.DestroyEntity(entities[6]).IsOk());

    auto mask = m_world.MaskOf<Position, Health>();
    ASSERT_TRUE(mask.IsOk());

    std::vector<Entity> matched = m_world.QueryMask(mask.Value()).Collect();
    std::sort(matched.begin(), matched.end());

    std::vector<Entity> expected;
    for (int i = 0; i < 30; i += 6)
    {
        if (i != 6)
            expected.push_back(entities[i]);
    }
    EXPECT_EQ(matched, expected);
}

TEST_F(QueryTest, EmptyMaskMatchesEveryLiveEntity)
{
    std::vector<Entity> entities;
    for (int i = 0; i < 8; ++i)
        entities.push_back(Spawn());
    ASSERT_TRUE(m_world.DestroyEntity(entities[3]).IsOk());

    auto query = m_world.QueryMask(ComponentMask{});
    EXPECT_EQ(query.Count(), 7u);

    std::size_t visited = 0;
    query.ForEach([&](Entity entity) {
        EXPECT_TRUE(m_world.IsAlive(entity));
        ++visited;
    });
    EXPECT_EQ(visited, 7u);
}

TEST_F(QueryTest, MaskQueryWithMissingStorageIsEmpty)
{
    Entity entity = Spawn();
    ASSERT_TRUE(m_world.AddComponent(entity, Position{}).IsOk());

    // Velocity is registered but has no storage yet
    auto mask = m_world.MaskOf<Position, Velocity>();
    ASSERT_TRUE(mask.IsOk());
    EXPECT_EQ(m_world.QueryMask(mask.Value()).Count(), 0u);
}
