#pragma once

#include <cstdint>
#include <functional>
#include <limits>
#include <queue>
#include <vector>

#include "../Component/Component.hpp"
#include "../Core/Base.hpp"
#include "../Core/Result.hpp"
#include "Entity.hpp"

namespace Strata
{
    struct EntityRecord
    {
        Entity::GenerationType generation = 0;
        bool alive = false;
        ComponentMask mask;
    };

    /**
     * @brief Issues and recycles generational entity handles
     *
     * Freed slots are recycled lowest index first. The generation of a slot
     * is bumped only when its entity is destroyed; a slot whose generation
     * reaches Config::maxGeneration is retired instead of recycled so no
     * handle can ever repeat.
     */
    class EntityManager
    {
    public:
        struct Config
        {
            Entity::GenerationType maxGeneration = std::numeric_limits<Entity::GenerationType>::max();
            std::size_t initialCapacity = 0;
        };

        EntityManager() : EntityManager(Config{}) {}

        explicit EntityManager(const Config& config) : m_config(config)
        {
            if (m_config.initialCapacity > 0)
                m_records.reserve(m_config.initialCapacity);
        }

        STRATA_NODISCARD Result<Entity> Create()
        {
            Entity::IndexType index;
            if (!m_freeSlots.empty())
            {
                index = m_freeSlots.top();
                m_freeSlots.pop();
            }
            else
            {
                if (m_records.size() >= Entity::INVALID_INDEX)
                    return Err(ErrorCode::CapacityExceeded, "Entity index space exhausted");

                index = static_cast<Entity::IndexType>(m_records.size());
                m_records.emplace_back();
            }

            EntityRecord& record = m_records[index];
            record.alive = true;
            record.mask.Clear();
            ++m_aliveCount;
            return Entity{index, record.generation};
        }

        STRATA_NODISCARD Result<void> Destroy(Entity entity)
        {
            EntityRecord* record = FindAlive(entity);
            if (!record)
                return Err(ErrorCode::StaleHandle);

            record->alive = false;
            record->mask.Clear();
            ++record->generation;
            --m_aliveCount;

            if (record->generation >= m_config.maxGeneration)
                ++m_retiredCount;
            else
                m_freeSlots.push(entity.Index());
            return OK;
        }

        STRATA_NODISCARD bool IsAlive(Entity entity) const noexcept
        {
            return FindAlive(entity) != nullptr;
        }

        STRATA_NODISCARD Result<ComponentMask> GetMask(Entity entity) const
        {
            const EntityRecord* record = FindAlive(entity);
            if (!record)
                return Err(ErrorCode::StaleHandle);
            return record->mask;
        }

        // Presence bits, maintained by component storages
        void SetComponentBit(Entity::IndexType index, ComponentID id) noexcept
        {
            STRATA_ASSERT(index < m_records.size() && m_records[index].alive, "Setting a bit on a dead slot");
            if (index < m_records.size())
                m_records[index].mask.Set(id);
        }

        void ClearComponentBit(Entity::IndexType index, ComponentID id) noexcept
        {
            if (index < m_records.size())
                m_records[index].mask.Reset(id);
        }

        // Current handle of a live slot, or the invalid handle
        STRATA_NODISCARD Entity HandleAt(Entity::IndexType index) const noexcept
        {
            if (index >= m_records.size() || !m_records[index].alive)
                return Entity::Invalid();
            return Entity{index, m_records[index].generation};
        }

        STRATA_NODISCARD const EntityRecord* GetRecord(Entity::IndexType index) const noexcept
        {
            return index < m_records.size() ? &m_records[index] : nullptr;
        }

        // Visits live entities in ascending index order
        template<typename Fn>
        void ForEach(Fn&& fn) const
        {
            for (std::size_t i = 0; i < m_records.size(); ++i)
            {
                if (m_records[i].alive)
                    fn(Entity{static_cast<Entity::IndexType>(i), m_records[i].generation});
            }
        }

        template<typename Fn>
        void ForEachMatching(const ComponentMask& required, Fn&& fn) const
        {
            for (std::size_t i = 0; i < m_records.size(); ++i)
            {
                const EntityRecord& record = m_records[i];
                if (record.alive && record.mask.HasAll(required))
                    fn(Entity{static_cast<Entity::IndexType>(i), record.generation});
            }
        }

        void Reserve(std::size_t count)
        {
            m_records.reserve(count);
        }

        // Destroys every live entity at once; slots keep their generations
        void Clear()
        {
            m_freeSlots = FreeSlotQueue{};
            for (std::size_t i = 0; i < m_records.size(); ++i)
            {
                EntityRecord& record = m_records[i];
                if (record.alive)
                {
                    record.alive = false;
                    record.mask.Clear();
                    ++record.generation;
                    if (record.generation >= m_config.maxGeneration)
                        ++m_retiredCount;
                }

                if (record.generation < m_config.maxGeneration)
                    m_freeSlots.push(static_cast<Entity::IndexType>(i));
            }
            m_aliveCount = 0;
        }

        STRATA_NODISCARD std::size_t AliveCount() const noexcept { return m_aliveCount; }
        STRATA_NODISCARD std::size_t SlotCount() const noexcept { return m_records.size(); }
        STRATA_NODISCARD std::size_t FreeCount() const noexcept { return m_freeSlots.size(); }
        STRATA_NODISCARD std::size_t RetiredCount() const noexcept { return m_retiredCount; }

    private:
        using FreeSlotQueue = std::priority_queue<Entity::IndexType, std::vector<Entity::IndexType>, std::greater<Entity::IndexType>>;

        EntityRecord* FindAlive(Entity entity) noexcept
        {
            if (entity.Index() >= m_records.size())
                return nullptr;
            EntityRecord& record = m_records[entity.Index()];
            if (!record.alive || record.generation != entity.Generation())
                return nullptr;
            return &record;
        }

        const EntityRecord* FindAlive(Entity entity) const noexcept
        {
            return const_cast<EntityManager*>(this)->FindAlive(entity);
        }

        Config m_config;
        std::vector<EntityRecord> m_records;
        FreeSlotQueue m_freeSlots;
        std::size_t m_aliveCount = 0;
        std::size_t m_retiredCount = 0;
    };
}
