#pragma once

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <memory>
#include <new>
#include <span>
#include <type_traits>
#include <utility>
#include <vector>

#include "../Core/Config.hpp"
#include "../Core/Logger.hpp"
#include "../Core/Profile.hpp"
#include "../Core/Result.hpp"
#include "../Core/TypeID.hpp"
#include "../Entity/EntityManager.hpp"
#include "../Memory/ArenaRegistry.hpp"
#include "Component.hpp"

namespace Strata
{
    /**
     * @brief Type-erased view of a ComponentStorage<T>
     *
     * Lets the world remove components of every type when an entity is
     * destroyed and lets queries lock storages without knowing T.
     */
    class IComponentStorage
    {
    public:
        virtual ~IComponentStorage() = default;

        STRATA_NODISCARD virtual ComponentID GetID() const noexcept = 0;
        STRATA_NODISCARD virtual bool Contains(Entity entity) const noexcept = 0;
        STRATA_NODISCARD virtual Result<void> Remove(Entity entity) = 0;
        STRATA_NODISCARD virtual std::size_t Size() const noexcept = 0;
        STRATA_NODISCARD virtual std::size_t Capacity() const noexcept = 0;
        STRATA_NODISCARD virtual const std::vector<Entity>& Entities() const noexcept = 0;
        virtual void Clear() = 0;

        // Held by live queries; structural changes fail with StorageLocked
        void Lock() noexcept { m_locks.fetch_add(1, std::memory_order_acq_rel); }
        void Unlock() noexcept
        {
            STRATA_ASSERT(m_locks.load(std::memory_order_acquire) > 0, "Unbalanced storage unlock");
            m_locks.fetch_sub(1, std::memory_order_acq_rel);
        }
        STRATA_NODISCARD bool IsLocked() const noexcept { return m_locks.load(std::memory_order_acquire) > 0; }

    private:
        std::atomic<std::uint32_t> m_locks{0};
    };

    /**
     * @brief Sparse-set storage for one component type
     *
     * Values live densely in a single block drawn from an arena; the dense
     * entity list and the sparse index table (entity index to dense slot)
     * are ordinary vectors. Removal swaps the last element into the hole so
     * the dense range never has gaps.
     */
    template<Component T>
    class ComponentStorage final : public IComponentStorage
    {
    public:
        static constexpr std::uint32_t NO_SLOT = UINT32_MAX;

        ComponentStorage(ComponentID id, ArenaRegistry& arenas, ArenaId arena,
                         EntityManager* entities = nullptr,
                         std::size_t initialCapacity = config::INITIAL_STORAGE_CAPACITY) noexcept
            : m_id(id)
            , m_arenas(&arenas)
            , m_arena(arena)
            , m_entityManager(entities)
            , m_initialCapacity(std::max<std::size_t>(initialCapacity, 1))
        {}

        ComponentStorage(const ComponentStorage&) = delete;
        ComponentStorage& operator=(const ComponentStorage&) = delete;

        ~ComponentStorage() override
        {
            DestroyValues();
            ReleaseBlock(m_block);
        }

        // Fails DuplicateComponent, StorageLocked or OutOfMemory; unchanged on failure
        template<typename... Args>
        STRATA_NODISCARD Result<T*> Emplace(Entity entity, Args&&... args)
        {
            if (IsLocked())
                return Err(ErrorCode::StorageLocked);
            if (!entity.IsValid())
                return Err(ErrorCode::StaleHandle);
            if (DenseIndex(entity.Index()) != NO_SLOT)
                return Err(ErrorCode::DuplicateComponent);

            if (m_size == m_capacity)
            {
                auto grown = Grow(m_size + 1);
                if (!grown) return Err(grown.Error());
            }

            if (entity.Index() >= m_sparse.size())
                m_sparse.resize(static_cast<std::size_t>(entity.Index()) + 1, NO_SLOT);
            m_entities.reserve(m_size + 1);

            // Nothing is published until the value exists, so a throwing
            // constructor leaves the storage as it was
            T* slot = m_data + m_size;
            if constexpr (std::is_aggregate_v<T>)
                ::new (static_cast<void*>(slot)) T{std::forward<Args>(args)...};
            else
                ::new (static_cast<void*>(slot)) T(std::forward<Args>(args)...);

            m_entities.push_back(entity);
            m_sparse[entity.Index()] = static_cast<std::uint32_t>(m_size);
            ++m_size;

            if (m_entityManager)
                m_entityManager->SetComponentBit(entity.Index(), m_id);
            return slot;
        }

        STRATA_NODISCARD Result<T*> Add(Entity entity, T&& value)
        {
            return Emplace(entity, std::move(value));
        }

        STRATA_NODISCARD Result<T*> Add(Entity entity, const T& value) requires std::is_copy_constructible_v<T>
        {
            return Emplace(entity, value);
        }

        STRATA_NODISCARD Result<void> Remove(Entity entity) override
        {
            if (IsLocked())
                return Err(ErrorCode::StorageLocked);
            if (!Contains(entity))
                return Err(ErrorCode::MissingComponent);

            const std::uint32_t hole = m_sparse[entity.Index()];
            const std::size_t last = m_size - 1;
            if (hole != last)
            {
                m_data[hole] = std::move(m_data[last]);
                m_entities[hole] = m_entities[last];
                m_sparse[m_entities[hole].Index()] = hole;
            }

            std::destroy_at(m_data + last);
            m_entities.pop_back();
            m_sparse[entity.Index()] = NO_SLOT;
            --m_size;

            if (m_entityManager)
                m_entityManager->ClearComponentBit(entity.Index(), m_id);
            return OK;
        }

        STRATA_NODISCARD Result<T*> Get(Entity entity) noexcept
        {
            T* value = TryGet(entity);
            if (!value)
                return Err(ErrorCode::MissingComponent);
            return value;
        }

        STRATA_NODISCARD Result<const T*> Get(Entity entity) const noexcept
        {
            const T* value = TryGet(entity);
            if (!value)
                return Err(ErrorCode::MissingComponent);
            return value;
        }

        STRATA_NODISCARD T* TryGet(Entity entity) noexcept
        {
            return Contains(entity) ? m_data + m_sparse[entity.Index()] : nullptr;
        }

        STRATA_NODISCARD const T* TryGet(Entity entity) const noexcept
        {
            return Contains(entity) ? m_data + m_sparse[entity.Index()] : nullptr;
        }

        // Value by entity index alone, skipping the generation check
        STRATA_NODISCARD T* TryGetByIndex(Entity::IndexType index) noexcept
        {
            const std::uint32_t slot = DenseIndex(index);
            return slot != NO_SLOT ? m_data + slot : nullptr;
        }

        STRATA_NODISCARD bool Contains(Entity entity) const noexcept override
        {
            const std::uint32_t slot = DenseIndex(entity.Index());
            return slot != NO_SLOT && m_entities[slot] == entity;
        }

        STRATA_NODISCARD Result<void> Reserve(std::size_t capacity)
        {
            if (IsLocked())
                return Err(ErrorCode::StorageLocked);
            if (capacity <= m_capacity)
                return OK;
            return Grow(capacity);
        }

        // Drops every value, keeping the block
        void Clear() override
        {
            STRATA_ASSERT(!IsLocked(), "Clearing a storage held by a query");
            if (m_entityManager)
            {
                for (Entity entity : m_entities)
                    m_entityManager->ClearComponentBit(entity.Index(), m_id);
            }
            DestroyValues();
            m_entities.clear();
            std::fill(m_sparse.begin(), m_sparse.end(), NO_SLOT);
        }

        STRATA_NODISCARD ComponentID GetID() const noexcept override { return m_id; }
        STRATA_NODISCARD std::size_t Size() const noexcept override { return m_size; }
        STRATA_NODISCARD std::size_t Capacity() const noexcept override { return m_capacity; }
        STRATA_NODISCARD bool Empty() const noexcept { return m_size == 0; }
        STRATA_NODISCARD const std::vector<Entity>& Entities() const noexcept override { return m_entities; }

        STRATA_NODISCARD std::span<T> Values() noexcept { return {m_data, m_size}; }
        STRATA_NODISCARD std::span<const T> Values() const noexcept { return {m_data, m_size}; }

        STRATA_NODISCARD ArenaId GetArena() const noexcept { return m_arena; }
        STRATA_NODISCARD const MemoryBlock& GetBlock() const noexcept { return m_block; }

    private:
        STRATA_NODISCARD std::uint32_t DenseIndex(Entity::IndexType index) const noexcept
        {
            return index < m_sparse.size() ? m_sparse[index] : NO_SLOT;
        }

        // In-place growth first, then relocation into a doubled block
        Result<void> Grow(std::size_t minCapacity)
        {
            STRATA_PROFILE_ZONE_NAMED_COLOR("ComponentStorage::Grow", Profile::ColorComponent);

            std::size_t newCapacity = m_capacity == 0 ? m_initialCapacity : m_capacity * config::STORAGE_GROWTH_FACTOR;
            newCapacity = std::max(newCapacity, minCapacity);
            if (newCapacity > SIZE_MAX / sizeof(T))
                return Err(ErrorCode::OutOfMemory, "Component storage size overflow");

            const std::size_t bytes = newCapacity * sizeof(T);
            if (m_block && m_arenas->TryGrow(m_arena, m_block, bytes))
            {
                m_capacity = newCapacity;
                return OK;
            }

            auto allocated = m_arenas->Allocate(m_arena, bytes, alignof(T), "ComponentStorage");
            if (!allocated) return Err(allocated.Error());

            MemoryBlock newBlock = allocated.Value();
            T* newData = static_cast<T*>(newBlock.ptr);
            for (std::size_t i = 0; i < m_size; ++i)
            {
                ::new (static_cast<void*>(newData + i)) T(std::move(m_data[i]));
                std::destroy_at(m_data + i);
            }

            ReleaseBlock(m_block);
            m_block = newBlock;
            m_data = newData;
            m_capacity = newCapacity;
            return OK;
        }

        void DestroyValues() noexcept
        {
            if constexpr (!std::is_trivially_destructible_v<T>)
            {
                for (std::size_t i = 0; i < m_size; ++i)
                    std::destroy_at(m_data + i);
            }
            m_size = 0;
        }

        void ReleaseBlock(const MemoryBlock& block)
        {
            if (!block)
                return;

            auto released = m_arenas->Free(m_arena, block);
            if (!released)
            {
                STRATA_LOG_ERROR("Component", "Failed to release storage block of component %u: %s",
                    static_cast<unsigned>(m_id), released.Error().message);
            }
        }

        ComponentID m_id;
        ArenaRegistry* m_arenas;
        ArenaId m_arena;
        EntityManager* m_entityManager;
        std::size_t m_initialCapacity;

        MemoryBlock m_block{};
        T* m_data = nullptr;
        std::size_t m_size = 0;
        std::size_t m_capacity = 0;

        std::vector<Entity> m_entities;
        std::vector<std::uint32_t> m_sparse;
    };
}
