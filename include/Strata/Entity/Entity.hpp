#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>

#include "../Core/Base.hpp"

namespace Strata
{
    /**
     * @brief Generational entity handle
     *
     * The index names a slot in the EntityManager; the generation tells
     * apart successive occupants of that slot, so a handle kept past
     * DestroyEntity() is detected as stale. A default-constructed handle
     * is invalid.
     */
    class Entity
    {
    public:
        using IndexType = std::uint32_t;
        using GenerationType = std::uint32_t;

        static constexpr IndexType INVALID_INDEX = std::numeric_limits<IndexType>::max();

        constexpr Entity() noexcept = default;
        constexpr Entity(IndexType index, GenerationType generation) noexcept
            : m_index(index), m_generation(generation)
        {}

        STRATA_NODISCARD constexpr IndexType Index() const noexcept { return m_index; }
        STRATA_NODISCARD constexpr GenerationType Generation() const noexcept { return m_generation; }

        STRATA_NODISCARD constexpr bool IsValid() const noexcept { return m_index != INVALID_INDEX; }
        STRATA_NODISCARD constexpr explicit operator bool() const noexcept { return IsValid(); }

        STRATA_NODISCARD constexpr bool operator==(const Entity& other) const noexcept = default;

        STRATA_NODISCARD constexpr bool operator<(const Entity& other) const noexcept
        {
            return m_index != other.m_index ? m_index < other.m_index : m_generation < other.m_generation;
        }

        // Index in the low half, generation in the high half
        STRATA_NODISCARD constexpr std::uint64_t Pack() const noexcept
        {
            return (static_cast<std::uint64_t>(m_generation) << 32) | m_index;
        }

        STRATA_NODISCARD static constexpr Entity Invalid() noexcept { return Entity{}; }

    private:
        IndexType m_index = INVALID_INDEX;
        GenerationType m_generation = 0;
    };

    struct EntityHash
    {
        std::size_t operator()(const Entity& entity) const noexcept
        {
            std::uint64_t hash = entity.Pack();
            hash ^= hash >> 33;
            hash *= 0xFF51AFD7ED558CCDULL;
            hash ^= hash >> 33;
            return static_cast<std::size_t>(hash);
        }
    };
}

namespace std
{
    template<>
    struct hash<Strata::Entity>
    {
        STRATA_NODISCARD std::size_t operator()(const Strata::Entity& entity) const noexcept
        {
            return Strata::EntityHash{}(entity);
        }
    };
}
