#pragma once

#include "../Core/Logger.hpp"
#include "Arena.hpp"

namespace Strata
{
    /**
     * @brief RAII marker over a stack arena
     *
     * Captures the arena top on construction and rolls back to it on
     * destruction, releasing everything allocated inside the scope. Scopes
     * nest. On an arena kind without markers the scope is inert and
     * IsActive() reports false.
     */
    class ArenaScope
    {
    public:
        explicit ArenaScope(IArena& arena)
            : m_arena(&arena)
        {
            auto marker = arena.Mark();
            if (marker)
            {
                m_marker = marker.Value();
                m_active = true;
            }
        }

        ArenaScope(const ArenaScope&) = delete;
        ArenaScope& operator=(const ArenaScope&) = delete;

        ArenaScope(ArenaScope&& other) noexcept
            : m_arena(other.m_arena)
            , m_marker(other.m_marker)
            , m_active(other.m_active)
        {
            other.m_arena = nullptr;
            other.m_active = false;
        }

        ArenaScope& operator=(ArenaScope&&) = delete;

        ~ArenaScope()
        {
            if (!m_active || m_arena == nullptr)
                return;

            auto rolled = m_arena->ResetTo(m_marker);
            if (!rolled)
            {
                STRATA_LOG_ERROR("Arena", "Scope rollback failed: %s", rolled.Error().message);
            }
        }

        STRATA_NODISCARD Result<MemoryBlock> Allocate(std::size_t size, std::size_t alignment = config::DEFAULT_ALIGNMENT)
        {
            STRATA_ASSERT(m_arena != nullptr, "Allocate on a moved-from ArenaScope");
            return m_arena->Allocate(size, alignment);
        }

        // Skip the rollback, keeping everything allocated in the scope
        void Release() noexcept { m_active = false; }

        STRATA_NODISCARD bool IsActive() const noexcept { return m_active; }
        STRATA_NODISCARD const Marker& GetMarker() const noexcept { return m_marker; }
        STRATA_NODISCARD IArena& GetArena() const noexcept { return *m_arena; }

    private:
        IArena* m_arena = nullptr;
        Marker m_marker{};
        bool m_active = false;
    };
}
