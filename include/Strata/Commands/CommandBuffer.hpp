#pragma once

#include <cstddef>
#include <functional>
#include <limits>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

#include "../Component/Component.hpp"
#include "../Core/Base.hpp"
#include "../Core/Logger.hpp"
#include "../Core/Result.hpp"
#include "../Entity/Entity.hpp"

namespace Strata
{
    /**
     * @brief Deferred structural changes, replayed in recording order
     *
     * Systems record entity and component changes here while a query or a
     * parallel dispatch forbids applying them directly; the world flushes the
     * buffer on its own thread at the end of the tick. Recording is
     * thread-safe.
     *
     * CreateEntity() returns a placeholder handle that later commands of the
     * same buffer may use; it is replaced by the real handle during Flush().
     *
     * @code
     * auto& commands = world.Defer();
     * Entity bullet = commands.CreateEntity();
     * commands.AddComponent(bullet, Position{0, 0, 0});
     * commands.DestroyEntity(target);
     * @endcode
     */
    template<typename WorldT>
    class BasicCommandBuffer
    {
    public:
        // Generation no live entity can carry, marking placeholders
        static constexpr Entity::GenerationType PENDING_GENERATION = std::numeric_limits<Entity::GenerationType>::max();

        BasicCommandBuffer() = default;
        BasicCommandBuffer(const BasicCommandBuffer&) = delete;
        BasicCommandBuffer& operator=(const BasicCommandBuffer&) = delete;

        STRATA_NODISCARD static bool IsPending(Entity entity) noexcept
        {
            return entity.IsValid() && entity.Generation() == PENDING_GENERATION;
        }

        Entity CreateEntity()
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            const std::size_t slot = m_pendingCount++;
            const Entity placeholder = MakePlaceholder(slot);
            m_commands.emplace_back([slot](WorldT& world, Remap& remap) -> Result<void> {
                auto created = world.CreateEntity();
                if (!created) return Err(created.Error());
                remap[slot] = created.Value();
                return OK;
            });
            return placeholder;
        }

        void DestroyEntity(Entity entity)
        {
            Record([entity](WorldT& world, Remap& remap) -> Result<void> {
                return world.DestroyEntity(Resolve(entity, remap));
            });
        }

        template<Component T>
        void AddComponent(Entity entity, T component)
        {
            // Held by pointer so move-only components fit in std::function
            auto value = std::make_shared<T>(std::move(component));
            Record([entity, value](WorldT& world, Remap& remap) -> Result<void> {
                auto added = world.template AddComponent<T>(Resolve(entity, remap), std::move(*value));
                if (!added) return Err(added.Error());
                return OK;
            });
        }

        template<Component T>
        void RemoveComponent(Entity entity)
        {
            Record([entity](WorldT& world, Remap& remap) -> Result<void> {
                return world.template RemoveComponent<T>(Resolve(entity, remap));
            });
        }

        /**
         * Applies every recorded command in order and empties the buffer.
         * A failing command does not stop the ones after it; every failure is
         * logged and the first one is returned. On success the value is the
         * number of commands applied.
         */
        STRATA_NODISCARD Result<std::size_t> Flush(WorldT& world)
        {
            std::vector<Command> commands;
            std::size_t pendingCount = 0;
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                commands.swap(m_commands);
                pendingCount = m_pendingCount;
                m_pendingCount = 0;
            }

            Remap remap(pendingCount, Entity::Invalid());
            Error firstError;
            std::size_t failures = 0;

            for (Command& command : commands)
            {
                auto applied = command(world, remap);
                if (!applied)
                {
                    if (failures++ == 0)
                        firstError = applied.Error();
                    STRATA_LOG_WARN("World", "Deferred command failed: %s", applied.Error().message);
                }
            }

            if (failures > 0)
                return Err(firstError);
            return commands.size();
        }

        void Clear()
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_commands.clear();
            m_pendingCount = 0;
        }

        STRATA_NODISCARD std::size_t Size() const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_commands.size();
        }

        STRATA_NODISCARD bool Empty() const { return Size() == 0; }

    private:
        using Remap = std::vector<Entity>;
        using Command = std::function<Result<void>(WorldT&, Remap&)>;

        static Entity MakePlaceholder(std::size_t slot) noexcept
        {
            return Entity{static_cast<Entity::IndexType>(Entity::INVALID_INDEX - 1 - slot), PENDING_GENERATION};
        }

        // Placeholders whose creation failed resolve to the invalid handle
        static Entity Resolve(Entity entity, const Remap& remap) noexcept
        {
            if (!IsPending(entity))
                return entity;

            const std::size_t slot = Entity::INVALID_INDEX - 1 - entity.Index();
            return slot < remap.size() ? remap[slot] : Entity::Invalid();
        }

        template<typename Fn>
        void Record(Fn&& fn)
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_commands.emplace_back(std::forward<Fn>(fn));
        }

        std::vector<Command> m_commands;
        std::size_t m_pendingCount = 0;
        mutable std::mutex m_mutex;
    };
}
