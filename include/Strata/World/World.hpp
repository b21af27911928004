#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <utility>
#include <vector>

#include "../Commands/CommandBuffer.hpp"
#include "../Component/Component.hpp"
#include "../Component/ComponentRegistry.hpp"
#include "../Component/ComponentStorage.hpp"
#include "../Core/Base.hpp"
#include "../Core/Config.hpp"
#include "../Core/Logger.hpp"
#include "../Core/Profile.hpp"
#include "../Core/Result.hpp"
#include "../Entity/EntityManager.hpp"
#include "../Memory/ArenaRegistry.hpp"
#include "../Query/QueryView.hpp"
#include "../System/SystemScheduler.hpp"

namespace Strata
{
    class World;

    using CommandBuffer = BasicCommandBuffer<World>;

    /**
     * @brief Composition root of the ECS
     *
     * Owns an ArenaRegistry with the component arena every storage draws
     * from, the EntityManager, the per-world ComponentRegistry, the storages,
     * the SystemScheduler and the deferred CommandBuffer. Storages are created
     * lazily on the first AddComponent of a type and are destroyed before the
     * arenas they live in.
     *
     * While a parallel tick is in flight structural changes fail InvalidState;
     * record them with Defer() instead.
     */
    class World
    {
    public:
        static constexpr const char* COMPONENT_ARENA_NAME = "Components";

        struct Config
        {
            ArenaDesc componentArena{};
            std::size_t initialStorageCapacity = config::INITIAL_STORAGE_CAPACITY;
            bool debugArenas =
#ifdef STRATA_BUILD_DEBUG
                true;
#else
                false;
#endif
            DebugArenaConfig debugConfig{};
            ExecutionMode executionMode = ExecutionMode::Sequential;
            // Zero lets the worker pool size itself from the hardware
            std::size_t workerCount = 0;
            EntityManager::Config entities{};
        };

        World() : World(Config{}) {}

        explicit World(const Config& config)
            : m_config(config)
            , m_arenas(ArenaRegistry::Config{config.debugArenas, config.debugConfig})
            , m_entities(config.entities)
            , m_scheduler(config.executionMode, config.workerCount)
        {
            auto arena = m_arenas.Create(COMPONENT_ARENA_NAME, config.componentArena);
            if (!arena)
            {
                m_initError = arena.Error();
                STRATA_LOG_ERROR("World", "Failed to create component arena: %s", m_initError.message);
                return;
            }

            m_componentArena = arena.Value();
            auto selected = m_arenas.SetDefault(m_componentArena);
            if (!selected)
                STRATA_LOG_WARN("World", "Component arena not selected as default: %s", selected.Error().message);
        }

        World(const World&) = delete;
        World& operator=(const World&) = delete;

        ~World()
        {
            // Storages hand their blocks back before the arenas go away
            m_commands.Clear();
            m_storages.clear();
        }

        STRATA_NODISCARD static Result<std::unique_ptr<World>> Create()
        {
            return Create(Config{});
        }

        // Constructs a world, failing when its component arena cannot be created
        STRATA_NODISCARD static Result<std::unique_ptr<World>> Create(const Config& config)
        {
            auto world = std::make_unique<World>(config);
            if (!world->IsValid())
                return Err(world->m_initError);
            return world;
        }

        STRATA_NODISCARD bool IsValid() const noexcept { return m_componentArena != INVALID_ARENA; }

        // ============= Entities =============

        STRATA_NODISCARD Result<Entity> CreateEntity()
        {
            if (IsDispatching())
                return Err(ErrorCode::InvalidState, "Structural change during parallel tick");
            return m_entities.Create();
        }

        /**
         * Removes every component of the entity, then frees its slot.
         * Fails StaleHandle for a dead handle and StorageLocked, with nothing
         * removed, when a query holds one of its storages.
         */
        STRATA_NODISCARD Result<void> DestroyEntity(Entity entity)
        {
            STRATA_PROFILE_ZONE_NAMED_COLOR("World::DestroyEntity", Profile::ColorEntity);

            if (IsDispatching())
                return Err(ErrorCode::InvalidState, "Structural change during parallel tick");

            auto mask = m_entities.GetMask(entity);
            if (!mask)
                return Err(mask.Error());

            const ComponentMask& held = mask.Value();
            bool locked = false;
            held.ForEachSetBit([&](std::size_t bit) {
                IComponentStorage* storage = StorageAt(static_cast<ComponentID>(bit));
                if (storage && storage->IsLocked())
                    locked = true;
            });
            if (locked)
                return Err(ErrorCode::StorageLocked);

            Result<void> removed = OK;
            held.ForEachSetBit([&](std::size_t bit) {
                IComponentStorage* storage = StorageAt(static_cast<ComponentID>(bit));
                if (!storage || !removed)
                    return;
                removed = storage->Remove(entity);
            });
            if (!removed)
                return removed;

            return m_entities.Destroy(entity);
        }

        STRATA_NODISCARD bool IsAlive(Entity entity) const noexcept { return m_entities.IsAlive(entity); }

        // Live entity count
        STRATA_NODISCARD std::size_t Size() const noexcept { return m_entities.AliveCount(); }

        // Destroys every live entity; storages keep their blocks
        STRATA_NODISCARD Result<void> Clear()
        {
            if (IsDispatching())
                return Err(ErrorCode::InvalidState, "Structural change during parallel tick");

            for (const auto& storage : m_storages)
            {
                if (storage && storage->IsLocked())
                    return Err(ErrorCode::StorageLocked);
            }

            for (auto& storage : m_storages)
            {
                if (storage)
                    storage->Clear();
            }
            m_entities.Clear();
            return OK;
        }

        // ============= Components =============

        template<Component T>
        STRATA_NODISCARD Result<T*> AddComponent(Entity entity, T&& component)
        {
            return EmplaceComponent<T>(entity, std::move(component));
        }

        template<Component T>
        STRATA_NODISCARD Result<T*> AddComponent(Entity entity, const T& component) requires std::is_copy_constructible_v<T>
        {
            return EmplaceComponent<T>(entity, component);
        }

        // Fails StaleHandle, DuplicateComponent, StorageLocked or OutOfMemory; nothing changes on failure
        template<Component T, typename... Args>
        STRATA_NODISCARD Result<T*> EmplaceComponent(Entity entity, Args&&... args)
        {
            if (IsDispatching())
                return Err(ErrorCode::InvalidState, "Structural change during parallel tick");
            if (!m_entities.IsAlive(entity))
                return Err(ErrorCode::StaleHandle);

            auto storage = GetOrCreateStorage<T>();
            if (!storage)
                return Err(storage.Error());
            return storage.Value()->Emplace(entity, std::forward<Args>(args)...);
        }

        template<Component T>
        STRATA_NODISCARD Result<void> RemoveComponent(Entity entity)
        {
            if (IsDispatching())
                return Err(ErrorCode::InvalidState, "Structural change during parallel tick");
            if (!m_entities.IsAlive(entity))
                return Err(ErrorCode::StaleHandle);

            ComponentStorage<T>* storage = GetStorage<T>();
            if (!storage)
                return Err(ErrorCode::MissingComponent);
            return storage->Remove(entity);
        }

        template<Component T>
        STRATA_NODISCARD Result<T*> GetComponent(Entity entity)
        {
            if (!m_entities.IsAlive(entity))
                return Err(ErrorCode::StaleHandle);

            ComponentStorage<T>* storage = GetStorage<T>();
            if (!storage)
                return Err(ErrorCode::MissingComponent);
            return storage->Get(entity);
        }

        template<Component T>
        STRATA_NODISCARD Result<const T*> GetComponent(Entity entity) const
        {
            if (!m_entities.IsAlive(entity))
                return Err(ErrorCode::StaleHandle);

            const ComponentStorage<T>* storage = GetStorage<T>();
            if (!storage)
                return Err(ErrorCode::MissingComponent);
            return storage->Get(entity);
        }

        template<Component T>
        STRATA_NODISCARD bool HasComponent(Entity entity) const noexcept
        {
            const ComponentStorage<T>* storage = GetStorage<T>();
            return storage && m_entities.IsAlive(entity) && storage->Contains(entity);
        }

        // Storage of T, or null before the first AddComponent<T>
        template<Component T>
        STRATA_NODISCARD ComponentStorage<T>* GetStorage() noexcept
        {
            auto id = m_components.GetID<T>();
            if (!id)
                return nullptr;
            return static_cast<ComponentStorage<T>*>(StorageAt(id.Value()));
        }

        template<Component T>
        STRATA_NODISCARD const ComponentStorage<T>* GetStorage() const noexcept
        {
            return const_cast<World*>(this)->GetStorage<T>();
        }

        // Registers each type if needed and returns the mask of their ids
        template<Component... Ts>
        STRATA_NODISCARD Result<ComponentMask> MaskOf()
        {
            ComponentMask mask;
            Result<void> registered = OK;
            ([&] {
                if (!registered)
                    return;
                auto id = m_components.Register<Ts>();
                if (!id)
                    registered = Err(id.Error());
                else
                    mask.Set(id.Value());
            }(), ...);

            if (!registered)
                return Err(registered.Error());
            return mask;
        }

        // ============= Queries =============

        /**
         * View over entities holding every type in Ts. The view locks the
         * storages it reads until it is destroyed.
         */
        template<Component... Ts>
        STRATA_NODISCARD QueryView<Ts...> Query()
        {
            STRATA_PROFILE_ZONE_NAMED_COLOR("World::Query", Profile::ColorQuery);

            ComponentMask required;
            ([&] {
                auto id = m_components.GetID<Ts>();
                if (id)
                    required.Set(id.Value());
            }(), ...);

            return QueryView<Ts...>(m_entities, required, GetStorage<Ts>()...);
        }

        // Entities whose presence mask holds every bit of required
        STRATA_NODISCARD MaskQuery QueryMask(const ComponentMask& required)
        {
            std::vector<IComponentStorage*> storages;
            storages.reserve(required.Count());
            required.ForEachSetBit([&](std::size_t bit) {
                storages.push_back(StorageAt(static_cast<ComponentID>(bit)));
            });
            return MaskQuery(m_entities, required, std::move(storages));
        }

        // ============= Systems =============

        STRATA_NODISCARD Result<SystemId> RegisterSystem(SystemDesc desc)
        {
            return m_scheduler.Register(std::move(desc));
        }

        /**
         * Runs every enabled system once, then applies the deferred
         * commands. Returns the first deferred command failure, if any.
         */
        STRATA_NODISCARD Result<void> Tick(float deltaTime)
        {
            STRATA_PROFILE_ZONE_NAMED_COLOR("World::Tick", Profile::ColorSystem);

            if (IsDispatching())
                return Err(ErrorCode::InvalidState, "Tick called from inside a tick");

            const bool parallel = m_scheduler.GetExecutionMode() == ExecutionMode::Parallel;
            m_dispatching.store(parallel, std::memory_order_release);
            m_scheduler.Tick(*this, deltaTime);
            m_dispatching.store(false, std::memory_order_release);

            auto flushed = FlushCommands();
            STRATA_PROFILE_FRAME_MARK();
            if (!flushed)
                return Err(flushed.Error());
            return OK;
        }

        STRATA_NODISCARD CommandBuffer& Defer() noexcept { return m_commands; }

        STRATA_NODISCARD Result<std::size_t> FlushCommands()
        {
            return m_commands.Flush(*this);
        }

        STRATA_NODISCARD bool IsDispatching() const noexcept { return m_dispatching.load(std::memory_order_acquire); }

        // ============= Accessors =============

        STRATA_NODISCARD ArenaRegistry& Arenas() noexcept { return m_arenas; }
        STRATA_NODISCARD const ArenaRegistry& Arenas() const noexcept { return m_arenas; }
        STRATA_NODISCARD ArenaId GetComponentArena() const noexcept { return m_componentArena; }
        STRATA_NODISCARD const EntityManager& Entities() const noexcept { return m_entities; }
        STRATA_NODISCARD const ComponentRegistry& Components() const noexcept { return m_components; }
        STRATA_NODISCARD SystemScheduler& Scheduler() noexcept { return m_scheduler; }
        STRATA_NODISCARD const Config& GetConfig() const noexcept { return m_config; }

    private:
        template<Component T>
        Result<ComponentStorage<T>*> GetOrCreateStorage()
        {
            if (!IsValid())
                return Err(ErrorCode::InvalidState, "World has no component arena");

            auto id = m_components.Register<T>();
            if (!id)
                return Err(id.Error());

            const ComponentID cid = id.Value();
            if (cid >= m_storages.size())
                m_storages.resize(static_cast<std::size_t>(cid) + 1);

            if (!m_storages[cid])
            {
                m_storages[cid] = std::make_unique<ComponentStorage<T>>(
                    cid, m_arenas, m_componentArena, &m_entities, m_config.initialStorageCapacity);
                STRATA_LOG_DEBUG("World", "Created storage for component %u (%s)",
                    static_cast<unsigned>(cid), m_components.GetName(cid));
            }
            return static_cast<ComponentStorage<T>*>(m_storages[cid].get());
        }

        IComponentStorage* StorageAt(ComponentID id) const noexcept
        {
            return id < m_storages.size() ? m_storages[id].get() : nullptr;
        }

        Config m_config;
        ArenaRegistry m_arenas;
        ArenaId m_componentArena = INVALID_ARENA;
        Error m_initError{};

        EntityManager m_entities;
        ComponentRegistry m_components;
        std::vector<std::unique_ptr<IComponentStorage>> m_storages;

        SystemScheduler m_scheduler;
        CommandBuffer m_commands;
        std::atomic<bool> m_dispatching{false};
    };
}
