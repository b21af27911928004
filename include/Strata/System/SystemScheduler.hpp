#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "../Core/Base.hpp"
#include "../Core/Logger.hpp"
#include "../Core/Profile.hpp"
#include "../Core/Result.hpp"
#include "SystemExecutor.hpp"
#include "SystemMetadata.hpp"
#include "WorkerPool.hpp"

namespace Strata
{
    /**
     * @brief Orders and runs the per-tick systems of a world
     *
     * Systems run once per Tick(). In Sequential mode they run in
     * registration order on the calling thread. In Parallel mode the plan
     * groups consecutive systems with disjoint access so each group can run
     * on the worker pool; registration order is still respected between any
     * two systems that conflict.
     *
     * @code
     * scheduler.Register({
     *     .name = "Movement",
     *     .reads = world.MaskOf<Velocity>().Value(),
     *     .writes = world.MaskOf<Position>().Value(),
     *     .callback = [](World& w, float dt) { ... }
     * });
     * @endcode
     *
     * @warning Not thread-safe. Tick() must not be called concurrently.
     */
    class SystemScheduler
    {
    private:
        struct SystemEntry
        {
            std::string name;
            std::string group;
            SystemCallback callback;
            SystemMetadata metadata;
            bool enabled = true;
        };

    public:
        explicit SystemScheduler(ExecutionMode mode = ExecutionMode::Sequential, std::size_t workerCount = 0)
            : m_mode(mode)
            , m_workerCount(workerCount)
        {}

        SystemScheduler(const SystemScheduler&) = delete;
        SystemScheduler& operator=(const SystemScheduler&) = delete;

        /**
         * Adds a system at the end of the order.
         * Fails InvalidArgument without a name or callback, AlreadyExists on a
         * duplicate name, and SystemConflict when the desc names a group that
         * already holds a conflicting member.
         */
        STRATA_NODISCARD Result<SystemId> Register(SystemDesc desc)
        {
            if (desc.name.empty())
                return Err(ErrorCode::InvalidArgument, "System name cannot be empty");
            if (!desc.callback)
                return Err(ErrorCode::InvalidArgument, "System callback cannot be empty");
            if (m_byName.find(desc.name) != m_byName.end())
                return Err(ErrorCode::AlreadyExists, "System name already registered");

            const auto id = static_cast<SystemId>(m_systems.size());
            SystemMetadata metadata;
            metadata.reads = desc.reads;
            metadata.writes = desc.writes;
            metadata.insertionOrder = id;

            if (!desc.group.empty())
            {
                for (const SystemEntry& member : m_systems)
                {
                    if (member.group == desc.group && member.metadata.ConflictsWith(metadata))
                    {
                        STRATA_LOG_ERROR("Scheduler", "System '%s' conflicts with '%s' in group '%s'",
                            desc.name.c_str(), member.name.c_str(), desc.group.c_str());
                        return Err(ErrorCode::SystemConflict);
                    }
                }
            }

            m_byName.emplace(desc.name, id);
            m_systems.push_back(SystemEntry{
                std::move(desc.name),
                std::move(desc.group),
                std::move(desc.callback),
                metadata,
                true
            });
            m_durations.push_back(0.0);
            m_needsRebuild = true;
            return id;
        }

        STRATA_NODISCARD Result<void> SetEnabled(SystemId id, bool enabled)
        {
            if (id >= m_systems.size())
                return Err(ErrorCode::NotFound, "Unknown system id");

            if (m_systems[id].enabled != enabled)
            {
                m_systems[id].enabled = enabled;
                m_needsRebuild = true;
            }
            return OK;
        }

        STRATA_NODISCARD bool IsEnabled(SystemId id) const noexcept
        {
            return id < m_systems.size() && m_systems[id].enabled;
        }

        STRATA_NODISCARD Result<SystemId> Find(std::string_view name) const
        {
            auto it = m_byName.find(std::string(name));
            if (it == m_byName.end())
                return Err(ErrorCode::NotFound, "Unknown system name");
            return it->second;
        }

        STRATA_NODISCARD const char* GetName(SystemId id) const noexcept
        {
            return id < m_systems.size() ? m_systems[id].name.c_str() : "Unknown";
        }

        STRATA_NODISCARD const SystemMetadata* GetMetadata(SystemId id) const noexcept
        {
            return id < m_systems.size() ? &m_systems[id].metadata : nullptr;
        }

        // Wall time of the system's last run, in milliseconds
        STRATA_NODISCARD Result<double> LastDuration(SystemId id) const
        {
            if (id >= m_systems.size())
                return Err(ErrorCode::NotFound, "Unknown system id");
            return m_durations[id];
        }

        void SetExecutionMode(ExecutionMode mode) noexcept
        {
            if (m_mode != mode)
            {
                m_mode = mode;
                m_needsRebuild = true;
            }
        }

        STRATA_NODISCARD ExecutionMode GetExecutionMode() const noexcept { return m_mode; }

        /**
         * Runs every enabled system once with the executor matching the
         * execution mode. Returns after the last group has joined.
         */
        void Tick(World& world, float deltaTime)
        {
            if (m_mode == ExecutionMode::Parallel)
            {
                if (!m_pool)
                    m_pool = std::make_unique<WorkerPool>(m_workerCount);
                ParallelExecutor executor(*m_pool);
                Tick(world, deltaTime, executor);
            }
            else
            {
                SequentialExecutor executor;
                Tick(world, deltaTime, executor);
            }
        }

        void Tick(World& world, float deltaTime, ISystemExecutor& executor)
        {
            STRATA_PROFILE_ZONE_NAMED_COLOR("SystemScheduler::Tick", Profile::ColorSystem);

            if (m_systems.empty())
                return;

            if (m_needsRebuild)
                BuildExecutionPlan();

            SystemExecutionContext context;
            context.world = &world;
            context.deltaTime = deltaTime;
            context.durations = &m_durations;
            context.parallelGroups = m_executionPlan;
            context.systems.reserve(m_systems.size());
            context.metadata.reserve(m_systems.size());
            for (const auto& entry : m_systems)
            {
                context.systems.push_back(&entry.callback);
                context.metadata.push_back(entry.metadata);
            }

            executor.Execute(context);
        }

        /**
         * Groups of system ids in execution order. Systems inside one group
         * may run concurrently. Disabled systems are left out.
         */
        STRATA_NODISCARD const std::vector<std::vector<std::size_t>>& GetExecutionPlan() const
        {
            if (m_needsRebuild)
                const_cast<SystemScheduler*>(this)->BuildExecutionPlan();
            return m_executionPlan;
        }

        void Clear()
        {
            m_systems.clear();
            m_byName.clear();
            m_durations.clear();
            m_executionPlan.clear();
            m_needsRebuild = true;
        }

        STRATA_NODISCARD std::size_t Size() const noexcept { return m_systems.size(); }
        STRATA_NODISCARD bool Empty() const noexcept { return m_systems.empty(); }

    private:
        /**
         * Build the plan from the declared access masks.
         *
         * A group starts at the first unscheduled system and greedily takes
         * later systems that conflict neither with the group's aggregate
         * reads/writes nor with any unscheduled system between them, so no
         * pair of conflicting systems is ever reordered.
         */
        void BuildExecutionPlan()
        {
            m_executionPlan.clear();

            std::vector<std::size_t> active;
            active.reserve(m_systems.size());
            for (std::size_t i = 0; i < m_systems.size(); ++i)
            {
                if (m_systems[i].enabled)
                    active.push_back(i);
            }

            if (m_mode == ExecutionMode::Sequential)
            {
                for (std::size_t index : active)
                    m_executionPlan.push_back({index});
                m_needsRebuild = false;
                return;
            }

            std::vector<bool> scheduled(active.size(), false);
            for (std::size_t a = 0; a < active.size(); ++a)
            {
                if (scheduled[a])
                    continue;

                std::vector<std::size_t> group;
                group.push_back(active[a]);
                scheduled[a] = true;

                const auto& first = m_systems[active[a]].metadata;
                ComponentMask groupReads = first.reads;
                ComponentMask groupWrites = first.writes;

                // A system with no declared access never shares its group
                const bool groupAcceptsMore = !first.TouchesEverything();

                for (std::size_t b = a + 1; b < active.size() && groupAcceptsMore; ++b)
                {
                    if (scheduled[b])
                        continue;

                    const auto& candidate = m_systems[active[b]].metadata;
                    const bool conflictsWithGroup = candidate.TouchesEverything() ||
                        (candidate.writes & groupWrites).Any() ||
                        (candidate.writes & groupReads).Any() ||
                        (candidate.reads & groupWrites).Any();

                    if (conflictsWithGroup)
                        continue;

                    bool dependsOnEarlier = false;
                    for (std::size_t k = a + 1; k < b; ++k)
                    {
                        if (!scheduled[k] && HasConflict(active[k], active[b]))
                        {
                            dependsOnEarlier = true;
                            break;
                        }
                    }

                    if (!dependsOnEarlier)
                    {
                        group.push_back(active[b]);
                        scheduled[b] = true;
                        groupReads |= candidate.reads;
                        groupWrites |= candidate.writes;
                    }
                }

                m_executionPlan.push_back(std::move(group));
            }

            m_needsRebuild = false;
        }

        STRATA_NODISCARD bool HasConflict(std::size_t a, std::size_t b) const noexcept
        {
            return m_systems[a].metadata.ConflictsWith(m_systems[b].metadata);
        }

        std::vector<SystemEntry> m_systems;
        std::unordered_map<std::string, SystemId> m_byName;
        std::vector<double> m_durations;
        std::vector<std::vector<std::size_t>> m_executionPlan;
        bool m_needsRebuild = true;

        ExecutionMode m_mode;
        std::size_t m_workerCount;
        std::unique_ptr<WorkerPool> m_pool;
    };
}
