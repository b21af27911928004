#pragma once

#include <cstddef>

#include "SystemMetadata.hpp"
#include "WorkerPool.hpp"

namespace Strata
{
    /**
     * @brief Strategy for running an execution plan
     *
     * The scheduler builds the plan; an executor only decides how the
     * systems of one group are dispatched. Implement this to hand groups to
     * an external job system.
     *
     * @code
     * class JobSystemExecutor : public ISystemExecutor {
     * public:
     *     void Execute(const SystemExecutionContext& context) override {
     *         for (const auto& group : context.parallelGroups) {
     *             jobs.ParallelFor(group.size(), [&](std::size_t i) { context.Run(group[i]); });
     *             jobs.Wait();
     *         }
     *     }
     * };
     * @endcode
     */
    class ISystemExecutor
    {
    public:
        virtual ~ISystemExecutor() = default;

        /**
         * Runs every group of the context in order. Systems inside a group
         * may run concurrently; every system of a group must have finished
         * before the next group starts.
         */
        virtual void Execute(const SystemExecutionContext& context) = 0;
    };

    // Runs everything on the calling thread in plan order
    class SequentialExecutor : public ISystemExecutor
    {
    public:
        void Execute(const SystemExecutionContext& context) override
        {
            for (const auto& group : context.parallelGroups)
            {
                for (std::size_t systemIdx : group)
                {
                    context.Run(systemIdx);
                }
            }
        }
    };

    /**
     * @brief Runs each group on a WorkerPool with a barrier after it
     *
     * One-system groups run directly on the calling thread.
     */
    class ParallelExecutor : public ISystemExecutor
    {
    public:
        explicit ParallelExecutor(WorkerPool& pool) noexcept : m_pool(&pool) {}

        void Execute(const SystemExecutionContext& context) override
        {
            for (const auto& group : context.parallelGroups)
            {
                if (group.size() == 1)
                {
                    context.Run(group[0]);
                    continue;
                }

                m_pool->RunBatch(group.size(), [&context, &group](std::size_t i) {
                    context.Run(group[i]);
                });
            }
        }

    private:
        WorkerPool* m_pool;
    };
}
