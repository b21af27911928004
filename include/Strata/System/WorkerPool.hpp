#pragma once

#include <algorithm>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

#include "../Core/Base.hpp"
#include "../Core/Logger.hpp"
#include "../Core/Profile.hpp"

namespace Strata
{
    /**
     * @brief Fixed set of worker threads fed from one task queue
     *
     * Workers sleep on a condition variable until work arrives or the pool
     * stops. RunBatch() is the only way work is submitted: it queues one
     * task per item and blocks until all of them have finished, which gives
     * the scheduler its join barrier after every parallel group.
     */
    class WorkerPool
    {
    public:
        // Zero picks one worker per hardware thread, minus the calling thread
        explicit WorkerPool(std::size_t workerCount = 0)
        {
            if (workerCount == 0)
            {
                const unsigned hardware = std::thread::hardware_concurrency();
                workerCount = hardware > 1 ? hardware - 1 : 1;
            }

            m_workers.reserve(workerCount);
            for (std::size_t i = 0; i < workerCount; ++i)
                m_workers.emplace_back([this] { WorkerLoop(); });

            STRATA_LOG_DEBUG("Scheduler", "Worker pool started with %zu threads", workerCount);
        }

        WorkerPool(const WorkerPool&) = delete;
        WorkerPool& operator=(const WorkerPool&) = delete;

        ~WorkerPool()
        {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_stopping = true;
            }
            m_condition.notify_all();

            for (std::thread& worker : m_workers)
            {
                if (worker.joinable())
                    worker.join();
            }
        }

        /**
         * Runs fn(0) .. fn(count - 1) on the workers and waits for all of them.
         * Must not be called from inside a worker task.
         */
        void RunBatch(std::size_t count, const std::function<void(std::size_t)>& fn)
        {
            if (count == 0)
                return;

            std::size_t remaining = count;
            std::mutex doneMutex;
            std::condition_variable doneCondition;

            {
                std::lock_guard<std::mutex> lock(m_mutex);
                for (std::size_t i = 0; i < count; ++i)
                {
                    m_tasks.emplace_back([&, i] {
                        fn(i);
                        std::lock_guard<std::mutex> doneLock(doneMutex);
                        if (--remaining == 0)
                            doneCondition.notify_one();
                    });
                }
            }
            m_condition.notify_all();

            STRATA_PROFILE_ZONE_NAMED_COLOR("WorkerPool::Wait", Profile::ColorWait);
            std::unique_lock<std::mutex> doneLock(doneMutex);
            doneCondition.wait(doneLock, [&] { return remaining == 0; });
        }

        STRATA_NODISCARD std::size_t WorkerCount() const noexcept { return m_workers.size(); }

    private:
        void WorkerLoop()
        {
            for (;;)
            {
                std::function<void()> task;
                {
                    std::unique_lock<std::mutex> lock(m_mutex);
                    m_condition.wait(lock, [this] { return m_stopping || !m_tasks.empty(); });
                    if (m_stopping && m_tasks.empty())
                        return;

                    task = std::move(m_tasks.front());
                    m_tasks.pop_front();
                }
                task();
            }
        }

        std::vector<std::thread> m_workers;
        std::deque<std::function<void()>> m_tasks;
        std::mutex m_mutex;
        std::condition_variable m_condition;
        bool m_stopping = false;
    };
}
