#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <string>
#include <vector>

#include "../Component/Component.hpp"
#include "../Core/Base.hpp"

namespace Strata
{
    class World;

    using SystemId = std::uint32_t;

    inline constexpr SystemId INVALID_SYSTEM = std::numeric_limits<SystemId>::max();

    // Per-tick update callback, receiving the world and the tick delta in seconds
    using SystemCallback = std::function<void(World&, float)>;

    enum class ExecutionMode : std::uint8_t
    {
        Sequential,
        Parallel
    };

    /**
     * @brief Everything needed to register a system
     *
     * reads and writes declare the component types the callback touches.
     * Leaving both empty means the system may touch anything and it is
     * always scheduled alone. Systems that name the same non-empty group must
     * be free of conflicts with each other; registration checks this.
     */
    struct SystemDesc
    {
        std::string name;
        ComponentMask reads;
        ComponentMask writes;
        SystemCallback callback;
        std::string group;
    };

    /**
     * @brief Component access pattern of a registered system
     *
     * Used for:
     * - Finding systems that may run concurrently
     * - Rejecting conflicting members of a named group
     * - Debugging and profiling
     */
    struct SystemMetadata
    {
        ComponentMask reads;
        ComponentMask writes;

        // Registration order, also the system's id
        std::size_t insertionOrder = 0;

        STRATA_NODISCARD bool TouchesEverything() const noexcept
        {
            return reads.None() && writes.None();
        }

        // Write/write or read/write overlap, or either side undeclared
        STRATA_NODISCARD bool ConflictsWith(const SystemMetadata& other) const noexcept
        {
            if (TouchesEverything() || other.TouchesEverything())
                return true;

            return (writes & other.writes).Any() ||
                   (reads & other.writes).Any() ||
                   (writes & other.reads).Any();
        }
    };

    /**
     * @brief Execution context handed to a system executor
     *
     * parallelGroups is ordered: the groups run one after another, and the
     * systems inside one group may run concurrently. For example
     * [[0], [1, 2], [3]] runs 0, then 1 and 2 together, then 3.
     */
    struct SystemExecutionContext
    {
        std::vector<std::vector<std::size_t>> parallelGroups;

        // Indexed by system id, matching parallelGroups entries
        std::vector<const SystemCallback*> systems;
        std::vector<SystemMetadata> metadata;

        // Last run time of each system in milliseconds, written by Run()
        std::vector<double>* durations = nullptr;

        World* world = nullptr;
        float deltaTime = 0.0f;

        // Runs one system and records its duration
        void Run(std::size_t index) const
        {
            const auto start = std::chrono::steady_clock::now();
            (*systems[index])(*world, deltaTime);
            const auto elapsed = std::chrono::steady_clock::now() - start;

            if (durations)
                (*durations)[index] = std::chrono::duration<double, std::milli>(elapsed).count();
        }
    };
}
