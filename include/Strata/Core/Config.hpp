#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>

#include "Base.hpp"

#define STRATA_VERSION_MAJOR 0
#define STRATA_VERSION_MINOR 1
#define STRATA_VERSION_PATCH 0

#define STRATA_VERSION ((STRATA_VERSION_MAJOR << 16) | (STRATA_VERSION_MINOR << 8) | STRATA_VERSION_PATCH)

namespace Strata
{
    namespace config
    {
        inline constexpr std::size_t DEFAULT_ALIGNMENT = alignof(std::max_align_t);

        // Guard band written on each side of a debug allocation
        inline constexpr std::size_t GUARD_SIZE = 16;
        inline constexpr std::uint8_t GUARD_PATTERN = 0xCA;

        // Written over released debug allocations
        inline constexpr std::uint8_t POISON_PATTERN = 0xDD;

        inline constexpr std::size_t DEFAULT_ARENA_CAPACITY = 16 * 1024 * 1024;

        inline constexpr std::size_t INITIAL_STORAGE_CAPACITY = 64;

        inline constexpr std::size_t STORAGE_GROWTH_FACTOR = 2;

        inline constexpr std::uint32_t FREELIST_MAGIC = 0x5354524Bu;

        inline constexpr bool ENABLE_ASSERTS =
#ifdef STRATA_BUILD_DEBUG
            true;
#else
            false;
#endif
    }

    template<typename T>
    inline constexpr bool IsPowerOfTwo(T value) noexcept
    {
        return value && !(value & (value - 1));
    }

    template<typename T>
    inline constexpr T AlignUp(T value, T alignment) noexcept
    {
        return (value + alignment - 1) & ~(alignment - 1);
    }

    // False when AlignUp(value, alignment) would wrap around
    template<typename T>
    inline constexpr bool CanAlignUp(T value, T alignment) noexcept
    {
        return value <= std::numeric_limits<T>::max() - (alignment - 1);
    }

    inline std::uintptr_t AlignUpAddress(std::uintptr_t address, std::size_t alignment) noexcept
    {
        return AlignUp<std::uintptr_t>(address, static_cast<std::uintptr_t>(alignment));
    }
}
