#pragma once

#include <cstddef>

#include "Platform.hpp"

// Base macros and definitions that depend on platform detection
// This is the top-level header that provides all core macros

#ifdef __has_builtin
    #define STRATA_HAS_BUILTIN(x) __has_builtin(x)
#else
    #define STRATA_HAS_BUILTIN(x) 0
#endif

#define STRATA_NODISCARD [[nodiscard]]
#define STRATA_MAYBE_UNUSED [[maybe_unused]]
#define STRATA_FALLTHROUGH [[fallthrough]]
#define STRATA_LIKELY [[likely]]
#define STRATA_UNLIKELY [[unlikely]]

#if defined(STRATA_COMPILER_MSVC)
    #define STRATA_FORCEINLINE __forceinline
    #define STRATA_NOINLINE __declspec(noinline)
    #define STRATA_UNREACHABLE() __assume(0)
#else
    #define STRATA_FORCEINLINE inline __attribute__((always_inline))
    #define STRATA_NOINLINE __attribute__((noinline))
    #if STRATA_HAS_BUILTIN(__builtin_unreachable)
        #define STRATA_UNREACHABLE() __builtin_unreachable()
    #else
        #define STRATA_UNREACHABLE() ((void)0)
    #endif
#endif

namespace Strata
{
    inline constexpr std::size_t CACHE_LINE_SIZE = 64;
}

// Cache line alignment for avoiding false sharing
#define STRATA_CACHE_ALIGNED alignas(::Strata::CACHE_LINE_SIZE)

#define STRATA_UNUSED(x) ((void)(x))

// Runtime assertion macro
// Debug builds only; never a replacement for a returned error
#ifdef STRATA_BUILD_DEBUG
    #include <cassert>
    #define STRATA_ASSERT(condition, message) assert((condition) && (message))
#else
    #define STRATA_ASSERT(condition, message) ((void)0)
#endif
