#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <type_traits>

#include "../Container/Bitmap.hpp"

namespace Strata
{
    using ComponentID = std::uint16_t;

    inline constexpr ComponentID INVALID_COMPONENT = std::numeric_limits<ComponentID>::max();

    // Allow users to override the maximum number of component types per world
    // Usage: #define STRATA_MAX_COMPONENTS 128 before including Strata
    #ifndef STRATA_MAX_COMPONENTS
        #define STRATA_MAX_COMPONENTS 64u
    #endif

    constexpr std::size_t MAX_COMPONENTS = STRATA_MAX_COMPONENTS;

    static_assert(MAX_COMPONENTS < INVALID_COMPONENT, "STRATA_MAX_COMPONENTS exceeds the ComponentID range");

    // One bit per registered component type
    using ComponentMask = Bitmap<MAX_COMPONENTS>;

    template<typename T>
    concept Component = std::is_object_v<T> &&
                        !std::is_const_v<T> &&
                        std::is_nothrow_destructible_v<T> &&
                        std::is_move_constructible_v<T> &&
                        std::is_move_assignable_v<T>;

    // Type-erased facts about a registered component type
    struct ComponentDescriptor
    {
        ComponentID id = INVALID_COMPONENT;
        std::size_t size = 0;
        std::size_t alignment = 0;
        std::uint64_t hash = 0;
        bool isTriviallyCopyable = false;
        bool isEmpty = false;
    };
}
