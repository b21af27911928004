#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <type_traits>

#include "Base.hpp"

namespace Strata
{
    namespace Detail
    {
        // 64-bit FNV-1a, evaluated at compile time over the type name
        inline constexpr std::uint64_t FNV_OFFSET_BASIS = 0xCBF29CE484222325ULL;
        inline constexpr std::uint64_t FNV_PRIME = 0x00000100000001B3ULL;

        constexpr std::uint64_t HashString(std::string_view str, std::uint64_t seed = FNV_OFFSET_BASIS) noexcept
        {
            std::uint64_t hash = seed;
            for (char c : str)
            {
                hash ^= static_cast<std::uint8_t>(c);
                hash *= FNV_PRIME;
            }
            return hash;
        }

        template<typename T>
        constexpr std::string_view TypeNameInternal() noexcept
        {
            #if defined(STRATA_COMPILER_MSVC)
                constexpr std::string_view funcName = __FUNCSIG__;
                constexpr std::string_view prefix = "TypeNameInternal<";
                constexpr std::string_view suffix = ">(void)";
            #elif defined(STRATA_COMPILER_CLANG)
                constexpr std::string_view funcName = __PRETTY_FUNCTION__;
                constexpr std::string_view prefix = "TypeNameInternal() [T = ";
                constexpr std::string_view suffix = "]";
            #elif defined(STRATA_COMPILER_GCC)
                constexpr std::string_view funcName = __PRETTY_FUNCTION__;
                constexpr std::string_view prefix = "TypeNameInternal() [with T = ";
                constexpr std::string_view suffix = "]";
            #else
                #error "Unsupported compiler for compile-time type name extraction"
            #endif

            std::size_t start = funcName.find(prefix);
            if (start == std::string_view::npos)
                return "Unknown";
            start += prefix.length();

            std::size_t end = funcName.rfind(suffix);
            if (end == std::string_view::npos || end <= start)
                return "Unknown";

            std::string_view typeName = funcName.substr(start, end - start);

            #if defined(STRATA_COMPILER_MSVC)
                if (typeName.starts_with("class "))
                    typeName.remove_prefix(6);
                else if (typeName.starts_with("struct "))
                    typeName.remove_prefix(7);
            #endif

            return typeName;
        }
    }

    /**
     * @brief Compile-time identity of a type
     *
     * Name() and Hash() are stable across runs and translation units. Dense
     * per-world ids are handed out by ComponentRegistry, keyed by Hash().
     */
    template<typename T>
    struct TypeID
    {
        using Type = std::remove_cvref_t<T>;

        STRATA_NODISCARD static constexpr std::string_view Name() noexcept
        {
            return Detail::TypeNameInternal<Type>();
        }

        STRATA_NODISCARD static constexpr std::uint64_t Hash() noexcept
        {
            return Detail::HashString(Name());
        }
    };
}
