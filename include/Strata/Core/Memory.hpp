#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <memory>

#include "Base.hpp"
#include "Config.hpp"

#ifdef STRATA_PLATFORM_WINDOWS
    #include <malloc.h>
#endif

namespace Strata
{
    enum class AllocFlags : std::uint32_t
    {
        None = 0,
        ZeroMem = 1 << 0
    };

    STRATA_FORCEINLINE constexpr AllocFlags operator|(AllocFlags a, AllocFlags b) noexcept
    {
        return static_cast<AllocFlags>(static_cast<std::uint32_t>(a) | static_cast<std::uint32_t>(b));
    }

    STRATA_FORCEINLINE constexpr bool operator&(AllocFlags a, AllocFlags b) noexcept
    {
        return (static_cast<std::uint32_t>(a) & static_cast<std::uint32_t>(b)) != 0;
    }

    struct AllocResult
    {
        void* ptr = nullptr;
        std::size_t size = 0;
    };

    /**
     * Allocate an aligned block from the system heap. Backs every arena.
     * Returns a null pointer on failure.
     */
    inline AllocResult AllocateMemory(std::size_t size, std::size_t alignment = CACHE_LINE_SIZE, AllocFlags flags = AllocFlags::None) noexcept
    {
        AllocResult result;
        if (size == 0 || !IsPowerOfTwo(alignment) || !CanAlignUp(size, alignment))
            return result;

        if (alignment < sizeof(void*))
            alignment = sizeof(void*);

        // aligned allocation requires a size that is a multiple of the alignment
        size = AlignUp(size, alignment);

        void* ptr = nullptr;
#ifdef STRATA_PLATFORM_WINDOWS
        ptr = _aligned_malloc(size, alignment);
#else
        if (posix_memalign(&ptr, alignment, size) != 0)
            ptr = nullptr;
#endif
        if (ptr == nullptr)
            return result;

        if (flags & AllocFlags::ZeroMem)
            std::memset(ptr, 0, size);

        result.ptr = ptr;
        result.size = size;
        return result;
    }

    inline void FreeMemory(void* ptr) noexcept
    {
        if (!ptr) return;

#ifdef STRATA_PLATFORM_WINDOWS
        _aligned_free(ptr);
#else
        std::free(ptr);
#endif
    }

    struct MemoryDeleter
    {
        void operator()(std::byte* ptr) const noexcept
        {
            FreeMemory(ptr);
        }
    };

    // Owning handle over an AllocateMemory block
    using MemoryPtr = std::unique_ptr<std::byte, MemoryDeleter>;
}
