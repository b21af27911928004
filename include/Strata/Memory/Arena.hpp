#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>

#include "../Core/Base.hpp"
#include "../Core/Config.hpp"
#include "../Core/Memory.hpp"
#include "../Core/Result.hpp"

namespace Strata
{
    enum class ArenaKind : std::uint8_t
    {
        Linear,
        Stack,
        Pool,
        FreeList,
        DoubleEndedStack
    };

    inline const char* ToString(ArenaKind kind) noexcept
    {
        switch (kind)
        {
            case ArenaKind::Linear: return "Linear";
            case ArenaKind::Stack: return "Stack";
            case ArenaKind::Pool: return "Pool";
            case ArenaKind::FreeList: return "FreeList";
            case ArenaKind::DoubleEndedStack: return "DoubleEndedStack";
        }
        return "Unknown";
    }

    struct MemoryBlock
    {
        void* ptr = nullptr;
        std::size_t size = 0;

        STRATA_NODISCARD explicit operator bool() const noexcept { return ptr != nullptr; }
        STRATA_NODISCARD bool operator==(const MemoryBlock& other) const noexcept = default;
    };

    struct ArenaStats
    {
        // Bytes consumed, headers and padding included
        std::size_t used = 0;
        std::size_t capacity = 0;
        std::size_t liveAllocations = 0;
        std::size_t peakUsed = 0;
        // Successful allocations since creation
        std::size_t allocationCount = 0;
        std::size_t failedAllocations = 0;
    };

    struct ArenaDesc
    {
        ArenaKind kind = ArenaKind::FreeList;
        std::size_t capacity = config::DEFAULT_ARENA_CAPACITY;
        std::size_t alignment = config::DEFAULT_ALIGNMENT;
        // Pool only
        std::size_t slotSize = 0;
    };

    // Stack arena rollback point
    struct Marker
    {
        std::size_t offset = 0;
        std::size_t top = 0;
        std::size_t liveAllocations = 0;
        // Sequence of the allocation at top, 0 when the stack was empty
        std::uint64_t sequence = 0;
    };

    /**
     * @brief Common interface of every arena kind
     *
     * Arenas own a single backing block of fixed capacity and hand out
     * sub-ranges of it. They are not thread-safe.
     */
    class IArena
    {
    public:
        virtual ~IArena() = default;

        STRATA_NODISCARD virtual Result<MemoryBlock> Allocate(std::size_t size, std::size_t alignment = config::DEFAULT_ALIGNMENT) = 0;
        STRATA_NODISCARD virtual Result<void> Free(MemoryBlock block) = 0;

        // Releases every allocation at once
        STRATA_NODISCARD virtual Result<void> Reset() = 0;

        // Stack kinds only; other kinds fail with InvalidState
        STRATA_NODISCARD virtual Result<Marker> Mark() const
        {
            return Err(ErrorCode::InvalidState, "Arena kind does not support markers");
        }

        STRATA_NODISCARD virtual Result<void> ResetTo(const Marker& marker)
        {
            STRATA_UNUSED(marker);
            return Err(ErrorCode::InvalidState, "Arena kind does not support markers");
        }

        // Resizes block in place, updating block.size on success
        virtual bool TryGrow(MemoryBlock& block, std::size_t newSize)
        {
            STRATA_UNUSED(block);
            STRATA_UNUSED(newSize);
            return false;
        }

        STRATA_NODISCARD virtual ArenaStats GetStats() const noexcept = 0;
        STRATA_NODISCARD virtual ArenaKind Kind() const noexcept = 0;
        STRATA_NODISCARD virtual bool Owns(const void* ptr) const noexcept = 0;
        STRATA_NODISCARD virtual std::byte* Data() const noexcept = 0;
        STRATA_NODISCARD virtual std::size_t Capacity() const noexcept = 0;
        STRATA_NODISCARD virtual std::size_t Alignment() const noexcept = 0;
    };

    namespace Detail
    {
        inline Result<void> ValidateRequest(std::size_t size, std::size_t alignment) noexcept
        {
            if (size == 0)
                return Err(ErrorCode::InvalidArgument, "Zero-sized allocation");
            if (!IsPowerOfTwo(alignment))
                return Err(ErrorCode::InvalidArgument, "Alignment must be a power of two");
            return OK;
        }

        inline Result<void> ValidateDesc(const ArenaDesc& desc) noexcept
        {
            if (!IsPowerOfTwo(desc.alignment))
                return Err(ErrorCode::InvalidArgument, "Arena alignment must be a power of two");
            if (desc.capacity == 0 || !CanAlignUp(desc.capacity, desc.alignment))
                return Err(ErrorCode::InvalidCapacity);
            return OK;
        }
    }

    /**
     * @brief Backing block ownership and stats bookkeeping shared by the arena kinds
     */
    class ArenaBase : public IArena
    {
    public:
        STRATA_NODISCARD ArenaStats GetStats() const noexcept override { return m_stats; }
        STRATA_NODISCARD bool Owns(const void* ptr) const noexcept override
        {
            const auto* p = static_cast<const std::byte*>(ptr);
            return p >= m_data.get() && p < m_data.get() + m_capacity;
        }
        STRATA_NODISCARD std::byte* Data() const noexcept override { return m_data.get(); }
        STRATA_NODISCARD std::size_t Capacity() const noexcept override { return m_capacity; }
        STRATA_NODISCARD std::size_t Alignment() const noexcept override { return m_alignment; }

    protected:
        ArenaBase(MemoryPtr data, std::size_t capacity, std::size_t alignment) noexcept
            : m_data(std::move(data)), m_capacity(capacity), m_alignment(alignment)
        {
            m_stats.capacity = capacity;
        }

        // Backing memory starts zeroed
        static Result<MemoryPtr> AllocateBacking(std::size_t capacity, std::size_t alignment) noexcept
        {
            AllocResult backing = AllocateMemory(capacity, std::max(alignment, CACHE_LINE_SIZE), AllocFlags::ZeroMem);
            if (!backing.ptr)
                return Err(ErrorCode::OutOfMemory, "System allocation for arena backing failed");
            return MemoryPtr(static_cast<std::byte*>(backing.ptr));
        }

        STRATA_NODISCARD std::size_t OffsetOf(const void* ptr) const noexcept
        {
            return static_cast<std::size_t>(static_cast<const std::byte*>(ptr) - m_data.get());
        }

        void RecordAllocation(std::size_t usedAfter) noexcept
        {
            ++m_stats.liveAllocations;
            ++m_stats.allocationCount;
            SetUsed(usedAfter);
        }

        void RecordRelease(std::size_t usedAfter) noexcept
        {
            STRATA_ASSERT(m_stats.liveAllocations > 0, "Release without a live allocation");
            --m_stats.liveAllocations;
            SetUsed(usedAfter);
        }

        ErrorValue<Error> FailAllocation(ErrorCode code, const char* message = nullptr) noexcept
        {
            ++m_stats.failedAllocations;
            return Err(code, message);
        }

        void SetUsed(std::size_t used) noexcept
        {
            m_stats.used = used;
            m_stats.peakUsed = std::max(m_stats.peakUsed, used);
        }

        MemoryPtr m_data;
        std::size_t m_capacity;
        std::size_t m_alignment;
        ArenaStats m_stats;
    };
}
