#pragma once

#include <cstdint>
#include <memory>

#include "Arena.hpp"

namespace Strata
{
    /**
     * @brief Bump allocator with strict LIFO release and marker rollback
     *
     * Every allocation is preceded by a StackHeader recording the arena top
     * before it was made, so freeing the newest block pops it in O(1).
     * Markers remember the sequence number of the top allocation and are
     * refused once that allocation has been popped.
     */
    class StackArena final : public ArenaBase
    {
    public:
        struct StackHeader
        {
            std::size_t prevOffset;
            // User offset of the allocation below this one, NO_TOP when none
            std::size_t prevTop;
            // Never reused, lets markers detect a recycled top
            std::uint64_t sequence;
        };

        static constexpr std::size_t NO_TOP = static_cast<std::size_t>(-1);

        static Result<std::unique_ptr<StackArena>> Create(std::size_t capacity, std::size_t alignment = config::DEFAULT_ALIGNMENT)
        {
            auto valid = Detail::ValidateDesc(ArenaDesc{ArenaKind::Stack, capacity, alignment, 0});
            if (!valid) return Err(valid.Error());
            if (capacity <= sizeof(StackHeader))
                return Err(ErrorCode::InvalidCapacity, "Stack arena cannot hold a single header");

            auto backing = AllocateBacking(capacity, alignment);
            if (!backing) return Err(backing.Error());

            return std::unique_ptr<StackArena>(new StackArena(std::move(backing).Value(), capacity, alignment));
        }

        STRATA_NODISCARD Result<MemoryBlock> Allocate(std::size_t size, std::size_t alignment = config::DEFAULT_ALIGNMENT) override
        {
            auto valid = Detail::ValidateRequest(size, alignment);
            if (!valid) return FailAllocation(valid.Error().code, valid.Error().message);

            const std::size_t effective = std::max(alignment, alignof(StackHeader));
            const auto base = reinterpret_cast<std::uintptr_t>(m_data.get());
            const std::size_t start = AlignUpAddress(base + m_offset + sizeof(StackHeader), effective) - base;
            if (start > m_capacity || size > m_capacity - start)
                return FailAllocation(ErrorCode::OutOfMemory);

            auto* header = reinterpret_cast<StackHeader*>(m_data.get() + start - sizeof(StackHeader));
            header->prevOffset = m_offset;
            header->prevTop = m_top;
            header->sequence = ++m_sequence;

            m_top = start;
            m_offset = start + size;
            RecordAllocation(m_offset);
            return MemoryBlock{m_data.get() + start, size};
        }

        STRATA_NODISCARD Result<void> Free(MemoryBlock block) override
        {
            const auto address = reinterpret_cast<std::uintptr_t>(block.ptr);
            if (!block.ptr || !Owns(block.ptr) || OffsetOf(block.ptr) >= m_offset)
                return Err(ErrorCode::InvalidRelease, "Block not live in this arena", address);
            if (OffsetOf(block.ptr) != m_top)
                return Err(ErrorCode::InvalidRelease, "Stack arena frees must be LIFO", address);

            const StackHeader* header = HeaderAt(m_top);
            m_offset = header->prevOffset;
            m_top = header->prevTop;
            RecordRelease(m_offset);
            return OK;
        }

        STRATA_NODISCARD Result<void> Reset() override
        {
            m_offset = 0;
            m_top = NO_TOP;
            m_stats.liveAllocations = 0;
            SetUsed(0);
            return OK;
        }

        STRATA_NODISCARD Result<Marker> Mark() const override
        {
            const std::uint64_t sequence = m_top == NO_TOP ? 0 : HeaderAt(m_top)->sequence;
            return Marker{m_offset, m_top, m_stats.liveAllocations, sequence};
        }

        STRATA_NODISCARD Result<void> ResetTo(const Marker& marker) override
        {
            if (marker.offset > m_offset || marker.liveAllocations > m_stats.liveAllocations)
                return Err(ErrorCode::InvalidRelease, "Marker is ahead of the stack top");
            if (!IsCurrent(marker))
                return Err(ErrorCode::InvalidRelease, "Marker top is no longer live");

            m_offset = marker.offset;
            m_top = marker.top;
            m_stats.liveAllocations = marker.liveAllocations;
            SetUsed(m_offset);
            return OK;
        }

        bool TryGrow(MemoryBlock& block, std::size_t newSize) override
        {
            if (!block.ptr || newSize == 0 || !Owns(block.ptr))
                return false;

            const std::size_t start = OffsetOf(block.ptr);
            if (start != m_top || start + block.size != m_offset)
                return false;
            if (newSize > m_capacity - start)
                return false;

            m_offset = start + newSize;
            block.size = newSize;
            SetUsed(m_offset);
            return true;
        }

        STRATA_NODISCARD ArenaKind Kind() const noexcept override { return ArenaKind::Stack; }

        STRATA_NODISCARD std::size_t Offset() const noexcept { return m_offset; }

    private:
        StackArena(MemoryPtr data, std::size_t capacity, std::size_t alignment) noexcept
            : ArenaBase(std::move(data), capacity, alignment)
        {}

        StackHeader* HeaderAt(std::size_t top) const noexcept
        {
            return reinterpret_cast<StackHeader*>(m_data.get() + top - sizeof(StackHeader));
        }

        // The allocation the marker was taken on top of is still on the stack
        bool IsCurrent(const Marker& marker) const noexcept
        {
            if (marker.top == NO_TOP)
                return marker.offset == 0 && marker.liveAllocations == 0;
            if (marker.top < sizeof(StackHeader) || marker.top >= marker.offset || marker.sequence == 0)
                return false;
            return HeaderAt(marker.top)->sequence == marker.sequence;
        }

        std::size_t m_offset = 0;
        std::size_t m_top = NO_TOP;
        std::uint64_t m_sequence = 0;
    };
}
