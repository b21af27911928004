#pragma once

#include <cstdint>
#include <memory>

#include "Arena.hpp"

namespace Strata
{
    enum class StackEnd : std::uint8_t
    {
        Front,
        Back
    };

    /**
     * @brief Two LIFO stacks growing towards each other in one block
     *
     * The front end bumps upward from the start of the block, the back end
     * downward from its end, and an allocation fails once the two would
     * overlap. Each end keeps its own LIFO order and its own markers.
     * Free() accepts the top block of either end.
     *
     * The IArena face (Allocate, Mark, ResetTo, TryGrow) works on the front
     * end, so the arena behaves like a StackArena wherever a plain arena is
     * expected.
     *
     * @code
     * auto level = arena->AllocateBack(levelSize);   // lives until unload
     * ArenaScope frame(*arena);                      // per-frame scratch
     * auto scratch = frame.Allocate(1024);
     * @endcode
     */
    class DoubleEndedStackArena final : public ArenaBase
    {
    public:
        struct StackHeader
        {
            // Front: end offset before the block; back: start offset before it
            std::size_t prevBoundary;
            // User offset of the block below this one on the same end, NO_TOP when none
            std::size_t prevTop;
            std::uint64_t sequence;
        };

        static constexpr std::size_t NO_TOP = static_cast<std::size_t>(-1);

        static Result<std::unique_ptr<DoubleEndedStackArena>> Create(std::size_t capacity, std::size_t alignment = config::DEFAULT_ALIGNMENT)
        {
            auto valid = Detail::ValidateDesc(ArenaDesc{ArenaKind::DoubleEndedStack, capacity, alignment, 0});
            if (!valid) return Err(valid.Error());
            if (capacity <= sizeof(StackHeader))
                return Err(ErrorCode::InvalidCapacity, "Double-ended stack arena cannot hold a single header");

            auto backing = AllocateBacking(capacity, alignment);
            if (!backing) return Err(backing.Error());

            return std::unique_ptr<DoubleEndedStackArena>(new DoubleEndedStackArena(std::move(backing).Value(), capacity, alignment));
        }

        STRATA_NODISCARD Result<MemoryBlock> Allocate(std::size_t size, std::size_t alignment = config::DEFAULT_ALIGNMENT) override
        {
            return AllocateFront(size, alignment);
        }

        STRATA_NODISCARD Result<MemoryBlock> AllocateFront(std::size_t size, std::size_t alignment = config::DEFAULT_ALIGNMENT)
        {
            auto valid = Detail::ValidateRequest(size, alignment);
            if (!valid) return FailAllocation(valid.Error().code, valid.Error().message);

            const std::size_t effective = std::max(alignment, alignof(StackHeader));
            const auto base = reinterpret_cast<std::uintptr_t>(m_data.get());
            const std::size_t start = AlignUpAddress(base + m_front + sizeof(StackHeader), effective) - base;
            if (start > m_back || size > m_back - start)
                return FailAllocation(ErrorCode::OutOfMemory);

            StackHeader* header = HeaderAt(start);
            header->prevBoundary = m_front;
            header->prevTop = m_frontTop;
            header->sequence = ++m_sequence;

            m_frontTop = start;
            m_front = start + size;
            ++m_frontLive;
            RecordAllocation(Used());
            return MemoryBlock{m_data.get() + start, size};
        }

        STRATA_NODISCARD Result<MemoryBlock> AllocateBack(std::size_t size, std::size_t alignment = config::DEFAULT_ALIGNMENT)
        {
            auto valid = Detail::ValidateRequest(size, alignment);
            if (!valid) return FailAllocation(valid.Error().code, valid.Error().message);

            const std::size_t effective = std::max(alignment, alignof(StackHeader));
            const auto base = reinterpret_cast<std::uintptr_t>(m_data.get());
            if (size > m_back)
                return FailAllocation(ErrorCode::OutOfMemory);

            // Round the user start down so the block ends at or below the back boundary
            const std::uintptr_t userAddress = (base + m_back - size) & ~(static_cast<std::uintptr_t>(effective) - 1);
            if (userAddress < base + m_front + sizeof(StackHeader))
                return FailAllocation(ErrorCode::OutOfMemory);

            const std::size_t start = userAddress - base;
            StackHeader* header = HeaderAt(start);
            header->prevBoundary = m_back;
            header->prevTop = m_backTop;
            header->sequence = ++m_sequence;

            m_backTop = start;
            m_back = start - sizeof(StackHeader);
            ++m_backLive;
            RecordAllocation(Used());
            return MemoryBlock{m_data.get() + start, size};
        }

        // Releases the top block of whichever end it belongs to
        STRATA_NODISCARD Result<void> Free(MemoryBlock block) override
        {
            const auto address = reinterpret_cast<std::uintptr_t>(block.ptr);
            if (!block.ptr || !Owns(block.ptr))
                return Err(ErrorCode::InvalidRelease, "Block not live in this arena", address);

            const std::size_t offset = OffsetOf(block.ptr);
            if (m_frontTop != NO_TOP && offset == m_frontTop)
            {
                const StackHeader* header = HeaderAt(m_frontTop);
                m_front = header->prevBoundary;
                m_frontTop = header->prevTop;
                --m_frontLive;
                RecordRelease(Used());
                return OK;
            }
            if (m_backTop != NO_TOP && offset == m_backTop)
            {
                const StackHeader* header = HeaderAt(m_backTop);
                m_back = header->prevBoundary;
                m_backTop = header->prevTop;
                --m_backLive;
                RecordRelease(Used());
                return OK;
            }

            if (offset < m_front || offset > m_back)
                return Err(ErrorCode::InvalidRelease, "Double-ended stack frees must be LIFO per end", address);
            return Err(ErrorCode::InvalidRelease, "Block not live in this arena", address);
        }

        STRATA_NODISCARD Result<void> Reset() override
        {
            m_front = 0;
            m_back = m_capacity;
            m_frontTop = NO_TOP;
            m_backTop = NO_TOP;
            m_frontLive = 0;
            m_backLive = 0;
            m_stats.liveAllocations = 0;
            SetUsed(0);
            return OK;
        }

        STRATA_NODISCARD Result<Marker> Mark() const override
        {
            return MarkEnd(StackEnd::Front);
        }

        STRATA_NODISCARD Result<void> ResetTo(const Marker& marker) override
        {
            return ResetEndTo(StackEnd::Front, marker);
        }

        STRATA_NODISCARD Marker MarkEnd(StackEnd end) const noexcept
        {
            if (end == StackEnd::Front)
                return Marker{m_front, m_frontTop, m_frontLive, SequenceOf(m_frontTop)};
            return Marker{m_back, m_backTop, m_backLive, SequenceOf(m_backTop)};
        }

        // Rolls one end back to a marker taken on that end
        STRATA_NODISCARD Result<void> ResetEndTo(StackEnd end, const Marker& marker)
        {
            if (end == StackEnd::Front)
            {
                if (marker.offset > m_front || marker.liveAllocations > m_frontLive)
                    return Err(ErrorCode::InvalidRelease, "Marker is ahead of the front top");
                if (!IsCurrent(end, marker))
                    return Err(ErrorCode::InvalidRelease, "Marker top is no longer live");

                m_front = marker.offset;
                m_frontTop = marker.top;
                m_frontLive = marker.liveAllocations;
            }
            else
            {
                if (marker.offset < m_back || marker.liveAllocations > m_backLive)
                    return Err(ErrorCode::InvalidRelease, "Marker is ahead of the back top");
                if (!IsCurrent(end, marker))
                    return Err(ErrorCode::InvalidRelease, "Marker top is no longer live");

                m_back = marker.offset;
                m_backTop = marker.top;
                m_backLive = marker.liveAllocations;
            }

            m_stats.liveAllocations = m_frontLive + m_backLive;
            SetUsed(Used());
            return OK;
        }

        // Front top only; back blocks would have to move to grow
        bool TryGrow(MemoryBlock& block, std::size_t newSize) override
        {
            if (!block.ptr || newSize == 0 || !Owns(block.ptr))
                return false;

            const std::size_t start = OffsetOf(block.ptr);
            if (start != m_frontTop || start + block.size != m_front)
                return false;
            if (newSize > m_back - start)
                return false;

            m_front = start + newSize;
            block.size = newSize;
            SetUsed(Used());
            return true;
        }

        STRATA_NODISCARD ArenaKind Kind() const noexcept override { return ArenaKind::DoubleEndedStack; }

        STRATA_NODISCARD std::size_t FrontOffset() const noexcept { return m_front; }
        STRATA_NODISCARD std::size_t BackOffset() const noexcept { return m_back; }
        STRATA_NODISCARD std::size_t FrontLive() const noexcept { return m_frontLive; }
        STRATA_NODISCARD std::size_t BackLive() const noexcept { return m_backLive; }
        STRATA_NODISCARD std::size_t Remaining() const noexcept { return m_back - m_front; }

    private:
        DoubleEndedStackArena(MemoryPtr data, std::size_t capacity, std::size_t alignment) noexcept
            : ArenaBase(std::move(data), capacity, alignment)
            , m_back(capacity)
        {}

        StackHeader* HeaderAt(std::size_t top) const noexcept
        {
            return reinterpret_cast<StackHeader*>(m_data.get() + top - sizeof(StackHeader));
        }

        std::uint64_t SequenceOf(std::size_t top) const noexcept
        {
            return top == NO_TOP ? 0 : HeaderAt(top)->sequence;
        }

        // The block the marker was taken on top of is still the one at marker.top
        bool IsCurrent(StackEnd end, const Marker& marker) const noexcept
        {
            const std::size_t emptyOffset = end == StackEnd::Front ? 0 : m_capacity;
            if (marker.top == NO_TOP)
                return marker.offset == emptyOffset && marker.liveAllocations == 0;
            if (marker.sequence == 0 || marker.top < sizeof(StackHeader))
                return false;

            // Front tops lie below their end offset, back tops directly above their header
            if (end == StackEnd::Front)
            {
                if (marker.top >= marker.offset)
                    return false;
            }
            else if (marker.offset > m_capacity - sizeof(StackHeader) || marker.top != marker.offset + sizeof(StackHeader))
            {
                return false;
            }
            return HeaderAt(marker.top)->sequence == marker.sequence;
        }

        std::size_t Used() const noexcept { return m_front + (m_capacity - m_back); }

        std::size_t m_front = 0;
        std::size_t m_back;
        std::size_t m_frontTop = NO_TOP;
        std::size_t m_backTop = NO_TOP;
        std::size_t m_frontLive = 0;
        std::size_t m_backLive = 0;
        std::uint64_t m_sequence = 0;
    };
}
