#pragma once

#include <memory>

#include "Arena.hpp"

namespace Strata
{
    /**
     * @brief Monotonic bump allocator
     *
     * Individual frees are accepted and ignored; memory comes back only
     * through Reset(). The most recent allocation can be grown in place.
     */
    class LinearArena final : public ArenaBase
    {
    public:
        static Result<std::unique_ptr<LinearArena>> Create(std::size_t capacity, std::size_t alignment = config::DEFAULT_ALIGNMENT)
        {
            auto valid = Detail::ValidateDesc(ArenaDesc{ArenaKind::Linear, capacity, alignment, 0});
            if (!valid) return Err(valid.Error());

            auto backing = AllocateBacking(capacity, alignment);
            if (!backing) return Err(backing.Error());

            return std::unique_ptr<LinearArena>(new LinearArena(std::move(backing).Value(), capacity, alignment));
        }

        STRATA_NODISCARD Result<MemoryBlock> Allocate(std::size_t size, std::size_t alignment = config::DEFAULT_ALIGNMENT) override
        {
            auto valid = Detail::ValidateRequest(size, alignment);
            if (!valid) return FailAllocation(valid.Error().code, valid.Error().message);

            const auto base = reinterpret_cast<std::uintptr_t>(m_data.get());
            const std::size_t start = AlignUpAddress(base + m_offset, alignment) - base;
            if (start > m_capacity || size > m_capacity - start)
                return FailAllocation(ErrorCode::OutOfMemory);

            m_lastStart = start;
            m_offset = start + size;
            RecordAllocation(m_offset);
            return MemoryBlock{m_data.get() + start, size};
        }

        STRATA_NODISCARD Result<void> Free(MemoryBlock block) override
        {
            if (!block.ptr || !Owns(block.ptr) || OffsetOf(block.ptr) >= m_offset)
                return Err(ErrorCode::InvalidRelease, "Block not allocated from this arena", reinterpret_cast<std::uintptr_t>(block.ptr));

            // Memory is reclaimed by Reset()
            return OK;
        }

        STRATA_NODISCARD Result<void> Reset() override
        {
            m_offset = 0;
            m_lastStart = 0;
            m_stats.liveAllocations = 0;
            SetUsed(0);
            return OK;
        }

        bool TryGrow(MemoryBlock& block, std::size_t newSize) override
        {
            if (!block.ptr || newSize == 0 || !Owns(block.ptr))
                return false;

            const std::size_t start = OffsetOf(block.ptr);
            if (start != m_lastStart || start + block.size != m_offset)
                return false;
            if (newSize > m_capacity - start)
                return false;

            m_offset = start + newSize;
            block.size = newSize;
            SetUsed(m_offset);
            return true;
        }

        STRATA_NODISCARD ArenaKind Kind() const noexcept override { return ArenaKind::Linear; }

        STRATA_NODISCARD std::size_t Offset() const noexcept { return m_offset; }

    private:
        LinearArena(MemoryPtr data, std::size_t capacity, std::size_t alignment) noexcept
            : ArenaBase(std::move(data), capacity, alignment)
        {}

        std::size_t m_offset = 0;
        std::size_t m_lastStart = 0;
    };
}
