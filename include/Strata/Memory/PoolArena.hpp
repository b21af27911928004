#pragma once

#include <cstdint>
#include <memory>
#include <vector>

#include "Arena.hpp"

namespace Strata
{
    /**
     * @brief Fixed-size slot allocator
     *
     * Slots are laid out at a stride of slotSize rounded up to the pool
     * alignment. Free slots are kept on a stack of indices, so the most
     * recently released slot is handed out first.
     */
    class PoolArena final : public ArenaBase
    {
    public:
        static Result<std::unique_ptr<PoolArena>> Create(std::size_t capacity, std::size_t slotSize, std::size_t alignment = config::DEFAULT_ALIGNMENT)
        {
            auto valid = Detail::ValidateDesc(ArenaDesc{ArenaKind::Pool, capacity, alignment, slotSize});
            if (!valid) return Err(valid.Error());
            if (slotSize == 0)
                return Err(ErrorCode::InvalidArgument, "Pool slot size must be non-zero");
            if (!CanAlignUp(slotSize, alignment))
                return Err(ErrorCode::InvalidCapacity);

            const std::size_t stride = AlignUp(slotSize, alignment);
            const std::size_t slotCount = capacity / stride;
            if (slotCount == 0)
                return Err(ErrorCode::InvalidCapacity, "Pool capacity cannot hold a single slot");
            if (slotCount > UINT32_MAX)
                return Err(ErrorCode::InvalidCapacity, "Pool slot count exceeds index range");

            auto backing = AllocateBacking(capacity, alignment);
            if (!backing) return Err(backing.Error());

            return std::unique_ptr<PoolArena>(new PoolArena(std::move(backing).Value(), capacity, alignment, slotSize, stride, slotCount));
        }

        STRATA_NODISCARD Result<MemoryBlock> Allocate(std::size_t size, std::size_t alignment = config::DEFAULT_ALIGNMENT) override
        {
            auto valid = Detail::ValidateRequest(size, alignment);
            if (!valid) return FailAllocation(valid.Error().code, valid.Error().message);

            if (size > m_slotSize || alignment > m_alignment)
                return FailAllocation(ErrorCode::SizeMismatch);
            if (m_freeSlots.empty())
                return FailAllocation(ErrorCode::OutOfMemory);

            const std::uint32_t slot = m_freeSlots.back();
            m_freeSlots.pop_back();
            m_live[slot] = true;

            RecordAllocation(LiveCount() * m_stride);
            return MemoryBlock{m_data.get() + static_cast<std::size_t>(slot) * m_stride, size};
        }

        STRATA_NODISCARD Result<void> Free(MemoryBlock block) override
        {
            const auto address = reinterpret_cast<std::uintptr_t>(block.ptr);
            if (!block.ptr || !Owns(block.ptr))
                return Err(ErrorCode::InvalidRelease, "Block not allocated from this pool", address);

            const std::size_t offset = OffsetOf(block.ptr);
            if (offset % m_stride != 0 || offset / m_stride >= m_slotCount)
                return Err(ErrorCode::InvalidRelease, "Pointer is not a slot start", address);

            const auto slot = static_cast<std::uint32_t>(offset / m_stride);
            if (!m_live[slot])
                return Err(ErrorCode::InvalidRelease, "Slot already free", address);

            m_live[slot] = false;
            m_freeSlots.push_back(slot);
            RecordRelease(LiveCount() * m_stride);
            return OK;
        }

        STRATA_NODISCARD Result<void> Reset() override
        {
            RebuildFreeSlots();
            m_stats.liveAllocations = 0;
            SetUsed(0);
            return OK;
        }

        bool TryGrow(MemoryBlock& block, std::size_t newSize) override
        {
            if (!block.ptr || newSize == 0 || newSize > m_slotSize || !Owns(block.ptr))
                return false;

            const std::size_t offset = OffsetOf(block.ptr);
            if (offset % m_stride != 0 || offset / m_stride >= m_slotCount || !m_live[offset / m_stride])
                return false;

            block.size = newSize;
            return true;
        }

        STRATA_NODISCARD ArenaKind Kind() const noexcept override { return ArenaKind::Pool; }

        STRATA_NODISCARD std::size_t SlotSize() const noexcept { return m_slotSize; }
        STRATA_NODISCARD std::size_t Stride() const noexcept { return m_stride; }
        STRATA_NODISCARD std::size_t SlotCount() const noexcept { return m_slotCount; }
        STRATA_NODISCARD std::size_t FreeSlots() const noexcept { return m_freeSlots.size(); }

    private:
        PoolArena(MemoryPtr data, std::size_t capacity, std::size_t alignment,
                  std::size_t slotSize, std::size_t stride, std::size_t slotCount)
            : ArenaBase(std::move(data), capacity, alignment)
            , m_slotSize(slotSize)
            , m_stride(stride)
            , m_slotCount(slotCount)
            , m_live(slotCount, false)
        {
            RebuildFreeSlots();
        }

        // Highest index at the bottom so slot 0 is popped first
        void RebuildFreeSlots()
        {
            m_freeSlots.resize(m_slotCount);
            for (std::size_t i = 0; i < m_slotCount; ++i)
            {
                m_freeSlots[i] = static_cast<std::uint32_t>(m_slotCount - 1 - i);
            }
            std::fill(m_live.begin(), m_live.end(), false);
        }

        STRATA_NODISCARD std::size_t LiveCount() const noexcept
        {
            return m_slotCount - m_freeSlots.size();
        }

        std::size_t m_slotSize;
        std::size_t m_stride;
        std::size_t m_slotCount;
        std::vector<std::uint32_t> m_freeSlots;
        std::vector<bool> m_live;
    };
}
