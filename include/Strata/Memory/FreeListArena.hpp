#pragma once

#include <cstdint>
#include <memory>

#include "Arena.hpp"

namespace Strata
{
    /**
     * @brief General-purpose first-fit allocator over an intrusive free list
     *
     * Free ranges are linked in address order through FreeNode headers
     * written into the ranges themselves, and adjacent ranges are merged
     * when a block is released. Each allocation is preceded by an
     * AllocationHeader recording the range it occupies.
     */
    class FreeListArena final : public ArenaBase
    {
    public:
        struct FreeNode
        {
            std::size_t size;
            FreeNode* next;
        };

        struct AllocationHeader
        {
            // Whole range, padding included
            std::size_t blockSize;
            // Distance from range start to the user pointer
            std::uint32_t padding;
            std::uint32_t magic;
        };

        static constexpr std::size_t MIN_BLOCK = sizeof(FreeNode);
        static constexpr std::size_t GRANULE = alignof(FreeNode);

        static_assert(sizeof(AllocationHeader) % GRANULE == 0);

        static Result<std::unique_ptr<FreeListArena>> Create(std::size_t capacity, std::size_t alignment = config::DEFAULT_ALIGNMENT)
        {
            auto valid = Detail::ValidateDesc(ArenaDesc{ArenaKind::FreeList, capacity, alignment, 0});
            if (!valid) return Err(valid.Error());

            // Usable capacity is trimmed to whole granules
            const std::size_t usable = capacity & ~(GRANULE - 1);
            if (usable < sizeof(AllocationHeader) + MIN_BLOCK)
                return Err(ErrorCode::InvalidCapacity, "Free-list arena too small for a single block");

            auto backing = AllocateBacking(capacity, alignment);
            if (!backing) return Err(backing.Error());

            return std::unique_ptr<FreeListArena>(new FreeListArena(std::move(backing).Value(), capacity, usable, alignment));
        }

        STRATA_NODISCARD Result<MemoryBlock> Allocate(std::size_t size, std::size_t alignment = config::DEFAULT_ALIGNMENT) override
        {
            auto valid = Detail::ValidateRequest(size, alignment);
            if (!valid) return FailAllocation(valid.Error().code, valid.Error().message);
            if (size > m_usable)
                return FailAllocation(ErrorCode::OutOfMemory);

            const std::size_t effective = std::max(alignment, alignof(AllocationHeader));

            FreeNode* prev = nullptr;
            for (FreeNode* node = m_head; node != nullptr; prev = node, node = node->next)
            {
                const auto start = reinterpret_cast<std::uintptr_t>(node);
                const std::uintptr_t user = AlignUpAddress(start + sizeof(AllocationHeader), effective);
                const std::size_t padding = user - start;
                std::size_t need = AlignUp(padding + size, GRANULE);

                if (need > node->size)
                    continue;

                const std::size_t remainder = node->size - need;
                FreeNode* next = node->next;
                if (remainder >= MIN_BLOCK)
                {
                    auto* split = reinterpret_cast<FreeNode*>(start + need);
                    split->size = remainder;
                    split->next = next;
                    next = split;
                }
                else
                {
                    need = node->size;
                }
                Unlink(prev, next);

                auto* header = reinterpret_cast<AllocationHeader*>(user - sizeof(AllocationHeader));
                header->blockSize = need;
                header->padding = static_cast<std::uint32_t>(padding);
                header->magic = config::FREELIST_MAGIC;

                m_usedBytes += need;
                RecordAllocation(m_usedBytes);
                return MemoryBlock{reinterpret_cast<void*>(user), size};
            }

            return FailAllocation(ErrorCode::OutOfMemory);
        }

        STRATA_NODISCARD Result<void> Free(MemoryBlock block) override
        {
            AllocationHeader* header = HeaderOf(block.ptr);
            if (!header)
                return Err(ErrorCode::InvalidRelease, "Block not live in this arena", reinterpret_cast<std::uintptr_t>(block.ptr));

            const std::size_t blockSize = header->blockSize;
            auto* start = static_cast<std::byte*>(block.ptr) - header->padding;
            header->magic = 0;

            m_usedBytes -= blockSize;
            Insert(start, blockSize);
            RecordRelease(m_usedBytes);
            return OK;
        }

        STRATA_NODISCARD Result<void> Reset() override
        {
            m_head = reinterpret_cast<FreeNode*>(m_data.get());
            m_head->size = m_usable;
            m_head->next = nullptr;
            m_usedBytes = 0;
            m_stats.liveAllocations = 0;
            SetUsed(0);
            return OK;
        }

        bool TryGrow(MemoryBlock& block, std::size_t newSize) override
        {
            AllocationHeader* header = HeaderOf(block.ptr);
            if (!header || newSize == 0)
                return false;

            auto* start = static_cast<std::byte*>(block.ptr) - header->padding;
            const std::size_t need = AlignUp(header->padding + newSize, GRANULE);
            if (need <= header->blockSize)
            {
                block.size = newSize;
                return true;
            }

            // Only a free range starting exactly at our end can be absorbed
            std::byte* end = start + header->blockSize;
            const std::size_t extra = need - header->blockSize;

            FreeNode* prev = nullptr;
            FreeNode* node = m_head;
            while (node != nullptr && reinterpret_cast<std::byte*>(node) < end)
            {
                prev = node;
                node = node->next;
            }
            if (node == nullptr || reinterpret_cast<std::byte*>(node) != end || node->size < extra)
                return false;

            const std::size_t remainder = node->size - extra;
            std::size_t taken = extra;
            FreeNode* next = node->next;
            if (remainder >= MIN_BLOCK)
            {
                auto* split = reinterpret_cast<FreeNode*>(end + extra);
                split->size = remainder;
                split->next = next;
                next = split;
            }
            else
            {
                taken = node->size;
            }
            Unlink(prev, next);

            header->blockSize += taken;
            m_usedBytes += taken;
            SetUsed(m_usedBytes);
            block.size = newSize;
            return true;
        }

        STRATA_NODISCARD ArenaKind Kind() const noexcept override { return ArenaKind::FreeList; }

        STRATA_NODISCARD std::size_t FreeRangeCount() const noexcept
        {
            std::size_t count = 0;
            for (const FreeNode* node = m_head; node != nullptr; node = node->next)
                ++count;
            return count;
        }

        STRATA_NODISCARD std::size_t LargestFreeRange() const noexcept
        {
            std::size_t largest = 0;
            for (const FreeNode* node = m_head; node != nullptr; node = node->next)
                largest = std::max(largest, node->size);
            return largest;
        }

    private:
        FreeListArena(MemoryPtr data, std::size_t capacity, std::size_t usable, std::size_t alignment) noexcept
            : ArenaBase(std::move(data), capacity, alignment)
            , m_usable(usable)
        {
            m_head = reinterpret_cast<FreeNode*>(m_data.get());
            m_head->size = m_usable;
            m_head->next = nullptr;
        }

        // Header of a live allocation, or nullptr when ptr is not one
        AllocationHeader* HeaderOf(void* ptr) const noexcept
        {
            if (!ptr || !Owns(ptr))
                return nullptr;

            const std::size_t offset = OffsetOf(ptr);
            if (offset < sizeof(AllocationHeader) || offset % alignof(AllocationHeader) != 0)
                return nullptr;

            auto* header = reinterpret_cast<AllocationHeader*>(static_cast<std::byte*>(ptr) - sizeof(AllocationHeader));
            if (header->magic != config::FREELIST_MAGIC)
                return nullptr;
            if (header->padding > offset || header->blockSize > m_usable - (offset - header->padding))
                return nullptr;
            return header;
        }

        // Replaces the node following prev (or the head) with replacement
        void Unlink(FreeNode* prev, FreeNode* replacement) noexcept
        {
            if (prev)
                prev->next = replacement;
            else
                m_head = replacement;
        }

        // Address-ordered insertion, merging with both neighbours
        void Insert(std::byte* start, std::size_t size) noexcept
        {
            auto* block = reinterpret_cast<FreeNode*>(start);
            block->size = size;

            FreeNode* prev = nullptr;
            FreeNode* next = m_head;
            while (next != nullptr && next < block)
            {
                prev = next;
                next = next->next;
            }

            block->next = next;
            if (next && reinterpret_cast<std::byte*>(block) + block->size == reinterpret_cast<std::byte*>(next))
            {
                block->size += next->size;
                block->next = next->next;
            }

            if (prev)
            {
                if (reinterpret_cast<std::byte*>(prev) + prev->size == reinterpret_cast<std::byte*>(block))
                {
                    prev->size += block->size;
                    prev->next = block->next;
                }
                else
                {
                    prev->next = block;
                }
            }
            else
            {
                m_head = block;
            }
        }

        std::size_t m_usable;
        std::size_t m_usedBytes = 0;
        FreeNode* m_head = nullptr;
    };
}
