#pragma once

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "../Core/Logger.hpp"
#include "Arena.hpp"
#include "DoubleEndedStackArena.hpp"

namespace Strata
{
    struct DebugArenaConfig
    {
        // Leaks found at destruction are fatal instead of logged
        bool failHardOnLeak = false;
        bool poisonOnFree = true;
    };

    struct AllocationRecord
    {
        std::uintptr_t address = 0;
        std::size_t size = 0;
        std::size_t alignment = 0;
        const char* tag = nullptr;
        bool live = false;
        std::uint64_t sequence = 0;
        // Front guard width, the inner block starts at address - frontGuard
        std::size_t frontGuard = 0;
        // Made on the back end of a double-ended stack
        bool back = false;
    };

    /**
     * @brief Guard-band and leak-tracking decorator over any arena
     *
     * Each allocation is surrounded by guard bytes filled with
     * config::GUARD_PATTERN. The front guard is GUARD_SIZE rounded up to the
     * requested alignment so the user pointer keeps that alignment; the back
     * guard is GUARD_SIZE bytes. Guards are verified whenever a block leaves
     * the arena (Free, Reset, ResetTo) and released bytes are poisoned.
     * Blocks with damaged guards are still released so arena state stays
     * consistent, and the error carries the block address. A free the inner
     * arena rejects leaves the block and its record as they were.
     */
    class DebugArena final : public IArena
    {
    public:
        explicit DebugArena(std::unique_ptr<IArena> inner, DebugArenaConfig config = {}, std::string name = "arena")
            : m_inner(std::move(inner))
            , m_config(config)
            , m_name(std::move(name))
        {
            STRATA_ASSERT(m_inner != nullptr, "DebugArena needs an inner arena");
        }

        DebugArena(const DebugArena&) = delete;
        DebugArena& operator=(const DebugArena&) = delete;

        ~DebugArena() override
        {
            const std::size_t leaks = ReportLeaks();
            if (leaks > 0 && m_config.failHardOnLeak)
            {
                STRATA_LOG_FATAL("Debug", "Arena '%s' destroyed with %zu leaked allocation(s)", m_name.c_str(), leaks);
            }
        }

        // Front plus back guard bytes added to a request of the given alignment
        STRATA_NODISCARD static constexpr std::size_t GuardOverhead(std::size_t alignment) noexcept
        {
            return FrontGuard(alignment) + config::GUARD_SIZE;
        }

        STRATA_NODISCARD Result<MemoryBlock> Allocate(std::size_t size, std::size_t alignment = config::DEFAULT_ALIGNMENT) override
        {
            return AllocateTagged(size, alignment, nullptr);
        }

        // tag must outlive the allocation, usually a string literal
        STRATA_NODISCARD Result<MemoryBlock> AllocateTagged(std::size_t size, std::size_t alignment, const char* tag)
        {
            return Instrument(size, alignment, tag, false, [this, alignment](std::size_t bytes) {
                return m_inner->Allocate(bytes, alignment);
            });
        }

        // Fails InvalidState unless the inner arena is a DoubleEndedStackArena
        STRATA_NODISCARD Result<MemoryBlock> AllocateBackTagged(std::size_t size, std::size_t alignment, const char* tag)
        {
            if (m_inner->Kind() != ArenaKind::DoubleEndedStack)
                return Err(ErrorCode::InvalidState, "Inner arena has no back end");

            auto* inner = static_cast<DoubleEndedStackArena*>(m_inner.get());
            return Instrument(size, alignment, tag, true, [inner, alignment](std::size_t bytes) {
                return inner->AllocateBack(bytes, alignment);
            });
        }

        STRATA_NODISCARD Result<void> Free(MemoryBlock block) override
        {
            const auto address = reinterpret_cast<std::uintptr_t>(block.ptr);
            auto it = m_records.find(address);
            if (it == m_records.end())
                return Err(ErrorCode::InvalidRelease, "Block not live in this debug arena", address);

            const AllocationRecord record = it->second;
            const bool intact = VerifyGuards(record);

            // A block the inner arena refuses stays live and untouched
            auto released = m_inner->Free(InnerBlock(record));
            if (!released)
                return released;

            m_records.erase(it);
            Poison(record);
            if (!intact)
                return Err(ErrorCode::CorruptionDetected, "Guard bytes damaged", address);
            return OK;
        }

        STRATA_NODISCARD Result<void> Reset() override
        {
            std::optional<std::uintptr_t> corrupted;
            for (auto& [address, record] : m_records)
            {
                if (!VerifyGuards(record) && !corrupted)
                    corrupted = address;
                Poison(record);
            }
            m_records.clear();

            auto reset = m_inner->Reset();
            if (corrupted)
                return Err(ErrorCode::CorruptionDetected, "Guard bytes damaged", *corrupted);
            return reset;
        }

        STRATA_NODISCARD Result<Marker> Mark() const override
        {
            return m_inner->Mark();
        }

        // Front records whose inner block starts at or above the marker are released
        STRATA_NODISCARD Result<void> ResetTo(const Marker& marker) override
        {
            auto rolled = m_inner->ResetTo(marker);
            if (!rolled) return rolled;

            const auto cutoff = reinterpret_cast<std::uintptr_t>(m_inner->Data()) + marker.offset;
            std::optional<std::uintptr_t> corrupted;
            for (auto it = m_records.begin(); it != m_records.end();)
            {
                const AllocationRecord& record = it->second;
                if (record.back || record.address - record.frontGuard < cutoff)
                {
                    ++it;
                    continue;
                }

                if (!VerifyGuards(record) && !corrupted)
                    corrupted = record.address;
                Poison(record);
                it = m_records.erase(it);
            }

            if (corrupted)
                return Err(ErrorCode::CorruptionDetected, "Guard bytes damaged", *corrupted);
            return OK;
        }

        bool TryGrow(MemoryBlock& block, std::size_t newSize) override
        {
            auto it = m_records.find(reinterpret_cast<std::uintptr_t>(block.ptr));
            if (it == m_records.end() || newSize == 0)
                return false;

            AllocationRecord& record = it->second;
            if (!VerifyGuards(record))
                return false;

            MemoryBlock inner = InnerBlock(record);
            if (!m_inner->TryGrow(inner, record.frontGuard + newSize + config::GUARD_SIZE))
                return false;

            auto* user = reinterpret_cast<std::byte*>(record.address);
            std::memset(user + newSize, config::GUARD_PATTERN, config::GUARD_SIZE);
            record.size = newSize;
            block.size = newSize;
            return true;
        }

        STRATA_NODISCARD ArenaStats GetStats() const noexcept override { return m_inner->GetStats(); }
        STRATA_NODISCARD ArenaKind Kind() const noexcept override { return m_inner->Kind(); }
        STRATA_NODISCARD bool Owns(const void* ptr) const noexcept override { return m_inner->Owns(ptr); }
        STRATA_NODISCARD std::byte* Data() const noexcept override { return m_inner->Data(); }
        STRATA_NODISCARD std::size_t Capacity() const noexcept override { return m_inner->Capacity(); }
        STRATA_NODISCARD std::size_t Alignment() const noexcept override { return m_inner->Alignment(); }

        // Live records ordered by allocation sequence
        STRATA_NODISCARD std::vector<AllocationRecord> CollectLeaks() const
        {
            std::vector<AllocationRecord> leaks;
            leaks.reserve(m_records.size());
            for (const auto& [address, record] : m_records)
                leaks.push_back(record);

            std::sort(leaks.begin(), leaks.end(), [](const AllocationRecord& a, const AllocationRecord& b) {
                return a.sequence < b.sequence;
            });
            return leaks;
        }

        // Logs every live record, returns how many there were
        std::size_t ReportLeaks() const
        {
            const auto leaks = CollectLeaks();
            if (leaks.empty())
                return 0;

            STRATA_LOG_ERROR("Debug", "Arena '%s' has %zu leaked allocation(s)", m_name.c_str(), leaks.size());
            for (const auto& leak : leaks)
            {
                STRATA_LOG_ERROR("Debug", "  leak #%llu: %zu bytes at 0x%llx (align %zu, tag %s)",
                    static_cast<unsigned long long>(leak.sequence), leak.size,
                    static_cast<unsigned long long>(leak.address), leak.alignment,
                    leak.tag ? leak.tag : "none");
            }
            return leaks.size();
        }

        // Record whose guards were most recently found damaged
        STRATA_NODISCARD const std::optional<AllocationRecord>& LastCorruption() const noexcept { return m_lastCorruption; }

        STRATA_NODISCARD std::size_t LiveRecordCount() const noexcept { return m_records.size(); }

        STRATA_NODISCARD std::optional<AllocationRecord> FindRecord(const void* ptr) const
        {
            auto it = m_records.find(reinterpret_cast<std::uintptr_t>(ptr));
            if (it == m_records.end())
                return std::nullopt;
            return it->second;
        }

        STRATA_NODISCARD IArena& Inner() noexcept { return *m_inner; }
        STRATA_NODISCARD const std::string& Name() const noexcept { return m_name; }

    private:
        // Requests the guarded size through allocate and records the block
        template<typename AllocateFn>
        Result<MemoryBlock> Instrument(std::size_t size, std::size_t alignment, const char* tag, bool back, AllocateFn&& allocate)
        {
            auto valid = Detail::ValidateRequest(size, alignment);
            if (!valid) return Err(valid.Error());

            const std::size_t front = FrontGuard(alignment);
            if (size > SIZE_MAX - front - config::GUARD_SIZE)
                return Err(ErrorCode::OutOfMemory);

            Result<MemoryBlock> inner = allocate(front + size + config::GUARD_SIZE);
            if (!inner) return Err(inner.Error());

            auto* base = static_cast<std::byte*>(inner.Value().ptr);
            std::byte* user = base + front;
            std::memset(base, config::GUARD_PATTERN, front);
            std::memset(user + size, config::GUARD_PATTERN, config::GUARD_SIZE);

            AllocationRecord record;
            record.address = reinterpret_cast<std::uintptr_t>(user);
            record.size = size;
            record.alignment = alignment;
            record.tag = tag;
            record.live = true;
            record.sequence = ++m_sequence;
            record.frontGuard = front;
            record.back = back;
            m_records[record.address] = record;

            return MemoryBlock{user, size};
        }

        STRATA_NODISCARD static constexpr std::size_t FrontGuard(std::size_t alignment) noexcept
        {
            return AlignUp(config::GUARD_SIZE, std::max<std::size_t>(alignment, 1));
        }

        STRATA_NODISCARD static MemoryBlock InnerBlock(const AllocationRecord& record) noexcept
        {
            auto* user = reinterpret_cast<std::byte*>(record.address);
            return MemoryBlock{user - record.frontGuard, record.frontGuard + record.size + config::GUARD_SIZE};
        }

        static bool IsFilled(const std::byte* begin, std::size_t count) noexcept
        {
            return std::all_of(begin, begin + count, [](std::byte b) {
                return b == static_cast<std::byte>(config::GUARD_PATTERN);
            });
        }

        // Logs and remembers the record when a guard is damaged
        bool VerifyGuards(const AllocationRecord& record)
        {
            const auto* user = reinterpret_cast<const std::byte*>(record.address);
            const bool frontOk = IsFilled(user - record.frontGuard, record.frontGuard);
            const bool backOk = IsFilled(user + record.size, config::GUARD_SIZE);
            if (frontOk && backOk) STRATA_LIKELY
                return true;

            AllocationRecord corrupted = record;
            corrupted.live = false;
            m_lastCorruption = corrupted;

            STRATA_LOG_ERROR("Debug", "Arena '%s': %s guard damaged on %zu byte block at 0x%llx (seq %llu, tag %s)",
                m_name.c_str(), frontOk ? "back" : "front", record.size,
                static_cast<unsigned long long>(record.address),
                static_cast<unsigned long long>(record.sequence),
                record.tag ? record.tag : "none");
            return false;
        }

        void Poison(const AllocationRecord& record) const noexcept
        {
            if (!m_config.poisonOnFree)
                return;
            auto* user = reinterpret_cast<std::byte*>(record.address);
            std::memset(user, config::POISON_PATTERN, record.size);
        }

        std::unique_ptr<IArena> m_inner;
        DebugArenaConfig m_config;
        std::string m_name;
        std::unordered_map<std::uintptr_t, AllocationRecord> m_records;
        std::optional<AllocationRecord> m_lastCorruption;
        std::uint64_t m_sequence = 0;
    };
}
