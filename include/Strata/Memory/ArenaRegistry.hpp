#pragma once

#include <cstdint>
#include <limits>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "../Core/Logger.hpp"
#include "../Core/Profile.hpp"
#include "Arena.hpp"
#include "DebugArena.hpp"
#include "DoubleEndedStackArena.hpp"
#include "FreeListArena.hpp"
#include "LinearArena.hpp"
#include "PoolArena.hpp"
#include "StackArena.hpp"

namespace Strata
{
    using ArenaId = std::uint32_t;

    inline constexpr ArenaId INVALID_ARENA = std::numeric_limits<ArenaId>::max();

    /**
     * @brief Owner of named arenas
     *
     * Ids are handed out sequentially and never reused, so an id held past
     * Destroy() resolves to NotFound instead of a different arena. When
     * debugArenas is set every arena is wrapped in a DebugArena.
     */
    class ArenaRegistry
    {
    public:
        struct Config
        {
            bool debugArenas =
#ifdef STRATA_BUILD_DEBUG
                true;
#else
                false;
#endif
            DebugArenaConfig debugConfig{};
        };

        ArenaRegistry() : ArenaRegistry(Config{}) {}
        explicit ArenaRegistry(const Config& config) : m_config(config) {}

        ArenaRegistry(const ArenaRegistry&) = delete;
        ArenaRegistry& operator=(const ArenaRegistry&) = delete;

        ~ArenaRegistry()
        {
            DestroyAll();
        }

        STRATA_NODISCARD Result<ArenaId> Create(std::string_view name, const ArenaDesc& desc)
        {
            if (name.empty())
                return Err(ErrorCode::InvalidArgument, "Arena name must not be empty");
            if (m_byName.find(std::string(name)) != m_byName.end())
                return Err(ErrorCode::AlreadyExists, "Arena name already registered");
            if (m_nextId == INVALID_ARENA)
                return Err(ErrorCode::CapacityExceeded, "Arena id space exhausted");

            auto arena = MakeArena(name, desc);
            if (!arena) return Err(arena.Error());

            const ArenaId id = m_nextId++;
            Entry entry;
            entry.name = std::string(name);
            entry.desc = desc;
            entry.arena = std::move(arena).Value();
            entry.debug = m_config.debugArenas ? static_cast<DebugArena*>(entry.arena.get()) : nullptr;

            m_entries.push_back(std::move(entry));
            m_byName.emplace(std::string(name), id);

            STRATA_LOG_DEBUG("Registry", "Created %s arena '%.*s' (id %u, %zu bytes)",
                ToString(desc.kind), static_cast<int>(name.size()), name.data(), id, desc.capacity);
            return id;
        }

        // Fails ArenaInUse while allocations are live unless forced
        STRATA_NODISCARD Result<void> Destroy(ArenaId id, bool force = false)
        {
            Entry* entry = FindEntry(id);
            if (!entry)
                return Err(ErrorCode::NotFound, "Unknown arena id");

            const std::size_t live = entry->arena->GetStats().liveAllocations;
            if (live > 0 && !force)
                return Err(ErrorCode::ArenaInUse);

            Release(*entry);
            if (m_default == id)
                m_default = INVALID_ARENA;
            return OK;
        }

        STRATA_NODISCARD IArena* Get(ArenaId id) noexcept
        {
            Entry* entry = FindEntry(id);
            return entry ? entry->arena.get() : nullptr;
        }

        STRATA_NODISCARD const IArena* Get(ArenaId id) const noexcept
        {
            const Entry* entry = FindEntry(id);
            return entry ? entry->arena.get() : nullptr;
        }

        // Null unless the arena was created with debug instrumentation
        STRATA_NODISCARD DebugArena* GetDebug(ArenaId id) noexcept
        {
            Entry* entry = FindEntry(id);
            return entry ? entry->debug : nullptr;
        }

        STRATA_NODISCARD Result<ArenaId> Find(std::string_view name) const
        {
            auto it = m_byName.find(std::string(name));
            if (it == m_byName.end())
                return Err(ErrorCode::NotFound, "No arena with that name");
            return it->second;
        }

        STRATA_NODISCARD Result<MemoryBlock> Allocate(ArenaId id, std::size_t size,
                                                      std::size_t alignment = config::DEFAULT_ALIGNMENT,
                                                      const char* tag = nullptr)
        {
            Entry* entry = FindEntry(id);
            if (!entry)
                return Err(ErrorCode::NotFound, "Unknown arena id");

            // Debug pools carry enlarged slots, keep the declared limit
            if (entry->desc.kind == ArenaKind::Pool && size > entry->desc.slotSize)
                return Err(ErrorCode::SizeMismatch);

            auto block = entry->debug ? entry->debug->AllocateTagged(size, alignment, tag)
                                      : entry->arena->Allocate(size, alignment);
            if (block)
            {
                STRATA_PROFILE_ALLOC(block.Value().ptr, block.Value().size);
            }
            return block;
        }

        // Double-ended stack arenas only, other kinds fail with InvalidState
        STRATA_NODISCARD Result<MemoryBlock> AllocateBack(ArenaId id, std::size_t size,
                                                          std::size_t alignment = config::DEFAULT_ALIGNMENT,
                                                          const char* tag = nullptr)
        {
            Entry* entry = FindEntry(id);
            if (!entry)
                return Err(ErrorCode::NotFound, "Unknown arena id");
            if (entry->desc.kind != ArenaKind::DoubleEndedStack)
                return Err(ErrorCode::InvalidState, "Arena kind has no back end");

            auto block = entry->debug ? entry->debug->AllocateBackTagged(size, alignment, tag)
                                      : static_cast<DoubleEndedStackArena*>(entry->arena.get())->AllocateBack(size, alignment);
            if (block)
            {
                STRATA_PROFILE_ALLOC(block.Value().ptr, block.Value().size);
            }
            return block;
        }

        STRATA_NODISCARD Result<void> Free(ArenaId id, MemoryBlock block)
        {
            Entry* entry = FindEntry(id);
            if (!entry)
                return Err(ErrorCode::NotFound, "Unknown arena id");

            STRATA_PROFILE_FREE(block.ptr);
            return entry->arena->Free(block);
        }

        bool TryGrow(ArenaId id, MemoryBlock& block, std::size_t newSize)
        {
            Entry* entry = FindEntry(id);
            if (!entry)
                return false;
            if (entry->desc.kind == ArenaKind::Pool && newSize > entry->desc.slotSize)
                return false;
            return entry->arena->TryGrow(block, newSize);
        }

        STRATA_NODISCARD Result<Marker> Mark(ArenaId id) const
        {
            const Entry* entry = FindEntry(id);
            if (!entry)
                return Err(ErrorCode::NotFound, "Unknown arena id");
            return entry->arena->Mark();
        }

        STRATA_NODISCARD Result<void> ResetTo(ArenaId id, const Marker& marker)
        {
            Entry* entry = FindEntry(id);
            if (!entry)
                return Err(ErrorCode::NotFound, "Unknown arena id");
            return entry->arena->ResetTo(marker);
        }

        STRATA_NODISCARD Result<void> Reset(ArenaId id)
        {
            Entry* entry = FindEntry(id);
            if (!entry)
                return Err(ErrorCode::NotFound, "Unknown arena id");
            return entry->arena->Reset();
        }

        STRATA_NODISCARD Result<ArenaStats> Stats(ArenaId id) const
        {
            const Entry* entry = FindEntry(id);
            if (!entry)
                return Err(ErrorCode::NotFound, "Unknown arena id");
            return entry->arena->GetStats();
        }

        // Sum over every live arena
        STRATA_NODISCARD ArenaStats TotalStats() const noexcept
        {
            ArenaStats total;
            for (const Entry& entry : m_entries)
            {
                if (!entry.arena)
                    continue;
                const ArenaStats stats = entry.arena->GetStats();
                total.used += stats.used;
                total.capacity += stats.capacity;
                total.liveAllocations += stats.liveAllocations;
                total.peakUsed += stats.peakUsed;
                total.allocationCount += stats.allocationCount;
                total.failedAllocations += stats.failedAllocations;
            }
            return total;
        }

        STRATA_NODISCARD Result<void> SetDefault(ArenaId id)
        {
            if (!FindEntry(id))
                return Err(ErrorCode::NotFound, "Unknown arena id");
            m_default = id;
            return OK;
        }

        STRATA_NODISCARD ArenaId GetDefault() const noexcept { return m_default; }

        STRATA_NODISCARD bool Contains(ArenaId id) const noexcept { return FindEntry(id) != nullptr; }

        STRATA_NODISCARD std::size_t Size() const noexcept { return m_byName.size(); }

        STRATA_NODISCARD const Config& GetConfig() const noexcept { return m_config; }

        // fn(ArenaId, std::string_view name, const IArena&) in creation order
        template<typename Fn>
        void ForEach(Fn&& fn) const
        {
            for (std::size_t i = 0; i < m_entries.size(); ++i)
            {
                const Entry& entry = m_entries[i];
                if (entry.arena)
                    fn(static_cast<ArenaId>(i), std::string_view(entry.name), *entry.arena);
            }
        }

        // Tears down every arena, newest first, reporting anything still live
        void DestroyAll()
        {
            for (auto it = m_entries.rbegin(); it != m_entries.rend(); ++it)
            {
                if (it->arena)
                    Release(*it);
            }
            m_default = INVALID_ARENA;
        }

    private:
        struct Entry
        {
            std::string name;
            ArenaDesc desc;
            std::unique_ptr<IArena> arena;
            DebugArena* debug = nullptr;
        };

        Entry* FindEntry(ArenaId id) noexcept
        {
            if (id >= m_entries.size() || !m_entries[id].arena)
                return nullptr;
            return &m_entries[id];
        }

        const Entry* FindEntry(ArenaId id) const noexcept
        {
            if (id >= m_entries.size() || !m_entries[id].arena)
                return nullptr;
            return &m_entries[id];
        }

        // Debug arenas report their own leaks when destroyed
        void Release(Entry& entry)
        {
            const std::size_t live = entry.arena->GetStats().liveAllocations;
            if (live > 0 && !entry.debug)
            {
                STRATA_LOG_WARN("Registry", "Arena '%s' destroyed with %zu live allocation(s)", entry.name.c_str(), live);
            }

            entry.arena.reset();
            entry.debug = nullptr;
            m_byName.erase(entry.name);
        }

        Result<std::unique_ptr<IArena>> MakeArena(std::string_view name, const ArenaDesc& desc) const
        {
            auto valid = Detail::ValidateDesc(desc);
            if (!valid) return Err(valid.Error());

            auto arena = MakePlainArena(m_config.debugArenas ? DebugDesc(desc) : desc);
            if (!arena) return arena;
            if (!m_config.debugArenas)
                return arena;

            return std::unique_ptr<IArena>(std::make_unique<DebugArena>(std::move(arena).Value(), m_config.debugConfig, std::string(name)));
        }

        // Pools are resized so the slot count survives the guard overhead
        static ArenaDesc DebugDesc(const ArenaDesc& desc) noexcept
        {
            if (desc.kind != ArenaKind::Pool || desc.slotSize == 0 || !CanAlignUp(desc.slotSize, desc.alignment))
                return desc;

            const std::size_t stride = AlignUp(desc.slotSize, desc.alignment);
            const std::size_t slotCount = desc.capacity / stride;

            ArenaDesc debug = desc;
            debug.slotSize = desc.slotSize + DebugArena::GuardOverhead(desc.alignment);
            debug.capacity = slotCount * AlignUp(debug.slotSize, desc.alignment);
            if (debug.capacity == 0)
                debug.capacity = desc.capacity;
            return debug;
        }

        static Result<std::unique_ptr<IArena>> MakePlainArena(const ArenaDesc& desc)
        {
            switch (desc.kind)
            {
                case ArenaKind::Linear: return Upcast(LinearArena::Create(desc.capacity, desc.alignment));
                case ArenaKind::Stack: return Upcast(StackArena::Create(desc.capacity, desc.alignment));
                case ArenaKind::Pool: return Upcast(PoolArena::Create(desc.capacity, desc.slotSize, desc.alignment));
                case ArenaKind::FreeList: return Upcast(FreeListArena::Create(desc.capacity, desc.alignment));
                case ArenaKind::DoubleEndedStack: return Upcast(DoubleEndedStackArena::Create(desc.capacity, desc.alignment));
            }
            return Err(ErrorCode::InvalidArgument, "Unknown arena kind");
        }

        template<typename T>
        static Result<std::unique_ptr<IArena>> Upcast(Result<std::unique_ptr<T>>&& result)
        {
            if (!result) return Err(std::move(result).Error());
            return std::unique_ptr<IArena>(std::move(result).Value());
        }

        Config m_config;
        std::vector<Entry> m_entries;
        std::unordered_map<std::string, ArenaId> m_byName;
        ArenaId m_default = INVALID_ARENA;
        ArenaId m_nextId = 0;
    };
}
