#pragma once

#include <array>
#include <cstddef>
#include <iterator>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include "../Component/ComponentStorage.hpp"
#include "../Core/Base.hpp"
#include "../Core/Profile.hpp"
#include "../Entity/EntityManager.hpp"

namespace Strata
{
    /**
     * @brief Lazy, restartable view over entities holding every component in Ts
     *
     * Iteration walks the dense entity list of the smallest participating
     * storage and keeps the rows whose presence mask has all required bits,
     * so the cost is proportional to the rarest component rather than to the
     * entity count. Order follows the dense order of that storage.
     *
     * The view locks each participating storage for its whole lifetime; adding
     * or removing those component types meanwhile fails with StorageLocked and
     * has to go through the world's CommandBuffer.
     *
     * @code
     * for (auto [entity, pos, vel] : world.Query<Position, Velocity>())
     * {
     *     pos.x += vel.x * dt;
     * }
     * @endcode
     */
    template<Component... Ts>
    class QueryView
    {
        static_assert(sizeof...(Ts) > 0, "A query needs at least one component type");

    public:
        using StorageTuple = std::tuple<ComponentStorage<Ts>*...>;
        using ValueType = std::tuple<Entity, Ts&...>;

        class Iterator
        {
        public:
            using iterator_category = std::forward_iterator_tag;
            using value_type = ValueType;
            using difference_type = std::ptrdiff_t;
            using pointer = void;
            using reference = ValueType;

            Iterator() = default;
            Iterator(const QueryView* view, std::size_t position) noexcept
                : m_view(view), m_position(position)
            {
                SkipNonMatching();
            }

            reference operator*() const
            {
                const Entity entity = (*m_view->m_driver)[m_position];
                return m_view->MakeRow(entity, std::index_sequence_for<Ts...>{});
            }

            Iterator& operator++() noexcept
            {
                ++m_position;
                SkipNonMatching();
                return *this;
            }

            Iterator operator++(int) noexcept
            {
                Iterator copy = *this;
                ++(*this);
                return copy;
            }

            bool operator==(const Iterator& other) const noexcept { return m_position == other.m_position; }

        private:
            void SkipNonMatching() noexcept
            {
                if (!m_view || !m_view->m_driver)
                    return;

                const std::size_t end = m_view->m_driver->size();
                while (m_position < end && !m_view->Matches((*m_view->m_driver)[m_position]))
                    ++m_position;
            }

            const QueryView* m_view = nullptr;
            std::size_t m_position = 0;
        };

        QueryView(const EntityManager& entities, const ComponentMask& required, ComponentStorage<Ts>*... storages) noexcept
            : m_entities(&entities)
            , m_required(required)
            , m_storages(storages...)
        {
            const std::array<IComponentStorage*, sizeof...(Ts)> erased{static_cast<IComponentStorage*>(storages)...};
            for (IComponentStorage* storage : erased)
            {
                // A type with no storage means no entity can match
                if (!storage)
                {
                    m_driver = nullptr;
                    return;
                }
                if (!m_driver || storage->Size() < m_driver->size())
                    m_driver = &storage->Entities();
            }

            std::apply([](auto*... s) { (s->Lock(), ...); }, m_storages);
            m_locked = true;
        }

        QueryView(const QueryView&) = delete;
        QueryView& operator=(const QueryView&) = delete;

        QueryView(QueryView&& other) noexcept
            : m_entities(other.m_entities)
            , m_required(other.m_required)
            , m_storages(other.m_storages)
            , m_driver(other.m_driver)
            , m_locked(other.m_locked)
        {
            other.m_locked = false;
            other.m_driver = nullptr;
        }

        QueryView& operator=(QueryView&&) = delete;

        ~QueryView()
        {
            if (m_locked)
                std::apply([](auto*... s) { (s->Unlock(), ...); }, m_storages);
        }

        STRATA_NODISCARD Iterator begin() const noexcept { return Iterator(this, 0); }
        STRATA_NODISCARD Iterator end() const noexcept { return Iterator(nullptr, m_driver ? m_driver->size() : 0); }

        // Calls fn(Entity, Ts&...) or fn(Ts&...) for every match
        template<typename Fn>
        void ForEach(Fn&& fn) const
        {
            STRATA_PROFILE_ZONE_NAMED_COLOR("QueryView::ForEach", Profile::ColorQuery);
            if (!m_driver)
                return;

            for (std::size_t i = 0; i < m_driver->size(); ++i)
            {
                const Entity entity = (*m_driver)[i];
                if (!Matches(entity))
                    continue;

                ValueType row = MakeRow(entity, std::index_sequence_for<Ts...>{});
                if constexpr (std::is_invocable_v<Fn&, Entity, Ts&...>)
                    std::apply(fn, row);
                else
                    std::apply([&fn](Entity, Ts&... values) { fn(values...); }, row);
            }
        }

        STRATA_NODISCARD std::size_t Count() const noexcept
        {
            std::size_t count = 0;
            for (auto it = begin(); it != end(); ++it)
                ++count;
            return count;
        }

        STRATA_NODISCARD bool Empty() const noexcept { return begin() == end(); }

        // Entities the iteration is driven by, or null when a type has no storage
        STRATA_NODISCARD const std::vector<Entity>* GetDriver() const noexcept { return m_driver; }
        STRATA_NODISCARD const ComponentMask& GetRequired() const noexcept { return m_required; }

    private:
        bool Matches(Entity entity) const noexcept
        {
            const EntityRecord* record = m_entities->GetRecord(entity.Index());
            return record && record->alive && record->generation == entity.Generation() && record->mask.HasAll(m_required);
        }

        template<std::size_t... Is>
        ValueType MakeRow(Entity entity, std::index_sequence<Is...>) const
        {
            return ValueType{entity, *std::get<Is>(m_storages)->TryGetByIndex(entity.Index())...};
        }

        const EntityManager* m_entities;
        ComponentMask m_required;
        StorageTuple m_storages;
        const std::vector<Entity>* m_driver = nullptr;
        bool m_locked = false;
    };

    /**
     * @brief Runtime form of QueryView, selecting entities by a ComponentMask
     *
     * Yields entity handles only. An empty mask matches every live entity.
     */
    class MaskQuery
    {
    public:
        class Iterator
        {
        public:
            using iterator_category = std::forward_iterator_tag;
            using value_type = Entity;
            using difference_type = std::ptrdiff_t;
            using pointer = void;
            using reference = Entity;

            Iterator() = default;
            Iterator(const MaskQuery* query, std::size_t position) noexcept
                : m_query(query), m_position(position)
            {
                SkipNonMatching();
            }

            reference operator*() const noexcept { return m_query->At(m_position); }

            Iterator& operator++() noexcept
            {
                ++m_position;
                SkipNonMatching();
                return *this;
            }

            Iterator operator++(int) noexcept
            {
                Iterator copy = *this;
                ++(*this);
                return copy;
            }

            bool operator==(const Iterator& other) const noexcept { return m_position == other.m_position; }

        private:
            void SkipNonMatching() noexcept
            {
                if (!m_query)
                    return;

                const std::size_t end = m_query->Extent();
                while (m_position < end && !m_query->Matches(m_query->At(m_position)))
                    ++m_position;
            }

            const MaskQuery* m_query = nullptr;
            std::size_t m_position = 0;
        };

        // storages holds one entry per set bit of required; a null entry empties the query
        MaskQuery(const EntityManager& entities, const ComponentMask& required, std::vector<IComponentStorage*> storages)
            : m_entities(&entities)
            , m_required(required)
            , m_storages(std::move(storages))
        {
            for (IComponentStorage* storage : m_storages)
            {
                if (!storage)
                {
                    m_empty = true;
                    m_storages.clear();
                    return;
                }
                if (!m_driver || storage->Size() < m_driver->size())
                    m_driver = &storage->Entities();
            }

            for (IComponentStorage* storage : m_storages)
                storage->Lock();
        }

        MaskQuery(const MaskQuery&) = delete;
        MaskQuery& operator=(const MaskQuery&) = delete;

        MaskQuery(MaskQuery&& other) noexcept
            : m_entities(other.m_entities)
            , m_required(other.m_required)
            , m_storages(std::move(other.m_storages))
            , m_driver(other.m_driver)
            , m_empty(other.m_empty)
        {
            other.m_storages.clear();
            other.m_driver = nullptr;
            other.m_empty = true;
        }

        MaskQuery& operator=(MaskQuery&&) = delete;

        ~MaskQuery()
        {
            for (IComponentStorage* storage : m_storages)
                storage->Unlock();
        }

        STRATA_NODISCARD Iterator begin() const noexcept { return Iterator(this, 0); }
        STRATA_NODISCARD Iterator end() const noexcept { return Iterator(nullptr, Extent()); }

        template<typename Fn>
        void ForEach(Fn&& fn) const
        {
            for (Entity entity : *this)
                fn(entity);
        }

        STRATA_NODISCARD std::vector<Entity> Collect() const
        {
            std::vector<Entity> result;
            for (Entity entity : *this)
                result.push_back(entity);
            return result;
        }

        STRATA_NODISCARD std::size_t Count() const noexcept
        {
            std::size_t count = 0;
            for (auto it = begin(); it != end(); ++it)
                ++count;
            return count;
        }

    private:
        // Without a driving storage the whole slot range is scanned
        std::size_t Extent() const noexcept
        {
            if (m_empty)
                return 0;
            return m_driver ? m_driver->size() : m_entities->SlotCount();
        }

        Entity At(std::size_t position) const noexcept
        {
            if (m_driver)
                return (*m_driver)[position];
            return m_entities->HandleAt(static_cast<Entity::IndexType>(position));
        }

        bool Matches(Entity entity) const noexcept
        {
            if (!entity.IsValid())
                return false;
            const EntityRecord* record = m_entities->GetRecord(entity.Index());
            return record && record->alive && record->generation == entity.Generation() && record->mask.HasAll(m_required);
        }

        const EntityManager* m_entities;
        ComponentMask m_required;
        std::vector<IComponentStorage*> m_storages;
        const std::vector<Entity>* m_driver = nullptr;
        bool m_empty = false;
    };
}
