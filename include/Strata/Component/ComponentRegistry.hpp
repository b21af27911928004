#pragma once

#include <cstdint>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <vector>

#include "../Core/Result.hpp"
#include "../Core/TypeID.hpp"
#include "Component.hpp"

namespace Strata
{
    /**
     * @brief Per-world mapping from component types to dense ComponentIDs
     *
     * Types are keyed by TypeID<T>::Hash() and numbered in registration
     * order, so ids are small enough to index a ComponentMask.
     */
    class ComponentRegistry
    {
    public:
        // Registers T if needed and returns its id
        template<Component T>
        STRATA_NODISCARD Result<ComponentID> Register()
        {
            const std::uint64_t hash = TypeID<T>::Hash();
            if (auto it = m_hashToID.find(hash); it != m_hashToID.end())
            {
                STRATA_ASSERT(m_names[it->second] == TypeID<T>::Name(), "Component type hash collision");
                return it->second;
            }

            if (m_descriptors.size() >= MAX_COMPONENTS)
                return Err(ErrorCode::CapacityExceeded, "More component types than STRATA_MAX_COMPONENTS");

            const auto id = static_cast<ComponentID>(m_descriptors.size());
            m_names.emplace_back(TypeID<T>::Name());

            ComponentDescriptor desc;
            desc.id = id;
            desc.size = sizeof(T);
            desc.alignment = alignof(T);
            desc.hash = hash;
            desc.isTriviallyCopyable = std::is_trivially_copyable_v<T>;
            desc.isEmpty = std::is_empty_v<T>;
            m_descriptors.push_back(desc);

            m_hashToID.emplace(hash, id);
            return id;
        }

        template<Component T>
        STRATA_NODISCARD Result<ComponentID> GetID() const
        {
            auto it = m_hashToID.find(TypeID<T>::Hash());
            if (it == m_hashToID.end())
                return Err(ErrorCode::NotFound, "Component type not registered");
            return it->second;
        }

        template<Component T>
        STRATA_NODISCARD bool IsRegistered() const
        {
            return m_hashToID.find(TypeID<T>::Hash()) != m_hashToID.end();
        }

        STRATA_NODISCARD Result<ComponentID> GetIDFromHash(std::uint64_t hash) const
        {
            auto it = m_hashToID.find(hash);
            if (it == m_hashToID.end())
                return Err(ErrorCode::NotFound, "Unknown component hash");
            return it->second;
        }

        STRATA_NODISCARD const ComponentDescriptor* GetDescriptor(ComponentID id) const noexcept
        {
            return id < m_descriptors.size() ? &m_descriptors[id] : nullptr;
        }

        STRATA_NODISCARD const char* GetName(ComponentID id) const noexcept
        {
            return id < m_names.size() ? m_names[id].c_str() : "Unknown";
        }

        STRATA_NODISCARD std::size_t Size() const noexcept { return m_descriptors.size(); }

    private:
        std::vector<ComponentDescriptor> m_descriptors;
        std::vector<std::string> m_names;
        std::unordered_map<std::uint64_t, ComponentID> m_hashToID;
    };
}
