#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "../Core/Log.hpp"
#include "../Core/Result.hpp"
#include "../Core/TypeID.hpp"
#include "Component.hpp"

namespace Orrery
{
    struct ComponentDescriptor
    {
        ComponentID id;
        std::string_view typeName;
        std::string name;           // Short user-facing alias such as "pos", may be empty
        std::size_t size;
        std::size_t alignment;
    };

    /**
     * Catalogue of component types known to a world, with optional short names
     * so aspects can be written against names instead of types.
     */
    class ComponentRegistry
    {
    public:
        /**
         * Registers T, optionally under a short name. Re-registering is a no-op;
         * a name can be attached later if the type has none yet.
         * @return The component id, AlreadyExists if the name belongs to another
         *         type or T already has a different name, CapacityExceeded if the
         *         id cannot be represented in a ComponentMask
         */
        template<Component T>
        Result<ComponentID> Register(std::string_view name = {})
        {
            const ComponentID id = TypeID<T>::Value();
            if (id >= MAX_COMPONENTS) ORRERY_UNLIKELY
            {
                GlobalLogger().Warn("Component {} has id {} beyond the mask capacity of {}",
                                    TypeID<T>::Name(), id, MAX_COMPONENTS);
                return Err(ErrorCode::CapacityExceeded, "Component id exceeds MAX_COMPONENTS");
            }

            auto it = m_components.find(id);
            if (it == m_components.end())
            {
                it = m_components.emplace(id, ComponentDescriptor{
                    id, TypeID<T>::Name(), std::string{}, sizeof(T), alignof(T)}).first;
            }

            if (!name.empty() && it->second.name != name)
            {
                if (!it->second.name.empty())
                {
                    GlobalLogger().Warn("Component {} is already named '{}', refusing '{}'",
                                        it->second.typeName, it->second.name, name);
                    return Err(ErrorCode::AlreadyExists, "Component already has a different name");
                }

                auto [nameIt, inserted] = m_names.emplace(std::string(name), id);
                if (!inserted)
                {
                    GlobalLogger().Warn("Component name '{}' is already taken by id {}", name, nameIt->second);
                    return Err(ErrorCode::AlreadyExists, "Component name already registered");
                }
                it->second.name = std::string(name);
            }

            return id;
        }

        template<Component... Components>
        void RegisterComponents()
        {
            (static_cast<void>(Register<Components>()), ...);
        }

        ORRERY_NODISCARD const ComponentDescriptor* GetDescriptor(ComponentID id) const
        {
            auto it = m_components.find(id);
            return it != m_components.end() ? &it->second : nullptr;
        }

        ORRERY_NODISCARD Result<ComponentID> FindByName(std::string_view name) const
        {
            auto it = m_names.find(std::string(name));
            if (it == m_names.end())
            {
                return Err(ErrorCode::NotFound, "Unknown component name");
            }
            return it->second;
        }

        // Resolves every name or fails on the first unknown one
        ORRERY_NODISCARD Result<std::vector<ComponentID>> Resolve(std::initializer_list<std::string_view> names) const
        {
            std::vector<ComponentID> ids;
            ids.reserve(names.size());
            for (std::string_view name : names)
            {
                auto id = FindByName(name);
                if (!id)
                {
                    GlobalLogger().Debug("Unresolved component name '{}'", name);
                    return Err(id.Error());
                }
                ids.push_back(*id);
            }
            return ids;
        }

        ORRERY_NODISCARD std::size_t Size() const noexcept { return m_components.size(); }

    private:
        std::unordered_map<ComponentID, ComponentDescriptor> m_components;
        std::unordered_map<std::string, ComponentID> m_names;
    };
}
