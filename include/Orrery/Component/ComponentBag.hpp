#pragma once

#include <algorithm>
#include <memory>
#include <utility>
#include <vector>

#include "../Core/Base.hpp"
#include "../Core/TypeID.hpp"
#include "Component.hpp"

namespace Orrery
{
    /**
     * Per-entity component storage: a presence mask plus one type-erased slot
     * per attached component. Values are opaque to everything but the typed
     * accessors; aspects only read the mask.
     */
    class ComponentBag
    {
    public:
        ComponentBag() = default;

        ComponentBag(const ComponentBag&) = delete;
        ComponentBag& operator=(const ComponentBag&) = delete;
        ComponentBag(ComponentBag&&) noexcept = default;
        ComponentBag& operator=(ComponentBag&&) noexcept = default;

        // Attaches T, replacing any existing value
        template<Component T, typename... Args>
        T& Emplace(Args&&... args)
        {
            const ComponentID id = TypeID<T>::Value();
            ErasedPtr value = MakeErased<T>(std::forward<Args>(args)...);
            T& ref = *static_cast<T*>(value.get());

            if (Slot* slot = FindSlot(id))
            {
                slot->value = std::move(value);
            }
            else
            {
                m_slots.push_back(Slot{id, std::move(value)});
                m_mask.Set(id);
            }
            return ref;
        }

        template<Component T>
        bool Remove()
        {
            const ComponentID id = TypeID<T>::Value();
            auto it = std::find_if(m_slots.begin(), m_slots.end(),
                                   [id](const Slot& slot) { return slot.id == id; });
            if (it == m_slots.end())
                return false;

            m_slots.erase(it);
            m_mask.Reset(id);
            return true;
        }

        template<Component T>
        ORRERY_NODISCARD T* Get() noexcept
        {
            Slot* slot = FindSlot(TypeID<T>::Value());
            return slot ? static_cast<T*>(slot->value.get()) : nullptr;
        }

        template<Component T>
        ORRERY_NODISCARD const T* Get() const noexcept
        {
            const Slot* slot = FindSlot(TypeID<T>::Value());
            return slot ? static_cast<const T*>(slot->value.get()) : nullptr;
        }

        template<Component T>
        ORRERY_NODISCARD bool Has() const noexcept
        {
            return Has(TypeID<T>::Value());
        }

        ORRERY_NODISCARD bool Has(ComponentID id) const noexcept
        {
            return FindSlot(id) != nullptr;
        }

        ORRERY_NODISCARD const ComponentMask& GetMask() const noexcept { return m_mask; }
        ORRERY_NODISCARD std::size_t Size() const noexcept { return m_slots.size(); }
        ORRERY_NODISCARD bool IsEmpty() const noexcept { return m_slots.empty(); }

        void Clear() noexcept
        {
            m_slots.clear();
            m_mask.Clear();
        }

    private:
        using ErasedPtr = std::unique_ptr<void, void(*)(void*)>;

        template<typename T, typename... Args>
        static ErasedPtr MakeErased(Args&&... args)
        {
            std::unique_ptr<T> typed = std::make_unique<T>(std::forward<Args>(args)...);
            return ErasedPtr(typed.release(), &DeleteErased<T>);
        }

        template<typename T>
        static void DeleteErased(void* ptr) noexcept
        {
            std::default_delete<T>{}(static_cast<T*>(ptr));
        }

        struct Slot
        {
            ComponentID id;
            ErasedPtr value;
        };

        Slot* FindSlot(ComponentID id) noexcept
        {
            for (Slot& slot : m_slots)
            {
                if (slot.id == id)
                    return &slot;
            }
            return nullptr;
        }

        const Slot* FindSlot(ComponentID id) const noexcept
        {
            for (const Slot& slot : m_slots)
            {
                if (slot.id == id)
                    return &slot;
            }
            return nullptr;
        }

        std::vector<Slot> m_slots;
        ComponentMask m_mask;
    };
}
