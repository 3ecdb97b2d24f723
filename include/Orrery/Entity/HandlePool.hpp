#pragma once

#include <cstddef>
#include <memory>
#include <utility>
#include <vector>

#include "../Core/Base.hpp"
#include "../Core/Result.hpp"
#include "Entity.hpp"

namespace Orrery
{
    /**
    * Generational arena mapping handles to heap-stable payloads.
    *
    * Features:
    * - O(1) creation, destruction and lookup
    * - Slot recycling with version incrementation so stale handles never resolve
    * - Payload addresses stay valid until the owning slot is destroyed
    *
    * Version 0 marks a free slot; live versions run 1..255 and wrap back to 1.
    */
    template<typename Handle, typename T>
    class HandlePool
    {
    public:
        using IDType = typename Handle::IDType;
        using VersionType = typename Handle::VersionType;

        static constexpr VersionType NULL_VERSION = 0;
        static constexpr VersionType INITIAL_VERSION = 1;
        static constexpr std::size_t MAX_SLOTS = Handle::ID_MASK;

    private:
        struct Slot
        {
            std::unique_ptr<T> payload;
            VersionType version = NULL_VERSION;
        };

        struct FreeListEntry
        {
            IDType id;
            VersionType nextVersion;
        };

        std::vector<Slot> m_slots;
        std::vector<FreeListEntry> m_freeList;
        std::size_t m_aliveCount = 0;

        const Slot* Find(Handle handle) const noexcept
        {
            if (!handle.IsValid()) ORRERY_UNLIKELY return nullptr;

            const IDType id = handle.GetID();
            if (id >= m_slots.size()) ORRERY_UNLIKELY return nullptr;

            const Slot& slot = m_slots[id];
            if (slot.version == NULL_VERSION || slot.version != handle.GetVersion()) return nullptr;
            return &slot;
        }

    public:
        HandlePool() = default;

        explicit HandlePool(std::size_t capacity)
        {
            Reserve(capacity);
        }

        HandlePool(const HandlePool&) = delete;
        HandlePool& operator=(const HandlePool&) = delete;
        HandlePool(HandlePool&&) noexcept = default;
        HandlePool& operator=(HandlePool&&) noexcept = default;

        void Reserve(std::size_t capacity)
        {
            m_slots.reserve(capacity < MAX_SLOTS ? capacity : MAX_SLOTS);
        }

        /**
        * Allocates a slot and constructs its payload
        * @return Fresh handle, or CapacityExceeded when every id is in use
        */
        template<typename... Args>
        ORRERY_NODISCARD Result<Handle> Create(Args&&... args)
        {
            IDType id;
            VersionType version;

            if (!m_freeList.empty())
            {
                const FreeListEntry entry = m_freeList.back();
                m_freeList.pop_back();
                id = entry.id;
                version = entry.nextVersion;
            }
            else
            {
                if (m_slots.size() >= MAX_SLOTS) ORRERY_UNLIKELY
                {
                    return Err(ErrorCode::CapacityExceeded, "Handle pool exhausted");
                }
                id = static_cast<IDType>(m_slots.size());
                version = INITIAL_VERSION;
                m_slots.emplace_back();
            }

            Slot& slot = m_slots[id];
            slot.payload = std::make_unique<T>(std::forward<Args>(args)...);
            slot.version = version;
            ++m_aliveCount;

            return Handle(id, version);
        }

        /**
        * Destroys the payload and recycles the slot under the next version
        * @return false if the handle was stale or invalid
        */
        bool Destroy(Handle handle) noexcept
        {
            if (!Find(handle))
                return false;

            Slot& slot = m_slots[handle.GetID()];

            VersionType nextVersion = static_cast<VersionType>(slot.version + 1);
            if (nextVersion == NULL_VERSION) ORRERY_UNLIKELY
            {
                nextVersion = INITIAL_VERSION;
            }

            slot.payload.reset();
            slot.version = NULL_VERSION;
            m_freeList.push_back({handle.GetID(), nextVersion});
            --m_aliveCount;
            return true;
        }

        ORRERY_NODISCARD bool IsValid(Handle handle) const noexcept
        {
            return Find(handle) != nullptr;
        }

        ORRERY_NODISCARD T* Get(Handle handle) noexcept
        {
            const Slot* slot = Find(handle);
            return slot ? slot->payload.get() : nullptr;
        }

        ORRERY_NODISCARD const T* Get(Handle handle) const noexcept
        {
            const Slot* slot = Find(handle);
            return slot ? slot->payload.get() : nullptr;
        }

        ORRERY_NODISCARD std::size_t Size() const noexcept { return m_aliveCount; }
        ORRERY_NODISCARD bool IsEmpty() const noexcept { return m_aliveCount == 0; }
        ORRERY_NODISCARD std::size_t Capacity() const noexcept { return m_slots.capacity(); }

        // Visits live slots in id order as func(Handle, T&)
        template<typename Func>
        void ForEach(Func&& func)
        {
            for (std::size_t id = 0; id < m_slots.size(); ++id)
            {
                Slot& slot = m_slots[id];
                if (slot.version != NULL_VERSION)
                {
                    func(Handle(static_cast<IDType>(id), slot.version), *slot.payload);
                }
            }
        }
    };
}
