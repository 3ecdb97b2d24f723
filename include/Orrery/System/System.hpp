#pragma once

#include <string>
#include <string_view>
#include <utility>

#include "../Aspect/Aspect.hpp"
#include "../Core/Base.hpp"
#include "../Core/Delegate.hpp"
#include "../Entity/Entity.hpp"

namespace Orrery
{
    /**
     * Named unit of behaviour: an aspect selecting its entities plus up to four hooks.
     *
     *   System movement("movement", Aspect::Make<Required<Position, Velocity>>());
     *   movement.OnUpdate([&world](Entity e, float dt) { ... })
     *           .OnAdd([](Entity e) { ... });
     *
     * Missing hooks are skipped. Scheduling and activation belong to the World.
     */
    class System
    {
    public:
        using PreUpdateFn = Delegate<void(float)>;
        using UpdateFn = Delegate<void(Entity, float)>;
        using TransitionFn = Delegate<void(Entity)>;

        System() = default;

        explicit System(std::string name, Aspect aspect = {})
            : m_name(std::move(name))
            , m_aspect(std::move(aspect))
        {}

        explicit System(Aspect aspect)
            : m_aspect(std::move(aspect))
        {}

        System& OnPreUpdate(PreUpdateFn fn) { m_preUpdate = std::move(fn); return *this; }
        System& OnUpdate(UpdateFn fn) { m_update = std::move(fn); return *this; }
        System& OnAdd(TransitionFn fn) { m_onAdd = std::move(fn); return *this; }
        System& OnRemove(TransitionFn fn) { m_onRemove = std::move(fn); return *this; }

        ORRERY_NODISCARD const std::string& GetName() const noexcept { return m_name; }
        ORRERY_NODISCARD const Aspect& GetAspect() const noexcept { return m_aspect; }

        ORRERY_NODISCARD bool HasPreUpdate() const noexcept { return static_cast<bool>(m_preUpdate); }
        ORRERY_NODISCARD bool HasUpdate() const noexcept { return static_cast<bool>(m_update); }
        ORRERY_NODISCARD bool HasAdd() const noexcept { return static_cast<bool>(m_onAdd); }
        ORRERY_NODISCARD bool HasRemove() const noexcept { return static_cast<bool>(m_onRemove); }

        void InvokePreUpdate(float dt) const
        {
            if (m_preUpdate) m_preUpdate(dt);
        }

        void InvokeUpdate(Entity entity, float dt) const
        {
            if (m_update) m_update(entity, dt);
        }

        void InvokeAdd(Entity entity) const
        {
            if (m_onAdd) m_onAdd(entity);
        }

        void InvokeRemove(Entity entity) const
        {
            if (m_onRemove) m_onRemove(entity);
        }

    private:
        std::string m_name;
        Aspect m_aspect;
        PreUpdateFn m_preUpdate;
        UpdateFn m_update;
        TransitionFn m_onAdd;
        TransitionFn m_onRemove;
    };
}
