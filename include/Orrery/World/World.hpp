#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "../Aspect/Aspect.hpp"
#include "../Commands/CommandBuffer.hpp"
#include "../Component/Component.hpp"
#include "../Component/ComponentBag.hpp"
#include "../Component/ComponentRegistry.hpp"
#include "../Core/Base.hpp"
#include "../Core/Config.hpp"
#include "../Core/Log.hpp"
#include "../Core/Result.hpp"
#include "../Core/TypeID.hpp"
#include "../Entity/Entity.hpp"
#include "../Entity/HandlePool.hpp"
#include "../System/System.hpp"

namespace Orrery
{
    struct WorldConfig
    {
        std::size_t entityCapacity = config::DEFAULT_ENTITY_CAPACITY;
        std::size_t systemCapacity = config::DEFAULT_SYSTEM_CAPACITY;
        LogLevel logLevel = LogLevel::Warn;
        LogSink logSink = &StderrSink;
        std::shared_ptr<ComponentRegistry> componentRegistry;   // Shared between worlds when set
    };

    /**
     * Owns entities and systems and keeps system membership in step with aspects.
     *
     * Entity and system changes are deferred: Enqueue/Dequeue record commands
     * that only take effect at the next SyncSystems/SyncEntities, both of which
     * run at the top of Update(). Hooks may issue further commands at any time;
     * those land in the following sync.
     *
     * Example usage:
     * @code
     * World world;
     * SystemHandle movement = world.AddSystem(System("movement", Aspect::Make<Required<Position>>())
     *     .OnUpdate([&world](Entity e, float dt) { world.GetComponent<Position>(e)->x += dt; }));
     *
     * Entity e = world.CreateEntityWith(Position{});
     * world.Enqueue(e);
     * world.Update(1.0f / 60.0f);   // movement is scheduled, e joins it and is updated
     * @endcode
     *
     * Changing an entity's components does not re-evaluate membership; enqueue
     * the entity again to refresh it.
     */
    class World
    {
    public:
        using Config = WorldConfig;
        using MemberSet = std::unordered_set<Entity>;
        using CommandKind = Commands::CommandKind;

        explicit World(const Config& config = {})
            : m_entities(config.entityCapacity)
            , m_systems(config.systemCapacity)
            , m_componentRegistry(config.componentRegistry ? config.componentRegistry : std::make_shared<ComponentRegistry>())
            , m_logger(config.logSink, config.logLevel)
        {
            m_schedule.reserve(config.systemCapacity);
        }

        /**
         * Creates and schedules the given systems, then runs one system and
         * entity sync so they are live before the first Update.
         */
        explicit World(std::vector<System> systems, const Config& config = {})
            : World(config)
        {
            for (System& system : systems)
            {
                static_cast<void>(AddSystem(std::move(system)));
            }
            SyncSystems();
            SyncEntities();
        }

        // Hooks capture the world by reference
        World(const World&) = delete;
        World& operator=(const World&) = delete;
        World(World&&) = delete;
        World& operator=(World&&) = delete;

        // ============= Entities =============

        ORRERY_NODISCARD Entity CreateEntity()
        {
            auto entity = m_entities.Create();
            if (!entity) ORRERY_UNLIKELY
            {
                m_logger.Error("Cannot create entity: {}", entity.Error());
                return Entity::Invalid();
            }
            return *entity;
        }

        template<typename... Components>
            requires (Component<std::remove_cvref_t<Components>> && ...)
        ORRERY_NODISCARD Entity CreateEntityWith(Components&&... components)
        {
            Entity entity = CreateEntity();
            if (!entity.IsValid())
                return entity;

            (static_cast<void>(AddComponent<std::remove_cvref_t<Components>>(entity, std::forward<Components>(components))), ...);
            return entity;
        }

        /**
         * Schedules the entity for removal from every system and release of its
         * handle at the next entity sync. The handle stays valid until then.
         */
        Result<void> DestroyEntity(Entity entity)
        {
            if (!m_entities.IsValid(entity))
                return Err(ErrorCode::InvalidEntity);

            m_commands.Push(entity, CommandKind::DestroyEntity);
            return OK;
        }

        ORRERY_NODISCARD bool IsValid(Entity entity) const noexcept { return m_entities.IsValid(entity); }

        // True once an entity sync has admitted the entity and until one removes it
        ORRERY_NODISCARD bool IsResident(Entity entity) const { return m_resident.contains(entity); }

        // ============= Components =============

        template<Component T>
        Result<ComponentID> RegisterComponent(std::string_view name = {})
        {
            return m_componentRegistry->Register<T>(name);
        }

        /**
         * Attaches or replaces a component. Membership is not re-evaluated
         * until the entity is enqueued again.
         * @return Pointer to the stored component, nullptr if the entity is invalid
         *         or T has no bit in ComponentMask
         */
        template<Component T, typename... Args>
        T* AddComponent(Entity entity, Args&&... args)
        {
            ComponentBag* bag = m_entities.Get(entity);
            if (!bag) ORRERY_UNLIKELY
            {
                m_logger.Warn("AddComponent<{}> on invalid {}", TypeID<T>::Name(), entity);
                return nullptr;
            }

            auto id = m_componentRegistry->Register<T>();
            if (!id) ORRERY_UNLIKELY
            {
                m_logger.Warn("AddComponent<{}> on {} refused: {}", TypeID<T>::Name(), entity, id.Error());
                return nullptr;
            }
            return &bag->Emplace<T>(std::forward<Args>(args)...);
        }

        template<Component T>
        bool RemoveComponent(Entity entity)
        {
            ComponentBag* bag = m_entities.Get(entity);
            return bag && bag->Remove<T>();
        }

        template<Component T>
        ORRERY_NODISCARD T* GetComponent(Entity entity)
        {
            ComponentBag* bag = m_entities.Get(entity);
            return bag ? bag->Get<T>() : nullptr;
        }

        template<Component T>
        ORRERY_NODISCARD const T* GetComponent(Entity entity) const
        {
            const ComponentBag* bag = m_entities.Get(entity);
            return bag ? bag->Get<T>() : nullptr;
        }

        template<Component T>
        ORRERY_NODISCARD bool HasComponent(Entity entity) const
        {
            const ComponentBag* bag = m_entities.Get(entity);
            return bag && bag->Has<T>();
        }

        ORRERY_NODISCARD Result<ComponentMask> GetComponentMask(Entity entity) const
        {
            const ComponentBag* bag = m_entities.Get(entity);
            if (!bag)
                return Err(ErrorCode::InvalidEntity);
            return bag->GetMask();
        }

        // ============= Systems =============

        // Stores the system without scheduling it
        ORRERY_NODISCARD SystemHandle CreateSystem(System system)
        {
            auto handle = m_systems.Create(std::move(system));
            if (!handle) ORRERY_UNLIKELY
            {
                m_logger.Error("Cannot create system: {}", handle.Error());
                return SystemHandle::Invalid();
            }
            return *handle;
        }

        // Stores the system and enqueues it for scheduling at the next system sync
        SystemHandle AddSystem(System system)
        {
            SystemHandle handle = CreateSystem(std::move(system));
            if (handle.IsValid())
            {
                m_commands.Push(handle, CommandKind::AddSystem);
            }
            return handle;
        }

        /**
         * Unschedules the system at the next system sync and releases its handle
         * afterwards. Additions of the same handle in that sync are ignored.
         */
        Result<void> DestroySystem(SystemHandle handle)
        {
            if (!m_systems.IsValid(handle))
                return Err(ErrorCode::InvalidSystem);

            m_commands.Push(handle, CommandKind::DestroySystem);
            return OK;
        }

        ORRERY_NODISCARD const System* GetSystem(SystemHandle handle) const noexcept { return m_systems.Get(handle); }
        ORRERY_NODISCARD bool IsValid(SystemHandle handle) const noexcept { return m_systems.IsValid(handle); }
        ORRERY_NODISCARD bool IsScheduled(SystemHandle handle) const { return m_scheduleIndex.contains(handle); }

        ORRERY_NODISCARD Result<bool> IsSystemActive(SystemHandle handle) const
        {
            const ScheduledSystem* entry = FindScheduled(handle);
            if (!entry)
                return Err(ErrorCode::SystemNotScheduled);
            return entry->active;
        }

        // ============= Frame =============

        Result<void> EnqueueEntity(Entity entity)
        {
            if (!m_entities.IsValid(entity))
                return Err(ErrorCode::InvalidEntity);

            m_commands.Push(entity, CommandKind::AddEntity);
            return OK;
        }

        Result<void> EnqueueSystem(SystemHandle handle)
        {
            if (!m_systems.IsValid(handle))
                return Err(ErrorCode::InvalidSystem);

            m_commands.Push(handle, CommandKind::AddSystem);
            return OK;
        }

        Result<void> DequeueEntity(Entity entity)
        {
            if (!m_entities.IsValid(entity))
                return Err(ErrorCode::InvalidEntity);

            m_commands.Push(entity, CommandKind::RemoveEntity);
            return OK;
        }

        Result<void> DequeueSystem(SystemHandle handle)
        {
            if (!m_systems.IsValid(handle))
                return Err(ErrorCode::InvalidSystem);

            m_commands.Push(handle, CommandKind::RemoveSystem);
            return OK;
        }

        /**
         * Enqueues any mix of entities and systems. Entities become pending-add,
         * systems are queued for scheduling. Invalid handles are skipped with a warning.
         * @return Number of handles accepted
         */
        template<typename... Objects>
            requires (IsHandle<Objects> && ...)
        std::size_t Enqueue(Objects... objects)
        {
            std::size_t accepted = 0;
            (Accept(EnqueueOne(objects), objects, "Enqueue", accepted), ...);
            return accepted;
        }

        // Counterpart of Enqueue: entities become pending-remove, systems are queued for removal
        template<typename... Objects>
            requires (IsHandle<Objects> && ...)
        std::size_t Dequeue(Objects... objects)
        {
            std::size_t accepted = 0;
            (Accept(DequeueOne(objects), objects, "Dequeue", accepted), ...);
            return accepted;
        }

        /**
         * Applies pending system commands: removals first, in order, each firing
         * onRemove for every member; then additions, in order, each populated
         * from the resident entities without firing onAdd.
         */
        void SyncSystems()
        {
            if (!CanSync("SyncSystems"))
                return;
            PhaseGuard guard(m_phase, Phase::SyncingSystems);

            Commands::SystemBatch batch = m_commands.TakeSystemCommands();
            if (batch.IsEmpty())
                return;

            std::size_t removed = 0;
            for (SystemHandle handle : batch.removals)
            {
                auto it = m_scheduleIndex.find(handle);
                if (it == m_scheduleIndex.end())
                    continue;

                ScheduledSystem entry = std::move(m_schedule[it->second]);
                m_schedule.erase(m_schedule.begin() + static_cast<std::ptrdiff_t>(it->second));
                RebuildScheduleIndex();
                ++removed;

                const System* system = m_systems.Get(handle);
                ORRERY_ASSERT(system != nullptr, "Scheduled system without a live slot");
                m_logger.Debug("Unscheduled {} '{}' with {} members", handle, system->GetName(), entry.members.size());

                if (system->HasRemove())
                {
                    for (Entity entity : entry.members)
                    {
                        system->InvokeRemove(entity);
                    }
                }
            }

            std::size_t added = 0;
            for (SystemHandle handle : batch.additions)
            {
                const System* system = m_systems.Get(handle);
                if (!system)
                {
                    m_logger.Warn("Skipping stale {} queued for scheduling", handle);
                    continue;
                }
                if (std::find(batch.releases.begin(), batch.releases.end(), handle) != batch.releases.end())
                {
                    m_logger.Debug("Skipping {} '{}': destroyed in the same sync", handle, system->GetName());
                    continue;
                }
                if (m_scheduleIndex.contains(handle))
                {
                    m_logger.Debug("{} '{}' is already scheduled", handle, system->GetName());
                    continue;
                }

                ScheduledSystem entry{handle, true, {}};
                const Aspect& aspect = system->GetAspect();
                for (Entity entity : m_resident)
                {
                    const ComponentBag* bag = m_entities.Get(entity);
                    if (bag && aspect.Matches(*bag))
                    {
                        entry.members.insert(entity);
                    }
                }

                m_logger.Debug("Scheduled {} '{}' with {} members", handle, system->GetName(), entry.members.size());
                m_scheduleIndex.emplace(handle, m_schedule.size());
                m_schedule.push_back(std::move(entry));
                ++added;
            }

            for (SystemHandle handle : batch.releases)
            {
                if (!m_scheduleIndex.contains(handle) && m_systems.Destroy(handle))
                {
                    m_logger.Debug("Released {}", handle);
                }
            }

            m_logger.Trace("SyncSystems: {} removed, {} added, {} scheduled", removed, added, m_schedule.size());
        }

        /**
         * Applies pending entity commands in first-command order.
         * Pending-add: the entity becomes resident; onAdd fires for each system
         * it newly matches and membership is set to the match result.
         * Pending-remove: the entity leaves residency; onRemove fires on every
         * scheduled system whether or not the entity was a member.
         * Pending-destroy: as pending-remove, then the handle is released.
         */
        void SyncEntities()
        {
            if (!CanSync("SyncEntities"))
                return;
            PhaseGuard guard(m_phase, Phase::SyncingEntities);

            std::vector<Commands::EntityCommand> commands = m_commands.TakeEntityCommands();
            for (const Commands::EntityCommand& command : commands)
            {
                if (!m_entities.IsValid(command.entity))
                {
                    m_logger.Warn("Skipping {} for stale {}", command.kind, command.entity);
                    continue;
                }

                switch (command.kind)
                {
                    case CommandKind::AddEntity:
                        AdmitEntity(command.entity);
                        break;
                    case CommandKind::RemoveEntity:
                        EvictEntity(command.entity);
                        break;
                    case CommandKind::DestroyEntity:
                        EvictEntity(command.entity);
                        m_entities.Destroy(command.entity);
                        break;
                    default:
                        ORRERY_UNREACHABLE();
                }
            }

            if (!commands.empty())
            {
                m_logger.Trace("SyncEntities: {} commands, {} resident", commands.size(), m_resident.size());
            }
        }

        /**
         * Runs one frame: system sync, entity sync, then every active system in
         * scheduling order
         */
        void Update(float dt)
        {
            if (!CanSync("Update"))
                return;

            SyncSystems();
            SyncEntities();

            PhaseGuard guard(m_phase, Phase::Updating);
            for (std::size_t i = 0; i < m_schedule.size(); ++i)
            {
                if (m_schedule[i].active)
                {
                    static_cast<void>(UpdateSystem(m_schedule[i].handle, dt));
                }
            }
        }

        /**
         * Runs a single scheduled system: preupdate once, then update for each
         * member. Sync passes requested by hooks meanwhile are refused.
         */
        Result<void> UpdateSystem(SystemHandle handle, float dt)
        {
            const System* system = m_systems.Get(handle);
            if (!system)
                return Err(ErrorCode::InvalidSystem);

            auto it = m_scheduleIndex.find(handle);
            if (it == m_scheduleIndex.end())
                return Err(ErrorCode::SystemNotScheduled);

            PhaseGuard guard(m_phase, m_phase == Phase::Idle ? Phase::Updating : m_phase);

            system->InvokePreUpdate(dt);
            if (system->HasUpdate())
            {
                for (Entity entity : m_schedule[it->second].members)
                {
                    system->InvokeUpdate(entity, dt);
                }
            }
            return OK;
        }

        // Marks every resident entity pending-remove
        void ClearEntities()
        {
            for (Entity entity : m_resident)
            {
                m_commands.Push(entity, CommandKind::RemoveEntity);
            }
        }

        // Replaces pending system removals with the whole current schedule
        void ClearSystems()
        {
            m_commands.ReplaceSystemRemovals(GetSchedule());
        }

        /**
         * Inactive systems are skipped by Update but keep tracking membership
         */
        Result<void> SetSystemActive(SystemHandle handle, bool active)
        {
            ScheduledSystem* entry = FindScheduled(handle);
            if (!entry)
                return Err(ErrorCode::SystemNotScheduled);

            entry->active = active;
            return OK;
        }

        // ============= Queries =============

        ORRERY_NODISCARD std::size_t GetEntityCount() const noexcept { return m_resident.size(); }
        ORRERY_NODISCARD std::size_t GetSystemCount() const noexcept { return m_schedule.size(); }

        // nullptr if the system is not scheduled
        ORRERY_NODISCARD const MemberSet* GetMembers(SystemHandle handle) const
        {
            const ScheduledSystem* entry = FindScheduled(handle);
            return entry ? &entry->members : nullptr;
        }

        ORRERY_NODISCARD bool IsMember(SystemHandle handle, Entity entity) const
        {
            const MemberSet* members = GetMembers(handle);
            return members && members->contains(entity);
        }

        ORRERY_NODISCARD std::vector<SystemHandle> GetSchedule() const
        {
            std::vector<SystemHandle> schedule;
            schedule.reserve(m_schedule.size());
            for (const ScheduledSystem& entry : m_schedule)
            {
                schedule.push_back(entry.handle);
            }
            return schedule;
        }

        ORRERY_NODISCARD bool HasPendingCommands() const noexcept { return !m_commands.IsEmpty(); }

        ORRERY_NODISCARD Logger& GetLogger() noexcept { return m_logger; }
        ORRERY_NODISCARD const Logger& GetLogger() const noexcept { return m_logger; }

        ORRERY_NODISCARD ComponentRegistry& GetComponentRegistry() noexcept { return *m_componentRegistry; }
        ORRERY_NODISCARD const ComponentRegistry& GetComponentRegistry() const noexcept { return *m_componentRegistry; }
        ORRERY_NODISCARD std::shared_ptr<ComponentRegistry> GetSharedComponentRegistry() const noexcept { return m_componentRegistry; }

    private:
        enum class Phase : std::uint8_t
        {
            Idle,
            SyncingSystems,
            SyncingEntities,
            Updating
        };

        static constexpr std::string_view ToString(Phase phase) noexcept
        {
            switch (phase)
            {
                case Phase::Idle: return "idle";
                case Phase::SyncingSystems: return "system sync";
                case Phase::SyncingEntities: return "entity sync";
                case Phase::Updating: return "update";
            }
            return "unknown";
        }

        class PhaseGuard
        {
        public:
            PhaseGuard(Phase& phase, Phase next) noexcept : m_phase(phase), m_previous(phase)
            {
                m_phase = next;
            }

            ~PhaseGuard() { m_phase = m_previous; }

            PhaseGuard(const PhaseGuard&) = delete;
            PhaseGuard& operator=(const PhaseGuard&) = delete;

        private:
            Phase& m_phase;
            Phase m_previous;
        };

        struct ScheduledSystem
        {
            SystemHandle handle;
            bool active = true;
            MemberSet members;
        };

        bool CanSync(std::string_view operation) const
        {
            if (m_phase == Phase::Idle)
                return true;

            m_logger.Error("{} refused during {}", operation, ToString(m_phase));
            return false;
        }

        const ScheduledSystem* FindScheduled(SystemHandle handle) const
        {
            auto it = m_scheduleIndex.find(handle);
            return it != m_scheduleIndex.end() ? &m_schedule[it->second] : nullptr;
        }

        ScheduledSystem* FindScheduled(SystemHandle handle)
        {
            auto it = m_scheduleIndex.find(handle);
            return it != m_scheduleIndex.end() ? &m_schedule[it->second] : nullptr;
        }

        void RebuildScheduleIndex()
        {
            m_scheduleIndex.clear();
            for (std::size_t i = 0; i < m_schedule.size(); ++i)
            {
                m_scheduleIndex.emplace(m_schedule[i].handle, i);
            }
        }

        void AdmitEntity(Entity entity)
        {
            m_resident.insert(entity);

            // Bag address is stable; hooks may still change its contents between systems
            const ComponentBag& bag = *m_entities.Get(entity);
            for (std::size_t i = 0; i < m_schedule.size(); ++i)
            {
                const SystemHandle handle = m_schedule[i].handle;
                const System& system = *m_systems.Get(handle);

                const bool matches = system.GetAspect().Matches(bag);
                if (matches && !m_schedule[i].members.contains(entity))
                {
                    system.InvokeAdd(entity);
                }

                if (matches)
                    m_schedule[i].members.insert(entity);
                else
                    m_schedule[i].members.erase(entity);
            }
        }

        void EvictEntity(Entity entity)
        {
            m_resident.erase(entity);

            for (std::size_t i = 0; i < m_schedule.size(); ++i)
            {
                const System& system = *m_systems.Get(m_schedule[i].handle);
                system.InvokeRemove(entity);
                m_schedule[i].members.erase(entity);
            }
        }

        Result<void> EnqueueOne(Entity entity) { return EnqueueEntity(entity); }
        Result<void> EnqueueOne(SystemHandle handle) { return EnqueueSystem(handle); }
        Result<void> DequeueOne(Entity entity) { return DequeueEntity(entity); }
        Result<void> DequeueOne(SystemHandle handle) { return DequeueSystem(handle); }

        template<typename Handle>
        void Accept(const Result<void>& result, Handle handle, std::string_view operation, std::size_t& accepted) const
        {
            if (result)
            {
                ++accepted;
                return;
            }
            m_logger.Warn("{} rejected {}: {}", operation, handle, result.Error());
        }

        HandlePool<Entity, ComponentBag> m_entities;
        HandlePool<SystemHandle, System> m_systems;
        MemberSet m_resident;
        std::vector<ScheduledSystem> m_schedule;
        std::unordered_map<SystemHandle, std::size_t> m_scheduleIndex;
        CommandBuffer m_commands;
        std::shared_ptr<ComponentRegistry> m_componentRegistry;
        Logger m_logger;
        Phase m_phase = Phase::Idle;
    };
}
