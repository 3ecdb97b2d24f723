#pragma once

#include <algorithm>
#include <cstddef>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

#include "../Core/Base.hpp"
#include "CommandTypes.hpp"

namespace Orrery
{
    /**
     * Pending world mutations, applied only at the two sync points.
     *
     * Entities keep one status each: re-issuing a command for the same entity
     * overwrites its kind but keeps its original position, so the entity sync
     * replays entities in first-command order with their last command.
     * System commands are kept as ordered queues.
     *
     * The World detaches a queue (Take*) before draining it, so commands pushed
     * while a sync pass runs are left for the next pass.
     *
     * Example usage:
     * @code
     * CommandBuffer buffer;
     * buffer.Push(entity, CommandKind::AddEntity);
     * buffer.Push(entity, CommandKind::RemoveEntity);   // entity is now pending-remove
     * auto commands = buffer.TakeEntityCommands();      // buffer no longer holds entity commands
     * @endcode
     */
    class CommandBuffer
    {
    public:
        using CommandKind = Commands::CommandKind;
        using EntityCommand = Commands::EntityCommand;
        using SystemBatch = Commands::SystemBatch;

        // ============= Entity Commands =============

        /**
         * Records the pending status of an entity. RemoveEntity never downgrades
         * a pending DestroyEntity; AddEntity overrides both.
         */
        void Push(Entity entity, CommandKind kind)
        {
            ORRERY_ASSERT(Commands::IsEntityCommand(kind), "System command pushed for an entity");

            auto [it, inserted] = m_entityIndex.try_emplace(entity, m_entityCommands.size());
            if (inserted)
            {
                m_entityCommands.push_back({entity, kind});
                return;
            }

            CommandKind& current = m_entityCommands[it->second].kind;
            if (current == CommandKind::DestroyEntity && kind == CommandKind::RemoveEntity)
                return;
            current = kind;
        }

        ORRERY_NODISCARD std::optional<CommandKind> GetStatus(Entity entity) const
        {
            auto it = m_entityIndex.find(entity);
            if (it == m_entityIndex.end())
                return std::nullopt;
            return m_entityCommands[it->second].kind;
        }

        ORRERY_NODISCARD std::size_t GetEntityCommandCount() const noexcept { return m_entityCommands.size(); }

        ORRERY_NODISCARD std::vector<EntityCommand> TakeEntityCommands()
        {
            m_entityIndex.clear();
            return std::exchange(m_entityCommands, {});
        }

        // ============= System Commands =============

        void Push(SystemHandle system, CommandKind kind)
        {
            switch (kind)
            {
                case CommandKind::AddSystem:
                    m_systems.additions.push_back(system);
                    break;
                case CommandKind::RemoveSystem:
                    m_systems.removals.push_back(system);
                    break;
                case CommandKind::DestroySystem:
                    m_systems.removals.push_back(system);
                    if (std::find(m_systems.releases.begin(), m_systems.releases.end(), system) == m_systems.releases.end())
                        m_systems.releases.push_back(system);
                    break;
                default:
                    ORRERY_ASSERT(false, "Entity command pushed for a system");
                    break;
            }
        }

        // Replaces the pending removal queue wholesale
        void ReplaceSystemRemovals(std::vector<SystemHandle> removals)
        {
            m_systems.removals = std::move(removals);
        }

        ORRERY_NODISCARD bool IsReleasePending(SystemHandle system) const
        {
            return std::find(m_systems.releases.begin(), m_systems.releases.end(), system) != m_systems.releases.end();
        }

        ORRERY_NODISCARD SystemBatch TakeSystemCommands()
        {
            return std::exchange(m_systems, {});
        }

        // ============= Queries =============

        ORRERY_NODISCARD bool HasEntityCommands() const noexcept { return !m_entityCommands.empty(); }
        ORRERY_NODISCARD bool HasSystemCommands() const noexcept { return !m_systems.IsEmpty(); }
        ORRERY_NODISCARD bool IsEmpty() const noexcept { return !HasEntityCommands() && !HasSystemCommands(); }

        void Clear() noexcept
        {
            m_entityCommands.clear();
            m_entityIndex.clear();
            m_systems = {};
        }

    private:
        std::vector<EntityCommand> m_entityCommands;
        std::unordered_map<Entity, std::size_t> m_entityIndex;
        SystemBatch m_systems;
    };
}
