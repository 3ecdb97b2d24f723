#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include <fmt/format.h>

#include "../Core/Base.hpp"
#include "../Entity/Entity.hpp"

namespace Orrery::Commands
{
    enum class CommandKind : std::uint8_t
    {
        // ============= Entity Commands =============
        AddEntity,
        RemoveEntity,
        DestroyEntity,      // Remove, then release the arena slot

        // ============= System Commands =============
        AddSystem,
        RemoveSystem,
        DestroySystem       // Remove, then release the arena slot
    };

    ORRERY_NODISCARD constexpr bool IsEntityCommand(CommandKind kind) noexcept
    {
        return kind == CommandKind::AddEntity ||
               kind == CommandKind::RemoveEntity ||
               kind == CommandKind::DestroyEntity;
    }

    ORRERY_NODISCARD constexpr std::string_view ToString(CommandKind kind) noexcept
    {
        switch (kind)
        {
            case CommandKind::AddEntity: return "AddEntity";
            case CommandKind::RemoveEntity: return "RemoveEntity";
            case CommandKind::DestroyEntity: return "DestroyEntity";
            case CommandKind::AddSystem: return "AddSystem";
            case CommandKind::RemoveSystem: return "RemoveSystem";
            case CommandKind::DestroySystem: return "DestroySystem";
        }
        return "Unknown";
    }

    /**
     * Final pending status of one entity for the next entity sync
     */
    struct EntityCommand
    {
        Entity entity;
        CommandKind kind;
    };

    /**
     * Pending system commands detached for one system sync.
     * Removals are drained before additions; releases run last.
     */
    struct SystemBatch
    {
        std::vector<SystemHandle> removals;
        std::vector<SystemHandle> additions;
        std::vector<SystemHandle> releases;

        ORRERY_NODISCARD bool IsEmpty() const noexcept
        {
            return removals.empty() && additions.empty() && releases.empty();
        }
    };
}

template<>
struct fmt::formatter<Orrery::Commands::CommandKind> : fmt::formatter<std::string_view>
{
    template<typename FormatContext>
    auto format(Orrery::Commands::CommandKind kind, FormatContext& ctx) const
    {
        return fmt::formatter<std::string_view>::format(Orrery::Commands::ToString(kind), ctx);
    }
};
