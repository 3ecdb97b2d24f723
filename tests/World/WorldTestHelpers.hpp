#pragma once

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

#include "Orrery/World/World.hpp"
#include "../TestComponents.hpp"

namespace Orrery::Test
{
    // Records every hook invocation of one system
    struct HookRecord
    {
        int preUpdates = 0;
        std::vector<Entity> updated;
        std::vector<Entity> added;
        std::vector<Entity> removed;

        static std::size_t Count(const std::vector<Entity>& calls, Entity entity)
        {
            return static_cast<std::size_t>(std::count(calls.begin(), calls.end(), entity));
        }

        void Clear()
        {
            preUpdates = 0;
            updated.clear();
            added.clear();
            removed.clear();
        }
    };

    inline System Recorded(std::string name, Aspect aspect, HookRecord& record)
    {
        System system(std::move(name), std::move(aspect));
        system.OnPreUpdate([&record](float) { ++record.preUpdates; })
              .OnUpdate([&record](Entity entity, float) { record.updated.push_back(entity); })
              .OnAdd([&record](Entity entity) { record.added.push_back(entity); })
              .OnRemove([&record](Entity entity) { record.removed.push_back(entity); });
        return system;
    }

    inline WorldConfig MakeConfig(CapturedLog& log, LogLevel level = LogLevel::Debug)
    {
        WorldConfig config;
        config.logLevel = level;
        config.logSink = log.Sink();
        return config;
    }
}
