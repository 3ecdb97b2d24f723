#pragma once

#include <cstddef>

#include "Base.hpp"

#define ORRERY_VERSION_MAJOR 0
#define ORRERY_VERSION_MINOR 3
#define ORRERY_VERSION_PATCH 0

#define ORRERY_VERSION ((ORRERY_VERSION_MAJOR << 16) | (ORRERY_VERSION_MINOR << 8) | ORRERY_VERSION_PATCH)

// Upper bound on component ids usable in aspects.
// Usage: #define ORRERY_MAX_COMPONENTS 256 before including Orrery
#ifndef ORRERY_MAX_COMPONENTS
    #define ORRERY_MAX_COMPONENTS 128u
#endif

namespace Orrery
{
    namespace config
    {
        inline constexpr std::size_t MAX_COMPONENTS = ORRERY_MAX_COMPONENTS;

        inline constexpr std::size_t DEFAULT_ENTITY_CAPACITY = 256;

        inline constexpr std::size_t DEFAULT_SYSTEM_CAPACITY = 16;
    }
}
