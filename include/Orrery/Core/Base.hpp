#pragma once

#include "Platform.hpp"

// Base macros shared by every Orrery header

#ifdef __has_builtin
    #define ORRERY_HAS_BUILTIN(x) __has_builtin(x)
#else
    #define ORRERY_HAS_BUILTIN(x) 0
#endif

#define ORRERY_NODISCARD [[nodiscard]]
#define ORRERY_LIKELY [[likely]]
#define ORRERY_UNLIKELY [[unlikely]]

#if defined(ORRERY_COMPILER_MSVC)
    #define ORRERY_UNREACHABLE() __assume(0)
#elif defined(ORRERY_COMPILER_GCC) || defined(ORRERY_COMPILER_CLANG)
    #if ORRERY_HAS_BUILTIN(__builtin_unreachable)
        #define ORRERY_UNREACHABLE() __builtin_unreachable()
    #else
        #define ORRERY_UNREACHABLE() ((void)0)
    #endif
#endif

// Internal invariant checks, compiled out of release builds
#ifdef ORRERY_BUILD_DEBUG
    #include <cassert>
    #define ORRERY_ASSERT(condition, message) assert((condition) && (message))
#else
    #define ORRERY_ASSERT(condition, message) ((void)0)
#endif
