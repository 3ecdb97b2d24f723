#pragma once

// Compiler Detection
#if defined(_MSC_VER) && !defined(__clang__)
    #define ORRERY_COMPILER_MSVC 1
#elif defined(__clang__)
    #define ORRERY_COMPILER_CLANG 1
#elif defined(__GNUC__) || defined(__GNUG__)
    #define ORRERY_COMPILER_GCC 1
#else
    #error "Unknown compiler"
#endif

#if !defined(NDEBUG) && !defined(ORRERY_BUILD_DEBUG)
    #define ORRERY_BUILD_DEBUG 1
#endif
