#pragma once

#include <iostream>

// Set to 1 to enable debug output, 0 to disable
#ifndef PLANAR_ENABLE_DEBUG
#define PLANAR_ENABLE_DEBUG 0
#endif

// Debug levels
#define DEBUG_LEVEL_NONE 0
#define DEBUG_LEVEL_BASIC 1
#define DEBUG_LEVEL_VERBOSE 2

// Set current debug level
#ifndef PLANAR_DEBUG_LEVEL
#define PLANAR_DEBUG_LEVEL DEBUG_LEVEL_BASIC
#endif

// Debug macros
#define DEBUG_MSG(level, x) do { \
    if (PLANAR_ENABLE_DEBUG && (level) <= PLANAR_DEBUG_LEVEL) { \
        std::cout << x; \
    } \
} while(0)

// Warnings are always emitted; they report isolated failures inside a tick
#define WARN_MSG(tag, x) do { \
    std::cerr << "[" << (tag) << "] Warning: " << x << "\n"; \
} while(0)
