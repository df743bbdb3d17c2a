#pragma once

#include <iostream>

// Set to 1 to enable debug output, 0 to disable
#ifndef ACCRETION_ENABLE_DEBUG
#define ACCRETION_ENABLE_DEBUG 0
#endif

// Debug levels
#define DEBUG_LEVEL_NONE 0
#define DEBUG_LEVEL_BASIC 1
#define DEBUG_LEVEL_VERBOSE 2

// Set current debug level
#define CURRENT_DEBUG_LEVEL DEBUG_LEVEL_BASIC

// Debug macros
#define DEBUG_MSG(level, x) do { \
    if (ACCRETION_ENABLE_DEBUG && level <= CURRENT_DEBUG_LEVEL) { \
        std::cerr << x; \
    } \
} while(0)
