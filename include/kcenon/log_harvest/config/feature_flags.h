// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file feature_flags.h
 * @brief Unified feature flags header for log_harvest
 *
 * Central entry point for system integration flags. Include this header to
 * get the KCENON_WITH_* macros and the LOG_HARVEST_USE_LOGGER_SYSTEM switch.
 *
 * The flags are set by CMake compile definitions (BUILD_WITH_*) when the
 * corresponding kcenon ecosystem module was found at configure time.
 *
 * Usage:
 * @code
 * #include <kcenon/log_harvest/config/feature_flags.h>
 *
 * #if KCENON_WITH_THREAD_SYSTEM
 *     pool->enqueue(std::move(job));
 * #endif
 * @endcode
 */

#pragma once

//==============================================================================
// System Integration Flags
//==============================================================================

// common_system integration (required by logger_system)
#ifndef KCENON_WITH_COMMON_SYSTEM
    #if defined(BUILD_WITH_COMMON_SYSTEM)
        #define KCENON_WITH_COMMON_SYSTEM 1
    #else
        #define KCENON_WITH_COMMON_SYSTEM 0
    #endif
#endif

// thread_system integration (worker pool for chunk and fleet tasks)
#ifndef KCENON_WITH_THREAD_SYSTEM
    #if defined(BUILD_WITH_THREAD_SYSTEM)
        #define KCENON_WITH_THREAD_SYSTEM 1
    #else
        #define KCENON_WITH_THREAD_SYSTEM 0
    #endif
#endif

// logger_system integration (structured logging)
#ifndef KCENON_WITH_LOGGER_SYSTEM
    #if defined(BUILD_WITH_LOGGER_SYSTEM)
        #define KCENON_WITH_LOGGER_SYSTEM 1
    #else
        #define KCENON_WITH_LOGGER_SYSTEM 0
    #endif
#endif

//==============================================================================
// Logger System Integration Helper
//==============================================================================

/**
 * @brief Unified flag for logger_system usage in log_harvest
 *
 * logger_system depends on common_system, so both must be present.
 */
#ifndef LOG_HARVEST_USE_LOGGER_SYSTEM
    #if KCENON_WITH_LOGGER_SYSTEM && KCENON_WITH_COMMON_SYSTEM
        #define LOG_HARVEST_USE_LOGGER_SYSTEM 1
    #else
        #define LOG_HARVEST_USE_LOGGER_SYSTEM 0
    #endif
#endif

//==============================================================================
// Feature Summary (for debugging)
//==============================================================================

#ifdef LOG_HARVEST_PRINT_FEATURE_SUMMARY

#pragma message("=== Log Harvest Feature Summary ===")

#if KCENON_WITH_THREAD_SYSTEM
    #pragma message("  thread_system: Enabled")
#else
    #pragma message("  thread_system: Disabled (std::async pool)")
#endif

#if LOG_HARVEST_USE_LOGGER_SYSTEM
    #pragma message("  logger_system: Enabled")
#else
    #pragma message("  logger_system: Disabled (stderr output)")
#endif

#endif  // LOG_HARVEST_PRINT_FEATURE_SUMMARY
