// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file feature_flags.h
 * @brief Unified feature flags header for edgefirst_sync
 *
 * Central entry point for feature detection and integration flags.
 *
 * Feature categories:
 * - EDGEFIRST_SYNC_HAS_* : Local feature availability (Arrow container I/O)
 * - KCENON_WITH_*        : System integration flags (inherited from common_system)
 *
 * Usage:
 * @code
 * #include <edgefirst/sync/config/feature_flags.h>
 *
 * #if EDGEFIRST_SYNC_HAS_ARROW
 *     write_arrow_file(table, path);
 * #endif
 * @endcode
 */

#pragma once

//==============================================================================
// Include common_system feature flags if available
//==============================================================================

#if __has_include(<kcenon/common/config/feature_flags.h>)
#include <kcenon/common/config/feature_flags.h>
#define EDGEFIRST_SYNC_HAS_COMMON_FEATURE_FLAGS 1
#else
#define EDGEFIRST_SYNC_HAS_COMMON_FEATURE_FLAGS 0
#endif

//==============================================================================
// Local Feature Flags
//==============================================================================

/**
 * @brief Apache Arrow IPC container support
 *
 * Set via CMake option EDGEFIRST_SYNC_ENABLE_ARROW when Arrow C++ is found.
 */
#ifndef EDGEFIRST_SYNC_HAS_ARROW
    #if defined(EDGEFIRST_SYNC_ENABLE_ARROW)
        #define EDGEFIRST_SYNC_HAS_ARROW 1
    #else
        #define EDGEFIRST_SYNC_HAS_ARROW 0
    #endif
#endif

//==============================================================================
// System Integration Flags
//==============================================================================

#ifndef KCENON_WITH_COMMON_SYSTEM
    #if defined(BUILD_WITH_COMMON_SYSTEM)
        #define KCENON_WITH_COMMON_SYSTEM 1
    #else
        #define KCENON_WITH_COMMON_SYSTEM 0
    #endif
#endif

// thread_system integration (worker executor)
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

// network_system integration (HTTPS client)
#ifndef KCENON_WITH_NETWORK_SYSTEM
    #if defined(BUILD_WITH_NETWORK_SYSTEM)
        #define KCENON_WITH_NETWORK_SYSTEM 1
    #else
        #define KCENON_WITH_NETWORK_SYSTEM 0
    #endif
#endif

//==============================================================================
// Logger System Integration Helper
//==============================================================================

/**
 * @brief Whether log records are routed through logger_system
 *
 * logger_system needs common_system for its result types.
 */
#ifndef EDGEFIRST_SYNC_USE_LOGGER_SYSTEM
    #if KCENON_WITH_LOGGER_SYSTEM && KCENON_WITH_COMMON_SYSTEM
        #define EDGEFIRST_SYNC_USE_LOGGER_SYSTEM 1
    #else
        #define EDGEFIRST_SYNC_USE_LOGGER_SYSTEM 0
    #endif
#endif

//==============================================================================
// Feature Summary (for debugging)
//==============================================================================

#ifdef EDGEFIRST_SYNC_PRINT_FEATURE_SUMMARY
#pragma message("=== edgefirst_sync Feature Summary ===")
#if EDGEFIRST_SYNC_HAS_ARROW
    #pragma message("  Arrow IPC: Enabled")
#else
    #pragma message("  Arrow IPC: Disabled")
#endif
#if KCENON_WITH_THREAD_SYSTEM
    #pragma message("  thread_system: Available")
#else
    #pragma message("  thread_system: Not Available")
#endif
#if KCENON_WITH_LOGGER_SYSTEM
    #pragma message("  logger_system: Available")
#else
    #pragma message("  logger_system: Not Available")
#endif
#if KCENON_WITH_NETWORK_SYSTEM
    #pragma message("  network_system: Available")
#else
    #pragma message("  network_system: Not Available")
#endif
#pragma message("======================================")
#endif  // EDGEFIRST_SYNC_PRINT_FEATURE_SUMMARY
