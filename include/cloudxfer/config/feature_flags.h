// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file feature_flags.h
 * @brief Unified feature flags header for cloudxfer
 *
 * Central entry point for integration flags. Include this header to get
 * the KCENON_WITH_* and CLOUDXFER_* feature macros.
 *
 * Feature categories:
 * - KCENON_WITH_*     : System integration flags (inherited from common_system)
 * - CLOUDXFER_USE_*   : Derived switches consumed by cloudxfer sources
 *
 * Usage:
 * @code
 * #include "cloudxfer/config/feature_flags.h"
 *
 * #if CLOUDXFER_USE_LOGGER_SYSTEM
 *     logger_->log(level, message);
 * #endif
 * @endcode
 */

#pragma once

//==============================================================================
// Include common_system feature flags if available
//==============================================================================

#if defined(BUILD_WITH_COMMON_SYSTEM) && __has_include(<kcenon/common/config/feature_flags.h>)
#include <kcenon/common/config/feature_flags.h>
#define CLOUDXFER_HAS_COMMON_FEATURE_FLAGS 1
#else
#define CLOUDXFER_HAS_COMMON_FEATURE_FLAGS 0
#endif

//==============================================================================
// System integration flags
//==============================================================================

// When common_system feature_flags.h is available, these are already defined.

#ifndef KCENON_WITH_COMMON_SYSTEM
    #if defined(BUILD_WITH_COMMON_SYSTEM)
        #define KCENON_WITH_COMMON_SYSTEM 1
    #else
        #define KCENON_WITH_COMMON_SYSTEM 0
    #endif
#endif

#ifndef KCENON_WITH_LOGGER_SYSTEM
    #if defined(BUILD_WITH_LOGGER_SYSTEM)
        #define KCENON_WITH_LOGGER_SYSTEM 1
    #else
        #define KCENON_WITH_LOGGER_SYSTEM 0
    #endif
#endif

//==============================================================================
// Derived switches
//==============================================================================

/**
 * @brief Route log records through logger_system
 *
 * logger_system integration requires common_system.
 */
#ifndef CLOUDXFER_USE_LOGGER_SYSTEM
    #if KCENON_WITH_LOGGER_SYSTEM && KCENON_WITH_COMMON_SYSTEM
        #define CLOUDXFER_USE_LOGGER_SYSTEM 1
    #else
        #define CLOUDXFER_USE_LOGGER_SYSTEM 0
    #endif
#endif

//==============================================================================
// Feature summary (for debugging)
//==============================================================================

#ifdef CLOUDXFER_PRINT_FEATURE_SUMMARY
    #if KCENON_WITH_COMMON_SYSTEM
        #pragma message("cloudxfer: common_system integration ENABLED")
    #endif
    #if CLOUDXFER_USE_LOGGER_SYSTEM
        #pragma message("cloudxfer: logger_system integration ENABLED")
    #else
        #pragma message("cloudxfer: built-in console logger")
    #endif
#endif  // CLOUDXFER_PRINT_FEATURE_SUMMARY
