// SPDX-FileCopyrightText: 2025 Contributors to the upath project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Logging.hpp
 * @brief Exception-safe logging macros for upath internal diagnostics
 *
 * Thin wrapper around spdlog:
 * - Every macro swallows exceptions thrown by the logger so that a failing sink can never
 *   turn a successful path reservation into an error
 * - Debug builds (NDEBUG not defined) keep TRACE and DEBUG statements
 * - Release builds compile TRACE and DEBUG to nothing
 * - Runtime levels are read once from the UPATH_LOG_LEVEL environment variable, see initializeLogging()
 */

#pragma once

// See : https://github.com/gabime/spdlog/wiki/0.-FAQ#how-to-remove-all-debug-statements-at-compile-time-
#ifndef SPDLOG_ACTIVE_LEVEL
#   ifndef NDEBUG
#      define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#   else
#      define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_INFO
#   endif
#endif

#include <spdlog/spdlog.h>

namespace upath::lib
{
    /** Name of the environment variable holding the runtime log levels, in spdlog syntax ("debug", "info,upath=trace", ...). */
    constexpr auto const LOG_LEVEL_ENV_VAR = "UPATH_LOG_LEVEL";

    /**
     * Apply the levels found in UPATH_LOG_LEVEL to the spdlog registry.
     * Only the first call has an effect; later calls return immediately.
     */
    void initializeLogging();
}

/**
 * UPATH_TRACE: Per-candidate detail (collisions, retries)
 * Only compiled in debug builds. Exception-safe.
 */
#define UPATH_TRACE(...)               \
    do                                 \
    {                                  \
        try                            \
        {                              \
            SPDLOG_TRACE(__VA_ARGS__); \
        }                              \
        catch (...)                    \
        {}                             \
    }                                  \
    while (false)

/**
 * UPATH_DEBUG: Development diagnostics (generator configuration, obtained paths)
 * Only compiled in debug builds. Exception-safe.
 */
#define UPATH_DEBUG(...)               \
    do                                 \
    {                                  \
        try                            \
        {                              \
            SPDLOG_DEBUG(__VA_ARGS__); \
        }                              \
        catch (...)                    \
        {}                             \
    }                                  \
    while (false)

/**
 * UPATH_INFO: Informational logging
 * Compiled in all builds. Exception-safe.
 */
#define UPATH_INFO(...)               \
    do                                \
    {                                 \
        try                           \
        {                             \
            SPDLOG_INFO(__VA_ARGS__); \
        }                             \
        catch (...)                   \
        {}                            \
    }                                 \
    while (false)

/**
 * UPATH_WARN: Recoverable anomalies, exhausted retry loops, reservations that could not be released
 * Compiled in all builds. Exception-safe.
 */
#define UPATH_WARN(...)               \
    do                                \
    {                                 \
        try                           \
        {                             \
            SPDLOG_WARN(__VA_ARGS__); \
        }                             \
        catch (...)                   \
        {}                            \
    }                                 \
    while (false)

/**
 * UPATH_ERROR: Operation failures reported to the caller at the C boundary
 * Compiled in all builds. Exception-safe.
 */
#define UPATH_ERROR(...)               \
    do                                 \
    {                                  \
        try                            \
        {                              \
            SPDLOG_ERROR(__VA_ARGS__); \
        }                              \
        catch (...)                    \
        {}                             \
    }                                  \
    while (false)

/**
 * UPATH_CRITICAL: Failures that leave the library unable to continue (out of memory)
 * Compiled in all builds. Exception-safe.
 */
#define UPATH_CRITICAL(...)               \
    do                                    \
    {                                     \
        try                               \
        {                                 \
            SPDLOG_CRITICAL(__VA_ARGS__); \
        }                                 \
        catch (...)                       \
        {}                                \
    }                                     \
    while (false)
