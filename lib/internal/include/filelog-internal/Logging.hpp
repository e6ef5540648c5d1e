// SPDX-FileCopyrightText: 2025 Contributors to the filelog project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Logging.hpp
 * @brief Logging macros for filelog internal diagnostics
 *
 * This file provides a thin wrapper around spdlog for all filelog internal logging.
 * - All macros wrap log calls in try/catch: logging never throws, so the macros are
 *   safe in catch handlers, destructors and noexcept functions
 * - In debug builds (NDEBUG not defined), TRACE and DEBUG logs are compiled in
 * - In release builds, TRACE and DEBUG calls compile to nothing
 * - Runtime log level is controlled by the FILELOG_LOG_LEVEL environment variable,
 *   applied once by initializeLogging()
 *
 * Context is passed as explicit key=value fields in each message, e.g.
 *   FILELOG_WARN("Failed to open file. path={} error={}", path, e.what());
 */

#pragma once

// In debug mode we keep all log statements.
// In release mode we only consider info and up.
// See : https://github.com/gabime/spdlog/wiki/0.-FAQ#how-to-remove-all-debug-statements-at-compile-time-
#ifndef SPDLOG_ACTIVE_LEVEL
#   ifndef NDEBUG
#      define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#   else
#      define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_INFO
#   endif
#endif

#include <spdlog/spdlog.h>

/**
 * FILELOG_TRACE: per-record and per-chunk traces of the read loop.
 * Only compiled in debug builds. Exception-safe.
 */
#define FILELOG_TRACE(...)             \
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
 * FILELOG_DEBUG: reconciliation decisions (new reader, continued reader, clone).
 * Only compiled in debug builds. Exception-safe.
 */
#define FILELOG_DEBUG(...)             \
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
 * FILELOG_INFO: manager start/stop, checkpoint restore, file retirement.
 * Compiled in all builds. Exception-safe.
 */
#define FILELOG_INFO(...)             \
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
 * FILELOG_WARN: recoverable per-file failures (open, read, decode, attributes).
 * The file is retried in the next poll cycle. Exception-safe.
 */
#define FILELOG_WARN(...)             \
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
 * FILELOG_ERROR: failures that affect a whole cycle (discovery, checkpoint storage).
 * Compiled in all builds. Exception-safe.
 */
#define FILELOG_ERROR(...)             \
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
 * FILELOG_CRITICAL: unexpected failures that escape a poll cycle.
 * Compiled in all builds. Exception-safe.
 */
#define FILELOG_CRITICAL(...)             \
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

namespace filelog::lib
{
    /**
     * Apply the FILELOG_LOG_LEVEL environment variable (trace, debug, info, warn,
     * error, critical, off) to the default spdlog logger.
     * Thread-safe, only the first call has an effect.
     */
    void initializeLogging();
}
