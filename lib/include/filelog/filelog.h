// SPDX-FileCopyrightText: 2025 Contributors to the filelog project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file filelog.h
 * @brief Status codes and versioning of the filelog tailing engine.
 *
 * The engine itself is a C++ library (see filelog-internal/Manager.hpp). This header
 * carries the parts that are shared with C callers and tools:
 *
 *   1. **filelogStatus**      -- The error categories reported by the engine. Every
 *                                filelog exception carries one of these values.
 *   2. **filelogVersionType** -- Semantic version of the library at runtime.
 */

#pragma once

#ifdef __cplusplus
#   include <cstdint>
#else
#   include <stdint.h>
#endif

#include <filelog/platform.h>

#ifdef __cplusplus
extern "C"
{
#endif

    /**
     * Error categories of the filelog engine.
     *
     * Per-file categories (IO, DECODE, ATTRIBUTE_RESOLUTION) never abort a poll
     * cycle. CONFIGURATION is only ever raised while a Manager is being built.
     */
    typedef enum filelogStatus
    {
        FILELOG_STATUS_OK,                   /**< Success.                                                        */
        FILELOG_ERR_UNKNOWN,                 /**< An unexpected internal error occurred.                          */
        FILELOG_ERR_IO,                      /**< Open, read, seek or stat failed on a file.                      */
        FILELOG_ERR_CONFIGURATION,           /**< The splitter, encoding or manager configuration is invalid.     */
        FILELOG_ERR_DECODE,                  /**< The encoding rejected the bytes of a record.                    */
        FILELOG_ERR_ATTRIBUTE_RESOLUTION,    /**< File attributes could not be resolved. Never fatal.             */
        FILELOG_ERR_INVALID_STATE,           /**< The object is not in a state that allows the call.              */
        FILELOG_ERR_INVALID_ARG,             /**< An argument is NULL or otherwise invalid.                       */
        FILELOG_ERR_CHECKPOINT,              /**< A persisted checkpoint could not be decoded.                    */
    } filelogStatus;

    /**
     * Semantic-versioning information for the filelog library.
     * The `full` string is owned by the library and must NOT be freed by the caller.
     */
    typedef struct filelogVersionType
    {
        uint16_t    major;  /**< Incremented on breaking API changes.     */
        uint16_t    minor;  /**< Incremented on compatible additions.     */
        uint16_t    bugfix; /**< Incremented on compatible bug fixes.     */
        char const* full;   /**< Human-readable version, e.g. "0.3.1".    */
    } filelogVersionType;

    /**
     * Retrieve the version of the filelog library that is currently linked.
     *
     * @param[out] out_version Filled with the version information. Must not be NULL.
     * @return FILELOG_STATUS_OK on success, FILELOG_ERR_INVALID_ARG if \p out_version is NULL.
     */
    FILELOG_EXPORT
    filelogStatus filelogGetVersion(filelogVersionType* out_version);

    /**
     * Human readable name of a status code ("FILELOG_ERR_IO", ...).
     * The returned string is static and must not be freed.
     */
    FILELOG_EXPORT
    char const* filelogStatusToString(filelogStatus status);

#ifdef __cplusplus
}
#endif
