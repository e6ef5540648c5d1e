// SPDX-FileCopyrightText: 2025 Contributors to the filelog project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file filelog.cpp
 * @brief C entry points: version query and status names.
 *
 * The version numbers are injected by the build system through the
 * FILELOG_VERSION_MAJOR / MINOR / BUGFIX compile definitions.
 */

#include <filelog/filelog.h>

#ifndef FILELOG_VERSION_MAJOR
#   define FILELOG_VERSION_MAJOR 0
#endif
#ifndef FILELOG_VERSION_MINOR
#   define FILELOG_VERSION_MINOR 0
#endif
#ifndef FILELOG_VERSION_BUGFIX
#   define FILELOG_VERSION_BUGFIX 0
#endif

#define FILELOG_STRINGIFY_IMPL(x) #x
#define FILELOG_STRINGIFY(x)      FILELOG_STRINGIFY_IMPL(x)

namespace
{
    constexpr char const VERSION_STRING[] = FILELOG_STRINGIFY(FILELOG_VERSION_MAJOR) "." FILELOG_STRINGIFY(
        FILELOG_VERSION_MINOR) "." FILELOG_STRINGIFY(FILELOG_VERSION_BUGFIX);
}

extern "C"
FILELOG_EXPORT
filelogStatus filelogGetVersion(filelogVersionType* out_version)
{
    if (out_version == nullptr)
    {
        return FILELOG_ERR_INVALID_ARG;
    }

    out_version->major = FILELOG_VERSION_MAJOR;
    out_version->minor = FILELOG_VERSION_MINOR;
    out_version->bugfix = FILELOG_VERSION_BUGFIX;
    out_version->full = VERSION_STRING;
    return FILELOG_STATUS_OK;
}

extern "C"
FILELOG_EXPORT
char const* filelogStatusToString(filelogStatus status)
{
    switch (status)
    {
        case FILELOG_STATUS_OK:                return "FILELOG_STATUS_OK";
        case FILELOG_ERR_UNKNOWN:              return "FILELOG_ERR_UNKNOWN";
        case FILELOG_ERR_IO:                   return "FILELOG_ERR_IO";
        case FILELOG_ERR_CONFIGURATION:        return "FILELOG_ERR_CONFIGURATION";
        case FILELOG_ERR_DECODE:               return "FILELOG_ERR_DECODE";
        case FILELOG_ERR_ATTRIBUTE_RESOLUTION: return "FILELOG_ERR_ATTRIBUTE_RESOLUTION";
        case FILELOG_ERR_INVALID_STATE:        return "FILELOG_ERR_INVALID_STATE";
        case FILELOG_ERR_INVALID_ARG:          return "FILELOG_ERR_INVALID_ARG";
        case FILELOG_ERR_CHECKPOINT:           return "FILELOG_ERR_CHECKPOINT";
        default:                               return "UNKNOWN";
    }
}
