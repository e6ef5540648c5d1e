// SPDX-FileCopyrightText: 2025 Contributors to the filelog project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Logging.cpp
 * @brief Runtime initialization of the logging infrastructure
 *
 * The logging macros are defined in Logging.hpp. This translation unit only applies
 * the FILELOG_LOG_LEVEL environment variable once per process. The Manager calls
 * initializeLogging() from its constructor.
 */

#include "filelog-internal/Logging.hpp"
#include <cstdlib>
#include <mutex>
#include <string>

namespace filelog::lib
{
    namespace
    {
        constexpr auto const LOG_LEVEL_ENV_VAR = "FILELOG_LOG_LEVEL";
    }

    void initializeLogging()
    {
        static std::once_flag once;
        std::call_once(once,
            []()
            {
                if (auto const value = std::getenv(LOG_LEVEL_ENV_VAR); value != nullptr)
                {
                    // spdlog maps unknown names to "off", which would silence everything.
                    auto const level = spdlog::level::from_str(value);
                    if ((level != spdlog::level::off) || (std::string{value} == "off"))
                    {
                        spdlog::set_level(level);
                    }
                    else
                    {
                        SPDLOG_WARN("Ignoring unknown log level. {}={}", LOG_LEVEL_ENV_VAR, value);
                    }
                }
            });
    }
}
