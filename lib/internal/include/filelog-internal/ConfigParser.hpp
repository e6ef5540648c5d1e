// SPDX-FileCopyrightText: 2025 Contributors to the filelog project.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>
#include <picojson/picojson.h>
#include "filelog-internal/ManagerConfig.hpp"

namespace filelog::lib
{
    /**
     * Parses a Manager configuration from JSON.
     * Keys that are absent keep their default value, unknown keys are logged and ignored.
     */
    class ConfigParser
    {
    public:
        /**
         * @param in_config JSON object (may be empty for an all-default configuration)
         * @throws Exception (FILELOG_ERR_CONFIGURATION) on malformed JSON, a wrong type or
         *         an out of range value
         */
        explicit ConfigParser(std::string const& in_config);

        [[nodiscard]]
        ManagerConfig const& config() const noexcept;

    private:
        void parseMultiline(picojson::value const& value);

        ManagerConfig _config;
    };
}
