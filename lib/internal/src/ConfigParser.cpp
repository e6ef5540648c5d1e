// SPDX-FileCopyrightText: 2025 Contributors to the filelog project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file ConfigParser.cpp
 * @brief Parses the Manager configuration from JSON
 *
 * Example JSON:
 * @code
 * {
 *   "include": ["/var/log/app/*.log"],
 *   "exclude": ["*.gz"],
 *   "start_at": "beginning",
 *   "fingerprint_size": 1000,
 *   "max_log_size": 1048576,
 *   "max_concurrent_files": 1024,
 *   "poll_interval_ms": 200,
 *   "lost_file_retention_cycles": 3,
 *   "worker_count": 4,
 *   "encoding": "utf-8",
 *   "flush_at_eof": false,
 *   "multiline": { "line_start_pattern": "^\\d{4}-\\d{2}-\\d{2}" }
 * }
 * @endcode
 */

#include "filelog-internal/ConfigParser.hpp"
#include <cmath>
#include "filelog-internal/Exception.hpp"
#include "filelog-internal/Logging.hpp"

namespace filelog::lib
{
    namespace
    {
        std::vector<std::string> parseStringArray(picojson::value const& value, char const* key)
        {
            if (!value.is<picojson::array>())
            {
                throw Exception::configuration("{} must be an array of strings.", key);
            }

            auto result = std::vector<std::string>{};
            for (auto const& item : value.get<picojson::array>())
            {
                if (!item.is<std::string>())
                {
                    throw Exception::configuration("{} must be an array of strings.", key);
                }
                result.push_back(item.get<std::string>());
            }
            return result;
        }

        std::size_t parseCount(picojson::value const& value, char const* key, std::size_t minimum, std::size_t maximum)
        {
            if (!value.is<double>())
            {
                throw Exception::configuration("{} must be a number.", key);
            }

            // Checked on the double before the conversion. NaN fails both comparisons.
            auto const v = value.get<double>();
            if (!(v >= static_cast<double>(minimum)) || !(v <= static_cast<double>(maximum)) || (v != std::floor(v)))
            {
                throw Exception::configuration("{} must be an integer between {} and {}.", key, minimum, maximum);
            }
            return static_cast<std::size_t>(v);
        }

        std::string parseString(picojson::value const& value, char const* key)
        {
            if (!value.is<std::string>())
            {
                throw Exception::configuration("{} must be a string.", key);
            }
            return value.get<std::string>();
        }
    }

    ConfigParser::ConfigParser(std::string const& in_config)
    {
        // Empty configuration means use all defaults
        if (in_config.empty())
        {
            return;
        }

        auto jsonValue = picojson::value{};
        auto const err = picojson::parse(jsonValue, in_config);
        if (!err.empty())
        {
            throw Exception::configuration("Invalid JSON configuration. {}", err);
        }
        if (!jsonValue.is<picojson::object>())
        {
            throw Exception::configuration("Expected a JSON object as configuration.");
        }

        for (auto const& [key, value] : jsonValue.get<picojson::object>())
        {
            if (key == "include")
            {
                _config.include = parseStringArray(value, "include");
            }
            else if (key == "exclude")
            {
                _config.exclude = parseStringArray(value, "exclude");
            }
            else if (key == "start_at")
            {
                auto const startAt = parseString(value, "start_at");
                if (startAt == "beginning")
                {
                    _config.reader.startAt = StartAt::Beginning;
                }
                else if (startAt == "end")
                {
                    _config.reader.startAt = StartAt::End;
                }
                else
                {
                    throw Exception::configuration("start_at must be 'beginning' or 'end', got '{}'.", startAt);
                }
            }
            else if (key == "fingerprint_size")
            {
                _config.reader.fingerprintSize = parseCount(value, "fingerprint_size", MIN_FINGERPRINT_SIZE, MAX_FINGERPRINT_SIZE);
            }
            else if (key == "max_log_size")
            {
                _config.reader.maxLogSize = parseCount(value, "max_log_size", 1, MAX_LOG_SIZE);
            }
            else if (key == "max_concurrent_files")
            {
                _config.maxConcurrentFiles = parseCount(value, "max_concurrent_files", 1, MAX_CONCURRENT_FILES);
            }
            else if (key == "poll_interval_ms")
            {
                _config.pollInterval = std::chrono::milliseconds{parseCount(value, "poll_interval_ms", 1, static_cast<std::size_t>(MAX_POLL_INTERVAL.count()))};
            }
            else if (key == "lost_file_retention_cycles")
            {
                _config.lostFileRetentionCycles = parseCount(value, "lost_file_retention_cycles", 0, MAX_LOST_FILE_RETENTION_CYCLES);
            }
            else if (key == "worker_count")
            {
                _config.workerCount = parseCount(value, "worker_count", 1, MAX_WORKER_COUNT);
            }
            else if (key == "encoding")
            {
                _config.reader.encoding.name = parseString(value, "encoding");
            }
            else if (key == "flush_at_eof")
            {
                if (!value.is<bool>())
                {
                    throw Exception::configuration("flush_at_eof must be a boolean.");
                }
                _config.reader.splitter.flushAtEof = value.get<bool>();
            }
            else if (key == "multiline")
            {
                parseMultiline(value);
            }
            else
            {
                FILELOG_WARN("Ignoring unknown configuration key. key={}", key);
            }
        }
    }

    ManagerConfig const& ConfigParser::config() const noexcept
    {
        return _config;
    }

    void ConfigParser::parseMultiline(picojson::value const& value)
    {
        if (!value.is<picojson::object>())
        {
            throw Exception::configuration("multiline must be an object.");
        }

        for (auto const& [key, pattern] : value.get<picojson::object>())
        {
            if (key == "line_start_pattern")
            {
                _config.reader.splitter.lineStartPattern = parseString(pattern, "multiline.line_start_pattern");
            }
            else if (key == "line_end_pattern")
            {
                _config.reader.splitter.lineEndPattern = parseString(pattern, "multiline.line_end_pattern");
            }
            else
            {
                FILELOG_WARN("Ignoring unknown configuration key. key=multiline.{}", key);
            }
        }
    }

    void validateConfig(ManagerConfig const& config)
    {
        if (config.include.empty())
        {
            throw Exception::configuration("include must name at least one pattern.");
        }
        if ((config.reader.fingerprintSize < MIN_FINGERPRINT_SIZE) || (config.reader.fingerprintSize > MAX_FINGERPRINT_SIZE))
        {
            throw Exception::configuration("fingerprint_size must be between {} and {}.", MIN_FINGERPRINT_SIZE, MAX_FINGERPRINT_SIZE);
        }
        if ((config.reader.maxLogSize < 1) || (config.reader.maxLogSize > MAX_LOG_SIZE))
        {
            throw Exception::configuration("max_log_size must be between 1 and {}.", MAX_LOG_SIZE);
        }
        if ((config.maxConcurrentFiles < 1) || (config.maxConcurrentFiles > MAX_CONCURRENT_FILES))
        {
            throw Exception::configuration("max_concurrent_files must be between 1 and {}.", MAX_CONCURRENT_FILES);
        }
        if ((config.pollInterval.count() < 1) || (config.pollInterval > MAX_POLL_INTERVAL))
        {
            throw Exception::configuration("poll_interval_ms must be between 1 and {}.", MAX_POLL_INTERVAL.count());
        }
        if (config.lostFileRetentionCycles > MAX_LOST_FILE_RETENTION_CYCLES)
        {
            throw Exception::configuration("lost_file_retention_cycles must be at most {}.", MAX_LOST_FILE_RETENTION_CYCLES);
        }
        if ((config.workerCount < 1) || (config.workerCount > MAX_WORKER_COUNT))
        {
            throw Exception::configuration("worker_count must be between 1 and {}.", MAX_WORKER_COUNT);
        }
    }
}
