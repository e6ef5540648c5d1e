// SPDX-FileCopyrightText: 2025 Contributors to the filelog project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file test_config.cpp
 * @brief Unit tests for JSON configuration parsing and validation
 */

#include <chrono>
#include <catch2/catch_test_macros.hpp>
#include <filelog-internal/ConfigParser.hpp>
#include <filelog-internal/Exception.hpp>

using namespace filelog::lib;

namespace
{
    bool isConfigurationError(std::string const& json)
    {
        try
        {
            (void)ConfigParser{json};
        }
        catch (Exception const& e)
        {
            return e.status() == FILELOG_ERR_CONFIGURATION;
        }
        return false;
    }
}

TEST_CASE("Empty configuration keeps the defaults", "[config]")
{
    auto const parser = ConfigParser{""};
    auto const& config = parser.config();
    REQUIRE(config.include.empty());
    REQUIRE(config.exclude.empty());
    REQUIRE(config.reader.startAt == StartAt::End);
    REQUIRE(config.reader.fingerprintSize == 1000);
    REQUIRE(config.reader.maxLogSize == 1024 * 1024);
    REQUIRE(config.reader.encoding.name == "utf-8");
    REQUIRE_FALSE(config.reader.splitter.flushAtEof);
    REQUIRE_FALSE(config.reader.splitter.lineStartPattern);
    REQUIRE(config.maxConcurrentFiles == 1024);
    REQUIRE(config.pollInterval == std::chrono::milliseconds{200});
    REQUIRE(config.lostFileRetentionCycles == 3);
    REQUIRE(config.workerCount == 4);

    REQUIRE(ConfigParser{"{}"}.config().workerCount == 4);
}

TEST_CASE("All keys are parsed", "[config]")
{
    auto const parser = ConfigParser{R"({
        "include": ["/var/log/*.log", "/srv/*/app.log"],
        "exclude": ["*.gz"],
        "start_at": "beginning",
        "fingerprint_size": 64,
        "max_log_size": 4096,
        "max_concurrent_files": 8,
        "poll_interval_ms": 50,
        "lost_file_retention_cycles": 0,
        "worker_count": 2,
        "encoding": "utf-16le",
        "flush_at_eof": true,
        "multiline": { "line_start_pattern": "^\\d{4}-" },
        "some_future_key": 1
    })"};
    auto const& config = parser.config();

    REQUIRE(config.include == std::vector<std::string>{"/var/log/*.log", "/srv/*/app.log"});
    REQUIRE(config.exclude == std::vector<std::string>{"*.gz"});
    REQUIRE(config.reader.startAt == StartAt::Beginning);
    REQUIRE(config.reader.fingerprintSize == 64);
    REQUIRE(config.reader.maxLogSize == 4096);
    REQUIRE(config.maxConcurrentFiles == 8);
    REQUIRE(config.pollInterval == std::chrono::milliseconds{50});
    REQUIRE(config.lostFileRetentionCycles == 0);
    REQUIRE(config.workerCount == 2);
    REQUIRE(config.reader.encoding.name == "utf-16le");
    REQUIRE(config.reader.splitter.flushAtEof);
    REQUIRE(config.reader.splitter.lineStartPattern == std::optional<std::string>{"^\\d{4}-"});
    REQUIRE_FALSE(config.reader.splitter.lineEndPattern);
}

TEST_CASE("Malformed configuration is rejected", "[config]")
{
    REQUIRE(isConfigurationError("{"));
    REQUIRE(isConfigurationError("[]"));
    REQUIRE(isConfigurationError(R"({"include": "/var/log/*.log"})"));
    REQUIRE(isConfigurationError(R"({"include": [1]})"));
    REQUIRE(isConfigurationError(R"({"start_at": "middle"})"));
    REQUIRE(isConfigurationError(R"({"fingerprint_size": 8})"));
    REQUIRE(isConfigurationError(R"({"fingerprint_size": "big"})"));
    REQUIRE(isConfigurationError(R"({"max_log_size": 0})"));
    REQUIRE(isConfigurationError(R"({"max_concurrent_files": 0})"));
    REQUIRE(isConfigurationError(R"({"max_concurrent_files": 1.5})"));
    REQUIRE(isConfigurationError(R"({"poll_interval_ms": 0})"));
    REQUIRE(isConfigurationError(R"({"lost_file_retention_cycles": -1})"));
    REQUIRE(isConfigurationError(R"({"worker_count": 0})"));
    REQUIRE(isConfigurationError(R"({"encoding": 8})"));
    REQUIRE(isConfigurationError(R"({"flush_at_eof": "yes"})"));
    REQUIRE(isConfigurationError(R"({"multiline": "^a"})"));
}

TEST_CASE("Numbers above their upper bound are rejected", "[config]")
{
    REQUIRE(isConfigurationError(R"({"fingerprint_size": 1e30})"));
    REQUIRE(isConfigurationError(R"({"fingerprint_size": 65537})"));
    REQUIRE(isConfigurationError(R"({"max_log_size": 1e300})"));
    REQUIRE(isConfigurationError(R"({"max_concurrent_files": 18446744073709551616})"));
    REQUIRE(isConfigurationError(R"({"poll_interval_ms": 86400001})"));
    REQUIRE(isConfigurationError(R"({"lost_file_retention_cycles": 1e20})"));
    REQUIRE(isConfigurationError(R"({"worker_count": 257})"));

    auto const parser = ConfigParser{R"({"fingerprint_size": 65536, "worker_count": 256, "poll_interval_ms": 86400000})"};
    REQUIRE(parser.config().reader.fingerprintSize == MAX_FINGERPRINT_SIZE);
    REQUIRE(parser.config().workerCount == MAX_WORKER_COUNT);
    REQUIRE(parser.config().pollInterval == MAX_POLL_INTERVAL);
}

TEST_CASE("Configuration validation", "[config]")
{
    auto config = ConfigParser{R"({"include": ["*.log"]})"}.config();
    REQUIRE_NOTHROW(validateConfig(config));

    auto noInclude = config;
    noInclude.include.clear();
    REQUIRE_THROWS_AS(validateConfig(noInclude), Exception);

    auto noWorkers = config;
    noWorkers.workerCount = 0;
    REQUIRE_THROWS_AS(validateConfig(noWorkers), Exception);

    auto noHandles = config;
    noHandles.maxConcurrentFiles = 0;
    REQUIRE_THROWS_AS(validateConfig(noHandles), Exception);

    auto hugeFingerprint = config;
    hugeFingerprint.reader.fingerprintSize = MAX_FINGERPRINT_SIZE + 1;
    REQUIRE_THROWS_AS(validateConfig(hugeFingerprint), Exception);

    auto tooManyWorkers = config;
    tooManyWorkers.workerCount = MAX_WORKER_COUNT + 1;
    REQUIRE_THROWS_AS(validateConfig(tooManyWorkers), Exception);
}
