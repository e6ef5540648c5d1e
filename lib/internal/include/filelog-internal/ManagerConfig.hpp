// SPDX-FileCopyrightText: 2025 Contributors to the filelog project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file ManagerConfig.hpp
 * @brief Every policy of a Manager, resolved once at startup
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>
#include "filelog-internal/ReaderFactory.hpp"

namespace filelog::lib
{
    struct ManagerConfig
    {
        /** glob(3) patterns of the files to tail. Must not be empty. */
        std::vector<std::string> include;
        /** fnmatch(3) patterns of discovered paths to ignore. */
        std::vector<std::string> exclude;
        /** Fingerprint size, record size limit, start position, splitter and encoding. */
        ReaderFactoryConfig reader;
        /** Upper bound of open file handles after reconciliation. */
        std::size_t maxConcurrentFiles = 1024;
        std::chrono::milliseconds pollInterval{200};
        /** Number of consecutive cycles a vanished file is remembered. */
        std::size_t lostFileRetentionCycles = 3;
        /** Number of threads reading files in parallel. */
        std::size_t workerCount = 4;
    };

    constexpr auto const MIN_FINGERPRINT_SIZE = std::size_t{16};
    /** Every candidate allocates this much on every cycle. */
    constexpr auto const MAX_FINGERPRINT_SIZE = std::size_t{64 * 1024};
    constexpr auto const MAX_LOG_SIZE = std::size_t{256 * 1024 * 1024};
    constexpr auto const MAX_CONCURRENT_FILES = std::size_t{1024 * 1024};
    constexpr auto const MAX_POLL_INTERVAL = std::chrono::milliseconds{std::chrono::hours{24}};
    constexpr auto const MAX_LOST_FILE_RETENTION_CYCLES = std::size_t{1024 * 1024};
    constexpr auto const MAX_WORKER_COUNT = std::size_t{256};

    /**
     * Check the value ranges of a configuration.
     * @throws Exception (FILELOG_ERR_CONFIGURATION) naming the first offending field
     */
    void validateConfig(ManagerConfig const& config);
}
