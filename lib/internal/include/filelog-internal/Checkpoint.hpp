// SPDX-FileCopyrightText: 2025 Contributors to the filelog project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Checkpoint.hpp
 * @brief JSON snapshot of the tracked readers
 *
 * Format (version 1):
 * @code
 * {
 *   "version": 1,
 *   "files": [
 *     {
 *       "fingerprint": "48656c6c6f",
 *       "offset": "5",
 *       "attributes": {
 *         "name": "app.log",
 *         "path": "/var/log/app.log",
 *         "resolvedName": "app.log",
 *         "resolvedPath": "/var/log/app.log",
 *         "device": "2049",
 *         "inode": "131090"
 *       }
 *     }
 *   ]
 * }
 * @endcode
 *
 * Fingerprints are hex encoded. Offset, device and inode are decimal strings since JSON
 * numbers can not represent every 64 bit value. Device and inode are omitted when the
 * key is unknown.
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "filelog-internal/FileAttributes.hpp"
#include "filelog-internal/Fingerprint.hpp"

namespace filelog::lib
{
    /** Persister key of the tracked reader snapshot. */
    constexpr auto const CHECKPOINT_KEY = "filelog.knownFiles";

    constexpr auto const CHECKPOINT_VERSION = 1;

    struct CheckpointEntry
    {
        Fingerprint fingerprint;
        std::uint64_t offset;
        FileAttributes attributes;
    };

    [[nodiscard]]
    std::string encodeCheckpoint(std::vector<CheckpointEntry> const& entries);

    /**
     * @throws Exception (FILELOG_ERR_CHECKPOINT) if the text is not a valid version 1 checkpoint
     */
    [[nodiscard]]
    std::vector<CheckpointEntry> decodeCheckpoint(std::string const& text);
}
