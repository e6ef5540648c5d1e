// SPDX-FileCopyrightText: 2025 Contributors to the filelog project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file FileFinder.hpp
 * @brief Discovery of the candidate log files of a poll cycle
 */

#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace filelog::lib
{
    /**
     * Abstract interface for path discovery.
     * The Manager calls findFiles() once at the start of every poll cycle.
     */
    class FileFinder
    {
    public:
        virtual ~FileFinder();

        /**
         * The current set of candidate paths, without duplicates.
         * Paths that vanish between discovery and open are handled by the caller.
         */
        [[nodiscard]]
        virtual std::vector<std::filesystem::path> findFiles() const = 0;
    };

    /**
     * Shell glob discovery: every regular file matching one of the include patterns
     * (glob(3)) and none of the exclude patterns (fnmatch(3) against the full path).
     * The result is sorted.
     */
    class GlobFileFinder final : public FileFinder
    {
    public:
        GlobFileFinder(std::vector<std::string> include, std::vector<std::string> exclude);

        [[nodiscard]]
        std::vector<std::filesystem::path> findFiles() const override;

    private:
        std::vector<std::string> _include;
        std::vector<std::string> _exclude;
    };
}
