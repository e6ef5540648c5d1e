// SPDX-FileCopyrightText: 2025 Contributors to the filelog project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Persister.hpp
 * @brief Key/value store for checkpoints
 *
 * The Manager does not own a persistence mechanism. It serializes its tracked readers
 * into a string and hands it to a Persister under a fixed key; on start it asks for the
 * most recent value of that key.
 *
 * Implementations:
 * - MemoryPersister: process lifetime only, used by tests and --once runs without state
 * - DirectoryPersister: one file per key in a state directory
 *
 *   ${stateDirectory}/
 *     ${key}.json          -- Latest value of the key
 *     ${key}.json.tmp      -- Written first, then renamed over ${key}.json
 */

#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace filelog::lib
{
    class Persister
    {
    public:
        virtual ~Persister();

        /**
         * The latest value stored under key.
         * @throws IoException if the store cannot be read
         */
        [[nodiscard]]
        virtual std::optional<std::string> get(std::string const& key) const = 0;

        /**
         * Replace the value stored under key.
         * @throws IoException if the store cannot be written
         */
        virtual void set(std::string const& key, std::string const& value) = 0;
    };

    class MemoryPersister final : public Persister
    {
    public:
        [[nodiscard]]
        std::optional<std::string> get(std::string const& key) const override;

        void set(std::string const& key, std::string const& value) override;

    private:
        mutable std::mutex _mutex;
        std::map<std::string, std::string> _values;
    };

    class DirectoryPersister final : public Persister
    {
    public:
        /**
         * @param directory The state directory, created if it does not exist.
         * @throws IoException if the directory cannot be created
         */
        explicit DirectoryPersister(std::filesystem::path directory);

        [[nodiscard]]
        std::optional<std::string> get(std::string const& key) const override;

        /** Writes a temporary file and renames it over the previous value. */
        void set(std::string const& key, std::string const& value) override;

        [[nodiscard]]
        std::filesystem::path const& directory() const noexcept;

    private:
        std::filesystem::path _directory;
    };

    /**
     * Path of the file that stores a key.
     * Example: makeStateFilePath("/var/lib/filelog", "filelog.knownFiles") -> "/var/lib/filelog/filelog.knownFiles.json"
     */
    std::filesystem::path makeStateFilePath(std::filesystem::path const& directory, std::string const& key);
}
