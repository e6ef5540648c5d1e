// SPDX-FileCopyrightText: 2025 Contributors to the filelog project.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>
#include <filelog-internal/Reader.hpp>

namespace filelog::tests
{
    //
    // RAII helper that provides an empty directory for the duration of a test
    //
    class TempDirectoryFixture
    {
    public:
        /// Create the fixture. Creates a new unique directory.
        TempDirectoryFixture();
        /// Delete the directory and everything in it
        ~TempDirectoryFixture();

    protected:
        /// The path to the directory
        std::filesystem::path directory;
    };

    // Replace the content of a file, creating it if needed
    void writeFile(std::filesystem::path const& filepath, std::string_view content);

    // Append to a file, creating it if needed
    void appendFile(std::filesystem::path const& filepath, std::string_view content);

    // Simple utility to read a file into a string
    std::string readFile(std::filesystem::path const& filepath);

    // Byte vector of a string, for fingerprint comparisons
    std::vector<std::uint8_t> bytesOf(std::string_view text);

    // Helper to make a unique temp directory
    auto makeTempDirectory() -> std::filesystem::path;

    //
    // Thread-safe sink that keeps every record it receives
    //
    class RecordCollector
    {
    public:
        /// A consumer that appends to this collector. The collector must outlive it.
        lib::RecordConsumer consumer();

        /// Bodies of the collected records in arrival order
        std::vector<std::string> bodies() const;

        /// Bodies of the records collected from one path, in arrival order
        std::vector<std::string> bodies(std::filesystem::path const& path) const;

        std::vector<lib::Record> records() const;

        void clear();

    private:
        mutable std::mutex _mutex;
        std::vector<lib::Record> _records;
    };

} // namespace filelog::tests
