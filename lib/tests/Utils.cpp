// SPDX-FileCopyrightText: 2025 Contributors to the filelog project.
// SPDX-License-Identifier: Apache-2.0

#include "Utils.hpp"
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace filelog::tests
{
    TempDirectoryFixture::TempDirectoryFixture()
        : directory{makeTempDirectory()}
    {}

    TempDirectoryFixture::~TempDirectoryFixture()
    {
        auto ec = std::error_code{};
        std::filesystem::remove_all(directory, ec);
    }

    void writeFile(std::filesystem::path const& filepath, std::string_view content)
    {
        auto ofs = std::ofstream{filepath, std::ios::out | std::ios::binary | std::ios::trunc};
        if (!ofs)
        {
            throw std::runtime_error("Failed to open file for writing: " + filepath.string());
        }
        ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
    }

    void appendFile(std::filesystem::path const& filepath, std::string_view content)
    {
        auto ofs = std::ofstream{filepath, std::ios::out | std::ios::binary | std::ios::app};
        if (!ofs)
        {
            throw std::runtime_error("Failed to open file for appending: " + filepath.string());
        }
        ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
    }

    std::string readFile(std::filesystem::path const& filepath)
    {
        auto ifs = std::ifstream{filepath, std::ios::in | std::ios::binary};
        if (!ifs)
        {
            throw std::runtime_error("Failed to open file: " + filepath.string());
        }
        return std::string{std::istreambuf_iterator<char>{ifs}, std::istreambuf_iterator<char>{}};
    }

    std::vector<std::uint8_t> bytesOf(std::string_view text)
    {
        return std::vector<std::uint8_t>{text.begin(), text.end()};
    }

    auto makeTempDirectory() -> std::filesystem::path
    {
        auto pattern = (std::filesystem::temp_directory_path() / "filelog_test_XXXXXX").string();
        if (::mkdtemp(pattern.data()) == nullptr)
        {
            throw std::runtime_error("Failed to create temporary directory: " + pattern);
        }
        return pattern;
    }

    lib::RecordConsumer RecordCollector::consumer()
    {
        return [this](lib::Record&& record)
        {
            auto const lock = std::lock_guard{_mutex};
            _records.push_back(std::move(record));
        };
    }

    std::vector<std::string> RecordCollector::bodies() const
    {
        auto const lock = std::lock_guard{_mutex};
        auto result = std::vector<std::string>{};
        for (auto const& record : _records)
        {
            result.push_back(record.body);
        }
        return result;
    }

    std::vector<std::string> RecordCollector::bodies(std::filesystem::path const& path) const
    {
        auto const lock = std::lock_guard{_mutex};
        auto result = std::vector<std::string>{};
        for (auto const& record : _records)
        {
            if (record.attributes->path == path.string())
            {
                result.push_back(record.body);
            }
        }
        return result;
    }

    std::vector<lib::Record> RecordCollector::records() const
    {
        auto const lock = std::lock_guard{_mutex};
        return _records;
    }

    void RecordCollector::clear()
    {
        auto const lock = std::lock_guard{_mutex};
        _records.clear();
    }
}
