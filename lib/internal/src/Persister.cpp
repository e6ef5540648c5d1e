// SPDX-FileCopyrightText: 2025 Contributors to the filelog project.
// SPDX-License-Identifier: Apache-2.0

#include "filelog-internal/Persister.hpp"
#include <cerrno>
#include <fstream>
#include <iterator>
#include <system_error>
#include <utility>
#include "filelog-internal/Exception.hpp"
#include "filelog-internal/Logging.hpp"

namespace filelog::lib
{
    namespace
    {
        constexpr auto const STATE_FILE_SUFFIX = ".json";
        constexpr auto const TEMPORARY_FILE_SUFFIX = ".tmp";
    }

    Persister::~Persister() = default;

    std::optional<std::string> MemoryPersister::get(std::string const& key) const
    {
        auto const lock = std::lock_guard{_mutex};
        if (auto const it = _values.find(key); it != _values.end())
        {
            return it->second;
        }
        return std::nullopt;
    }

    void MemoryPersister::set(std::string const& key, std::string const& value)
    {
        auto const lock = std::lock_guard{_mutex};
        _values[key] = value;
    }

    DirectoryPersister::DirectoryPersister(std::filesystem::path directory)
        : _directory{std::move(directory)}
    {
        auto ec = std::error_code{};
        std::filesystem::create_directories(_directory, ec);
        if (ec)
        {
            throw IoException::make(ec.value(), "Failed to create state directory '{}': {}", _directory.string(), ec.message());
        }
    }

    std::optional<std::string> DirectoryPersister::get(std::string const& key) const
    {
        auto const path = makeStateFilePath(_directory, key);
        auto ec = std::error_code{};
        if (!std::filesystem::exists(path, ec))
        {
            return std::nullopt;
        }

        auto ifs = std::ifstream{path, std::ios::in | std::ios::binary};
        if (!ifs)
        {
            throw IoException::make(errno, "Failed to open state file '{}'.", path.string());
        }
        return std::string{std::istreambuf_iterator<char>{ifs}, std::istreambuf_iterator<char>{}};
    }

    void DirectoryPersister::set(std::string const& key, std::string const& value)
    {
        auto const path = makeStateFilePath(_directory, key);
        auto temporary = path;
        temporary += TEMPORARY_FILE_SUFFIX;

        {
            auto ofs = std::ofstream{temporary, std::ios::out | std::ios::binary | std::ios::trunc};
            if (!ofs)
            {
                throw IoException::make(errno, "Failed to create state file '{}'.", temporary.string());
            }
            ofs << value;
            ofs.flush();
            if (!ofs)
            {
                throw IoException::make(errno, "Failed to write state file '{}'.", temporary.string());
            }
        }

        auto ec = std::error_code{};
        std::filesystem::rename(temporary, path, ec);
        if (ec)
        {
            throw IoException::make(ec.value(), "Failed to replace state file '{}': {}", path.string(), ec.message());
        }
        FILELOG_TRACE("Stored state. path={} bytes={}", path.string(), value.size());
    }

    std::filesystem::path const& DirectoryPersister::directory() const noexcept
    {
        return _directory;
    }

    std::filesystem::path makeStateFilePath(std::filesystem::path const& directory, std::string const& key)
    {
        return directory / (key + STATE_FILE_SUFFIX);
    }
}
