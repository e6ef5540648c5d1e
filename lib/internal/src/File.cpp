// SPDX-FileCopyrightText: 2025 Contributors to the filelog project.
// SPDX-License-Identifier: Apache-2.0

#include "filelog-internal/File.hpp"
#include <utility>
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#include "filelog-internal/Exception.hpp"

namespace filelog::lib
{
    File::File(int fd, std::filesystem::path path) noexcept
        : _fd{fd}
        , _path{std::move(path)}
    {}

    File::File(File&& other) noexcept
        : _fd{std::exchange(other._fd, -1)}
        , _path{std::move(other._path)}
    {}

    File& File::operator=(File&& other) noexcept
    {
        if (this != &other)
        {
            close();
            _fd = std::exchange(other._fd, -1);
            _path = std::move(other._path);
        }
        return *this;
    }

    File::~File()
    {
        close();
    }

    File File::open(std::filesystem::path const& path)
    {
        auto const fd = posixCall(
            [](char const* p) { return ::open(p, O_RDONLY | O_CLOEXEC); }, fmt::format("Failed to open '{}'", path.string()), path.c_str());
        return File{fd, path};
    }

    FileKey File::keyAt(std::filesystem::path const& path)
    {
        struct ::stat st;
        posixCall(::stat, fmt::format("Failed to stat '{}'", path.string()), path.c_str(), &st);
        return FileKey{static_cast<std::uint64_t>(st.st_dev), static_cast<std::uint64_t>(st.st_ino)};
    }

    std::filesystem::path const& File::path() const noexcept
    {
        return _path;
    }

    std::size_t File::readAt(std::uint64_t offset, std::span<std::uint8_t> buffer) const
    {
        if (!isOpen())
        {
            throw IoException::make(EBADF, "Cannot read from a detached file handle.");
        }

        auto total = std::size_t{0};
        while (total < buffer.size())
        {
            auto const n = posixCall(::pread,
                "Failed to read file",
                _fd,
                static_cast<void*>(buffer.data() + total),
                buffer.size() - total,
                static_cast<::off_t>(offset + total));
            if (n == 0)
            {
                break;
            }
            total += static_cast<std::size_t>(n);
        }
        return total;
    }

    struct ::stat File::fileStatus() const
    {
        if (!isOpen())
        {
            throw IoException::make(EBADF, "Cannot stat a detached file handle.");
        }

        struct ::stat st;
        posixCall(::fstat, fmt::format("Failed to stat '{}'", _path.string()), _fd, &st);
        return st;
    }

    std::uint64_t File::size() const
    {
        return static_cast<std::uint64_t>(fileStatus().st_size);
    }

    std::int64_t File::lastModified() const
    {
        auto const st = fileStatus();
        return static_cast<std::int64_t>(st.st_mtim.tv_sec) * 1'000'000'000LL + st.st_mtim.tv_nsec;
    }

    FileKey File::key() const
    {
        auto const st = fileStatus();
        return FileKey{static_cast<std::uint64_t>(st.st_dev), static_cast<std::uint64_t>(st.st_ino)};
    }

    void File::close() noexcept
    {
        if (_fd != -1)
        {
            // The descriptor is released even when close() reports an error.
            ::close(_fd);
            _fd = -1;
        }
    }
}
