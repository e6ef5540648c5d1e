// SPDX-FileCopyrightText: 2025 Contributors to the filelog project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file File.hpp
 * @brief Read-only POSIX file handle owned by exactly one Reader
 *
 * KEY DECISIONS:
 *
 * 1. Positional reads only:
 *    - All reads go through pread(), the kernel file position is never used
 *    - Computing a fingerprint therefore never disturbs a reader's offset, even
 *      when both operate on the same descriptor
 *
 * 2. Single ownership:
 *    - Move-only, copy deleted: a descriptor has exactly one owner
 *    - The descriptor is closed exactly once, by close() or by the destructor
 *
 * 3. Identity helpers:
 *    - size(), lastModified() and key() are answered through fstat() on the open
 *      descriptor, so they describe the file that was opened even if its path has
 *      since been renamed or replaced
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <sys/stat.h>
#include <sys/types.h>

namespace filelog::lib
{
    /**
     * Device and inode of a file. Stable across renames, reused after deletion,
     * so it is only ever used as an auxiliary identity signal.
     */
    struct FileKey
    {
        std::uint64_t device;
        std::uint64_t inode;

        [[nodiscard]]
        constexpr bool operator==(FileKey const& other) const noexcept = default;
    };

    class File
    {
    public:
        /** Default constructor: detached handle (no descriptor). */
        File() noexcept;

        /** Move constructor: transfers ownership of the descriptor. */
        File(File&& other) noexcept;

        /** Move assignment: closes the current descriptor, then takes ownership. */
        File& operator=(File&& other) noexcept;

        File(File const&) = delete;
        File& operator=(File const&) = delete;

        /** Closes the descriptor if still open. */
        ~File();

        /**
         * Open a file for reading.
         *
         * @param path Path of the file to open
         * @return The open handle
         * @throws IoException if open() fails
         */
        static File open(std::filesystem::path const& path);

        /**
         * Device and inode of the file currently at path, without opening it.
         * @throws IoException if stat() fails
         */
        static FileKey keyAt(std::filesystem::path const& path);

        [[nodiscard]]
        bool isOpen() const noexcept;

        explicit operator bool() const noexcept;

        /** The path the file was opened with. Empty for a detached handle. */
        [[nodiscard]]
        std::filesystem::path const& path() const noexcept;

        /**
         * Read up to buffer.size() bytes starting at offset.
         * Short reads are retried until the buffer is full or EOF is reached.
         *
         * @return Number of bytes read, 0 at EOF
         * @throws IoException on read failure or if the handle is detached
         */
        std::size_t readAt(std::uint64_t offset, std::span<std::uint8_t> buffer) const;

        /** @throws IoException if fstat() fails */
        [[nodiscard]]
        std::uint64_t size() const;

        /** Modification time in nanoseconds since the epoch. @throws IoException */
        [[nodiscard]]
        std::int64_t lastModified() const;

        /** @throws IoException if fstat() fails */
        [[nodiscard]]
        FileKey key() const;

        /** Close the descriptor. No-op for a detached handle. */
        void close() noexcept;

    private:
        File(int fd, std::filesystem::path path) noexcept;

        struct ::stat fileStatus() const;

        /** -1 for a detached or closed handle. */
        int _fd;
        std::filesystem::path _path;
    };

    /**************************************************************************/
    /* Inline implementation.                                                 */
    /**************************************************************************/

    inline File::File() noexcept
        : _fd{-1}
        , _path{}
    {}

    inline bool File::isOpen() const noexcept
    {
        return _fd != -1;
    }

    inline File::operator bool() const noexcept
    {
        return isOpen();
    }
}
