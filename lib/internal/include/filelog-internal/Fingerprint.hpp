// SPDX-FileCopyrightText: 2025 Contributors to the filelog project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Fingerprint.hpp
 * @brief Content based identity of a log file
 *
 * A fingerprint is the first N bytes of a file (N = the configured fingerprint size).
 * Paths are not a usable identity for log files: a rotator renames the file and a new
 * file appears at the old path. The first bytes of a file however do not change while
 * the file is appended to, and differ between the rotated file and its replacement.
 *
 * Comparison rules:
 * - Equal byte sequences are the same file at the same growth point
 * - A fingerprint that starts with another one is the same file, grown since
 * - An empty fingerprint (empty file) carries no identity and is a prefix of everything,
 *   callers must not use prefix containment alone to match it
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>
#include "filelog-internal/File.hpp"

namespace filelog::lib
{
    class Fingerprint
    {
    public:
        /** Empty fingerprint. */
        Fingerprint() = default;

        explicit Fingerprint(std::vector<std::uint8_t> firstBytes);

        /**
         * Capture the first maxSize bytes of a file.
         * Uses positional reads, the offset of any reader sharing the file is untouched.
         *
         * @throws IoException if the file cannot be read
         */
        static Fingerprint compute(File const& file, std::size_t maxSize);

        /** Independent copy. Extending the copy never affects this fingerprint. */
        [[nodiscard]]
        Fingerprint copy() const;

        /** True if prefix's bytes are a prefix of (or equal to) this fingerprint's bytes. */
        [[nodiscard]]
        bool startsWith(Fingerprint const& prefix) const noexcept;

        /**
         * Grow the fingerprint with bytes that were read from the file at position.
         * Only the part of the bytes that directly continues the current fingerprint is
         * appended, and never beyond maxSize. Chunks that start past the end of the
         * fingerprint are ignored.
         */
        void extend(std::uint64_t position, std::span<std::uint8_t const> bytes, std::size_t maxSize);

        [[nodiscard]]
        bool empty() const noexcept;

        [[nodiscard]]
        std::size_t size() const noexcept;

        [[nodiscard]]
        std::vector<std::uint8_t> const& bytes() const noexcept;

        /** Lowercase hex rendering of the bytes, used by checkpoints and log messages. */
        [[nodiscard]]
        std::string toHex() const;

        /** @throws Exception (FILELOG_ERR_INVALID_ARG) if hex is not valid hexadecimal */
        static Fingerprint fromHex(std::string const& hex);

        [[nodiscard]]
        bool operator==(Fingerprint const& other) const noexcept = default;

    private:
        std::vector<std::uint8_t> _firstBytes;
    };
}
