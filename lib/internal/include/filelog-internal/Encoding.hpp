// SPDX-FileCopyrightText: 2025 Contributors to the filelog project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Encoding.hpp
 * @brief Character encoding of the tailed files
 *
 * An Encoding turns the raw bytes of one record into UTF-8 text. It also exposes the
 * encoded form of the newline character so the default splitter can find record
 * boundaries in UTF-16 files.
 *
 * Supported names (case-insensitive):
 *   nop       -- bytes are passed through untouched
 *   utf-8     -- bytes must be valid UTF-8 (alias: utf8)
 *   ascii     -- bytes must be 7-bit (alias: us-ascii)
 *   utf-16le  -- little endian UTF-16, converted to UTF-8
 *   utf-16be  -- big endian UTF-16, converted to UTF-8
 */

#pragma once

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace filelog::lib
{
    struct EncodingConfig
    {
        std::string name = "utf-8";
    };

    class Encoding
    {
    public:
        virtual ~Encoding();

        /** Canonical name of the encoding, e.g. "utf-16le". */
        [[nodiscard]]
        virtual std::string_view name() const noexcept = 0;

        /** The newline character in this encoding. */
        [[nodiscard]]
        virtual std::span<std::uint8_t const> newline() const noexcept = 0;

        /**
         * Decode the bytes of one record.
         * @throws Exception (FILELOG_ERR_DECODE) if the bytes are not valid in this encoding
         */
        [[nodiscard]]
        virtual std::string decode(std::span<std::uint8_t const> bytes) const = 0;
    };

    /**
     * Build the encoding named by the configuration.
     * @throws Exception (FILELOG_ERR_CONFIGURATION) for an unknown name
     */
    std::shared_ptr<Encoding const> buildEncoding(EncodingConfig const& config);
}
