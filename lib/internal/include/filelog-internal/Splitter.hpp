// SPDX-FileCopyrightText: 2025 Contributors to the filelog project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Splitter.hpp
 * @brief Record boundary detection
 *
 * A SplitFunc looks at the unconsumed bytes of a Reader and decides where the next
 * record ends. It is called repeatedly with a growing view until it returns a token.
 *
 * Contract:
 * - Returns std::nullopt while no complete record is present in the view
 * - Returns Token{advance, length} for a complete record: the record is the first
 *   `length` bytes of the view, and the Reader moves its offset by `advance` bytes
 *   (length <= advance, the difference being the delimiter)
 * - A token with length 0 is a bare delimiter and yields no record
 * - atEof is true when the view ends at the current end of the file
 *
 * Available strategies:
 * - newline (default): one record per line, trailing CR removed
 * - multiline start: a new record begins at every line matching line_start_pattern
 * - multiline end: a record ends with every line matching line_end_pattern
 *
 * With flushAtEof a trailing partial record is emitted when the end of the file is
 * reached, otherwise it is held back until its delimiter is written.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include "filelog-internal/Encoding.hpp"

namespace filelog::lib
{
    struct Token
    {
        /** Number of bytes the Reader consumes. */
        std::size_t advance;
        /** Number of leading bytes that make up the record. */
        std::size_t length;

        [[nodiscard]]
        constexpr bool operator==(Token const& other) const noexcept = default;
    };

    using SplitFunc = std::function<std::optional<Token>(std::span<std::uint8_t const> data, bool atEof)>;

    struct SplitterConfig
    {
        /** ECMAScript regex. A record starts at each line that contains a match. */
        std::optional<std::string> lineStartPattern;
        /** ECMAScript regex. A record ends with each line that contains a match. */
        std::optional<std::string> lineEndPattern;
        /** Emit a trailing partial record at end of file. */
        bool flushAtEof = false;
    };

    /**
     * Build the split function described by the configuration for the given encoding.
     *
     * @throws Exception (FILELOG_ERR_CONFIGURATION) if both patterns are set, if a pattern
     *         is not a valid regex or if a multiline pattern is combined with an encoding
     *         whose newline is not a single byte
     */
    SplitFunc buildSplitFunc(SplitterConfig const& config, Encoding const& encoding);
}
