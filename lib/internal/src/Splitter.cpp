// SPDX-FileCopyrightText: 2025 Contributors to the filelog project.
// SPDX-License-Identifier: Apache-2.0

#include "filelog-internal/Splitter.hpp"
#include <algorithm>
#include <array>
#include <memory>
#include <regex>
#include <vector>
#include "filelog-internal/Exception.hpp"

namespace filelog::lib
{
    namespace
    {
        using Bytes = std::span<std::uint8_t const>;

        /** Position of the first newline at or after from, aligned to the newline width. */
        std::optional<std::size_t> findNewline(Bytes data, Bytes newline, std::size_t from)
        {
            auto const width = newline.size();
            for (auto i = from; i + width <= data.size(); i += width)
            {
                if (std::equal(newline.begin(), newline.end(), data.begin() + i))
                {
                    return i;
                }
            }
            return std::nullopt;
        }

        /** The carriage return in the encoding of the given newline. */
        std::vector<std::uint8_t> carriageReturnFor(Bytes newline)
        {
            auto cr = std::vector<std::uint8_t>{newline.begin(), newline.end()};
            std::ranges::replace(cr, std::uint8_t{0x0A}, std::uint8_t{0x0D});
            return cr;
        }

        /** Length of data[0, length) without trailing carriage returns. */
        std::size_t trimCarriageReturn(Bytes data, std::size_t length, std::vector<std::uint8_t> const& cr)
        {
            while ((length >= cr.size()) && std::equal(cr.begin(), cr.end(), data.begin() + (length - cr.size())))
            {
                length -= cr.size();
            }
            return length;
        }

        /** Length of data[0, length) without trailing CR and LF bytes. */
        std::size_t trimLineBreaks(Bytes data, std::size_t length)
        {
            while ((length > 0) && ((data[length - 1] == 0x0A) || (data[length - 1] == 0x0D)))
            {
                --length;
            }
            return length;
        }

        std::optional<Token> flush(Bytes data, bool atEof, bool flushAtEof)
        {
            if (atEof && flushAtEof && !data.empty())
            {
                return Token{data.size(), trimLineBreaks(data, data.size())};
            }
            return std::nullopt;
        }

        bool lineMatches(std::regex const& pattern, Bytes data, std::size_t begin, std::size_t end)
        {
            auto const first = reinterpret_cast<char const*>(data.data()) + begin;
            auto const last = reinterpret_cast<char const*>(data.data()) + end;
            return std::regex_search(first, last, pattern);
        }

        std::shared_ptr<std::regex const> compile(std::string const& pattern, char const* key)
        {
            try
            {
                return std::make_shared<std::regex>(pattern, std::regex::ECMAScript);
            }
            catch (std::regex_error const& e)
            {
                throw Exception::configuration("Invalid {} '{}': {}", key, pattern, e.what());
            }
        }

        SplitFunc newlineSplitFunc(Encoding const& encoding, bool flushAtEof)
        {
            auto const newline = std::vector<std::uint8_t>{encoding.newline().begin(), encoding.newline().end()};
            auto const cr = carriageReturnFor(newline);

            return [newline, cr, flushAtEof](Bytes data, bool atEof) -> std::optional<Token>
            {
                if (auto const pos = findNewline(data, newline, 0); pos)
                {
                    return Token{*pos + newline.size(), trimCarriageReturn(data, *pos, cr)};
                }
                if (atEof && flushAtEof && !data.empty())
                {
                    return Token{data.size(), trimCarriageReturn(data, data.size(), cr)};
                }
                return std::nullopt;
            };
        }

        SplitFunc lineStartSplitFunc(std::shared_ptr<std::regex const> pattern, bool flushAtEof)
        {
            return [pattern = std::move(pattern), flushAtEof](Bytes data, bool atEof) -> std::optional<Token>
            {
                auto const nl = std::array<std::uint8_t, 1>{0x0A};
                // The first line always belongs to the current record, look for the next start.
                auto lineEnd = findNewline(data, nl, 0);
                while (lineEnd)
                {
                    auto const lineBegin = *lineEnd + 1;
                    auto const next = findNewline(data, nl, lineBegin);
                    if (!next)
                    {
                        // The last line is incomplete, it can only be judged once it is.
                        break;
                    }
                    if (lineMatches(*pattern, data, lineBegin, *next))
                    {
                        return Token{lineBegin, trimLineBreaks(data, lineBegin)};
                    }
                    lineEnd = next;
                }
                if (atEof && lineEnd && (*lineEnd + 1 < data.size()) && lineMatches(*pattern, data, *lineEnd + 1, data.size()))
                {
                    // Partial last line that starts a new record: the current one is complete.
                    auto const lineBegin = *lineEnd + 1;
                    return Token{lineBegin, trimLineBreaks(data, lineBegin)};
                }
                return flush(data, atEof, flushAtEof);
            };
        }

        SplitFunc lineEndSplitFunc(std::shared_ptr<std::regex const> pattern, bool flushAtEof)
        {
            return [pattern = std::move(pattern), flushAtEof](Bytes data, bool atEof) -> std::optional<Token>
            {
                if (!data.empty() && ((data[0] == 0x0A) || (data[0] == 0x0D)))
                {
                    return Token{1, 0};
                }

                auto const nl = std::array<std::uint8_t, 1>{0x0A};
                auto lineBegin = std::size_t{0};
                while (auto const lineEnd = findNewline(data, nl, lineBegin))
                {
                    if (lineMatches(*pattern, data, lineBegin, *lineEnd))
                    {
                        return Token{*lineEnd + 1, trimLineBreaks(data, *lineEnd)};
                    }
                    lineBegin = *lineEnd + 1;
                }
                return flush(data, atEof, flushAtEof);
            };
        }
    }

    SplitFunc buildSplitFunc(SplitterConfig const& config, Encoding const& encoding)
    {
        if (config.lineStartPattern && config.lineEndPattern)
        {
            throw Exception::configuration("Only one of line_start_pattern and line_end_pattern can be set.");
        }

        if (!config.lineStartPattern && !config.lineEndPattern)
        {
            return newlineSplitFunc(encoding, config.flushAtEof);
        }

        if (encoding.newline().size() != 1)
        {
            throw Exception::configuration("Multiline patterns are not supported with encoding '{}'.", encoding.name());
        }

        if (config.lineStartPattern)
        {
            return lineStartSplitFunc(compile(*config.lineStartPattern, "line_start_pattern"), config.flushAtEof);
        }
        return lineEndSplitFunc(compile(*config.lineEndPattern, "line_end_pattern"), config.flushAtEof);
    }
}
