// SPDX-FileCopyrightText: 2025 Contributors to the filelog project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Encoding.cpp
 * @brief Built-in encodings
 *
 * UTF-8 validation follows RFC 3629: overlong forms, surrogate code points and code
 * points above U+10FFFF are rejected. UTF-16 input is converted code unit by code unit,
 * unpaired surrogates and odd byte counts are rejected.
 */

#include "filelog-internal/Encoding.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <iterator>
#include "filelog-internal/Exception.hpp"

namespace filelog::lib
{
    namespace
    {
        constexpr auto const LF = std::array<std::uint8_t, 1>{0x0A};
        constexpr auto const LF_UTF16LE = std::array<std::uint8_t, 2>{0x0A, 0x00};
        constexpr auto const LF_UTF16BE = std::array<std::uint8_t, 2>{0x00, 0x0A};

        void appendUtf8(std::string& out, std::uint32_t codePoint)
        {
            if (codePoint < 0x80)
            {
                out.push_back(static_cast<char>(codePoint));
            }
            else if (codePoint < 0x800)
            {
                out.push_back(static_cast<char>(0xC0 | (codePoint >> 6)));
                out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
            }
            else if (codePoint < 0x10000)
            {
                out.push_back(static_cast<char>(0xE0 | (codePoint >> 12)));
                out.push_back(static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
            }
            else
            {
                out.push_back(static_cast<char>(0xF0 | (codePoint >> 18)));
                out.push_back(static_cast<char>(0x80 | ((codePoint >> 12) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
            }
        }

        class NopEncoding final : public Encoding
        {
        public:
            std::string_view name() const noexcept override
            {
                return "nop";
            }

            std::span<std::uint8_t const> newline() const noexcept override
            {
                return LF;
            }

            std::string decode(std::span<std::uint8_t const> bytes) const override
            {
                return std::string{bytes.begin(), bytes.end()};
            }
        };

        class AsciiEncoding final : public Encoding
        {
        public:
            std::string_view name() const noexcept override
            {
                return "ascii";
            }

            std::span<std::uint8_t const> newline() const noexcept override
            {
                return LF;
            }

            std::string decode(std::span<std::uint8_t const> bytes) const override
            {
                if (auto const it = std::ranges::find_if(bytes, [](std::uint8_t b) { return b > 0x7F; }); it != bytes.end())
                {
                    throw Exception::decode("Byte 0x{:02x} at position {} is not ASCII.", *it, std::distance(bytes.begin(), it));
                }
                return std::string{bytes.begin(), bytes.end()};
            }
        };

        class Utf8Encoding final : public Encoding
        {
        public:
            std::string_view name() const noexcept override
            {
                return "utf-8";
            }

            std::span<std::uint8_t const> newline() const noexcept override
            {
                return LF;
            }

            std::string decode(std::span<std::uint8_t const> bytes) const override
            {
                auto i = std::size_t{0};
                while (i < bytes.size())
                {
                    auto const lead = bytes[i];
                    auto length = std::size_t{0};
                    auto codePoint = std::uint32_t{0};
                    auto minimum = std::uint32_t{0};

                    if (lead < 0x80)
                    {
                        ++i;
                        continue;
                    }
                    else if ((lead & 0xE0) == 0xC0)
                    {
                        length = 2;
                        codePoint = lead & 0x1F;
                        minimum = 0x80;
                    }
                    else if ((lead & 0xF0) == 0xE0)
                    {
                        length = 3;
                        codePoint = lead & 0x0F;
                        minimum = 0x800;
                    }
                    else if ((lead & 0xF8) == 0xF0)
                    {
                        length = 4;
                        codePoint = lead & 0x07;
                        minimum = 0x10000;
                    }
                    else
                    {
                        throw Exception::decode("Invalid UTF-8 lead byte 0x{:02x} at position {}.", lead, i);
                    }

                    if (i + length > bytes.size())
                    {
                        throw Exception::decode("Truncated UTF-8 sequence at position {}.", i);
                    }
                    for (auto k = std::size_t{1}; k < length; ++k)
                    {
                        auto const cont = bytes[i + k];
                        if ((cont & 0xC0) != 0x80)
                        {
                            throw Exception::decode("Invalid UTF-8 continuation byte 0x{:02x} at position {}.", cont, i + k);
                        }
                        codePoint = (codePoint << 6) | (cont & 0x3F);
                    }
                    if ((codePoint < minimum) || (codePoint > 0x10FFFF) || ((codePoint >= 0xD800) && (codePoint <= 0xDFFF)))
                    {
                        throw Exception::decode("Invalid UTF-8 code point U+{:04X} at position {}.", codePoint, i);
                    }
                    i += length;
                }
                return std::string{bytes.begin(), bytes.end()};
            }
        };

        class Utf16Encoding final : public Encoding
        {
        public:
            explicit Utf16Encoding(bool bigEndian) noexcept
                : _bigEndian{bigEndian}
            {}

            std::string_view name() const noexcept override
            {
                return _bigEndian ? "utf-16be" : "utf-16le";
            }

            std::span<std::uint8_t const> newline() const noexcept override
            {
                if (_bigEndian)
                {
                    return LF_UTF16BE;
                }
                return LF_UTF16LE;
            }

            std::string decode(std::span<std::uint8_t const> bytes) const override
            {
                if ((bytes.size() % 2) != 0)
                {
                    throw Exception::decode("UTF-16 input has an odd length of {} bytes.", bytes.size());
                }

                auto out = std::string{};
                out.reserve(bytes.size());
                auto i = std::size_t{0};
                while (i < bytes.size())
                {
                    auto const unit = unitAt(bytes, i);
                    if ((unit >= 0xD800) && (unit <= 0xDBFF))
                    {
                        if (i + 4 > bytes.size())
                        {
                            throw Exception::decode("Unpaired high surrogate at position {}.", i);
                        }
                        auto const low = unitAt(bytes, i + 2);
                        if ((low < 0xDC00) || (low > 0xDFFF))
                        {
                            throw Exception::decode("Unpaired high surrogate at position {}.", i);
                        }
                        appendUtf8(out, 0x10000 + ((static_cast<std::uint32_t>(unit) - 0xD800) << 10) + (low - 0xDC00));
                        i += 4;
                    }
                    else if ((unit >= 0xDC00) && (unit <= 0xDFFF))
                    {
                        throw Exception::decode("Unpaired low surrogate at position {}.", i);
                    }
                    else
                    {
                        appendUtf8(out, unit);
                        i += 2;
                    }
                }
                return out;
            }

        private:
            std::uint16_t unitAt(std::span<std::uint8_t const> bytes, std::size_t i) const noexcept
            {
                return _bigEndian ? static_cast<std::uint16_t>((bytes[i] << 8) | bytes[i + 1])
                                  : static_cast<std::uint16_t>((bytes[i + 1] << 8) | bytes[i]);
            }

            bool _bigEndian;
        };
    }

    Encoding::~Encoding() = default;

    std::shared_ptr<Encoding const> buildEncoding(EncodingConfig const& config)
    {
        auto name = config.name;
        std::ranges::transform(name, name.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if ((name == "utf-8") || (name == "utf8") || name.empty())
        {
            return std::make_shared<Utf8Encoding>();
        }
        if (name == "nop")
        {
            return std::make_shared<NopEncoding>();
        }
        if ((name == "ascii") || (name == "us-ascii"))
        {
            return std::make_shared<AsciiEncoding>();
        }
        if (name == "utf-16le")
        {
            return std::make_shared<Utf16Encoding>(false);
        }
        if (name == "utf-16be")
        {
            return std::make_shared<Utf16Encoding>(true);
        }

        throw Exception::configuration("Unsupported encoding '{}'.", config.name);
    }
}
