// SPDX-FileCopyrightText: 2025 Contributors to the filelog project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file test_encoding_splitter.cpp
 * @brief Unit tests for the built-in encodings and split functions
 */

#include <optional>
#include <string>
#include <catch2/catch_test_macros.hpp>
#include <filelog-internal/Encoding.hpp>
#include <filelog-internal/Exception.hpp>
#include <filelog-internal/Splitter.hpp>
#include "Utils.hpp"

using namespace filelog::lib;
using filelog::tests::bytesOf;

namespace
{
    std::optional<Token> split(SplitFunc const& func, std::string const& data, bool atEof = false)
    {
        auto const bytes = bytesOf(data);
        return func(bytes, atEof);
    }
}

TEST_CASE("Encodings are looked up by name", "[encoding]")
{
    REQUIRE(buildEncoding(EncodingConfig{})->name() == "utf-8");
    REQUIRE(buildEncoding(EncodingConfig{"UTF8"})->name() == "utf-8");
    REQUIRE(buildEncoding(EncodingConfig{"nop"})->name() == "nop");
    REQUIRE(buildEncoding(EncodingConfig{"us-ascii"})->name() == "ascii");
    REQUIRE(buildEncoding(EncodingConfig{"utf-16le"})->name() == "utf-16le");
    REQUIRE(buildEncoding(EncodingConfig{"utf-16be"})->name() == "utf-16be");

    try
    {
        (void)buildEncoding(EncodingConfig{"ebcdic"});
        FAIL("Unknown encoding accepted");
    }
    catch (Exception const& e)
    {
        REQUIRE(e.status() == FILELOG_ERR_CONFIGURATION);
    }
}

TEST_CASE("UTF-8 validation", "[encoding]")
{
    auto const utf8 = buildEncoding(EncodingConfig{"utf-8"});

    REQUIRE(utf8->decode(bytesOf("plain")) == "plain");
    REQUIRE(utf8->decode(bytesOf("gr\xc3\xbc\xc3\x9f")) == "gr\xc3\xbc\xc3\x9f");
    REQUIRE(utf8->decode(bytesOf("\xf0\x9f\x98\x80")) == "\xf0\x9f\x98\x80");

    // Truncated sequence, overlong form, lone continuation byte, encoded surrogate
    REQUIRE_THROWS_AS(utf8->decode(bytesOf("\xc3")), Exception);
    REQUIRE_THROWS_AS(utf8->decode(bytesOf("\xc0\xaf")), Exception);
    REQUIRE_THROWS_AS(utf8->decode(bytesOf("\x80")), Exception);
    REQUIRE_THROWS_AS(utf8->decode(bytesOf("\xed\xa0\x80")), Exception);
}

TEST_CASE("ASCII and nop encodings", "[encoding]")
{
    auto const ascii = buildEncoding(EncodingConfig{"ascii"});
    REQUIRE(ascii->decode(bytesOf("abc")) == "abc");
    REQUIRE_THROWS_AS(ascii->decode(bytesOf("\xc3\xbc")), Exception);

    auto const nop = buildEncoding(EncodingConfig{"nop"});
    REQUIRE(nop->decode(bytesOf(std::string{"\xff\x00x", 3})) == std::string{"\xff\x00x", 3});
}

TEST_CASE("UTF-16 is converted to UTF-8", "[encoding]")
{
    auto const le = buildEncoding(EncodingConfig{"utf-16le"});
    REQUIRE(le->decode(bytesOf(std::string{"h\0i\0", 4})) == "hi");
    REQUIRE(le->decode(bytesOf(std::string{"\xfc\x00", 2})) == "\xc3\xbc");
    // U+1F600 as a surrogate pair
    REQUIRE(le->decode(bytesOf(std::string{"\x3d\xd8\x00\xde", 4})) == "\xf0\x9f\x98\x80");
    REQUIRE(le->newline().size() == 2);

    auto const be = buildEncoding(EncodingConfig{"utf-16be"});
    REQUIRE(be->decode(bytesOf(std::string{"\0h\0i", 4})) == "hi");

    REQUIRE_THROWS_AS(le->decode(bytesOf(std::string{"h\0i", 3})), Exception);
    REQUIRE_THROWS_AS(le->decode(bytesOf(std::string{"\x00\xdc", 2})), Exception);
}

TEST_CASE("Newline split function", "[splitter]")
{
    auto const encoding = buildEncoding(EncodingConfig{});

    SECTION("Complete and incomplete lines")
    {
        auto const func = buildSplitFunc(SplitterConfig{}, *encoding);
        REQUIRE(split(func, "abc\ndef") == Token{4, 3});
        REQUIRE(split(func, "\nabc") == Token{1, 0});
        REQUIRE_FALSE(split(func, "abc").has_value());
        REQUIRE_FALSE(split(func, "abc", true).has_value());
        REQUIRE(split(func, "abc\r\n") == Token{5, 3});
    }

    SECTION("Flush at end of file")
    {
        auto config = SplitterConfig{};
        config.flushAtEof = true;
        auto const func = buildSplitFunc(config, *encoding);
        REQUIRE_FALSE(split(func, "abc").has_value());
        REQUIRE(split(func, "abc", true) == Token{3, 3});
        REQUIRE_FALSE(split(func, "", true).has_value());
    }

    SECTION("UTF-16 newlines are aligned")
    {
        auto const utf16 = buildEncoding(EncodingConfig{"utf-16le"});
        auto const func = buildSplitFunc(SplitterConfig{}, *utf16);
        // U+0A00 contains a 0x0A byte at an odd position and is not a newline.
        REQUIRE(split(func, std::string{"\x00\x0a\x0d\x00\x0a\x00", 6}) == Token{6, 2});
    }
}

TEST_CASE("Multiline split functions", "[splitter]")
{
    auto const encoding = buildEncoding(EncodingConfig{});

    SECTION("Line start pattern")
    {
        auto config = SplitterConfig{};
        config.lineStartPattern = "^START";
        auto const func = buildSplitFunc(config, *encoding);

        REQUIRE(split(func, "START 1\n  more\nSTART 2\n") == Token{15, 14});
        // The last record is complete only once the next one starts.
        REQUIRE_FALSE(split(func, "START 2\n  more\n").has_value());
        REQUIRE(split(func, "START 1\nSTART 2", true) == Token{8, 7});
    }

    SECTION("Line end pattern")
    {
        auto config = SplitterConfig{};
        config.lineEndPattern = "END$";
        auto const func = buildSplitFunc(config, *encoding);

        REQUIRE(split(func, "a\nb END\nc\n") == Token{8, 7});
        REQUIRE(split(func, "\nc") == Token{1, 0});
        REQUIRE_FALSE(split(func, "c\nd\n").has_value());
    }

    SECTION("Invalid configurations")
    {
        auto both = SplitterConfig{};
        both.lineStartPattern = "a";
        both.lineEndPattern = "b";
        REQUIRE_THROWS_AS(buildSplitFunc(both, *encoding), Exception);

        auto invalid = SplitterConfig{};
        invalid.lineStartPattern = "([";
        REQUIRE_THROWS_AS(buildSplitFunc(invalid, *encoding), Exception);

        auto wide = SplitterConfig{};
        wide.lineStartPattern = "a";
        REQUIRE_THROWS_AS(buildSplitFunc(wide, *buildEncoding(EncodingConfig{"utf-16le"})), Exception);
    }
}
