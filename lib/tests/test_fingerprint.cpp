// SPDX-FileCopyrightText: 2025 Contributors to the filelog project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file test_fingerprint.cpp
 * @brief Unit tests for content based file identity
 *
 * Covers capture from a file, prefix containment, extension while reading and the hex
 * representation used by checkpoints.
 */

#include <catch2/catch_test_macros.hpp>
#include <filelog-internal/Exception.hpp>
#include <filelog-internal/File.hpp>
#include <filelog-internal/Fingerprint.hpp>
#include "Utils.hpp"

using namespace filelog::lib;
using filelog::tests::bytesOf;

TEST_CASE_METHOD(filelog::tests::TempDirectoryFixture, "Fingerprint captures at most maxSize leading bytes", "[fingerprint]")
{
    auto const path = directory / "app.log";
    filelog::tests::writeFile(path, "0123456789abcdefghij");

    auto const file = File::open(path);
    auto const fp = Fingerprint::compute(file, 16);
    REQUIRE(fp.size() == 16);
    REQUIRE(fp.bytes() == bytesOf("0123456789abcdef"));

    auto const whole = Fingerprint::compute(file, 1000);
    REQUIRE(whole.bytes() == bytesOf("0123456789abcdefghij"));
    REQUIRE(whole.startsWith(fp));
    REQUIRE_FALSE(fp.startsWith(whole));
}

TEST_CASE_METHOD(filelog::tests::TempDirectoryFixture, "Identical content gives equal fingerprints", "[fingerprint]")
{
    filelog::tests::writeFile(directory / "a.log", "same content\n");
    filelog::tests::writeFile(directory / "b.log", "same content\n");
    filelog::tests::writeFile(directory / "c.log", "other content\n");

    auto const a = Fingerprint::compute(File::open(directory / "a.log"), 1000);
    auto const b = Fingerprint::compute(File::open(directory / "b.log"), 1000);
    auto const c = Fingerprint::compute(File::open(directory / "c.log"), 1000);

    REQUIRE(a == b);
    REQUIRE_FALSE(a == c);
    REQUIRE_FALSE(c.startsWith(a));
}

TEST_CASE_METHOD(filelog::tests::TempDirectoryFixture, "Empty file has an empty fingerprint", "[fingerprint]")
{
    filelog::tests::writeFile(directory / "empty.log", "");
    auto const fp = Fingerprint::compute(File::open(directory / "empty.log"), 1000);

    REQUIRE(fp.empty());
    REQUIRE(fp == Fingerprint{});
    // An empty fingerprint is a prefix of everything, callers must not rely on it alone.
    REQUIRE(Fingerprint{bytesOf("anything")}.startsWith(fp));
}

TEST_CASE("Copied fingerprint is independent", "[fingerprint]")
{
    auto const original = Fingerprint{bytesOf("abc")};
    auto copy = original.copy();
    REQUIRE(copy == original);

    copy.extend(3, bytesOf("def"), 1000);
    REQUIRE(copy.bytes() == bytesOf("abcdef"));
    REQUIRE(original.bytes() == bytesOf("abc"));
}

TEST_CASE("Fingerprint extension only continues the captured prefix", "[fingerprint]")
{
    auto fp = Fingerprint{bytesOf("abc")};

    SECTION("Chunk that continues the prefix")
    {
        fp.extend(3, bytesOf("defg"), 1000);
        REQUIRE(fp.bytes() == bytesOf("abcdefg"));
    }

    SECTION("Chunk that overlaps the prefix")
    {
        fp.extend(1, bytesOf("bcdef"), 1000);
        REQUIRE(fp.bytes() == bytesOf("abcdef"));
    }

    SECTION("Chunk that starts past the prefix is ignored")
    {
        fp.extend(4, bytesOf("efg"), 1000);
        REQUIRE(fp.bytes() == bytesOf("abc"));
    }

    SECTION("Chunk fully covered by the prefix is ignored")
    {
        fp.extend(0, bytesOf("ab"), 1000);
        REQUIRE(fp.bytes() == bytesOf("abc"));
    }

    SECTION("Extension stops at the maximum size")
    {
        fp.extend(3, bytesOf("defghij"), 5);
        REQUIRE(fp.bytes() == bytesOf("abcde"));

        fp.extend(5, bytesOf("fgh"), 5);
        REQUIRE(fp.bytes() == bytesOf("abcde"));
    }
}

TEST_CASE("Fingerprint hex representation", "[fingerprint]")
{
    auto const fp = Fingerprint{std::vector<std::uint8_t>{0x00, 0x0a, 0xff, 0x41}};
    REQUIRE(fp.toHex() == "000aff41");
    REQUIRE(Fingerprint::fromHex("000aff41") == fp);
    REQUIRE(Fingerprint::fromHex("000AFF41") == fp);
    REQUIRE(Fingerprint::fromHex("").empty());

    REQUIRE_THROWS_AS(Fingerprint::fromHex("abc"), Exception);
    REQUIRE_THROWS_AS(Fingerprint::fromHex("zz"), Exception);
}

TEST_CASE_METHOD(filelog::tests::TempDirectoryFixture, "File handle basics", "[file]")
{
    auto const path = directory / "app.log";
    filelog::tests::writeFile(path, "hello");

    auto file = File::open(path);
    REQUIRE(file.isOpen());
    REQUIRE(file.size() == 5);
    REQUIRE(file.path() == path);

    auto buffer = std::vector<std::uint8_t>(8);
    REQUIRE(file.readAt(1, buffer) == 4);
    REQUIRE(file.readAt(5, buffer) == 0);

    auto moved = std::move(file);
    REQUIRE(moved.isOpen());
    REQUIRE_FALSE(file.isOpen());

    moved.close();
    REQUIRE_FALSE(moved.isOpen());
    REQUIRE_THROWS_AS(moved.readAt(0, buffer), IoException);

    REQUIRE_THROWS_AS(File::open(directory / "missing.log"), IoException);
}
