// SPDX-FileCopyrightText: 2025 Contributors to the filelog project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file test_checkpoint.cpp
 * @brief Unit tests for checkpoint encoding, persisters and file discovery
 */

#include <cstdint>
#include <limits>
#include <catch2/catch_test_macros.hpp>
#include <picojson/picojson.h>
#include <filelog-internal/Checkpoint.hpp>
#include <filelog-internal/Exception.hpp>
#include <filelog-internal/FileFinder.hpp>
#include <filelog-internal/Persister.hpp>
#include "Utils.hpp"

using namespace filelog::lib;
using filelog::tests::bytesOf;
using filelog::tests::writeFile;

namespace
{
    filelogStatus decodeStatus(std::string const& text)
    {
        try
        {
            (void)decodeCheckpoint(text);
        }
        catch (Exception const& e)
        {
            return e.status();
        }
        return FILELOG_STATUS_OK;
    }
}

TEST_CASE("Checkpoint encoding", "[checkpoint]")
{
    auto attributes = FileAttributes{"app.log", "/var/log/app.log", "app-2025.log", "/data/app-2025.log", FileKey{2049, 18446744073709551615ULL}};
    auto detached = FileAttributes{"old.log", "/var/log/old.log", "old.log", "/var/log/old.log", std::nullopt};

    auto const text = encodeCheckpoint({CheckpointEntry{Fingerprint{bytesOf("Hello")}, 5, attributes}, CheckpointEntry{Fingerprint{}, 0, detached}});

    // The layout is plain JSON that other tools can read.
    auto json = picojson::value{};
    REQUIRE(picojson::parse(json, text).empty());
    REQUIRE(json.get("version").get<double>() == 1);
    auto const& first = json.get("files").get<picojson::array>().at(0);
    REQUIRE(first.get("fingerprint").get<std::string>() == "48656c6c6f");
    REQUIRE(first.get("offset").get<std::string>() == "5");
    REQUIRE(first.get("attributes").get("inode").get<std::string>() == "18446744073709551615");

    auto const entries = decodeCheckpoint(text);
    REQUIRE(entries.size() == 2);
    REQUIRE(entries[0].fingerprint == Fingerprint{bytesOf("Hello")});
    REQUIRE(entries[0].offset == 5);
    REQUIRE(entries[0].attributes.name == "app.log");
    REQUIRE(entries[0].attributes.path == "/var/log/app.log");
    REQUIRE(entries[0].attributes.resolvedName == "app-2025.log");
    REQUIRE(entries[0].attributes.resolvedPath == "/data/app-2025.log");
    REQUIRE(entries[0].attributes.key == FileKey{2049, 18446744073709551615ULL});
    REQUIRE(entries[1].fingerprint.empty());
    REQUIRE_FALSE(entries[1].attributes.key);
}

TEST_CASE("Checkpoint offsets keep every 64 bit value", "[checkpoint]")
{
    // 2^53 + 1 is the first integer a double can not represent.
    auto const large = std::uint64_t{9007199254740993ULL};
    auto const attributes = FileAttributes{"big.log", "/var/log/big.log", "big.log", "/var/log/big.log", std::nullopt};

    auto const entries = decodeCheckpoint(encodeCheckpoint({CheckpointEntry{Fingerprint{bytesOf("big")}, large, attributes},
        CheckpointEntry{Fingerprint{bytesOf("max")}, std::numeric_limits<std::uint64_t>::max(), attributes}}));
    REQUIRE(entries.size() == 2);
    REQUIRE(entries[0].offset == large);
    REQUIRE(entries[1].offset == std::numeric_limits<std::uint64_t>::max());
}

TEST_CASE("Malformed checkpoints are rejected", "[checkpoint]")
{
    REQUIRE(decodeStatus(R"({"version":1,"files":[]})") == FILELOG_STATUS_OK);

    REQUIRE(decodeStatus("not json") == FILELOG_ERR_CHECKPOINT);
    REQUIRE(decodeStatus("[]") == FILELOG_ERR_CHECKPOINT);
    REQUIRE(decodeStatus(R"({"version":2,"files":[]})") == FILELOG_ERR_CHECKPOINT);
    REQUIRE(decodeStatus(R"({"version":1})") == FILELOG_ERR_CHECKPOINT);
    REQUIRE(decodeStatus(R"({"version":1,"files":[1]})") == FILELOG_ERR_CHECKPOINT);
    REQUIRE(decodeStatus(R"({"version":1,"files":[{"fingerprint":"zz","offset":"0","attributes":{}}]})") == FILELOG_ERR_CHECKPOINT);
    REQUIRE(decodeStatus(R"({"version":1,"files":[{"fingerprint":"00","offset":"-1","attributes":{}}]})") == FILELOG_ERR_CHECKPOINT);
    REQUIRE(decodeStatus(R"({"version":1,"files":[{"fingerprint":"00","offset":5,"attributes":{}}]})") == FILELOG_ERR_CHECKPOINT);
    REQUIRE(decodeStatus(R"({"version":1,"files":[{"fingerprint":"00","offset":"18446744073709551616","attributes":{}}]})") == FILELOG_ERR_CHECKPOINT);
    REQUIRE(decodeStatus(R"({"version":1,"files":[{"fingerprint":"00","offset":"0","attributes":{"name":"a"}}]})") == FILELOG_ERR_CHECKPOINT);
    REQUIRE(decodeStatus(R"({"version":1,"files":[{"fingerprint":"00","offset":"0","attributes":{"name":"a","path":"a","resolvedName":"a","resolvedPath":"a","device":"x","inode":"1"}}]})") ==
            FILELOG_ERR_CHECKPOINT);
}

TEST_CASE("Memory persister", "[persister]")
{
    auto persister = MemoryPersister{};
    REQUIRE_FALSE(persister.get("key"));

    persister.set("key", "one");
    persister.set("key", "two");
    REQUIRE(persister.get("key") == std::optional<std::string>{"two"});
    REQUIRE_FALSE(persister.get("other"));
}

TEST_CASE_METHOD(filelog::tests::TempDirectoryFixture, "Directory persister", "[persister]")
{
    auto const stateDirectory = directory / "nested" / "state";
    {
        auto persister = DirectoryPersister{stateDirectory};
        REQUIRE(std::filesystem::is_directory(stateDirectory));
        REQUIRE_FALSE(persister.get(CHECKPOINT_KEY));

        persister.set(CHECKPOINT_KEY, "first");
        persister.set(CHECKPOINT_KEY, "second");
    }

    auto const path = makeStateFilePath(stateDirectory, CHECKPOINT_KEY);
    REQUIRE(path == stateDirectory / "filelog.knownFiles.json");
    REQUIRE(filelog::tests::readFile(path) == "second");

    // A new instance sees the stored value, no temporary file is left behind.
    auto const reopened = DirectoryPersister{stateDirectory};
    REQUIRE(reopened.get(CHECKPOINT_KEY) == std::optional<std::string>{"second"});
    auto temporary = path;
    temporary += ".tmp";
    REQUIRE_FALSE(std::filesystem::exists(temporary));
}

TEST_CASE_METHOD(filelog::tests::TempDirectoryFixture, "Glob file finder", "[finder]")
{
    writeFile(directory / "a.log", "a");
    writeFile(directory / "b.log", "b");
    writeFile(directory / "b.log.gz", "b");
    writeFile(directory / "notes.txt", "n");
    std::filesystem::create_directory(directory / "dir.log");

    auto const finder = GlobFileFinder{{(directory / "*.log*").string(), (directory / "a.*").string()}, {"*.gz"}};
    auto const files = finder.findFiles();

    REQUIRE(files == std::vector<std::filesystem::path>{directory / "a.log", directory / "b.log"});

    auto const nothing = GlobFileFinder{{(directory / "*.missing").string()}, {}};
    REQUIRE(nothing.findFiles().empty());
}
