// SPDX-FileCopyrightText: 2025 Contributors to the filelog project.
// SPDX-License-Identifier: Apache-2.0

#include "filelog-internal/Checkpoint.hpp"
#include <charconv>
#include <utility>
#include <picojson/picojson.h>
#include "filelog-internal/Exception.hpp"

namespace filelog::lib
{
    namespace
    {
        std::string const& requireString(picojson::object const& object, std::string const& key)
        {
            auto const it = object.find(key);
            if ((it == object.end()) || !it->second.is<std::string>())
            {
                throw Exception::checkpoint("Checkpoint field '{}' must be a string.", key);
            }
            return it->second.get<std::string>();
        }

        std::uint64_t parseUnsigned(std::string const& text, std::string const& key)
        {
            auto value = std::uint64_t{0};
            auto const [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
            if ((ec != std::errc{}) || (ptr != text.data() + text.size()))
            {
                throw Exception::checkpoint("Checkpoint field '{}' is not an unsigned integer: '{}'.", key, text);
            }
            return value;
        }

        FileAttributes decodeAttributes(picojson::object const& object)
        {
            auto attributes = FileAttributes{};
            attributes.name = requireString(object, "name");
            attributes.path = requireString(object, "path");
            attributes.resolvedName = requireString(object, "resolvedName");
            attributes.resolvedPath = requireString(object, "resolvedPath");

            if (object.contains("device") && object.contains("inode"))
            {
                attributes.key = FileKey{parseUnsigned(requireString(object, "device"), "device"), parseUnsigned(requireString(object, "inode"), "inode")};
            }
            return attributes;
        }

        CheckpointEntry decodeEntry(picojson::value const& value)
        {
            if (!value.is<picojson::object>())
            {
                throw Exception::checkpoint("Checkpoint entries must be objects.");
            }
            auto const& object = value.get<picojson::object>();

            auto fingerprint = Fingerprint{};
            try
            {
                fingerprint = Fingerprint::fromHex(requireString(object, "fingerprint"));
            }
            catch (Exception const& e)
            {
                if (e.status() != FILELOG_ERR_INVALID_ARG)
                {
                    throw;
                }
                throw Exception::checkpoint("Invalid checkpoint fingerprint: {}", e.what());
            }

            auto const offset = parseUnsigned(requireString(object, "offset"), "offset");

            auto const attributesIt = object.find("attributes");
            if ((attributesIt == object.end()) || !attributesIt->second.is<picojson::object>())
            {
                throw Exception::checkpoint("Checkpoint field 'attributes' must be an object.");
            }

            return CheckpointEntry{std::move(fingerprint),
                offset,
                decodeAttributes(attributesIt->second.get<picojson::object>())};
        }
    }

    std::string encodeCheckpoint(std::vector<CheckpointEntry> const& entries)
    {
        auto files = picojson::array{};
        files.reserve(entries.size());

        for (auto const& entry : entries)
        {
            auto attributes = picojson::object{};
            attributes["name"] = picojson::value{entry.attributes.name};
            attributes["path"] = picojson::value{entry.attributes.path};
            attributes["resolvedName"] = picojson::value{entry.attributes.resolvedName};
            attributes["resolvedPath"] = picojson::value{entry.attributes.resolvedPath};
            if (entry.attributes.key)
            {
                attributes["device"] = picojson::value{std::to_string(entry.attributes.key->device)};
                attributes["inode"] = picojson::value{std::to_string(entry.attributes.key->inode)};
            }

            auto file = picojson::object{};
            file["fingerprint"] = picojson::value{entry.fingerprint.toHex()};
            file["offset"] = picojson::value{std::to_string(entry.offset)};
            file["attributes"] = picojson::value{attributes};
            files.emplace_back(file);
        }

        auto root = picojson::object{};
        root["version"] = picojson::value{static_cast<double>(CHECKPOINT_VERSION)};
        root["files"] = picojson::value{files};
        return picojson::value{root}.serialize();
    }

    std::vector<CheckpointEntry> decodeCheckpoint(std::string const& text)
    {
        auto jsonValue = picojson::value{};
        auto const err = picojson::parse(jsonValue, text);
        if (!err.empty())
        {
            throw Exception::checkpoint("Invalid checkpoint JSON. {}", err);
        }
        if (!jsonValue.is<picojson::object>())
        {
            throw Exception::checkpoint("Expected a JSON object as checkpoint root.");
        }
        auto const& root = jsonValue.get<picojson::object>();

        auto const versionIt = root.find("version");
        if ((versionIt == root.end()) || !versionIt->second.is<double>() || (versionIt->second.get<double>() != CHECKPOINT_VERSION))
        {
            throw Exception::checkpoint("Unsupported checkpoint version.");
        }

        auto const filesIt = root.find("files");
        if ((filesIt == root.end()) || !filesIt->second.is<picojson::array>())
        {
            throw Exception::checkpoint("Checkpoint field 'files' must be an array.");
        }

        auto entries = std::vector<CheckpointEntry>{};
        for (auto const& value : filesIt->second.get<picojson::array>())
        {
            entries.push_back(decodeEntry(value));
        }
        return entries;
    }
}
