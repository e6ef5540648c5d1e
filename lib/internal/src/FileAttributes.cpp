// SPDX-FileCopyrightText: 2025 Contributors to the filelog project.
// SPDX-License-Identifier: Apache-2.0

#include "filelog-internal/FileAttributes.hpp"
#include <system_error>
#include "filelog-internal/Exception.hpp"

namespace filelog::lib
{
    FileAttributes unresolvedFileAttributes(std::filesystem::path const& path)
    {
        auto attributes = FileAttributes{};
        attributes.name = path.filename().string();
        attributes.path = path.string();
        attributes.resolvedName = attributes.name;
        attributes.resolvedPath = attributes.path;
        return attributes;
    }

    FileAttributes resolveFileAttributes(std::filesystem::path const& path)
    {
        auto ec = std::error_code{};
        auto const resolved = std::filesystem::canonical(path, ec);
        if (ec)
        {
            throw Exception::attributeResolution("Failed to resolve '{}': {}", path.string(), ec.message());
        }

        auto attributes = unresolvedFileAttributes(path);
        attributes.resolvedName = resolved.filename().string();
        attributes.resolvedPath = resolved.string();
        return attributes;
    }
}
