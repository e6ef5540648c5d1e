// SPDX-FileCopyrightText: 2025 Contributors to the filelog project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file FileAttributes.hpp
 * @brief Metadata attached to every record emitted for a file
 *
 * Attributes are resolved once when a Reader is built. Resolution is best-effort:
 * if the symlink-free path cannot be determined (dangling link, permission denied on
 * a parent directory, file removed in the meantime), the resolved fields fall back to
 * the unresolved ones and the failure is only logged.
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include "filelog-internal/File.hpp"

namespace filelog::lib
{
    struct FileAttributes
    {
        /** File name as discovered, e.g. "app.log" */
        std::string name;
        /** Path as discovered, e.g. "/var/log/current/app.log" */
        std::string path;
        /** File name after symlink resolution */
        std::string resolvedName;
        /** Absolute path after symlink resolution */
        std::string resolvedPath;
        /** Device and inode of the open handle, absent for detached readers */
        std::optional<FileKey> key;
    };

    /**
     * Resolve the attributes of a discovered path.
     *
     * @param path The path the file was discovered at
     * @return Attributes with resolved name and path
     * @throws Exception (FILELOG_ERR_ATTRIBUTE_RESOLUTION) if the path cannot be canonicalized
     */
    FileAttributes resolveFileAttributes(std::filesystem::path const& path);

    /** Attributes made only of the discovered path, used when resolution fails. */
    FileAttributes unresolvedFileAttributes(std::filesystem::path const& path);
}
