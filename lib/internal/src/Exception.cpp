// SPDX-FileCopyrightText: 2025 Contributors to the filelog project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Exception.cpp
 * @brief Implementation of the engine's exception classes
 */

#include "filelog-internal/Exception.hpp"
#include <utility>

namespace filelog::lib
{
    Exception::Exception(std::string msg, filelogStatus status)
        : _msg(std::move(msg))
        , _status(status)
    {}

    filelogStatus Exception::status() const noexcept
    {
        return _status;
    }

    char const* Exception::what() const noexcept
    {
        return _msg.c_str();
    }

    IoException::IoException(std::string msg, int error)
        : Exception(std::move(msg), FILELOG_ERR_IO)
        , _error(error)
    {}

    // errno of the failing system call (ENOENT, EACCES, EIO, ...)
    int IoException::error() const noexcept
    {
        return _error;
    }
}
