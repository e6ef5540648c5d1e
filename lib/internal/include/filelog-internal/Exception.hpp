// SPDX-FileCopyrightText: 2025 Contributors to the filelog project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Exception.hpp
 * @brief Exception types of the tailing engine
 *
 * ERROR HANDLING STRATEGY:
 * - Internally the engine uses C++ exceptions (Exception, IoException)
 * - Every exception carries a filelogStatus that names its category
 * - The Manager catches per-file exceptions at the file boundary, logs them and
 *   continues with the other files; only configuration errors escape its constructor
 *
 * TWO EXCEPTION TYPES:
 * - **Exception**: carries a filelogStatus code
 * - **IoException**: extends Exception with the errno of the failing system call
 *
 * USAGE PATTERN:
 * ```cpp
 * auto const n = posixCall(::pread, "Failed to read file", fd, buffer, size, offset);
 * // throws IoException on error, otherwise returns the result
 * ```
 */

#pragma once

#include <cerrno>
#include <cstring>
#include <exception>
#include <string>
#include <string_view>
#include <utility>
#include <fmt/format.h>
#include <filelog/filelog.h>

namespace filelog::lib
{
    /**
     * @class Exception
     * @brief Base exception class of the engine
     *
     * The factory methods use fmt::format for type-safe formatting:
     * - configuration() for FILELOG_ERR_CONFIGURATION
     * - decode() for FILELOG_ERR_DECODE
     * - attributeResolution() for FILELOG_ERR_ATTRIBUTE_RESOLUTION
     * - invalidState() for FILELOG_ERR_INVALID_STATE
     * - invalidArgument() for FILELOG_ERR_INVALID_ARG
     * - checkpoint() for FILELOG_ERR_CHECKPOINT
     */
    class Exception : public std::exception
    {
    public:
        Exception(std::string msg, filelogStatus status);

        /** \brief Make any type of exception.
         */
        template<typename... T>
        static Exception make(filelogStatus status, fmt::format_string<T...> fmt, T&&... args)
        {
            return Exception(fmt::format(fmt, std::forward<T>(args)...), status);
        }

        /** \brief Make a FILELOG_ERR_CONFIGURATION exception.
         */
        template<typename... T>
        static Exception configuration(fmt::format_string<T...> fmt, T&&... args)
        {
            return make(FILELOG_ERR_CONFIGURATION, fmt, std::forward<T>(args)...);
        }

        /** \brief Make a FILELOG_ERR_DECODE exception.
         */
        template<typename... T>
        static Exception decode(fmt::format_string<T...> fmt, T&&... args)
        {
            return make(FILELOG_ERR_DECODE, fmt, std::forward<T>(args)...);
        }

        /** \brief Make a FILELOG_ERR_ATTRIBUTE_RESOLUTION exception.
         */
        template<typename... T>
        static Exception attributeResolution(fmt::format_string<T...> fmt, T&&... args)
        {
            return make(FILELOG_ERR_ATTRIBUTE_RESOLUTION, fmt, std::forward<T>(args)...);
        }

        /** \brief Make a FILELOG_ERR_INVALID_STATE exception.
         */
        template<typename... T>
        static Exception invalidState(fmt::format_string<T...> fmt, T&&... args)
        {
            return make(FILELOG_ERR_INVALID_STATE, fmt, std::forward<T>(args)...);
        }

        /** \brief Make a FILELOG_ERR_INVALID_ARG exception.
         */
        template<typename... T>
        static Exception invalidArgument(fmt::format_string<T...> fmt, T&&... args)
        {
            return make(FILELOG_ERR_INVALID_ARG, fmt, std::forward<T>(args)...);
        }

        /** \brief Make a FILELOG_ERR_CHECKPOINT exception.
         */
        template<typename... T>
        static Exception checkpoint(fmt::format_string<T...> fmt, T&&... args)
        {
            return make(FILELOG_ERR_CHECKPOINT, fmt, std::forward<T>(args)...);
        }

        /** \brief Return the status code that describes the condition that led to the
         * exception being thrown.
         */
        [[nodiscard]]
        filelogStatus status() const noexcept;

        /** \brief Implements std::exception, returns a descriptive string about the error.
         */
        [[nodiscard]]
        char const* what() const noexcept override;

    private:
        std::string _msg;
        filelogStatus _status;
    };

    /**
     * \brief A FILELOG_ERR_IO exception that also carries the errno of the failing call.
     */
    class IoException : public Exception
    {
    public:
        IoException(std::string msg, int error);

        /**
         * \brief Create a new exception object.
         *
         * \param error The errno value reported by the system call.
         * \param fmt Format string
         * \param ...args Format args
         */
        template<typename... T>
        static IoException make(int error, fmt::format_string<T...> fmt, T&&... args)
        {
            return IoException(fmt::format(fmt, std::forward<T>(args)...), error);
        }

        [[nodiscard]]
        int error() const noexcept;

    private:
        int _error;
    };

    /**
     * \brief Call a POSIX function that reports failure with -1 and errno, retrying on EINTR.
     *
     * If the call fails, throws an IoException that includes errno, its description and the
     * message passed in as the second argument.
     */
    template<typename F, typename... T>
    auto posixCall(F fun, std::string_view msg, T... args)
    {
        while (true)
        {
            auto const result = fun(args...);
            if (result != -1)
            {
                return result;
            }
            if (errno != EINTR)
            {
                auto const error = errno;
                throw IoException::make(error, "{}: {}, errno {}", msg, std::strerror(error), error);
            }
        }
    }
}
