// SPDX-FileCopyrightText: 2025 Contributors to the upath project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Exception.hpp
 * @brief Exception types used inside the upath library
 *
 * ERROR HANDLING STRATEGY:
 * - Internally the library throws Exception (or SystemException) carrying an upathStatus
 * - At the C API boundary exceptions are caught and converted to the carried status
 * - Collisions are never exceptions: they are ordinary ReservationOutcome values that drive
 *   the retry loops, only errors that end an operation are thrown
 *
 * TWO EXCEPTION TYPES:
 * - **Exception**: carries an upathStatus code
 * - **SystemException**: extends Exception with the errno of the failed system call, the status is
 *   derived from the errno with statusFromErrno()
 */

#pragma once

#include <exception>
#include <string>
#include <utility>
#include <fmt/format.h>
#include <upath/upath.h>

namespace upath::lib
{
    /**
     * @brief Map the errno of a failed create call to a status code.
     *
     * - ENOENT, ENOTDIR        -> UPATH_ERR_DIRECTORY_NOT_FOUND
     * - EACCES, EPERM, EROFS   -> UPATH_ERR_PERMISSION_DENIED
     * - ECANCELED              -> UPATH_ERR_CANCELLED
     * - Everything else        -> UPATH_ERR_IO
     *
     * Collision and transient errors (EEXIST, EINTR, EAGAIN, ...) never reach this function, they are
     * classified by isCollisionErrno() first.
     */
    upathStatus statusFromErrno(int error) noexcept;

    /**
     * @brief Whether the errno of a failed exclusive create means "try the next candidate".
     *
     * True for EEXIST (the name is taken) and for transient contention (EINTR, EAGAIN, EBUSY, ETXTBSY).
     */
    bool isCollisionErrno(int error) noexcept;

    class Exception : public std::exception
    {
    public:
        Exception(std::string msg, upathStatus status);

        template<typename... T>
        static Exception make(upathStatus status, fmt::format_string<T...> fmt, T&&... args)
        {
            return Exception(fmt::format(fmt, std::forward<T>(args)...), status);
        }

        /** \brief Make an UPATH_ERR_INVALID_ARG exception.
         */
        template<typename... T>
        static Exception invalidArgument(fmt::format_string<T...> fmt, T&&... args)
        {
            return make(UPATH_ERR_INVALID_ARG, fmt, std::forward<T>(args)...);
        }

        /** \brief Make an UPATH_ERR_DIRECTORY_NOT_FOUND exception.
         */
        template<typename... T>
        static Exception directoryNotFound(fmt::format_string<T...> fmt, T&&... args)
        {
            return make(UPATH_ERR_DIRECTORY_NOT_FOUND, fmt, std::forward<T>(args)...);
        }

        /** \brief Make an UPATH_ERR_CANCELLED exception.
         */
        template<typename... T>
        static Exception cancelled(fmt::format_string<T...> fmt, T&&... args)
        {
            return make(UPATH_ERR_CANCELLED, fmt, std::forward<T>(args)...);
        }

        /** \brief Make an UPATH_ERR_EXHAUSTED exception.
         */
        template<typename... T>
        static Exception exhausted(fmt::format_string<T...> fmt, T&&... args)
        {
            return make(UPATH_ERR_EXHAUSTED, fmt, std::forward<T>(args)...);
        }

        /** \brief The status code describing the condition that led to the exception.
         */
        [[nodiscard]]
        upathStatus status() const noexcept;

        [[nodiscard]]
        char const* what() const noexcept override;

    private:
        std::string _msg;
        upathStatus _status;
    };

    /**
     * \brief Exception raised by a failed system call.  Keeps the errno next to the derived status.
     */
    class SystemException : public Exception
    {
    public:
        SystemException(std::string msg, int error);

        /**
         * \brief Create a new exception object.  The message is suffixed with the strerror() text.
         *
         * \param error The errno value reported by the failed call.
         */
        template<typename... T>
        static SystemException make(int error, fmt::format_string<T...> fmt, T&&... args)
        {
            return SystemException(fmt::format(fmt, std::forward<T>(args)...), error);
        }

        [[nodiscard]]
        int error() const noexcept;

    private:
        int _error;
    };
}
