// SPDX-FileCopyrightText: 2025 Contributors to the upath project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Exception.cpp
 * @brief Implementation of the upath exception types and errno classification
 */

#include "upath-internal/Exception.hpp"
#include <cerrno>
#include <cstring>

namespace upath::lib
{
    Exception::Exception(std::string msg, upathStatus status)
        : _msg(std::move(msg))
        , _status(status)
    {}

    upathStatus Exception::status() const noexcept
    {
        return _status;
    }

    char const* Exception::what() const noexcept
    {
        return _msg.c_str();
    }

    SystemException::SystemException(std::string msg, int error)
        : Exception(fmt::format("{}: {} (errno {})", msg, std::strerror(error), error), statusFromErrno(error))
        , _error(error)
    {}

    int SystemException::error() const noexcept
    {
        return _error;
    }

    upathStatus statusFromErrno(int error) noexcept
    {
        switch (error)
        {
            case ENOENT:
            case ENOTDIR:   return UPATH_ERR_DIRECTORY_NOT_FOUND;
            case EACCES:
            case EPERM:
            case EROFS:     return UPATH_ERR_PERMISSION_DENIED;
            case ECANCELED: return UPATH_ERR_CANCELLED;
            default:        return UPATH_ERR_IO;
        }
    }

    bool isCollisionErrno(int error) noexcept
    {
        switch (error)
        {
            case EEXIST:
            case EINTR:
            case EAGAIN:
            case EBUSY:
            case ETXTBSY: return true;
            default:      return false;
        }
    }
}
