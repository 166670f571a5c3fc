// SPDX-FileCopyrightText: 2025 Contributors to the upath project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file PosixReservationStrategy.cpp
 * @brief POSIX implementations of the reservation strategies
 *
 * Errno classification:
 *   - EEXIST, EINTR, EAGAIN, EBUSY, ETXTBSY   -> ReservationOutcome::Collision (retry)
 *   - ENOENT, ENOTDIR                         -> UPATH_ERR_DIRECTORY_NOT_FOUND (fatal)
 *   - EACCES, EPERM, EROFS                    -> UPATH_ERR_PERMISSION_DENIED (fatal)
 *   - anything else                           -> UPATH_ERR_IO (fatal)
 */

#include "upath-internal/PosixReservationStrategy.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/types.h>
#include "upath-internal/Exception.hpp"
#include "upath-internal/Logging.hpp"

namespace upath::lib
{
    namespace
    {
        constexpr auto const FILE_CREATE_MODE = mode_t{0666};      // Further restricted by the umask
        constexpr auto const DIRECTORY_CREATE_MODE = mode_t{0777}; // Further restricted by the umask

        bool equalsIgnoreCase(std::string const& lhs, std::string const& rhs) noexcept
        {
            return std::equal(lhs.begin(),
                lhs.end(),
                rhs.begin(),
                rhs.end(),
                [](char a, char b)
                { return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b)); });
        }
    }

    ReservationStrategy::~ReservationStrategy() = default;

    bool pathIsOccupied(std::filesystem::path const& path)
    {
        auto ec = std::error_code{};
        // symlink_status so that a dangling link is reported as occupied, not as absent.
        auto const status = std::filesystem::symlink_status(path, ec);
        if (status.type() == std::filesystem::file_type::not_found)
        {
            return false;
        }
        if (ec)
        {
            throw SystemException::make(ec.value(), "Could not query {}", path.string());
        }
        return true;
    }

    ReservationOutcome keepIfResolvedName(std::filesystem::path const& created, std::filesystem::path const& resolved)
    {
        if (!resolved.empty() && equalsIgnoreCase(resolved.filename().string(), created.filename().string()))
        {
            return ReservationOutcome::Reserved;
        }

        UPATH_WARN("Created directory {} does not resolve to the requested name, trying another one", created.string());
        if (::rmdir(created.c_str()) == -1)
        {
            UPATH_WARN("Failed to remove directory {}: errno {}", created.string(), errno);
        }
        return ReservationOutcome::Collision;
    }

    ///
    /// ExclusiveCreateStrategy
    ///

    ReservationOutcome ExclusiveCreateStrategy::tryReserve(std::filesystem::path const& candidate) const
    {
        auto const fd = ::open(candidate.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, FILE_CREATE_MODE);
        if (fd == -1)
        {
            auto const error = errno;
            if (isCollisionErrno(error))
            {
                UPATH_TRACE("Exclusive create of {} collided (errno {})", candidate.string(), error);
                return ReservationOutcome::Collision;
            }
            throw SystemException::make(error, "Could not create {}", candidate.string());
        }

        // The empty file is the reservation, nothing was written that a failed close could lose.
        if (::close(fd) == -1)
        {
            UPATH_WARN("Failed to close reserved file {}: errno {}", candidate.string(), errno);
        }
        return ReservationOutcome::Reserved;
    }

    bool ExclusiveCreateStrategy::createsEntry() const noexcept
    {
        return true;
    }

    char const* ExclusiveCreateStrategy::name() const noexcept
    {
        return "exclusive";
    }

    ///
    /// AdvisoryLockStrategy
    ///

    std::mutex& AdvisoryLockStrategy::processMutex() noexcept
    {
        static auto mutex = std::mutex{};
        return mutex;
    }

    ReservationOutcome AdvisoryLockStrategy::tryReserve(std::filesystem::path const& candidate) const
    {
        auto const lock = std::lock_guard{processMutex()};
        return pathIsOccupied(candidate) ? ReservationOutcome::Collision : ReservationOutcome::Reserved;
    }

    bool AdvisoryLockStrategy::createsEntry() const noexcept
    {
        return false;
    }

    char const* AdvisoryLockStrategy::name() const noexcept
    {
        return "advisory";
    }

    ///
    /// ExistenceCheckStrategy
    ///

    ReservationOutcome ExistenceCheckStrategy::tryReserve(std::filesystem::path const& candidate) const
    {
        return pathIsOccupied(candidate) ? ReservationOutcome::Collision : ReservationOutcome::Reserved;
    }

    bool ExistenceCheckStrategy::createsEntry() const noexcept
    {
        return false;
    }

    char const* ExistenceCheckStrategy::name() const noexcept
    {
        return "existence-check";
    }

    ///
    /// DirectoryCreateStrategy
    ///

    ReservationOutcome DirectoryCreateStrategy::tryReserve(std::filesystem::path const& candidate) const
    {
        if (::mkdir(candidate.c_str(), DIRECTORY_CREATE_MODE) == -1)
        {
            auto const error = errno;
            if (isCollisionErrno(error))
            {
                UPATH_TRACE("Creating directory {} collided (errno {})", candidate.string(), error);
                return ReservationOutcome::Collision;
            }
            throw SystemException::make(error, "Could not create directory {}", candidate.string());
        }

        // Guard against a filesystem that normalizes the name it was given.
        auto ec = std::error_code{};
        auto const resolved = std::filesystem::canonical(candidate, ec);
        return keepIfResolvedName(candidate, ec ? std::filesystem::path{} : resolved);
    }

    bool DirectoryCreateStrategy::createsEntry() const noexcept
    {
        return true;
    }

    char const* DirectoryCreateStrategy::name() const noexcept
    {
        return "mkdir";
    }

    ///
    /// Factories
    ///

    std::unique_ptr<ReservationStrategy> makeExclusiveCreateStrategy()
    {
        return std::make_unique<ExclusiveCreateStrategy>();
    }

    std::unique_ptr<ReservationStrategy> makeAdvisoryLockStrategy()
    {
        return std::make_unique<AdvisoryLockStrategy>();
    }

    std::unique_ptr<ReservationStrategy> makeExistenceCheckStrategy()
    {
        return std::make_unique<ExistenceCheckStrategy>();
    }

    std::unique_ptr<ReservationStrategy> makeDirectoryCreateStrategy()
    {
        return std::make_unique<DirectoryCreateStrategy>();
    }
}
