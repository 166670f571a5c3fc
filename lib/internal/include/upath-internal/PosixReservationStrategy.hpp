// SPDX-FileCopyrightText: 2025 Contributors to the upath project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file PosixReservationStrategy.hpp
 * @brief Concrete reservation strategies for POSIX systems
 *
 * Collisions are told apart from fatal errors by errno only (see isCollisionErrno()
 * and statusFromErrno()), never by message text.
 */

#pragma once

#include <mutex>
#include "upath-internal/ReservationStrategy.hpp"

namespace upath::lib
{
    /**
     * Reserve a file by creating it with open(O_WRONLY|O_CREAT|O_EXCL).
     *
     * The kernel serializes competing creates of the same name, so two callers, in the
     * same or in different processes, can never both be told that a name is theirs.
     * On success the file exists, is empty, and is closed again.
     */
    class ExclusiveCreateStrategy final : public ReservationStrategy
    {
    public:
        ReservationOutcome tryReserve(std::filesystem::path const& candidate) const override;

        [[nodiscard]]
        bool createsEntry() const noexcept override;

        [[nodiscard]]
        char const* name() const noexcept override;
    };

    /**
     * Check-then-decide under one process-wide mutex.
     *
     * Every AdvisoryLockStrategy shares the same mutex, so two threads of one process cannot
     * be handed the same name.  Another process, or any writer that does not go through this
     * library, can still create the file between the check and its use.
     */
    class AdvisoryLockStrategy final : public ReservationStrategy
    {
    public:
        ReservationOutcome tryReserve(std::filesystem::path const& candidate) const override;

        [[nodiscard]]
        bool createsEntry() const noexcept override;

        [[nodiscard]]
        char const* name() const noexcept override;

    private:
        static std::mutex& processMutex() noexcept;
    };

    /**
     * Existence check only.  Used for random 128-bit names where the token space, not
     * the check, provides uniqueness.  A dangling symlink counts as occupied.
     */
    class ExistenceCheckStrategy final : public ReservationStrategy
    {
    public:
        ReservationOutcome tryReserve(std::filesystem::path const& candidate) const override;

        [[nodiscard]]
        bool createsEntry() const noexcept override;

        [[nodiscard]]
        char const* name() const noexcept override;
    };

    /**
     * Reserve a directory with mkdir().  EEXIST and transient errors are collisions.
     * A created directory whose resolved name differs from the requested one (ignoring
     * case) is not accepted and counts as a collision.
     */
    class DirectoryCreateStrategy final : public ReservationStrategy
    {
    public:
        ReservationOutcome tryReserve(std::filesystem::path const& candidate) const override;

        [[nodiscard]]
        bool createsEntry() const noexcept override;

        [[nodiscard]]
        char const* name() const noexcept override;
    };

    /**
     * Whether \p path is occupied by anything, including a dangling symlink.
     * @throws SystemException if the state cannot be determined (e.g. permission denied on a parent).
     */
    bool pathIsOccupied(std::filesystem::path const& path);

    /**
     * Keep a directory just created by mkdir if \p resolved (its canonical path) carries the requested
     * name, ignoring case.  Otherwise the directory is removed again and the candidate counts as a collision.
     *
     * @param resolved Canonical path of \p created, empty if it could not be resolved
     */
    ReservationOutcome keepIfResolvedName(std::filesystem::path const& created, std::filesystem::path const& resolved);
}
