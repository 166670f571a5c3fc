// SPDX-FileCopyrightText: 2025 Contributors to the upath project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file ReservationStrategy.hpp
 * @brief Abstract interface deciding whether a candidate path can be handed out
 *
 * The generator owns the naming and retry logic; a strategy only answers one
 * question per candidate: "is this one mine?".  Depending on the strategy the
 * answer is backed by the filesystem (exclusive create, mkdir) or only by an
 * existence check.
 *
 * Strategy hierarchy (see PosixReservationStrategy.hpp):
 *   ReservationStrategy (abstract)
 *     ├── ExclusiveCreateStrategy   -- open(O_CREAT|O_EXCL), safe across processes
 *     ├── AdvisoryLockStrategy      -- existence check under a process-wide mutex
 *     ├── ExistenceCheckStrategy    -- existence check only, for random names
 *     └── DirectoryCreateStrategy   -- mkdir() + name verification
 */

#pragma once

#include <filesystem>
#include <memory>

namespace upath::lib
{
    /** Result of a reservation attempt that did not fail fatally. */
    enum class ReservationOutcome
    {
        Reserved,  // The candidate is the caller's (created, or verified absent)
        Collision, // The candidate is taken or transiently contended, try the next one
    };

    class ReservationStrategy
    {
    public:
        virtual ~ReservationStrategy();

        /**
         * Try to claim a candidate path.
         *
         * @return Reserved or Collision.
         * @throws SystemException for failures that retrying cannot fix (missing directory, permissions, ...).
         */
        virtual ReservationOutcome tryReserve(std::filesystem::path const& candidate) const = 0;

        /** Whether a Reserved outcome leaves a new entry on disk that the caller owns. */
        [[nodiscard]]
        virtual bool createsEntry() const noexcept = 0;

        /** Short name used in log messages. */
        [[nodiscard]]
        virtual char const* name() const noexcept = 0;

    protected:
        ReservationStrategy() = default;
    };

    /** Posix strategy creating the candidate file with an exclusive create. */
    std::unique_ptr<ReservationStrategy> makeExclusiveCreateStrategy();
    /** Posix strategy checking existence under a process-wide lock. */
    std::unique_ptr<ReservationStrategy> makeAdvisoryLockStrategy();
    /** Posix strategy checking existence without any lock. */
    std::unique_ptr<ReservationStrategy> makeExistenceCheckStrategy();
    /** Posix strategy creating the candidate directory. */
    std::unique_ptr<ReservationStrategy> makeDirectoryCreateStrategy();
}
