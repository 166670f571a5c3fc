// SPDX-FileCopyrightText: 2025 Contributors to the upath project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file UniquePathGenerator.hpp
 * @brief Mint file and directory paths that do not collide with existing entries
 *
 * Every operation runs the same loop:
 *
 *   1. check the stop token (cancellation)
 *   2. build the next candidate (numbered name or fresh random token)
 *   3. ask a ReservationStrategy whether the candidate can be handed out
 *   4. return it, or go back to 1 on a collision
 *
 * The loop gives up after GeneratorOptions::maxAttempts candidates with UPATH_ERR_EXHAUSTED.
 *
 * GUARANTEES:
 * - reserveFileFromIdentifier (exclusive mode): the returned file did not exist and has been
 *   created empty by this call.  Holds across threads and processes.
 * - reserveFileFromIdentifier (advisory mode): the returned path was absent while holding a
 *   process-wide lock.  Nothing is created; no guarantee across processes.
 * - makeRandomFilePath / makeRandomTempFilePath: the returned path was absent at check time.
 *   Nothing is created; uniqueness rests on the 128-bit token.
 * - makeUniqueTempDirectory(create = true): the directory has been created by this call.
 *
 * Cancellation is observed before every candidate.  An entry created before cancellation is
 * observed is not removed again; it belongs to the caller.
 *
 * Thread-safety: immutable after construction, all operations may be called concurrently.
 * All operations block on filesystem I/O.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <stop_token>
#include <string>
#include <upath/platform.h>
#include "upath-internal/GeneratorOptions.hpp"
#include "upath-internal/ReservationStrategy.hpp"

namespace upath::lib
{
    class UPATH_EXPORT UniquePathGenerator
    {
    public:
        explicit UniquePathGenerator(GeneratorOptions options = {});

        /**
         * Use \p fileReservation in reserveFileFromIdentifier() instead of the strategy selected by
         * GeneratorOptions::reservation.
         *
         * @throws Exception UPATH_ERR_INVALID_ARG if \p fileReservation is null or maxAttempts is 0
         */
        UniquePathGenerator(GeneratorOptions options, std::unique_ptr<ReservationStrategy> fileReservation);

        UniquePathGenerator(UniquePathGenerator const&) = delete;
        UniquePathGenerator& operator=(UniquePathGenerator const&) = delete;

        ~UniquePathGenerator();

        /**
         * Reserve a file in \p directory named after \p identifier.
         *
         * Candidates are "<base><ext>", "<base>(1)<ext>", "<base>(2)<ext>", ... where base and
         * extension come from makeNameHint().
         *
         * @param directory Existing target directory
         * @param identifier Absolute URI or file name
         * @param stopToken Cancellation signal, checked before every candidate
         * @return Path of the reserved file
         *
         * @throws Exception UPATH_ERR_CANCELLED, UPATH_ERR_DIRECTORY_NOT_FOUND (\p directory missing or not a
         *         directory; reported before anything is created), UPATH_ERR_EXHAUSTED, or a SystemException
         *         for permission and I/O failures.
         */
        [[nodiscard]]
        std::filesystem::path reserveFileFromIdentifier(std::filesystem::path const& directory, std::string const& identifier,
            std::stop_token const& stopToken = {}) const;

        /**
         * Make "<token><extension>" in \p directory, verified absent, not created.
         *
         * @param extension Normalized with normalizeExtension() (empty -> ".tmp", leading '.' added)
         * @throws Exception UPATH_ERR_CANCELLED, UPATH_ERR_INVALID_ARG, UPATH_ERR_EXHAUSTED
         */
        [[nodiscard]]
        std::filesystem::path makeRandomFilePath(std::filesystem::path const& directory, std::string const& extension,
            std::stop_token const& stopToken = {}) const;

        /**
         * makeRandomFilePath() in the temporary directory (see tempDirectory()).
         */
        [[nodiscard]]
        std::filesystem::path makeRandomTempFilePath(std::string const& extension, std::stop_token const& stopToken = {}) const;

        /**
         * Make "<prefix>_<token>" in the temporary directory.
         *
         * @param prefix Empty selects "temp"
         * @param create Create the directory (true) or only verify that it does not exist (false)
         * @throws Exception UPATH_ERR_CANCELLED, UPATH_ERR_INVALID_ARG, UPATH_ERR_EXHAUSTED,
         *         UPATH_ERR_DIRECTORY_NOT_FOUND (temporary directory missing, create = true only)
         */
        [[nodiscard]]
        std::filesystem::path makeUniqueTempDirectory(std::string const& prefix = {}, bool create = true,
            std::stop_token const& stopToken = {}) const;

        /** The configured temporary directory, or the process-wide one. */
        [[nodiscard]]
        std::filesystem::path const& tempDirectory() const;

        [[nodiscard]]
        GeneratorOptions const& options() const noexcept;

        /** Whether reserveFileFromIdentifier() leaves the reserved file on disk. */
        [[nodiscard]]
        bool reservesFiles() const noexcept;

    private:
        GeneratorOptions _options;

        /** Strategy used by reserveFileFromIdentifier(), chosen by GeneratorOptions::reservation. */
        std::unique_ptr<ReservationStrategy> _fileReservation;
        /** Strategy used for random file names and for uncreated directories. */
        std::unique_ptr<ReservationStrategy> _existenceCheck;
        std::unique_ptr<ReservationStrategy> _directoryCreation;
    };
}
