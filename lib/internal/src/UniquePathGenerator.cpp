// SPDX-FileCopyrightText: 2025 Contributors to the upath project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file UniquePathGenerator.cpp
 * @brief Candidate loops of the four unique path operations
 */

#include "upath-internal/UniquePathGenerator.hpp"
#include <utility>
#include "upath-internal/Exception.hpp"
#include "upath-internal/Logging.hpp"
#include "upath-internal/NameHint.hpp"
#include "upath-internal/PathUtils.hpp"
#include "upath-internal/RandomToken.hpp"
#include "upath-internal/TempLocation.hpp"

namespace upath::lib
{
    namespace
    {
        void throwIfCancelled(std::stop_token const& stopToken, char const* operation)
        {
            if (stopToken.stop_requested())
            {
                throw Exception::cancelled("{} was cancelled.", operation);
            }
        }

        /**
         * Run the candidate loop.
         *
         * @param makeCandidate Called with the attempt number (0, 1, 2, ...), returns the path to try
         */
        template<typename MakeCandidate>
        std::filesystem::path findUnique(ReservationStrategy const& strategy, std::uint64_t maxAttempts, std::stop_token const& stopToken,
            char const* operation, MakeCandidate&& makeCandidate)
        {
            for (auto attempt = std::uint64_t{0}; attempt < maxAttempts; ++attempt)
            {
                throwIfCancelled(stopToken, operation);

                auto candidate = makeCandidate(attempt);
                if (strategy.tryReserve(candidate) == ReservationOutcome::Reserved)
                {
                    UPATH_DEBUG("{}: obtained {} after {} collision(s) [{}]", operation, candidate.string(), attempt, strategy.name());
                    return candidate;
                }
            }

            UPATH_WARN("{}: every one of {} candidates was occupied [{}]", operation, maxAttempts, strategy.name());
            throw Exception::exhausted("{} gave up after {} occupied candidates.", operation, maxAttempts);
        }

        void requireDirectory(std::filesystem::path const& directory)
        {
            auto ec = std::error_code{};
            if (!std::filesystem::is_directory(directory, ec))
            {
                throw Exception::directoryNotFound("Directory '{}' does not exist.", directory.string());
            }
        }

        std::unique_ptr<ReservationStrategy> makeFileReservation(ReservationMode mode)
        {
            return (mode == ReservationMode::Advisory) ? makeAdvisoryLockStrategy() : makeExclusiveCreateStrategy();
        }

        std::string normalizePrefix(std::string const& prefix)
        {
            if (prefix.empty())
            {
                return DEFAULT_TEMP_DIRECTORY_PREFIX;
            }
            if (containsSeparator(prefix))
            {
                throw Exception::invalidArgument("Directory prefix '{}' must not contain a path separator.", prefix);
            }
            return prefix;
        }
    }

    UniquePathGenerator::UniquePathGenerator(GeneratorOptions options)
        : UniquePathGenerator{options, makeFileReservation(options.reservation)}
    {}

    UniquePathGenerator::UniquePathGenerator(GeneratorOptions options, std::unique_ptr<ReservationStrategy> fileReservation)
        : _options{std::move(options)}
        , _fileReservation{std::move(fileReservation)}
        , _existenceCheck{makeExistenceCheckStrategy()}
        , _directoryCreation{makeDirectoryCreateStrategy()}
    {
        initializeLogging();

        if (!_fileReservation)
        {
            throw Exception::invalidArgument("A file reservation strategy is required.");
        }
        if (_options.maxAttempts == 0)
        {
            throw Exception::invalidArgument("maxAttempts must be greater or equal to 1.");
        }
        UPATH_DEBUG("Created generator: reservation={} [{}], maxAttempts={}",
            toString(_options.reservation),
            _fileReservation->name(),
            _options.maxAttempts);
    }

    UniquePathGenerator::~UniquePathGenerator() = default;

    std::filesystem::path UniquePathGenerator::reserveFileFromIdentifier(std::filesystem::path const& directory, std::string const& identifier,
        std::stop_token const& stopToken) const
    {
        constexpr auto const operation = "reserveFileFromIdentifier";

        throwIfCancelled(stopToken, operation);
        requireDirectory(directory);

        auto const hint = makeNameHint(identifier, _options.defaultBaseName);
        UPATH_TRACE("{}: '{}' -> base '{}', extension '{}'", operation, identifier, hint.base, hint.extension);

        return findUnique(*_fileReservation,
            _options.maxAttempts,
            stopToken,
            operation,
            [&](std::uint64_t attempt) { return makeCandidatePath(directory, makeNumberedFileName(hint.base, hint.extension, attempt)); });
    }

    std::filesystem::path UniquePathGenerator::makeRandomFilePath(std::filesystem::path const& directory, std::string const& extension,
        std::stop_token const& stopToken) const
    {
        constexpr auto const operation = "makeRandomFilePath";

        throwIfCancelled(stopToken, operation);
        auto const normalized = normalizeExtension(extension);

        return findUnique(*_existenceCheck,
            _options.maxAttempts,
            stopToken,
            operation,
            [&](std::uint64_t) { return makeCandidatePath(directory, makeTokenFileName(makeRandomToken(), normalized)); });
    }

    std::filesystem::path UniquePathGenerator::makeRandomTempFilePath(std::string const& extension, std::stop_token const& stopToken) const
    {
        throwIfCancelled(stopToken, "makeRandomTempFilePath");
        return makeRandomFilePath(tempDirectory(), extension, stopToken);
    }

    std::filesystem::path UniquePathGenerator::makeUniqueTempDirectory(std::string const& prefix, bool create, std::stop_token const& stopToken) const
    {
        constexpr auto const operation = "makeUniqueTempDirectory";

        throwIfCancelled(stopToken, operation);
        auto const normalized = normalizePrefix(prefix);
        auto const& root = tempDirectory();

        auto const& strategy = create ? *_directoryCreation : *_existenceCheck;
        return findUnique(strategy,
            _options.maxAttempts,
            stopToken,
            operation,
            [&](std::uint64_t) { return makeCandidatePath(root, makeTempDirectoryName(normalized, makeRandomToken())); });
    }

    std::filesystem::path const& UniquePathGenerator::tempDirectory() const
    {
        if (_options.tempDirectory)
        {
            return *_options.tempDirectory;
        }
        return systemTempDirectory();
    }

    GeneratorOptions const& UniquePathGenerator::options() const noexcept
    {
        return _options;
    }

    bool UniquePathGenerator::reservesFiles() const noexcept
    {
        return _fileReservation->createsEntry();
    }
}
