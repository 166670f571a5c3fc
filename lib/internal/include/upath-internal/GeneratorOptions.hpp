// SPDX-FileCopyrightText: 2025 Contributors to the upath project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file GeneratorOptions.hpp
 * @brief Configuration of a UniquePathGenerator
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include "upath-internal/PathUtils.hpp"

namespace upath::lib
{
    /**
     * How reserveFileFromIdentifier() claims a name.
     */
    enum class ReservationMode
    {
        Exclusive, // Create the file with O_CREAT|O_EXCL.  Safe across processes.
        Advisory,  // Check for existence under a process-wide lock, create nothing.  Safe within one process only.
    };

    /** Upper bound on candidates tried by one operation before it fails with UPATH_ERR_EXHAUSTED. */
    constexpr auto const DEFAULT_MAX_ATTEMPTS = std::uint64_t{1'000'000};

    struct GeneratorOptions
    {
        ReservationMode reservation = ReservationMode::Exclusive;

        std::uint64_t maxAttempts = DEFAULT_MAX_ATTEMPTS;

        /** Replaces the process-wide temporary directory for this generator when set. */
        std::optional<std::filesystem::path> tempDirectory;

        /** Base name used when an identifier yields no usable file name. */
        std::string defaultBaseName = DEFAULT_BASE_NAME;
    };

    /** "exclusive" or "advisory". */
    char const* toString(ReservationMode mode) noexcept;

    /** Parse "exclusive" or "advisory", std::nullopt for anything else. */
    std::optional<ReservationMode> reservationModeFromString(std::string const& name) noexcept;
}
