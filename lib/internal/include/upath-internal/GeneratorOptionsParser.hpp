// SPDX-FileCopyrightText: 2025 Contributors to the upath project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file GeneratorOptionsParser.hpp
 * @brief Parse the JSON options passed to upathCreateGenerator()
 *
 * Example options JSON:
 * {
 *   "reservation": "advisory",          // "exclusive" (default) or "advisory"
 *   "maxAttempts": 5000,                // candidates tried before UPATH_ERR_EXHAUSTED
 *   "tempDirectory": "/scratch/tmp",    // replaces the process temporary directory
 *   "defaultBaseName": "download"       // used when an identifier yields no name
 * }
 *
 * Design:
 * - std::optional fields (no value = keep the GeneratorOptions default)
 * - Immutable after construction
 * - Validated during parsing (throws Exception with UPATH_ERR_INVALID_ARG)
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <picojson/picojson.h>
#include "upath-internal/GeneratorOptions.hpp"

namespace upath::lib
{
    class GeneratorOptionsParser
    {
    public:
        /**
         * Parse a JSON string of generator options.  An empty string means no options.
         *
         * @throws Exception (UPATH_ERR_INVALID_ARG) if the JSON is malformed, the root is not an object,
         *         or a known field has the wrong type or an out of range value.  Unknown fields are ignored.
         */
        explicit GeneratorOptionsParser(std::string const& in_options);

        [[nodiscard]]
        std::optional<ReservationMode> getReservationMode() const;

        [[nodiscard]]
        std::optional<std::uint64_t> getMaxAttempts() const;

        [[nodiscard]]
        std::optional<std::filesystem::path> getTempDirectory() const;

        [[nodiscard]]
        std::optional<std::string> getDefaultBaseName() const;

        /** Apply every field present in the JSON on top of \p defaults. */
        [[nodiscard]]
        GeneratorOptions applyTo(GeneratorOptions defaults) const;

    private:
        std::optional<ReservationMode> _reservationMode;
        std::optional<std::uint64_t> _maxAttempts;
        std::optional<std::filesystem::path> _tempDirectory;
        std::optional<std::string> _defaultBaseName;
    };
}
