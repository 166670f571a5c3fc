// SPDX-FileCopyrightText: 2025 Contributors to the upath project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file GeneratorOptionsParser.cpp
 * @brief Parses generator configuration from JSON
 *
 * Options let an application trade safety for compatibility ("advisory" mode for
 * callers that must not see a pre-created file), bound the retry loops, and
 * redirect temporary paths to a scratch volume without touching TMPDIR for the
 * whole process.
 */

#include "upath-internal/GeneratorOptionsParser.hpp"
#include <cmath>
#include <limits>
#include "upath-internal/Exception.hpp"

namespace upath::lib
{
    char const* toString(ReservationMode mode) noexcept
    {
        switch (mode)
        {
            case ReservationMode::Exclusive: return "exclusive";
            case ReservationMode::Advisory:  return "advisory";
            default:                         return "unknown";
        }
    }

    std::optional<ReservationMode> reservationModeFromString(std::string const& name) noexcept
    {
        if (name == "exclusive")
        {
            return ReservationMode::Exclusive;
        }
        if (name == "advisory")
        {
            return ReservationMode::Advisory;
        }
        return std::nullopt;
    }

    /**
     * @brief Parse generator options from a JSON string
     *
     * Validation rules:
     * - reservation: "exclusive" or "advisory"
     * - maxAttempts: integral number >= 1
     * - tempDirectory: non-empty string
     * - defaultBaseName: non-empty string without separators, not "." or ".."
     */
    GeneratorOptionsParser::GeneratorOptionsParser(std::string const& in_options)
    {
        if (in_options.empty())
        {
            return;
        }

        auto jsonValue = picojson::value{};
        auto const err = picojson::parse(jsonValue, in_options);
        if (!err.empty())
        {
            throw Exception::invalidArgument("Invalid JSON options. {}", err);
        }

        if (!jsonValue.is<picojson::object>())
        {
            throw Exception::invalidArgument("Expected a JSON object");
        }
        auto const& root = jsonValue.get<picojson::object>();

        if (auto it = root.find("reservation"); it != root.end())
        {
            if (!it->second.is<std::string>())
            {
                throw Exception::invalidArgument("reservation must be a string.");
            }

            _reservationMode = reservationModeFromString(it->second.get<std::string>());
            if (!_reservationMode)
            {
                throw Exception::invalidArgument("reservation must be 'exclusive' or 'advisory', got '{}'.", it->second.get<std::string>());
            }
        }

        if (auto it = root.find("maxAttempts"); it != root.end())
        {
            if (!it->second.is<double>())
            {
                throw Exception::invalidArgument("maxAttempts must be a number.");
            }

            auto const v = it->second.get<double>();
            if ((v < 1) || (v != std::floor(v)) || (v >= static_cast<double>(std::numeric_limits<std::uint64_t>::max())))
            {
                throw Exception::invalidArgument("maxAttempts must be an integer greater or equal to 1.");
            }

            _maxAttempts = static_cast<std::uint64_t>(v);
        }

        if (auto it = root.find("tempDirectory"); it != root.end())
        {
            if (!it->second.is<std::string>() || it->second.get<std::string>().empty())
            {
                throw Exception::invalidArgument("tempDirectory must be a non-empty string.");
            }

            _tempDirectory = std::filesystem::path{it->second.get<std::string>()};
        }

        if (auto it = root.find("defaultBaseName"); it != root.end())
        {
            if (!it->second.is<std::string>())
            {
                throw Exception::invalidArgument("defaultBaseName must be a string.");
            }

            auto const& name = it->second.get<std::string>();
            if (name.empty() || (name == ".") || (name == "..") || containsSeparator(name))
            {
                throw Exception::invalidArgument("defaultBaseName '{}' is not a valid file name.", name);
            }

            _defaultBaseName = name;
        }
    }

    std::optional<ReservationMode> GeneratorOptionsParser::getReservationMode() const
    {
        return _reservationMode;
    }

    std::optional<std::uint64_t> GeneratorOptionsParser::getMaxAttempts() const
    {
        return _maxAttempts;
    }

    std::optional<std::filesystem::path> GeneratorOptionsParser::getTempDirectory() const
    {
        return _tempDirectory;
    }

    std::optional<std::string> GeneratorOptionsParser::getDefaultBaseName() const
    {
        return _defaultBaseName;
    }

    GeneratorOptions GeneratorOptionsParser::applyTo(GeneratorOptions defaults) const
    {
        defaults.reservation = _reservationMode.value_or(defaults.reservation);
        defaults.maxAttempts = _maxAttempts.value_or(defaults.maxAttempts);
        if (_tempDirectory)
        {
            defaults.tempDirectory = _tempDirectory;
        }
        defaults.defaultBaseName = _defaultBaseName.value_or(defaults.defaultBaseName);
        return defaults;
    }
}
