// SPDX-FileCopyrightText: 2025 Contributors to the upath project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file NameHint.cpp
 * @brief Identifier parsing for the unique path generator
 *
 * Only the small subset of RFC 3986 needed to find the last path segment is
 * implemented: scheme detection, authority skipping, query/fragment removal and
 * percent-decoding.  Anything that does not look like an absolute URI is handed
 * to std::filesystem as a plain file name.
 */

#include "upath-internal/NameHint.hpp"
#include <filesystem>
#include "upath-internal/Exception.hpp"
#include "upath-internal/PathUtils.hpp"

namespace upath::lib
{
    namespace
    {
        // A one letter scheme is rejected so that "C:photo.jpg" stays a file name.
        constexpr auto const MIN_SCHEME_LENGTH = std::size_t{2};

        constexpr bool isAlpha(char c) noexcept
        {
            return ((c >= 'a') && (c <= 'z')) || ((c >= 'A') && (c <= 'Z'));
        }

        constexpr bool isDigit(char c) noexcept
        {
            return (c >= '0') && (c <= '9');
        }

        constexpr int hexValue(char c) noexcept
        {
            if (isDigit(c))
            {
                return c - '0';
            }
            if ((c >= 'a') && (c <= 'f'))
            {
                return c - 'a' + 10;
            }
            if ((c >= 'A') && (c <= 'F'))
            {
                return c - 'A' + 10;
            }
            return -1;
        }

        /** Length of the scheme if \p identifier starts with "scheme:", 0 otherwise. */
        std::size_t schemeLength(std::string_view identifier) noexcept
        {
            if (identifier.empty() || !isAlpha(identifier.front()))
            {
                return 0;
            }

            for (auto i = std::size_t{1}; i < identifier.size(); ++i)
            {
                auto const c = identifier[i];
                if (c == ':')
                {
                    return (i >= MIN_SCHEME_LENGTH) ? i : 0;
                }
                if (!isAlpha(c) && !isDigit(c) && (c != '+') && (c != '-') && (c != '.'))
                {
                    return 0;
                }
            }
            return 0;
        }

        /** Percent-decode \p encoded.  Returns std::nullopt on a truncated or non-hex escape. */
        std::optional<std::string> percentDecode(std::string_view encoded)
        {
            auto result = std::string{};
            result.reserve(encoded.size());

            for (auto i = std::size_t{0}; i < encoded.size(); ++i)
            {
                if (encoded[i] != '%')
                {
                    result.push_back(encoded[i]);
                    continue;
                }

                if (i + 2 >= encoded.size())
                {
                    return std::nullopt;
                }
                auto const high = hexValue(encoded[i + 1]);
                auto const low = hexValue(encoded[i + 2]);
                if ((high < 0) || (low < 0))
                {
                    return std::nullopt;
                }
                result.push_back(static_cast<char>((high << 4) | low));
                i += 2;
            }
            return result;
        }

        bool isUsableName(std::string const& name) noexcept
        {
            return !name.empty() && (name != ".") && (name != "..") && !containsSeparator(name);
        }
    }

    std::optional<std::string> fileNameFromUri(std::string_view identifier)
    {
        auto const scheme = schemeLength(identifier);
        if (scheme == 0)
        {
            return std::nullopt;
        }

        auto rest = identifier.substr(scheme + 1);

        // Anything with white space or control characters is not a well formed URI.
        for (auto const c : rest)
        {
            if (static_cast<unsigned char>(c) <= 0x20)
            {
                return std::nullopt;
            }
        }

        // Query and fragment never contribute to the file name.
        if (auto const end = rest.find_first_of("?#"); end != std::string_view::npos)
        {
            rest = rest.substr(0, end);
        }

        // Skip the authority ("//user@host:port"), the path starts at the next '/'.
        if (rest.substr(0, 2) == "//")
        {
            auto const pathStart = rest.find('/', 2);
            rest = (pathStart == std::string_view::npos) ? std::string_view{} : rest.substr(pathStart);
        }

        auto const lastSlash = rest.rfind('/');
        auto const segment = (lastSlash == std::string_view::npos) ? rest : rest.substr(lastSlash + 1);

        return percentDecode(segment);
    }

    std::string extractFileName(std::string_view identifier)
    {
        if (auto fromUri = fileNameFromUri(identifier); fromUri)
        {
            return *std::move(fromUri);
        }
        return std::filesystem::path{identifier}.filename().string();
    }

    NameHint makeNameHint(std::string_view identifier, std::string const& defaultBaseName)
    {
        auto name = extractFileName(identifier);
        if (!isUsableName(name))
        {
            name = defaultBaseName;
        }

        auto const asPath = std::filesystem::path{name};
        return NameHint{asPath.stem().string(), asPath.extension().string()};
    }

    std::string normalizeExtension(std::string_view extension)
    {
        if (extension.empty())
        {
            return DEFAULT_EXTENSION;
        }

        auto result = std::string{extension};
        if (containsSeparator(result))
        {
            throw Exception::invalidArgument("Extension '{}' must not contain a path separator.", result);
        }
        if (result.front() != EXTENSION_SEPARATOR)
        {
            result.insert(result.begin(), EXTENSION_SEPARATOR);
        }
        return result;
    }
}
