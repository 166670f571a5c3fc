// SPDX-FileCopyrightText: 2025 Contributors to the upath project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file PathUtils.hpp
 * @brief Candidate name construction for the unique path generator
 *
 * Every name the generator tries is built by one of these functions, so the naming
 * scheme is defined in a single place:
 *
 *   ${directory}/
 *     photo.jpg                         -- first candidate derived from an identifier
 *     photo(1).jpg, photo(2).jpg, ...   -- numbered retries after collisions
 *     3f2a...c9e1.png                   -- random token + extension
 *
 *   ${temp}/
 *     build_3f2a...c9e1/                -- prefix + '_' + random token
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace upath::lib
{
    constexpr auto const DEFAULT_BASE_NAME = "file";                // Used when an identifier yields no usable name
    constexpr auto const DEFAULT_EXTENSION = ".tmp";                // Used when the caller passes no extension
    constexpr auto const DEFAULT_TEMP_DIRECTORY_PREFIX = "temp";    // Used when the caller passes no directory prefix
    constexpr auto const TEMP_DIRECTORY_PREFIX_SEPARATOR = '_';     // Between prefix and token: "temp_<token>"
    constexpr auto const EXTENSION_SEPARATOR = '.';

    /**
     * Construct the n-th candidate file name for a base name and extension.
     * Example: makeNumberedFileName("photo", ".jpg", 0) -> "photo.jpg"
     *          makeNumberedFileName("photo", ".jpg", 2) -> "photo(2).jpg"
     */
    std::string makeNumberedFileName(std::string const& base, std::string const& extension, std::uint64_t number);

    /** Construct a random file name.  The extension must already be normalized. */
    std::string makeTokenFileName(std::string const& token, std::string const& extension);

    /**
     * Construct a temporary directory name.
     * Example: makeTempDirectoryName("build", "3f2a...") -> "build_3f2a..."
     */
    std::string makeTempDirectoryName(std::string const& prefix, std::string const& token);

    /** Join a directory and a single name component into a candidate path. */
    std::filesystem::path makeCandidatePath(std::filesystem::path const& directory, std::string const& name);

    /** Whether \p name contains a character that would make it span more than one path component. */
    bool containsSeparator(std::string const& name) noexcept;
}
