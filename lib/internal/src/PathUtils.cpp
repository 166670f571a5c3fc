// SPDX-FileCopyrightText: 2025 Contributors to the upath project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file PathUtils.cpp
 * @brief Candidate name construction for the unique path generator
 */

#include "upath-internal/PathUtils.hpp"
#include <string_view>
#include <fmt/format.h>

namespace upath::lib
{
    /**
     * @brief Construct the n-th candidate name for a base name and extension
     *
     * The first candidate carries no number so that an uncontended download keeps the
     * name it was published under.  Later candidates insert "(n)" between base name
     * and extension, the convention used by browsers for duplicate downloads.
     *
     * @param base File name without its extension (may be empty, e.g. for ".bashrc" style names)
     * @param extension Extension including the leading '.', or empty
     * @param number Retry number, 0 for the first candidate
     */
    std::string makeNumberedFileName(std::string const& base, std::string const& extension, std::uint64_t number)
    {
        if (number == 0)
        {
            return base + extension;
        }
        return fmt::format("{}({}){}", base, number, extension);
    }

    std::string makeTokenFileName(std::string const& token, std::string const& extension)
    {
        return token + extension;
    }

    std::string makeTempDirectoryName(std::string const& prefix, std::string const& token)
    {
        return fmt::format("{}{}{}", prefix, TEMP_DIRECTORY_PREFIX_SEPARATOR, token);
    }

    /**
     * @brief Join a directory and a name
     *
     * The name is appended as a single component.  Callers make sure it contains no
     * separator (see containsSeparator()), otherwise the candidate could escape the
     * requested directory.
     */
    std::filesystem::path makeCandidatePath(std::filesystem::path const& directory, std::string const& name)
    {
        return directory / name;
    }

    bool containsSeparator(std::string const& name) noexcept
    {
        return name.find_first_of(std::string_view{"/\0", 2}) != std::string::npos;
    }
}
