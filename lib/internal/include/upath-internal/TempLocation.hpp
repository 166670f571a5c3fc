// SPDX-FileCopyrightText: 2025 Contributors to the upath project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file TempLocation.hpp
 * @brief Process-wide temporary directory
 */

#pragma once

#include <filesystem>

namespace upath::lib
{
    /**
     * Get the system temporary directory.
     *
     * Resolved with std::filesystem::temp_directory_path() (TMPDIR, then /tmp) on the first
     * successful call and cached for the lifetime of the process.  Later changes to TMPDIR
     * are not observed.
     *
     * @throws Exception (UPATH_ERR_DIRECTORY_NOT_FOUND) if no temporary directory can be resolved.
     *         Nothing is cached in that case, the next call tries again.
     */
    std::filesystem::path const& systemTempDirectory();
}
