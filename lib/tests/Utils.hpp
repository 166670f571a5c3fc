// SPDX-FileCopyrightText: 2025 Contributors to the upath project.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

namespace upath::tests
{
    //
    // RAII helper to prepare and cleanup a scratch directory for the duration of a test
    //
    class ScratchDirectoryFixture
    {
    public:
        /// Create the fixture. Creates a fresh, empty directory below the system temp location.
        ScratchDirectoryFixture();
        /// Delete the scratch directory and everything in it
        ~ScratchDirectoryFixture();

    protected:
        /// The path to the scratch directory
        std::filesystem::path scratch;

        /// The options string that points tempDirectory at the scratch directory
        std::string scratchOptions() const;

    private:
        /// Remove the scratch directory if it exists
        void removeScratch();
    };

    // Create an empty regular file
    void touch(std::filesystem::path const& filepath);

    // Number of entries (files, directories, links) directly inside a directory
    std::size_t countEntries(std::filesystem::path const& directory);

    // Helper to make a unique scratch directory name
    auto makeScratchPath() -> std::filesystem::path;

} // namespace upath::tests
