// SPDX-FileCopyrightText: 2025 Contributors to the upath project.
// SPDX-License-Identifier: Apache-2.0

#include "Utils.hpp"
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>
#include <fmt/format.h>
#include "upath-internal/RandomToken.hpp"

namespace upath::tests
{
    ScratchDirectoryFixture::ScratchDirectoryFixture()
        : scratch{makeScratchPath()}
    {
        removeScratch();
        std::filesystem::create_directories(scratch);
    }

    ScratchDirectoryFixture::~ScratchDirectoryFixture()
    {
        removeScratch();
    }

    std::string ScratchDirectoryFixture::scratchOptions() const
    {
        return fmt::format(R"({{"tempDirectory": "{}"}})", scratch.string());
    }

    void ScratchDirectoryFixture::removeScratch()
    {
        auto ec = std::error_code{};
        std::filesystem::remove_all(scratch, ec);
    }

    void touch(std::filesystem::path const& filepath)
    {
        auto file = std::ofstream{filepath};
        if (!file)
        {
            throw std::runtime_error{"Failed to create file: " + filepath.string()};
        }
    }

    std::size_t countEntries(std::filesystem::path const& directory)
    {
        auto const it = std::filesystem::directory_iterator{directory};
        return static_cast<std::size_t>(std::distance(std::filesystem::begin(it), std::filesystem::end(it)));
    }

    auto makeScratchPath() -> std::filesystem::path
    {
        return std::filesystem::temp_directory_path() / fmt::format("upath_test_{}", upath::lib::makeRandomToken());
    }
}
