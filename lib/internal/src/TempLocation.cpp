// SPDX-FileCopyrightText: 2025 Contributors to the upath project.
// SPDX-License-Identifier: Apache-2.0

#include "upath-internal/TempLocation.hpp"
#include "upath-internal/Exception.hpp"
#include "upath-internal/Logging.hpp"

namespace upath::lib
{
    std::filesystem::path const& systemTempDirectory()
    {
        // A throwing initializer leaves the static uninitialized, so a failed lookup is retried.
        static auto const tempDirectory = []()
        {
            auto ec = std::error_code{};
            auto result = std::filesystem::temp_directory_path(ec);
            if (ec)
            {
                throw Exception::directoryNotFound("Could not resolve the temporary directory: {}", ec.message());
            }
            UPATH_DEBUG("Using temporary directory {}", result.string());
            return result;
        }();
        return tempDirectory;
    }
}
