// SPDX-FileCopyrightText: 2025 Contributors to the upath project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Logging.cpp
 * @brief Runtime configuration of the spdlog based logging used throughout upath
 *
 * The macros themselves live in Logging.hpp.  This translation unit applies the
 * UPATH_LOG_LEVEL environment variable to the spdlog registry, exactly once per
 * process, the first time a generator is created.
 */

#include "upath-internal/Logging.hpp"
#include <cstdlib>
#include <mutex>
#include <string>
#include <spdlog/cfg/helpers.h>

namespace upath::lib
{
    void initializeLogging()
    {
        static auto once = std::once_flag{};
        std::call_once(once,
            []()
            {
                // Unknown level names are ignored by spdlog, the default level stays in effect.
                if (auto const levels = std::getenv(LOG_LEVEL_ENV_VAR); levels != nullptr)
                {
                    spdlog::cfg::helpers::load_levels(std::string{levels});
                }
            });
    }
}
