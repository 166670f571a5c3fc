// SPDX-FileCopyrightText: 2025 Contributors to the upath project.
// SPDX-License-Identifier: Apache-2.0

#include "upath-internal/RandomToken.hpp"
#include <algorithm>
#include <array>
#include <functional>
#include <random>
#include <uuid.h>

namespace upath::lib
{
    namespace
    {
        std::mt19937& threadEngine()
        {
            thread_local auto engine = []()
            {
                auto device = std::random_device{};
                auto seedData = std::array<std::random_device::result_type, std::mt19937::state_size>{};
                std::generate(seedData.begin(), seedData.end(), std::ref(device));
                auto seq = std::seed_seq(seedData.begin(), seedData.end());
                return std::mt19937{seq};
            }();
            return engine;
        }
    }

    std::string makeRandomToken()
    {
        auto generator = uuids::uuid_random_generator{threadEngine()};
        auto token = uuids::to_string(generator());
        token.erase(std::remove(token.begin(), token.end(), '-'), token.end());
        return token;
    }
}
