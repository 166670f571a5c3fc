// SPDX-FileCopyrightText: 2025 Contributors to the upath project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file RandomToken.hpp
 * @brief 128-bit random tokens used as collision resistant file and directory names
 *
 * Tokens are version 4 UUIDs rendered as 32 lowercase hex digits without dashes.
 * They are not meant to be unpredictable, only unique: with 122 random bits a
 * collision is not a realistic failure mode, the existence checks in the
 * generator are a safety net.
 */

#pragma once

#include <cstddef>
#include <string>

namespace upath::lib
{
    /** Number of characters in a token. */
    constexpr auto const RANDOM_TOKEN_LENGTH = std::size_t{32};

    /**
     * Make a fresh random token.
     * Thread-safe: every thread owns its own random engine, seeded from std::random_device.
     */
    std::string makeRandomToken();
}
