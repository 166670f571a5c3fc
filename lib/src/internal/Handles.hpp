// SPDX-FileCopyrightText: 2025 Contributors to the upath project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Handles.hpp
 * @brief Conversions between the opaque C handles and the C++ objects behind them
 */

#pragma once

#include <stop_token>
#include <upath/upath.h>
#include "upath-internal/UniquePathGenerator.hpp"

namespace upath::lib
{
    inline UniquePathGenerator* to_Generator(upathGenerator in_generator) noexcept
    {
        return reinterpret_cast<UniquePathGenerator*>(in_generator);
    }

    inline upathGenerator to_upathGenerator(UniquePathGenerator* in_generator) noexcept
    {
        return reinterpret_cast<upathGenerator>(in_generator);
    }

    inline std::stop_source* to_StopSource(upathCancellation in_cancellation) noexcept
    {
        return reinterpret_cast<std::stop_source*>(in_cancellation);
    }

    inline upathCancellation to_upathCancellation(std::stop_source* in_source) noexcept
    {
        return reinterpret_cast<upathCancellation>(in_source);
    }

    /** The token of a cancellation handle, or an empty token (never signalled) for NULL. */
    inline std::stop_token to_StopToken(upathCancellation in_cancellation) noexcept
    {
        auto const source = to_StopSource(in_cancellation);
        return (source != nullptr) ? source->get_token() : std::stop_token{};
    }
}
