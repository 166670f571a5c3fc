// SPDX-FileCopyrightText: 2025 Contributors to the upath project.
// SPDX-License-Identifier: Apache-2.0

#include "upath/upath.h"
#include <new>
#include <stop_token>
#include "upath-internal/Exception.hpp"
#include "upath-internal/GeneratorOptionsParser.hpp"
#include "upath-internal/Logging.hpp"
#include "internal/Handles.hpp"

using namespace upath::lib;

extern "C"
UPATH_EXPORT
char const* upathStatusToString(upathStatus in_status)
{
    switch (in_status)
    {
        case UPATH_STATUS_OK:               return "UPATH_STATUS_OK";
        case UPATH_ERR_UNKNOWN:             return "UPATH_ERR_UNKNOWN";
        case UPATH_ERR_INVALID_ARG:         return "UPATH_ERR_INVALID_ARG";
        case UPATH_ERR_DIRECTORY_NOT_FOUND: return "UPATH_ERR_DIRECTORY_NOT_FOUND";
        case UPATH_ERR_CANCELLED:           return "UPATH_ERR_CANCELLED";
        case UPATH_ERR_EXHAUSTED:           return "UPATH_ERR_EXHAUSTED";
        case UPATH_ERR_PERMISSION_DENIED:   return "UPATH_ERR_PERMISSION_DENIED";
        case UPATH_ERR_IO:                  return "UPATH_ERR_IO";
        case UPATH_ERR_STRLEN:              return "UPATH_ERR_STRLEN";
        default:                            return "UPATH_ERR_UNKNOWN";
    }
}

extern "C"
UPATH_EXPORT
upathStatus upathGetVersion(upathVersionType* out_version)
{
    if (out_version == nullptr)
    {
        return UPATH_ERR_INVALID_ARG;
    }

    out_version->major = UPATH_VERSION_MAJOR;
    out_version->minor = UPATH_VERSION_MINOR;
    out_version->bugfix = UPATH_VERSION_PATCH;
    out_version->full = UPATH_VERSION_FULL;
    return UPATH_STATUS_OK;
}

extern "C"
UPATH_EXPORT
upathGenerator upathCreateGenerator(char const* in_options)
{
    try
    {

        auto const parser = GeneratorOptionsParser{(in_options != nullptr) ? in_options : ""};
        return to_upathGenerator(new UniquePathGenerator{parser.applyTo(GeneratorOptions{})});
    }
    catch (Exception const& e)
    {
        UPATH_ERROR("Failed to create generator: {} ({})", e.what(), upathStatusToString(e.status()));
    }
    catch (std::exception const& e)
    {
        UPATH_ERROR("Failed to create generator: {}", e.what());
    }
    return nullptr;
}

extern "C"
UPATH_EXPORT
upathStatus upathDestroyGenerator(upathGenerator in_generator)
{
    if (auto const generator = to_Generator(in_generator); generator != nullptr)
    {
        delete generator;
        return UPATH_STATUS_OK;
    }
    return UPATH_ERR_INVALID_ARG;
}

extern "C"
UPATH_EXPORT
upathCancellation upathCreateCancellation(void)
{
    return to_upathCancellation(new (std::nothrow) std::stop_source{});
}

extern "C"
UPATH_EXPORT
upathStatus upathCancel(upathCancellation in_cancellation)
{
    if (auto const source = to_StopSource(in_cancellation); source != nullptr)
    {
        source->request_stop();
        return UPATH_STATUS_OK;
    }
    return UPATH_ERR_INVALID_ARG;
}

extern "C"
UPATH_EXPORT
upathStatus upathIsCancelled(upathCancellation in_cancellation, bool* out_cancelled)
{
    if (auto const source = to_StopSource(in_cancellation); (source != nullptr) && (out_cancelled != nullptr))
    {
        *out_cancelled = source->stop_requested();
        return UPATH_STATUS_OK;
    }
    return UPATH_ERR_INVALID_ARG;
}

extern "C"
UPATH_EXPORT
upathStatus upathDestroyCancellation(upathCancellation in_cancellation)
{
    if (auto const source = to_StopSource(in_cancellation); source != nullptr)
    {
        delete source;
        return UPATH_STATUS_OK;
    }
    return UPATH_ERR_INVALID_ARG;
}
