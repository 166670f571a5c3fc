// SPDX-FileCopyrightText: 2025 Contributors to the upath project.
// SPDX-License-Identifier: Apache-2.0

#include "upath/paths.h"
#include <cstring>
#include <filesystem>
#include <new>
#include <system_error>
#include "upath-internal/Exception.hpp"
#include "upath-internal/Logging.hpp"
#include "internal/Handles.hpp"

using namespace upath::lib;

namespace
{
    /**
     * Copy \p path into the caller buffer.
     * Returns UPATH_ERR_STRLEN and the required size (terminator included) if it does not fit.
     */
    upathStatus copyPathOut(std::filesystem::path const& path, char* out_path, size_t* inout_pathSize) noexcept
    {
        auto const& native = path.native();
        auto const required = native.size() + 1U;
        if ((out_path == nullptr) || (*inout_pathSize < required))
        {
            *inout_pathSize = required;
            return UPATH_ERR_STRLEN;
        }

        std::memcpy(out_path, native.c_str(), required);
        *inout_pathSize = required;
        return UPATH_STATUS_OK;
    }

    /**
     * Copy \p path out, removing the entry this call created if the buffer is too small so that the
     * caller can repeat the call with a larger buffer without leaking a reservation.
     */
    upathStatus deliver(std::filesystem::path const& path, bool created, char* out_path, size_t* inout_pathSize)
    {
        auto const status = copyPathOut(path, out_path, inout_pathSize);
        if ((status == UPATH_ERR_STRLEN) && created)
        {
            auto ec = std::error_code{};
            if (!std::filesystem::remove(path, ec) || ec)
            {
                UPATH_WARN("Could not release reservation {} after a too small buffer: {}", path.string(), ec.message());
            }
        }
        return status;
    }

    /** Run an operation and translate every exception into a status code. */
    template<typename F>
    upathStatus runOperation(char const* operation, F&& f) noexcept
    {
        try
        {
            return f();
        }
        catch (Exception const& e)
        {
            if (e.status() == UPATH_ERR_CANCELLED)
            {
                UPATH_DEBUG("{}: {}", operation, e.what());
            }
            else
            {
                UPATH_ERROR("{} failed: {}", operation, e.what());
            }
            return e.status();
        }
        catch (std::bad_alloc const&)
        {
            UPATH_CRITICAL("{} failed: out of memory", operation);
            return UPATH_ERR_UNKNOWN;
        }
        catch (std::exception const& e)
        {
            UPATH_ERROR("{} failed: {}", operation, e.what());
            return UPATH_ERR_UNKNOWN;
        }
    }
}

extern "C"
UPATH_EXPORT
upathStatus upathReserveFileFromIdentifier(upathGenerator in_generator, char const* in_directory, char const* in_identifier,
    upathCancellation in_cancellation, char* out_path, size_t* inout_pathSize)
{
    auto const generator = to_Generator(in_generator);
    if ((generator == nullptr) || (in_directory == nullptr) || (in_identifier == nullptr) || (inout_pathSize == nullptr))
    {
        return UPATH_ERR_INVALID_ARG;
    }

    return runOperation("upathReserveFileFromIdentifier",
        [&]()
        {
            auto const path = generator->reserveFileFromIdentifier(in_directory, in_identifier, to_StopToken(in_cancellation));
            return deliver(path, generator->reservesFiles(), out_path, inout_pathSize);
        });
}

extern "C"
UPATH_EXPORT
upathStatus upathMakeRandomFilePath(upathGenerator in_generator, char const* in_directory, char const* in_extension,
    upathCancellation in_cancellation, char* out_path, size_t* inout_pathSize)
{
    auto const generator = to_Generator(in_generator);
    if ((generator == nullptr) || (in_directory == nullptr) || (inout_pathSize == nullptr))
    {
        return UPATH_ERR_INVALID_ARG;
    }

    return runOperation("upathMakeRandomFilePath",
        [&]()
        {
            auto const extension = (in_extension != nullptr) ? in_extension : "";
            auto const path = generator->makeRandomFilePath(in_directory, extension, to_StopToken(in_cancellation));
            return deliver(path, false, out_path, inout_pathSize);
        });
}

extern "C"
UPATH_EXPORT
upathStatus upathMakeRandomTempFilePath(upathGenerator in_generator, char const* in_extension, upathCancellation in_cancellation,
    char* out_path, size_t* inout_pathSize)
{
    auto const generator = to_Generator(in_generator);
    if ((generator == nullptr) || (inout_pathSize == nullptr))
    {
        return UPATH_ERR_INVALID_ARG;
    }

    return runOperation("upathMakeRandomTempFilePath",
        [&]()
        {
            auto const extension = (in_extension != nullptr) ? in_extension : "";
            auto const path = generator->makeRandomTempFilePath(extension, to_StopToken(in_cancellation));
            return deliver(path, false, out_path, inout_pathSize);
        });
}

extern "C"
UPATH_EXPORT
upathStatus upathMakeUniqueTempDirectory(upathGenerator in_generator, char const* in_prefix, bool in_create,
    upathCancellation in_cancellation, char* out_path, size_t* inout_pathSize)
{
    auto const generator = to_Generator(in_generator);
    if ((generator == nullptr) || (inout_pathSize == nullptr))
    {
        return UPATH_ERR_INVALID_ARG;
    }

    return runOperation("upathMakeUniqueTempDirectory",
        [&]()
        {
            auto const prefix = (in_prefix != nullptr) ? in_prefix : "";
            auto const path = generator->makeUniqueTempDirectory(prefix, in_create, to_StopToken(in_cancellation));
            return deliver(path, in_create, out_path, inout_pathSize);
        });
}
