// SPDX-FileCopyrightText: 2025 Contributors to the upath project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file upath.h
 * @brief Core upath SDK entry point -- status codes, versioning, generator and cancellation handles.
 *
 * This is the first header most consumers will include.  It defines:
 *
 *   1. **upathStatus**       -- The error/success codes returned by every upath function.
 *   2. **upathVersionType**  -- Semantic version of the SDK at runtime.
 *   3. **upathGenerator**    -- Opaque handle to a configured unique path generator.
 *   4. **upathCancellation** -- Opaque handle used to interrupt long retry loops.
 *
 * Typical usage:
 * @code
 *     #include <upath/upath.h>
 *     #include <upath/paths.h>
 *
 *     upathGenerator gen = upathCreateGenerator(NULL);
 *
 *     char path[4096];
 *     size_t size = sizeof path;
 *     if (upathReserveFileFromIdentifier(gen, "/var/downloads", "https://example.com/photo.jpg", NULL, path, &size) == UPATH_STATUS_OK)
 *     {
 *         // path now names an empty file that belongs to the caller
 *     }
 *
 *     upathDestroyGenerator(gen);
 * @endcode
 */

#pragma once

#ifdef __cplusplus
#   include <cstddef>
#   include <cstdint>
#else
#   include <stdbool.h>
#   include <stddef.h>
#   include <stdint.h>
#endif

#include <upath/platform.h>

#ifdef __cplusplus
extern "C"
{
#endif

    /* ======================================================================
     * Status codes
     * ==================================================================== */

    /**
     * Return-code enum for the upath SDK.
     *
     * Any value other than UPATH_STATUS_OK indicates that the operation did not
     * succeed and that any [out] parameters should be considered uninitialised,
     * except where documented otherwise (see UPATH_ERR_STRLEN).
     */
    typedef enum upathStatus
    {
        UPATH_STATUS_OK,               /**< Success -- the operation completed normally.                                   */
        UPATH_ERR_UNKNOWN,             /**< An unexpected internal error occurred.                                         */
        UPATH_ERR_INVALID_ARG,         /**< One or more arguments are NULL or otherwise invalid.                           */
        UPATH_ERR_DIRECTORY_NOT_FOUND, /**< The target directory does not exist.  A setup problem, never retried.          */
        UPATH_ERR_CANCELLED,           /**< The cancellation handle was signalled before a path could be obtained.         */
        UPATH_ERR_EXHAUSTED,           /**< Every candidate tried within the configured attempt limit was occupied.        */
        UPATH_ERR_PERMISSION_DENIED,   /**< File-system permissions prevent creating the candidate.                        */
        UPATH_ERR_IO,                  /**< Any other non-transient I/O failure (no space, name too long, ...).            */
        UPATH_ERR_STRLEN,              /**< The output buffer is too small.  The required size has been written back.      */
    } upathStatus;

    /**
     * Get a static, human readable name for a status code (e.g. "UPATH_ERR_CANCELLED").
     * Never returns NULL.
     */
    UPATH_EXPORT
    char const* upathStatusToString(upathStatus in_status);

    /* ======================================================================
     * SDK version
     * ==================================================================== */

    typedef struct upathVersionType
    {
        uint16_t    major;  /**< Major version -- incremented on breaking API changes. */
        uint16_t    minor;  /**< Minor version -- incremented on backwards-compatible additions. */
        uint16_t    bugfix; /**< Patch version -- incremented on backwards-compatible bug fixes. */
        char const* full;   /**< Human-readable version string, e.g. "1.0.0". Owned by the library. */
    } upathVersionType;

    /**
     * Retrieve the version of the upath SDK that is currently linked.
     *
     * @param[out] out_version  Must not be NULL.
     * @return UPATH_STATUS_OK on success,
     *         UPATH_ERR_INVALID_ARG if \p out_version is NULL.
     */
    UPATH_EXPORT
    upathStatus upathGetVersion(upathVersionType* out_version);

    /* ======================================================================
     * Generator lifecycle
     * ======================================================================
     * A generator holds the configuration used by the operations declared in
     * <upath/paths.h>.  It is immutable once created and may be shared by any
     * number of threads.
     * ==================================================================== */

    /** Opaque handle to a generator.  Created by upathCreateGenerator(). */
    typedef struct upathGenerator_t* upathGenerator;

    /**
     * Create a new generator.
     *
     * @param[in] in_options  Optional JSON object configuring the generator, or NULL for defaults.
     *                        Recognised fields (all optional):
     *                          - "reservation":     "exclusive" (default) or "advisory"
     *                          - "maxAttempts":     number of candidates tried before giving up (default 1000000)
     *                          - "tempDirectory":   overrides the process temporary directory
     *                          - "defaultBaseName": base name used when an identifier yields none (default "file")
     * @return A valid generator, or NULL if the options are invalid.
     */
    UPATH_NODISCARD
    UPATH_EXPORT
    upathGenerator upathCreateGenerator(char const* in_options);

    /**
     * Destroy a generator.
     *
     * @return UPATH_STATUS_OK on success,
     *         UPATH_ERR_INVALID_ARG if \p in_generator is NULL.
     */
    UPATH_EXPORT
    upathStatus upathDestroyGenerator(upathGenerator in_generator);

    /* ======================================================================
     * Cancellation
     * ======================================================================
     * Every path operation accepts an optional cancellation handle.  It is
     * checked before each candidate is generated, so a pathological retry
     * loop can be interrupted from another thread.
     * ==================================================================== */

    /** Opaque cancellation handle.  Created by upathCreateCancellation(). */
    typedef struct upathCancellation_t* upathCancellation;

    /** Create a cancellation handle in the non-signalled state.  Returns NULL on allocation failure. */
    UPATH_NODISCARD
    UPATH_EXPORT
    upathCancellation upathCreateCancellation(void);

    /**
     * Signal the handle.  Idempotent and safe to call from any thread.
     *
     * @return UPATH_STATUS_OK, or UPATH_ERR_INVALID_ARG if \p in_cancellation is NULL.
     */
    UPATH_EXPORT
    upathStatus upathCancel(upathCancellation in_cancellation);

    /**
     * Query whether the handle has been signalled.
     *
     * @param[out] out_cancelled  Must not be NULL.
     */
    UPATH_EXPORT
    upathStatus upathIsCancelled(upathCancellation in_cancellation, bool* out_cancelled);

    /**
     * Destroy a cancellation handle.  No operation may still be using it.
     */
    UPATH_EXPORT
    upathStatus upathDestroyCancellation(upathCancellation in_cancellation);

#ifdef __cplusplus
}
#endif
