// SPDX-FileCopyrightText: 2025 Contributors to the upath project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file paths.h
 * @brief Unique path operations.
 *
 * Four operations mint paths that do not collide with anything already present:
 *
 *   - upathReserveFileFromIdentifier:  name derived from a URI or filename, "(N)" suffix on collision,
 *                                      reserved by creating an empty file.
 *   - upathMakeRandomFilePath:         random 128-bit token + extension in a caller supplied directory.
 *   - upathMakeRandomTempFilePath:     same, in the temporary directory.
 *   - upathMakeUniqueTempDirectory:    "<prefix>_<token>" directory in the temporary directory.
 *
 * Output convention:
 *   All operations write a NUL terminated path to \p out_path.  \p inout_pathSize holds the size of the
 *   buffer on input and the number of bytes written (terminator included) on output.  If the buffer is too
 *   small, UPATH_ERR_STRLEN is returned, \p inout_pathSize receives the required size and any file or
 *   directory created by the call is removed again, so the call can simply be repeated.
 *
 * Cancellation:
 *   \p in_cancellation may be NULL.  When it is signalled before or during a call, the call fails with
 *   UPATH_ERR_CANCELLED.  A file reserved before the signal is observed is kept.
 */

#pragma once

#include <upath/upath.h>

#ifdef __cplusplus
extern "C"
{
#endif

    /**
     * Reserve a unique file named after an identifier.
     *
     * The identifier is interpreted as an absolute URI first ("https://host/dir/photo.jpg?x=1" -> "photo.jpg")
     * and as a plain filename otherwise.  Candidates are "photo.jpg", "photo(1).jpg", "photo(2).jpg", ...
     *
     * With the default "exclusive" reservation the candidate is created with an exclusive create, which is
     * safe across processes: the returned path names an empty file that did not exist before.  With the
     * "advisory" reservation option the path is only checked under a process-wide lock and not created.
     *
     * @return UPATH_STATUS_OK, UPATH_ERR_INVALID_ARG, UPATH_ERR_DIRECTORY_NOT_FOUND, UPATH_ERR_CANCELLED,
     *         UPATH_ERR_EXHAUSTED, UPATH_ERR_PERMISSION_DENIED, UPATH_ERR_IO or UPATH_ERR_STRLEN.
     */
    UPATH_EXPORT
    upathStatus upathReserveFileFromIdentifier(upathGenerator in_generator, char const* in_directory, char const* in_identifier,
        upathCancellation in_cancellation, char* out_path, size_t* inout_pathSize);

    /**
     * Make a random file path in \p in_directory.
     *
     * @param in_extension  Desired extension.  NULL or "" selects ".tmp"; a missing leading '.' is inserted.
     *
     * The path is verified not to exist at check time but is NOT created.
     */
    UPATH_EXPORT
    upathStatus upathMakeRandomFilePath(upathGenerator in_generator, char const* in_directory, char const* in_extension,
        upathCancellation in_cancellation, char* out_path, size_t* inout_pathSize);

    /**
     * Make a random file path in the generator's temporary directory.  Same rules as upathMakeRandomFilePath.
     */
    UPATH_EXPORT
    upathStatus upathMakeRandomTempFilePath(upathGenerator in_generator, char const* in_extension, upathCancellation in_cancellation,
        char* out_path, size_t* inout_pathSize);

    /**
     * Make a unique "<prefix>_<token>" directory path in the generator's temporary directory.
     *
     * @param in_prefix  NULL or "" selects "temp".
     * @param in_create  When true the directory is created before returning.  When false the path is only
     *                   verified not to exist.
     */
    UPATH_EXPORT
    upathStatus upathMakeUniqueTempDirectory(upathGenerator in_generator, char const* in_prefix, bool in_create,
        upathCancellation in_cancellation, char* out_path, size_t* inout_pathSize);

#ifdef __cplusplus
}
#endif
