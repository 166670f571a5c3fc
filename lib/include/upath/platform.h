// SPDX-FileCopyrightText: 2025 Contributors to the upath project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file platform.h
 * @brief Compiler portability helpers shared by every public upath header.
 *
 * Macros defined here:
 *   - UPATH_EXPORT      : Marks a symbol for export from the shared library.
 *   - UPATH_NODISCARD   : Warns callers if they discard the return value.
 */

#pragma once

/*
 * ---------------------------------------------------------------------------
 * UPATH_EXPORT  --  Shared library symbol visibility
 * ---------------------------------------------------------------------------
 * The library is built with hidden visibility by default; only symbols marked
 * with this macro are exported from the .so.
 */
#if defined(__GNUC__) || defined(__clang__)
#   define UPATH_EXPORT __attribute__((visibility("default")))
#else
#   define UPATH_EXPORT
#endif

#ifdef __cplusplus
#   define UPATH_NODISCARD [[nodiscard]]
#else
#   define UPATH_NODISCARD
#endif
