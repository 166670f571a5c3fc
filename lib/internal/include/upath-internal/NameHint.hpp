// SPDX-FileCopyrightText: 2025 Contributors to the upath project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file NameHint.hpp
 * @brief Derive a file name from a caller supplied identifier
 *
 * An identifier is either an absolute URI ("https://cdn.example.com/img/photo.jpg?w=200")
 * or a plain file name ("photo.jpg", "downloads/photo.jpg").  The URI interpretation is
 * always attempted first; a bare file name can look like a malformed URI, so the order
 * matters.
 *
 * The result is a single, safe path component split into base name and extension.
 */

#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace upath::lib
{
    /** A file name split into base name and extension ("photo" + ".jpg"). */
    struct NameHint
    {
        std::string base;
        std::string extension; ///< Includes the leading '.', or empty
    };

    /**
     * Extract the last path segment of an absolute URI.
     *
     * The identifier is accepted as a URI if it starts with a scheme of at least two characters
     * (ALPHA *( ALPHA / DIGIT / "+" / "-" / "." ) ":") and contains only valid percent-escapes.
     * Query and fragment are ignored, the segment is percent-decoded.
     *
     * @return The decoded segment (possibly empty), or std::nullopt if the identifier is not a URI.
     */
    std::optional<std::string> fileNameFromUri(std::string_view identifier);

    /**
     * Extract the terminal name component of an identifier: URI first, literal file name second.
     * May return an empty string (e.g. "https://example.com/" or "downloads/").
     */
    std::string extractFileName(std::string_view identifier);

    /**
     * Build the name hint for an identifier.
     *
     * Names that are empty, "." or "..", or that contain a separator after decoding are replaced
     * by \p defaultBaseName, so a hint can never point outside the target directory.
     */
    NameHint makeNameHint(std::string_view identifier, std::string const& defaultBaseName);

    /**
     * Normalize a caller supplied extension: empty selects ".tmp", a missing leading '.' is inserted.
     *
     * @throws Exception (UPATH_ERR_INVALID_ARG) if the extension contains a separator.
     */
    std::string normalizeExtension(std::string_view extension);
}
