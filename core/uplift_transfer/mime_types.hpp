// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef UPLIFT_MIME_TYPES_HPP
#define UPLIFT_MIME_TYPES_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace uplift {
namespace transfer {

/**
 * Lowercase extension without the dot, "" if the name has none.
 * "archive.tar.GZ" -> "gz", ".bashrc" -> "".
 */
std::string extensionOf(const std::string& filename);

/**
 * All dot-separated extensions after the base name, lowercase.
 * "invoice.pdf.exe" -> {"pdf", "exe"}.
 */
std::vector<std::string> extensionsOf(const std::string& filename);

/**
 * MIME type registered for an extension, "" if unknown.
 */
std::string mimeTypeForExtension(const std::string& extension);

/**
 * MIME type for a file name, "application/octet-stream" if unknown.
 */
std::string mimeTypeForFilename(const std::string& filename);

/**
 * Whether two MIME types name the same format ("image/jpg" == "image/jpeg").
 */
bool sameMimeType(const std::string& a, const std::string& b);

/**
 * Match a MIME type against an allow-list entry. Supports "*" / "*\/*"
 * and "type/*" wildcards. Parameters after ';' are ignored.
 */
bool mimeMatches(const std::string& pattern, const std::string& mime_type);

/**
 * Format detected from leading magic bytes, std::nullopt if none matches.
 */
std::optional<std::string> detectMimeType(const std::vector<uint8_t>& header);

/**
 * Whether a declared type has a known signature that the header must
 * start with. Office Open XML types accept the ZIP signature.
 */
bool hasKnownSignature(const std::string& mime_type);

/**
 * Whether header matches one of the signatures of mime_type. Types
 * without a known signature always match.
 */
bool signatureMatches(const std::string& mime_type, const std::vector<uint8_t>& header);

/**
 * "image", "document", "spreadsheet", "presentation", "archive", "text",
 * "audio", "video" or "other".
 */
std::string categoryOf(const std::string& mime_type);

/**
 * Types whose content is scanned for embedded scripts.
 */
bool isTextBased(const std::string& mime_type);

/**
 * Default allow-list used when none is configured.
 */
const std::vector<std::string>& defaultAllowedTypes();

}  // namespace transfer
}  // namespace uplift

#endif  // UPLIFT_MIME_TYPES_HPP
