#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace webget::downloader {

/**
 * Copy of s without leading and trailing whitespace.
 */
std::string trimWhitespace(std::string_view s);

/**
 * True when name is usable as-is inside a directory: non-empty, not "." or "..",
 * and free of '/' and '\\'.
 */
bool isPlainFileName(std::string_view name);

/**
 * Decode %XX escapes. Malformed escapes are kept verbatim; '+' is not treated as a space.
 */
std::string percentDecode(std::string_view in);

/**
 * Replace every character that is invalid in a file name (control characters and
 * " < > | : * ? \ /) with a space, then trim surrounding whitespace.
 * "." and ".." sanitize to the empty string.
 */
std::string sanitizeFileName(std::string_view in);

/**
 * Text after the last '/' or '\\'.
 */
std::string_view lastPathSegment(std::string_view path);

/**
 * Last path segment of a URL with query and fragment stripped, percent-decoded and
 * sanitized. Empty when the URL has no usable segment (e.g. "https://host/").
 */
std::string fileNameFromUrl(std::string_view url);

/**
 * File name carried by a Content-Disposition header value, percent-decoded, reduced
 * to its last path segment and sanitized. Empty when no filename parameter is present.
 */
std::string fileNameFromContentDisposition(std::string_view headerValue);

/**
 * Filename derivation, first non-empty wins:
 * explicit name (trimmed), Content-Disposition, effective URL, original URL.
 */
std::string deriveFileName(const std::optional<std::string>& explicitName,
                           std::optional<std::string_view> contentDisposition,
                           std::string_view effectiveUrl, std::string_view originalUrl);

/**
 * Human readable size in binary units: "0 B", "512 B", "1.5 KB", "12.3 MB".
 */
std::string formatBytes(std::uint64_t bytes);

} // namespace webget::downloader
