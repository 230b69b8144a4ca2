#pragma once

#include <string>
#include <string_view>

/**
 * \file error_sanitizer.h
 * \brief Removes filesystem paths from user-facing error text.
 */

namespace metascrub {

/// Replacement for a path token without a filename-like last segment.
inline constexpr std::string_view kHiddenPathPlaceholder = "[path hidden]";

/// Prefix used when a message starts with an absolute path.
inline constexpr std::string_view kFileErrorPrefix = "File error: ";

/**
 * \brief Returns \p raw with every path-like token replaced.
 *
 * The message is scanned once, left to right, as whitespace-separated
 * tokens. A token containing `/` or `\` is a path: it is replaced by its
 * last segment when that segment looks like a file name (`photo.jpg`), or
 * by \ref kHiddenPathPlaceholder otherwise. A message that starts with an
 * absolute path (`/...`, `\...`, `C:\...`, `C:/...`) is additionally
 * prefixed with \ref kFileErrorPrefix.
 *
 * The output never contains a separator, so the function is idempotent.
 * Runs in time linear in `raw.size()`; no regular expressions are used.
 */
std::string
sanitize_error_message(std::string_view raw);

/// Appends the sanitized form of \p raw to \p out.
void
append_sanitized_message(std::string_view raw, std::string* out);

/**
 * \brief Returns the last component of \p path for use in messages.
 *
 * Trailing separators are ignored; an empty or separator-only path yields
 * an empty view.
 */
std::string_view
display_file_name(std::string_view path) noexcept;

}  // namespace metascrub
