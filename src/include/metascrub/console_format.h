#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

/**
 * \file console_format.h
 * \brief Terminal-safe rendering of untrusted bytes for diagnostics.
 */

namespace metascrub {

// Appends an ASCII-only, terminal-safe representation of `s` into `out`.
//
// - Control bytes, DEL and non-ASCII become `\xNN`
// - `\n`, `\r`, `\t` become their C escapes; `\` and `"` are backslashed
// - At most `max_bytes` input bytes are rendered (0 = unlimited), then "..."
//
// Returns true when any escaping or truncation occurred.
bool
append_console_escaped_ascii(std::string_view s, uint32_t max_bytes,
                             std::string* out) noexcept;

// Appends space-separated uppercase hex bytes (`FF D8 FF`) into `out`.
// Truncates to `max_bytes` (0 = unlimited) and appends " ..." when truncated.
void
append_hex_bytes(std::span<const std::byte> bytes, uint32_t max_bytes,
                 std::string* out) noexcept;

// Appends a FourCC as four escaped characters (`heic`, `\x00\x00\x00\x01`).
void
append_fourcc(uint32_t fourcc_value, std::string* out) noexcept;

}  // namespace metascrub
