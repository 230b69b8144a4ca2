#pragma once

#include "metascrub/format_signature.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

/**
 * \file validation_events.h
 * \brief Security detection events reported by the validators.
 *
 * Events carry no filesystem paths. They are written into caller-owned
 * storage so a validation call never allocates for diagnostics and never
 * shares state with other calls.
 */

namespace metascrub {

/// Kind of a detection event.
enum class ValidationEventKind : uint8_t {
    /// A path contained `..` components or doubled separators.
    TraversalRejected,
    /// A symlink was refused under \ref SymlinkPolicy::Reject.
    SymlinkRejected,
    /// A symlink was resolved one level (development policy).
    SymlinkFollowed,
    /// A symlink chain exceeded the resolution depth limit.
    SymlinkDepthExceeded,
    /// An ISO-BMFF `ftyp` box carried a brand outside the HEIF whitelist.
    UnrecognizedBrand,
    /// The header did not match any signature for the claimed extension.
    ContentMismatch,
    /// The file ended before the signature region.
    TruncatedHeader,
};

/// One detection event.
struct ValidationEvent final {
    ValidationEventKind kind = ValidationEventKind::ContentMismatch;
    /// Format family claimed by the extension (first candidate).
    ImageFormat claimed = ImageFormat::Unknown;
    /// Format detected from content, if any.
    ImageFormat sniffed = ImageFormat::Unknown;
    /// Offending brand (UnrecognizedBrand only).
    uint32_t brand = 0;
    /// Symlink hops taken when the event was raised.
    uint32_t symlink_depth = 0;
    /// Header prefix that was inspected (content events only).
    uint32_t header_size = 0;
    std::array<std::byte, kMagicProbeBytes> header {};
};

/**
 * \brief Caller-owned event output buffer.
 *
 * `needed` counts every emitted event; `written` counts the ones that fit.
 * A default-constructed sink discards events but still counts them.
 */
struct EventSink final {
    std::span<ValidationEvent> out;
    uint32_t written = 0;
    uint32_t needed  = 0;
};

/// Records \p event into \p sink (no-op when \p sink is null).
void
emit_event(EventSink* sink, const ValidationEvent& event) noexcept;

/// Stable lower-case identifier for \p kind.
std::string_view
validation_event_kind_name(ValidationEventKind kind) noexcept;

/**
 * \brief Formats a single-line, terminal-safe description of \p event.
 *
 * Example: `unrecognized_brand claimed=heif brand=xxxx header=00 00 00 18
 * 66 74 79 70 78 78 78 78`.
 */
void
format_validation_event(const ValidationEvent& event, std::string* out);

}  // namespace metascrub
