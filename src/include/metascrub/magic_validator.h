#pragma once

#include "metascrub/format_signature.h"
#include "metascrub/validation_events.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

/**
 * \file magic_validator.h
 * \brief Header magic number checks against a claimed file extension.
 */

namespace metascrub {

/// Result status of a magic number check.
enum class MagicStatus : uint8_t {
    /// The header matches a signature for the claimed extension.
    Match,
    /// The header does not match (includes unrecognized HEIF brands).
    Mismatch,
    /// The file is shorter than every candidate signature.
    Truncated,
    /// The extension has no signatures; nothing was read.
    UnknownExtension,
    /// The file could not be opened for reading.
    OpenFailed,
    /// The file was opened but the header read failed.
    ReadFailed,
};

/// Outcome of \ref check_magic / \ref validate_magic.
struct MagicCheckResult final {
    MagicStatus status = MagicStatus::Mismatch;
    /// Matched signature variant (Match only).
    ImageFormat format = ImageFormat::Unknown;
    /// First candidate format for the claimed extension.
    ImageFormat claimed = ImageFormat::Unknown;
    /// Extension-independent detection of the header (diagnostics only).
    ImageFormat sniffed = ImageFormat::Unknown;
    /// True when an `ftyp` box was found with a non-whitelisted brand.
    bool unrecognized_brand = false;
    uint32_t header_size    = 0;
    std::array<std::byte, kMagicProbeBytes> header {};
    /// OS error code for OpenFailed/ReadFailed.
    int sys_error = 0;
};

/**
 * \brief Checks an already read header prefix against \p extension.
 *
 * Pure; performs no I/O. Content failures emit one event into \p events.
 */
MagicCheckResult
check_magic(std::span<const std::byte> header, std::string_view extension,
            EventSink* events = nullptr) noexcept;

/**
 * \brief Reads at most \ref kMagicProbeBytes from \p path and checks them.
 *
 * The file is opened read-only and read with a single bounded read; a
 * short file is a content failure (\ref MagicStatus::Truncated), never a
 * retry. A mismatch is a result, not an error: only open/read failures
 * report the I/O statuses.
 */
MagicCheckResult
validate_magic(const char* path, std::string_view extension,
               EventSink* events = nullptr) noexcept;

/// True for the statuses that mean "cannot read file".
bool
is_io_failure(MagicStatus status) noexcept;

/// Stable lower-case identifier for \p status.
std::string_view
magic_status_name(MagicStatus status) noexcept;

}  // namespace metascrub
