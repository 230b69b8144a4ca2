#pragma once

#include "metascrub/format_signature.h"
#include "metascrub/path_guard.h"
#include "metascrub/validation_events.h"
#include "metascrub/validation_policy.h"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

/**
 * \file validation.h
 * \brief Entry point used before decoding or writing an image file.
 *
 * \ref ValidationPipeline runs the path checks and then the magic number
 * check, and turns every failure into a status plus a message that is
 * already safe to show to the user.
 */

namespace metascrub {

/// Outcome status. Every failure cause has its own value.
enum class ValidationStatus : uint8_t {
    Ok,
    EmptyPath,
    MalformedPath,
    TraversalAttempt,
    NotFound,
    NotRegularFile,
    SymlinkRejected,
    SymlinkDepthExceeded,
    FileTooLarge,
    FileEmpty,
    Unreadable,
    ExtensionUnrecognized,
    ContentFormatMismatch,
    ParentDirectoryMissing,
    ParentNotDirectory,
    ParentNotWritable,
    /// Save target is the file being cleaned.
    OverwritesSource,
};

/// Where a failure was detected.
enum class FailureDomain : uint8_t {
    None,
    /// Path syntax, existence, type, symlink and size checks.
    Path,
    /// The bytes do not identify the claimed format.
    Content,
    /// The file could not be read.
    Io,
};

/// A file that passed all open-time checks.
struct ValidatedFile final {
    /// Path to hand to the decoder (symlinks resolved).
    std::string canonical_path;
    ImageFormat format  = ImageFormat::Unknown;
    uint64_t size_bytes = 0;
};

/// Result of \ref ValidationPipeline::validate_for_open.
struct OpenValidation final {
    ValidationStatus status = ValidationStatus::Ok;
    /// Sanitized, user-facing text; empty on success.
    std::string message;
    /// Valid only when `status == ValidationStatus::Ok`.
    ValidatedFile file;
    uint32_t events_written = 0;
    uint32_t events_needed  = 0;
};

/// Result of \ref ValidationPipeline::validate_for_save.
struct SaveValidation final {
    ValidationStatus status = ValidationStatus::Ok;
    std::string message;
    /// Absolute target path; valid only on success.
    std::string target_path;
};

/**
 * \brief Validation entry point for the application layer.
 *
 * Holds only the immutable symlink policy, so one instance can be shared by
 * any number of threads. Calls never retry and never fall back to another
 * format.
 */
class ValidationPipeline final {
public:
    explicit ValidationPipeline(const ValidationPolicy& policy = {}) noexcept;

    /**
     * \brief Checks a user-selected file before it is decoded.
     *
     * The extension of \p path selects the candidate signatures. On success
     * the caller decodes `file.canonical_path`. Detection events are
     * written into \p events when provided.
     */
    OpenValidation validate_for_open(
        std::string_view path, std::span<ValidationEvent> events = {}) const;

    /**
     * \brief Checks a save target before the cleaned image is written.
     *
     * When \p source_path is given, a target that is the same file as the
     * source is rejected with \ref ValidationStatus::OverwritesSource.
     */
    SaveValidation validate_for_save(std::string_view path,
                                     std::string_view source_path = {}) const;

    SymlinkPolicy symlink_policy() const noexcept;

private:
    SymlinkPolicy symlink_policy_ = SymlinkPolicy::Reject;
};

/// Maximum number of files accepted by one batch call.
inline constexpr uint32_t kBatchSizeLimit = 1000;

/// Status of \ref validate_batch_for_open.
enum class BatchStatus : uint8_t {
    Ok,
    /// More than \ref kBatchSizeLimit paths; nothing was validated.
    TooManyFiles,
    /// `out` is shorter than `paths`; the prefix that fit was validated.
    OutputTruncated,
};

struct BatchResult final {
    BatchStatus status = BatchStatus::Ok;
    uint32_t accepted  = 0;
    uint32_t rejected  = 0;
};

/// Runs \ref ValidationPipeline::validate_for_open for each path in order.
BatchResult
validate_batch_for_open(const ValidationPipeline& pipeline,
                        std::span<const std::string> paths,
                        std::span<OpenValidation> out);

/// Stable lower-case identifier for \p status.
std::string_view
validation_status_name(ValidationStatus status) noexcept;

/// Stable lower-case identifier for \p status.
std::string_view
batch_status_name(BatchStatus status) noexcept;

/// Classifies \p status by where the failure was detected.
FailureDomain
failure_domain(ValidationStatus status) noexcept;

/**
 * \brief True when the user can resolve the failure by choosing another
 * file or location (as opposed to an environment problem).
 */
bool
is_user_actionable(ValidationStatus status) noexcept;

/// Maps a path check status onto the pipeline status.
ValidationStatus
to_validation_status(PathStatus status) noexcept;

}  // namespace metascrub
