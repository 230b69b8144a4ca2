#pragma once

#include "metascrub/validation_events.h"

#include <cstdint>
#include <string>
#include <string_view>

/**
 * \file path_guard.h
 * \brief Path, file type, symlink and size checks for untrusted paths.
 */

namespace metascrub {

/// Largest input file accepted for processing (500 MiB).
inline constexpr uint64_t kMaxInputFileBytes = 500ULL * 1024ULL * 1024ULL;

/// Maximum number of symlink hops followed under the resolving policy.
inline constexpr uint32_t kMaxSymlinkDepth = 8;

/// Longest path string accepted, in bytes.
inline constexpr uint32_t kMaxPathBytes = 4096;

/// How a symlink at the validated path is treated.
enum class SymlinkPolicy : uint8_t {
    /// Production default: any symlink is refused.
    Reject,
    /// Development opt-in: resolve one level and validate the target again.
    ResolveAndRevalidate,
};

/// Result status of a path check. Each failure cause has its own value.
enum class PathStatus : uint8_t {
    Ok,
    EmptyPath,
    /// Embedded NUL byte or longer than \ref kMaxPathBytes.
    MalformedPath,
    /// `..` component or doubled separator.
    TraversalAttempt,
    NotFound,
    /// Directory, device, FIFO, socket, ...
    NotRegularFile,
    SymlinkRejected,
    SymlinkDepthExceeded,
    FileTooLarge,
    FileEmpty,
    /// Metadata could not be queried or the file is not readable.
    Unreadable,
    /// Output paths: the parent directory does not exist.
    ParentDirectoryMissing,
    /// Output paths: the parent exists but is not a directory.
    ParentNotDirectory,
    /// Output paths: the parent directory denies write access.
    ParentNotWritable,
};

/// Outcome of \ref check_input_path.
struct InputPathCheck final {
    PathStatus status = PathStatus::Ok;
    /// Absolute path of the final regular file, with symlinks resolved.
    std::string canonical_path;
    uint64_t size         = 0;
    uint32_t symlink_hops = 0;
    /// OS error code behind NotFound/Unreadable, when available.
    int sys_error = 0;
};

/// Outcome of \ref check_output_path.
struct OutputPathCheck final {
    PathStatus status = PathStatus::Ok;
    /// Absolute target path (canonical parent + file name).
    std::string target_path;
    int sys_error = 0;
};

/**
 * \brief True when \p path has a `..` component or a doubled separator.
 *
 * Both `/` and `\` count as separators. This is a syntactic heuristic that
 * runs before canonicalization, not a replacement for it.
 */
bool
has_traversal_tokens(std::string_view path) noexcept;

/**
 * \brief Syntactic checks only: blank, malformed, traversal.
 *
 * Never touches the filesystem.
 */
PathStatus
check_path_syntax(std::string_view path) noexcept;

/**
 * \brief Validates a path that is about to be opened for reading.
 *
 * Order: syntax, existence, symlink (per \p policy), regular-file type,
 * size bounds, readability. Under \ref SymlinkPolicy::ResolveAndRevalidate
 * each link is resolved one level and the target goes through the complete
 * sequence again, up to \ref kMaxSymlinkDepth hops.
 */
InputPathCheck
check_input_path(std::string_view path, SymlinkPolicy policy,
                 EventSink* events = nullptr);

/**
 * \brief Validates a save target that may not exist yet.
 *
 * Syntax checks plus an existing parent directory; no size or symlink
 * checks on the target itself.
 */
OutputPathCheck
check_output_path(std::string_view path);

/**
 * \brief True when both paths name the same existing file.
 *
 * Compares device and inode (volume serial and file index on Windows)
 * after following links. Returns false when either path does not exist.
 */
bool
is_same_existing_file(std::string_view a, std::string_view b);

/// Stable lower-case identifier for \p status.
std::string_view
path_status_name(PathStatus status) noexcept;

}  // namespace metascrub
