#pragma once

#include <cstdint>
#include <string>
#include <string_view>

/**
 * \file build_info.h
 * \brief Runtime information about how MetaScrub was built.
 */

namespace metascrub {

/**
 * \brief MetaScrub build information.
 *
 * Values are compiled into the binary at build time.
 */
struct BuildInfo final {
    /// MetaScrub version string (e.g. "0.1.0").
    std::string_view version;

    /// Build timestamp in UTC (ISO-8601), or empty if not recorded.
    std::string_view build_timestamp_utc;

    /// Build type string (e.g. "Release", "Debug", "multi-config").
    std::string_view build_type;

    /// CMake generator used to configure the build (e.g. "Ninja").
    std::string_view cmake_generator;

    /// Target platform (e.g. "Linux", "Darwin", "Windows").
    std::string_view system_name;

    /// Target CPU architecture (e.g. "x86_64", "arm64").
    std::string_view system_processor;

    /// Compiler ID (e.g. "Clang", "GNU", "MSVC").
    std::string_view cxx_compiler_id;

    /// Compiler version string.
    std::string_view cxx_compiler_version;

    /// Compiler executable path, if available.
    std::string_view cxx_compiler;

    bool linkage_static = false;
    bool linkage_shared = false;

    /// Compiled-in security limits.
    uint64_t max_input_file_bytes = 0;
    uint32_t max_symlink_depth    = 0;
    uint32_t magic_probe_bytes    = 0;
    uint32_t signature_count      = 0;
};

/// Returns build information for the linked MetaScrub library.
const BuildInfo&
build_info() noexcept;

/**
 * \brief Formats a stable, human-readable build info header (2 lines).
 *
 * Output format:
 * - `MetaScrub vX.Y.Z <build_type> [limits] <linkage>`
 * - `built with <compiler> for <system>/<arch> (<timestamp>)`
 */
void
format_build_info_lines(const BuildInfo& info, std::string* line1,
                        std::string* line2);

/// Convenience overload for the linked MetaScrub library build.
void
format_build_info_lines(std::string* line1, std::string* line2);

}  // namespace metascrub
