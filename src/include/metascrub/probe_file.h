#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

/**
 * \file probe_file.h
 * \brief Read-only file handle for bounded header probes.
 */

namespace metascrub {

/// Status code for \ref ProbeFile operations.
enum class ProbeFileStatus : uint8_t {
    Ok,
    OpenFailed,
    StatFailed,
    /// The opened entry is not a regular file (swapped after path checks).
    NotRegular,
    ReadFailed,
};

/**
 * \brief Read-only file handle that reads one bounded prefix.
 *
 * The file is opened without write access and without following a final
 * symlink component, so a link planted after path validation fails to
 * open instead of redirecting the probe.
 */
class ProbeFile final {
public:
    ProbeFile() noexcept;
    ~ProbeFile() noexcept;

    ProbeFile(const ProbeFile&)            = delete;
    ProbeFile& operator=(const ProbeFile&) = delete;

    ProbeFile(ProbeFile&& other) noexcept;
    ProbeFile& operator=(ProbeFile&& other) noexcept;

    /// Opens \p path for reading and records its size.
    ProbeFileStatus open(const char* path) noexcept;

    /**
     * \brief Reads up to `out.size()` bytes from offset 0 with one read call.
     *
     * A short read is reported through \p bytes_read, not retried.
     */
    ProbeFileStatus read_prefix(std::span<std::byte> out,
                                uint32_t* bytes_read) noexcept;

    /// Closes the file (idempotent).
    void close() noexcept;

    bool is_open() const noexcept;
    uint64_t size() const noexcept;
    /// OS error code (`errno` / `GetLastError()`) of the last failure.
    int last_error() const noexcept;

private:
#if defined(_WIN32)
    void* file_handle_ = nullptr;
#else
    int fd_ = -1;
#endif
    uint64_t size_  = 0;
    int last_error_ = 0;
};

}  // namespace metascrub
