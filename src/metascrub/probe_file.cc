#include "metascrub/probe_file.h"

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <utility>

#if defined(_WIN32)
#    define WIN32_LEAN_AND_MEAN
#    include <windows.h>
#else
#    include <fcntl.h>
#    include <sys/stat.h>
#    include <unistd.h>
#endif

namespace metascrub {

ProbeFile::ProbeFile() noexcept = default;


ProbeFile::~ProbeFile() noexcept
{
    close();
}


ProbeFile::ProbeFile(ProbeFile&& other) noexcept
{
    *this = std::move(other);
}


ProbeFile&
ProbeFile::operator=(ProbeFile&& other) noexcept
{
    if (this == &other) {
        return *this;
    }
    close();

#if defined(_WIN32)
    file_handle_       = other.file_handle_;
    other.file_handle_ = nullptr;
#else
    fd_       = other.fd_;
    other.fd_ = -1;
#endif

    size_             = other.size_;
    last_error_       = other.last_error_;
    other.size_       = 0;
    other.last_error_ = 0;
    return *this;
}


ProbeFileStatus
ProbeFile::open(const char* path) noexcept
{
    close();
    last_error_ = 0;

    if (!path || !*path) {
        return ProbeFileStatus::OpenFailed;
    }

#if defined(_WIN32)
    HANDLE h = ::CreateFileA(path, GENERIC_READ, FILE_SHARE_READ, nullptr,
                             OPEN_EXISTING,
                             FILE_ATTRIBUTE_NORMAL
                                 | FILE_FLAG_OPEN_REPARSE_POINT,
                             nullptr);
    if (h == INVALID_HANDLE_VALUE) {
        last_error_ = static_cast<int>(::GetLastError());
        return ProbeFileStatus::OpenFailed;
    }

    BY_HANDLE_FILE_INFORMATION info;
    if (!::GetFileInformationByHandle(h, &info)) {
        last_error_ = static_cast<int>(::GetLastError());
        ::CloseHandle(h);
        return ProbeFileStatus::StatFailed;
    }
    if ((info.dwFileAttributes
         & (FILE_ATTRIBUTE_DIRECTORY | FILE_ATTRIBUTE_REPARSE_POINT))
        != 0U) {
        ::CloseHandle(h);
        return ProbeFileStatus::NotRegular;
    }

    file_handle_ = static_cast<void*>(h);
    size_        = (static_cast<uint64_t>(info.nFileSizeHigh) << 32)
            | static_cast<uint64_t>(info.nFileSizeLow);
    return ProbeFileStatus::Ok;
#else
    // O_NONBLOCK keeps a FIFO swapped in behind our back from blocking open.
    const int fd = ::open(path,
                          O_RDONLY | O_CLOEXEC | O_NOCTTY | O_NOFOLLOW
                              | O_NONBLOCK);
    if (fd < 0) {
        last_error_ = errno;
        return ProbeFileStatus::OpenFailed;
    }

    struct stat st {};
    if (::fstat(fd, &st) != 0) {
        last_error_ = errno;
        ::close(fd);
        return ProbeFileStatus::StatFailed;
    }
    if (!S_ISREG(st.st_mode)) {
        ::close(fd);
        return ProbeFileStatus::NotRegular;
    }
    if (st.st_size < 0) {
        ::close(fd);
        return ProbeFileStatus::StatFailed;
    }

    fd_   = fd;
    size_ = static_cast<uint64_t>(st.st_size);
    return ProbeFileStatus::Ok;
#endif
}


ProbeFileStatus
ProbeFile::read_prefix(std::span<std::byte> out, uint32_t* bytes_read) noexcept
{
    if (bytes_read) {
        *bytes_read = 0;
    }
    if (!is_open()) {
        return ProbeFileStatus::ReadFailed;
    }
    if (out.empty()) {
        return ProbeFileStatus::Ok;
    }

#if defined(_WIN32)
    DWORD got = 0;
    if (!::ReadFile(static_cast<HANDLE>(file_handle_), out.data(),
                    static_cast<DWORD>(out.size()), &got, nullptr)) {
        last_error_ = static_cast<int>(::GetLastError());
        return ProbeFileStatus::ReadFailed;
    }
    if (bytes_read) {
        *bytes_read = static_cast<uint32_t>(got);
    }
    return ProbeFileStatus::Ok;
#else
    const ssize_t got = ::pread(fd_, out.data(), out.size(), 0);
    if (got < 0) {
        last_error_ = errno;
        return ProbeFileStatus::ReadFailed;
    }
    if (bytes_read) {
        *bytes_read = static_cast<uint32_t>(got);
    }
    return ProbeFileStatus::Ok;
#endif
}


void
ProbeFile::close() noexcept
{
#if defined(_WIN32)
    if (file_handle_) {
        ::CloseHandle(static_cast<HANDLE>(file_handle_));
    }
    file_handle_ = nullptr;
#else
    if (fd_ >= 0) {
        (void)::close(fd_);
    }
    fd_ = -1;
#endif

    size_ = 0;
}


bool
ProbeFile::is_open() const noexcept
{
#if defined(_WIN32)
    return file_handle_ != nullptr;
#else
    return fd_ >= 0;
#endif
}


uint64_t
ProbeFile::size() const noexcept
{
    return size_;
}


int
ProbeFile::last_error() const noexcept
{
    return last_error_;
}

}  // namespace metascrub
