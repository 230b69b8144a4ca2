#include "metascrub/path_guard.h"

#include <cerrno>
#include <cstdlib>
#include <string>
#include <utility>

#if defined(_WIN32)
#    define WIN32_LEAN_AND_MEAN
#    include <windows.h>
#else
#    include <climits>
#    include <sys/stat.h>
#    include <unistd.h>
#endif

namespace metascrub {
namespace {

    enum class EntryKind : uint8_t {
        Missing,
        Regular,
        Symlink,
        Directory,
        Other,
        Error,
    };

    struct EntryInfo final {
        EntryKind kind = EntryKind::Error;
        uint64_t size  = 0;
        int error      = 0;
    };

    static bool is_separator(char c) noexcept { return c == '/' || c == '\\'; }


    static bool is_blank(std::string_view s) noexcept
    {
        for (char c : s) {
            if (c != ' ' && c != '\t' && c != '\r' && c != '\n' && c != '\v'
                && c != '\f') {
                return false;
            }
        }
        return true;
    }


    static size_t last_separator(std::string_view path) noexcept
    {
        return path.find_last_of("/\\");
    }

#if defined(_WIN32)

    static bool is_missing_error(DWORD err) noexcept
    {
        return err == ERROR_FILE_NOT_FOUND || err == ERROR_PATH_NOT_FOUND
               || err == ERROR_INVALID_NAME;
    }


    // Without \p follow, reparse points are reported as symlinks.
    static EntryInfo query_entry(const std::string& path, bool follow) noexcept
    {
        EntryInfo info;
        WIN32_FILE_ATTRIBUTE_DATA data;
        if (!::GetFileAttributesExA(path.c_str(), GetFileExInfoStandard,
                                    &data)) {
            const DWORD err = ::GetLastError();
            info.kind  = is_missing_error(err) ? EntryKind::Missing
                                               : EntryKind::Error;
            info.error = static_cast<int>(err);
            return info;
        }
        const DWORD attrs = data.dwFileAttributes;
        if (!follow && (attrs & FILE_ATTRIBUTE_REPARSE_POINT) != 0U) {
            info.kind = EntryKind::Symlink;
            return info;
        }
        if ((attrs & FILE_ATTRIBUTE_DIRECTORY) != 0U) {
            info.kind = EntryKind::Directory;
            return info;
        }
        if ((attrs & FILE_ATTRIBUTE_DEVICE) != 0U) {
            info.kind = EntryKind::Other;
            return info;
        }
        info.kind = EntryKind::Regular;
        info.size = (static_cast<uint64_t>(data.nFileSizeHigh) << 32)
                    | static_cast<uint64_t>(data.nFileSizeLow);
        return info;
    }


    // Windows exposes only the final target of a reparse chain; one call
    // counts as one hop.
    static PathStatus read_link_target(const std::string& path,
                                       std::string* out, int* error) noexcept
    {
        HANDLE h = ::CreateFileA(path.c_str(), 0,
                                 FILE_SHARE_READ | FILE_SHARE_WRITE
                                     | FILE_SHARE_DELETE,
                                 nullptr, OPEN_EXISTING,
                                 FILE_FLAG_BACKUP_SEMANTICS, nullptr);
        if (h == INVALID_HANDLE_VALUE) {
            const DWORD err = ::GetLastError();
            *error          = static_cast<int>(err);
            return is_missing_error(err) ? PathStatus::NotFound
                                         : PathStatus::Unreadable;
        }
        char buf[kMaxPathBytes + 1U];
        const DWORD n = ::GetFinalPathNameByHandleA(h, buf, sizeof(buf),
                                                    FILE_NAME_NORMALIZED);
        *error = static_cast<int>(::GetLastError());
        ::CloseHandle(h);
        if (n >= sizeof(buf)) {
            return PathStatus::MalformedPath;
        }
        if (n == 0U) {
            return PathStatus::Unreadable;
        }
        std::string_view target(buf, n);
        if (target.substr(0, 4) == "\\\\?\\") {
            target.remove_prefix(4);
        }
        out->assign(target.data(), target.size());
        return PathStatus::Ok;
    }


    static bool canonicalize(const std::string& path, std::string* out,
                             int* error) noexcept
    {
        char buf[kMaxPathBytes + 1U];
        const DWORD n = ::GetFullPathNameA(path.c_str(), sizeof(buf), buf,
                                           nullptr);
        if (n == 0U || n >= sizeof(buf)) {
            *error = static_cast<int>(::GetLastError());
            return false;
        }
        out->assign(buf, n);
        return true;
    }


    static bool is_readable(const std::string& path, int* error) noexcept
    {
        HANDLE h = ::CreateFileA(path.c_str(), GENERIC_READ, FILE_SHARE_READ,
                                 nullptr, OPEN_EXISTING,
                                 FILE_ATTRIBUTE_NORMAL, nullptr);
        if (h == INVALID_HANDLE_VALUE) {
            *error = static_cast<int>(::GetLastError());
            return false;
        }
        ::CloseHandle(h);
        return true;
    }

    static bool is_writable_directory(const std::string& path,
                                      int* error) noexcept
    {
        HANDLE h = ::CreateFileA(path.c_str(), FILE_GENERIC_WRITE,
                                 FILE_SHARE_READ | FILE_SHARE_WRITE
                                     | FILE_SHARE_DELETE,
                                 nullptr, OPEN_EXISTING,
                                 FILE_FLAG_BACKUP_SEMANTICS, nullptr);
        if (h == INVALID_HANDLE_VALUE) {
            *error = static_cast<int>(::GetLastError());
            return false;
        }
        ::CloseHandle(h);
        return true;
    }


    struct FileIdentity final {
        uint64_t device = 0;
        uint64_t index  = 0;
    };


    static bool query_identity(const std::string& path,
                               FileIdentity* out) noexcept
    {
        HANDLE h = ::CreateFileA(path.c_str(), 0,
                                 FILE_SHARE_READ | FILE_SHARE_WRITE
                                     | FILE_SHARE_DELETE,
                                 nullptr, OPEN_EXISTING,
                                 FILE_FLAG_BACKUP_SEMANTICS, nullptr);
        if (h == INVALID_HANDLE_VALUE) {
            return false;
        }
        BY_HANDLE_FILE_INFORMATION info;
        const BOOL ok = ::GetFileInformationByHandle(h, &info);
        ::CloseHandle(h);
        if (!ok) {
            return false;
        }
        out->device = info.dwVolumeSerialNumber;
        out->index  = (static_cast<uint64_t>(info.nFileIndexHigh) << 32)
                     | static_cast<uint64_t>(info.nFileIndexLow);
        return true;
    }

#else

    static EntryInfo query_entry(const std::string& path, bool follow) noexcept
    {
        EntryInfo info;
        struct stat st {};
        const int rc = follow ? ::stat(path.c_str(), &st)
                              : ::lstat(path.c_str(), &st);
        if (rc != 0) {
            info.error = errno;
            info.kind  = (errno == ENOENT || errno == ENOTDIR)
                             ? EntryKind::Missing
                             : EntryKind::Error;
            return info;
        }
        if (S_ISLNK(st.st_mode)) {
            info.kind = EntryKind::Symlink;
        } else if (S_ISREG(st.st_mode)) {
            info.kind = EntryKind::Regular;
            info.size = st.st_size > 0 ? static_cast<uint64_t>(st.st_size) : 0U;
        } else if (S_ISDIR(st.st_mode)) {
            info.kind = EntryKind::Directory;
        } else {
            info.kind = EntryKind::Other;
        }
        return info;
    }


    // Reads exactly one link level; relative targets are resolved against
    // the directory holding the link.
    static PathStatus read_link_target(const std::string& path,
                                       std::string* out, int* error) noexcept
    {
        char buf[kMaxPathBytes + 1U];
        const ssize_t n = ::readlink(path.c_str(), buf, sizeof(buf));
        if (n < 0) {
            *error = errno;
            return PathStatus::Unreadable;
        }
        if (static_cast<size_t>(n) >= sizeof(buf)) {
            *error = ENAMETOOLONG;
            return PathStatus::MalformedPath;
        }

        const std::string_view target(buf, static_cast<size_t>(n));
        const size_t sep = last_separator(path);
        if ((!target.empty() && target.front() == '/')
            || sep == std::string::npos) {
            out->assign(target.data(), target.size());
            return PathStatus::Ok;
        }
        out->assign(path, 0, sep + 1U);
        out->append(target.data(), target.size());
        return PathStatus::Ok;
    }


    static bool canonicalize(const std::string& path, std::string* out,
                             int* error) noexcept
    {
        char buf[PATH_MAX];
        if (!::realpath(path.c_str(), buf)) {
            *error = errno;
            return false;
        }
        out->assign(buf);
        return true;
    }


    static bool is_readable(const std::string& path, int* error) noexcept
    {
        if (::access(path.c_str(), R_OK) != 0) {
            *error = errno;
            return false;
        }
        return true;
    }


    static bool is_writable_directory(const std::string& path,
                                      int* error) noexcept
    {
        if (::access(path.c_str(), W_OK) != 0) {
            *error = errno;
            return false;
        }
        return true;
    }


    struct FileIdentity final {
        uint64_t device = 0;
        uint64_t index  = 0;
    };


    static bool query_identity(const std::string& path,
                               FileIdentity* out) noexcept
    {
        struct stat st {};
        if (::stat(path.c_str(), &st) != 0) {
            return false;
        }
        out->device = static_cast<uint64_t>(st.st_dev);
        out->index  = static_cast<uint64_t>(st.st_ino);
        return true;
    }

#endif

    static ValidationEvent make_path_event(ValidationEventKind kind,
                                           uint32_t hops) noexcept
    {
        ValidationEvent e;
        e.kind          = kind;
        e.symlink_depth = hops;
        return e;
    }


    static void check_input_at(const std::string& path, SymlinkPolicy policy,
                               uint32_t hops, EventSink* events,
                               InputPathCheck* out)
    {
        out->symlink_hops = hops;

        const PathStatus syntax = check_path_syntax(path);
        if (syntax != PathStatus::Ok) {
            if (syntax == PathStatus::TraversalAttempt) {
                emit_event(events,
                           make_path_event(
                               ValidationEventKind::TraversalRejected, hops));
            }
            out->status = syntax;
            return;
        }

        const EntryInfo entry = query_entry(path, false);
        switch (entry.kind) {
        case EntryKind::Missing:
            out->status    = PathStatus::NotFound;
            out->sys_error = entry.error;
            return;
        case EntryKind::Error:
            out->status    = PathStatus::Unreadable;
            out->sys_error = entry.error;
            return;
        case EntryKind::Symlink: {
            if (policy == SymlinkPolicy::Reject) {
                emit_event(events,
                           make_path_event(ValidationEventKind::SymlinkRejected,
                                           hops));
                out->status = PathStatus::SymlinkRejected;
                return;
            }
            if (hops >= kMaxSymlinkDepth) {
                emit_event(events,
                           make_path_event(
                               ValidationEventKind::SymlinkDepthExceeded,
                               hops));
                out->status = PathStatus::SymlinkDepthExceeded;
                return;
            }
            std::string target;
            int error               = 0;
            const PathStatus linked = read_link_target(path, &target, &error);
            if (linked != PathStatus::Ok) {
                out->status    = linked;
                out->sys_error = error;
                return;
            }
            emit_event(events,
                       make_path_event(ValidationEventKind::SymlinkFollowed,
                                       hops + 1U));
            check_input_at(target, policy, hops + 1U, events, out);
            return;
        }
        case EntryKind::Directory:
        case EntryKind::Other: out->status = PathStatus::NotRegularFile; return;
        case EntryKind::Regular: break;
        }

        if (entry.size == 0U) {
            out->status = PathStatus::FileEmpty;
            return;
        }
        if (entry.size > kMaxInputFileBytes) {
            out->status = PathStatus::FileTooLarge;
            out->size   = entry.size;
            return;
        }

        int error = 0;
        if (!is_readable(path, &error)) {
            out->status    = PathStatus::Unreadable;
            out->sys_error = error;
            return;
        }
        if (!canonicalize(path, &out->canonical_path, &error)) {
            out->status    = PathStatus::Unreadable;
            out->sys_error = error;
            return;
        }

        out->status = PathStatus::Ok;
        out->size   = entry.size;
    }

}  // namespace


bool
has_traversal_tokens(std::string_view path) noexcept
{
    size_t component_start = 0;
    for (size_t i = 0; i <= path.size(); ++i) {
        const bool at_end = (i == path.size());
        if (!at_end && !is_separator(path[i])) {
            continue;
        }
        if (i - component_start == 2U && path[component_start] == '.'
            && path[component_start + 1U] == '.') {
            return true;
        }
        if (!at_end && i > 0U && is_separator(path[i - 1U])) {
            return true;
        }
        component_start = i + 1U;
    }
    return false;
}


PathStatus
check_path_syntax(std::string_view path) noexcept
{
    if (path.empty() || is_blank(path)) {
        return PathStatus::EmptyPath;
    }
    if (path.size() > kMaxPathBytes
        || path.find('\0') != std::string_view::npos) {
        return PathStatus::MalformedPath;
    }
    if (has_traversal_tokens(path)) {
        return PathStatus::TraversalAttempt;
    }
    return PathStatus::Ok;
}


InputPathCheck
check_input_path(std::string_view path, SymlinkPolicy policy,
                 EventSink* events)
{
    InputPathCheck out;

    // Reject before building a C string: NUL bytes would truncate it.
    const PathStatus syntax = check_path_syntax(path);
    if (syntax != PathStatus::Ok) {
        if (syntax == PathStatus::TraversalAttempt) {
            emit_event(events,
                       make_path_event(ValidationEventKind::TraversalRejected,
                                       0U));
        }
        out.status = syntax;
        return out;
    }

    check_input_at(std::string(path), policy, 0U, events, &out);
    if (out.status != PathStatus::Ok) {
        out.canonical_path.clear();
    }
    return out;
}


OutputPathCheck
check_output_path(std::string_view path)
{
    OutputPathCheck out;

    out.status = check_path_syntax(path);
    if (out.status != PathStatus::Ok) {
        return out;
    }

    const size_t sep = last_separator(path);
    const std::string_view name = (sep == std::string_view::npos)
                                      ? path
                                      : path.substr(sep + 1U);
    if (name.empty() || name == ".") {
        out.status = PathStatus::MalformedPath;
        return out;
    }

    std::string parent;
    if (sep == std::string_view::npos) {
        parent = ".";
    } else if (sep == 0U) {
        parent.assign(path.substr(0, 1));
    } else {
        parent.assign(path.substr(0, sep));
    }

    const EntryInfo parent_info = query_entry(parent, true);
    switch (parent_info.kind) {
    case EntryKind::Missing:
        out.status    = PathStatus::ParentDirectoryMissing;
        out.sys_error = parent_info.error;
        return out;
    case EntryKind::Error:
        out.status    = PathStatus::Unreadable;
        out.sys_error = parent_info.error;
        return out;
    case EntryKind::Directory: break;
    case EntryKind::Regular:
    case EntryKind::Symlink:
    case EntryKind::Other: out.status = PathStatus::ParentNotDirectory; return out;
    }

    int write_error = 0;
    if (!is_writable_directory(parent, &write_error)) {
        out.status    = PathStatus::ParentNotWritable;
        out.sys_error = write_error;
        return out;
    }

    const EntryInfo target_info = query_entry(std::string(path), true);
    if (target_info.kind == EntryKind::Directory
        || target_info.kind == EntryKind::Other) {
        out.status = PathStatus::NotRegularFile;
        return out;
    }

    std::string canonical_parent;
    int error = 0;
    if (!canonicalize(parent, &canonical_parent, &error)) {
        out.status    = PathStatus::Unreadable;
        out.sys_error = error;
        return out;
    }

    out.target_path = std::move(canonical_parent);
    if (out.target_path.empty() || !is_separator(out.target_path.back())) {
#if defined(_WIN32)
        out.target_path.push_back('\\');
#else
        out.target_path.push_back('/');
#endif
    }
    out.target_path.append(name.data(), name.size());
    return out;
}


bool
is_same_existing_file(std::string_view a, std::string_view b)
{
    if (a.empty() || b.empty() || a.find('\0') != std::string_view::npos
        || b.find('\0') != std::string_view::npos) {
        return false;
    }
    FileIdentity ia;
    FileIdentity ib;
    if (!query_identity(std::string(a), &ia)
        || !query_identity(std::string(b), &ib)) {
        return false;
    }
    return ia.device == ib.device && ia.index == ib.index;
}


std::string_view
path_status_name(PathStatus status) noexcept
{
    switch (status) {
    case PathStatus::Ok: return "ok";
    case PathStatus::EmptyPath: return "empty_path";
    case PathStatus::MalformedPath: return "malformed_path";
    case PathStatus::TraversalAttempt: return "traversal_attempt";
    case PathStatus::NotFound: return "not_found";
    case PathStatus::NotRegularFile: return "not_regular_file";
    case PathStatus::SymlinkRejected: return "symlink_rejected";
    case PathStatus::SymlinkDepthExceeded: return "symlink_depth_exceeded";
    case PathStatus::FileTooLarge: return "file_too_large";
    case PathStatus::FileEmpty: return "file_empty";
    case PathStatus::Unreadable: return "unreadable";
    case PathStatus::ParentDirectoryMissing: return "parent_directory_missing";
    case PathStatus::ParentNotDirectory: return "parent_not_directory";
    case PathStatus::ParentNotWritable: return "parent_not_writable";
    }
    return "unknown";
}

}  // namespace metascrub
