#include "metascrub/validation.h"

#include "metascrub/error_sanitizer.h"
#include "metascrub/magic_validator.h"

#include <system_error>
#include <utility>

namespace metascrub {
namespace {

    static void append_quoted_name(std::string_view path, std::string* out)
    {
        const std::string_view name = display_file_name(path);
        out->push_back('\'');
        out->append(name.data(), name.size());
        out->push_back('\'');
    }


    static void append_system_error(int error, std::string* out)
    {
        if (error == 0) {
            return;
        }
        out->append(": ");
        out->append(std::system_category().message(error));
    }


    static std::string path_failure_message(ValidationStatus status,
                                            std::string_view path,
                                            int sys_error)
    {
        std::string raw;
        switch (status) {
        case ValidationStatus::EmptyPath: raw = "No file was selected"; break;
        case ValidationStatus::MalformedPath:
            raw = "Invalid file path";
            break;
        case ValidationStatus::TraversalAttempt:
            raw = "Invalid file path: contains suspicious patterns";
            break;
        case ValidationStatus::NotFound:
            raw = "File does not exist: ";
            append_quoted_name(path, &raw);
            break;
        case ValidationStatus::NotRegularFile:
            raw = "Not a regular file: ";
            append_quoted_name(path, &raw);
            break;
        case ValidationStatus::SymlinkRejected:
            raw = "Symbolic links are not supported for security reasons: ";
            append_quoted_name(path, &raw);
            break;
        case ValidationStatus::SymlinkDepthExceeded:
            raw = "Too many levels of symbolic links: ";
            append_quoted_name(path, &raw);
            break;
        case ValidationStatus::FileTooLarge:
            raw = "File too large (max 500 MB): ";
            append_quoted_name(path, &raw);
            break;
        case ValidationStatus::FileEmpty:
            raw = "File is empty: ";
            append_quoted_name(path, &raw);
            break;
        case ValidationStatus::Unreadable:
            raw = "Cannot access file ";
            append_quoted_name(path, &raw);
            append_system_error(sys_error, &raw);
            break;
        case ValidationStatus::ParentDirectoryMissing:
            raw = "Output directory does not exist for ";
            append_quoted_name(path, &raw);
            break;
        case ValidationStatus::ParentNotDirectory:
            raw = "Output location is not a directory for ";
            append_quoted_name(path, &raw);
            break;
        case ValidationStatus::ParentNotWritable:
            raw = "Output directory is not writable for ";
            append_quoted_name(path, &raw);
            break;
        case ValidationStatus::OverwritesSource:
            raw = "Cannot overwrite the original file ";
            append_quoted_name(path, &raw);
            raw.append("; choose a different name");
            break;
        case ValidationStatus::Ok:
        case ValidationStatus::ExtensionUnrecognized:
        case ValidationStatus::ContentFormatMismatch: break;
        }
        return sanitize_error_message(raw);
    }


    static std::string content_failure_message(std::string_view path,
                                               std::string_view extension,
                                               const MagicCheckResult& magic)
    {
        std::string raw;
        if (magic.status == MagicStatus::UnknownExtension) {
            if (extension.empty()) {
                raw = "File has no extension: ";
            } else {
                raw = "Unsupported file type '.";
                raw.append(extension.data(), extension.size());
                raw.append("': ");
            }
            append_quoted_name(path, &raw);
            return sanitize_error_message(raw);
        }

        const std::string_view family = format_family_name(magic.claimed);
        append_quoted_name(path, &raw);
        if (magic.status == MagicStatus::Truncated) {
            raw.append(" is too short to be a valid ");
            raw.append(family.data(), family.size());
            raw.append(" image.");
            return sanitize_error_message(raw);
        }

        raw.append(" does not appear to be a valid ");
        raw.append(family.data(), family.size());
        raw.append(
            " image. The file may be corrupted or have an incorrect extension.");
        if (magic.unrecognized_brand) {
            raw.append(" The HEIF brand is not supported.");
        } else if (magic.sniffed != ImageFormat::Unknown) {
            const std::string_view sniffed = format_family_name(magic.sniffed);
            raw.append(" Its content looks like a ");
            raw.append(sniffed.data(), sniffed.size());
            raw.append(" image.");
        }
        return sanitize_error_message(raw);
    }


    static ValidationStatus from_magic_status(MagicStatus status) noexcept
    {
        switch (status) {
        case MagicStatus::Match: return ValidationStatus::Ok;
        case MagicStatus::Mismatch:
        case MagicStatus::Truncated:
            return ValidationStatus::ContentFormatMismatch;
        case MagicStatus::UnknownExtension:
            return ValidationStatus::ExtensionUnrecognized;
        case MagicStatus::OpenFailed:
        case MagicStatus::ReadFailed: return ValidationStatus::Unreadable;
        }
        return ValidationStatus::Unreadable;
    }

}  // namespace


ValidationPipeline::ValidationPipeline(const ValidationPolicy& policy) noexcept
    : symlink_policy_(symlink_policy_for(policy))
{
}


SymlinkPolicy
ValidationPipeline::symlink_policy() const noexcept
{
    return symlink_policy_;
}


OpenValidation
ValidationPipeline::validate_for_open(std::string_view path,
                                      std::span<ValidationEvent> events) const
{
    OpenValidation result;
    EventSink sink;
    sink.out = events;

    const InputPathCheck checked = check_input_path(path, symlink_policy_,
                                                    &sink);
    if (checked.status != PathStatus::Ok) {
        result.status  = to_validation_status(checked.status);
        result.message = path_failure_message(result.status, path,
                                              checked.sys_error);
        result.events_written = sink.written;
        result.events_needed  = sink.needed;
        return result;
    }

    // The name the user picked decides the claimed format; the bytes of the
    // resolved file must back it up.
    const std::string extension = extension_from_path(path);
    const MagicCheckResult magic = validate_magic(checked.canonical_path.c_str(),
                                                  extension, &sink);
    result.events_written = sink.written;
    result.events_needed  = sink.needed;

    result.status = from_magic_status(magic.status);
    if (result.status == ValidationStatus::Ok) {
        result.file.canonical_path = checked.canonical_path;
        result.file.format         = magic.format;
        result.file.size_bytes     = checked.size;
        return result;
    }

    if (is_io_failure(magic.status)) {
        result.message = path_failure_message(result.status, path,
                                              magic.sys_error);
    } else {
        result.message = content_failure_message(path, extension, magic);
    }
    return result;
}


SaveValidation
ValidationPipeline::validate_for_save(std::string_view path,
                                      std::string_view source_path) const
{
    SaveValidation result;

    OutputPathCheck checked = check_output_path(path);
    if (checked.status != PathStatus::Ok) {
        result.status  = to_validation_status(checked.status);
        result.message = path_failure_message(result.status, path,
                                              checked.sys_error);
        return result;
    }

    if (!source_path.empty()
        && is_same_existing_file(checked.target_path, source_path)) {
        result.status  = ValidationStatus::OverwritesSource;
        result.message = path_failure_message(result.status, path, 0);
        return result;
    }

    result.target_path = std::move(checked.target_path);
    return result;
}


BatchResult
validate_batch_for_open(const ValidationPipeline& pipeline,
                        std::span<const std::string> paths,
                        std::span<OpenValidation> out)
{
    BatchResult result;
    if (paths.size() > kBatchSizeLimit) {
        result.status = BatchStatus::TooManyFiles;
        return result;
    }

    const size_t count = paths.size() < out.size() ? paths.size()
                                                   : out.size();
    for (size_t i = 0; i < count; ++i) {
        out[i] = pipeline.validate_for_open(paths[i]);
        if (out[i].status == ValidationStatus::Ok) {
            result.accepted += 1U;
        } else {
            result.rejected += 1U;
        }
    }
    if (count < paths.size()) {
        result.status = BatchStatus::OutputTruncated;
    }
    return result;
}


ValidationStatus
to_validation_status(PathStatus status) noexcept
{
    switch (status) {
    case PathStatus::Ok: return ValidationStatus::Ok;
    case PathStatus::EmptyPath: return ValidationStatus::EmptyPath;
    case PathStatus::MalformedPath: return ValidationStatus::MalformedPath;
    case PathStatus::TraversalAttempt: return ValidationStatus::TraversalAttempt;
    case PathStatus::NotFound: return ValidationStatus::NotFound;
    case PathStatus::NotRegularFile: return ValidationStatus::NotRegularFile;
    case PathStatus::SymlinkRejected: return ValidationStatus::SymlinkRejected;
    case PathStatus::SymlinkDepthExceeded:
        return ValidationStatus::SymlinkDepthExceeded;
    case PathStatus::FileTooLarge: return ValidationStatus::FileTooLarge;
    case PathStatus::FileEmpty: return ValidationStatus::FileEmpty;
    case PathStatus::Unreadable: return ValidationStatus::Unreadable;
    case PathStatus::ParentDirectoryMissing:
        return ValidationStatus::ParentDirectoryMissing;
    case PathStatus::ParentNotDirectory:
        return ValidationStatus::ParentNotDirectory;
    case PathStatus::ParentNotWritable:
        return ValidationStatus::ParentNotWritable;
    }
    return ValidationStatus::Unreadable;
}


std::string_view
validation_status_name(ValidationStatus status) noexcept
{
    switch (status) {
    case ValidationStatus::Ok: return "ok";
    case ValidationStatus::EmptyPath: return "empty_path";
    case ValidationStatus::MalformedPath: return "malformed_path";
    case ValidationStatus::TraversalAttempt: return "traversal_attempt";
    case ValidationStatus::NotFound: return "not_found";
    case ValidationStatus::NotRegularFile: return "not_regular_file";
    case ValidationStatus::SymlinkRejected: return "symlink_rejected";
    case ValidationStatus::SymlinkDepthExceeded:
        return "symlink_depth_exceeded";
    case ValidationStatus::FileTooLarge: return "file_too_large";
    case ValidationStatus::FileEmpty: return "file_empty";
    case ValidationStatus::Unreadable: return "unreadable";
    case ValidationStatus::ExtensionUnrecognized:
        return "extension_unrecognized";
    case ValidationStatus::ContentFormatMismatch:
        return "content_format_mismatch";
    case ValidationStatus::ParentDirectoryMissing:
        return "parent_directory_missing";
    case ValidationStatus::ParentNotDirectory: return "parent_not_directory";
    case ValidationStatus::ParentNotWritable: return "parent_not_writable";
    case ValidationStatus::OverwritesSource: return "overwrites_source";
    }
    return "unknown";
}


std::string_view
batch_status_name(BatchStatus status) noexcept
{
    switch (status) {
    case BatchStatus::Ok: return "ok";
    case BatchStatus::TooManyFiles: return "too_many_files";
    case BatchStatus::OutputTruncated: return "output_truncated";
    }
    return "unknown";
}


FailureDomain
failure_domain(ValidationStatus status) noexcept
{
    switch (status) {
    case ValidationStatus::Ok: return FailureDomain::None;
    case ValidationStatus::ExtensionUnrecognized:
    case ValidationStatus::ContentFormatMismatch: return FailureDomain::Content;
    case ValidationStatus::Unreadable: return FailureDomain::Io;
    case ValidationStatus::EmptyPath:
    case ValidationStatus::MalformedPath:
    case ValidationStatus::TraversalAttempt:
    case ValidationStatus::NotFound:
    case ValidationStatus::NotRegularFile:
    case ValidationStatus::SymlinkRejected:
    case ValidationStatus::SymlinkDepthExceeded:
    case ValidationStatus::FileTooLarge:
    case ValidationStatus::FileEmpty:
    case ValidationStatus::ParentDirectoryMissing:
    case ValidationStatus::ParentNotDirectory:
    case ValidationStatus::ParentNotWritable:
    case ValidationStatus::OverwritesSource: return FailureDomain::Path;
    }
    return FailureDomain::Path;
}


bool
is_user_actionable(ValidationStatus status) noexcept
{
    switch (status) {
    case ValidationStatus::Ok:
    case ValidationStatus::Unreadable: return false;
    case ValidationStatus::EmptyPath:
    case ValidationStatus::MalformedPath:
    case ValidationStatus::TraversalAttempt:
    case ValidationStatus::NotFound:
    case ValidationStatus::NotRegularFile:
    case ValidationStatus::SymlinkRejected:
    case ValidationStatus::SymlinkDepthExceeded:
    case ValidationStatus::FileTooLarge:
    case ValidationStatus::FileEmpty:
    case ValidationStatus::ExtensionUnrecognized:
    case ValidationStatus::ContentFormatMismatch:
    case ValidationStatus::ParentDirectoryMissing:
    case ValidationStatus::ParentNotDirectory:
    case ValidationStatus::ParentNotWritable:
    case ValidationStatus::OverwritesSource: return true;
    }
    return false;
}

}  // namespace metascrub
