#include "metascrub/build_info.h"
#include "metascrub/console_format.h"
#include "metascrub/error_sanitizer.h"
#include "metascrub/format_signature.h"
#include "metascrub/magic_validator.h"
#include "metascrub/validation.h"

#include <nanobind/nanobind.h>
#include <nanobind/stl/pair.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/vector.h>

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace nb = nanobind;
using namespace nb::literals;

namespace metascrub {
namespace {

    /// Open result with events rendered to text for Python callers.
    struct PyOpenResult final {
        OpenValidation validation;
        std::vector<std::string> events;
        uint32_t events_needed = 0;
    };


    static nb::str sv_to_py(std::string_view s)
    {
        return nb::str(s.data(), s.size());
    }


    static std::pair<std::string, std::string> info_lines()
    {
        std::string line1;
        std::string line2;
        format_build_info_lines(&line1, &line2);
        return { std::move(line1), std::move(line2) };
    }


    static std::span<const std::byte> bytes_view(const nb::bytes& data)
    {
        return std::span<const std::byte>(
            reinterpret_cast<const std::byte*>(data.c_str()), data.size());
    }


    static PyOpenResult open_file(const std::string& path, bool allow_symlinks,
                                  uint32_t max_events)
    {
        if (max_events > 1024U) {
            throw std::invalid_argument("max_events must be <= 1024");
        }

        ValidationPolicy policy;
        policy.allow_symlinks_in_development = allow_symlinks;
        const ValidationPipeline pipeline(policy);

        std::vector<ValidationEvent> events(max_events);
        PyOpenResult out;
        {
            nb::gil_scoped_release gil_release;
            out.validation = pipeline.validate_for_open(
                path, std::span<ValidationEvent>(events.data(), events.size()));
        }

        const uint32_t avail = (out.validation.events_written < events.size())
                                   ? out.validation.events_written
                                   : static_cast<uint32_t>(events.size());
        out.events.reserve(avail);
        for (uint32_t i = 0; i < avail; ++i) {
            std::string line;
            format_validation_event(events[i], &line);
            out.events.push_back(std::move(line));
        }
        out.events_needed = out.validation.events_needed;
        return out;
    }


    static SaveValidation save_target(const std::string& path,
                                      const std::string& source_path)
    {
        const ValidationPipeline pipeline;
        nb::gil_scoped_release gil_release;
        return pipeline.validate_for_save(path, source_path);
    }


    static std::vector<OpenValidation>
    open_batch(const std::vector<std::string>& paths, bool allow_symlinks)
    {
        if (paths.size() > kBatchSizeLimit) {
            throw std::invalid_argument("too many files in one batch");
        }
        ValidationPolicy policy;
        policy.allow_symlinks_in_development = allow_symlinks;
        const ValidationPipeline pipeline(policy);

        std::vector<OpenValidation> out(paths.size());
        BatchResult res;
        {
            nb::gil_scoped_release gil_release;
            res = validate_batch_for_open(
                pipeline,
                std::span<const std::string>(paths.data(), paths.size()),
                std::span<OpenValidation>(out.data(), out.size()));
        }
        if (res.status != BatchStatus::Ok) {
            throw std::runtime_error("batch validation failed");
        }
        return out;
    }


    static std::string hex_bytes(const nb::bytes& data, uint32_t max_bytes)
    {
        std::string out;
        append_hex_bytes(bytes_view(data), max_bytes, &out);
        return out;
    }

}  // namespace
}  // namespace metascrub


NB_MODULE(_metascrub, m)
{
    using namespace metascrub;

    m.doc()               = "MetaScrub file validation bindings (nanobind).";
    m.attr("__version__") = METASCRUB_VERSION_STRING;

    m.attr("MAX_INPUT_FILE_BYTES") = kMaxInputFileBytes;
    m.attr("MAX_SYMLINK_DEPTH")    = kMaxSymlinkDepth;
    m.attr("MAGIC_PROBE_BYTES")    = kMagicProbeBytes;
    m.attr("BATCH_SIZE_LIMIT")     = kBatchSizeLimit;

    nb::enum_<ImageFormat>(m, "ImageFormat")
        .value("Unknown", ImageFormat::Unknown)
        .value("Jpeg", ImageFormat::Jpeg)
        .value("Png", ImageFormat::Png)
        .value("Webp", ImageFormat::Webp)
        .value("TiffLe", ImageFormat::TiffLe)
        .value("TiffBe", ImageFormat::TiffBe)
        .value("Heif", ImageFormat::Heif);

    nb::enum_<MagicStatus>(m, "MagicStatus")
        .value("Match", MagicStatus::Match)
        .value("Mismatch", MagicStatus::Mismatch)
        .value("Truncated", MagicStatus::Truncated)
        .value("UnknownExtension", MagicStatus::UnknownExtension)
        .value("OpenFailed", MagicStatus::OpenFailed)
        .value("ReadFailed", MagicStatus::ReadFailed);

    nb::enum_<ValidationStatus>(m, "ValidationStatus")
        .value("Ok", ValidationStatus::Ok)
        .value("EmptyPath", ValidationStatus::EmptyPath)
        .value("MalformedPath", ValidationStatus::MalformedPath)
        .value("TraversalAttempt", ValidationStatus::TraversalAttempt)
        .value("NotFound", ValidationStatus::NotFound)
        .value("NotRegularFile", ValidationStatus::NotRegularFile)
        .value("SymlinkRejected", ValidationStatus::SymlinkRejected)
        .value("SymlinkDepthExceeded", ValidationStatus::SymlinkDepthExceeded)
        .value("FileTooLarge", ValidationStatus::FileTooLarge)
        .value("FileEmpty", ValidationStatus::FileEmpty)
        .value("Unreadable", ValidationStatus::Unreadable)
        .value("ExtensionUnrecognized", ValidationStatus::ExtensionUnrecognized)
        .value("ContentFormatMismatch", ValidationStatus::ContentFormatMismatch)
        .value("ParentDirectoryMissing",
               ValidationStatus::ParentDirectoryMissing)
        .value("ParentNotDirectory", ValidationStatus::ParentNotDirectory)
        .value("ParentNotWritable", ValidationStatus::ParentNotWritable)
        .value("OverwritesSource", ValidationStatus::OverwritesSource);

    nb::enum_<FailureDomain>(m, "FailureDomain")
        .value("None", FailureDomain::None)
        .value("Path", FailureDomain::Path)
        .value("Content", FailureDomain::Content)
        .value("Io", FailureDomain::Io);

    nb::class_<OpenValidation>(m, "OpenValidation")
        .def_ro("status", &OpenValidation::status)
        .def_ro("message", &OpenValidation::message)
        .def_prop_ro("ok",
                     [](const OpenValidation& v) {
                         return v.status == ValidationStatus::Ok;
                     })
        .def_prop_ro("canonical_path",
                     [](const OpenValidation& v) {
                         return v.file.canonical_path;
                     })
        .def_prop_ro("format",
                     [](const OpenValidation& v) { return v.file.format; })
        .def_prop_ro("size_bytes",
                     [](const OpenValidation& v) { return v.file.size_bytes; })
        .def("__repr__", [](const OpenValidation& v) {
            std::string s = "OpenValidation(status=";
            s.append(validation_status_name(v.status));
            if (v.status == ValidationStatus::Ok) {
                s.append(", format=");
                s.append(image_format_name(v.file.format));
            }
            s.append(")");
            return s;
        });

    nb::class_<PyOpenResult>(m, "OpenResult")
        .def_prop_ro("status",
                     [](const PyOpenResult& r) { return r.validation.status; })
        .def_prop_ro("ok",
                     [](const PyOpenResult& r) {
                         return r.validation.status == ValidationStatus::Ok;
                     })
        .def_prop_ro("message",
                     [](const PyOpenResult& r) { return r.validation.message; })
        .def_prop_ro("canonical_path",
                     [](const PyOpenResult& r) {
                         return r.validation.file.canonical_path;
                     })
        .def_prop_ro("format",
                     [](const PyOpenResult& r) {
                         return r.validation.file.format;
                     })
        .def_prop_ro("size_bytes",
                     [](const PyOpenResult& r) {
                         return r.validation.file.size_bytes;
                     })
        .def_ro("events", &PyOpenResult::events)
        .def_ro("events_needed", &PyOpenResult::events_needed);

    nb::class_<SaveValidation>(m, "SaveValidation")
        .def_ro("status", &SaveValidation::status)
        .def_ro("message", &SaveValidation::message)
        .def_ro("target_path", &SaveValidation::target_path)
        .def_prop_ro("ok", [](const SaveValidation& v) {
            return v.status == ValidationStatus::Ok;
        });

    m.def("validate_for_open", &open_file, "path"_a,
          "allow_symlinks"_a = false, "max_events"_a = 16U);
    m.def("validate_for_save", &save_target, "path"_a,
          "source_path"_a = std::string());
    m.def("validate_batch_for_open", &open_batch, "paths"_a,
          "allow_symlinks"_a = false);

    m.def("sanitize_error_message", [](const std::string& raw) {
        return sanitize_error_message(raw);
    });
    m.def("display_file_name", [](const std::string& path) {
        return std::string(display_file_name(path));
    });

    m.def("status_name", [](ValidationStatus status) {
        return sv_to_py(validation_status_name(status));
    });
    m.def("failure_domain", &failure_domain, "status"_a);
    m.def("is_user_actionable", &is_user_actionable, "status"_a);

    m.def(
        "sniff_image_format",
        [](const nb::bytes& header) {
            return sniff_image_format(bytes_view(header));
        },
        "header"_a);
    m.def(
        "check_magic",
        [](const nb::bytes& header, const std::string& extension) {
            return check_magic(bytes_view(header), extension).status;
        },
        "header"_a, "extension"_a);
    m.def("hex_bytes", &hex_bytes, "data"_a, "max_bytes"_a = 4096U);

    m.def("build_info", []() {
        const BuildInfo& bi = build_info();
        nb::dict d;
        d["version"]              = sv_to_py(bi.version);
        d["build_timestamp_utc"]  = sv_to_py(bi.build_timestamp_utc);
        d["build_type"]           = sv_to_py(bi.build_type);
        d["cmake_generator"]      = sv_to_py(bi.cmake_generator);
        d["system_name"]          = sv_to_py(bi.system_name);
        d["system_processor"]     = sv_to_py(bi.system_processor);
        d["cxx_compiler_id"]      = sv_to_py(bi.cxx_compiler_id);
        d["cxx_compiler_version"] = sv_to_py(bi.cxx_compiler_version);
        d["cxx_compiler"]         = sv_to_py(bi.cxx_compiler);
        d["linkage_static"]       = nb::bool_(bi.linkage_static);
        d["linkage_shared"]       = nb::bool_(bi.linkage_shared);
        d["max_input_file_bytes"] = nb::int_(bi.max_input_file_bytes);
        d["max_symlink_depth"]    = nb::int_(bi.max_symlink_depth);
        d["magic_probe_bytes"]    = nb::int_(bi.magic_probe_bytes);
        d["signature_count"]      = nb::int_(bi.signature_count);
        return d;
    });

    m.def("info_lines", &info_lines);
}
