#include "metascrub/build_info.h"

#include "metascrub/build_info_generated.h"
#include "metascrub/format_signature.h"
#include "metascrub/path_guard.h"

#include <string>

namespace metascrub {
namespace {

    static constexpr bool linkage_static() noexcept
    {
#if defined(METASCRUB_BUILD_LINKAGE_STATIC) && METASCRUB_BUILD_LINKAGE_STATIC
        return true;
#else
        return false;
#endif
    }

    static constexpr bool linkage_shared() noexcept
    {
#if defined(METASCRUB_BUILD_LINKAGE_SHARED) && METASCRUB_BUILD_LINKAGE_SHARED
        return true;
#else
        return false;
#endif
    }

    static const char* linkage_string(const BuildInfo& bi) noexcept
    {
        if (bi.linkage_static) {
            return "static";
        }
        if (bi.linkage_shared) {
            return "shared";
        }
        return "unknown";
    }

    static void append_sv(std::string* out, std::string_view s)
    {
        out->append(s.data(), s.size());
    }

}  // namespace

const BuildInfo&
build_info() noexcept
{
    static const BuildInfo kBuildInfo = {
        /*version=*/METASCRUB_BUILDINFO_VERSION,
        /*build_timestamp_utc=*/METASCRUB_BUILDINFO_BUILD_TIMESTAMP_UTC,
        /*build_type=*/METASCRUB_BUILDINFO_BUILD_TYPE,
        /*cmake_generator=*/METASCRUB_BUILDINFO_CMAKE_GENERATOR,
        /*system_name=*/METASCRUB_BUILDINFO_SYSTEM_NAME,
        /*system_processor=*/METASCRUB_BUILDINFO_SYSTEM_PROCESSOR,
        /*cxx_compiler_id=*/METASCRUB_BUILDINFO_CXX_COMPILER_ID,
        /*cxx_compiler_version=*/METASCRUB_BUILDINFO_CXX_COMPILER_VERSION,
        /*cxx_compiler=*/METASCRUB_BUILDINFO_CXX_COMPILER,
        /*linkage_static=*/linkage_static(),
        /*linkage_shared=*/linkage_shared(),
        /*max_input_file_bytes=*/kMaxInputFileBytes,
        /*max_symlink_depth=*/kMaxSymlinkDepth,
        /*magic_probe_bytes=*/kMagicProbeBytes,
        /*signature_count=*/static_cast<uint32_t>(all_signatures().size()),
    };
    return kBuildInfo;
}


void
format_build_info_lines(const BuildInfo& bi, std::string* line1,
                        std::string* line2)
{
    if (line1) {
        line1->clear();
        line1->reserve(128);
        line1->append("MetaScrub v");
        append_sv(line1, bi.version);
        line1->append(" ");
        append_sv(line1, bi.build_type);
        line1->append(" [max=");
        line1->append(std::to_string(bi.max_input_file_bytes / (1024U * 1024U)));
        line1->append("MiB,probe=");
        line1->append(std::to_string(bi.magic_probe_bytes));
        line1->append(",symlink-depth=");
        line1->append(std::to_string(bi.max_symlink_depth));
        line1->append(",signatures=");
        line1->append(std::to_string(bi.signature_count));
        line1->append("] ");
        line1->append(linkage_string(bi));
    }

    if (line2) {
        line2->clear();
        line2->reserve(160);
        line2->append("built with ");
        append_sv(line2, bi.cxx_compiler_id);
        line2->append("-");
        append_sv(line2, bi.cxx_compiler_version);
        line2->append(" for ");
        append_sv(line2, bi.system_name);
        line2->append("/");
        append_sv(line2, bi.system_processor);

        if (!bi.build_timestamp_utc.empty()) {
            line2->append(" (");
            append_sv(line2, bi.build_timestamp_utc);
            line2->append(")");
        }
    }
}


void
format_build_info_lines(std::string* line1, std::string* line2)
{
    format_build_info_lines(build_info(), line1, line2);
}

}  // namespace metascrub
