#include "metascrub/build_info.h"
#include "metascrub/console_format.h"
#include "metascrub/validation.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <string_view>
#include <vector>

namespace metascrub {
namespace {

    static void usage(const char* argv0)
    {
        std::printf(
            "Usage: %s [options] <file> [file...]\n"
            "\n"
            "Checks image files the way the editor does before opening them:\n"
            "path rules, symlink policy, size limits and magic numbers.\n"
            "\n"
            "Options:\n"
            "  --help                 Show this help\n"
            "  --version              Print MetaScrub build info\n"
            "  --no-build-info        Hide build info header\n"
            "  -i, --input <path>     Input file (repeatable)\n"
            "  -o, --save-target <p>  Also check <p> as the save target\n"
            "                         (single input only)\n"
            "  --allow-symlinks       Resolve symlinks instead of refusing them\n"
            "                         (development policy)\n"
            "  --no-events            Do not print detection events\n"
            "  --max-events N         Event buffer size per file (default: 16)\n",
            argv0 ? argv0 : "metascrub-check");
    }


    static bool parse_u32_arg(const char* s, uint32_t* out)
    {
        if (!s || !*s || !out) {
            return false;
        }
        char* end       = nullptr;
        unsigned long v = std::strtoul(s, &end, 10);
        if (!end || *end != '\0') {
            return false;
        }
        *out = static_cast<uint32_t>(v);
        return true;
    }


    static bool has_option_value(int argc, char** argv, int i) noexcept
    {
        return i + 1 < argc && argv[i + 1] != nullptr;
    }


    static void print_build_info_header()
    {
        std::string line1;
        std::string line2;
        format_build_info_lines(&line1, &line2);
        std::printf("%s\n%s\n", line1.c_str(), line2.c_str());
    }


    static std::string escaped(std::string_view s)
    {
        std::string out;
        (void)append_console_escaped_ascii(s, 1024U, &out);
        return out;
    }


    static const char* failure_domain_name(FailureDomain domain) noexcept
    {
        switch (domain) {
        case FailureDomain::None: return "none";
        case FailureDomain::Path: return "path";
        case FailureDomain::Content: return "content";
        case FailureDomain::Io: return "io";
        }
        return "unknown";
    }


    static void print_events(std::span<const ValidationEvent> events,
                             uint32_t written, uint32_t needed)
    {
        if (needed == 0U) {
            return;
        }
        const uint32_t avail = (written < events.size())
                                   ? written
                                   : static_cast<uint32_t>(events.size());
        std::string line;
        for (uint32_t i = 0; i < avail; ++i) {
            line.clear();
            format_validation_event(events[i], &line);
            std::printf("  event[%u] %s\n", i, line.c_str());
        }
        if (needed > avail) {
            std::printf("  events written=%u needed=%u\n", avail, needed);
        }
    }

}  // namespace
}  // namespace metascrub


int
main(int argc, char** argv)
{
    using namespace metascrub;

    bool show_build_info = true;
    bool show_events     = true;
    uint32_t max_events  = 16U;
    std::string save_target;
    std::vector<std::string> explicit_inputs;
    ValidationPolicy policy;

    int first_path = 1;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (!arg) {
            continue;
        }
        if (std::strcmp(arg, "--help") == 0) {
            usage(argv[0]);
            return 0;
        }
        if (std::strcmp(arg, "--version") == 0) {
            print_build_info_header();
            return 0;
        }
        if (std::strcmp(arg, "--no-build-info") == 0) {
            show_build_info = false;
            first_path += 1;
            continue;
        }
        if (std::strcmp(arg, "--no-events") == 0) {
            show_events = false;
            first_path += 1;
            continue;
        }
        if (std::strcmp(arg, "--allow-symlinks") == 0) {
            policy.allow_symlinks_in_development = true;
            first_path += 1;
            continue;
        }
        if (std::strcmp(arg, "-i") == 0 || std::strcmp(arg, "--input") == 0) {
            if (!has_option_value(argc, argv, i)) {
                usage(argv[0]);
                return 2;
            }
            explicit_inputs.emplace_back(argv[i + 1]);
            i += 1;
            first_path += 2;
            continue;
        }
        if (std::strcmp(arg, "-o") == 0
            || std::strcmp(arg, "--save-target") == 0) {
            if (!has_option_value(argc, argv, i)) {
                usage(argv[0]);
                return 2;
            }
            save_target = argv[i + 1];
            i += 1;
            first_path += 2;
            continue;
        }
        if (std::strcmp(arg, "--max-events") == 0) {
            if (!has_option_value(argc, argv, i)) {
                usage(argv[0]);
                return 2;
            }
            if (!parse_u32_arg(argv[i + 1], &max_events)
                || max_events > 1024U) {
                std::fprintf(stderr, "invalid --max-events value\n");
                return 2;
            }
            i += 1;
            first_path += 2;
            continue;
        }
        break;
    }

    std::vector<std::string> input_paths = explicit_inputs;
    for (int i = first_path; i < argc; ++i) {
        if (argv[i]) {
            input_paths.emplace_back(argv[i]);
        }
    }

    if (input_paths.empty()) {
        usage(argv[0]);
        return 2;
    }
    if (input_paths.size() > kBatchSizeLimit) {
        std::fprintf(stderr, "metascrub-check: at most %u files per run\n",
                     kBatchSizeLimit);
        return 2;
    }
    if (!save_target.empty() && input_paths.size() != 1U) {
        std::fprintf(stderr,
                     "metascrub-check: --save-target requires exactly one "
                     "input file\n");
        return 2;
    }

    if (show_build_info) {
        print_build_info_header();
    }

    const ValidationPipeline pipeline(policy);
    std::vector<ValidationEvent> events(max_events);

    bool any_failed = false;
    for (size_t i = 0; i < input_paths.size(); ++i) {
        const std::string& path = input_paths[i];

        const OpenValidation opened = pipeline.validate_for_open(
            path, std::span<ValidationEvent>(events.data(), events.size()));
        std::printf("== %s\n", escaped(path).c_str());
        std::printf("  status=%s domain=%s\n",
                    validation_status_name(opened.status).data(),
                    failure_domain_name(failure_domain(opened.status)));
        if (opened.status == ValidationStatus::Ok) {
            std::printf("  format=%s size=%llu\n",
                        image_format_name(opened.file.format).data(),
                        static_cast<unsigned long long>(
                            opened.file.size_bytes));
        } else {
            std::printf("  message=%s\n", escaped(opened.message).c_str());
            any_failed = true;
        }
        if (show_events) {
            print_events(std::span<const ValidationEvent>(events.data(),
                                                          events.size()),
                         opened.events_written, opened.events_needed);
        }

        if (save_target.empty()) {
            continue;
        }
        const std::string_view source = (opened.status == ValidationStatus::Ok)
                                            ? std::string_view(
                                                opened.file.canonical_path)
                                            : std::string_view(path);
        const SaveValidation saved = pipeline.validate_for_save(save_target,
                                                                source);
        std::printf("-- save %s\n", escaped(save_target).c_str());
        std::printf("  status=%s\n",
                    validation_status_name(saved.status).data());
        if (saved.status == ValidationStatus::Ok) {
            std::printf("  target=%s\n", escaped(saved.target_path).c_str());
        } else {
            std::printf("  message=%s\n", escaped(saved.message).c_str());
            any_failed = true;
        }
    }

    return any_failed ? 1 : 0;
}
