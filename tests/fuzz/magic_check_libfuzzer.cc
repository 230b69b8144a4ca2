#include "metascrub/magic_validator.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <span>
#include <string_view>

namespace metascrub {

[[noreturn]] static void
fuzz_trap() noexcept
{
#if defined(__clang__) || defined(__GNUC__)
    __builtin_trap();
#else
    std::abort();
#endif
}


static void
verify_result(const MagicCheckResult& res, std::span<const std::byte> header,
              const EventSink& sink) noexcept
{
    if (res.header_size > kMagicProbeBytes) {
        fuzz_trap();
    }
    if (res.status == MagicStatus::Match) {
        if (res.format == ImageFormat::Unknown || sink.needed != 0U) {
            fuzz_trap();
        }
        if (sniff_image_format(header) == ImageFormat::Unknown) {
            fuzz_trap();
        }
        return;
    }
    if (res.status == MagicStatus::Mismatch
        || res.status == MagicStatus::Truncated) {
        if (sink.needed != 1U) {
            fuzz_trap();
        }
    }
}

}  // namespace metascrub

extern "C" int
LLVMFuzzerTestOneInput(const uint8_t* data, size_t size)
{
    using namespace metascrub;

    static constexpr std::array<std::string_view, 8> kExtensions = {
        "jpg", "png", "webp", "tif", "heic", "heif", "txt", "",
    };
    if (size == 0U) {
        return 0;
    }

    const std::string_view ext = kExtensions[data[0] % kExtensions.size()];
    const std::span<const std::byte> header(
        reinterpret_cast<const std::byte*>(data + 1), size - 1U);

    std::array<ValidationEvent, 2> events {};
    EventSink sink;
    sink.out = events;
    const MagicCheckResult res = check_magic(header, ext, &sink);
    verify_result(res, header, sink);
    return 0;
}
