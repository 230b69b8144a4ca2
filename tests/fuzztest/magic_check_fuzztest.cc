#include "metascrub/magic_validator.h"

#include "fuzztest/fuzztest.h"
#include "gtest/gtest.h"

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace metascrub {

static std::span<const std::byte>
as_bytes_span(const std::vector<uint8_t>& v)
{
    return std::span<const std::byte>(reinterpret_cast<const std::byte*>(
                                          v.data()),
                                      v.size());
}


// A header accepted for an extension is also recognized without one.
static void
MatchAgreesWithSniff(const std::vector<uint8_t>& header,
                     const std::string& extension)
{
    const std::span<const std::byte> bytes = as_bytes_span(header);
    const MagicCheckResult res = check_magic(bytes, extension);
    if (res.status == MagicStatus::Match) {
        EXPECT_NE(sniff_image_format(bytes), ImageFormat::Unknown);
    }
    EXPECT_LE(res.header_size, kMagicProbeBytes);
}

FUZZ_TEST(MagicCheckFuzz, MatchAgreesWithSniff)
    .WithDomains(fuzztest::Arbitrary<std::vector<uint8_t>>().WithMaxSize(64),
                 fuzztest::ElementOf<std::string>(
                     { "jpg", "jpeg", "png", "webp", "tif", "tiff", "heic",
                       "heif", "gif", "" }));


// Bytes past the probe window never change the verdict.
static void
OnlyProbeWindowMatters(const std::vector<uint8_t>& header,
                       const std::vector<uint8_t>& tail)
{
    std::vector<uint8_t> longer = header;
    longer.resize(kMagicProbeBytes, 0U);
    std::vector<uint8_t> padded = longer;
    padded.insert(padded.end(), tail.begin(), tail.end());

    const MagicCheckResult a = check_magic(as_bytes_span(longer), "tif");
    const MagicCheckResult b = check_magic(as_bytes_span(padded), "tif");
    EXPECT_EQ(a.status, b.status);
    EXPECT_EQ(a.format, b.format);
}

FUZZ_TEST(MagicCheckFuzz, OnlyProbeWindowMatters)
    .WithDomains(fuzztest::Arbitrary<std::vector<uint8_t>>().WithMaxSize(
                     kMagicProbeBytes),
                 fuzztest::Arbitrary<std::vector<uint8_t>>().WithMaxSize(64));

}  // namespace metascrub
