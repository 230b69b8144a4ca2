#include "metascrub/error_sanitizer.h"

#include "fuzztest/fuzztest.h"
#include "gtest/gtest.h"

#include <string>
#include <vector>

namespace metascrub {

static void
SanitizedMessageHasNoSeparators(const std::string& raw)
{
    const std::string out = sanitize_error_message(raw);
    EXPECT_EQ(out.find_first_of("/\\"), std::string::npos);
}

FUZZ_TEST(ErrorSanitizerFuzz, SanitizedMessageHasNoSeparators);


static void
SanitizeIsIdempotent(const std::string& raw)
{
    const std::string once = sanitize_error_message(raw);
    EXPECT_EQ(sanitize_error_message(once), once);
}

FUZZ_TEST(ErrorSanitizerFuzz, SanitizeIsIdempotent);


// Paths assembled from directory names must not leak any of them. The
// prefix never contains 'z', so a marker can only come from the path.
static void
DirectoryNamesNeverLeak(const std::vector<std::string>& dirs,
                        const std::string& prefix)
{
    std::string raw = prefix;
    raw.append(" /");
    for (const std::string& d : dirs) {
        raw.append("zz");
        raw.append(d);
        raw.push_back('/');
    }
    raw.append("photo.jpg failed");

    const std::string out = sanitize_error_message(raw);
    for (const std::string& d : dirs) {
        const std::string marker = "zz" + d;
        EXPECT_EQ(out.find(marker), std::string::npos) << out;
    }
}

FUZZ_TEST(ErrorSanitizerFuzz, DirectoryNamesNeverLeak)
    .WithDomains(fuzztest::VectorOf(fuzztest::StringOf(
                                        fuzztest::InRange('a', 'z')))
                     .WithMaxSize(8),
                 fuzztest::StringOf(fuzztest::InRange('a', 'y')));

}  // namespace metascrub
