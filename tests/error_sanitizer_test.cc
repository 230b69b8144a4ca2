#include "metascrub/error_sanitizer.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <string>
#include <string_view>

namespace metascrub {
namespace {

    static bool has_separator(std::string_view s) noexcept
    {
        return s.find_first_of("/\\") != std::string_view::npos;
    }


    static double sanitize_seconds(const std::string& input)
    {
        double best = 1e9;
        for (int rep = 0; rep < 5; ++rep) {
            const auto start = std::chrono::steady_clock::now();
            const std::string out = sanitize_error_message(input);
            const auto stop = std::chrono::steady_clock::now();
            EXPECT_FALSE(has_separator(out));
            best = std::min(best,
                            std::chrono::duration<double>(stop - start).count());
        }
        return best;
    }

}  // namespace


TEST(ErrorSanitizer, ReplacesUnixPathWithFileName)
{
    EXPECT_EQ(sanitize_error_message(
                  "Cannot open /home/alice/private/vacation.jpg: denied"),
              "Cannot open vacation.jpg: denied");
}


TEST(ErrorSanitizer, ReplacesWindowsPathWithFileName)
{
    EXPECT_EQ(sanitize_error_message(
                  "Cannot open C:\\Users\\alice\\Pictures\\scan.tif now"),
              "Cannot open scan.tif now");
}


TEST(ErrorSanitizer, HidesPathsWithoutFileName)
{
    EXPECT_EQ(sanitize_error_message("Directory /home/alice/secret is busy"),
              "Directory [path hidden] is busy");
    EXPECT_EQ(sanitize_error_message("Bad dir /home/alice/.cache"),
              "Bad dir [path hidden]");
    EXPECT_EQ(sanitize_error_message("Bad dir /home/alice/"),
              "Bad dir [path hidden]");
}


TEST(ErrorSanitizer, PrefixesMessagesStartingWithAbsolutePath)
{
    EXPECT_EQ(sanitize_error_message("/var/data/photo.png: not found"),
              "File error: photo.png: not found");
    EXPECT_EQ(sanitize_error_message("C:\\data\\photo.png is locked"),
              "File error: photo.png is locked");
    EXPECT_EQ(sanitize_error_message("D:/data/photo.png is locked"),
              "File error: photo.png is locked");
    EXPECT_EQ(sanitize_error_message("  /etc is a directory"),
              "File error:   [path hidden] is a directory");
}


TEST(ErrorSanitizer, KeepsOpeningPunctuation)
{
    EXPECT_EQ(sanitize_error_message("File '/home/u/a.jpg' is corrupt"),
              "File 'a.jpg' is corrupt");
    EXPECT_EQ(sanitize_error_message("(see /home/u/dir)"),
              "(see [path hidden]");
}


TEST(ErrorSanitizer, LeavesPlainTextAlone)
{
    const std::string_view plain
        = "'photo.jpg' does not appear to be a valid JPEG image.";
    EXPECT_EQ(sanitize_error_message(plain), plain);
    EXPECT_EQ(sanitize_error_message(""), "");
    EXPECT_EQ(sanitize_error_message("  \t"), "  \t");
}


TEST(ErrorSanitizer, RelativePathsAreReplacedToo)
{
    EXPECT_EQ(sanitize_error_message("open photos/2024/img.heic failed"),
              "open img.heic failed");
}


TEST(ErrorSanitizer, NoDirectoryTextSurvives)
{
    const std::string_view inputs[] = {
        "at /home/alice/Documents/taxes/2023/receipt.jpg line 4",
        "C:\\Users\\bob\\AppData\\Local\\Temp\\x.png",
        "copy /a/b/c.jpg to /d/e/f.png",
        "mixed /usr\\local/share\\thing",
        "////",
        "\\\\server\\share\\secret\\",
        "quoted \"/opt/alice/raw file.jpg\"",
    };
    for (std::string_view in : inputs) {
        const std::string out = sanitize_error_message(in);
        EXPECT_FALSE(has_separator(out)) << in;
        EXPECT_EQ(out.find("alice"), std::string::npos) << in;
        EXPECT_EQ(out.find("bob"), std::string::npos) << in;
        EXPECT_EQ(out.find("AppData"), std::string::npos) << in;
        EXPECT_EQ(out.find("secret"), std::string::npos) << in;
    }
}


TEST(ErrorSanitizer, IsIdempotent)
{
    const std::string_view inputs[] = {
        "/var/data/photo.png: not found",
        "Cannot open C:\\Users\\alice\\scan.tif",
        "Directory /home/alice/secret is busy",
        "File error: photo.png",
        "(see /home/u/dir) and /x/y.jpg",
        "no paths at all",
    };
    for (std::string_view in : inputs) {
        const std::string once  = sanitize_error_message(in);
        const std::string twice = sanitize_error_message(once);
        EXPECT_EQ(once, twice) << in;
    }
}


TEST(ErrorSanitizer, RunsInLinearTime)
{
    // A quadratic pass would slow down by 256x between these sizes.
    std::string small;
    while (small.size() < 64U * 1024U) {
        small.append("/a/b/c/d.jpg x//y ");
    }
    std::string large;
    while (large.size() < 1024U * 1024U) {
        large.append("/a/b/c/d.jpg x//y ");
    }
    const double t_small = sanitize_seconds(small);
    const double t_large = sanitize_seconds(large);
    EXPECT_LT(t_large, std::max(t_small, 1e-4) * 80.0);
}


TEST(ErrorSanitizer, SeparatorRunsWithoutFileNameRunInLinearTime)
{
    const std::string small_run(64U * 1024U, '/');
    const std::string large_run(1024U * 1024U, '/');
    std::string small_mixed;
    while (small_mixed.size() < 64U * 1024U) {
        small_mixed.append("/\\dir//");
    }
    std::string large_mixed;
    while (large_mixed.size() < 1024U * 1024U) {
        large_mixed.append("/\\dir//");
    }

    const double t_small_run = sanitize_seconds(small_run);
    const double t_large_run = sanitize_seconds(large_run);
    EXPECT_LT(t_large_run, std::max(t_small_run, 1e-4) * 80.0);

    const double t_small_mixed = sanitize_seconds(small_mixed);
    const double t_large_mixed = sanitize_seconds(large_mixed);
    EXPECT_LT(t_large_mixed, std::max(t_small_mixed, 1e-4) * 80.0);

    EXPECT_EQ(sanitize_error_message(large_run), "File error: [path hidden]");
}


TEST(ErrorSanitizer, AppendsToExistingText)
{
    std::string out = "prefix: ";
    append_sanitized_message("/tmp/x/photo.jpg", &out);
    EXPECT_EQ(out, "prefix: File error: photo.jpg");
    append_sanitized_message("ignored", nullptr);
}


TEST(ErrorSanitizer, DisplayFileName)
{
    EXPECT_EQ(display_file_name("/home/u/photo.jpg"), "photo.jpg");
    EXPECT_EQ(display_file_name("C:\\u\\scan.tif"), "scan.tif");
    EXPECT_EQ(display_file_name("photo.jpg"), "photo.jpg");
    EXPECT_EQ(display_file_name("/home/u/album/"), "album");
    EXPECT_EQ(display_file_name("///"), "");
    EXPECT_EQ(display_file_name(""), "");
}

}  // namespace metascrub
