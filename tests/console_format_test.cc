#include "metascrub/console_format.h"

#include "metascrub/format_signature.h"

#include <gtest/gtest.h>

#include <array>
#include <string>
#include <string_view>

namespace metascrub {

TEST(ConsoleFormat, EscapesControlAndNonAscii)
{
    std::string out;
    EXPECT_TRUE(append_console_escaped_ascii(
        std::string_view("a\nb\x1b[2J\xff", 8), 0U, &out));
    EXPECT_EQ(out, "a\\nb\\x1B[2J\\xFF");
}


TEST(ConsoleFormat, PlainAsciiIsUnchanged)
{
    std::string out;
    EXPECT_FALSE(append_console_escaped_ascii("photo.jpg", 0U, &out));
    EXPECT_EQ(out, "photo.jpg");
}


TEST(ConsoleFormat, TruncatesAtMaxBytes)
{
    std::string out;
    EXPECT_TRUE(append_console_escaped_ascii("abcdef", 3U, &out));
    EXPECT_EQ(out, "abc...");
}


TEST(ConsoleFormat, HexBytes)
{
    const std::array<std::byte, 4> bytes = {
        std::byte { 0xFF },
        std::byte { 0xD8 },
        std::byte { 0xFF },
        std::byte { 0x0E },
    };
    std::string out;
    append_hex_bytes(bytes, 0U, &out);
    EXPECT_EQ(out, "FF D8 FF 0E");

    out.clear();
    append_hex_bytes(bytes, 2U, &out);
    EXPECT_EQ(out, "FF D8 ...");

    out.clear();
    append_hex_bytes({}, 0U, &out);
    EXPECT_EQ(out, "");
}


TEST(ConsoleFormat, FourccIsEscaped)
{
    std::string out;
    append_fourcc(fourcc('h', 'e', 'i', 'c'), &out);
    EXPECT_EQ(out, "heic");

    out.clear();
    append_fourcc(0x00000001U, &out);
    EXPECT_EQ(out, "\\x00\\x00\\x00\\x01");
}

}  // namespace metascrub
