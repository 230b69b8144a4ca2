#include "metascrub/console_format.h"

namespace metascrub {
namespace {

    static constexpr char kHexDigits[] = "0123456789ABCDEF";

    static void append_hex_u8(uint8_t v, std::string* out) noexcept
    {
        out->push_back(kHexDigits[(v >> 4) & 0x0F]);
        out->push_back(kHexDigits[v & 0x0F]);
    }

}  // namespace

bool
append_console_escaped_ascii(std::string_view s, uint32_t max_bytes,
                             std::string* out) noexcept
{
    if (!out) {
        return false;
    }

    bool escaped     = false;
    const size_t n   = (max_bytes == 0U || s.size() < max_bytes)
                           ? s.size()
                           : static_cast<size_t>(max_bytes);

    out->reserve(out->size() + n);
    for (size_t i = 0; i < n; ++i) {
        const unsigned char c = static_cast<unsigned char>(s[i]);
        switch (c) {
        case '\\':
        case '"':
            out->push_back('\\');
            out->push_back(static_cast<char>(c));
            continue;
        case '\n':
            out->append("\\n");
            escaped = true;
            continue;
        case '\r':
            out->append("\\r");
            escaped = true;
            continue;
        case '\t':
            out->append("\\t");
            escaped = true;
            continue;
        default: break;
        }
        if (c < 0x20U || c == 0x7FU || c >= 0x80U) {
            out->append("\\x");
            append_hex_u8(static_cast<uint8_t>(c), out);
            escaped = true;
            continue;
        }
        out->push_back(static_cast<char>(c));
    }
    if (n < s.size()) {
        out->append("...");
        escaped = true;
    }
    return escaped;
}


void
append_hex_bytes(std::span<const std::byte> bytes, uint32_t max_bytes,
                 std::string* out) noexcept
{
    if (!out) {
        return;
    }

    const size_t n = (max_bytes == 0U || bytes.size() < max_bytes)
                         ? bytes.size()
                         : static_cast<size_t>(max_bytes);

    out->reserve(out->size() + n * 3U);
    for (size_t i = 0; i < n; ++i) {
        if (i != 0U) {
            out->push_back(' ');
        }
        append_hex_u8(static_cast<uint8_t>(bytes[i]), out);
    }
    if (n < bytes.size()) {
        out->append(" ...");
    }
}


void
append_fourcc(uint32_t fourcc_value, std::string* out) noexcept
{
    const char chars[4] = {
        static_cast<char>((fourcc_value >> 24) & 0xFF),
        static_cast<char>((fourcc_value >> 16) & 0xFF),
        static_cast<char>((fourcc_value >> 8) & 0xFF),
        static_cast<char>((fourcc_value >> 0) & 0xFF),
    };
    (void)append_console_escaped_ascii(std::string_view(chars, 4), 0U, out);
}

}  // namespace metascrub
