#include "metascrub/error_sanitizer.h"

namespace metascrub {
namespace {

    static bool is_space(char c) noexcept
    {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v'
               || c == '\f';
    }


    static bool is_separator(char c) noexcept { return c == '/' || c == '\\'; }


    static bool is_ascii_alpha(char c) noexcept
    {
        return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
    }


    // Opening punctuation kept in front of a replaced path token.
    static bool is_opening_punct(char c) noexcept
    {
        return c == '\'' || c == '"' || c == '(' || c == '[' || c == '<'
               || c == '{' || c == '`';
    }


    static bool starts_with_absolute_path(std::string_view s) noexcept
    {
        size_t i = 0;
        while (i < s.size() && is_space(s[i])) {
            ++i;
        }
        if (i < s.size() && is_separator(s[i])) {
            return true;
        }
        return i + 2U < s.size() && is_ascii_alpha(s[i]) && s[i + 1U] == ':'
               && is_separator(s[i + 2U]);
    }


    // `photo.jpg`, `IMG_01.heic:`; not `.cache`, `secret`, `dir.`.
    static bool looks_like_file_name(std::string_view segment) noexcept
    {
        if (segment.size() < 3U) {
            return false;
        }
        for (size_t i = 1; i + 1U < segment.size(); ++i) {
            if (segment[i] == '.' && segment[i - 1U] != '.'
                && segment[i + 1U] != '.') {
                return true;
            }
        }
        return false;
    }


    static void append_path_replacement(std::string_view token,
                                        size_t last_sep, std::string* out)
    {
        size_t lead = 0;
        while (lead < token.size() && is_opening_punct(token[lead])) {
            ++lead;
        }
        out->append(token.data(), lead);

        const std::string_view segment = token.substr(last_sep + 1U);
        if (looks_like_file_name(segment)) {
            out->append(segment.data(), segment.size());
        } else {
            out->append(kHiddenPathPlaceholder.data(),
                        kHiddenPathPlaceholder.size());
        }
    }

}  // namespace


void
append_sanitized_message(std::string_view raw, std::string* out)
{
    if (!out) {
        return;
    }

    const bool absolute_prefix = starts_with_absolute_path(raw);
    out->reserve(out->size() + raw.size()
                 + (absolute_prefix ? kFileErrorPrefix.size() : 0U));
    if (absolute_prefix) {
        out->append(kFileErrorPrefix.data(), kFileErrorPrefix.size());
    }

    size_t i = 0;
    while (i < raw.size()) {
        if (is_space(raw[i])) {
            out->push_back(raw[i]);
            ++i;
            continue;
        }

        size_t end      = i;
        size_t last_sep = std::string_view::npos;
        while (end < raw.size() && !is_space(raw[end])) {
            if (is_separator(raw[end])) {
                last_sep = end;
            }
            ++end;
        }

        const std::string_view token = raw.substr(i, end - i);
        if (last_sep == std::string_view::npos) {
            out->append(token.data(), token.size());
        } else {
            append_path_replacement(token, last_sep - i, out);
        }
        i = end;
    }
}


std::string
sanitize_error_message(std::string_view raw)
{
    std::string out;
    append_sanitized_message(raw, &out);
    return out;
}


std::string_view
display_file_name(std::string_view path) noexcept
{
    while (!path.empty() && is_separator(path.back())) {
        path.remove_suffix(1);
    }
    const size_t sep = path.find_last_of("/\\");
    if (sep == std::string_view::npos) {
        return path;
    }
    return path.substr(sep + 1U);
}

}  // namespace metascrub
