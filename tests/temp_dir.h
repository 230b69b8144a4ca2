#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#if !defined(_WIN32)
#    include <unistd.h>
#endif

namespace metascrub {

/// Scratch directory removed when the test finishes.
class TempDir final {
public:
    TempDir()
    {
        const std::filesystem::path base
            = std::filesystem::temp_directory_path();
#if defined(_WIN32)
        path_ = base / ("metascrub_test_" + std::to_string(std::rand()));
        std::filesystem::create_directories(path_);
#else
        std::string templ = (base / "metascrub_test_XXXXXX").string();
        if (::mkdtemp(templ.data())) {
            path_ = templ;
        }
#endif
        // realpath of the scratch root, so results can be compared exactly.
        std::error_code ec;
        const std::filesystem::path canonical
            = std::filesystem::canonical(path_, ec);
        if (!ec) {
            path_ = canonical;
        }
    }

    ~TempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&)            = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const noexcept { return path_; }

    std::string file(std::string_view name) const
    {
        return (path_ / std::filesystem::path(name)).string();
    }

    std::string write(std::string_view name,
                      const std::vector<std::byte>& bytes) const
    {
        const std::string p = file(name);
        std::ofstream out(p, std::ios::binary | std::ios::trunc);
        out.write(reinterpret_cast<const char*>(bytes.data()),
                  static_cast<std::streamsize>(bytes.size()));
        return p;
    }

    /// Creates a sparse file of \p size bytes that starts with \p prefix.
    std::string write_sized(std::string_view name,
                            const std::vector<std::byte>& prefix,
                            uint64_t size) const
    {
        const std::string p = write(name, prefix);
        std::filesystem::resize_file(p, size);
        return p;
    }

    std::string mkdir(std::string_view name) const
    {
        const std::string p = file(name);
        std::filesystem::create_directories(p);
        return p;
    }

    /// Creates `name -> target` where \p target is stored verbatim.
    std::string symlink(std::string_view target, std::string_view name) const
    {
        const std::string p = file(name);
        std::filesystem::create_symlink(std::filesystem::path(target), p);
        return p;
    }

private:
    std::filesystem::path path_;
};


inline std::vector<std::byte>
bytes_of(std::initializer_list<uint8_t> values)
{
    std::vector<std::byte> out;
    out.reserve(values.size());
    for (uint8_t v : values) {
        out.push_back(std::byte { v });
    }
    return out;
}


inline void
append_ascii(std::vector<std::byte>* out, std::string_view s)
{
    for (char c : s) {
        out->push_back(std::byte { static_cast<uint8_t>(c) });
    }
}


/// Minimal JPEG header: SOI followed by an APP0 marker.
inline std::vector<std::byte>
jpeg_header()
{
    std::vector<std::byte> out = bytes_of(
        { 0xFF, 0xD8, 0xFF, 0xE0, 0x00, 0x10 });
    append_ascii(&out, "JFIF");
    out.push_back(std::byte { 0x00 });
    out.push_back(std::byte { 0x01 });
    return out;
}


inline std::vector<std::byte>
png_header()
{
    std::vector<std::byte> out = bytes_of(
        { 0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A });
    out.push_back(std::byte { 0x00 });
    out.push_back(std::byte { 0x00 });
    out.push_back(std::byte { 0x00 });
    out.push_back(std::byte { 0x0D });
    return out;
}


inline std::vector<std::byte>
webp_header()
{
    std::vector<std::byte> out;
    append_ascii(&out, "RIFF");
    out.push_back(std::byte { 0x24 });
    out.push_back(std::byte { 0x00 });
    out.push_back(std::byte { 0x00 });
    out.push_back(std::byte { 0x00 });
    append_ascii(&out, "WEBPVP8 ");
    return out;
}


inline std::vector<std::byte>
tiff_le_header()
{
    return bytes_of(
        { 0x49, 0x49, 0x2A, 0x00, 0x08, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
          0x00 });
}


inline std::vector<std::byte>
tiff_be_header()
{
    return bytes_of(
        { 0x4D, 0x4D, 0x00, 0x2A, 0x00, 0x00, 0x00, 0x08, 0x00, 0x00, 0x00,
          0x00 });
}


/// ISO-BMFF `ftyp` box start with major brand \p brand.
inline std::vector<std::byte>
heif_header(std::string_view brand)
{
    std::vector<std::byte> out = bytes_of({ 0x00, 0x00, 0x00, 0x18 });
    append_ascii(&out, "ftyp");
    append_ascii(&out, brand);
    for (int i = 0; i < 4; ++i) {
        out.push_back(std::byte { 0x00 });
    }
    append_ascii(&out, "mif1");
    return out;
}

}  // namespace metascrub
