#include "metascrub/format_signature.h"

#include <array>
#include <cstring>

namespace metascrub {
namespace {

    static constexpr std::array<std::byte, 3> kJpegSoi = {
        std::byte { 0xFF },
        std::byte { 0xD8 },
        std::byte { 0xFF },
    };

    static constexpr std::array<std::byte, 8> kPngSignature = {
        std::byte { 0x89 }, std::byte { 0x50 }, std::byte { 0x4E },
        std::byte { 0x47 }, std::byte { 0x0D }, std::byte { 0x0A },
        std::byte { 0x1A }, std::byte { 0x0A },
    };

    static constexpr std::array<std::byte, 4> kRiffTag = {
        std::byte { 'R' },
        std::byte { 'I' },
        std::byte { 'F' },
        std::byte { 'F' },
    };

    static constexpr std::array<std::byte, 4> kWebpTag = {
        std::byte { 'W' },
        std::byte { 'E' },
        std::byte { 'B' },
        std::byte { 'P' },
    };

    static constexpr std::array<std::byte, 4> kTiffLeHeader = {
        std::byte { 0x49 },
        std::byte { 0x49 },
        std::byte { 0x2A },
        std::byte { 0x00 },
    };

    static constexpr std::array<std::byte, 4> kTiffBeHeader = {
        std::byte { 0x4D },
        std::byte { 0x4D },
        std::byte { 0x00 },
        std::byte { 0x2A },
    };

    // Bytes 0..3 of an ISO-BMFF file are the `ftyp` box size.
    static constexpr std::array<std::byte, 4> kFtypTag = {
        std::byte { 'f' },
        std::byte { 't' },
        std::byte { 'y' },
        std::byte { 'p' },
    };

    static constexpr std::array<uint32_t, 6> kHeifBrands = {
        fourcc('h', 'e', 'i', 'c'), fourcc('h', 'e', 'i', 'x'),
        fourcc('h', 'e', 'v', 'c'), fourcc('h', 'e', 'v', 'x'),
        fourcc('m', 'i', 'f', '1'), fourcc('m', 's', 'f', '1'),
    };

    static constexpr std::array<SignaturePart, 1> kJpegParts = {
        SignaturePart { 0U, kJpegSoi },
    };
    static constexpr std::array<SignaturePart, 1> kPngParts = {
        SignaturePart { 0U, kPngSignature },
    };
    // A RIFF container alone is not enough: AVI/WAV share the outer tag.
    static constexpr std::array<SignaturePart, 2> kWebpParts = {
        SignaturePart { 0U, kRiffTag },
        SignaturePart { 8U, kWebpTag },
    };
    static constexpr std::array<SignaturePart, 1> kTiffLeParts = {
        SignaturePart { 0U, kTiffLeHeader },
    };
    static constexpr std::array<SignaturePart, 1> kTiffBeParts = {
        SignaturePart { 0U, kTiffBeHeader },
    };
    static constexpr std::array<SignaturePart, 1> kHeifParts = {
        SignaturePart { 4U, kFtypTag },
    };

    // Entries sharing an extension must stay adjacent (see kExtensions).
    static constexpr std::array<FormatSignature, 6> kSignatures = {
        FormatSignature { ImageFormat::Jpeg, kJpegParts, 0U, {} },
        FormatSignature { ImageFormat::Png, kPngParts, 0U, {} },
        FormatSignature { ImageFormat::Webp, kWebpParts, 0U, {} },
        FormatSignature { ImageFormat::TiffLe, kTiffLeParts, 0U, {} },
        FormatSignature { ImageFormat::TiffBe, kTiffBeParts, 0U, {} },
        FormatSignature { ImageFormat::Heif, kHeifParts, 8U, kHeifBrands },
    };

    struct ExtensionEntry final {
        std::string_view extension;
        uint32_t first = 0;
        uint32_t count = 0;
    };

    static constexpr std::array<ExtensionEntry, 8> kExtensions = {
        ExtensionEntry { "jpg", 0U, 1U },  ExtensionEntry { "jpeg", 0U, 1U },
        ExtensionEntry { "png", 1U, 1U },  ExtensionEntry { "webp", 2U, 1U },
        ExtensionEntry { "tif", 3U, 2U },  ExtensionEntry { "tiff", 3U, 2U },
        ExtensionEntry { "heif", 5U, 1U }, ExtensionEntry { "heic", 5U, 1U },
    };

    static constexpr uint32_t kMaxExtensionChars = 8;

    static constexpr uint32_t signature_end(const FormatSignature& sig) noexcept
    {
        uint32_t end = 0;
        for (const SignaturePart& part : sig.parts) {
            const uint32_t part_end = part.offset
                                      + static_cast<uint32_t>(
                                          part.bytes.size());
            if (part_end > end) {
                end = part_end;
            }
        }
        if (!sig.brands.empty() && sig.brand_offset + 4U > end) {
            end = sig.brand_offset + 4U;
        }
        return end;
    }

    static constexpr bool table_fits_probe() noexcept
    {
        for (const FormatSignature& sig : kSignatures) {
            if (sig.parts.empty()) {
                return false;
            }
            if (signature_end(sig) > kMagicProbeBytes) {
                return false;
            }
        }
        for (const ExtensionEntry& e : kExtensions) {
            if (e.count == 0U || e.first + e.count > kSignatures.size()) {
                return false;
            }
            if (e.extension.size() > kMaxExtensionChars) {
                return false;
            }
        }
        return true;
    }

    static_assert(table_fits_probe(),
                  "signature table exceeds kMagicProbeBytes or is malformed");

    static constexpr char ascii_lower(char c) noexcept
    {
        if (c >= 'A' && c <= 'Z') {
            return static_cast<char>(c - 'A' + 'a');
        }
        return c;
    }


    static bool read_u32be(std::span<const std::byte> bytes, uint64_t offset,
                           uint32_t* out) noexcept
    {
        if (offset + 4 > bytes.size()) {
            return false;
        }
        const uint32_t v
            = (static_cast<uint32_t>(bytes[offset + 0]) << 24)
              | (static_cast<uint32_t>(bytes[offset + 1]) << 16)
              | (static_cast<uint32_t>(bytes[offset + 2]) << 8)
              | (static_cast<uint32_t>(bytes[offset + 3]) << 0);
        *out = v;
        return true;
    }

}  // namespace


std::span<const FormatSignature>
lookup_signatures(std::string_view extension) noexcept
{
    if (!extension.empty() && extension.front() == '.') {
        extension.remove_prefix(1);
    }
    if (extension.empty() || extension.size() > kMaxExtensionChars) {
        return {};
    }

    char lower_buf[kMaxExtensionChars];
    for (size_t i = 0; i < extension.size(); ++i) {
        lower_buf[i] = ascii_lower(extension[i]);
    }
    const std::string_view lower(lower_buf, extension.size());

    for (const ExtensionEntry& e : kExtensions) {
        if (e.extension == lower) {
            return std::span<const FormatSignature>(kSignatures)
                .subspan(e.first, e.count);
        }
    }
    return {};
}


std::span<const FormatSignature>
all_signatures() noexcept
{
    return kSignatures;
}


uint32_t
required_probe_bytes(const FormatSignature& sig) noexcept
{
    return signature_end(sig);
}


bool
signature_matches(const FormatSignature& sig,
                  std::span<const std::byte> header,
                  bool* brand_recognized) noexcept
{
    if (brand_recognized) {
        *brand_recognized = false;
    }
    if (header.size() < required_probe_bytes(sig)) {
        return false;
    }

    for (const SignaturePart& part : sig.parts) {
        if (std::memcmp(header.data() + part.offset, part.bytes.data(),
                        part.bytes.size())
            != 0) {
            return false;
        }
    }

    if (sig.brands.empty()) {
        return true;
    }

    uint32_t brand = 0;
    if (!read_u32be(header, sig.brand_offset, &brand)) {
        return false;
    }
    for (uint32_t known : sig.brands) {
        if (brand == known) {
            if (brand_recognized) {
                *brand_recognized = true;
            }
            return true;
        }
    }
    return false;
}


ImageFormat
sniff_image_format(std::span<const std::byte> header) noexcept
{
    for (const FormatSignature& sig : kSignatures) {
        if (signature_matches(sig, header)) {
            return sig.format;
        }
    }
    return ImageFormat::Unknown;
}


std::string
extension_from_path(std::string_view path)
{
    const size_t sep = path.find_last_of("/\\");
    const std::string_view name = (sep == std::string_view::npos)
                                      ? path
                                      : path.substr(sep + 1);

    const size_t dot = name.rfind('.');
    if (dot == std::string_view::npos || dot == 0U
        || dot + 1U == name.size()) {
        return std::string();
    }

    std::string out;
    out.reserve(name.size() - dot - 1U);
    for (size_t i = dot + 1U; i < name.size(); ++i) {
        out.push_back(ascii_lower(name[i]));
    }
    return out;
}


std::string_view
image_format_name(ImageFormat format) noexcept
{
    switch (format) {
    case ImageFormat::Unknown: return "unknown";
    case ImageFormat::Jpeg: return "jpeg";
    case ImageFormat::Png: return "png";
    case ImageFormat::Webp: return "webp";
    case ImageFormat::TiffLe: return "tiff_le";
    case ImageFormat::TiffBe: return "tiff_be";
    case ImageFormat::Heif: return "heif";
    }
    return "unknown";
}


std::string_view
format_family_name(ImageFormat format) noexcept
{
    switch (format) {
    case ImageFormat::Unknown: return "unknown";
    case ImageFormat::Jpeg: return "JPEG";
    case ImageFormat::Png: return "PNG";
    case ImageFormat::Webp: return "WebP";
    case ImageFormat::TiffLe:
    case ImageFormat::TiffBe: return "TIFF";
    case ImageFormat::Heif: return "HEIF";
    }
    return "unknown";
}

}  // namespace metascrub
