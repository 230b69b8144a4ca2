#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

/**
 * \file format_signature.h
 * \brief Compiled-in magic number signatures for supported image formats.
 */

namespace metascrub {

/// Image formats recognized by the signature table.
enum class ImageFormat : uint8_t {
    Unknown,
    Jpeg,
    Png,
    Webp,
    /// TIFF, Intel byte order (`II*\0`).
    TiffLe,
    /// TIFF, Motorola byte order (`MM\0*`).
    TiffBe,
    /// HEIF/HEIC (ISO-BMFF `ftyp` box with a HEIF brand).
    Heif,
};

/// One fixed byte pattern at a fixed file offset.
struct SignaturePart final {
    uint32_t offset = 0;
    std::span<const std::byte> bytes;
};

/**
 * \brief Immutable magic number signature of one format variant.
 *
 * A header matches when every entry of \ref parts matches. When \ref brands
 * is non-empty, the FourCC at \ref brand_offset must additionally be one of
 * the listed tokens (ISO-BMFF major brand).
 */
struct FormatSignature final {
    ImageFormat format = ImageFormat::Unknown;
    std::span<const SignaturePart> parts;
    uint32_t brand_offset = 0;
    std::span<const uint32_t> brands;
};

/**
 * \brief Number of header bytes a probe reads.
 *
 * Every signature part and brand field ends at or before this offset; the
 * table definition enforces it at compile time.
 */
inline constexpr uint32_t kMagicProbeBytes = 12;

/// Packs four ASCII characters into a big-endian FourCC integer.
static constexpr uint32_t
fourcc(char a, char b, char c, char d) noexcept
{
    return (static_cast<uint32_t>(static_cast<uint8_t>(a)) << 24)
           | (static_cast<uint32_t>(static_cast<uint8_t>(b)) << 16)
           | (static_cast<uint32_t>(static_cast<uint8_t>(c)) << 8)
           | (static_cast<uint32_t>(static_cast<uint8_t>(d)) << 0);
}

/**
 * \brief Returns the candidate signatures for a claimed file extension.
 *
 * \p extension is compared ASCII case-insensitively; one leading dot is
 * ignored. An unknown extension returns an empty span. Several candidates
 * are returned where one extension legitimately covers several variants
 * (TIFF byte orders).
 */
std::span<const FormatSignature>
lookup_signatures(std::string_view extension) noexcept;

/// Returns every signature in the table (in table order).
std::span<const FormatSignature>
all_signatures() noexcept;

/// Number of leading header bytes \p sig needs to be decided.
uint32_t
required_probe_bytes(const FormatSignature& sig) noexcept;

/**
 * \brief Checks \p header against one signature.
 *
 * \p brand_recognized (optional) receives whether the brand field (if the
 * signature has one) is whitelisted; it is only meaningful when all
 * \ref FormatSignature::parts matched.
 */
bool
signature_matches(const FormatSignature& sig,
                  std::span<const std::byte> header,
                  bool* brand_recognized = nullptr) noexcept;

/**
 * \brief Detects the format of \p header regardless of extension.
 *
 * Returns the first table entry that fully matches, or
 * \ref ImageFormat::Unknown.
 */
ImageFormat
sniff_image_format(std::span<const std::byte> header) noexcept;

/**
 * \brief Extracts the extension of the last component of \p path.
 *
 * The result is lower-cased without the dot, and empty for names without
 * an extension (including dot-files such as `.profile`).
 */
std::string
extension_from_path(std::string_view path);

/// Stable lower-case identifier (for tools, tests and bindings).
std::string_view
image_format_name(ImageFormat format) noexcept;

/// User-facing family name (`JPEG`, `TIFF`, ...).
std::string_view
format_family_name(ImageFormat format) noexcept;

}  // namespace metascrub
