#include "metascrub/magic_validator.h"

#include "metascrub/probe_file.h"

#include <cstring>

namespace metascrub {
namespace {

    static uint32_t read_brand(std::span<const std::byte> header,
                               uint32_t offset) noexcept
    {
        if (offset + 4U > header.size()) {
            return 0;
        }
        return (static_cast<uint32_t>(header[offset + 0]) << 24)
               | (static_cast<uint32_t>(header[offset + 1]) << 16)
               | (static_cast<uint32_t>(header[offset + 2]) << 8)
               | (static_cast<uint32_t>(header[offset + 3]) << 0);
    }


    // True when the container parts of a branded signature match but the
    // brand itself is not whitelisted.
    static bool container_without_known_brand(
        const FormatSignature& sig, std::span<const std::byte> header) noexcept
    {
        if (sig.brands.empty()) {
            return false;
        }
        FormatSignature container = sig;
        container.brands          = {};
        return signature_matches(container, header)
               && !signature_matches(sig, header);
    }


    static ValidationEvent make_content_event(ValidationEventKind kind,
                                              const MagicCheckResult& r) noexcept
    {
        ValidationEvent e;
        e.kind        = kind;
        e.claimed     = r.claimed;
        e.sniffed     = r.sniffed;
        e.header_size = r.header_size;
        e.header      = r.header;
        return e;
    }

}  // namespace


MagicCheckResult
check_magic(std::span<const std::byte> header, std::string_view extension,
            EventSink* events) noexcept
{
    MagicCheckResult res;

    const std::span<const FormatSignature> candidates = lookup_signatures(
        extension);
    if (candidates.empty()) {
        res.status = MagicStatus::UnknownExtension;
        return res;
    }

    if (header.size() > kMagicProbeBytes) {
        header = header.first(kMagicProbeBytes);
    }
    res.claimed     = candidates.front().format;
    res.header_size = static_cast<uint32_t>(header.size());
    if (!header.empty()) {
        std::memcpy(res.header.data(), header.data(), header.size());
    }

    bool any_decidable = false;
    uint32_t bad_brand = 0;
    for (const FormatSignature& sig : candidates) {
        if (header.size() < required_probe_bytes(sig)) {
            continue;
        }
        any_decidable = true;
        if (signature_matches(sig, header)) {
            res.status = MagicStatus::Match;
            res.format = sig.format;
            return res;
        }
        if (container_without_known_brand(sig, header)) {
            res.unrecognized_brand = true;
            bad_brand              = read_brand(header, sig.brand_offset);
        }
    }

    res.sniffed = sniff_image_format(header);
    if (!any_decidable) {
        res.status = MagicStatus::Truncated;
        emit_event(events, make_content_event(
                               ValidationEventKind::TruncatedHeader, res));
        return res;
    }

    res.status = MagicStatus::Mismatch;
    if (res.unrecognized_brand) {
        // Unknown brands fail closed until they are added to the table.
        ValidationEvent e = make_content_event(
            ValidationEventKind::UnrecognizedBrand, res);
        e.brand = bad_brand;
        emit_event(events, e);
    } else {
        emit_event(events, make_content_event(
                               ValidationEventKind::ContentMismatch, res));
    }
    return res;
}


MagicCheckResult
validate_magic(const char* path, std::string_view extension,
               EventSink* events) noexcept
{
    MagicCheckResult res;
    const std::span<const FormatSignature> candidates = lookup_signatures(
        extension);
    if (candidates.empty()) {
        res.status = MagicStatus::UnknownExtension;
        return res;
    }

    ProbeFile file;
    const ProbeFileStatus open_status = file.open(path);
    if (open_status != ProbeFileStatus::Ok) {
        res.status    = MagicStatus::OpenFailed;
        res.claimed   = candidates.front().format;
        res.sys_error = file.last_error();
        return res;
    }

    std::array<std::byte, kMagicProbeBytes> buf {};
    uint32_t got = 0;
    if (file.read_prefix(buf, &got) != ProbeFileStatus::Ok) {
        res.status    = MagicStatus::ReadFailed;
        res.claimed   = candidates.front().format;
        res.sys_error = file.last_error();
        return res;
    }
    file.close();

    return check_magic(std::span<const std::byte>(buf.data(), got), extension,
                       events);
}


bool
is_io_failure(MagicStatus status) noexcept
{
    return status == MagicStatus::OpenFailed
           || status == MagicStatus::ReadFailed;
}


std::string_view
magic_status_name(MagicStatus status) noexcept
{
    switch (status) {
    case MagicStatus::Match: return "match";
    case MagicStatus::Mismatch: return "mismatch";
    case MagicStatus::Truncated: return "truncated";
    case MagicStatus::UnknownExtension: return "unknown_extension";
    case MagicStatus::OpenFailed: return "open_failed";
    case MagicStatus::ReadFailed: return "read_failed";
    }
    return "unknown";
}

}  // namespace metascrub
