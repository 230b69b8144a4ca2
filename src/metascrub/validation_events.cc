#include "metascrub/validation_events.h"

#include "metascrub/console_format.h"

namespace metascrub {

void
emit_event(EventSink* sink, const ValidationEvent& event) noexcept
{
    if (!sink) {
        return;
    }
    if (sink->written < sink->out.size()) {
        sink->out[sink->written] = event;
        sink->written += 1;
    }
    sink->needed += 1;
}


std::string_view
validation_event_kind_name(ValidationEventKind kind) noexcept
{
    switch (kind) {
    case ValidationEventKind::TraversalRejected: return "traversal_rejected";
    case ValidationEventKind::SymlinkRejected: return "symlink_rejected";
    case ValidationEventKind::SymlinkFollowed: return "symlink_followed";
    case ValidationEventKind::SymlinkDepthExceeded:
        return "symlink_depth_exceeded";
    case ValidationEventKind::UnrecognizedBrand: return "unrecognized_brand";
    case ValidationEventKind::ContentMismatch: return "content_mismatch";
    case ValidationEventKind::TruncatedHeader: return "truncated_header";
    }
    return "unknown";
}


void
format_validation_event(const ValidationEvent& event, std::string* out)
{
    if (!out) {
        return;
    }

    out->append(validation_event_kind_name(event.kind));
    if (event.claimed != ImageFormat::Unknown) {
        out->append(" claimed=");
        out->append(image_format_name(event.claimed));
    }
    if (event.sniffed != ImageFormat::Unknown) {
        out->append(" sniffed=");
        out->append(image_format_name(event.sniffed));
    }
    if (event.kind == ValidationEventKind::UnrecognizedBrand) {
        out->append(" brand=");
        append_fourcc(event.brand, out);
    }
    if (event.symlink_depth != 0U) {
        out->append(" depth=");
        out->append(std::to_string(event.symlink_depth));
    }
    if (event.header_size != 0U) {
        out->append(" header=");
        append_hex_bytes(std::span<const std::byte>(event.header.data(),
                                                    event.header_size),
                         0U, out);
    }
}

}  // namespace metascrub
