#include "boxmeta/box_tree.h"

#include <limits>
#include <utility>

namespace boxmeta {
namespace {

    static constexpr uint32_t kBoxHeaderBytes      = 8;
    static constexpr uint32_t kLargeBoxHeaderBytes = 16;
    static constexpr uint32_t kExtendedTypeBytes   = 16;
    static constexpr uint32_t kFullBoxHeaderBytes  = 4;

    static ReadResult skip_to(ReaderCursor& cursor, uint64_t end) noexcept
    {
        const uint64_t pos = cursor.absolute_position();
        if (end <= pos) {
            return ReadResult {};
        }
        const uint64_t delta = end - pos;
        if (delta
            > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            return make_bounds_violation(static_cast<int64_t>(pos), delta, -1);
        }
        return cursor.skip(static_cast<int64_t>(delta));
    }

}  // namespace

uint64_t
BoxExtent::end() const noexcept
{
    return start + length;
}


uint64_t
BoxExtent::payload_start() const noexcept
{
    return start + header_size;
}


uint64_t
BoxExtent::payload_length() const noexcept
{
    if (open_ended || length < header_size) {
        return 0;
    }
    return length - header_size;
}


bool
BoxExtent::done_reading(ReaderCursor& cursor) const noexcept
{
    if (open_ended) {
        ByteSource* source = cursor.source();
        if (!source) {
            return true;
        }
        const ReadResult r
            = source->ensure_available(cursor.absolute_position(), 1U);
        return r.status == ReadStatus::OutOfBounds;
    }
    return cursor.absolute_position() >= end();
}


uint64_t
BoxExtent::remaining(const ReaderCursor& cursor) const noexcept
{
    const uint64_t pos = cursor.absolute_position();
    if (open_ended) {
        const uint64_t len = cursor.length();
        return (len > cursor.position()) ? len - cursor.position() : 0U;
    }
    return (end() > pos) ? end() - pos : 0U;
}


BoxDecodeStatus
box_status_from_read(const ReadResult& read, const ReaderCursor& view) noexcept
{
    switch (read.status) {
    case ReadStatus::Ok: return BoxDecodeStatus::Ok;
    case ReadStatus::IoError: return BoxDecodeStatus::IoError;
    case ReadStatus::LimitExceeded: return BoxDecodeStatus::LimitExceeded;
    case ReadStatus::OutOfBounds: break;
    }
    if (!view.has_length()) {
        return BoxDecodeStatus::Truncated;
    }
    // The view bound was hit (declared size too small) unless the data
    // itself ended first.
    const int64_t view_last = static_cast<int64_t>(view.start() + view.length())
                              - 1;
    return (read.max_index >= view_last) ? BoxDecodeStatus::Malformed
                                         : BoxDecodeStatus::Truncated;
}


void
BoxParserRegistry::add(uint32_t type, std::unique_ptr<BoxParser> parser)
{
    parsers_[type] = std::move(parser);
}


const BoxParser*
BoxParserRegistry::find(uint32_t type) const noexcept
{
    const auto it = parsers_.find(type);
    if (it == parsers_.end()) {
        return nullptr;
    }
    return it->second.get();
}


size_t
BoxParserRegistry::size() const noexcept
{
    return parsers_.size();
}


BoxDecoder::BoxDecoder(const BoxParserRegistry& registry,
                       const BoxDecodeOptions& options, BoxTree* tree) noexcept
    : registry_(&registry)
    , options_(options)
    , tree_(tree)
{
}


const BoxDecodeResult&
BoxDecoder::result() const noexcept
{
    return result_;
}


uint32_t
BoxDecoder::depth() const noexcept
{
    return depth_;
}


void
BoxDecoder::add_issue(uint64_t offset, uint32_t type, BoxDecodeStatus status,
                      const ReadResult& read, bool kept) noexcept
{
    BoxIssue issue;
    issue.offset = offset;
    issue.type   = type;
    issue.depth  = depth_;
    issue.status = status;
    issue.read   = read;
    issue.kept   = kept;
    tree_->issues.push_back(issue);

    result_.boxes_failed += 1U;
    if (result_.status == BoxDecodeStatus::Ok) {
        result_.status = status;
    }
}


BoxDecoder::Step
BoxDecoder::fail_header(uint64_t offset, uint32_t type, const ReadResult& read,
                        const ReaderCursor& view) noexcept
{
    Step step;
    step.status = box_status_from_read(read, view);
    add_issue(offset, type, step.status, read, false);
    return step;
}


void
BoxDecoder::retain_payload(Box* box) noexcept
{
    const uint64_t len = box->payload.length();
    const uint64_t cap = options_.limits.max_retained_payload_bytes;
    if (cap != 0U
        && (len > cap || tree_->arena.size() > cap - len)) {
        return;
    }

    ReaderCursor reader = box->payload;
    std::vector<std::byte> bytes;
    if (reader.read_bytes_at(0, len, &bytes).status != ReadStatus::Ok) {
        // The skip past the box reports the truncation.
        return;
    }
    ByteSpan span;
    if (tree_->arena.try_append(bytes, cap, &span)) {
        box->has_retained_payload = true;
        box->retained_payload     = span;
        result_.retained_bytes    = tree_->arena.size();
    }
}


BoxDecoder::Step
BoxDecoder::decode_box(ReaderCursor& cursor, const BoxExtent& parent,
                       const BoxParser* forced_parser, Box* out) noexcept
{
    Step step;
    const uint64_t offset = cursor.absolute_position();

    if (boxes_seen_ >= options_.limits.max_boxes) {
        stopped_    = true;
        step.status = BoxDecodeStatus::LimitExceeded;
        add_issue(offset, 0, step.status, ReadResult {}, false);
        return step;
    }
    boxes_seen_ += 1U;

    if (!parent.open_ended && parent.remaining(cursor) < kBoxHeaderBytes) {
        step.status = BoxDecodeStatus::Malformed;
        add_issue(offset, 0, step.status, ReadResult {}, false);
        return step;
    }

    uint32_t size32 = 0;
    uint32_t type   = 0;
    ReadResult r    = cursor.read_u32(&size32);
    if (r.status == ReadStatus::Ok) {
        r = cursor.read_u32(&type);
    }
    if (r.status != ReadStatus::Ok) {
        return fail_header(offset, 0, r, cursor);
    }

    uint32_t header_size = kBoxHeaderBytes;
    uint64_t length      = size32;
    bool open_ended      = false;
    if (size32 == 1U) {
        if (!parent.open_ended && parent.remaining(cursor) < 8U) {
            step.status = BoxDecodeStatus::Malformed;
            add_issue(offset, type, step.status, ReadResult {}, false);
            return step;
        }
        uint64_t large = 0;
        r              = cursor.read_u64(&large);
        if (r.status != ReadStatus::Ok) {
            return fail_header(offset, type, r, cursor);
        }
        header_size = kLargeBoxHeaderBytes;
        length      = large;
        if (length < kLargeBoxHeaderBytes) {
            step.status = BoxDecodeStatus::Malformed;
            add_issue(offset, type, step.status, ReadResult {}, false);
            return step;
        }
    } else if (size32 == 0U) {
        if (parent.open_ended) {
            open_ended = true;
            length     = 0;
        } else {
            length = parent.end() - offset;
        }
    } else if (size32 < kBoxHeaderBytes) {
        step.status = BoxDecodeStatus::Malformed;
        add_issue(offset, type, step.status, ReadResult {}, false);
        return step;
    }

    if (!open_ended && !parent.open_ended && length > parent.end() - offset) {
        step.status = BoxDecodeStatus::Malformed;
        add_issue(offset, type, step.status, ReadResult {}, false);
        return step;
    }

    const BoxParser* parser = forced_parser ? forced_parser
                                            : registry_->find(type);
    const bool full_box     = parser && parser->is_full_box();
    uint64_t needed         = header_size;
    if (type == kUuidBoxType) {
        needed += kExtendedTypeBytes;
    }
    if (full_box) {
        needed += kFullBoxHeaderBytes;
    }

    // From here on the extent is known; a bad box can be stepped over.
    if (!open_ended && needed > length) {
        step.status = BoxDecodeStatus::Malformed;
        add_issue(offset, type, step.status, ReadResult {}, false);
        step.can_continue = skip_to(cursor, offset + length).status
                            == ReadStatus::Ok;
        return step;
    }

    out->type               = type;
    out->extent.start       = offset;
    out->extent.length      = length;
    out->extent.open_ended  = open_ended;
    out->extent.is_full_box = full_box;

    if (type == kUuidBoxType) {
        r = cursor.read(std::span<std::byte>(out->extended_type));
        if (r.status != ReadStatus::Ok) {
            return fail_header(offset, type, r, cursor);
        }
        out->has_extended_type = true;
        header_size += kExtendedTypeBytes;
    }
    if (full_box) {
        uint8_t version = 0;
        uint32_t flags  = 0;
        r               = cursor.read_u8(&version);
        if (r.status == ReadStatus::Ok) {
            r = cursor.read_u24(&flags);
        }
        if (r.status != ReadStatus::Ok) {
            return fail_header(offset, type, r, cursor);
        }
        out->extent.version = version;
        out->extent.flags   = flags;
        header_size += kFullBoxHeaderBytes;
    }
    out->extent.header_size = header_size;

    if (depth_ >= options_.limits.max_depth) {
        step.status = BoxDecodeStatus::LimitExceeded;
        add_issue(offset, type, step.status, ReadResult {}, false);
        step.can_continue = !open_ended
                            && skip_to(cursor, offset + length).status
                                   == ReadStatus::Ok;
        return step;
    }
    if (depth_ > result_.deepest_level) {
        result_.deepest_level = depth_;
    }

    if (open_ended) {
        r = cursor.clone_to_end(0, false, &out->payload);
    } else {
        r = cursor.clone(0, length - header_size, false, &out->payload);
    }
    if (r.status != ReadStatus::Ok) {
        return fail_header(offset, type, r, cursor);
    }

    out->kind                  = parser ? parser->kind() : BoxKind::Opaque;
    const size_t issues_before = tree_->issues.size();
    BoxDecodeStatus status     = BoxDecodeStatus::Ok;
    if (parser) {
        ReaderCursor work = out->payload;
        depth_ += 1U;
        status = parser->parse(*this, work, out);
        depth_ -= 1U;
    } else if (options_.retain_opaque_payloads && !open_ended) {
        retain_payload(out);
    }
    out->status = status;
    if (status != BoxDecodeStatus::Ok && tree_->issues.size() == issues_before) {
        add_issue(offset, type, status, ReadResult {}, true);
    }

    step.status = status;
    step.keep   = true;
    if (open_ended) {
        // Runs to the end of the data; nothing can follow it.
        return step;
    }

    r = skip_to(cursor, offset + length);
    if (r.status != ReadStatus::Ok) {
        const BoxDecodeStatus skip_status = box_status_from_read(r, cursor);
        if (status == BoxDecodeStatus::Ok) {
            out->status = skip_status;
            step.status = skip_status;
            add_issue(offset, type, skip_status, r, true);
        }
        return step;
    }
    step.can_continue = !stopped_;
    return step;
}


BoxDecodeStatus
BoxDecoder::decode_children(ReaderCursor& cursor, const BoxExtent& extent,
                            std::vector<Box>* out,
                            const BoxParser* forced_parser,
                            bool stop_on_failure) noexcept
{
    while (!stopped_ && !extent.done_reading(cursor)) {
        const size_t issues_before = tree_->issues.size();
        Box box;
        const Step step = decode_box(cursor, extent, forced_parser, &box);

        const bool clean = step.status == BoxDecodeStatus::Ok;
        if (step.keep && (clean || !stop_on_failure)) {
            out->push_back(std::move(box));
            result_.boxes_decoded += 1U;
        } else if (step.keep) {
            for (size_t i = issues_before; i < tree_->issues.size(); ++i) {
                if (tree_->issues[i].offset == box.extent.start) {
                    tree_->issues[i].kept = false;
                }
            }
        }

        if (!clean && stop_on_failure) {
            return step.status;
        }
        if (!step.can_continue) {
            return step.status;
        }
    }
    return stopped_ ? BoxDecodeStatus::LimitExceeded : BoxDecodeStatus::Ok;
}


BoxDecodeResult
decode_box_tree(ReaderCursor& cursor, const BoxParserRegistry& registry,
                BoxTree* out, const BoxDecodeOptions& options) noexcept
{
    out->boxes.clear();
    out->issues.clear();
    out->arena.clear();

    const bool caller_big_endian = cursor.is_big_endian();
    cursor.set_big_endian(true);
    BoxExtent root;
    root.start = cursor.absolute_position();
    if (cursor.has_length()) {
        root.length = (cursor.length() > cursor.position())
                          ? cursor.length() - cursor.position()
                          : 0U;
    } else {
        root.open_ended = true;
    }

    BoxDecoder decoder(registry, options, out);
    (void)decoder.decode_children(cursor, root, &out->boxes);
    cursor.set_big_endian(caller_big_endian);
    return decoder.result();
}


BoxDecodeResult
decode_box_tree(ByteSource& source, const BoxParserRegistry& registry,
                BoxTree* out, const BoxDecodeOptions& options) noexcept
{
    if (source.length_known()) {
        ReaderCursor root(source, 0, source.length());
        return decode_box_tree(root, registry, out, options);
    }
    ReaderCursor root(source);
    return decode_box_tree(root, registry, out, options);
}


const Box*
find_child(const Box& box, uint32_t type) noexcept
{
    return find_box(box.children, type);
}


const Box*
find_box(const std::vector<Box>& boxes, uint32_t type) noexcept
{
    for (size_t i = 0; i < boxes.size(); ++i) {
        if (boxes[i].type == type) {
            return &boxes[i];
        }
    }
    return nullptr;
}


const char*
box_decode_status_name(BoxDecodeStatus status) noexcept
{
    switch (status) {
    case BoxDecodeStatus::Ok: return "ok";
    case BoxDecodeStatus::Malformed: return "malformed";
    case BoxDecodeStatus::Truncated: return "truncated";
    case BoxDecodeStatus::LimitExceeded: return "limit_exceeded";
    case BoxDecodeStatus::IoError: return "io_error";
    }
    return "unknown";
}


const char*
box_kind_name(BoxKind kind) noexcept
{
    switch (kind) {
    case BoxKind::Opaque: return "opaque";
    case BoxKind::Container: return "container";
    case BoxKind::FileType: return "file_type";
    case BoxKind::Handler: return "handler";
    case BoxKind::PrimaryItem: return "primary_item";
    case BoxKind::ImageSpatialExtent: return "image_spatial_extent";
    case BoxKind::ImageRotation: return "image_rotation";
    case BoxKind::ItemReference: return "item_reference";
    case BoxKind::ItemTypeReference: return "item_type_reference";
    }
    return "unknown";
}

}  // namespace boxmeta
