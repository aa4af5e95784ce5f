#include "boxmeta/box_parsers.h"

#include <limits>
#include <memory>

namespace boxmeta {
namespace {

    static constexpr uint64_t kMaxU64 = std::numeric_limits<uint64_t>::max();

    static void note_brand(uint32_t brand, bool* is_heif, bool* is_avif,
                           bool* is_cr3, bool* is_mp4) noexcept
    {
        if (brand == fourcc('c', 'r', 'x', ' ')
            || brand == fourcc('C', 'R', '3', ' ')) {
            *is_cr3 = true;
        }

        if (brand == fourcc('a', 'v', 'i', 'f')
            || brand == fourcc('a', 'v', 'i', 's')) {
            *is_avif = true;
        }

        if (brand == fourcc('m', 'i', 'f', '1')
            || brand == fourcc('m', 's', 'f', '1')
            || brand == fourcc('h', 'e', 'i', 'c')
            || brand == fourcc('h', 'e', 'i', 'x')
            || brand == fourcc('h', 'e', 'v', 'c')
            || brand == fourcc('h', 'e', 'v', 'x')) {
            *is_heif = true;
        }

        switch (brand) {
        case fourcc('i', 's', 'o', 'm'):
        case fourcc('i', 's', 'o', '2'):
        case fourcc('i', 's', 'o', '4'):
        case fourcc('i', 's', 'o', '5'):
        case fourcc('i', 's', 'o', '6'):
        case fourcc('m', 'p', '4', '1'):
        case fourcc('m', 'p', '4', '2'):
        case fourcc('a', 'v', 'c', '1'):
        case fourcc('d', 'a', 's', 'h'):
        case fourcc('M', '4', 'V', ' '):
        case fourcc('M', '4', 'A', ' '): *is_mp4 = true; break;
        default: break;
        }
    }


    static BoxDecodeStatus read_item_id(ReaderCursor& payload, bool large,
                                        uint32_t* out) noexcept
    {
        ReadResult r;
        if (large) {
            r = payload.read_u32(out);
        } else {
            uint16_t id16 = 0;
            r             = payload.read_u16(&id16);
            *out          = id16;
        }
        return box_status_from_read(r, payload);
    }

}  // namespace

ContainerBoxParser::ContainerBoxParser(bool full_box) noexcept
    : full_box_(full_box)
{
}


bool
ContainerBoxParser::is_full_box() const noexcept
{
    return full_box_;
}


BoxKind
ContainerBoxParser::kind() const noexcept
{
    return BoxKind::Container;
}


BoxDecodeStatus
ContainerBoxParser::parse(BoxDecoder& decoder, ReaderCursor& payload,
                          Box* box) const noexcept
{
    return decoder.decode_children(payload, box->extent, &box->children);
}


bool
FileTypeBoxParser::is_full_box() const noexcept
{
    return false;
}


BoxKind
FileTypeBoxParser::kind() const noexcept
{
    return BoxKind::FileType;
}


BoxDecodeStatus
FileTypeBoxParser::parse(BoxDecoder& decoder, ReaderCursor& payload,
                         Box* box) const noexcept
{
    (void)decoder;
    FileTypeInfo& info = box->file_type;

    ReadResult r = payload.read_u32(&info.major_brand);
    if (r.status == ReadStatus::Ok) {
        r = payload.read_u32(&info.minor_version);
    }
    if (r.status != ReadStatus::Ok) {
        return box_status_from_read(r, payload);
    }

    // A trailing partial brand is ignored.
    while (!payload.is_near_end(4U)) {
        uint32_t brand = 0;
        r              = payload.read_u32(&brand);
        if (r.status != ReadStatus::Ok) {
            return box_status_from_read(r, payload);
        }
        info.compatible_brands.push_back(brand);
    }

    info.format = classify_bmff_brands(info.major_brand,
                                       info.compatible_brands);
    return BoxDecodeStatus::Ok;
}


bool
HandlerBoxParser::is_full_box() const noexcept
{
    return true;
}


BoxKind
HandlerBoxParser::kind() const noexcept
{
    return BoxKind::Handler;
}


BoxDecodeStatus
HandlerBoxParser::parse(BoxDecoder& decoder, ReaderCursor& payload,
                        Box* box) const noexcept
{
    (void)decoder;
    // pre_defined(32) handler_type(32) reserved(3 x 32) name
    ReadResult r = payload.skip(4);
    if (r.status == ReadStatus::Ok) {
        r = payload.read_u32(&box->handler.handler_type);
    }
    if (r.status == ReadStatus::Ok) {
        r = payload.skip(12);
    }
    if (r.status != ReadStatus::Ok) {
        return box_status_from_read(r, payload);
    }

    if (!payload.has_length()) {
        // Open-ended payload: the name runs to its terminator or the end of
        // the data, not to the end of what is buffered.
        if (payload.is_near_end(1)) {
            return BoxDecodeStatus::Ok;
        }
        r = payload.read_null_terminated_string(kMaxU64, &box->handler.name);
        if (r.status != ReadStatus::OutOfBounds) {
            return box_status_from_read(r, payload);
        }
        // The data ended first; the source length is now exact.
    }

    const uint64_t rest = payload.length() - payload.position();
    if (rest == 0U) {
        return BoxDecodeStatus::Ok;
    }
    r = payload.read_null_terminated_string(rest, &box->handler.name);
    return box_status_from_read(r, payload);
}


bool
PrimaryItemBoxParser::is_full_box() const noexcept
{
    return true;
}


BoxKind
PrimaryItemBoxParser::kind() const noexcept
{
    return BoxKind::PrimaryItem;
}


BoxDecodeStatus
PrimaryItemBoxParser::parse(BoxDecoder& decoder, ReaderCursor& payload,
                            Box* box) const noexcept
{
    (void)decoder;
    return read_item_id(payload, box->extent.version != 0U, &box->item_id);
}


bool
ImageSpatialExtentBoxParser::is_full_box() const noexcept
{
    return true;
}


BoxKind
ImageSpatialExtentBoxParser::kind() const noexcept
{
    return BoxKind::ImageSpatialExtent;
}


BoxDecodeStatus
ImageSpatialExtentBoxParser::parse(BoxDecoder& decoder, ReaderCursor& payload,
                                   Box* box) const noexcept
{
    (void)decoder;
    ReadResult r = payload.read_u32(&box->image_width);
    if (r.status == ReadStatus::Ok) {
        r = payload.read_u32(&box->image_height);
    }
    return box_status_from_read(r, payload);
}


bool
ImageRotationBoxParser::is_full_box() const noexcept
{
    return false;
}


BoxKind
ImageRotationBoxParser::kind() const noexcept
{
    return BoxKind::ImageRotation;
}


BoxDecodeStatus
ImageRotationBoxParser::parse(BoxDecoder& decoder, ReaderCursor& payload,
                              Box* box) const noexcept
{
    (void)decoder;
    uint8_t v          = 0;
    const ReadResult r = payload.read_u8(&v);
    if (r.status != ReadStatus::Ok) {
        return box_status_from_read(r, payload);
    }
    box->rotation_degrees = static_cast<uint16_t>((v & 0x03U) * 90U);
    return BoxDecodeStatus::Ok;
}


ItemTypeReferenceBoxParser::ItemTypeReferenceBoxParser(bool large_ids) noexcept
    : large_ids_(large_ids)
{
}


bool
ItemTypeReferenceBoxParser::is_full_box() const noexcept
{
    return false;
}


BoxKind
ItemTypeReferenceBoxParser::kind() const noexcept
{
    return BoxKind::ItemTypeReference;
}


BoxDecodeStatus
ItemTypeReferenceBoxParser::parse(BoxDecoder& decoder, ReaderCursor& payload,
                                  Box* box) const noexcept
{
    (void)decoder;
    ItemReferenceInfo& ref = box->reference;

    BoxDecodeStatus status = read_item_id(payload, large_ids_,
                                          &ref.from_item_id);
    if (status != BoxDecodeStatus::Ok) {
        return status;
    }

    uint16_t count     = 0;
    const ReadResult r = payload.read_u16(&count);
    if (r.status != ReadStatus::Ok) {
        return box_status_from_read(r, payload);
    }

    ref.to_item_ids.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        uint32_t id = 0;
        status      = read_item_id(payload, large_ids_, &id);
        if (status != BoxDecodeStatus::Ok) {
            return status;
        }
        ref.to_item_ids.push_back(id);
    }
    return BoxDecodeStatus::Ok;
}


ItemReferenceBoxParser::ItemReferenceBoxParser() noexcept
    : small_ids_(false)
    , large_ids_(true)
{
}


bool
ItemReferenceBoxParser::is_full_box() const noexcept
{
    return true;
}


BoxKind
ItemReferenceBoxParser::kind() const noexcept
{
    return BoxKind::ItemReference;
}


BoxDecodeStatus
ItemReferenceBoxParser::parse(BoxDecoder& decoder, ReaderCursor& payload,
                              Box* box) const noexcept
{
    const BoxParser* child = (box->extent.version == 0U)
                                 ? static_cast<const BoxParser*>(&small_ids_)
                                 : static_cast<const BoxParser*>(&large_ids_);
    return decoder.decode_children(payload, box->extent, &box->children,
                                   child, true);
}


BmffFormat
classify_bmff_brands(uint32_t major_brand,
                     const std::vector<uint32_t>& compatible_brands) noexcept
{
    bool is_heif = false;
    bool is_avif = false;
    bool is_cr3  = false;
    bool is_mp4  = false;
    note_brand(major_brand, &is_heif, &is_avif, &is_cr3, &is_mp4);
    for (size_t i = 0; i < compatible_brands.size(); ++i) {
        note_brand(compatible_brands[i], &is_heif, &is_avif, &is_cr3,
                   &is_mp4);
    }

    if (is_cr3) {
        return BmffFormat::Cr3;
    }
    if (is_avif) {
        return BmffFormat::Avif;
    }
    if (is_heif) {
        return BmffFormat::Heif;
    }
    if (is_mp4) {
        return BmffFormat::Mp4;
    }
    return BmffFormat::Unknown;
}


const char*
bmff_format_name(BmffFormat format) noexcept
{
    switch (format) {
    case BmffFormat::Unknown: return "unknown";
    case BmffFormat::Heif: return "heif";
    case BmffFormat::Avif: return "avif";
    case BmffFormat::Cr3: return "cr3";
    case BmffFormat::Mp4: return "mp4";
    }
    return "unknown";
}


void
register_default_box_parsers(BoxParserRegistry* registry)
{
    static constexpr uint32_t kPlainContainers[] = {
        fourcc('m', 'o', 'o', 'v'), fourcc('t', 'r', 'a', 'k'),
        fourcc('m', 'd', 'i', 'a'), fourcc('m', 'i', 'n', 'f'),
        fourcc('s', 't', 'b', 'l'), fourcc('e', 'd', 't', 's'),
        fourcc('d', 'i', 'n', 'f'), fourcc('u', 'd', 't', 'a'),
        fourcc('m', 'v', 'e', 'x'), fourcc('m', 'o', 'o', 'f'),
        fourcc('t', 'r', 'a', 'f'), fourcc('i', 'p', 'r', 'p'),
        fourcc('i', 'p', 'c', 'o'),
    };
    for (const uint32_t type : kPlainContainers) {
        registry->add(type, std::make_unique<ContainerBoxParser>(false));
    }
    registry->add(fourcc('m', 'e', 't', 'a'),
                  std::make_unique<ContainerBoxParser>(true));

    registry->add(fourcc('f', 't', 'y', 'p'),
                  std::make_unique<FileTypeBoxParser>());
    registry->add(fourcc('h', 'd', 'l', 'r'),
                  std::make_unique<HandlerBoxParser>());
    registry->add(fourcc('p', 'i', 't', 'm'),
                  std::make_unique<PrimaryItemBoxParser>());
    registry->add(fourcc('i', 's', 'p', 'e'),
                  std::make_unique<ImageSpatialExtentBoxParser>());
    registry->add(fourcc('i', 'r', 'o', 't'),
                  std::make_unique<ImageRotationBoxParser>());
    registry->add(fourcc('i', 'r', 'e', 'f'),
                  std::make_unique<ItemReferenceBoxParser>());
}


BoxParserRegistry
make_default_box_registry()
{
    BoxParserRegistry registry;
    register_default_box_parsers(&registry);
    return registry;
}

}  // namespace boxmeta
