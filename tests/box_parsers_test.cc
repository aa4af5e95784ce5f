#include "boxmeta/box_parsers.h"

#include <gtest/gtest.h>

#include <cstdint>
#include <memory>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

namespace boxmeta {
namespace {

    static void append_u16be(std::vector<std::byte>* out, uint16_t v)
    {
        out->push_back(std::byte { static_cast<uint8_t>((v >> 8) & 0xFF) });
        out->push_back(std::byte { static_cast<uint8_t>((v >> 0) & 0xFF) });
    }

    static void append_u32be(std::vector<std::byte>* out, uint32_t v)
    {
        out->push_back(std::byte { static_cast<uint8_t>((v >> 24) & 0xFF) });
        out->push_back(std::byte { static_cast<uint8_t>((v >> 16) & 0xFF) });
        out->push_back(std::byte { static_cast<uint8_t>((v >> 8) & 0xFF) });
        out->push_back(std::byte { static_cast<uint8_t>((v >> 0) & 0xFF) });
    }

    static void append_fullbox_header(std::vector<std::byte>* out,
                                      uint8_t version)
    {
        out->push_back(std::byte { version });
        out->push_back(std::byte { 0 });
        out->push_back(std::byte { 0 });
        out->push_back(std::byte { 0 });
    }

    static void append_text(std::vector<std::byte>* out, std::string_view s)
    {
        for (const char c : s) {
            out->push_back(std::byte { static_cast<uint8_t>(c) });
        }
    }

    static void append_bmff_box(std::vector<std::byte>* out, uint32_t type,
                                std::span<const std::byte> payload)
    {
        append_u32be(out, static_cast<uint32_t>(8 + payload.size()));
        append_u32be(out, type);
        out->insert(out->end(), payload.begin(), payload.end());
    }

    static std::vector<std::byte> make_ftyp_payload(uint32_t major,
                                                    uint32_t compat)
    {
        std::vector<std::byte> out;
        append_u32be(&out, major);
        append_u32be(&out, 0);
        append_u32be(&out, compat);
        return out;
    }

    static std::vector<std::byte> make_hdlr_payload(uint32_t handler,
                                                    std::string_view name)
    {
        std::vector<std::byte> out;
        append_fullbox_header(&out, 0);
        append_u32be(&out, 0);
        append_u32be(&out, handler);
        append_u32be(&out, 0);
        append_u32be(&out, 0);
        append_u32be(&out, 0);
        append_text(&out, name);
        return out;
    }

    // Single-type reference with 16-bit ids.
    static void append_ref16(std::vector<std::byte>* out, uint32_t type,
                             uint16_t from, std::span<const uint16_t> to)
    {
        std::vector<std::byte> payload;
        append_u16be(&payload, from);
        append_u16be(&payload, static_cast<uint16_t>(to.size()));
        for (const uint16_t id : to) {
            append_u16be(&payload, id);
        }
        append_bmff_box(out, type, payload);
    }

    // Single-type reference with 32-bit ids.
    static void append_ref32(std::vector<std::byte>* out, uint32_t type,
                             uint32_t from, std::span<const uint32_t> to)
    {
        std::vector<std::byte> payload;
        append_u32be(&payload, from);
        append_u16be(&payload, static_cast<uint16_t>(to.size()));
        for (const uint32_t id : to) {
            append_u32be(&payload, id);
        }
        append_bmff_box(out, type, payload);
    }

    struct Decoded final {
        std::vector<std::byte> bytes;
        std::unique_ptr<ByteSource> source;
        BoxTree tree;
        BoxDecodeResult result;
    };

    static void decode_bytes(std::vector<std::byte> bytes, Decoded* out)
    {
        static const BoxParserRegistry registry = make_default_box_registry();
        out->bytes  = std::move(bytes);
        out->source = std::make_unique<ByteSource>(
            std::span<const std::byte>(out->bytes));
        out->result = decode_box_tree(*out->source, registry, &out->tree);
    }

}  // namespace

TEST(BoxParsers, ClassifiesBrandFamilies)
{
    const std::vector<uint32_t> none;
    EXPECT_EQ(classify_bmff_brands(fourcc('h', 'e', 'i', 'c'), none),
              BmffFormat::Heif);
    EXPECT_EQ(classify_bmff_brands(fourcc('i', 's', 'o', 'm'), none),
              BmffFormat::Mp4);
    EXPECT_EQ(classify_bmff_brands(fourcc('q', 't', ' ', ' '), none),
              BmffFormat::Unknown);

    const std::vector<uint32_t> avif = { fourcc('m', 'i', 'f', '1'),
                                         fourcc('a', 'v', 'i', 'f') };
    EXPECT_EQ(classify_bmff_brands(fourcc('a', 'v', 'i', 'f'), avif),
              BmffFormat::Avif);

    const std::vector<uint32_t> cr3 = { fourcc('i', 's', 'o', 'm'),
                                        fourcc('C', 'R', '3', ' ') };
    EXPECT_EQ(classify_bmff_brands(fourcc('c', 'r', 'x', ' '), cr3),
              BmffFormat::Cr3);
    EXPECT_STREQ(bmff_format_name(BmffFormat::Cr3), "cr3");
}


TEST(BoxParsers, DecodesFileType)
{
    std::vector<std::byte> payload
        = make_ftyp_payload(fourcc('a', 'v', 'i', 'f'),
                            fourcc('m', 'i', 'f', '1'));
    // A trailing partial brand is ignored.
    payload.push_back(std::byte { 'x' });
    payload.push_back(std::byte { 'y' });

    std::vector<std::byte> file;
    append_bmff_box(&file, fourcc('f', 't', 'y', 'p'), payload);
    Decoded d;
    decode_bytes(std::move(file), &d);

    EXPECT_EQ(d.result.status, BoxDecodeStatus::Ok);
    ASSERT_EQ(d.tree.boxes.size(), 1U);
    const Box& ftyp = d.tree.boxes[0];
    EXPECT_EQ(ftyp.kind, BoxKind::FileType);
    EXPECT_EQ(ftyp.file_type.major_brand, fourcc('a', 'v', 'i', 'f'));
    EXPECT_EQ(ftyp.file_type.minor_version, 0U);
    ASSERT_EQ(ftyp.file_type.compatible_brands.size(), 1U);
    EXPECT_EQ(ftyp.file_type.compatible_brands[0], fourcc('m', 'i', 'f', '1'));
    EXPECT_EQ(ftyp.file_type.format, BmffFormat::Avif);
}


TEST(BoxParsers, ShortFileTypeIsMalformedButKept)
{
    std::vector<std::byte> payload;
    append_u32be(&payload, fourcc('h', 'e', 'i', 'c'));
    payload.push_back(std::byte { 0 });

    std::vector<std::byte> file;
    append_bmff_box(&file, fourcc('f', 't', 'y', 'p'), payload);
    append_bmff_box(&file, fourcc('f', 'r', 'e', 'e'), {});
    Decoded d;
    decode_bytes(std::move(file), &d);

    EXPECT_EQ(d.result.status, BoxDecodeStatus::Malformed);
    ASSERT_EQ(d.tree.boxes.size(), 2U);
    EXPECT_EQ(d.tree.boxes[0].status, BoxDecodeStatus::Malformed);
    ASSERT_EQ(d.tree.issues.size(), 1U);
    EXPECT_TRUE(d.tree.issues[0].kept);
    EXPECT_EQ(d.tree.boxes[1].type, fourcc('f', 'r', 'e', 'e'));
}


TEST(BoxParsers, DecodesHandlerWithAndWithoutName)
{
    std::vector<std::byte> file;
    std::vector<std::byte> named
        = make_hdlr_payload(fourcc('p', 'i', 'c', 't'), "Pictures");
    named.push_back(std::byte { 0 });
    append_bmff_box(&file, fourcc('h', 'd', 'l', 'r'), named);
    append_bmff_box(&file, fourcc('h', 'd', 'l', 'r'),
                    make_hdlr_payload(fourcc('v', 'i', 'd', 'e'), ""));
    append_bmff_box(&file, fourcc('h', 'd', 'l', 'r'),
                    make_hdlr_payload(fourcc('s', 'o', 'u', 'n'), "Raw"));
    Decoded d;
    decode_bytes(std::move(file), &d);

    EXPECT_EQ(d.result.status, BoxDecodeStatus::Ok);
    ASSERT_EQ(d.tree.boxes.size(), 3U);
    EXPECT_EQ(d.tree.boxes[0].kind, BoxKind::Handler);
    EXPECT_TRUE(d.tree.boxes[0].extent.is_full_box);
    EXPECT_EQ(d.tree.boxes[0].handler.handler_type,
              fourcc('p', 'i', 'c', 't'));
    EXPECT_EQ(d.tree.boxes[0].handler.name, "Pictures");
    EXPECT_TRUE(d.tree.boxes[1].handler.name.empty());
    // An unterminated name runs to the end of the box.
    EXPECT_EQ(d.tree.boxes[2].handler.name, "Raw");
}


TEST(BoxParsers, HandlerNameInOpenEndedStreamBox)
{
    std::vector<std::byte> named
        = make_hdlr_payload(fourcc('p', 'i', 'c', 't'), "Pictures");
    named.push_back(std::byte { 0 });
    const std::vector<std::byte> unterminated
        = make_hdlr_payload(fourcc('s', 'o', 'u', 'n'), "Raw");

    const std::vector<std::byte>* payloads[] = { &named, &unterminated };
    const char* expected[]                   = { "Pictures", "Raw" };
    const BoxParserRegistry registry = make_default_box_registry();
    for (size_t i = 0; i < 2; ++i) {
        SCOPED_TRACE(expected[i]);
        std::vector<std::byte> file;
        append_u32be(&file, 0);
        append_u32be(&file, fourcc('h', 'd', 'l', 'r'));
        file.insert(file.end(), payloads[i]->begin(), payloads[i]->end());

        MemoryByteStream stream(file, 3);
        SourceLimits limits;
        limits.pull_chunk_bytes = 2;
        ByteSource source(stream, limits);
        BoxTree tree;
        const BoxDecodeResult res = decode_box_tree(source, registry, &tree);

        EXPECT_EQ(res.status, BoxDecodeStatus::Ok);
        ASSERT_EQ(tree.boxes.size(), 1U);
        EXPECT_TRUE(tree.boxes[0].extent.open_ended);
        EXPECT_EQ(tree.boxes[0].kind, BoxKind::Handler);
        EXPECT_EQ(tree.boxes[0].status, BoxDecodeStatus::Ok);
        EXPECT_EQ(tree.boxes[0].handler.name, expected[i]);
    }
}


TEST(BoxParsers, PrimaryItemWidthFollowsVersion)
{
    std::vector<std::byte> v0;
    append_fullbox_header(&v0, 0);
    append_u16be(&v0, 7);
    std::vector<std::byte> v1;
    append_fullbox_header(&v1, 1);
    append_u32be(&v1, 0x10000U);

    std::vector<std::byte> file;
    append_bmff_box(&file, fourcc('p', 'i', 't', 'm'), v0);
    append_bmff_box(&file, fourcc('p', 'i', 't', 'm'), v1);
    Decoded d;
    decode_bytes(std::move(file), &d);

    EXPECT_EQ(d.result.status, BoxDecodeStatus::Ok);
    ASSERT_EQ(d.tree.boxes.size(), 2U);
    EXPECT_EQ(d.tree.boxes[0].kind, BoxKind::PrimaryItem);
    EXPECT_EQ(d.tree.boxes[0].item_id, 7U);
    EXPECT_EQ(d.tree.boxes[1].extent.version, 1U);
    EXPECT_EQ(d.tree.boxes[1].item_id, 0x10000U);
}


TEST(BoxParsers, DecodesImageProperties)
{
    std::vector<std::byte> ispe;
    append_fullbox_header(&ispe, 0);
    append_u32be(&ispe, 640);
    append_u32be(&ispe, 480);
    const std::byte irot[] = { std::byte { 0x07 } };

    std::vector<std::byte> ipco;
    append_bmff_box(&ipco, fourcc('i', 's', 'p', 'e'), ispe);
    append_bmff_box(&ipco, fourcc('i', 'r', 'o', 't'), irot);
    std::vector<std::byte> iprp;
    append_bmff_box(&iprp, fourcc('i', 'p', 'c', 'o'), ipco);
    std::vector<std::byte> file;
    append_bmff_box(&file, fourcc('i', 'p', 'r', 'p'), iprp);
    Decoded d;
    decode_bytes(std::move(file), &d);

    EXPECT_EQ(d.result.status, BoxDecodeStatus::Ok);
    ASSERT_EQ(d.tree.boxes.size(), 1U);
    const Box* ipco_box = find_child(d.tree.boxes[0], fourcc('i', 'p', 'c', 'o'));
    ASSERT_NE(ipco_box, nullptr);
    const Box* ispe_box = find_child(*ipco_box, fourcc('i', 's', 'p', 'e'));
    ASSERT_NE(ispe_box, nullptr);
    EXPECT_EQ(ispe_box->kind, BoxKind::ImageSpatialExtent);
    EXPECT_EQ(ispe_box->image_width, 640U);
    EXPECT_EQ(ispe_box->image_height, 480U);

    const Box* irot_box = find_child(*ipco_box, fourcc('i', 'r', 'o', 't'));
    ASSERT_NE(irot_box, nullptr);
    EXPECT_FALSE(irot_box->extent.is_full_box);
    EXPECT_EQ(irot_box->rotation_degrees, 270U);
    EXPECT_EQ(find_child(*ipco_box, fourcc('c', 'o', 'l', 'r')), nullptr);
}


TEST(BoxParsers, DecodesItemReferencesWith16BitIds)
{
    const uint16_t dimg_to[] = { 2, 3 };
    const uint16_t thmb_to[] = { 1 };
    std::vector<std::byte> iref;
    append_fullbox_header(&iref, 0);
    append_ref16(&iref, fourcc('d', 'i', 'm', 'g'), 1, dimg_to);
    append_ref16(&iref, fourcc('t', 'h', 'm', 'b'), 4, thmb_to);

    std::vector<std::byte> file;
    append_bmff_box(&file, fourcc('i', 'r', 'e', 'f'), iref);
    Decoded d;
    decode_bytes(std::move(file), &d);

    EXPECT_EQ(d.result.status, BoxDecodeStatus::Ok);
    ASSERT_EQ(d.tree.boxes.size(), 1U);
    const Box& box = d.tree.boxes[0];
    EXPECT_EQ(box.kind, BoxKind::ItemReference);
    ASSERT_EQ(box.children.size(), 2U);

    const Box& dimg = box.children[0];
    EXPECT_EQ(dimg.type, fourcc('d', 'i', 'm', 'g'));
    EXPECT_EQ(dimg.kind, BoxKind::ItemTypeReference);
    EXPECT_FALSE(dimg.extent.is_full_box);
    EXPECT_EQ(dimg.reference.from_item_id, 1U);
    EXPECT_EQ(dimg.reference.to_item_ids, (std::vector<uint32_t> { 2, 3 }));

    const Box& thmb = box.children[1];
    EXPECT_EQ(thmb.type, fourcc('t', 'h', 'm', 'b'));
    EXPECT_EQ(thmb.reference.from_item_id, 4U);
    EXPECT_EQ(thmb.reference.to_item_ids, (std::vector<uint32_t> { 1 }));
}


TEST(BoxParsers, DecodesItemReferencesWith32BitIds)
{
    const uint32_t cdsc_to[] = { 0x00010000U };
    std::vector<std::byte> iref;
    append_fullbox_header(&iref, 1);
    append_ref32(&iref, fourcc('c', 'd', 's', 'c'), 0x00020000U, cdsc_to);

    std::vector<std::byte> file;
    append_bmff_box(&file, fourcc('i', 'r', 'e', 'f'), iref);
    Decoded d;
    decode_bytes(std::move(file), &d);

    EXPECT_EQ(d.result.status, BoxDecodeStatus::Ok);
    ASSERT_EQ(d.tree.boxes.size(), 1U);
    ASSERT_EQ(d.tree.boxes[0].children.size(), 1U);
    const Box& cdsc = d.tree.boxes[0].children[0];
    EXPECT_EQ(cdsc.extent.length, 18U);
    EXPECT_EQ(cdsc.reference.from_item_id, 0x00020000U);
    EXPECT_EQ(cdsc.reference.to_item_ids,
              (std::vector<uint32_t> { 0x00010000U }));
}


TEST(BoxParsers, ItemReferenceListKeepsPrefixBeforeBadEntry)
{
    const uint16_t dimg_to[] = { 2 };
    const uint16_t auxl_to[] = { 9 };
    std::vector<std::byte> iref;
    append_fullbox_header(&iref, 0);
    append_ref16(&iref, fourcc('d', 'i', 'm', 'g'), 1, dimg_to);
    // Claims three ids but holds one.
    std::vector<std::byte> bad;
    append_u16be(&bad, 5);
    append_u16be(&bad, 3);
    append_u16be(&bad, 6);
    append_bmff_box(&iref, fourcc('c', 'd', 's', 'c'), bad);
    append_ref16(&iref, fourcc('a', 'u', 'x', 'l'), 8, auxl_to);

    std::vector<std::byte> file;
    append_bmff_box(&file, fourcc('i', 'r', 'e', 'f'), iref);
    append_bmff_box(&file, fourcc('f', 'r', 'e', 'e'), {});
    Decoded d;
    decode_bytes(std::move(file), &d);

    EXPECT_EQ(d.result.status, BoxDecodeStatus::Malformed);
    ASSERT_EQ(d.tree.boxes.size(), 2U);
    const Box& box = d.tree.boxes[0];
    EXPECT_EQ(box.status, BoxDecodeStatus::Malformed);
    ASSERT_EQ(box.children.size(), 1U);
    EXPECT_EQ(box.children[0].type, fourcc('d', 'i', 'm', 'g'));
    EXPECT_EQ(d.tree.boxes[1].type, fourcc('f', 'r', 'e', 'e'));

    ASSERT_EQ(d.tree.issues.size(), 1U);
    EXPECT_EQ(d.tree.issues[0].type, fourcc('c', 'd', 's', 'c'));
    EXPECT_EQ(d.tree.issues[0].offset, 12U + 14U);
    EXPECT_FALSE(d.tree.issues[0].kept);
}


TEST(BoxParsers, DecodesNestedMetaBox)
{
    std::vector<std::byte> pitm;
    append_fullbox_header(&pitm, 0);
    append_u16be(&pitm, 1);
    const uint16_t thmb_to[] = { 1 };
    std::vector<std::byte> iref;
    append_fullbox_header(&iref, 0);
    append_ref16(&iref, fourcc('t', 'h', 'm', 'b'), 2, thmb_to);

    std::vector<std::byte> meta;
    append_fullbox_header(&meta, 0);
    append_bmff_box(&meta, fourcc('h', 'd', 'l', 'r'),
                    make_hdlr_payload(fourcc('p', 'i', 'c', 't'), ""));
    append_bmff_box(&meta, fourcc('p', 'i', 't', 'm'), pitm);
    append_bmff_box(&meta, fourcc('i', 'r', 'e', 'f'), iref);

    std::vector<std::byte> file;
    append_bmff_box(&file, fourcc('f', 't', 'y', 'p'),
                    make_ftyp_payload(fourcc('h', 'e', 'i', 'c'),
                                      fourcc('m', 'i', 'f', '1')));
    append_bmff_box(&file, fourcc('m', 'e', 't', 'a'), meta);
    Decoded d;
    decode_bytes(std::move(file), &d);

    EXPECT_EQ(d.result.status, BoxDecodeStatus::Ok);
    EXPECT_EQ(d.result.deepest_level, 2U);
    const Box* meta_box = find_box(d.tree.boxes, fourcc('m', 'e', 't', 'a'));
    ASSERT_NE(meta_box, nullptr);
    EXPECT_TRUE(meta_box->extent.is_full_box);
    ASSERT_EQ(meta_box->children.size(), 3U);
    const Box* pitm_box = find_child(*meta_box, fourcc('p', 'i', 't', 'm'));
    ASSERT_NE(pitm_box, nullptr);
    EXPECT_EQ(pitm_box->item_id, 1U);
    const Box* iref_box = find_child(*meta_box, fourcc('i', 'r', 'e', 'f'));
    ASSERT_NE(iref_box, nullptr);
    ASSERT_EQ(iref_box->children.size(), 1U);
    EXPECT_EQ(iref_box->children[0].reference.from_item_id, 2U);
}


TEST(BoxParsers, RegistryControlsDispatch)
{
    BoxParserRegistry registry;
    EXPECT_EQ(registry.size(), 0U);
    EXPECT_EQ(registry.find(fourcc('m', 'o', 'o', 'v')), nullptr);

    registry.add(fourcc('w', 'r', 'a', 'p'),
                 std::make_unique<ContainerBoxParser>());
    ASSERT_NE(registry.find(fourcc('w', 'r', 'a', 'p')), nullptr);
    EXPECT_EQ(registry.size(), 1U);

    std::vector<std::byte> inner;
    append_bmff_box(&inner, fourcc('f', 't', 'y', 'p'),
                    make_ftyp_payload(fourcc('i', 's', 'o', 'm'), 0));
    std::vector<std::byte> file;
    append_bmff_box(&file, fourcc('w', 'r', 'a', 'p'), inner);

    ByteSource source(file);
    BoxTree tree;
    const BoxDecodeResult res = decode_box_tree(source, registry, &tree);
    EXPECT_EQ(res.status, BoxDecodeStatus::Ok);
    ASSERT_EQ(tree.boxes.size(), 1U);
    EXPECT_EQ(tree.boxes[0].kind, BoxKind::Container);
    ASSERT_EQ(tree.boxes[0].children.size(), 1U);
    // Not registered here, so left opaque.
    EXPECT_EQ(tree.boxes[0].children[0].kind, BoxKind::Opaque);

    const BoxParserRegistry defaults = make_default_box_registry();
    EXPECT_NE(defaults.find(fourcc('i', 'r', 'e', 'f')), nullptr);
    EXPECT_NE(defaults.find(fourcc('m', 'e', 't', 'a')), nullptr);
    EXPECT_EQ(defaults.find(fourcc('d', 'i', 'm', 'g')), nullptr);
}

}  // namespace boxmeta
