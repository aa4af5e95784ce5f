#pragma once

#include "boxmeta/box_tree.h"

#include <cstdint>

/**
 * \file box_parsers.h
 * \brief Built-in box parsers (containers, `ftyp`, `hdlr`, `pitm`, `ispe`,
 * `irot`, `iref`) and the default registry.
 */

namespace boxmeta {

/// Box whose payload is a sequence of child boxes (`moov`, `meta`, ...).
class ContainerBoxParser final : public BoxParser {
public:
    explicit ContainerBoxParser(bool full_box = false) noexcept;

    bool is_full_box() const noexcept override;
    BoxKind kind() const noexcept override;
    BoxDecodeStatus parse(BoxDecoder& decoder, ReaderCursor& payload,
                          Box* box) const noexcept override;

private:
    bool full_box_ = false;
};

/// `ftyp`: major brand, minor version, compatible brands.
class FileTypeBoxParser final : public BoxParser {
public:
    bool is_full_box() const noexcept override;
    BoxKind kind() const noexcept override;
    BoxDecodeStatus parse(BoxDecoder& decoder, ReaderCursor& payload,
                          Box* box) const noexcept override;
};

/// `hdlr`: handler type and name.
class HandlerBoxParser final : public BoxParser {
public:
    bool is_full_box() const noexcept override;
    BoxKind kind() const noexcept override;
    BoxDecodeStatus parse(BoxDecoder& decoder, ReaderCursor& payload,
                          Box* box) const noexcept override;
};

/// `pitm`: primary item id (16-bit in version 0, 32-bit otherwise).
class PrimaryItemBoxParser final : public BoxParser {
public:
    bool is_full_box() const noexcept override;
    BoxKind kind() const noexcept override;
    BoxDecodeStatus parse(BoxDecoder& decoder, ReaderCursor& payload,
                          Box* box) const noexcept override;
};

/// `ispe`: image width and height.
class ImageSpatialExtentBoxParser final : public BoxParser {
public:
    bool is_full_box() const noexcept override;
    BoxKind kind() const noexcept override;
    BoxDecodeStatus parse(BoxDecoder& decoder, ReaderCursor& payload,
                          Box* box) const noexcept override;
};

/// `irot`: rotation in 90 degree steps.
class ImageRotationBoxParser final : public BoxParser {
public:
    bool is_full_box() const noexcept override;
    BoxKind kind() const noexcept override;
    BoxDecodeStatus parse(BoxDecoder& decoder, ReaderCursor& payload,
                          Box* box) const noexcept override;
};

/**
 * \brief One single-type reference inside `iref`.
 *
 * The box type is the reference type (`dimg`, `thmb`, `cdsc`, `auxl`, ...).
 * Item ids are 32-bit when \p large_ids is set (parent version != 0).
 */
class ItemTypeReferenceBoxParser final : public BoxParser {
public:
    explicit ItemTypeReferenceBoxParser(bool large_ids) noexcept;

    bool is_full_box() const noexcept override;
    BoxKind kind() const noexcept override;
    BoxDecodeStatus parse(BoxDecoder& decoder, ReaderCursor& payload,
                          Box* box) const noexcept override;

private:
    bool large_ids_ = false;
};

/**
 * \brief `iref`: list of single-type references.
 *
 * Children are decoded with a parser chosen by this box's version. The list
 * stops at the first child that fails; the decoded prefix is kept.
 */
class ItemReferenceBoxParser final : public BoxParser {
public:
    ItemReferenceBoxParser() noexcept;

    bool is_full_box() const noexcept override;
    BoxKind kind() const noexcept override;
    BoxDecodeStatus parse(BoxDecoder& decoder, ReaderCursor& payload,
                          Box* box) const noexcept override;

private:
    ItemTypeReferenceBoxParser small_ids_;
    ItemTypeReferenceBoxParser large_ids_;
};


/// Classifies a set of `ftyp` brands (CR3, then AVIF, then HEIF, then MP4).
BmffFormat
classify_bmff_brands(uint32_t major_brand,
                     const std::vector<uint32_t>& compatible_brands) noexcept;

/// Short name for \p format.
const char*
bmff_format_name(BmffFormat format) noexcept;

/// Adds every built-in parser to \p registry.
void
register_default_box_parsers(BoxParserRegistry* registry);

/// Registry with every built-in parser.
BoxParserRegistry
make_default_box_registry();

}  // namespace boxmeta
