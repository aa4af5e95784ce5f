#pragma once

#include "boxmeta/byte_arena.h"
#include "boxmeta/byte_source.h"
#include "boxmeta/reader_cursor.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

/**
 * \file box_tree.h
 * \brief Recursive decoder for ISO-BMFF style box trees.
 */

namespace boxmeta {

static constexpr uint32_t
fourcc(char a, char b, char c, char d) noexcept
{
    return (static_cast<uint32_t>(static_cast<uint8_t>(a)) << 24)
           | (static_cast<uint32_t>(static_cast<uint8_t>(b)) << 16)
           | (static_cast<uint32_t>(static_cast<uint8_t>(c)) << 8)
           | (static_cast<uint32_t>(static_cast<uint8_t>(d)) << 0);
}

/// Type code that announces a 16-byte extended type.
inline constexpr uint32_t kUuidBoxType = fourcc('u', 'u', 'i', 'd');

/**
 * \brief Declared byte range of a box, plus the full-box version/flags.
 *
 * `start` is the absolute offset of the box's size field. `length` is the
 * total box length including the header. An open-ended extent (size 0 on an
 * input of unknown length) runs until the data ends.
 */
struct BoxExtent final {
    uint64_t start       = 0;
    uint64_t length      = 0;
    bool open_ended      = false;
    uint32_t header_size = 0;
    bool is_full_box     = false;
    uint8_t version      = 0;
    uint32_t flags       = 0;

    /// One past the last byte (meaningless when \ref open_ended).
    uint64_t end() const noexcept;
    /// Absolute offset of the first payload byte.
    uint64_t payload_start() const noexcept;
    /// Payload byte count (0 when \ref open_ended).
    uint64_t payload_length() const noexcept;

    /**
     * \brief True once \p cursor has consumed the whole extent.
     *
     * For an open-ended extent this is true only when the source reports
     * that no byte exists at the cursor position (it may pull a stream).
     */
    bool done_reading(ReaderCursor& cursor) const noexcept;
    /// Bytes left between the cursor and \ref end(), never negative.
    uint64_t remaining(const ReaderCursor& cursor) const noexcept;
};


/// Per-box decode status.
enum class BoxDecodeStatus : uint8_t {
    Ok,
    /// Declared sizes are inconsistent with the header or the parent extent.
    Malformed,
    /// The data ends before the declared box does.
    Truncated,
    /// A depth/count/buffer limit was hit.
    LimitExceeded,
    /// The underlying stream failed.
    IoError,
};

/// Maps a failed \ref ReadResult to a box status.
BoxDecodeStatus
box_status_from_read(const ReadResult& read,
                     const ReaderCursor& view) noexcept;

/// How the payload of a decoded box was interpreted.
enum class BoxKind : uint8_t {
    Opaque,
    Container,
    FileType,
    Handler,
    PrimaryItem,
    ImageSpatialExtent,
    ImageRotation,
    ItemReference,
    ItemTypeReference,
};

/// Brand family derived from an `ftyp` box.
enum class BmffFormat : uint8_t {
    Unknown,
    Heif,
    Avif,
    Cr3,
    Mp4,
};

/// Fields of an `ftyp` box.
struct FileTypeInfo final {
    uint32_t major_brand   = 0;
    uint32_t minor_version = 0;
    std::vector<uint32_t> compatible_brands;
    BmffFormat format = BmffFormat::Unknown;
};

/// Fields of an `hdlr` box.
struct HandlerInfo final {
    uint32_t handler_type = 0;
    std::string name;
};

/// One single-type reference (child of `iref`).
struct ItemReferenceInfo final {
    uint32_t from_item_id = 0;
    std::vector<uint32_t> to_item_ids;
};

/**
 * \brief One decoded box.
 *
 * \ref payload is scoped exactly to the payload bytes (after every header
 * field) and stays valid as long as the \ref ByteSource it was decoded from.
 */
struct Box final {
    uint32_t type = 0;
    BoxExtent extent;
    bool has_extended_type = false;
    std::array<std::byte, 16> extended_type {};
    BoxKind kind           = BoxKind::Opaque;
    BoxDecodeStatus status = BoxDecodeStatus::Ok;
    ReaderCursor payload;

    /// Raw opaque payload copied into \ref BoxTree::arena.
    bool has_retained_payload = false;
    ByteSpan retained_payload;

    FileTypeInfo file_type;
    HandlerInfo handler;
    /// `pitm` primary item id.
    uint32_t item_id = 0;
    /// `ispe` image size.
    uint32_t image_width  = 0;
    uint32_t image_height = 0;
    /// `irot` rotation (0, 90, 180, 270).
    uint16_t rotation_degrees = 0;
    ItemReferenceInfo reference;

    std::vector<Box> children;
};

/// Diagnostic for a box that failed to decode.
struct BoxIssue final {
    /// Absolute offset of the failing box header.
    uint64_t offset = 0;
    /// Type code, or 0 when the header could not be read.
    uint32_t type          = 0;
    uint32_t depth         = 0;
    BoxDecodeStatus status = BoxDecodeStatus::Malformed;
    /// Underlying read failure, when a read triggered the issue.
    ReadResult read;
    /// True when the box is still present in the tree (partially decoded).
    bool kept = false;
};

/// Decoded top-level boxes plus the storage and diagnostics they own.
struct BoxTree final {
    std::vector<Box> boxes;
    std::vector<BoxIssue> issues;
    ByteArena arena;
};


/// Resource limits for \ref decode_box_tree.
struct BoxDecodeLimits final {
    /// Maximum nesting depth (top-level boxes are depth 0).
    uint32_t max_depth = 32;
    /// Maximum box headers to decode.
    uint32_t max_boxes = 1U << 16;
    /// Maximum bytes copied into \ref BoxTree::arena (0 = unlimited).
    uint64_t max_retained_payload_bytes = 16ULL * 1024ULL * 1024ULL;
};

/// Decoder options for \ref decode_box_tree.
struct BoxDecodeOptions final {
    /// If true, copy the payload of unregistered boxes into the tree arena.
    bool retain_opaque_payloads = false;
    BoxDecodeLimits limits;
};

/// Box tree decode result summary.
struct BoxDecodeResult final {
    BoxDecodeStatus status  = BoxDecodeStatus::Ok;
    uint32_t boxes_decoded  = 0;
    uint32_t boxes_failed   = 0;
    uint32_t deepest_level  = 0;
    uint64_t retained_bytes = 0;
};


class BoxDecoder;

/**
 * \brief Decodes the payload of one box type.
 *
 * Parsers receive a cursor scoped to the payload and fill in \p box. They
 * never need to skip trailing bytes; the decoder moves past the box.
 */
class BoxParser {
public:
    virtual ~BoxParser() = default;

    /// True when the box carries the 8-bit version and 24-bit flags.
    virtual bool is_full_box() const noexcept = 0;
    virtual BoxKind kind() const noexcept     = 0;
    virtual BoxDecodeStatus parse(BoxDecoder& decoder, ReaderCursor& payload,
                                  Box* box) const noexcept
        = 0;
};

/// Type code to parser lookup table. Unregistered types decode as opaque.
class BoxParserRegistry final {
public:
    BoxParserRegistry() = default;

    BoxParserRegistry(const BoxParserRegistry&)            = delete;
    BoxParserRegistry& operator=(const BoxParserRegistry&) = delete;
    BoxParserRegistry(BoxParserRegistry&&)                 = default;
    BoxParserRegistry& operator=(BoxParserRegistry&&)      = default;

    /// Registers \p parser for \p type, replacing any previous one.
    void add(uint32_t type, std::unique_ptr<BoxParser> parser);
    const BoxParser* find(uint32_t type) const noexcept;
    size_t size() const noexcept;

private:
    std::unordered_map<uint32_t, std::unique_ptr<BoxParser>> parsers_;
};


/**
 * \brief Recursive decode state for one tree.
 *
 * Created by \ref decode_box_tree; parsers use it to decode nested boxes.
 */
class BoxDecoder final {
public:
    BoxDecoder(const BoxParserRegistry& registry,
               const BoxDecodeOptions& options, BoxTree* tree) noexcept;

    /**
     * \brief Decodes successive boxes until \p extent is exhausted.
     *
     * Boxes are appended to \p out in stream order. A malformed box is
     * recorded in \ref BoxTree::issues and omitted; the loop continues only
     * when the failing box's extent could be determined.
     *
     * \param forced_parser parses every child regardless of its type
     *        (used by list boxes whose child layout depends on the parent).
     * \param stop_on_failure omit any child that did not decode cleanly and
     *        stop there, keeping the decoded prefix.
     * \return status of the box that ended the loop early, or Ok.
     */
    BoxDecodeStatus decode_children(ReaderCursor& cursor,
                                    const BoxExtent& extent,
                                    std::vector<Box>* out,
                                    const BoxParser* forced_parser = nullptr,
                                    bool stop_on_failure = false) noexcept;

    const BoxDecodeResult& result() const noexcept;
    /// Depth of the box currently being parsed.
    uint32_t depth() const noexcept;

private:
    struct Step final {
        BoxDecodeStatus status = BoxDecodeStatus::Ok;
        bool keep              = false;
        bool can_continue      = false;
    };

    Step decode_box(ReaderCursor& cursor, const BoxExtent& parent,
                    const BoxParser* forced_parser, Box* out) noexcept;
    void retain_payload(Box* box) noexcept;
    void add_issue(uint64_t offset, uint32_t type, BoxDecodeStatus status,
                   const ReadResult& read, bool kept) noexcept;
    Step fail_header(uint64_t offset, uint32_t type, const ReadResult& read,
                     const ReaderCursor& view) noexcept;

    const BoxParserRegistry* registry_ = nullptr;
    BoxDecodeOptions options_;
    BoxTree* tree_ = nullptr;
    BoxDecodeResult result_;
    uint32_t depth_      = 0;
    uint32_t boxes_seen_ = 0;
    bool stopped_        = false;
};


/**
 * \brief Decodes every top-level box of \p source into \p out.
 *
 * A seekable source is decoded as a bounded root extent; a stream source as
 * an open-ended one. \p out is cleared first. The tree's payload cursors
 * reference \p source.
 */
BoxDecodeResult
decode_box_tree(ByteSource& source, const BoxParserRegistry& registry,
                BoxTree* out,
                const BoxDecodeOptions& options = BoxDecodeOptions {}) noexcept;

/**
 * \brief Decodes boxes from the current position of \p cursor to its end.
 *
 * \p cursor is advanced past the decoded boxes. Headers are read big endian;
 * the cursor's own byte order is restored before returning.
 */
BoxDecodeResult
decode_box_tree(ReaderCursor& cursor, const BoxParserRegistry& registry,
                BoxTree* out,
                const BoxDecodeOptions& options = BoxDecodeOptions {}) noexcept;

/// Returns the first direct child of \p box with \p type, or null.
const Box*
find_child(const Box& box, uint32_t type) noexcept;

/// Returns the first box in \p boxes with \p type, or null.
const Box*
find_box(const std::vector<Box>& boxes, uint32_t type) noexcept;

/// Short lowercase name for \p status.
const char*
box_decode_status_name(BoxDecodeStatus status) noexcept;

/// Short lowercase name for \p kind.
const char*
box_kind_name(BoxKind kind) noexcept;

}  // namespace boxmeta
