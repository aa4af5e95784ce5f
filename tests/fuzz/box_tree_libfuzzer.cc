#include "boxmeta/box_parsers.h"
#include "boxmeta/box_tree.h"
#include "boxmeta/byte_source.h"

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <span>
#include <vector>

namespace boxmeta {

[[noreturn]] static void
fuzz_trap() noexcept
{
#if defined(__clang__) || defined(__GNUC__)
    __builtin_trap();
#else
    std::abort();
#endif
}

static void
verify_box(const Box& box, uint64_t parent_start, uint64_t parent_end,
           uint64_t data_size, uint32_t depth, uint32_t max_depth) noexcept
{
    if (depth >= max_depth) {
        fuzz_trap();
    }
    if (box.extent.start < parent_start || box.extent.start > parent_end) {
        fuzz_trap();
    }
    if (box.extent.header_size < 8U) {
        fuzz_trap();
    }

    uint64_t end = parent_end;
    if (!box.extent.open_ended) {
        if (box.extent.length < box.extent.header_size
            || box.extent.length > parent_end - box.extent.start) {
            fuzz_trap();
        }
        end = box.extent.start + box.extent.length;
        if (box.payload.length() != box.extent.payload_length()) {
            fuzz_trap();
        }
    }
    if (box.payload.start() != box.extent.payload_start()) {
        fuzz_trap();
    }
    if (box.status == BoxDecodeStatus::Ok && end > data_size) {
        fuzz_trap();
    }

    uint64_t last_start = box.extent.start;
    for (size_t i = 0; i < box.children.size(); ++i) {
        const Box& child = box.children[i];
        if (child.extent.start < last_start) {
            fuzz_trap();
        }
        last_start = child.extent.start;
        verify_box(child, box.extent.payload_start(), end, data_size,
                   depth + 1U, max_depth);
    }
}

static void
verify_tree(const BoxTree& tree, const BoxDecodeResult& result,
            uint64_t data_size, uint32_t max_depth) noexcept
{
    if (result.boxes_failed != tree.issues.size()) {
        fuzz_trap();
    }
    if ((result.status == BoxDecodeStatus::Ok) != tree.issues.empty()) {
        fuzz_trap();
    }
    for (size_t i = 0; i < tree.boxes.size(); ++i) {
        verify_box(tree.boxes[i], 0, UINT64_MAX, data_size, 0, max_depth);
    }
}

}  // namespace boxmeta

extern "C" int
LLVMFuzzerTestOneInput(const uint8_t* data, size_t size)
{
    using namespace boxmeta;

    const std::span<const std::byte> bytes(
        reinterpret_cast<const std::byte*>(data), size);
    static const BoxParserRegistry registry = make_default_box_registry();

    BoxDecodeOptions options;
    options.retain_opaque_payloads              = true;
    options.limits.max_depth                    = 16;
    options.limits.max_boxes                    = 4096;
    options.limits.max_retained_payload_bytes   = 1U << 20;

    {
        ByteSource source(bytes);
        BoxTree tree;
        const BoxDecodeResult result = decode_box_tree(source, registry,
                                                       &tree, options);
        verify_tree(tree, result, size, options.limits.max_depth);
        if (tree.arena.size() > options.limits.max_retained_payload_bytes) {
            fuzz_trap();
        }
    }

    {
        MemoryByteStream stream(bytes, 7);
        SourceLimits limits;
        limits.pull_chunk_bytes = 16;
        ByteSource source(stream, limits);
        BoxTree tree;
        const BoxDecodeResult result = decode_box_tree(source, registry,
                                                       &tree, options);
        verify_tree(tree, result, size, options.limits.max_depth);
        if (stream.bytes_pulled() > size) {
            fuzz_trap();
        }
    }
    return 0;
}
