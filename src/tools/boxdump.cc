#include "boxmeta/box_parsers.h"
#include "boxmeta/box_tree.h"
#include "boxmeta/byte_source.h"
#include "boxmeta/console_format.h"
#include "boxmeta/file_source.h"
#include "boxmeta/resource_policy.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

#if defined(_WIN32)
#    include <fcntl.h>
#    include <io.h>
#else
#    include <fcntl.h>
#    include <unistd.h>
#endif

namespace boxmeta {
namespace {

    struct DumpOptions final {
        bool force_stream  = false;
        uint32_t hex_bytes = 0;
        BoxMetaResourcePolicy policy;
    };

    static bool parse_u64_arg(const char* s, uint64_t* out)
    {
        if (!s || !*s) {
            return false;
        }
        char* end            = nullptr;
        unsigned long long v = std::strtoull(s, &end, 10);
        if (!end || *end != '\0') {
            return false;
        }
        *out = static_cast<uint64_t>(v);
        return true;
    }

    static bool parse_u32_arg(const char* s, uint32_t* out)
    {
        uint64_t v = 0;
        if (!parse_u64_arg(s, &v) || v > 0xFFFFFFFFULL) {
            return false;
        }
        *out = static_cast<uint32_t>(v);
        return true;
    }

    static int open_read_fd(const char* path) noexcept
    {
#if defined(_WIN32)
        return ::_open(path, _O_RDONLY | _O_BINARY);
#else
        return ::open(path, O_RDONLY);
#endif
    }

    static void append_box_fields(const Box& box, std::string* line)
    {
        char buf[128];
        switch (box.kind) {
        case BoxKind::FileType: {
            line->append(" major=");
            append_fourcc(box.file_type.major_brand, line);
            std::snprintf(buf, sizeof(buf), " minor=%u",
                          static_cast<unsigned>(box.file_type.minor_version));
            line->append(buf);
            line->append(" compat=[");
            for (size_t i = 0; i < box.file_type.compatible_brands.size();
                 ++i) {
                if (i != 0U) {
                    line->push_back(',');
                }
                append_fourcc(box.file_type.compatible_brands[i], line);
            }
            line->append("] format=");
            line->append(bmff_format_name(box.file_type.format));
            break;
        }
        case BoxKind::Handler:
            line->append(" handler=");
            append_fourcc(box.handler.handler_type, line);
            line->append(" name=\"");
            (void)append_console_escaped_ascii(box.handler.name, 64, line);
            line->push_back('"');
            break;
        case BoxKind::PrimaryItem:
            std::snprintf(buf, sizeof(buf), " item_id=%u",
                          static_cast<unsigned>(box.item_id));
            line->append(buf);
            break;
        case BoxKind::ImageSpatialExtent:
            std::snprintf(buf, sizeof(buf), " width=%u height=%u",
                          static_cast<unsigned>(box.image_width),
                          static_cast<unsigned>(box.image_height));
            line->append(buf);
            break;
        case BoxKind::ImageRotation:
            std::snprintf(buf, sizeof(buf), " rotation=%u",
                          static_cast<unsigned>(box.rotation_degrees));
            line->append(buf);
            break;
        case BoxKind::ItemTypeReference: {
            std::snprintf(buf, sizeof(buf), " from=%u to=[",
                          static_cast<unsigned>(box.reference.from_item_id));
            line->append(buf);
            for (size_t i = 0; i < box.reference.to_item_ids.size(); ++i) {
                std::snprintf(buf, sizeof(buf), "%s%u", i != 0U ? "," : "",
                              static_cast<unsigned>(
                                  box.reference.to_item_ids[i]));
                line->append(buf);
            }
            line->push_back(']');
            break;
        }
        case BoxKind::Opaque:
        case BoxKind::Container:
        case BoxKind::ItemReference: break;
        }
    }

    static void print_box(const Box& box, uint32_t depth,
                          const DumpOptions& options)
    {
        std::string line(static_cast<size_t>(depth) * 2U, ' ');
        append_fourcc(box.type, &line);

        char buf[160];
        if (box.extent.open_ended) {
            std::snprintf(buf, sizeof(buf), " offset=%llu size=open header=%u",
                          static_cast<unsigned long long>(box.extent.start),
                          static_cast<unsigned>(box.extent.header_size));
        } else {
            std::snprintf(buf, sizeof(buf), " offset=%llu size=%llu header=%u",
                          static_cast<unsigned long long>(box.extent.start),
                          static_cast<unsigned long long>(box.extent.length),
                          static_cast<unsigned>(box.extent.header_size));
        }
        line.append(buf);
        if (box.extent.is_full_box) {
            std::snprintf(buf, sizeof(buf), " version=%u flags=0x%06X",
                          static_cast<unsigned>(box.extent.version),
                          static_cast<unsigned>(box.extent.flags));
            line.append(buf);
        }
        if (box.has_extended_type) {
            line.append(" uuid=");
            append_uuid(box.extended_type, &line);
        }
        line.append(" kind=");
        line.append(box_kind_name(box.kind));
        if (box.status != BoxDecodeStatus::Ok) {
            line.append(" status=");
            line.append(box_decode_status_name(box.status));
        }
        append_box_fields(box, &line);

        if (options.hex_bytes != 0U && box.kind != BoxKind::Container) {
            uint64_t n = box.payload.length();
            if (n > options.hex_bytes) {
                n = options.hex_bytes;
            }
            ReaderCursor reader = box.payload;
            std::vector<std::byte> head;
            if (n != 0U
                && reader.read_bytes_at(0, n, &head).status
                       == ReadStatus::Ok) {
                line.append(" hex=");
                append_hex_bytes(head, 0, &line);
                if (box.payload.length() > n) {
                    line.append("...");
                }
            }
        }
        std::printf("%s\n", line.c_str());

        for (size_t i = 0; i < box.children.size(); ++i) {
            print_box(box.children[i], depth + 1U, options);
        }
    }

    static void print_issues(const BoxTree& tree)
    {
        for (size_t i = 0; i < tree.issues.size(); ++i) {
            const BoxIssue& issue = tree.issues[i];
            std::string line("issue offset=");
            line.append(std::to_string(issue.offset));
            line.append(" type=");
            append_fourcc(issue.type, &line);
            line.append(" depth=");
            line.append(std::to_string(issue.depth));
            line.append(" status=");
            line.append(box_decode_status_name(issue.status));
            if (issue.kept) {
                line.append(" (partial box kept)");
            }
            if (issue.read.status != ReadStatus::Ok) {
                line.append(": ");
                line.append(format_read_error(issue.read));
            }
            std::printf("%s\n", line.c_str());
        }
    }

    static int dump_source(const char* label, ByteSource& source,
                           const BoxParserRegistry& registry,
                           const DumpOptions& options)
    {
        BoxDecodeOptions decode;
        apply_resource_policy(options.policy, nullptr, &decode);

        BoxTree tree;
        const BoxDecodeResult result = decode_box_tree(source, registry,
                                                       &tree, decode);

        std::printf("== %s\n", label);
        std::printf("source=%s bytes=%llu boxes=%u failed=%u depth=%u "
                    "status=%s\n",
                    source.is_seekable() ? "seekable" : "stream",
                    static_cast<unsigned long long>(source.length()),
                    static_cast<unsigned>(result.boxes_decoded),
                    static_cast<unsigned>(result.boxes_failed),
                    static_cast<unsigned>(result.deepest_level),
                    box_decode_status_name(result.status));
        for (size_t i = 0; i < tree.boxes.size(); ++i) {
            print_box(tree.boxes[i], 0, options);
        }
        print_issues(tree);
        return result.status == BoxDecodeStatus::Ok ? 0 : 1;
    }

    static int dump_stream_fd(const char* label, int fd, bool owns_fd,
                              const BoxParserRegistry& registry,
                              const DumpOptions& options)
    {
        FdByteStream stream(fd, owns_fd);
        SourceLimits limits;
        apply_resource_policy(options.policy, &limits, nullptr);
        ByteSource source(stream, limits);
        return dump_source(label, source, registry, options);
    }

    static int dump_path(const char* path, const BoxParserRegistry& registry,
                         const DumpOptions& options)
    {
        if (std::strcmp(path, "-") == 0) {
            return dump_stream_fd("<stdin>", 0, false, registry, options);
        }

        if (options.force_stream) {
            const int fd = open_read_fd(path);
            if (fd < 0) {
                std::fprintf(stderr, "boxdump: failed to open `%s`\n", path);
                return 1;
            }
            return dump_stream_fd(path, fd, true, registry, options);
        }

        MappedFile file;
        const MappedFileStatus st
            = file.open(path, options.policy.max_file_bytes);
        if (st != MappedFileStatus::Ok) {
            if (st == MappedFileStatus::TooLarge) {
                std::fprintf(
                    stderr,
                    "boxdump: refusing to map `%s` (--max-file-bytes=%llu)\n",
                    path,
                    static_cast<unsigned long long>(
                        options.policy.max_file_bytes));
            } else {
                std::fprintf(stderr, "boxdump: failed to map `%s` (%s)\n",
                             path, mapped_file_status_name(st));
            }
            return 1;
        }
        ByteSource source(file.bytes());
        return dump_source(path, source, registry, options);
    }

    static void usage(const char* argv0)
    {
        std::printf("usage: %s [options] <file|-> [file...]\n", argv0);
        std::printf("options:\n");
        std::printf(
            "  --stream              read files as forward-only streams (`-` always is)\n");
        std::printf(
            "  --max-depth N         max box nesting depth (default: 32)\n");
        std::printf(
            "  --max-boxes N         max boxes to decode (default: 65536)\n");
        std::printf(
            "  --max-buffer-bytes N  max bytes buffered from a stream (default: 1073741824; 0=unlimited)\n");
        std::printf(
            "  --max-file-bytes N    refuse to map files larger than N bytes (default: 0=unlimited)\n");
        std::printf(
            "  --hex N               print the first N payload bytes of leaf boxes\n");
    }

}  // namespace
}  // namespace boxmeta

int
main(int argc, char** argv)
{
    using namespace boxmeta;

    DumpOptions options;

    int first_path = 1;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (!arg) {
            continue;
        }
        if (std::strcmp(arg, "--help") == 0) {
            usage(argv[0]);
            return 0;
        }
        if (std::strcmp(arg, "--stream") == 0) {
            options.force_stream = true;
            first_path += 1;
            continue;
        }
        if (std::strcmp(arg, "--max-depth") == 0 && i + 1 < argc) {
            uint32_t v = 0;
            if (!parse_u32_arg(argv[i + 1], &v)) {
                std::fprintf(stderr, "invalid --max-depth value\n");
                return 2;
            }
            options.policy.box_limits.max_depth = v;
            i += 1;
            first_path += 2;
            continue;
        }
        if (std::strcmp(arg, "--max-boxes") == 0 && i + 1 < argc) {
            uint32_t v = 0;
            if (!parse_u32_arg(argv[i + 1], &v)) {
                std::fprintf(stderr, "invalid --max-boxes value\n");
                return 2;
            }
            options.policy.box_limits.max_boxes = v;
            i += 1;
            first_path += 2;
            continue;
        }
        if (std::strcmp(arg, "--max-buffer-bytes") == 0 && i + 1 < argc) {
            uint64_t v = 0;
            if (!parse_u64_arg(argv[i + 1], &v)) {
                std::fprintf(stderr, "invalid --max-buffer-bytes value\n");
                return 2;
            }
            options.policy.source_limits.max_buffer_bytes = v;
            i += 1;
            first_path += 2;
            continue;
        }
        if (std::strcmp(arg, "--max-file-bytes") == 0 && i + 1 < argc) {
            uint64_t v = 0;
            if (!parse_u64_arg(argv[i + 1], &v)) {
                std::fprintf(stderr, "invalid --max-file-bytes value\n");
                return 2;
            }
            options.policy.max_file_bytes = v;
            i += 1;
            first_path += 2;
            continue;
        }
        if (std::strcmp(arg, "--hex") == 0 && i + 1 < argc) {
            uint32_t v = 0;
            if (!parse_u32_arg(argv[i + 1], &v)) {
                std::fprintf(stderr, "invalid --hex value\n");
                return 2;
            }
            options.hex_bytes = v;
            i += 1;
            first_path += 2;
            continue;
        }
        if (arg[0] == '-' && arg[1] == '-') {
            std::fprintf(stderr, "boxdump: unknown option `%s`\n", arg);
            usage(argv[0]);
            return 2;
        }
        break;
    }

    if (argc <= first_path) {
        usage(argv[0]);
        return 2;
    }

    const BoxParserRegistry registry = make_default_box_registry();

    int exit_code = 0;
    for (int argi = first_path; argi < argc; ++argi) {
        const char* path = argv[argi];
        if (!path || !*path) {
            continue;
        }
        if (dump_path(path, registry, options) != 0) {
            exit_code = 1;
        }
    }
    return exit_code;
}
