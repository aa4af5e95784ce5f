#include "boxmeta/box_parsers.h"
#include "boxmeta/box_tree.h"
#include "boxmeta/byte_source.h"
#include "boxmeta/console_format.h"

#include <nanobind/nanobind.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/vector.h>

#include <cstring>
#include <string>
#include <utility>
#include <vector>

namespace nb = nanobind;
using namespace nb::literals;

namespace boxmeta {
namespace {

    // Detached copy of a decoded box; the source bytes do not outlive the
    // decode call.
    struct PyBox final {
        std::string type;
        uint64_t offset      = 0;
        uint64_t size        = 0;
        bool open_ended      = false;
        uint32_t header_size = 0;
        bool is_full_box     = false;
        uint32_t version     = 0;
        uint32_t flags       = 0;
        bool has_extended_type = false;
        std::string extended_type;
        std::string kind;
        std::string status;
        std::vector<PyBox> children;
    };


    static PyBox to_py_box(const Box& box)
    {
        PyBox out;
        append_fourcc(box.type, &out.type);
        out.offset            = box.extent.start;
        out.size              = box.extent.length;
        out.open_ended        = box.extent.open_ended;
        out.header_size       = box.extent.header_size;
        out.is_full_box       = box.extent.is_full_box;
        out.version           = box.extent.version;
        out.flags             = box.extent.flags;
        out.has_extended_type = box.has_extended_type;
        if (box.has_extended_type) {
            out.extended_type.assign(
                reinterpret_cast<const char*>(box.extended_type.data()),
                box.extended_type.size());
        }
        out.kind   = box_kind_name(box.kind);
        out.status = box_decode_status_name(box.status);
        out.children.reserve(box.children.size());
        for (size_t i = 0; i < box.children.size(); ++i) {
            out.children.push_back(to_py_box(box.children[i]));
        }
        return out;
    }


    static std::vector<PyBox> decode_to_python(nb::bytes data,
                                               uint32_t max_depth,
                                               uint32_t max_boxes)
    {
        std::vector<std::byte> bytes(data.size());
        if (!bytes.empty()) {
            std::memcpy(bytes.data(), data.c_str(), bytes.size());
        }

        std::vector<PyBox> out;
        {
            nb::gil_scoped_release gil_release;
            ByteSource source(std::move(bytes));
            const BoxParserRegistry registry = make_default_box_registry();

            BoxDecodeOptions options;
            options.limits.max_depth = max_depth;
            options.limits.max_boxes = max_boxes;

            BoxTree tree;
            (void)decode_box_tree(source, registry, &tree, options);
            out.reserve(tree.boxes.size());
            for (size_t i = 0; i < tree.boxes.size(); ++i) {
                out.push_back(to_py_box(tree.boxes[i]));
            }
        }
        return out;
    }

}  // namespace
}  // namespace boxmeta

NB_MODULE(boxmeta, m)
{
    using namespace boxmeta;

    m.doc() = "boxmeta box tree decoding bindings (nanobind).";

    nb::class_<PyBox>(m, "Box")
        .def_prop_ro("type", [](const PyBox& b) { return b.type; })
        .def_prop_ro("offset", [](const PyBox& b) { return b.offset; })
        .def_prop_ro("size",
                     [](const PyBox& b) -> nb::object {
                         if (b.open_ended) {
                             return nb::none();
                         }
                         return nb::int_(b.size);
                     })
        .def_prop_ro("header_size",
                     [](const PyBox& b) { return b.header_size; })
        .def_prop_ro("version",
                     [](const PyBox& b) -> nb::object {
                         if (!b.is_full_box) {
                             return nb::none();
                         }
                         return nb::int_(b.version);
                     })
        .def_prop_ro("flags",
                     [](const PyBox& b) -> nb::object {
                         if (!b.is_full_box) {
                             return nb::none();
                         }
                         return nb::int_(b.flags);
                     })
        .def_prop_ro("extended_type",
                     [](const PyBox& b) -> nb::object {
                         if (!b.has_extended_type) {
                             return nb::none();
                         }
                         return nb::bytes(b.extended_type.data(),
                                          b.extended_type.size());
                     })
        .def_prop_ro("kind", [](const PyBox& b) { return b.kind; })
        .def_prop_ro("status", [](const PyBox& b) { return b.status; })
        .def_prop_ro("children", [](const PyBox& b) { return b.children; })
        .def("__repr__", [](const PyBox& b) {
            return "<boxmeta.Box " + b.type + " offset="
                   + std::to_string(b.offset) + ">";
        });

    m.def("decode", &decode_to_python, "data"_a, "max_depth"_a = 32U,
          "max_boxes"_a = 1U << 16,
          "Decodes a box tree from `data` and returns the top-level boxes.");
}
