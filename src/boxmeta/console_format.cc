#include "boxmeta/console_format.h"

#include <cstdio>

namespace boxmeta {

bool
append_console_escaped_ascii(std::string_view s, uint32_t max_bytes,
                             std::string* out) noexcept
{
    bool escaped     = false;
    const uint32_t n = (max_bytes == 0U || s.size() < max_bytes)
                           ? static_cast<uint32_t>(s.size())
                           : max_bytes;

    out->reserve(out->size() + static_cast<size_t>(n));
    for (uint32_t i = 0; i < n; ++i) {
        const unsigned char c = static_cast<unsigned char>(s[i]);
        switch (c) {
        case '\\':
        case '"':
            out->push_back('\\');
            out->push_back(static_cast<char>(c));
            continue;
        case '\n': out->append("\\n"); escaped = true; continue;
        case '\r': out->append("\\r"); escaped = true; continue;
        case '\t': out->append("\\t"); escaped = true; continue;
        default: break;
        }
        if (c < 0x20U || c == 0x7FU || c >= 0x80U) {
            char buf[8];
            std::snprintf(buf, sizeof(buf), "\\x%02X",
                          static_cast<unsigned>(c));
            out->append(buf);
            escaped = true;
            continue;
        }
        out->push_back(static_cast<char>(c));
    }
    if (n < s.size()) {
        out->append("...");
        escaped = true;
    }
    return escaped;
}


void
append_hex_bytes(std::span<const std::byte> bytes, uint32_t max_bytes,
                 std::string* out) noexcept
{
    static constexpr char kHex[] = "0123456789ABCDEF";
    const uint32_t n = (max_bytes == 0U || bytes.size() < max_bytes)
                           ? static_cast<uint32_t>(bytes.size())
                           : max_bytes;

    out->reserve(out->size() + static_cast<size_t>(n) * 2U);
    for (uint32_t i = 0; i < n; ++i) {
        const uint8_t v = static_cast<uint8_t>(bytes[i]);
        out->push_back(kHex[v >> 4]);
        out->push_back(kHex[v & 0x0FU]);
    }
    if (n < bytes.size()) {
        out->append("...");
    }
}


void
append_fourcc(uint32_t type, std::string* out) noexcept
{
    char code[4];
    bool printable = true;
    for (uint32_t i = 0; i < 4U; ++i) {
        const uint8_t c = static_cast<uint8_t>(type >> (24U - i * 8U));
        code[i]         = static_cast<char>(c);
        if (c < 0x20U || c >= 0x7FU) {
            printable = false;
        }
    }
    if (!printable) {
        char buf[16];
        std::snprintf(buf, sizeof(buf), "0x%08X", static_cast<unsigned>(type));
        out->append(buf);
        return;
    }
    (void)append_console_escaped_ascii(std::string_view(code, 4), 0, out);
}


void
append_uuid(const std::array<std::byte, 16>& uuid, std::string* out) noexcept
{
    static constexpr char kHex[] = "0123456789abcdef";
    for (size_t i = 0; i < uuid.size(); ++i) {
        if (i == 4U || i == 6U || i == 8U || i == 10U) {
            out->push_back('-');
        }
        const uint8_t v = static_cast<uint8_t>(uuid[i]);
        out->push_back(kHex[v >> 4]);
        out->push_back(kHex[v & 0x0FU]);
    }
}

}  // namespace boxmeta
