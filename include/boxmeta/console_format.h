#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace boxmeta {

// Appends an ASCII-only, terminal-safe representation of `s` into `out`.
//
// Behavior:
// - Escapes control bytes and non-ASCII as `\xNN`
// - Escapes `\n`, `\r`, `\t`, `\\` and `"`
// - Truncates to `max_bytes` bytes (0 = unlimited) and appends "..."
//
// Returns true when any escaping or truncation occurred.
bool
append_console_escaped_ascii(std::string_view s, uint32_t max_bytes,
                             std::string* out) noexcept;

// Appends uppercase hex bytes into `out` (no "0x" prefix, no separators).
// Truncates to `max_bytes` (0 = unlimited) and appends "..." when truncated.
void
append_hex_bytes(std::span<const std::byte> bytes, uint32_t max_bytes,
                 std::string* out) noexcept;

// Appends a box type code. Printable codes are written as their four
// characters (escaped like append_console_escaped_ascii); anything else as
// `0xNNNNNNNN`.
void
append_fourcc(uint32_t type, std::string* out) noexcept;

// Appends a 16-byte extended type in 8-4-4-4-12 lowercase hex form.
void
append_uuid(const std::array<std::byte, 16>& uuid, std::string* out) noexcept;

}  // namespace boxmeta
