#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

/**
 * \file text_decode.h
 * \brief Conversion of encoded byte strings into UTF-8.
 */

namespace boxmeta {

/// Text encodings understood by the string accessors of \ref ReaderCursor.
enum class TextEncoding : uint8_t {
    Utf8,
    Ascii,
    Latin1,
    Utf16BE,
    Utf16LE,
};

enum class TextDecodeStatus : uint8_t {
    Ok,
    /// One or more invalid sequences were replaced with U+FFFD (or `?` for ASCII).
    Replaced,
};

/**
 * \brief Decodes \p bytes in \p encoding and replaces \p out with UTF-8 text.
 *
 * Decoding never fails; invalid input is substituted, never dropped.
 */
TextDecodeStatus
decode_text_to_utf8(std::span<const std::byte> bytes, TextEncoding encoding,
                    std::string* out);

}  // namespace boxmeta
