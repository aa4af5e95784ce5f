#include "boxmeta/text_decode.h"

namespace boxmeta {
namespace {

    static constexpr uint32_t kReplacementChar = 0xFFFDU;

    static void append_utf8_codepoint(uint32_t cp, std::string* out)
    {
        if (cp <= 0x7FU) {
            out->push_back(static_cast<char>(cp));
        } else if (cp <= 0x7FFU) {
            out->push_back(static_cast<char>(0xC0U | (cp >> 6U)));
            out->push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
        } else if (cp <= 0xFFFFU) {
            out->push_back(static_cast<char>(0xE0U | (cp >> 12U)));
            out->push_back(static_cast<char>(0x80U | ((cp >> 6U) & 0x3FU)));
            out->push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
        } else {
            out->push_back(static_cast<char>(0xF0U | (cp >> 18U)));
            out->push_back(static_cast<char>(0x80U | ((cp >> 12U) & 0x3FU)));
            out->push_back(static_cast<char>(0x80U | ((cp >> 6U) & 0x3FU)));
            out->push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
        }
    }


    static TextDecodeStatus decode_ascii(std::span<const std::byte> bytes,
                                         std::string* out)
    {
        TextDecodeStatus status = TextDecodeStatus::Ok;
        for (size_t i = 0; i < bytes.size(); ++i) {
            const uint8_t c = static_cast<uint8_t>(bytes[i]);
            if (c >= 0x80U) {
                out->push_back('?');
                status = TextDecodeStatus::Replaced;
                continue;
            }
            out->push_back(static_cast<char>(c));
        }
        return status;
    }


    static TextDecodeStatus decode_latin1(std::span<const std::byte> bytes,
                                          std::string* out)
    {
        for (size_t i = 0; i < bytes.size(); ++i) {
            append_utf8_codepoint(static_cast<uint8_t>(bytes[i]), out);
        }
        return TextDecodeStatus::Ok;
    }


    // Well-formed sequences are copied through; every maximal invalid
    // subpart becomes one U+FFFD.
    static TextDecodeStatus decode_utf8(std::span<const std::byte> bytes,
                                        std::string* out)
    {
        TextDecodeStatus status = TextDecodeStatus::Ok;
        size_t i                = 0;
        while (i < bytes.size()) {
            const uint8_t b0 = static_cast<uint8_t>(bytes[i]);
            if (b0 < 0x80U) {
                out->push_back(static_cast<char>(b0));
                i += 1U;
                continue;
            }

            size_t len = 0;
            uint8_t lo = 0x80U;
            uint8_t hi = 0xBFU;
            if (b0 >= 0xC2U && b0 <= 0xDFU) {
                len = 2U;
            } else if (b0 >= 0xE0U && b0 <= 0xEFU) {
                len = 3U;
                if (b0 == 0xE0U) {
                    lo = 0xA0U;
                } else if (b0 == 0xEDU) {
                    hi = 0x9FU;
                }
            } else if (b0 >= 0xF0U && b0 <= 0xF4U) {
                len = 4U;
                if (b0 == 0xF0U) {
                    lo = 0x90U;
                } else if (b0 == 0xF4U) {
                    hi = 0x8FU;
                }
            } else {
                append_utf8_codepoint(kReplacementChar, out);
                status = TextDecodeStatus::Replaced;
                i += 1U;
                continue;
            }

            size_t j = 1U;
            for (; j < len && i + j < bytes.size(); ++j) {
                const uint8_t bj = static_cast<uint8_t>(bytes[i + j]);
                const uint8_t jl = (j == 1U) ? lo : 0x80U;
                const uint8_t jh = (j == 1U) ? hi : 0xBFU;
                if (bj < jl || bj > jh) {
                    break;
                }
            }
            if (j != len) {
                append_utf8_codepoint(kReplacementChar, out);
                status = TextDecodeStatus::Replaced;
                i += j;
                continue;
            }
            out->append(reinterpret_cast<const char*>(bytes.data() + i), len);
            i += len;
        }
        return status;
    }


    static uint16_t utf16_unit(std::span<const std::byte> bytes, size_t i,
                               bool little_endian) noexcept
    {
        const uint16_t a = static_cast<uint8_t>(bytes[i]);
        const uint16_t b = static_cast<uint8_t>(bytes[i + 1U]);
        return little_endian ? static_cast<uint16_t>(a | (b << 8U))
                             : static_cast<uint16_t>((a << 8U) | b);
    }


    static TextDecodeStatus decode_utf16(std::span<const std::byte> bytes,
                                         bool little_endian, std::string* out)
    {
        TextDecodeStatus status = TextDecodeStatus::Ok;
        size_t i                = 0;
        while (i + 1U < bytes.size()) {
            const uint16_t u0 = utf16_unit(bytes, i, little_endian);
            i += 2U;

            if (u0 >= 0xD800U && u0 <= 0xDBFFU) {
                if (i + 1U < bytes.size()) {
                    const uint16_t u1 = utf16_unit(bytes, i, little_endian);
                    if (u1 >= 0xDC00U && u1 <= 0xDFFFU) {
                        i += 2U;
                        const uint32_t cp
                            = 0x10000U
                              + (((static_cast<uint32_t>(u0) - 0xD800U) << 10U)
                                 | (static_cast<uint32_t>(u1) - 0xDC00U));
                        append_utf8_codepoint(cp, out);
                        continue;
                    }
                }
                append_utf8_codepoint(kReplacementChar, out);
                status = TextDecodeStatus::Replaced;
                continue;
            }
            if (u0 >= 0xDC00U && u0 <= 0xDFFFU) {
                append_utf8_codepoint(kReplacementChar, out);
                status = TextDecodeStatus::Replaced;
                continue;
            }
            append_utf8_codepoint(u0, out);
        }
        if (i < bytes.size()) {
            // Odd trailing byte.
            append_utf8_codepoint(kReplacementChar, out);
            status = TextDecodeStatus::Replaced;
        }
        return status;
    }

}  // namespace

TextDecodeStatus
decode_text_to_utf8(std::span<const std::byte> bytes, TextEncoding encoding,
                    std::string* out)
{
    out->clear();
    out->reserve(bytes.size());
    switch (encoding) {
    case TextEncoding::Utf8: return decode_utf8(bytes, out);
    case TextEncoding::Ascii: return decode_ascii(bytes, out);
    case TextEncoding::Latin1: return decode_latin1(bytes, out);
    case TextEncoding::Utf16BE: return decode_utf16(bytes, false, out);
    case TextEncoding::Utf16LE: return decode_utf16(bytes, true, out);
    }
    return decode_utf8(bytes, out);
}

}  // namespace boxmeta
