#pragma once

#include "boxmeta/byte_source.h"
#include "boxmeta/text_decode.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

/**
 * \file reader_cursor.h
 * \brief Positioned, byte-order-aware view over a \ref ByteSource.
 */

namespace boxmeta {

/**
 * \brief Typed reader over a (sub-)range of a \ref ByteSource.
 *
 * Every accessor comes in two forms:
 * - `read_x(out)` reads at the sequential position and advances it by the
 *   decoded width (only when the read succeeds);
 * - `read_x_at(index, out)` reads at \p index relative to \ref start() and
 *   never moves the sequential position.
 *
 * All failures use the same \ref ReadResult shape. Bounds violations carry
 * the requested absolute index, the requested count and the highest valid
 * absolute index.
 *
 * A cursor never owns the bytes. Copies share the source and have their own
 * start/position/length/byte order.
 */
class ReaderCursor final {
public:
    /// Detached cursor; every read fails.
    ReaderCursor() noexcept = default;
    /// View over the whole of \p source (open ended).
    explicit ReaderCursor(ByteSource& source, bool big_endian = true) noexcept;
    /// View over `[start, start + length)` of \p source.
    ReaderCursor(ByteSource& source, uint64_t start, uint64_t length,
                 bool big_endian = true) noexcept;

    ByteSource* source() const noexcept;
    /// Absolute offset of this view's zero.
    uint64_t start() const noexcept;
    /// Sequential position relative to \ref start().
    uint64_t position() const noexcept;
    uint64_t absolute_position() const noexcept;
    /// True when the view has an explicit length.
    bool has_length() const noexcept;
    /// Explicit length, or what the source currently holds past \ref start().
    uint64_t length() const noexcept;

    bool is_big_endian() const noexcept;
    void set_big_endian(bool big_endian) noexcept;

    /**
     * \brief Moves the sequential position by \p offset bytes.
     *
     * Moving backward past zero clamps to zero. Moving forward buffers the
     * source as needed and fails past the view or past the data.
     */
    ReadResult skip(int64_t offset) noexcept;
    /// \ref skip that reports failure as `false`.
    bool try_skip(int64_t offset) noexcept;
    /// True when fewer than \p count bytes remain after the position.
    bool is_near_end(uint64_t count) noexcept;
    /// Compares the first `pattern.size()` bytes of the view with \p pattern.
    bool starts_with(std::span<const std::byte> pattern) noexcept;

    /**
     * \brief Derives a view of \p length bytes at `position() + offset`.
     *
     * The derived view inherits the byte order, or flips it when
     * \p flip_byte_order is set.
     */
    ReadResult clone(uint64_t offset, uint64_t length, bool flip_byte_order,
                     ReaderCursor* out) const noexcept;
    /// Like \ref clone, covering everything after `position() + offset`.
    ReadResult clone_to_end(uint64_t offset, bool flip_byte_order,
                            ReaderCursor* out) const noexcept;

    /// Reads exactly `dst.size()` bytes.
    ReadResult read(std::span<std::byte> dst) noexcept;
    ReadResult read_at(uint64_t index, std::span<std::byte> dst) noexcept;
    /// Reads up to `dst.size()` bytes, stopping at the end of the data.
    ReadResult read_partial(std::span<std::byte> dst,
                            uint64_t* out_read) noexcept;
    /// Reads \p count bytes; the range is validated before allocating.
    ReadResult read_bytes(uint64_t count, std::vector<std::byte>* out);
    ReadResult read_bytes_at(uint64_t index, uint64_t count,
                             std::vector<std::byte>* out);

    ReadResult read_u8(uint8_t* out) noexcept;
    ReadResult read_u8_at(uint64_t index, uint8_t* out) noexcept;
    ReadResult read_i8(int8_t* out) noexcept;
    ReadResult read_i8_at(uint64_t index, int8_t* out) noexcept;
    ReadResult read_u16(uint16_t* out) noexcept;
    ReadResult read_u16_at(uint64_t index, uint16_t* out) noexcept;
    ReadResult read_i16(int16_t* out) noexcept;
    ReadResult read_i16_at(uint64_t index, int16_t* out) noexcept;
    /// Unsigned 24-bit value widened to 32 bits.
    ReadResult read_u24(uint32_t* out) noexcept;
    ReadResult read_u24_at(uint64_t index, uint32_t* out) noexcept;
    ReadResult read_u32(uint32_t* out) noexcept;
    ReadResult read_u32_at(uint64_t index, uint32_t* out) noexcept;
    ReadResult read_i32(int32_t* out) noexcept;
    ReadResult read_i32_at(uint64_t index, int32_t* out) noexcept;
    ReadResult read_u64(uint64_t* out) noexcept;
    ReadResult read_u64_at(uint64_t index, uint64_t* out) noexcept;
    ReadResult read_i64(int64_t* out) noexcept;
    ReadResult read_i64_at(uint64_t index, int64_t* out) noexcept;

    /// Signed 15.16 fixed point (`raw / 65536`).
    ReadResult read_s15_fixed16(float* out) noexcept;
    ReadResult read_s15_fixed16_at(uint64_t index, float* out) noexcept;
    /// IEEE-754 binary32 from the bit pattern of a 32-bit read.
    ReadResult read_f32(float* out) noexcept;
    ReadResult read_f32_at(uint64_t index, float* out) noexcept;
    /// IEEE-754 binary64 from the bit pattern of a 64-bit read.
    ReadResult read_f64(double* out) noexcept;
    ReadResult read_f64_at(uint64_t index, double* out) noexcept;

    /// Tests bit `bit_index % 8` (LSB = 0) of byte `bit_index / 8`.
    ReadResult read_bit_at(uint64_t bit_index, bool* out) noexcept;

    /// Decodes exactly \p count bytes as \p encoding into UTF-8.
    ReadResult read_string(uint64_t count, TextEncoding encoding,
                           std::string* out);
    ReadResult read_string_at(uint64_t index, uint64_t count,
                              TextEncoding encoding, std::string* out);

    /**
     * \brief Reads up to \p max_length bytes, stopping at the first zero byte.
     *
     * The zero byte is not returned. In sequential mode it is consumed.
     * Reaching \p max_length without a terminator is not an error; running
     * out of data before either is a bounds violation.
     */
    ReadResult read_null_terminated_bytes(uint64_t max_length,
                                          std::vector<std::byte>* out);
    ReadResult read_null_terminated_bytes_at(uint64_t index,
                                             uint64_t max_length,
                                             std::vector<std::byte>* out);
    ReadResult read_null_terminated_string(
        uint64_t max_length, std::string* out,
        TextEncoding encoding = TextEncoding::Utf8);
    ReadResult read_null_terminated_string_at(
        uint64_t index, uint64_t max_length, std::string* out,
        TextEncoding encoding = TextEncoding::Utf8);

    /**
     * \brief Reads one line terminated by `\n`, `\r\n`, `\r` or the view end.
     *
     * \p out_has_line is false only when nothing was read because the view
     * was already exhausted.
     */
    ReadResult read_line(std::string* out, bool* out_has_line);

    /// Copies every byte of the view (drains an open stream view first).
    ReadResult to_array(std::vector<std::byte>* out);

private:
    struct Address final {
        bool sequential = true;
        uint64_t index  = 0;
    };

    static Address next() noexcept;
    static Address at(uint64_t index) noexcept;

    ReaderCursor(ByteSource* source, uint64_t start, bool has_length,
                 uint64_t length, bool big_endian) noexcept;

    uint64_t local_index(Address addr) const noexcept;
    int64_t last_index() const noexcept;
    ReadResult check_view(uint64_t local, uint64_t count) const noexcept;
    ReadResult fetch(Address addr, std::span<std::byte> dst) noexcept;
    ReadResult fetch_uint(Address addr, uint32_t width,
                          uint64_t* out) noexcept;
    ReadResult fetch_bytes(Address addr, uint64_t count,
                           std::vector<std::byte>* out);
    ReadResult fetch_null_terminated(Address addr, uint64_t max_length,
                                     std::vector<std::byte>* out);

    ByteSource* source_ = nullptr;
    uint64_t start_     = 0;
    uint64_t position_  = 0;
    uint64_t length_    = 0;
    bool has_length_    = false;
    bool big_endian_    = true;
};

}  // namespace boxmeta
