#include "boxmeta/reader_cursor.h"

#include <array>
#include <bit>
#include <cstring>
#include <limits>

namespace boxmeta {
namespace {

    static constexpr uint64_t kMaxU64 = std::numeric_limits<uint64_t>::max();

    static int64_t to_i64(uint64_t v) noexcept
    {
        if (v > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            return std::numeric_limits<int64_t>::max();
        }
        return static_cast<int64_t>(v);
    }

    static constexpr uint8_t u8(std::byte b) noexcept
    {
        return static_cast<uint8_t>(b);
    }

}  // namespace

ReaderCursor::ReaderCursor(ByteSource& source, bool big_endian) noexcept
    : source_(&source)
    , big_endian_(big_endian)
{
}


ReaderCursor::ReaderCursor(ByteSource& source, uint64_t start, uint64_t length,
                           bool big_endian) noexcept
    : source_(&source)
    , start_(start)
    , length_(length)
    , has_length_(true)
    , big_endian_(big_endian)
{
}


ReaderCursor::ReaderCursor(ByteSource* source, uint64_t start,
                           bool has_length, uint64_t length,
                           bool big_endian) noexcept
    : source_(source)
    , start_(start)
    , length_(length)
    , has_length_(has_length)
    , big_endian_(big_endian)
{
}


ReaderCursor::Address
ReaderCursor::next() noexcept
{
    return Address { true, 0 };
}


ReaderCursor::Address
ReaderCursor::at(uint64_t index) noexcept
{
    return Address { false, index };
}


ByteSource*
ReaderCursor::source() const noexcept
{
    return source_;
}


uint64_t
ReaderCursor::start() const noexcept
{
    return start_;
}


uint64_t
ReaderCursor::position() const noexcept
{
    return position_;
}


uint64_t
ReaderCursor::absolute_position() const noexcept
{
    return start_ + position_;
}


bool
ReaderCursor::has_length() const noexcept
{
    return has_length_;
}


uint64_t
ReaderCursor::length() const noexcept
{
    if (has_length_) {
        return length_;
    }
    if (!source_) {
        return 0;
    }
    const uint64_t total = source_->length();
    return (total > start_) ? total - start_ : 0U;
}


bool
ReaderCursor::is_big_endian() const noexcept
{
    return big_endian_;
}


void
ReaderCursor::set_big_endian(bool big_endian) noexcept
{
    big_endian_ = big_endian;
}


uint64_t
ReaderCursor::local_index(Address addr) const noexcept
{
    return addr.sequential ? position_ : addr.index;
}


int64_t
ReaderCursor::last_index() const noexcept
{
    if (has_length_) {
        return to_i64(start_ + length_) - 1;
    }
    if (!source_) {
        return -1;
    }
    return to_i64(source_->length()) - 1;
}


ReadResult
ReaderCursor::check_view(uint64_t local, uint64_t count) const noexcept
{
    if (!source_) {
        return make_bounds_violation(to_i64(local), count, -1);
    }
    if (local > kMaxU64 - start_ || count > kMaxU64 - (start_ + local)) {
        return make_bounds_violation(to_i64(start_ + local), count,
                                     last_index());
    }
    if (has_length_ && (local > length_ || count > length_ - local)) {
        return make_bounds_violation(to_i64(start_ + local), count,
                                     last_index());
    }
    return ReadResult {};
}


ReadResult
ReaderCursor::fetch(Address addr, std::span<std::byte> dst) noexcept
{
    const uint64_t local = local_index(addr);
    const uint64_t count = static_cast<uint64_t>(dst.size());
    const ReadResult view = check_view(local, count);
    if (view.status != ReadStatus::Ok) {
        return view;
    }

    uint64_t got       = 0;
    const ReadResult r = source_->read_at(start_ + local, dst, false, &got);
    if (r.status != ReadStatus::Ok) {
        return r;
    }
    if (addr.sequential) {
        position_ += count;
    }
    return ReadResult {};
}


ReadResult
ReaderCursor::fetch_uint(Address addr, uint32_t width, uint64_t* out) noexcept
{
    std::array<std::byte, 8> raw {};
    const ReadResult r = fetch(addr, std::span<std::byte>(raw.data(), width));
    if (r.status != ReadStatus::Ok) {
        return r;
    }

    uint64_t v = 0;
    if (big_endian_) {
        for (uint32_t i = 0; i < width; ++i) {
            v = (v << 8U) | static_cast<uint64_t>(u8(raw[i]));
        }
    } else {
        for (uint32_t i = 0; i < width; ++i) {
            v |= static_cast<uint64_t>(u8(raw[i])) << (i * 8U);
        }
    }
    *out = v;
    return ReadResult {};
}


ReadResult
ReaderCursor::fetch_bytes(Address addr, uint64_t count,
                          std::vector<std::byte>* out)
{
    out->clear();
    const uint64_t local  = local_index(addr);
    const ReadResult view = check_view(local, count);
    if (view.status != ReadStatus::Ok) {
        return view;
    }
    if (count == 0U) {
        return ReadResult {};
    }

    // Refuse to allocate for a range that cannot be satisfied.
    uint64_t available = 0;
    const ReadResult range
        = source_->validate_range(to_i64(start_ + local), count, &available);
    if (range.status != ReadStatus::Ok) {
        return range;
    }
    if (available < count) {
        return make_bounds_violation(to_i64(start_ + local), count,
                                     last_index());
    }

    out->resize(static_cast<size_t>(count));
    const ReadResult r = fetch(addr, std::span<std::byte>(*out));
    if (r.status != ReadStatus::Ok) {
        out->clear();
    }
    return r;
}


ReadResult
ReaderCursor::fetch_null_terminated(Address addr, uint64_t max_length,
                                    std::vector<std::byte>* out)
{
    out->clear();
    const uint64_t saved = position_;
    const uint64_t first = local_index(addr);

    for (uint64_t i = 0; i < max_length; ++i) {
        if (!addr.sequential && i > kMaxU64 - first) {
            return make_bounds_violation(to_i64(start_ + first), max_length,
                                         last_index());
        }
        std::byte b {};
        const ReadResult r
            = fetch(addr.sequential ? next() : at(first + i),
                    std::span<std::byte>(&b, 1));
        if (r.status != ReadStatus::Ok) {
            position_ = saved;
            out->clear();
            return r;
        }
        if (b == std::byte { 0 }) {
            break;
        }
        out->push_back(b);
    }
    return ReadResult {};
}


ReadResult
ReaderCursor::skip(int64_t offset) noexcept
{
    uint64_t target = 0;
    if (offset < 0) {
        const uint64_t back = static_cast<uint64_t>(-(offset + 1)) + 1U;
        target              = (back > position_) ? 0U : position_ - back;
    } else {
        const uint64_t fwd = static_cast<uint64_t>(offset);
        if (fwd > kMaxU64 - position_) {
            return make_bounds_violation(to_i64(absolute_position()), fwd,
                                         last_index());
        }
        target = position_ + fwd;
    }

    if (target > position_) {
        const uint64_t count  = target - position_;
        const ReadResult view = check_view(position_, count);
        if (view.status != ReadStatus::Ok) {
            return view;
        }
        const ReadResult r = source_->ensure_available(absolute_position(),
                                                       count);
        if (r.status != ReadStatus::Ok) {
            return r;
        }
    }
    position_ = target;
    return ReadResult {};
}


bool
ReaderCursor::try_skip(int64_t offset) noexcept
{
    return skip(offset).status == ReadStatus::Ok;
}


bool
ReaderCursor::is_near_end(uint64_t count) noexcept
{
    if (!source_) {
        return count != 0U;
    }
    if (has_length_) {
        return position_ > length_ || count > length_ - position_;
    }
    return source_->ensure_available(absolute_position(), count).status
           != ReadStatus::Ok;
}


bool
ReaderCursor::starts_with(std::span<const std::byte> pattern) noexcept
{
    if (pattern.empty()) {
        return true;
    }
    if (!source_) {
        return false;
    }
    if ((has_length_ || source_->length_known())
        && length() < pattern.size()) {
        return false;
    }
    std::vector<std::byte> head(pattern.size());
    if (read_at(0, std::span<std::byte>(head)).status != ReadStatus::Ok) {
        return false;
    }
    return std::memcmp(head.data(), pattern.data(), pattern.size()) == 0;
}


ReadResult
ReaderCursor::clone(uint64_t offset, uint64_t length, bool flip_byte_order,
                    ReaderCursor* out) const noexcept
{
    if (offset > kMaxU64 - position_) {
        return make_bounds_violation(to_i64(absolute_position()), length,
                                     last_index());
    }
    const uint64_t base   = position_ + offset;
    const ReadResult view = check_view(base, length);
    if (view.status != ReadStatus::Ok) {
        return view;
    }
    *out = ReaderCursor(source_, start_ + base, true, length,
                        big_endian_ != flip_byte_order);
    return ReadResult {};
}


ReadResult
ReaderCursor::clone_to_end(uint64_t offset, bool flip_byte_order,
                           ReaderCursor* out) const noexcept
{
    if (offset > kMaxU64 - position_) {
        return make_bounds_violation(to_i64(absolute_position()), 0,
                                     last_index());
    }
    const uint64_t base   = position_ + offset;
    const ReadResult view = check_view(base, 0);
    if (view.status != ReadStatus::Ok) {
        return view;
    }
    if (has_length_) {
        *out = ReaderCursor(source_, start_ + base, true, length_ - base,
                            big_endian_ != flip_byte_order);
    } else {
        *out = ReaderCursor(source_, start_ + base, false, 0,
                            big_endian_ != flip_byte_order);
    }
    return ReadResult {};
}


ReadResult
ReaderCursor::read(std::span<std::byte> dst) noexcept
{
    return fetch(next(), dst);
}


ReadResult
ReaderCursor::read_at(uint64_t index, std::span<std::byte> dst) noexcept
{
    return fetch(at(index), dst);
}


ReadResult
ReaderCursor::read_partial(std::span<std::byte> dst,
                           uint64_t* out_read) noexcept
{
    *out_read = 0;
    if (!source_) {
        return make_bounds_violation(to_i64(position_), dst.size(), -1);
    }
    uint64_t want = static_cast<uint64_t>(dst.size());
    if (has_length_) {
        const uint64_t rem = (position_ < length_) ? length_ - position_ : 0U;
        if (want > rem) {
            want = rem;
        }
    }
    if (want == 0U) {
        return ReadResult {};
    }

    uint64_t got       = 0;
    const ReadResult r = source_->read_at(
        absolute_position(),
        dst.first(static_cast<size_t>(want)), true, &got);
    if (r.status != ReadStatus::Ok) {
        return r;
    }
    position_ += got;
    *out_read = got;
    return ReadResult {};
}


ReadResult
ReaderCursor::read_bytes(uint64_t count, std::vector<std::byte>* out)
{
    return fetch_bytes(next(), count, out);
}


ReadResult
ReaderCursor::read_bytes_at(uint64_t index, uint64_t count,
                            std::vector<std::byte>* out)
{
    return fetch_bytes(at(index), count, out);
}


ReadResult
ReaderCursor::read_u8(uint8_t* out) noexcept
{
    uint64_t v         = 0;
    const ReadResult r = fetch_uint(next(), 1U, &v);
    *out               = static_cast<uint8_t>(v);
    return r;
}


ReadResult
ReaderCursor::read_u8_at(uint64_t index, uint8_t* out) noexcept
{
    uint64_t v         = 0;
    const ReadResult r = fetch_uint(at(index), 1U, &v);
    *out               = static_cast<uint8_t>(v);
    return r;
}


ReadResult
ReaderCursor::read_i8(int8_t* out) noexcept
{
    uint64_t v         = 0;
    const ReadResult r = fetch_uint(next(), 1U, &v);
    *out               = static_cast<int8_t>(static_cast<uint8_t>(v));
    return r;
}


ReadResult
ReaderCursor::read_i8_at(uint64_t index, int8_t* out) noexcept
{
    uint64_t v         = 0;
    const ReadResult r = fetch_uint(at(index), 1U, &v);
    *out               = static_cast<int8_t>(static_cast<uint8_t>(v));
    return r;
}


ReadResult
ReaderCursor::read_u16(uint16_t* out) noexcept
{
    uint64_t v         = 0;
    const ReadResult r = fetch_uint(next(), 2U, &v);
    *out               = static_cast<uint16_t>(v);
    return r;
}


ReadResult
ReaderCursor::read_u16_at(uint64_t index, uint16_t* out) noexcept
{
    uint64_t v         = 0;
    const ReadResult r = fetch_uint(at(index), 2U, &v);
    *out               = static_cast<uint16_t>(v);
    return r;
}


ReadResult
ReaderCursor::read_i16(int16_t* out) noexcept
{
    uint64_t v         = 0;
    const ReadResult r = fetch_uint(next(), 2U, &v);
    *out               = static_cast<int16_t>(static_cast<uint16_t>(v));
    return r;
}


ReadResult
ReaderCursor::read_i16_at(uint64_t index, int16_t* out) noexcept
{
    uint64_t v         = 0;
    const ReadResult r = fetch_uint(at(index), 2U, &v);
    *out               = static_cast<int16_t>(static_cast<uint16_t>(v));
    return r;
}


ReadResult
ReaderCursor::read_u24(uint32_t* out) noexcept
{
    uint64_t v         = 0;
    const ReadResult r = fetch_uint(next(), 3U, &v);
    *out               = static_cast<uint32_t>(v);
    return r;
}


ReadResult
ReaderCursor::read_u24_at(uint64_t index, uint32_t* out) noexcept
{
    uint64_t v         = 0;
    const ReadResult r = fetch_uint(at(index), 3U, &v);
    *out               = static_cast<uint32_t>(v);
    return r;
}


ReadResult
ReaderCursor::read_u32(uint32_t* out) noexcept
{
    uint64_t v         = 0;
    const ReadResult r = fetch_uint(next(), 4U, &v);
    *out               = static_cast<uint32_t>(v);
    return r;
}


ReadResult
ReaderCursor::read_u32_at(uint64_t index, uint32_t* out) noexcept
{
    uint64_t v         = 0;
    const ReadResult r = fetch_uint(at(index), 4U, &v);
    *out               = static_cast<uint32_t>(v);
    return r;
}


ReadResult
ReaderCursor::read_i32(int32_t* out) noexcept
{
    uint64_t v         = 0;
    const ReadResult r = fetch_uint(next(), 4U, &v);
    *out               = static_cast<int32_t>(static_cast<uint32_t>(v));
    return r;
}


ReadResult
ReaderCursor::read_i32_at(uint64_t index, int32_t* out) noexcept
{
    uint64_t v         = 0;
    const ReadResult r = fetch_uint(at(index), 4U, &v);
    *out               = static_cast<int32_t>(static_cast<uint32_t>(v));
    return r;
}


ReadResult
ReaderCursor::read_u64(uint64_t* out) noexcept
{
    return fetch_uint(next(), 8U, out);
}


ReadResult
ReaderCursor::read_u64_at(uint64_t index, uint64_t* out) noexcept
{
    return fetch_uint(at(index), 8U, out);
}


ReadResult
ReaderCursor::read_i64(int64_t* out) noexcept
{
    uint64_t v         = 0;
    const ReadResult r = fetch_uint(next(), 8U, &v);
    *out               = static_cast<int64_t>(v);
    return r;
}


ReadResult
ReaderCursor::read_i64_at(uint64_t index, int64_t* out) noexcept
{
    uint64_t v         = 0;
    const ReadResult r = fetch_uint(at(index), 8U, &v);
    *out               = static_cast<int64_t>(v);
    return r;
}


ReadResult
ReaderCursor::read_s15_fixed16(float* out) noexcept
{
    int32_t raw        = 0;
    const ReadResult r = read_i32(&raw);
    *out               = static_cast<float>(static_cast<double>(raw) / 65536.0);
    return r;
}


ReadResult
ReaderCursor::read_s15_fixed16_at(uint64_t index, float* out) noexcept
{
    int32_t raw        = 0;
    const ReadResult r = read_i32_at(index, &raw);
    *out               = static_cast<float>(static_cast<double>(raw) / 65536.0);
    return r;
}


ReadResult
ReaderCursor::read_f32(float* out) noexcept
{
    uint32_t bits      = 0;
    const ReadResult r = read_u32(&bits);
    *out               = std::bit_cast<float>(bits);
    return r;
}


ReadResult
ReaderCursor::read_f32_at(uint64_t index, float* out) noexcept
{
    uint32_t bits      = 0;
    const ReadResult r = read_u32_at(index, &bits);
    *out               = std::bit_cast<float>(bits);
    return r;
}


ReadResult
ReaderCursor::read_f64(double* out) noexcept
{
    uint64_t bits      = 0;
    const ReadResult r = read_u64(&bits);
    *out               = std::bit_cast<double>(bits);
    return r;
}


ReadResult
ReaderCursor::read_f64_at(uint64_t index, double* out) noexcept
{
    uint64_t bits      = 0;
    const ReadResult r = read_u64_at(index, &bits);
    *out               = std::bit_cast<double>(bits);
    return r;
}


ReadResult
ReaderCursor::read_bit_at(uint64_t bit_index, bool* out) noexcept
{
    uint8_t b          = 0;
    const ReadResult r = read_u8_at(bit_index / 8U, &b);
    *out               = ((b >> (bit_index % 8U)) & 1U) != 0U;
    return r;
}


ReadResult
ReaderCursor::read_string(uint64_t count, TextEncoding encoding,
                          std::string* out)
{
    out->clear();
    std::vector<std::byte> bytes;
    const ReadResult r = fetch_bytes(next(), count, &bytes);
    if (r.status == ReadStatus::Ok) {
        (void)decode_text_to_utf8(bytes, encoding, out);
    }
    return r;
}


ReadResult
ReaderCursor::read_string_at(uint64_t index, uint64_t count,
                             TextEncoding encoding, std::string* out)
{
    out->clear();
    std::vector<std::byte> bytes;
    const ReadResult r = fetch_bytes(at(index), count, &bytes);
    if (r.status == ReadStatus::Ok) {
        (void)decode_text_to_utf8(bytes, encoding, out);
    }
    return r;
}


ReadResult
ReaderCursor::read_null_terminated_bytes(uint64_t max_length,
                                         std::vector<std::byte>* out)
{
    return fetch_null_terminated(next(), max_length, out);
}


ReadResult
ReaderCursor::read_null_terminated_bytes_at(uint64_t index,
                                            uint64_t max_length,
                                            std::vector<std::byte>* out)
{
    return fetch_null_terminated(at(index), max_length, out);
}


ReadResult
ReaderCursor::read_null_terminated_string(uint64_t max_length,
                                          std::string* out,
                                          TextEncoding encoding)
{
    out->clear();
    std::vector<std::byte> bytes;
    const ReadResult r = fetch_null_terminated(next(), max_length, &bytes);
    if (r.status == ReadStatus::Ok) {
        (void)decode_text_to_utf8(bytes, encoding, out);
    }
    return r;
}


ReadResult
ReaderCursor::read_null_terminated_string_at(uint64_t index,
                                             uint64_t max_length,
                                             std::string* out,
                                             TextEncoding encoding)
{
    out->clear();
    std::vector<std::byte> bytes;
    const ReadResult r = fetch_null_terminated(at(index), max_length, &bytes);
    if (r.status == ReadStatus::Ok) {
        (void)decode_text_to_utf8(bytes, encoding, out);
    }
    return r;
}


ReadResult
ReaderCursor::read_line(std::string* out, bool* out_has_line)
{
    out->clear();
    *out_has_line = false;

    while (!is_near_end(1U)) {
        uint8_t ch         = 0;
        const ReadResult r = read_u8(&ch);
        if (r.status != ReadStatus::Ok) {
            return r;
        }
        if (ch == '\r' || ch == '\n') {
            if (ch == '\r' && !is_near_end(1U)) {
                uint8_t peek        = 0;
                const ReadResult pr = read_u8(&peek);
                if (pr.status != ReadStatus::Ok) {
                    return pr;
                }
                if (peek != '\n') {
                    (void)skip(-1);
                }
            }
            *out_has_line = true;
            return ReadResult {};
        }
        out->push_back(static_cast<char>(ch));
    }

    *out_has_line = !out->empty();
    return ReadResult {};
}


ReadResult
ReaderCursor::to_array(std::vector<std::byte>* out)
{
    out->clear();
    if (!source_) {
        return make_bounds_violation(to_i64(start_), 0, -1);
    }
    if (!has_length_) {
        const ReadResult r = source_->drain();
        if (r.status != ReadStatus::Ok) {
            return r;
        }
    }
    return source_->to_array(start_, length(), out);
}

}  // namespace boxmeta
