#include "boxmeta/byte_source.h"

#include <cstddef>
#include <cstdio>
#include <cstring>
#include <limits>
#include <utility>

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

    static ReadResult make_status(ReadStatus status, uint64_t index,
                                  uint64_t count) noexcept
    {
        ReadResult r;
        r.status          = status;
        r.requested_index = to_i64(index);
        r.requested_count = count;
        return r;
    }

    // Per-pull scratch size: at least one pull chunk, never more than 1 MiB.
    static size_t pull_scratch_bytes(const SourceLimits& limits) noexcept
    {
        static constexpr uint64_t kMinScratch = 64U * 1024U;
        static constexpr uint64_t kMaxScratch = 1024U * 1024U;
        uint64_t n = limits.pull_chunk_bytes;
        if (n < kMinScratch) {
            n = kMinScratch;
        }
        if (n > kMaxScratch) {
            n = kMaxScratch;
        }
        return static_cast<size_t>(n);
    }

}  // namespace

ReadResult
make_bounds_violation(int64_t requested_index, uint64_t requested_count,
                      int64_t max_index) noexcept
{
    ReadResult r;
    r.status          = ReadStatus::OutOfBounds;
    r.requested_index = requested_index;
    r.requested_count = requested_count;
    r.max_index       = max_index;
    return r;
}


std::string
format_read_error(const ReadResult& result)
{
    char buf[256];
    switch (result.status) {
    case ReadStatus::Ok: return "ok";
    case ReadStatus::OutOfBounds:
        std::snprintf(
            buf, sizeof(buf),
            "Attempt to read from beyond end of underlying data source "
            "(requested index: %lld, requested count: %llu, max index: %lld)",
            static_cast<long long>(result.requested_index),
            static_cast<unsigned long long>(result.requested_count),
            static_cast<long long>(result.max_index));
        return std::string(buf);
    case ReadStatus::IoError:
        std::snprintf(buf, sizeof(buf),
                      "I/O error while reading underlying stream "
                      "(requested index: %lld, requested count: %llu)",
                      static_cast<long long>(result.requested_index),
                      static_cast<unsigned long long>(result.requested_count));
        return std::string(buf);
    case ReadStatus::LimitExceeded:
        std::snprintf(buf, sizeof(buf),
                      "Stream buffering limit exceeded "
                      "(requested index: %lld, requested count: %llu)",
                      static_cast<long long>(result.requested_index),
                      static_cast<unsigned long long>(result.requested_count));
        return std::string(buf);
    }
    return "unknown read error";
}


MemoryByteStream::MemoryByteStream(std::span<const std::byte> bytes,
                                   size_t max_chunk) noexcept
    : bytes_(bytes)
    , max_chunk_(max_chunk)
{
}


StreamStatus
MemoryByteStream::read(std::span<std::byte> dst, size_t* out_read) noexcept
{
    *out_read = 0;
    read_calls_ += 1U;
    if (offset_ >= bytes_.size()) {
        return StreamStatus::End;
    }
    size_t n         = dst.size();
    const size_t rem = static_cast<size_t>(bytes_.size() - offset_);
    if (n > rem) {
        n = rem;
    }
    if (max_chunk_ != 0U && n > max_chunk_) {
        n = max_chunk_;
    }
    if (n != 0U) {
        std::memcpy(dst.data(), bytes_.data() + offset_, n);
    }
    offset_ += n;
    *out_read = n;
    return StreamStatus::Ok;
}


uint64_t
MemoryByteStream::bytes_pulled() const noexcept
{
    return offset_;
}


uint32_t
MemoryByteStream::read_calls() const noexcept
{
    return read_calls_;
}


ByteSource::ByteSource(std::span<const std::byte> bytes) noexcept
    : fixed_(bytes)
{
}


ByteSource::ByteSource(std::vector<std::byte>&& bytes) noexcept
    : owned_(std::move(bytes))
{
    fixed_ = std::span<const std::byte>(owned_.data(), owned_.size());
}


ByteSource::ByteSource(ByteStream& stream, const SourceLimits& limits) noexcept
    : stream_(&stream)
    , limits_(limits)
{
}


bool
ByteSource::is_seekable() const noexcept
{
    return stream_ == nullptr;
}


bool
ByteSource::length_known() const noexcept
{
    return stream_ == nullptr || stream_ended_;
}


uint64_t
ByteSource::length() const noexcept
{
    return static_cast<uint64_t>(data().size());
}


uint64_t
ByteSource::buffered_size() const noexcept
{
    return static_cast<uint64_t>(data().size());
}


std::span<const std::byte>
ByteSource::data() const noexcept
{
    if (stream_) {
        return std::span<const std::byte>(buffer_.data(), buffer_.size());
    }
    return fixed_;
}


int64_t
ByteSource::max_index() const noexcept
{
    return to_i64(length()) - 1;
}


ReadResult
ByteSource::fill_to(uint64_t end) noexcept
{
    if (!stream_ || end <= buffer_.size()) {
        return ReadResult {};
    }
    if (stream_failed_) {
        return make_status(ReadStatus::IoError, buffer_.size(),
                           end - buffer_.size());
    }

    uint64_t target = end;
    if (limits_.max_buffer_bytes != 0U && target > limits_.max_buffer_bytes) {
        target = limits_.max_buffer_bytes;
    }

    const size_t chunk = pull_scratch_bytes(limits_);
    if (scratch_.size() < chunk) {
        scratch_.resize(chunk);
    }

    // The buffer only grows by what the stream actually returned.
    while (buffer_.size() < target && !stream_ended_) {
        const uint64_t have = buffer_.size();
        uint64_t want       = target - have;
        if (want < limits_.pull_chunk_bytes) {
            want = limits_.pull_chunk_bytes;
        }
        if (want > scratch_.size()) {
            want = scratch_.size();
        }
        if (limits_.max_buffer_bytes != 0U
            && have + want > limits_.max_buffer_bytes) {
            want = limits_.max_buffer_bytes - have;
        }

        size_t got            = 0;
        const StreamStatus st = stream_->read(
            std::span<std::byte>(scratch_.data(), static_cast<size_t>(want)),
            &got);
        if (st != StreamStatus::Ok || got > want) {
            got = 0;
        }
        buffer_.insert(buffer_.end(), scratch_.begin(),
                       scratch_.begin() + static_cast<std::ptrdiff_t>(got));

        if (st == StreamStatus::IoError) {
            stream_failed_ = true;
            return make_status(ReadStatus::IoError, have, end - have);
        }
        if (st == StreamStatus::End || got == 0U) {
            stream_ended_ = true;
        }
    }

    if (buffer_.size() < end && !stream_ended_) {
        return make_status(ReadStatus::LimitExceeded, buffer_.size(),
                           end - buffer_.size());
    }
    return ReadResult {};
}


ReadResult
ByteSource::validate_range(int64_t offset, uint64_t count,
                           uint64_t* out_available) const noexcept
{
    if (out_available) {
        *out_available = 0;
    }
    if (offset < 0) {
        return make_bounds_violation(offset, count, max_index());
    }

    const uint64_t off = static_cast<uint64_t>(offset);
    uint64_t end       = (count > kMaxU64 - off) ? kMaxU64 : off + count;

    uint64_t limit = length();
    if (!length_known()) {
        limit = (limits_.max_buffer_bytes != 0U) ? limits_.max_buffer_bytes
                                                 : kMaxU64;
    }
    if (end > limit) {
        end = limit;
    }
    if (out_available) {
        *out_available = (end > off) ? end - off : 0U;
    }
    return ReadResult {};
}


ReadResult
ByteSource::ensure_available(uint64_t offset, uint64_t count) noexcept
{
    if (count > kMaxU64 - offset) {
        return make_bounds_violation(to_i64(offset), count, max_index());
    }
    const uint64_t end = offset + count;
    const ReadResult filled = fill_to(end);
    if (filled.status != ReadStatus::Ok) {
        return filled;
    }
    if (end > length()) {
        return make_bounds_violation(to_i64(offset), count, max_index());
    }
    return ReadResult {};
}


ReadResult
ByteSource::drain() noexcept
{
    if (!stream_) {
        return ReadResult {};
    }
    while (!stream_ended_) {
        const uint64_t have = buffer_.size();
        uint64_t step       = limits_.pull_chunk_bytes;
        if (step == 0U) {
            step = 64U * 1024U;
        }
        const ReadResult r = fill_to(have + step);
        if (r.status != ReadStatus::Ok) {
            return r;
        }
    }
    return ReadResult {};
}


ReadResult
ByteSource::read_at(uint64_t offset, std::span<std::byte> dst,
                    bool allow_partial, uint64_t* out_read) noexcept
{
    if (out_read) {
        *out_read = 0;
    }
    const uint64_t count = static_cast<uint64_t>(dst.size());
    if (count > kMaxU64 - offset) {
        return make_bounds_violation(to_i64(offset), count, max_index());
    }

    const ReadResult filled = fill_to(offset + count);
    if (filled.status != ReadStatus::Ok) {
        return filled;
    }

    const std::span<const std::byte> all = data();
    uint64_t avail                       = 0;
    if (offset < all.size()) {
        avail = all.size() - offset;
        if (avail > count) {
            avail = count;
        }
    }
    if (avail < count && !allow_partial) {
        return make_bounds_violation(to_i64(offset), count, max_index());
    }

    if (avail != 0U) {
        std::memcpy(dst.data(), all.data() + offset,
                    static_cast<size_t>(avail));
    }
    if (out_read) {
        *out_read = avail;
    }
    return ReadResult {};
}


ReadResult
ByteSource::to_array(uint64_t start, uint64_t count,
                     std::vector<std::byte>* out)
{
    out->clear();
    const ReadResult r = ensure_available(start, count);
    if (r.status != ReadStatus::Ok) {
        return r;
    }
    const std::span<const std::byte> bytes = view(start, count);
    out->assign(bytes.begin(), bytes.end());
    return ReadResult {};
}


std::span<const std::byte>
ByteSource::view(uint64_t offset, uint64_t count) const noexcept
{
    const std::span<const std::byte> all = data();
    if (offset > all.size() || count > all.size() - offset) {
        return std::span<const std::byte>();
    }
    return all.subspan(static_cast<size_t>(offset), static_cast<size_t>(count));
}

}  // namespace boxmeta
