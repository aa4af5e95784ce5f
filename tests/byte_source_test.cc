#include "boxmeta/byte_source.h"

#include <gtest/gtest.h>

#include <cstdint>
#include <cstring>
#include <span>
#include <utility>
#include <vector>

namespace boxmeta {
namespace {

    static std::vector<std::byte> counting_bytes(size_t n)
    {
        std::vector<std::byte> out(n);
        for (size_t i = 0; i < n; ++i) {
            out[i] = std::byte { static_cast<uint8_t>(i) };
        }
        return out;
    }

    // Hands out `good_bytes` bytes, then reports an I/O failure.
    class FailingStream final : public ByteStream {
    public:
        explicit FailingStream(size_t good_bytes) noexcept
            : good_bytes_(good_bytes)
        {
        }

        StreamStatus read(std::span<std::byte> dst,
                          size_t* out_read) noexcept override
        {
            *out_read = 0;
            if (sent_ >= good_bytes_) {
                return StreamStatus::IoError;
            }
            size_t n = good_bytes_ - sent_;
            if (n > dst.size()) {
                n = dst.size();
            }
            std::memset(dst.data(), 0x5A, n);
            sent_ += n;
            *out_read = n;
            return StreamStatus::Ok;
        }

    private:
        size_t good_bytes_ = 0;
        size_t sent_       = 0;
    };

}  // namespace

TEST(ByteSource, FixedBufferIsSeekableWithKnownLength)
{
    const std::vector<std::byte> bytes = counting_bytes(10);
    ByteSource src(bytes);
    EXPECT_TRUE(src.is_seekable());
    EXPECT_TRUE(src.length_known());
    EXPECT_EQ(src.length(), 10U);

    std::byte b[3] {};
    uint64_t got = 0;
    ASSERT_EQ(src.read_at(7, b, false, &got).status, ReadStatus::Ok);
    EXPECT_EQ(got, 3U);
    EXPECT_EQ(b[0], std::byte { 7 });
    EXPECT_EQ(b[2], std::byte { 9 });

    const ReadResult r = src.read_at(8, b, false, &got);
    ASSERT_EQ(r.status, ReadStatus::OutOfBounds);
    EXPECT_EQ(r.requested_index, 8);
    EXPECT_EQ(r.requested_count, 3U);
    EXPECT_EQ(r.max_index, 9);

    ASSERT_EQ(src.read_at(8, b, true, &got).status, ReadStatus::Ok);
    EXPECT_EQ(got, 2U);
}


TEST(ByteSource, OwnsMovedBuffer)
{
    std::vector<std::byte> bytes = counting_bytes(4);
    ByteSource src(std::move(bytes));
    EXPECT_EQ(src.length(), 4U);

    std::vector<std::byte> copy;
    ASSERT_EQ(src.to_array(1, 3, &copy).status, ReadStatus::Ok);
    ASSERT_EQ(copy.size(), 3U);
    EXPECT_EQ(copy[0], std::byte { 1 });
    EXPECT_EQ(copy[2], std::byte { 3 });
}


TEST(ByteSource, EmptySourceReportsNegativeMaxIndex)
{
    ByteSource src { std::span<const std::byte>() };
    std::byte b {};
    uint64_t got       = 0;
    const ReadResult r = src.read_at(0, std::span<std::byte>(&b, 1), false,
                                     &got);
    ASSERT_EQ(r.status, ReadStatus::OutOfBounds);
    EXPECT_EQ(r.max_index, -1);
    EXPECT_EQ(format_read_error(r),
              "Attempt to read from beyond end of underlying data source "
              "(requested index: 0, requested count: 1, max index: -1)");
}


TEST(ByteSource, ValidateRangeClipsToAvailableBytes)
{
    const std::vector<std::byte> bytes = counting_bytes(10);
    ByteSource src(bytes);

    uint64_t available = 0;
    ASSERT_EQ(src.validate_range(4, 100, &available).status, ReadStatus::Ok);
    EXPECT_EQ(available, 6U);
    ASSERT_EQ(src.validate_range(20, 1, &available).status, ReadStatus::Ok);
    EXPECT_EQ(available, 0U);

    const ReadResult neg = src.validate_range(-1, 1, &available);
    EXPECT_EQ(neg.status, ReadStatus::OutOfBounds);
    EXPECT_EQ(neg.requested_index, -1);
}


TEST(ByteSource, ValidateRangeOnStreamAssumesBufferBudget)
{
    const std::vector<std::byte> bytes = counting_bytes(4);
    MemoryByteStream stream(bytes);
    SourceLimits limits;
    limits.max_buffer_bytes = 64;
    ByteSource src(stream, limits);

    uint64_t available = 0;
    ASSERT_EQ(src.validate_range(0, 32, &available).status, ReadStatus::Ok);
    EXPECT_EQ(available, 32U);
    ASSERT_EQ(src.validate_range(48, 32, &available).status, ReadStatus::Ok);
    EXPECT_EQ(available, 16U);
    EXPECT_EQ(stream.read_calls(), 0U);
}


TEST(ByteSource, StreamBuffersOnlyWhatIsNeeded)
{
    const std::vector<std::byte> bytes = counting_bytes(16);
    MemoryByteStream stream(bytes);
    SourceLimits limits;
    limits.pull_chunk_bytes = 4;
    ByteSource src(stream, limits);
    EXPECT_FALSE(src.is_seekable());
    EXPECT_FALSE(src.length_known());

    std::byte b[2] {};
    uint64_t got = 0;
    ASSERT_EQ(src.read_at(0, b, false, &got).status, ReadStatus::Ok);
    EXPECT_EQ(stream.read_calls(), 1U);
    EXPECT_EQ(stream.bytes_pulled(), 4U);
    EXPECT_EQ(src.buffered_size(), 4U);

    // Reads below the high-water mark never touch the stream.
    ASSERT_EQ(src.read_at(1, b, false, &got).status, ReadStatus::Ok);
    ASSERT_EQ(src.read_at(2, b, false, &got).status, ReadStatus::Ok);
    EXPECT_EQ(b[0], std::byte { 2 });
    EXPECT_EQ(stream.read_calls(), 1U);

    ASSERT_EQ(src.read_at(6, b, false, &got).status, ReadStatus::Ok);
    EXPECT_EQ(b[1], std::byte { 7 });
    EXPECT_EQ(stream.bytes_pulled(), 8U);
    EXPECT_EQ(src.length(), 8U);
    EXPECT_FALSE(src.length_known());
}


TEST(ByteSource, DrainMakesStreamLengthExact)
{
    const std::vector<std::byte> bytes = counting_bytes(37);
    MemoryByteStream stream(bytes, 5);
    SourceLimits limits;
    limits.pull_chunk_bytes = 8;
    ByteSource src(stream, limits);

    ASSERT_EQ(src.drain().status, ReadStatus::Ok);
    EXPECT_TRUE(src.length_known());
    EXPECT_EQ(src.length(), 37U);
    EXPECT_EQ(src.view(30, 7).size(), 7U);
    EXPECT_TRUE(src.view(30, 8).empty());
}


TEST(ByteSource, StreamReadPastEndReportsTrueMaxIndex)
{
    const std::vector<std::byte> bytes = counting_bytes(5);
    MemoryByteStream stream(bytes, 2);
    ByteSource src(stream);

    const ReadResult r = src.ensure_available(3, 4);
    ASSERT_EQ(r.status, ReadStatus::OutOfBounds);
    EXPECT_EQ(r.requested_index, 3);
    EXPECT_EQ(r.requested_count, 4U);
    EXPECT_EQ(r.max_index, 4);
    EXPECT_TRUE(src.length_known());
}


TEST(ByteSource, BufferLimitIsReportedSeparately)
{
    const std::vector<std::byte> bytes = counting_bytes(64);
    MemoryByteStream stream(bytes);
    SourceLimits limits;
    limits.max_buffer_bytes = 16;
    limits.pull_chunk_bytes = 4;
    ByteSource src(stream, limits);

    ASSERT_EQ(src.ensure_available(0, 16).status, ReadStatus::Ok);
    const ReadResult r = src.ensure_available(10, 10);
    EXPECT_EQ(r.status, ReadStatus::LimitExceeded);
    EXPECT_LE(src.buffered_size(), 16U);
}


TEST(ByteSource, HugeRequestOnlyBuffersWhatTheStreamHolds)
{
    const std::vector<std::byte> bytes = counting_bytes(16);
    MemoryByteStream stream(bytes);
    ByteSource src(stream);

    const ReadResult r = src.ensure_available(8, 0x7FFFFFF0U);
    EXPECT_EQ(r.status, ReadStatus::OutOfBounds);
    EXPECT_EQ(r.max_index, 15);
    EXPECT_EQ(src.buffered_size(), 16U);
    EXPECT_EQ(stream.bytes_pulled(), 16U);
    EXPECT_EQ(stream.read_calls(), 2U);
    EXPECT_TRUE(src.length_known());

    MemoryByteStream unlimited_stream(bytes);
    SourceLimits limits;
    limits.max_buffer_bytes = 0;
    ByteSource unlimited(unlimited_stream, limits);
    EXPECT_EQ(unlimited.ensure_available(0, 1ULL << 40).status,
              ReadStatus::OutOfBounds);
    EXPECT_EQ(unlimited.buffered_size(), 16U);
    EXPECT_EQ(unlimited.drain().status, ReadStatus::Ok);
    EXPECT_EQ(unlimited.length(), 16U);
}


TEST(ByteSource, LargeRangeIsPulledInBoundedChunks)
{
    const size_t total                 = 4U * 1024U * 1024U;
    const std::vector<std::byte> bytes = counting_bytes(total);
    MemoryByteStream stream(bytes, 64U * 1024U);
    ByteSource src(stream);

    ASSERT_EQ(src.ensure_available(0, total).status, ReadStatus::Ok);
    EXPECT_EQ(stream.read_calls(), 64U);
    EXPECT_EQ(stream.bytes_pulled(), total);
    EXPECT_EQ(src.buffered_size(), total);
    EXPECT_FALSE(src.length_known());

    // Short reads append only what each pull returned.
    const size_t small = 1024U * 1024U;
    MemoryByteStream trickle(std::span<const std::byte>(bytes.data(), small),
                             1000);
    ByteSource trickled(trickle);
    ASSERT_EQ(trickled.ensure_available(0, small).status, ReadStatus::Ok);
    EXPECT_EQ(trickle.read_calls(), (small + 999U) / 1000U);
    EXPECT_EQ(trickled.buffered_size(), small);
    EXPECT_EQ(trickled.view(small - 1U, 1).front(), bytes[small - 1U]);
}


TEST(ByteSource, StreamFailureIsStickyButKeepsBufferedBytes)
{
    FailingStream stream(3);
    SourceLimits limits;
    limits.pull_chunk_bytes = 2;
    ByteSource src(stream, limits);

    std::byte b[4] {};
    uint64_t got = 0;
    ReadResult r = src.read_at(0, b, false, &got);
    ASSERT_EQ(r.status, ReadStatus::IoError);
    EXPECT_EQ(src.buffered_size(), 3U);
    EXPECT_EQ(format_read_error(r).find("I/O error"), 0U);

    r = src.read_at(0, std::span<std::byte>(b, 3), false, &got);
    ASSERT_EQ(r.status, ReadStatus::Ok);
    EXPECT_EQ(b[2], std::byte { 0x5A });

    EXPECT_EQ(src.ensure_available(3, 1).status, ReadStatus::IoError);
    EXPECT_EQ(src.drain().status, ReadStatus::IoError);
}


TEST(MemoryByteStream, HonorsChunkSizeAndReportsEnd)
{
    const std::vector<std::byte> bytes = counting_bytes(5);
    MemoryByteStream stream(bytes, 2);

    std::byte buf[8] {};
    size_t got = 0;
    ASSERT_EQ(stream.read(buf, &got), StreamStatus::Ok);
    EXPECT_EQ(got, 2U);
    ASSERT_EQ(stream.read(buf, &got), StreamStatus::Ok);
    ASSERT_EQ(stream.read(buf, &got), StreamStatus::Ok);
    EXPECT_EQ(got, 1U);
    EXPECT_EQ(buf[0], std::byte { 4 });
    EXPECT_EQ(stream.read(buf, &got), StreamStatus::End);
    EXPECT_EQ(got, 0U);
    EXPECT_EQ(stream.bytes_pulled(), 5U);
    EXPECT_EQ(stream.read_calls(), 4U);
}

}  // namespace boxmeta
