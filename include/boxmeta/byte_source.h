#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

/**
 * \file byte_source.h
 * \brief Random-access byte source over a buffer or a forward-only stream.
 */

namespace boxmeta {

/// Status code shared by every read/skip/range operation.
enum class ReadStatus : uint8_t {
    Ok,
    /// Requested range is not fully available (bounds violation).
    OutOfBounds,
    /// The underlying stream reported an I/O failure.
    IoError,
    /// Forward-only buffering would exceed \ref SourceLimits::max_buffer_bytes.
    LimitExceeded,
};

/**
 * \brief Outcome of a read.
 *
 * On \ref ReadStatus::OutOfBounds the remaining fields describe the bounds
 * violation in absolute source offsets. `max_index` is -1 for an empty source.
 */
struct ReadResult final {
    ReadStatus status        = ReadStatus::Ok;
    int64_t requested_index  = 0;
    uint64_t requested_count = 0;
    int64_t max_index        = -1;
};

/// Builds the \ref ReadStatus::OutOfBounds result for a range request.
ReadResult
make_bounds_violation(int64_t requested_index, uint64_t requested_count,
                      int64_t max_index) noexcept;

/// Formats \p result as a single human-readable line.
std::string
format_read_error(const ReadResult& result);


/// Status code for \ref ByteStream::read.
enum class StreamStatus : uint8_t {
    Ok,
    End,
    IoError,
};

/**
 * \brief Forward-only byte producer (pipe, socket, decompressor, ...).
 *
 * Implementations never rewind. A call that returns \ref StreamStatus::Ok
 * must deliver at least one byte.
 */
class ByteStream {
public:
    virtual ~ByteStream() = default;

    /// Reads up to `dst.size()` bytes and stores the count in \p out_read.
    virtual StreamStatus read(std::span<std::byte> dst,
                              size_t* out_read) noexcept
        = 0;
};

/**
 * \brief Forward-only stream over an in-memory buffer.
 *
 * Counts every byte handed out so callers can observe how much was pulled.
 * \p max_chunk limits the bytes returned per call (0 = unlimited).
 */
class MemoryByteStream final : public ByteStream {
public:
    explicit MemoryByteStream(std::span<const std::byte> bytes,
                              size_t max_chunk = 0) noexcept;

    StreamStatus read(std::span<std::byte> dst,
                      size_t* out_read) noexcept override;

    uint64_t bytes_pulled() const noexcept;
    uint32_t read_calls() const noexcept;

private:
    std::span<const std::byte> bytes_;
    size_t max_chunk_    = 0;
    uint64_t offset_     = 0;
    uint32_t read_calls_ = 0;
};


/// Buffering budgets for forward-only sources.
struct SourceLimits final {
    /// Maximum bytes buffered from a stream (0 = unlimited).
    uint64_t max_buffer_bytes = 1024ULL * 1024ULL * 1024ULL;
    /// Minimum number of bytes requested from the stream per pull (a single
    /// pull is capped at 1 MiB).
    uint32_t pull_chunk_bytes = 64U * 1024U;
};

/**
 * \brief Owns (or borrows) the raw bytes every \ref ReaderCursor reads.
 *
 * A source is either a fixed buffer (seekable, length known up front) or a
 * \ref ByteStream plus an append-only buffer of the bytes pulled so far.
 *
 * \note For a stream source, \ref length() returns the buffered high-water
 * mark until the stream has been drained; only then is it the true length
 * (see \ref length_known()).
 *
 * \note Cursors may read already-buffered ranges freely, but only one caller
 * at a time may trigger forward buffering. There is no locking.
 */
class ByteSource final {
public:
    /// Borrows \p bytes; the caller keeps them alive (e.g. a MappedFile).
    explicit ByteSource(std::span<const std::byte> bytes) noexcept;
    /// Takes ownership of \p bytes.
    explicit ByteSource(std::vector<std::byte>&& bytes) noexcept;
    /// Buffers \p stream incrementally. \p stream must outlive the source.
    explicit ByteSource(ByteStream& stream,
                        const SourceLimits& limits = SourceLimits {}) noexcept;

    ByteSource(const ByteSource&)            = delete;
    ByteSource& operator=(const ByteSource&) = delete;
    ByteSource(ByteSource&&)                 = delete;
    ByteSource& operator=(ByteSource&&)      = delete;

    bool is_seekable() const noexcept;
    bool length_known() const noexcept;
    /// Known length, or the buffered high-water mark for an undrained stream.
    uint64_t length() const noexcept;
    uint64_t buffered_size() const noexcept;

    /**
     * \brief Computes how many of \p count bytes at \p offset exist.
     *
     * Does not pull from the stream. Bytes past the high-water mark of an
     * undrained stream are assumed available up to the buffering limit.
     * Fails only when \p offset is negative.
     */
    ReadResult validate_range(int64_t offset, uint64_t count,
                              uint64_t* out_available) const noexcept;

    /**
     * \brief Copies `dst.size()` bytes at \p offset into \p dst.
     *
     * With \p allow_partial, a short read at the end of the data succeeds and
     * \p out_read holds the number of bytes copied.
     */
    ReadResult read_at(uint64_t offset, std::span<std::byte> dst,
                       bool allow_partial, uint64_t* out_read) noexcept;

    /// Buffers forward until `offset + count` bytes exist.
    ReadResult ensure_available(uint64_t offset, uint64_t count) noexcept;

    /// Pulls a stream until it ends, making \ref length() exact.
    ReadResult drain() noexcept;

    /// Materializes exactly \p count bytes at \p start into \p out.
    ReadResult to_array(uint64_t start, uint64_t count,
                        std::vector<std::byte>* out);

    /// Returns a view of an already-available range, or an empty span.
    std::span<const std::byte> view(uint64_t offset,
                                    uint64_t count) const noexcept;

private:
    std::span<const std::byte> data() const noexcept;
    ReadResult fill_to(uint64_t end) noexcept;
    int64_t max_index() const noexcept;

    std::span<const std::byte> fixed_;
    std::vector<std::byte> owned_;
    ByteStream* stream_ = nullptr;
    std::vector<std::byte> buffer_;
    std::vector<std::byte> scratch_;
    SourceLimits limits_;
    bool stream_ended_  = false;
    bool stream_failed_ = false;
};

}  // namespace boxmeta
