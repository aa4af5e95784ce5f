#pragma once

#include "boxmeta/byte_source.h"

#include <cstddef>
#include <cstdint>
#include <span>

/**
 * \file file_source.h
 * \brief File inputs for \ref ByteSource: a read-only mapping (seekable) and
 * a file-descriptor stream (forward-only).
 */

namespace boxmeta {

/// Status code for \ref MappedFile::open.
enum class MappedFileStatus : uint8_t {
    Ok,
    OpenFailed,
    StatFailed,
    TooLarge,
    MapFailed,
};

/**
 * \brief Read-only, whole-file memory mapping.
 *
 * Lets tools hand large files to a borrowing \ref ByteSource without copying
 * them into memory.
 */
class MappedFile final {
public:
    MappedFile() noexcept = default;
    ~MappedFile() noexcept;

    MappedFile(const MappedFile&)            = delete;
    MappedFile& operator=(const MappedFile&) = delete;

    MappedFile(MappedFile&& other) noexcept;
    MappedFile& operator=(MappedFile&& other) noexcept;

    /// Maps \p path read-only. \p max_file_bytes is a hard cap (0 = unlimited).
    MappedFileStatus open(const char* path,
                          uint64_t max_file_bytes = 0) noexcept;
    /// Unmaps and closes (idempotent).
    void close() noexcept;

    bool is_open() const noexcept;
    uint64_t size() const noexcept;
    std::span<const std::byte> bytes() const noexcept;

private:
    void release() noexcept;
    void take(MappedFile& other) noexcept;

#if defined(_WIN32)
    void* file_handle_ = nullptr;
    void* map_handle_  = nullptr;
#else
    int fd_ = -1;
#endif
    const std::byte* data_ = nullptr;
    uint64_t size_         = 0;
};

/**
 * \brief Forward-only \ref ByteStream over a file descriptor (pipe, stdin).
 *
 * Interrupted reads are retried. The descriptor is closed on destruction
 * only when \p owns_fd was set.
 */
class FdByteStream final : public ByteStream {
public:
    explicit FdByteStream(int fd, bool owns_fd = false) noexcept;
    ~FdByteStream() noexcept override;

    FdByteStream(const FdByteStream&)            = delete;
    FdByteStream& operator=(const FdByteStream&) = delete;

    StreamStatus read(std::span<std::byte> dst,
                      size_t* out_read) noexcept override;

private:
    int fd_       = -1;
    bool owns_fd_ = false;
};

/// Human-readable name for \p status.
const char*
mapped_file_status_name(MappedFileStatus status) noexcept;

}  // namespace boxmeta
