#include "boxmeta/file_source.h"

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <limits>

#if defined(_WIN32)
#    define WIN32_LEAN_AND_MEAN
#    include <io.h>
#    include <windows.h>
#else
#    include <fcntl.h>
#    include <sys/mman.h>
#    include <sys/stat.h>
#    include <unistd.h>
#endif

namespace boxmeta {
namespace {

    static bool fits_in_memory(uint64_t size) noexcept
    {
        return size <= static_cast<uint64_t>(std::numeric_limits<size_t>::max());
    }

}  // namespace

MappedFile::~MappedFile() noexcept
{
    release();
}


MappedFile::MappedFile(MappedFile&& other) noexcept
{
    take(other);
}


MappedFile&
MappedFile::operator=(MappedFile&& other) noexcept
{
    if (this != &other) {
        release();
        take(other);
    }
    return *this;
}


void
MappedFile::take(MappedFile& other) noexcept
{
#if defined(_WIN32)
    file_handle_       = other.file_handle_;
    map_handle_        = other.map_handle_;
    other.file_handle_ = nullptr;
    other.map_handle_  = nullptr;
#else
    fd_       = other.fd_;
    other.fd_ = -1;
#endif
    data_       = other.data_;
    size_       = other.size_;
    other.data_ = nullptr;
    other.size_ = 0;
}


MappedFileStatus
MappedFile::open(const char* path, uint64_t max_file_bytes) noexcept
{
    release();
    if (!path || !*path) {
        return MappedFileStatus::OpenFailed;
    }

#if defined(_WIN32)
    HANDLE h = ::CreateFileA(path, GENERIC_READ, FILE_SHARE_READ, nullptr,
                             OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL, nullptr);
    if (h == INVALID_HANDLE_VALUE) {
        return MappedFileStatus::OpenFailed;
    }
    LARGE_INTEGER sz;
    if (!::GetFileSizeEx(h, &sz) || sz.QuadPart < 0) {
        ::CloseHandle(h);
        return MappedFileStatus::StatFailed;
    }
    const uint64_t file_size = static_cast<uint64_t>(sz.QuadPart);
    if ((max_file_bytes != 0U && file_size > max_file_bytes)
        || !fits_in_memory(file_size)) {
        ::CloseHandle(h);
        return MappedFileStatus::TooLarge;
    }

    HANDLE map = nullptr;
    if (file_size != 0U) {
        map = ::CreateFileMappingA(h, nullptr, PAGE_READONLY, 0, 0, nullptr);
        void* p = map ? ::MapViewOfFile(map, FILE_MAP_READ, 0, 0, 0) : nullptr;
        if (!p) {
            if (map) {
                ::CloseHandle(map);
            }
            ::CloseHandle(h);
            return MappedFileStatus::MapFailed;
        }
        data_ = static_cast<const std::byte*>(p);
    }
    file_handle_ = static_cast<void*>(h);
    map_handle_  = static_cast<void*>(map);
    size_        = file_size;
    return MappedFileStatus::Ok;
#else
    const int fd = ::open(path, O_RDONLY);
    if (fd < 0) {
        return MappedFileStatus::OpenFailed;
    }
    struct stat st {};
    if (::fstat(fd, &st) != 0 || st.st_size < 0) {
        (void)::close(fd);
        return MappedFileStatus::StatFailed;
    }
    const uint64_t file_size = static_cast<uint64_t>(st.st_size);
    if ((max_file_bytes != 0U && file_size > max_file_bytes)
        || !fits_in_memory(file_size)) {
        (void)::close(fd);
        return MappedFileStatus::TooLarge;
    }

    if (file_size != 0U) {
        void* p = ::mmap(nullptr, static_cast<size_t>(file_size), PROT_READ,
                         MAP_PRIVATE, fd, 0);
        if (p == MAP_FAILED) {
            (void)::close(fd);
            return MappedFileStatus::MapFailed;
        }
        data_ = static_cast<const std::byte*>(p);
    }
    fd_   = fd;
    size_ = file_size;
    return MappedFileStatus::Ok;
#endif
}


void
MappedFile::close() noexcept
{
    release();
}


void
MappedFile::release() noexcept
{
    void* mapped = const_cast<void*>(static_cast<const void*>(data_));
#if defined(_WIN32)
    if (mapped) {
        ::UnmapViewOfFile(mapped);
    }
    if (map_handle_) {
        ::CloseHandle(static_cast<HANDLE>(map_handle_));
    }
    if (file_handle_) {
        ::CloseHandle(static_cast<HANDLE>(file_handle_));
    }
    file_handle_ = nullptr;
    map_handle_  = nullptr;
#else
    if (mapped && size_ != 0U) {
        (void)::munmap(mapped, static_cast<size_t>(size_));
    }
    if (fd_ >= 0) {
        (void)::close(fd_);
    }
    fd_ = -1;
#endif
    data_ = nullptr;
    size_ = 0;
}


bool
MappedFile::is_open() const noexcept
{
#if defined(_WIN32)
    return file_handle_ != nullptr;
#else
    return fd_ >= 0;
#endif
}


uint64_t
MappedFile::size() const noexcept
{
    return size_;
}


std::span<const std::byte>
MappedFile::bytes() const noexcept
{
    if (size_ == 0U) {
        return {};
    }
    return std::span<const std::byte>(data_, static_cast<size_t>(size_));
}


FdByteStream::FdByteStream(int fd, bool owns_fd) noexcept
    : fd_(fd)
    , owns_fd_(owns_fd)
{
}


FdByteStream::~FdByteStream() noexcept
{
    if (owns_fd_ && fd_ >= 0) {
#if defined(_WIN32)
        (void)::_close(fd_);
#else
        (void)::close(fd_);
#endif
    }
}


StreamStatus
FdByteStream::read(std::span<std::byte> dst, size_t* out_read) noexcept
{
    *out_read = 0;
    if (fd_ < 0) {
        return StreamStatus::IoError;
    }
    if (dst.empty()) {
        return StreamStatus::Ok;
    }

    for (;;) {
#if defined(_WIN32)
        const unsigned int want = dst.size() > 0x7FFFFFFFU
                                      ? 0x7FFFFFFFU
                                      : static_cast<unsigned int>(dst.size());
        const int n = ::_read(fd_, dst.data(), want);
#else
        const ssize_t n = ::read(fd_, dst.data(), dst.size());
#endif
        if (n > 0) {
            *out_read = static_cast<size_t>(n);
            return StreamStatus::Ok;
        }
        if (n == 0) {
            return StreamStatus::End;
        }
        if (errno != EINTR) {
            return StreamStatus::IoError;
        }
    }
}


const char*
mapped_file_status_name(MappedFileStatus status) noexcept
{
    switch (status) {
    case MappedFileStatus::Ok: return "ok";
    case MappedFileStatus::OpenFailed: return "open_failed";
    case MappedFileStatus::StatFailed: return "stat_failed";
    case MappedFileStatus::TooLarge: return "too_large";
    case MappedFileStatus::MapFailed: return "map_failed";
    }
    return "unknown";
}

}  // namespace boxmeta
