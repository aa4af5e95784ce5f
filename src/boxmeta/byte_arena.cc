#include "boxmeta/byte_arena.h"

#include <cstring>
#include <limits>

namespace boxmeta {

void
ByteArena::clear() noexcept
{
    buffer_.clear();
}


void
ByteArena::reserve(size_t size_bytes)
{
    buffer_.reserve(size_bytes);
}


uint64_t
ByteArena::size() const noexcept
{
    return static_cast<uint64_t>(buffer_.size());
}


bool
ByteArena::try_append(std::span<const std::byte> bytes, uint64_t max_total,
                      ByteSpan* out)
{
    const uint64_t have = buffer_.size();
    const uint64_t add  = bytes.size();
    const uint64_t cap  = std::numeric_limits<uint32_t>::max();
    if (add > cap - have) {
        return false;
    }
    if (max_total != 0U && (add > max_total || have > max_total - add)) {
        return false;
    }

    buffer_.resize(static_cast<size_t>(have + add));
    if (add != 0U) {
        std::memcpy(buffer_.data() + have, bytes.data(),
                    static_cast<size_t>(add));
    }
    if (out) {
        out->offset = static_cast<uint32_t>(have);
        out->size   = static_cast<uint32_t>(add);
    }
    return true;
}


std::span<const std::byte>
ByteArena::bytes() const noexcept
{
    return std::span<const std::byte>(buffer_.data(), buffer_.size());
}


std::span<const std::byte>
ByteArena::span(ByteSpan view) const noexcept
{
    const std::span<const std::byte> all = bytes();
    if (view.offset > all.size()) {
        return std::span<const std::byte>();
    }
    const size_t end = static_cast<size_t>(view.offset) + view.size;
    if (end > all.size()) {
        return std::span<const std::byte>();
    }
    return all.subspan(view.offset, view.size);
}

}  // namespace boxmeta
