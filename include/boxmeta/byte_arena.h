#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

/**
 * \file byte_arena.h
 * \brief Append-only byte arena holding payload bytes retained by a box tree.
 */

namespace boxmeta {

/// A span (offset,size) into a \ref ByteArena buffer.
struct ByteSpan final {
    uint32_t offset = 0;
    uint32_t size   = 0;
};

/**
 * \brief Append-only storage for retained payload bytes.
 *
 * \note \ref ByteSpan values remain meaningful as long as the arena is not
 * cleared. Any span returned by \ref span() may be invalidated by subsequent
 * arena growth (vector reallocation).
 */
class ByteArena final {
public:
    ByteArena() = default;

    /// Discards all stored bytes.
    void clear() noexcept;
    /// Reserves at least \p size_bytes capacity (may allocate).
    void reserve(size_t size_bytes);

    /// Stored byte count.
    uint64_t size() const noexcept;

    /**
     * \brief Appends \p bytes unless the arena would grow past \p max_total.
     *
     * \p max_total of 0 means "no cap other than the 32-bit span range".
     * Returns false and leaves the arena untouched when refused.
     */
    bool try_append(std::span<const std::byte> bytes, uint64_t max_total,
                    ByteSpan* out);

    /// Returns a view of the full buffer.
    std::span<const std::byte> bytes() const noexcept;
    /// Returns a view for \p view, or an empty span if out of range.
    std::span<const std::byte> span(ByteSpan view) const noexcept;

private:
    std::vector<std::byte> buffer_;
};

}  // namespace boxmeta
