#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

/**
 * \file byte_arena.h
 * \brief Append-only byte arena holding decoded tag payloads.
 */

namespace tiffdir {

/// A span (offset,size) into a \ref ByteArena buffer.
struct ByteSpan final {
    uint32_t offset = 0;
    uint32_t size   = 0;
};

/**
 * \brief Append-only storage for decoded element bytes.
 *
 * \note \ref ByteSpan values remain meaningful as long as the arena content is
 * not cleared. Any pointer/span returned by \ref span() may be invalidated by
 * subsequent arena growth (vector reallocation).
 */
class ByteArena final {
public:
    ByteArena() = default;

    /// Discards all stored bytes.
    void clear() noexcept;
    /// Reserves at least \p size_bytes capacity (may allocate).
    void reserve(size_t size_bytes);

    /// True if \p size_bytes at \p alignment still ends inside the 32-bit
    /// \ref ByteSpan offset space.
    bool fits(uint64_t size_bytes, uint32_t alignment) const noexcept;

    /// Appends raw bytes and returns a \ref ByteSpan to the stored copy.
    /// Returns an empty span and stores nothing if the bytes do not fit().
    ByteSpan append(std::span<const std::byte> bytes);
    /// Allocates \p size_bytes with \p alignment and returns the written span.
    /// Returns an empty span and stores nothing if the bytes do not fit().
    ByteSpan allocate(uint32_t size_bytes, uint32_t alignment);

    /// Total number of bytes held (including alignment padding).
    size_t size() const noexcept;

    /// Returns a view for \p view, or an empty span if out of range.
    std::span<const std::byte> span(ByteSpan view) const noexcept;
    /// Returns a mutable view for \p view, or an empty span if out of range.
    std::span<std::byte> span_mut(ByteSpan view) noexcept;

private:
    std::vector<std::byte> buffer_;
};

}  // namespace tiffdir
