#pragma once

#include "tiffdir/byte_arena.h"
#include "tiffdir/byte_order.h"
#include "tiffdir/tiff_value.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

/**
 * \file directory.h
 * \brief Raw and resolved Image File Directory (IFD) structures.
 */

namespace tiffdir {

/// Size of one classic directory entry on disk.
inline constexpr uint32_t kDirectoryEntrySize = 12;

/// Byte length of a directory with \p entry_count entries: `2 + 12*N + 4`.
constexpr uint64_t
directory_byte_size(uint64_t entry_count) noexcept
{
    return 2U + kDirectoryEntrySize * entry_count + 4U;
}

/// One 12-byte directory entry exactly as stored (multi-byte fields decoded).
struct RawEntry final {
    uint16_t tag   = 0;
    uint16_t type  = 0;
    uint32_t count = 0;
    /// The 4-byte value-or-offset field, undecoded.
    std::array<std::byte, 4> value_field {};
};

/// Entries of one directory in file order plus the chain pointer.
struct RawDirectory final {
    uint64_t offset      = 0;
    uint32_t next_offset = 0;
    std::vector<RawEntry> entries;
};

/// A resolved field. \ref order is the entry's slot in the directory.
struct TiffField final {
    uint16_t tag   = 0;
    uint32_t order = 0;
    TiffValue value;
};

/**
 * \brief A resolved directory: unique tags mapped to typed values.
 *
 * Fields keep file order; lookup by tag uses a sorted index. On duplicate tags
 * the first occurrence wins and the tag is recorded in \ref duplicate_tags().
 */
class Directory final {
public:
    Directory() = default;

    ByteOrder byte_order() const noexcept;
    uint64_t offset() const noexcept;
    /// Offset of the next directory in the chain, 0 for the last one.
    uint32_t next_offset() const noexcept;

    std::span<const TiffField> fields() const noexcept;
    std::span<const uint16_t> duplicate_tags() const noexcept;

    const TiffField* find(uint16_t tag) const noexcept;
    bool has(uint16_t tag) const noexcept;

    /// First element of \p tag as an unsigned integer.
    bool first_u32(uint16_t tag, uint32_t* out) const noexcept;
    /// All elements of \p tag as unsigned integers.
    bool values_u32(uint16_t tag, std::vector<uint32_t>* out) const;
    /// All elements of \p tag as doubles.
    bool values_f64(uint16_t tag, std::vector<double>* out) const;
    /// First NUL-terminated run of an ASCII tag.
    bool ascii(uint16_t tag, std::string_view* out) const noexcept;

    ByteArena& arena() noexcept;
    const ByteArena& arena() const noexcept;

    // Build phase.
    void set_location(ByteOrder order, uint64_t offset,
                      uint32_t next_offset) noexcept;
    /// Adds a field. A tag already present keeps its first value.
    void add_field(const TiffField& field);
    void add_duplicate(uint16_t tag);

private:
    size_t lower_bound(uint16_t tag) const noexcept;

    ByteArena arena_;
    std::vector<TiffField> fields_;
    std::vector<uint32_t> by_tag_;
    std::vector<uint16_t> duplicates_;
    ByteOrder order_      = ByteOrder::Little;
    uint64_t offset_      = 0;
    uint32_t next_offset_ = 0;
};

}  // namespace tiffdir
