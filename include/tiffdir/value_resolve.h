#pragma once

#include "tiffdir/byte_arena.h"
#include "tiffdir/byte_order.h"
#include "tiffdir/decode_options.h"
#include "tiffdir/decode_status.h"
#include "tiffdir/directory.h"
#include "tiffdir/tiff_value.h"

#include <cstddef>
#include <cstdint>
#include <span>

/**
 * \file value_resolve.h
 * \brief Expands a raw directory entry into a typed value sequence.
 */

namespace tiffdir {

/// Where the bytes of an entry's value live in the source.
struct ValueLocation final {
    /// `count * unit`, checked against the 32-bit offset space.
    uint32_t total_bytes = 0;
    /// True if the value is packed in the entry's 4-byte field.
    bool inline_value = false;
    /// Source offset of out-of-line values; unused for inline ones.
    uint32_t offset = 0;
};

/**
 * \brief Computes the size and location of \p entry's value.
 *
 * Fails \ref TiffDecodeStatus::UnsupportedType for type codes outside 1..12
 * and \ref TiffDecodeStatus::Overflow when `count * unit` exceeds 32 bits.
 * No bounds check against the source is made here.
 */
TiffDecodeResult
locate_entry_value(ByteOrder order, const RawEntry& entry,
                   ValueLocation* out) noexcept;

/**
 * \brief Resolves \p entry into \p out, appending its elements to \p arena.
 *
 * Values of 4 bytes or less are decoded from the entry's own field; larger
 * values are read at the offset stored in that field, failing
 * \ref TiffDecodeStatus::Truncated if the range leaves \p bytes. \p out is
 * written only on success; on failure the arena may hold unused bytes.
 */
TiffDecodeResult
resolve_entry_value(std::span<const std::byte> bytes, ByteOrder order,
                    const RawEntry& entry, const TiffDecodeLimits& limits,
                    ByteArena& arena, TiffValue* out) noexcept;

}  // namespace tiffdir
