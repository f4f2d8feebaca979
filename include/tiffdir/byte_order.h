#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

/**
 * \file byte_order.h
 * \brief Bounds-checked integer reads in an explicit byte order.
 *
 * The byte order of a TIFF stream is fixed once by its header and then passed
 * explicitly to every read; there is no ambient byte-order state.
 */

namespace tiffdir {

/// Byte order of a TIFF stream.
enum class ByteOrder : uint8_t {
    Little,
    Big,
};

/// Returns true if `[offset, offset + n)` lies inside \p bytes.
constexpr bool
range_in_bounds(std::span<const std::byte> bytes, uint64_t offset,
                uint64_t n) noexcept
{
    return offset <= bytes.size() && n <= bytes.size() - offset;
}

bool
read_u16(ByteOrder order, std::span<const std::byte> bytes, uint64_t offset,
         uint16_t* out) noexcept;
bool
read_u32(ByteOrder order, std::span<const std::byte> bytes, uint64_t offset,
         uint32_t* out) noexcept;
bool
read_u64(ByteOrder order, std::span<const std::byte> bytes, uint64_t offset,
         uint64_t* out) noexcept;

}  // namespace tiffdir
