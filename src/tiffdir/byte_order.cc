#include "tiffdir/byte_order.h"

namespace tiffdir {
namespace {

    static constexpr uint8_t u8(std::byte b) noexcept
    {
        return static_cast<uint8_t>(b);
    }


    // Reads an unsigned integer of `n` bytes (n <= 8). The caller checks
    // bounds.
    static uint64_t read_uint(ByteOrder order, std::span<const std::byte> bytes,
                              uint64_t offset, uint32_t n) noexcept
    {
        uint64_t v = 0;
        if (order == ByteOrder::Little) {
            for (uint32_t i = 0; i < n; ++i) {
                v |= static_cast<uint64_t>(u8(bytes[offset + i])) << (i * 8U);
            }
            return v;
        }
        for (uint32_t i = 0; i < n; ++i) {
            v = (v << 8U) | static_cast<uint64_t>(u8(bytes[offset + i]));
        }
        return v;
    }

}  // namespace

bool
read_u16(ByteOrder order, std::span<const std::byte> bytes, uint64_t offset,
         uint16_t* out) noexcept
{
    if (!out || !range_in_bounds(bytes, offset, 2)) {
        return false;
    }
    *out = static_cast<uint16_t>(read_uint(order, bytes, offset, 2));
    return true;
}


bool
read_u32(ByteOrder order, std::span<const std::byte> bytes, uint64_t offset,
         uint32_t* out) noexcept
{
    if (!out || !range_in_bounds(bytes, offset, 4)) {
        return false;
    }
    *out = static_cast<uint32_t>(read_uint(order, bytes, offset, 4));
    return true;
}


bool
read_u64(ByteOrder order, std::span<const std::byte> bytes, uint64_t offset,
         uint64_t* out) noexcept
{
    if (!out || !range_in_bounds(bytes, offset, 8)) {
        return false;
    }
    *out = read_uint(order, bytes, offset, 8);
    return true;
}

}  // namespace tiffdir
