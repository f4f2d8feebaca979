#pragma once

#include "tiffdir/byte_order.h"
#include "tiffdir/decode_status.h"

#include <cstddef>
#include <cstdint>
#include <span>

/**
 * \file tiff_header.h
 * \brief Classic TIFF header: byte order magic + first directory offset.
 */

namespace tiffdir {

/// Size of the classic TIFF header in bytes.
inline constexpr uint32_t kTiffHeaderSize = 8;

/// Decoded TIFF header.
struct TiffHeader final {
    ByteOrder order       = ByteOrder::Little;
    uint32_t first_offset = 0;
};

/**
 * \brief Detects the byte order and reads the first directory offset.
 *
 * Only `"II\x2A\x00"` (little endian) and `"MM\x00\x2A"` (big endian) are
 * accepted; any other 4 bytes yield \ref TiffDecodeStatus::InvalidFormat.
 * A source shorter than the 8-byte header yields
 * \ref TiffDecodeStatus::Truncated. \p out is written only on success.
 */
TiffDecodeResult
read_tiff_header(std::span<const std::byte> bytes, TiffHeader* out) noexcept;

}  // namespace tiffdir
