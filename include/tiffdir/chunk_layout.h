#pragma once

#include "tiffdir/decode_status.h"
#include "tiffdir/directory.h"
#include "tiffdir/image_mode.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

/**
 * \file chunk_layout.h
 * \brief Strip/tile geometry handed to an external decompressor.
 *
 * Nothing here decompresses. A chunk is a strip or a tile; its raw bytes are
 * returned as stored, together with the compression id and the predictor
 * flag the decompressor needs.
 */

namespace tiffdir {

struct ChunkRef final {
    uint64_t offset     = 0;
    uint64_t byte_count = 0;
};

/// Pixel rectangle covered by one chunk, clipped to the image.
struct ChunkRect final {
    uint32_t x      = 0;
    uint32_t y      = 0;
    uint32_t width  = 0;
    uint32_t length = 0;
};

struct ChunkLayout final {
    bool tiled                = false;
    uint32_t image_width      = 0;
    uint32_t image_length     = 0;
    /// Tile width, or the image width for strips.
    uint32_t chunk_width      = 0;
    /// Tile length, or RowsPerStrip (clamped to the image) for strips.
    uint32_t chunk_length     = 0;
    uint32_t chunks_across    = 0;
    uint32_t chunks_down      = 0;
    uint16_t compression      = 1;
    bool horizontal_predictor = false;
    /// Row-major, `chunks_across * chunks_down` entries.
    std::vector<ChunkRef> chunks;
};

/**
 * \brief Builds the chunk layout of an image.
 *
 * Tiles are used when TileWidth/TileLength are present (both are required and
 * must be non-zero multiples of 16); strips otherwise, with RowsPerStrip
 * defaulting to the image length. The offset and byte-count arrays must hold
 * exactly `chunks_across * chunks_down` values (\ref TiffDecodeStatus::Malformed)
 * and every chunk must lie inside \p source_size bytes
 * (\ref TiffDecodeStatus::Truncated).
 */
TiffDecodeResult
resolve_chunk_layout(const Directory& dir, const ImageInfo& info,
                     uint64_t source_size, ChunkLayout* out);

/// Raw stored bytes of chunk \p index.
TiffDecodeResult
chunk_bytes(std::span<const std::byte> bytes, const ChunkLayout& layout,
            uint32_t index, std::span<const std::byte>* out) noexcept;

/// Pixel rectangle of chunk \p index; false if \p index is out of range.
bool
chunk_rect(const ChunkLayout& layout, uint32_t index, ChunkRect* out) noexcept;

}  // namespace tiffdir
