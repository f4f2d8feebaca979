#include "tiffdir/chunk_layout.h"

#include "tiffdir/byte_order.h"
#include "tiffdir/tiff_tags.h"

#include <utility>

namespace tiffdir {
namespace {

    static TiffDecodeResult layout_error(TiffDecodeStatus status, uint16_t tag,
                                         const Directory& dir) noexcept
    {
        return decode_error(status, TiffDecodeStage::Layout, tag, dir.offset());
    }


    static uint32_t div_round_up(uint32_t n, uint32_t d) noexcept
    {
        return static_cast<uint32_t>((static_cast<uint64_t>(n) + d - 1U) / d);
    }


    static TiffDecodeResult read_tile_geometry(const Directory& dir,
                                               ChunkLayout* layout) noexcept
    {
        const bool has_w = dir.has(tags::kTileWidth);
        const bool has_l = dir.has(tags::kTileLength);
        if (!has_w) {
            return layout_error(TiffDecodeStatus::MissingTag, tags::kTileWidth,
                                dir);
        }
        if (!has_l) {
            return layout_error(TiffDecodeStatus::MissingTag,
                                tags::kTileLength, dir);
        }
        if (!dir.first_u32(tags::kTileWidth, &layout->chunk_width)
            || layout->chunk_width == 0U || layout->chunk_width % 16U != 0U) {
            return layout_error(TiffDecodeStatus::Malformed, tags::kTileWidth,
                                dir);
        }
        if (!dir.first_u32(tags::kTileLength, &layout->chunk_length)
            || layout->chunk_length == 0U
            || layout->chunk_length % 16U != 0U) {
            return layout_error(TiffDecodeStatus::Malformed, tags::kTileLength,
                                dir);
        }
        layout->tiled         = true;
        layout->chunks_across = div_round_up(layout->image_width,
                                             layout->chunk_width);
        layout->chunks_down   = div_round_up(layout->image_length,
                                             layout->chunk_length);
        return decode_ok(TiffDecodeStage::Layout);
    }


    static TiffDecodeResult read_strip_geometry(const Directory& dir,
                                                ChunkLayout* layout) noexcept
    {
        uint32_t rows = layout->image_length;
        if (dir.has(tags::kRowsPerStrip)
            && (!dir.first_u32(tags::kRowsPerStrip, &rows) || rows == 0U)) {
            return layout_error(TiffDecodeStatus::Malformed,
                                tags::kRowsPerStrip, dir);
        }
        // Writers commonly store 2^32-1 for "one strip".
        if (rows > layout->image_length) {
            rows = layout->image_length;
        }
        layout->tiled         = false;
        layout->chunk_width   = layout->image_width;
        layout->chunk_length  = rows;
        layout->chunks_across = 1;
        layout->chunks_down   = rows == 0U
                                    ? 0U
                                    : div_round_up(layout->image_length, rows);
        return decode_ok(TiffDecodeStage::Layout);
    }

}  // namespace

TiffDecodeResult
resolve_chunk_layout(const Directory& dir, const ImageInfo& info,
                     uint64_t source_size, ChunkLayout* out)
{
    ChunkLayout layout;
    layout.image_width          = info.width;
    layout.image_length         = info.length;
    layout.compression          = info.compression;
    layout.horizontal_predictor = info.predictor_flag;

    const bool tiled = dir.has(tags::kTileWidth) || dir.has(tags::kTileLength);
    const TiffDecodeResult g = tiled ? read_tile_geometry(dir, &layout)
                                     : read_strip_geometry(dir, &layout);
    if (!g.ok()) {
        return g;
    }

    const uint16_t offsets_tag = tiled ? tags::kTileOffsets
                                       : tags::kStripOffsets;
    const uint16_t counts_tag  = tiled ? tags::kTileByteCounts
                                       : tags::kStripByteCounts;
    const TiffField* offsets   = dir.find(offsets_tag);
    const TiffField* counts    = dir.find(counts_tag);
    if (!offsets) {
        return layout_error(TiffDecodeStatus::MissingTag, offsets_tag, dir);
    }
    if (!counts) {
        return layout_error(TiffDecodeStatus::MissingTag, counts_tag, dir);
    }

    const uint64_t expected = static_cast<uint64_t>(layout.chunks_across)
                              * layout.chunks_down;
    if (offsets->value.count != expected) {
        return layout_error(TiffDecodeStatus::Malformed, offsets_tag, dir);
    }
    if (counts->value.count != expected) {
        return layout_error(TiffDecodeStatus::Malformed, counts_tag, dir);
    }

    layout.chunks.resize(static_cast<size_t>(expected));
    for (uint32_t i = 0; i < static_cast<uint32_t>(expected); ++i) {
        ChunkRef& c = layout.chunks[i];
        if (!value_u64(dir.arena(), offsets->value, i, &c.offset)) {
            return layout_error(TiffDecodeStatus::Malformed, offsets_tag, dir);
        }
        if (!value_u64(dir.arena(), counts->value, i, &c.byte_count)) {
            return layout_error(TiffDecodeStatus::Malformed, counts_tag, dir);
        }
        if (c.offset > source_size || c.byte_count > source_size - c.offset) {
            return layout_error(TiffDecodeStatus::Truncated, offsets_tag, dir);
        }
    }

    *out = std::move(layout);
    return decode_ok(TiffDecodeStage::Layout);
}


TiffDecodeResult
chunk_bytes(std::span<const std::byte> bytes, const ChunkLayout& layout,
            uint32_t index, std::span<const std::byte>* out) noexcept
{
    if (index >= layout.chunks.size()) {
        return decode_error(TiffDecodeStatus::Malformed,
                            TiffDecodeStage::Layout);
    }
    const ChunkRef& c = layout.chunks[index];
    if (!range_in_bounds(bytes, c.offset, c.byte_count)) {
        return decode_error(TiffDecodeStatus::Truncated,
                            TiffDecodeStage::Layout, 0, c.offset);
    }
    *out = bytes.subspan(static_cast<size_t>(c.offset),
                         static_cast<size_t>(c.byte_count));
    return decode_ok(TiffDecodeStage::Layout);
}


bool
chunk_rect(const ChunkLayout& layout, uint32_t index, ChunkRect* out) noexcept
{
    if (index >= layout.chunks.size() || layout.chunks_across == 0U) {
        return false;
    }
    const uint32_t col = index % layout.chunks_across;
    const uint32_t row = index / layout.chunks_across;

    ChunkRect r;
    r.x = static_cast<uint32_t>(static_cast<uint64_t>(col)
                                * layout.chunk_width);
    r.y = static_cast<uint32_t>(static_cast<uint64_t>(row)
                                * layout.chunk_length);
    if (r.x >= layout.image_width || r.y >= layout.image_length) {
        return false;
    }
    r.width  = layout.image_width - r.x < layout.chunk_width
                   ? layout.image_width - r.x
                   : layout.chunk_width;
    r.length = layout.image_length - r.y < layout.chunk_length
                   ? layout.image_length - r.y
                   : layout.chunk_length;
    *out = r;
    return true;
}

}  // namespace tiffdir
