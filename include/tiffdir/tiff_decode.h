#pragma once

#include "tiffdir/decode_options.h"
#include "tiffdir/decode_status.h"
#include "tiffdir/directory.h"
#include "tiffdir/geokey_decode.h"
#include "tiffdir/georeference.h"
#include "tiffdir/image_mode.h"
#include "tiffdir/tiff_header.h"

#include <cstddef>
#include <span>
#include <vector>

/**
 * \file tiff_decode.h
 * \brief Whole-file decode: header, directory chain, modes and GeoKeys.
 */

namespace tiffdir {

/// One directory of the chain with everything derived from it.
struct TiffImage final {
    Directory directory;
    /**
     * Outcome of mode resolution. Only recoverable failures
     * (\ref is_recoverable) are kept here; \ref info is valid only when this
     * is ok.
     */
    TiffDecodeResult mode_result;
    ImageInfo info;
    bool has_geokeys = false;
    GeoKeyDirectory geokeys;
    bool has_georeference = false;
    GeoReference georeference;
};

struct TiffFile final {
    TiffHeader header;
    std::vector<TiffImage> images;
    /// Union of the warnings of every directory.
    DecodeWarnings warnings = DecodeWarnings::None;

    ByteOrder byte_order() const noexcept { return header.order; }
};

/**
 * \brief Decodes every directory of a classic TIFF byte stream.
 *
 * Header, chain, directory, value, GeoKey and georeference failures fail the
 * whole call. Unsupported compression/configuration is recorded per image
 * unless `options.stop_on_unsupported` is set. \p out is written only on
 * success; the returned warnings are the union of all directories'.
 */
TiffDecodeResult
decode_tiff(std::span<const std::byte> bytes, const TiffDecodeOptions& options,
            TiffFile* out);

}  // namespace tiffdir
