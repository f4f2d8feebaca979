#pragma once

#include <cstdint>

/**
 * \file decode_options.h
 * \brief Decode options and resource limits.
 */

namespace tiffdir {

/// Resource limits applied during decode to bound hostile inputs (0 = unlimited).
struct TiffDecodeLimits final {
    uint32_t max_directories           = 1024;
    uint32_t max_entries_per_directory = 4096;
    uint64_t max_value_bytes           = 64ULL * 1024ULL * 1024ULL;
    /// Sum of decoded payload bytes held by one directory. The arena caps
    /// this at 4 GiB even when unlimited.
    uint64_t max_directory_bytes = 256ULL * 1024ULL * 1024ULL;
    uint32_t max_geokeys         = 4096;
};

/// Options for \ref decode_tiff.
struct TiffDecodeOptions final {
    TiffDecodeLimits limits;
    /// Parse the GeoKey directory of images that carry one.
    bool parse_geokeys = true;
    /// Derive \ref ImageInfo for every image.
    bool resolve_modes = true;
    /**
     * If false, images with an unsupported compression or tag combination
     * keep their failure in \ref TiffImage::mode_result and decoding goes on.
     * If true, decode_tiff() fails on the first such image.
     */
    bool stop_on_unsupported = false;
};

}  // namespace tiffdir
