#pragma once

#include "tiffdir/decode_status.h"
#include "tiffdir/directory.h"

#include <cstdint>
#include <vector>

/**
 * \file image_mode.h
 * \brief Derivation of the pixel encoding mode from baseline tags.
 */

namespace tiffdir {

/// Pixel encoding of one image. Derived from tags, never stored in the file.
enum class ImageMode : uint8_t {
    Bilevel,
    Paletted,
    Gray,
    GrayInverted,
    Rgb,
    /// RGB with premultiplied (associated) alpha.
    Rgba,
    /// RGB with straight (unassociated) alpha.
    Nrgba,
};

/// Physical resolution from XResolution/YResolution/ResolutionUnit.
struct Resolution final {
    bool present  = false;
    double x      = 0.0;
    double y      = 0.0;
    uint16_t unit = 2;
};

/**
 * \brief Validated description of one image.
 *
 * Baseline defaults are applied for absent tags. \ref predictor_flag is set
 * for horizontal differencing; undoing it is left to the decompressor.
 */
struct ImageInfo final {
    uint32_t width  = 0;
    uint32_t length = 0;
    /// One entry per sample (a single stored value is expanded).
    std::vector<uint16_t> bits_per_sample;
    uint16_t samples_per_pixel = 1;
    uint16_t compression       = 1;
    uint16_t photometric       = 0;
    ImageMode mode             = ImageMode::Bilevel;
    /// Bilevel images with white-is-zero photometric.
    bool min_is_white   = false;
    uint16_t predictor  = 1;
    bool predictor_flag = false;
    /// ExtraSamples value of the alpha channel, 0 when absent.
    uint16_t extra_sample  = 0;
    uint16_t planar_config = 1;
    uint16_t sample_format = 1;
    uint16_t orientation   = 1;
    Resolution resolution;
};

/// One ColorMap entry with 16-bit channels as stored.
struct PaletteEntry final {
    uint16_t red   = 0;
    uint16_t green = 0;
    uint16_t blue  = 0;
};

/// Returns true for compression ids this library recognizes.
bool
is_known_compression(uint16_t compression) noexcept;

/**
 * \brief Resolves \p dir into an \ref ImageInfo.
 *
 * Fails \ref TiffDecodeStatus::MissingTag without ImageWidth/ImageLength,
 * \ref TiffDecodeStatus::UnsupportedCompression for unknown compression ids
 * and \ref TiffDecodeStatus::UnsupportedConfiguration for tag combinations
 * with no mode (CMYK, YCbCr, CIE Lab, float samples...). Those two statuses
 * are recoverable: the image can be skipped. All failures use
 * \ref TiffDecodeStage::Mode. \p out is written only on success.
 */
TiffDecodeResult
resolve_image_info(const Directory& dir, ImageInfo* out);

/// Decodes the ColorMap of a paletted image (`2^bps` entries).
TiffDecodeResult
read_palette(const Directory& dir, const ImageInfo& info,
             std::vector<PaletteEntry>* out);

}  // namespace tiffdir
