#include "tiffdir/image_mode.h"

#include "tiffdir/tiff_tags.h"

#include <utility>

namespace tiffdir {
namespace {

    static TiffDecodeResult mode_error(TiffDecodeStatus status, uint16_t tag,
                                       const Directory& dir) noexcept
    {
        return decode_error(status, TiffDecodeStage::Mode, tag, dir.offset());
    }


    // Reads the first value of an optional SHORT/LONG tag, keeping
    // \p fallback when the tag is absent.
    static bool read_u16_or(const Directory& dir, uint16_t tag,
                            uint16_t fallback, uint16_t* out) noexcept
    {
        const TiffField* f = dir.find(tag);
        if (!f) {
            *out = fallback;
            return true;
        }
        uint32_t v = 0;
        if (!value_u32(dir.arena(), f->value, 0, &v) || v > UINT16_MAX) {
            return false;
        }
        *out = static_cast<uint16_t>(v);
        return true;
    }


    static bool is_supported_depth(uint16_t bits) noexcept
    {
        return bits == 1 || bits == 2 || bits == 4 || bits == 8 || bits == 16;
    }


    static TiffDecodeResult read_bits_per_sample(const Directory& dir,
                                                 ImageInfo* info)
    {
        std::vector<uint32_t> stored;
        if (!dir.has(tags::kBitsPerSample)) {
            stored.push_back(1);
        } else if (!dir.values_u32(tags::kBitsPerSample, &stored)
                   || stored.empty()) {
            return mode_error(TiffDecodeStatus::Malformed,
                              tags::kBitsPerSample, dir);
        }

        if (stored.size() == 1U && info->samples_per_pixel > 1U) {
            stored.resize(info->samples_per_pixel, stored[0]);
        }
        if (stored.size() != info->samples_per_pixel) {
            return mode_error(TiffDecodeStatus::Malformed,
                              tags::kBitsPerSample, dir);
        }

        info->bits_per_sample.clear();
        info->bits_per_sample.reserve(stored.size());
        for (const uint32_t bits : stored) {
            if (bits == 0U || bits > UINT16_MAX) {
                return mode_error(TiffDecodeStatus::Malformed,
                                  tags::kBitsPerSample, dir);
            }
            info->bits_per_sample.push_back(static_cast<uint16_t>(bits));
        }
        return decode_ok(TiffDecodeStage::Mode);
    }


    static TiffDecodeResult read_sample_format(const Directory& dir,
                                               ImageInfo* info)
    {
        std::vector<uint32_t> formats;
        if (!dir.has(tags::kSampleFormat)) {
            info->sample_format = sample_format::kUnsigned;
            return decode_ok(TiffDecodeStage::Mode);
        }
        if (!dir.values_u32(tags::kSampleFormat, &formats) || formats.empty()
            || formats[0] > UINT16_MAX) {
            return mode_error(TiffDecodeStatus::Malformed, tags::kSampleFormat,
                              dir);
        }
        info->sample_format = static_cast<uint16_t>(formats[0]);
        for (const uint32_t f : formats) {
            if (f != sample_format::kUnsigned) {
                return mode_error(TiffDecodeStatus::UnsupportedConfiguration,
                                  tags::kSampleFormat, dir);
            }
        }
        return decode_ok(TiffDecodeStage::Mode);
    }


    static TiffDecodeResult read_resolution(const Directory& dir,
                                            Resolution* out) noexcept
    {
        Resolution res;
        if (!read_u16_or(dir, tags::kResolutionUnit,
                         resolution_unit::kPerInch, &res.unit)) {
            return mode_error(TiffDecodeStatus::Malformed,
                              tags::kResolutionUnit, dir);
        }
        const TiffField* x = dir.find(tags::kXResolution);
        const TiffField* y = dir.find(tags::kYResolution);
        if (x && y) {
            // A zero denominator leaves the resolution unset.
            res.present = value_f64(dir.arena(), x->value, 0, &res.x)
                          && value_f64(dir.arena(), y->value, 0, &res.y);
        }
        *out = res;
        return decode_ok(TiffDecodeStage::Mode);
    }


    static TiffDecodeResult resolve_gray(const Directory& dir, ImageInfo* info)
    {
        if (info->samples_per_pixel != 1U) {
            return mode_error(TiffDecodeStatus::UnsupportedConfiguration,
                              tags::kSamplesPerPixel, dir);
        }
        const bool white_is_zero = info->photometric
                                   == photometric::kWhiteIsZero;
        if (info->bits_per_sample[0] == 1U) {
            info->mode         = ImageMode::Bilevel;
            info->min_is_white = white_is_zero;
        } else {
            info->mode = white_is_zero ? ImageMode::GrayInverted
                                       : ImageMode::Gray;
        }
        return decode_ok(TiffDecodeStage::Mode);
    }


    static TiffDecodeResult resolve_paletted(const Directory& dir,
                                             ImageInfo* info)
    {
        if (info->samples_per_pixel != 1U) {
            return mode_error(TiffDecodeStatus::UnsupportedConfiguration,
                              tags::kSamplesPerPixel, dir);
        }
        const uint16_t bits = info->bits_per_sample[0];
        if (bits > 8U) {
            return mode_error(TiffDecodeStatus::UnsupportedConfiguration,
                              tags::kBitsPerSample, dir);
        }
        const TiffField* cmap = dir.find(tags::kColorMap);
        if (!cmap) {
            return mode_error(TiffDecodeStatus::MissingTag, tags::kColorMap,
                              dir);
        }
        if (cmap->value.type != TiffType::Short
            || cmap->value.count != (3U << bits)) {
            return mode_error(TiffDecodeStatus::Malformed, tags::kColorMap,
                              dir);
        }
        info->mode = ImageMode::Paletted;
        return decode_ok(TiffDecodeStage::Mode);
    }


    static TiffDecodeResult resolve_rgb(const Directory& dir, ImageInfo* info)
    {
        const uint16_t bits = info->bits_per_sample[0];
        if (bits != 8U && bits != 16U) {
            return mode_error(TiffDecodeStatus::Malformed,
                              tags::kBitsPerSample, dir);
        }
        for (const uint16_t b : info->bits_per_sample) {
            if (b != bits) {
                return mode_error(TiffDecodeStatus::Malformed,
                                  tags::kBitsPerSample, dir);
            }
        }

        switch (info->samples_per_pixel) {
        case 3: info->mode = ImageMode::Rgb; break;
        case 4:
            if (info->extra_sample == extra_samples::kAssociatedAlpha) {
                info->mode = ImageMode::Rgba;
            } else if (info->extra_sample
                       == extra_samples::kUnassociatedAlpha) {
                info->mode = ImageMode::Nrgba;
            } else {
                return mode_error(TiffDecodeStatus::UnsupportedConfiguration,
                                  tags::kExtraSamples, dir);
            }
            break;
        default:
            return mode_error(TiffDecodeStatus::UnsupportedConfiguration,
                              tags::kSamplesPerPixel, dir);
        }
        return decode_ok(TiffDecodeStage::Mode);
    }

}  // namespace

bool
is_known_compression(uint16_t id) noexcept
{
    switch (id) {
    case compression::kNone:
    case compression::kCcitt:
    case compression::kGroup3Fax:
    case compression::kGroup4Fax:
    case compression::kLzw:
    case compression::kJpegOld:
    case compression::kJpeg:
    case compression::kDeflate:
    case compression::kPackBits:
    case compression::kDeflateOld: return true;
    default: return false;
    }
}


TiffDecodeResult
resolve_image_info(const Directory& dir, ImageInfo* out)
{
    ImageInfo info;

    const TiffField* width  = dir.find(tags::kImageWidth);
    const TiffField* length = dir.find(tags::kImageLength);
    if (!width) {
        return mode_error(TiffDecodeStatus::MissingTag, tags::kImageWidth,
                          dir);
    }
    if (!length) {
        return mode_error(TiffDecodeStatus::MissingTag, tags::kImageLength,
                          dir);
    }
    if (!value_u32(dir.arena(), width->value, 0, &info.width)) {
        return mode_error(TiffDecodeStatus::Malformed, tags::kImageWidth,
                          dir);
    }
    if (!value_u32(dir.arena(), length->value, 0, &info.length)) {
        return mode_error(TiffDecodeStatus::Malformed, tags::kImageLength,
                          dir);
    }

    if (!read_u16_or(dir, tags::kCompression, compression::kNone,
                     &info.compression)) {
        return mode_error(TiffDecodeStatus::Malformed, tags::kCompression,
                          dir);
    }
    if (!is_known_compression(info.compression)) {
        return mode_error(TiffDecodeStatus::UnsupportedCompression,
                          tags::kCompression, dir);
    }

    if (!read_u16_or(dir, tags::kSamplesPerPixel, 1, &info.samples_per_pixel)
        || info.samples_per_pixel == 0U) {
        return mode_error(TiffDecodeStatus::Malformed, tags::kSamplesPerPixel,
                          dir);
    }
    if (!read_u16_or(dir, tags::kPhotometricInterpretation,
                     photometric::kWhiteIsZero, &info.photometric)) {
        return mode_error(TiffDecodeStatus::Malformed,
                          tags::kPhotometricInterpretation, dir);
    }

    TiffDecodeResult r = read_bits_per_sample(dir, &info);
    if (!r.ok()) {
        return r;
    }
    for (const uint16_t bits : info.bits_per_sample) {
        if (!is_supported_depth(bits)) {
            return mode_error(TiffDecodeStatus::UnsupportedConfiguration,
                              tags::kBitsPerSample, dir);
        }
    }
    r = read_sample_format(dir, &info);
    if (!r.ok()) {
        return r;
    }

    if (!read_u16_or(dir, tags::kPlanarConfiguration, planar::kChunky,
                     &info.planar_config)
        || (info.planar_config != planar::kChunky
            && info.planar_config != planar::kPlanar)) {
        return mode_error(TiffDecodeStatus::Malformed,
                          tags::kPlanarConfiguration, dir);
    }
    if (info.planar_config == planar::kPlanar
        && info.samples_per_pixel > 1U) {
        return mode_error(TiffDecodeStatus::UnsupportedConfiguration,
                          tags::kPlanarConfiguration, dir);
    }

    if (!read_u16_or(dir, tags::kPredictor, predictor::kNone,
                     &info.predictor)) {
        return mode_error(TiffDecodeStatus::Malformed, tags::kPredictor, dir);
    }
    if (info.predictor == predictor::kHorizontal) {
        for (const uint16_t bits : info.bits_per_sample) {
            if (bits != 8U && bits != 16U) {
                return mode_error(TiffDecodeStatus::UnsupportedConfiguration,
                                  tags::kPredictor, dir);
            }
        }
        info.predictor_flag = true;
    } else if (info.predictor != predictor::kNone) {
        return mode_error(TiffDecodeStatus::UnsupportedConfiguration,
                          tags::kPredictor, dir);
    }

    if (!read_u16_or(dir, tags::kExtraSamples, extra_samples::kUnspecified,
                     &info.extra_sample)) {
        return mode_error(TiffDecodeStatus::Malformed, tags::kExtraSamples,
                          dir);
    }
    if (!read_u16_or(dir, tags::kOrientation, 1, &info.orientation)) {
        return mode_error(TiffDecodeStatus::Malformed, tags::kOrientation,
                          dir);
    }
    r = read_resolution(dir, &info.resolution);
    if (!r.ok()) {
        return r;
    }

    switch (info.photometric) {
    case photometric::kWhiteIsZero:
    case photometric::kBlackIsZero: r = resolve_gray(dir, &info); break;
    case photometric::kPaletted: r = resolve_paletted(dir, &info); break;
    case photometric::kRgb: r = resolve_rgb(dir, &info); break;
    default:
        r = mode_error(TiffDecodeStatus::UnsupportedConfiguration,
                       tags::kPhotometricInterpretation, dir);
        break;
    }
    if (!r.ok()) {
        return r;
    }

    *out = std::move(info);
    return decode_ok(TiffDecodeStage::Mode);
}


TiffDecodeResult
read_palette(const Directory& dir, const ImageInfo& info,
             std::vector<PaletteEntry>* out)
{
    const TiffField* cmap = dir.find(tags::kColorMap);
    if (!cmap) {
        return mode_error(TiffDecodeStatus::MissingTag, tags::kColorMap, dir);
    }
    if (info.bits_per_sample.empty() || info.bits_per_sample[0] > 8U) {
        return mode_error(TiffDecodeStatus::UnsupportedConfiguration,
                          tags::kBitsPerSample, dir);
    }
    const uint32_t n = 1U << info.bits_per_sample[0];
    if (cmap->value.count != 3U * n) {
        return mode_error(TiffDecodeStatus::Malformed, tags::kColorMap, dir);
    }

    // Stored as three planes: all reds, then greens, then blues.
    std::vector<PaletteEntry> palette(n);
    for (uint32_t i = 0; i < n; ++i) {
        uint32_t r = 0;
        uint32_t g = 0;
        uint32_t b = 0;
        if (!value_u32(dir.arena(), cmap->value, i, &r)
            || !value_u32(dir.arena(), cmap->value, n + i, &g)
            || !value_u32(dir.arena(), cmap->value, 2U * n + i, &b)
            || r > UINT16_MAX || g > UINT16_MAX || b > UINT16_MAX) {
            return mode_error(TiffDecodeStatus::Malformed, tags::kColorMap,
                              dir);
        }
        palette[i].red   = static_cast<uint16_t>(r);
        palette[i].green = static_cast<uint16_t>(g);
        palette[i].blue  = static_cast<uint16_t>(b);
    }

    *out = std::move(palette);
    return decode_ok(TiffDecodeStage::Mode);
}

}  // namespace tiffdir
