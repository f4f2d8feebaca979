#include "tiffdir/tiff_decode.h"

#include "tiffdir/directory_decode.h"
#include "tiffdir/tiff_tags.h"

#include <utility>

namespace tiffdir {
namespace {

    static bool has_georeference_tags(const Directory& dir) noexcept
    {
        return dir.has(tags::kModelPixelScale) || dir.has(tags::kModelTiepoint)
               || dir.has(tags::kModelTransformation)
               || dir.has(tags::kGdalMetadata) || dir.has(tags::kGdalNoData);
    }


    static TiffDecodeResult decode_image(std::span<const std::byte> bytes,
                                         const TiffHeader& header,
                                         uint64_t offset,
                                         const TiffDecodeOptions& options,
                                         TiffImage* image)
    {
        TiffDecodeResult r = decode_directory(bytes, header.order, offset,
                                              options.limits,
                                              &image->directory);
        if (!r.ok()) {
            return r;
        }
        const DecodeWarnings warnings = r.warnings;
        const Directory& dir          = image->directory;

        image->mode_result = decode_ok(TiffDecodeStage::Mode);
        if (options.resolve_modes) {
            r = resolve_image_info(dir, &image->info);
            if (!r.ok()) {
                if (options.stop_on_unsupported
                    || !is_recoverable(r.status)) {
                    return r;
                }
                image->mode_result = r;
            }
        }

        if (options.parse_geokeys) {
            if (dir.has(tags::kGeoKeyDirectory)) {
                r = parse_geokeys(dir, options.limits, &image->geokeys);
                if (!r.ok()) {
                    return r;
                }
                image->has_geokeys = true;
            }
            if (has_georeference_tags(dir)) {
                r = read_georeference(dir, &image->georeference);
                if (!r.ok()) {
                    return r;
                }
                image->has_georeference = true;
            }
        }

        TiffDecodeResult ok = decode_ok(TiffDecodeStage::Directory);
        ok.offset           = offset;
        ok.warnings         = warnings;
        return ok;
    }

}  // namespace

TiffDecodeResult
decode_tiff(std::span<const std::byte> bytes, const TiffDecodeOptions& options,
            TiffFile* out)
{
    TiffFile file;
    TiffDecodeResult r = read_tiff_header(bytes, &file.header);
    if (!r.ok()) {
        return r;
    }

    std::vector<uint64_t> offsets;
    r = list_directory_offsets(bytes, file.header, options.limits, &offsets);
    if (!r.ok()) {
        return r;
    }

    file.images.reserve(offsets.size());
    for (const uint64_t offset : offsets) {
        TiffImage image;
        r = decode_image(bytes, file.header, offset, options, &image);
        if (!r.ok()) {
            return r;
        }
        file.warnings |= r.warnings;
        file.images.push_back(std::move(image));
    }

    TiffDecodeResult result = decode_ok(TiffDecodeStage::Chain);
    result.warnings         = file.warnings;
    *out                    = std::move(file);
    return result;
}

}  // namespace tiffdir
