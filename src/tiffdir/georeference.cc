#include "tiffdir/georeference.h"

#include "tiffdir/tiff_tags.h"

#include <string_view>
#include <utility>

namespace tiffdir {
namespace {

    static TiffDecodeResult georef_error(uint16_t tag,
                                         const Directory& dir) noexcept
    {
        return decode_error(TiffDecodeStatus::Malformed,
                            TiffDecodeStage::GeoReference, tag, dir.offset());
    }


    // Optional double array; returns false when present but not numeric.
    static bool read_doubles(const Directory& dir, uint16_t tag, bool* present,
                             std::vector<double>* out)
    {
        *present = dir.has(tag);
        if (!*present) {
            out->clear();
            return true;
        }
        return dir.values_f64(tag, out);
    }


    static bool read_text(const Directory& dir, uint16_t tag, std::string* out)
    {
        std::string_view s;
        if (!dir.has(tag)) {
            out->clear();
            return true;
        }
        if (!dir.ascii(tag, &s)) {
            return false;
        }
        out->assign(s.data(), s.size());
        return true;
    }

}  // namespace

bool
GeoReference::empty() const noexcept
{
    return !has_pixel_scale && tiepoints.empty() && !has_transformation
           && gdal_metadata.empty() && gdal_nodata.empty();
}


TiffDecodeResult
read_georeference(const Directory& dir, GeoReference* out)
{
    GeoReference geo;
    std::vector<double> v;
    bool present = false;

    if (!read_doubles(dir, tags::kModelPixelScale, &present, &v)
        || (present && v.size() != 3U)) {
        return georef_error(tags::kModelPixelScale, dir);
    }
    if (present) {
        geo.has_pixel_scale = true;
        for (size_t i = 0; i < 3U; ++i) {
            geo.pixel_scale[i] = v[i];
        }
    }

    if (!read_doubles(dir, tags::kModelTiepoint, &present, &v)
        || (present && (v.empty() || v.size() % 6U != 0U))) {
        return georef_error(tags::kModelTiepoint, dir);
    }
    geo.tiepoints.reserve(v.size() / 6U);
    for (size_t i = 0; i + 6U <= v.size(); i += 6U) {
        Tiepoint t;
        t.i = v[i + 0];
        t.j = v[i + 1];
        t.k = v[i + 2];
        t.x = v[i + 3];
        t.y = v[i + 4];
        t.z = v[i + 5];
        geo.tiepoints.push_back(t);
    }

    if (!read_doubles(dir, tags::kModelTransformation, &present, &v)
        || (present && v.size() != 16U)) {
        return georef_error(tags::kModelTransformation, dir);
    }
    if (present) {
        geo.has_transformation = true;
        for (size_t i = 0; i < 16U; ++i) {
            geo.transformation[i] = v[i];
        }
    }

    if (!read_text(dir, tags::kGdalMetadata, &geo.gdal_metadata)) {
        return georef_error(tags::kGdalMetadata, dir);
    }
    if (!read_text(dir, tags::kGdalNoData, &geo.gdal_nodata)) {
        return georef_error(tags::kGdalNoData, dir);
    }

    *out = std::move(geo);
    return decode_ok(TiffDecodeStage::GeoReference);
}

}  // namespace tiffdir
