#pragma once

#include "tiffdir/decode_status.h"
#include "tiffdir/directory.h"

#include <array>
#include <string>
#include <vector>

/**
 * \file georeference.h
 * \brief Structural reading of the GeoTIFF model tags and GDAL vendor tags.
 *
 * Values are exposed as stored; no georeferencing semantics are checked.
 */

namespace tiffdir {

/// Raster point `(i, j, k)` tied to model point `(x, y, z)`.
struct Tiepoint final {
    double i = 0.0;
    double j = 0.0;
    double k = 0.0;
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;
};

struct GeoReference final {
    bool has_pixel_scale = false;
    std::array<double, 3> pixel_scale {};
    std::vector<Tiepoint> tiepoints;
    bool has_transformation = false;
    /// Row-major 4x4 model transformation.
    std::array<double, 16> transformation {};
    /// GDALMetadata XML, empty when absent.
    std::string gdal_metadata;
    /// GDALNoData text, empty when absent.
    std::string gdal_nodata;

    bool empty() const noexcept;
};

/**
 * \brief Collects ModelPixelScale, ModelTiepoint, ModelTransformation and the
 * GDAL metadata/nodata tags of \p dir.
 *
 * A pixel scale other than 3 values, a tiepoint array that is not a multiple of
 * 6 values, or a transformation other than 16 values fails
 * \ref TiffDecodeStatus::Malformed at \ref TiffDecodeStage::GeoReference.
 */
TiffDecodeResult
read_georeference(const Directory& dir, GeoReference* out);

}  // namespace tiffdir
