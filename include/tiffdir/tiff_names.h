#pragma once

#include "tiffdir/image_mode.h"
#include "tiffdir/tiff_types.h"

#include <cstdint>
#include <string_view>

/**
 * \file tiff_names.h
 * \brief Display names for tag ids, type codes and enumerated values.
 *
 * Unknown ids return an empty view.
 */

namespace tiffdir {

std::string_view
tiff_tag_name(uint16_t tag) noexcept;

std::string_view
tiff_type_name(uint16_t type) noexcept;

std::string_view
compression_name(uint16_t compression) noexcept;

std::string_view
photometric_name(uint16_t photometric) noexcept;

std::string_view
image_mode_name(ImageMode mode) noexcept;

/// GeoKey name (e.g. "GTModelTypeGeoKey").
std::string_view
geokey_name(uint16_t key_id) noexcept;

/// ProjCoordTransGeoKey value name (e.g. "CT_TransverseMercator").
std::string_view
coord_transform_name(uint16_t code) noexcept;

}  // namespace tiffdir
