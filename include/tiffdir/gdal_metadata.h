#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

/**
 * \file gdal_metadata.h
 * \brief Item extraction from the GDALMetadata (42112) XML text.
 *
 * The payload looks like
 * `<GDALMetadata><Item name="SCALE" sample="0" role="scale">2</Item>...`.
 * Parsing requires Expat (`TIFFDIR_HAS_EXPAT`); without it every call
 * reports \ref GdalMetadataStatus::Unsupported.
 */

namespace tiffdir {

enum class GdalMetadataStatus : uint8_t {
    Ok,
    /// Expat is not available, or the text is not XML.
    Unsupported,
    /// XML error, or a root element other than `GDALMetadata`.
    Malformed,
    LimitExceeded,
};

struct GdalMetadataLimits final {
    uint32_t max_input_bytes = 16U * 1024U * 1024U;
    uint32_t max_items       = 4096;
    uint32_t max_value_bytes = 1024U * 1024U;
};

struct GdalMetadataItem final {
    std::string name;
    std::string domain;
    std::string role;
    /// Band index, -1 for dataset-wide items.
    int32_t sample = -1;
    std::string value;
};

bool
gdal_metadata_available() noexcept;

std::string_view
gdal_metadata_status_name(GdalMetadataStatus status) noexcept;

/// Parses every `Item` under the root. \p out is written only on Ok.
GdalMetadataStatus
parse_gdal_metadata(std::string_view xml, const GdalMetadataLimits& limits,
                    std::vector<GdalMetadataItem>* out) noexcept;

}  // namespace tiffdir
