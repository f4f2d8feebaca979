#pragma once

#include "tiffdir/decode_options.h"
#include "tiffdir/decode_status.h"
#include "tiffdir/directory.h"

#include <cstdint>
#include <string>
#include <vector>

/**
 * \file geokey_decode.h
 * \brief GeoKey directory (tag 34735) parsing.
 *
 * The GeoKey directory is a SHORT array laid out as a 4-value header
 * `{version, key_revision, minor_revision, key_count}` followed by `key_count`
 * entries `{key_id, tag_location, count, value_or_offset}`. Entries with
 * `tag_location == 0` carry the value inline; otherwise `count` elements
 * starting at `value_or_offset` are sliced out of the tag `tag_location`
 * (usually GeoDoubleParams or GeoAsciiParams) of the same directory.
 */

namespace tiffdir {

enum class GeoKeyKind : uint8_t {
    /// Inline SHORT value (`tag_location == 0`).
    Short,
    /// SHORT slice of another tag.
    Shorts,
    Doubles,
    Ascii,
};

struct GeoKeyValue final {
    uint16_t key_id       = 0;
    uint16_t tag_location = 0;
    GeoKeyKind kind       = GeoKeyKind::Short;
    uint16_t short_value  = 0;
    std::vector<uint16_t> shorts;
    std::vector<double> doubles;
    /// Trailing `|` separators and NULs removed.
    std::string ascii;
};

struct GeoKeyDirectory final {
    uint16_t version        = 0;
    uint16_t key_revision   = 0;
    uint16_t minor_revision = 0;
    /// Keys in directory order.
    std::vector<GeoKeyValue> keys;

    const GeoKeyValue* find(uint16_t key_id) const noexcept;
};

/**
 * \brief Parses the GeoKey directory of \p dir.
 *
 * Fails with \ref TiffDecodeStage::GeoKeys and:
 * - \ref TiffDecodeStatus::MissingTag if \p dir has no GeoKey directory tag;
 * - \ref TiffDecodeStatus::MissingReferencedTag if a key names an absent tag;
 * - \ref TiffDecodeStatus::Truncated if a slice runs past the referenced tag;
 * - \ref TiffDecodeStatus::Malformed for a bad header or key table;
 * - \ref TiffDecodeStatus::LimitExceeded above `limits.max_geokeys`.
 *
 * \p out is written only on success.
 */
TiffDecodeResult
parse_geokeys(const Directory& dir, const TiffDecodeLimits& limits,
              GeoKeyDirectory* out);

}  // namespace tiffdir
