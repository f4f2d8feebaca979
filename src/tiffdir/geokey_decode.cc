#include "tiffdir/geokey_decode.h"

#include "tiffdir/tiff_tags.h"

#include <array>
#include <string_view>
#include <utility>

namespace tiffdir {
namespace {

    static TiffDecodeResult geokey_error(TiffDecodeStatus status, uint16_t tag,
                                         const Directory& dir) noexcept
    {
        return decode_error(status, TiffDecodeStage::GeoKeys, tag,
                            dir.offset());
    }


    static std::string_view trim_geo_ascii(std::string_view s) noexcept
    {
        while (!s.empty() && (s.back() == '\0' || s.back() == '|')) {
            s.remove_suffix(1);
        }
        return s;
    }


    static TiffDecodeResult slice_referenced(const Directory& dir,
                                             uint16_t count, uint16_t first,
                                             GeoKeyValue* key)
    {
        const TiffField* ref = dir.find(key->tag_location);
        if (!ref) {
            return geokey_error(TiffDecodeStatus::MissingReferencedTag,
                                key->tag_location, dir);
        }
        const uint32_t end = static_cast<uint32_t>(first) + count;
        if (end > ref->value.count) {
            return geokey_error(TiffDecodeStatus::Truncated, key->tag_location,
                                dir);
        }

        const ByteArena& arena = dir.arena();
        switch (ref->value.type) {
        case TiffType::Ascii: {
            const std::string_view text = value_text(arena, ref->value);
            key->kind  = GeoKeyKind::Ascii;
            key->ascii = std::string(trim_geo_ascii(text.substr(first, count)));
            return decode_ok(TiffDecodeStage::GeoKeys);
        }
        case TiffType::Byte:
        case TiffType::Short:
        case TiffType::Long: {
            key->kind = GeoKeyKind::Shorts;
            key->shorts.reserve(count);
            for (uint32_t i = first; i < end; ++i) {
                uint32_t v = 0;
                if (!value_u32(arena, ref->value, i, &v) || v > UINT16_MAX) {
                    return geokey_error(TiffDecodeStatus::Malformed,
                                        key->tag_location, dir);
                }
                key->shorts.push_back(static_cast<uint16_t>(v));
            }
            return decode_ok(TiffDecodeStage::GeoKeys);
        }
        case TiffType::Float:
        case TiffType::Double:
        case TiffType::Rational:
        case TiffType::SRational: {
            key->kind = GeoKeyKind::Doubles;
            key->doubles.reserve(count);
            for (uint32_t i = first; i < end; ++i) {
                double v = 0.0;
                if (!value_f64(arena, ref->value, i, &v)) {
                    return geokey_error(TiffDecodeStatus::Malformed,
                                        key->tag_location, dir);
                }
                key->doubles.push_back(v);
            }
            return decode_ok(TiffDecodeStage::GeoKeys);
        }
        default: break;
        }
        return geokey_error(TiffDecodeStatus::Malformed, key->tag_location,
                            dir);
    }

}  // namespace

const GeoKeyValue*
GeoKeyDirectory::find(uint16_t key_id) const noexcept
{
    for (const GeoKeyValue& k : keys) {
        if (k.key_id == key_id) {
            return &k;
        }
    }
    return nullptr;
}


TiffDecodeResult
parse_geokeys(const Directory& dir, const TiffDecodeLimits& limits,
              GeoKeyDirectory* out)
{
    const TiffField* field = dir.find(tags::kGeoKeyDirectory);
    if (!field) {
        return geokey_error(TiffDecodeStatus::MissingTag,
                            tags::kGeoKeyDirectory, dir);
    }
    if (field->value.type != TiffType::Short || field->value.count < 4U) {
        return geokey_error(TiffDecodeStatus::Malformed,
                            tags::kGeoKeyDirectory, dir);
    }

    const ByteArena& arena = dir.arena();
    auto short_at = [&](uint32_t index, uint16_t* v) noexcept {
        uint32_t tmp = 0;
        if (!value_u32(arena, field->value, index, &tmp)) {
            return false;
        }
        *v = static_cast<uint16_t>(tmp);
        return true;
    };

    std::array<uint16_t, 4> hdr {};
    for (uint32_t i = 0; i < 4U; ++i) {
        if (!short_at(i, &hdr[i])) {
            return geokey_error(TiffDecodeStatus::Malformed,
                                tags::kGeoKeyDirectory, dir);
        }
    }

    GeoKeyDirectory geo;
    geo.version          = hdr[0];
    geo.key_revision     = hdr[1];
    geo.minor_revision   = hdr[2];
    const uint32_t nkeys = hdr[3];
    if (geo.version != 1U) {
        return geokey_error(TiffDecodeStatus::Malformed,
                            tags::kGeoKeyDirectory, dir);
    }
    if (limits.max_geokeys != 0U && nkeys > limits.max_geokeys) {
        return geokey_error(TiffDecodeStatus::LimitExceeded,
                            tags::kGeoKeyDirectory, dir);
    }
    if (4U + 4U * nkeys > field->value.count) {
        return geokey_error(TiffDecodeStatus::Malformed,
                            tags::kGeoKeyDirectory, dir);
    }

    geo.keys.reserve(nkeys);
    for (uint32_t k = 0; k < nkeys; ++k) {
        const uint32_t base = 4U + 4U * k;
        std::array<uint16_t, 4> entry {};
        for (uint32_t i = 0; i < 4U; ++i) {
            if (!short_at(base + i, &entry[i])) {
                return geokey_error(TiffDecodeStatus::Malformed,
                                    tags::kGeoKeyDirectory, dir);
            }
        }

        GeoKeyValue key;
        key.key_id       = entry[0];
        key.tag_location = entry[1];
        if (key.tag_location == 0U) {
            key.kind        = GeoKeyKind::Short;
            key.short_value = entry[3];
        } else {
            const TiffDecodeResult r = slice_referenced(dir, entry[2],
                                                        entry[3], &key);
            if (!r.ok()) {
                return r;
            }
        }
        geo.keys.push_back(std::move(key));
    }

    *out = std::move(geo);
    return decode_ok(TiffDecodeStage::GeoKeys);
}

}  // namespace tiffdir
