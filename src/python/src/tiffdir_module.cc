#include "tiffdir/gdal_metadata.h"
#include "tiffdir/mapped_file.h"
#include "tiffdir/tiff_decode.h"
#include "tiffdir/tiff_names.h"

#include <nanobind/nanobind.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/vector.h>

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace nb = nanobind;
using namespace nb::literals;

namespace tiffdir {
namespace {

    static nb::str sv_to_py(std::string_view s)
    {
        return nb::str(s.data(), s.size());
    }


    [[noreturn]] static void raise_decode_error(const TiffDecodeResult& r)
    {
        std::string msg(decode_status_name(r.status));
        msg.append(" at ");
        msg.append(decode_stage_name(r.stage));
        msg.append(" (tag=");
        msg.append(std::to_string(r.tag));
        msg.append(", offset=");
        msg.append(std::to_string(r.offset));
        msg.append(")");
        throw nb::value_error(msg.c_str());
    }


    static nb::object field_to_py(const ByteArena& arena, const TiffValue& v)
    {
        if (v.type == TiffType::Ascii) {
            nb::list runs;
            std::vector<std::string_view> parts;
            value_ascii_runs(arena, v, &parts);
            if (parts.size() == 1U) {
                return sv_to_py(parts[0]);
            }
            for (const std::string_view s : parts) {
                runs.append(sv_to_py(s));
            }
            return runs;
        }
        if (v.type == TiffType::Undefined) {
            const std::span<const std::byte> raw = value_bytes(arena, v);
            return nb::bytes(reinterpret_cast<const char*>(raw.data()),
                             raw.size());
        }

        nb::list out;
        for (uint32_t i = 0; i < v.count; ++i) {
            int64_t s = 0;
            double d  = 0.0;
            URational ur;
            SRational sr;
            if (is_rational_type(v.type)) {
                if (value_urational(arena, v, i, &ur)) {
                    out.append(nb::make_tuple(ur.numer, ur.denom));
                } else if (value_srational(arena, v, i, &sr)) {
                    out.append(nb::make_tuple(sr.numer, sr.denom));
                }
            } else if (is_integer_type(v.type)) {
                if (value_i64(arena, v, i, &s)) {
                    out.append(nb::int_(s));
                }
            } else if (value_f64(arena, v, i, &d)) {
                out.append(nb::float_(d));
            }
        }
        return out;
    }


    static nb::object geokey_to_py(const GeoKeyValue& k)
    {
        switch (k.kind) {
        case GeoKeyKind::Short: return nb::int_(k.short_value);
        case GeoKeyKind::Shorts: return nb::cast(k.shorts);
        case GeoKeyKind::Doubles: return nb::cast(k.doubles);
        case GeoKeyKind::Ascii: return nb::str(k.ascii.c_str());
        }
        return nb::none();
    }


    static nb::dict georeference_to_py(const GeoReference& ref)
    {
        nb::dict d;
        if (ref.has_pixel_scale) {
            d["pixel_scale"] = nb::make_tuple(ref.pixel_scale[0],
                                              ref.pixel_scale[1],
                                              ref.pixel_scale[2]);
        }
        nb::list tiepoints;
        for (const Tiepoint& t : ref.tiepoints) {
            tiepoints.append(nb::make_tuple(t.i, t.j, t.k, t.x, t.y, t.z));
        }
        d["tiepoints"] = tiepoints;
        if (ref.has_transformation) {
            nb::list m;
            for (const double v : ref.transformation) {
                m.append(nb::float_(v));
            }
            d["transformation"] = m;
        }
        if (!ref.gdal_nodata.empty()) {
            d["gdal_nodata"] = nb::str(ref.gdal_nodata.c_str());
        }
        if (!ref.gdal_metadata.empty()) {
            std::vector<GdalMetadataItem> items;
            if (parse_gdal_metadata(ref.gdal_metadata, GdalMetadataLimits {},
                                    &items)
                == GdalMetadataStatus::Ok) {
                nb::list md;
                for (const GdalMetadataItem& item : items) {
                    nb::dict e;
                    e["name"]   = nb::str(item.name.c_str());
                    e["domain"] = nb::str(item.domain.c_str());
                    e["role"]   = nb::str(item.role.c_str());
                    e["sample"] = item.sample;
                    e["value"]  = nb::str(item.value.c_str());
                    md.append(e);
                }
                d["gdal_metadata"] = md;
            } else {
                d["gdal_metadata"] = nb::str(ref.gdal_metadata.c_str());
            }
        }
        return d;
    }


    static nb::dict image_to_py(const TiffImage& image)
    {
        const Directory& dir = image.directory;

        nb::dict tags;
        for (const TiffField& f : dir.fields()) {
            tags[nb::int_(f.tag)] = field_to_py(dir.arena(), f.value);
        }

        nb::dict d;
        d["offset"] = dir.offset();
        d["tags"]   = tags;
        if (image.mode_result.ok()) {
            const ImageInfo& info = image.info;
            d["mode"]             = sv_to_py(image_mode_name(info.mode));
            d["width"]            = info.width;
            d["length"]           = info.length;
            d["bits_per_sample"]  = nb::cast(info.bits_per_sample);
            d["compression"]      = info.compression;
            d["predictor"]        = info.predictor_flag;
        } else {
            d["mode"]  = nb::none();
            d["error"] = sv_to_py(decode_status_name(image.mode_result.status));
        }
        if (image.has_geokeys) {
            nb::dict keys;
            for (const GeoKeyValue& k : image.geokeys.keys) {
                keys[nb::int_(k.key_id)] = geokey_to_py(k);
            }
            d["geokeys"] = keys;
        }
        if (image.has_georeference) {
            d["georeference"] = georeference_to_py(image.georeference);
        }
        return d;
    }


    static nb::list decode_to_py(std::span<const std::byte> bytes,
                                 const TiffDecodeOptions& options)
    {
        TiffFile file;
        TiffDecodeResult r;
        {
            nb::gil_scoped_release gil_release;
            r = decode_tiff(bytes, options, &file);
        }
        if (!r.ok()) {
            raise_decode_error(r);
        }
        nb::list images;
        for (const TiffImage& image : file.images) {
            images.append(image_to_py(image));
        }
        return images;
    }


    static TiffDecodeOptions make_options(bool parse_geokeys,
                                          uint32_t max_directories)
    {
        TiffDecodeOptions options;
        options.parse_geokeys          = parse_geokeys;
        options.limits.max_directories = max_directories;
        return options;
    }

}  // namespace
}  // namespace tiffdir

NB_MODULE(tiffdir, m)
{
    using namespace tiffdir;

    m.doc() = "TIFF/GeoTIFF directory decoding bindings (nanobind).";

    nb::enum_<TiffDecodeStatus>(m, "TiffDecodeStatus")
        .value("Ok", TiffDecodeStatus::Ok)
        .value("InvalidFormat", TiffDecodeStatus::InvalidFormat)
        .value("Truncated", TiffDecodeStatus::Truncated)
        .value("Overflow", TiffDecodeStatus::Overflow)
        .value("UnsupportedType", TiffDecodeStatus::UnsupportedType)
        .value("UnsupportedCompression",
               TiffDecodeStatus::UnsupportedCompression)
        .value("UnsupportedConfiguration",
               TiffDecodeStatus::UnsupportedConfiguration)
        .value("MissingTag", TiffDecodeStatus::MissingTag)
        .value("MissingReferencedTag", TiffDecodeStatus::MissingReferencedTag)
        .value("LimitExceeded", TiffDecodeStatus::LimitExceeded)
        .value("Malformed", TiffDecodeStatus::Malformed);

    m.def(
        "decode",
        [](nb::bytes data, bool parse_geokeys, uint32_t max_directories) {
            const std::span<const std::byte> bytes(
                reinterpret_cast<const std::byte*>(data.c_str()), data.size());
            return decode_to_py(bytes,
                                make_options(parse_geokeys, max_directories));
        },
        "data"_a, "parse_geokeys"_a = true, "max_directories"_a = 1024U,
        "Decodes every directory of a TIFF byte string.");

    m.def(
        "decode_file",
        [](const std::string& path, bool parse_geokeys,
           uint32_t max_directories, uint64_t max_file_bytes) {
            MappedFile file;
            const MappedFileStatus st = file.open(path.c_str(),
                                                  max_file_bytes);
            if (st != MappedFileStatus::Ok) {
                const std::string msg(mapped_file_status_name(st));
                throw nb::value_error(msg.c_str());
            }
            return decode_to_py(file.bytes(),
                                make_options(parse_geokeys, max_directories));
        },
        "path"_a, "parse_geokeys"_a = true, "max_directories"_a = 1024U,
        "max_file_bytes"_a = 0ULL, "Maps a file and decodes it.");

    m.def(
        "tag_name",
        [](uint16_t tag) { return sv_to_py(tiff_tag_name(tag)); }, "tag"_a);
    m.def(
        "geokey_name",
        [](uint16_t key_id) { return sv_to_py(geokey_name(key_id)); },
        "key_id"_a);
}
