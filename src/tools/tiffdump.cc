#include "tiffdir/chunk_layout.h"
#include "tiffdir/gdal_metadata.h"
#include "tiffdir/geotiff_keys.h"
#include "tiffdir/mapped_file.h"
#include "tiffdir/tiff_decode.h"
#include "tiffdir/tiff_names.h"

#include <cinttypes>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <string_view>
#include <vector>

namespace tiffdir {
namespace {

    static bool parse_u64_arg(const char* s, uint64_t* out)
    {
        if (!s || !*s) {
            return false;
        }
        char* end            = nullptr;
        unsigned long long v = std::strtoull(s, &end, 10);
        if (!end || *end != '\0') {
            return false;
        }
        *out = static_cast<uint64_t>(v);
        return true;
    }


    static bool parse_u32_arg(const char* s, uint32_t* out)
    {
        uint64_t v = 0;
        if (!parse_u64_arg(s, &v) || v > UINT32_MAX) {
            return false;
        }
        *out = static_cast<uint32_t>(v);
        return true;
    }


    static void append_element(const ByteArena& arena, const TiffValue& value,
                               uint32_t index, std::string* out)
    {
        char buf[64];
        std::snprintf(buf, sizeof(buf), "?");
        if (value.type == TiffType::Rational) {
            URational r;
            if (value_urational(arena, value, index, &r)) {
                std::snprintf(buf, sizeof(buf), "%" PRIu32 "/%" PRIu32,
                              r.numer, r.denom);
            }
        } else if (value.type == TiffType::SRational) {
            SRational r;
            if (value_srational(arena, value, index, &r)) {
                std::snprintf(buf, sizeof(buf), "%" PRId32 "/%" PRId32,
                              r.numer, r.denom);
            }
        } else if (is_integer_type(value.type)) {
            int64_t v = 0;
            if (value_i64(arena, value, index, &v)) {
                std::snprintf(buf, sizeof(buf), "%" PRId64, v);
            }
        } else {
            double v = 0.0;
            if (value_f64(arena, value, index, &v)) {
                std::snprintf(buf, sizeof(buf), "%.6g", v);
            }
        }
        out->append(buf);
    }


    static std::string format_value(const ByteArena& arena,
                                    const TiffValue& value,
                                    uint32_t max_elements)
    {
        std::string s;
        if (value.type == TiffType::Ascii) {
            std::string_view text = value_text(arena, value);
            const size_t nul      = text.find('\0');
            if (nul != std::string_view::npos) {
                text = text.substr(0, nul);
            }
            if (text.size() > 64U) {
                text = text.substr(0, 64);
            }
            s.push_back('"');
            s.append(text.data(), text.size());
            s.push_back('"');
            return s;
        }
        s.push_back('[');
        const uint32_t n = value.count < max_elements ? value.count
                                                      : max_elements;
        for (uint32_t i = 0; i < n; ++i) {
            if (i != 0U) {
                s.append(", ");
            }
            append_element(arena, value, i, &s);
        }
        if (n < value.count) {
            s.append(", ...");
        }
        s.push_back(']');
        return s;
    }


    static void print_error(const char* path, const TiffDecodeResult& r)
    {
        const std::string_view status = decode_status_name(r.status);
        const std::string_view stage  = decode_stage_name(r.stage);
        std::fprintf(stderr,
                     "tiffdump: `%s`: %.*s at %.*s (tag=%u offset=%" PRIu64
                     ")\n",
                     path, static_cast<int>(status.size()), status.data(),
                     static_cast<int>(stage.size()), stage.data(),
                     static_cast<unsigned>(r.tag), r.offset);
    }


    static void print_gdal_metadata(const std::string& xml)
    {
        std::vector<GdalMetadataItem> items;
        const GdalMetadataStatus st = parse_gdal_metadata(
            xml, GdalMetadataLimits {}, &items);
        if (st != GdalMetadataStatus::Ok) {
            std::printf("  gdal_metadata: %zu bytes (%s)\n", xml.size(),
                        std::string(gdal_metadata_status_name(st)).c_str());
            return;
        }
        for (const GdalMetadataItem& item : items) {
            std::printf("  gdal_metadata: %s", item.name.c_str());
            if (item.sample >= 0) {
                std::printf(" [band %d]", static_cast<int>(item.sample));
            }
            if (!item.domain.empty()) {
                std::printf(" (%s)", item.domain.c_str());
            }
            std::printf(" = %s\n", item.value.c_str());
        }
    }


    static void print_image(std::span<const std::byte> bytes,
                            const TiffImage& image, uint32_t index,
                            uint32_t max_elements)
    {
        const Directory& dir = image.directory;
        std::printf("ifd[%u] offset=%" PRIu64 " entries=%zu next=%u\n", index,
                    dir.offset(), dir.fields().size(), dir.next_offset());
        for (const TiffField& f : dir.fields()) {
            const std::string_view name = tiff_tag_name(f.tag);
            const std::string_view type = tiff_type_name(
                static_cast<uint16_t>(f.value.type));
            const std::string value = format_value(dir.arena(), f.value,
                                                   max_elements);
            std::printf("  %5u %-26.*s %-9.*s count=%-6u %s\n",
                        static_cast<unsigned>(f.tag),
                        static_cast<int>(name.size()), name.data(),
                        static_cast<int>(type.size()), type.data(),
                        f.value.count, value.c_str());
        }
        for (const uint16_t tag : dir.duplicate_tags()) {
            std::printf("  duplicate tag %u ignored\n",
                        static_cast<unsigned>(tag));
        }

        if (!image.mode_result.ok()) {
            const std::string_view status = decode_status_name(
                image.mode_result.status);
            std::printf("  mode: %.*s (tag=%u)\n",
                        static_cast<int>(status.size()), status.data(),
                        static_cast<unsigned>(image.mode_result.tag));
        } else {
            const ImageInfo& info       = image.info;
            const std::string_view mode = image_mode_name(info.mode);
            const std::string_view comp = compression_name(info.compression);
            std::printf("  mode: %.*s %ux%u spp=%u compression=%.*s%s\n",
                        static_cast<int>(mode.size()), mode.data(), info.width,
                        info.length,
                        static_cast<unsigned>(info.samples_per_pixel),
                        static_cast<int>(comp.size()), comp.data(),
                        info.predictor_flag ? " predictor=horizontal" : "");

            ChunkLayout layout;
            const TiffDecodeResult lr = resolve_chunk_layout(dir, info,
                                                             bytes.size(),
                                                             &layout);
            if (lr.ok()) {
                std::printf("  %s: %ux%u grid=%ux%u\n",
                            layout.tiled ? "tiles" : "strips",
                            layout.chunk_width, layout.chunk_length,
                            layout.chunks_across, layout.chunks_down);
            } else {
                const std::string_view status = decode_status_name(lr.status);
                std::printf("  layout: %.*s (tag=%u)\n",
                            static_cast<int>(status.size()), status.data(),
                            static_cast<unsigned>(lr.tag));
            }
        }

        if (image.has_geokeys) {
            const GeoKeyDirectory& geo = image.geokeys;
            std::printf("  geokeys: version=%u revision=%u.%u count=%zu\n",
                        static_cast<unsigned>(geo.version),
                        static_cast<unsigned>(geo.key_revision),
                        static_cast<unsigned>(geo.minor_revision),
                        geo.keys.size());
            for (const GeoKeyValue& k : geo.keys) {
                const std::string_view name = geokey_name(k.key_id);
                std::printf("    %5u %-32.*s ", static_cast<unsigned>(k.key_id),
                            static_cast<int>(name.size()), name.data());
                switch (k.kind) {
                case GeoKeyKind::Short: {
                    const std::string_view ct
                        = k.key_id == geokeys::kProjCoordTrans
                              ? coord_transform_name(k.short_value)
                              : std::string_view {};
                    std::printf("%u %.*s\n",
                                static_cast<unsigned>(k.short_value),
                                static_cast<int>(ct.size()), ct.data());
                    break;
                }
                case GeoKeyKind::Shorts:
                    std::printf("shorts[%zu]\n", k.shorts.size());
                    break;
                case GeoKeyKind::Doubles:
                    std::printf("[");
                    for (size_t i = 0; i < k.doubles.size(); ++i) {
                        std::printf("%s%.10g", i == 0 ? "" : ", ",
                                    k.doubles[i]);
                    }
                    std::printf("]\n");
                    break;
                case GeoKeyKind::Ascii:
                    std::printf("\"%s\"\n", k.ascii.c_str());
                    break;
                }
            }
        }
        if (image.has_georeference) {
            const GeoReference& ref = image.georeference;
            if (ref.has_pixel_scale) {
                std::printf("  pixel_scale: %.10g %.10g %.10g\n",
                            ref.pixel_scale[0], ref.pixel_scale[1],
                            ref.pixel_scale[2]);
            }
            for (const Tiepoint& t : ref.tiepoints) {
                std::printf("  tiepoint: (%g, %g, %g) -> (%.10g, %.10g, %g)\n",
                            t.i, t.j, t.k, t.x, t.y, t.z);
            }
            if (ref.has_transformation) {
                std::printf("  transformation:");
                for (const double v : ref.transformation) {
                    std::printf(" %.10g", v);
                }
                std::printf("\n");
            }
            if (!ref.gdal_nodata.empty()) {
                std::printf("  gdal_nodata: %s\n", ref.gdal_nodata.c_str());
            }
            if (!ref.gdal_metadata.empty()) {
                print_gdal_metadata(ref.gdal_metadata);
            }
        }
    }


    static void usage(const char* argv0)
    {
        std::printf("usage: %s [options] <file> [file...]\n", argv0);
        std::printf("options:\n");
        std::printf("  --no-geokeys          do not parse GeoKey directories\n");
        std::printf(
            "  --max-dirs N          max directories in the chain (default: 1024; 0=unlimited)\n");
        std::printf(
            "  --max-value-bytes N   max bytes of one tag value (default: 67108864; 0=unlimited)\n");
        std::printf(
            "  --max-elements N      max array elements to print (default: 8)\n");
        std::printf(
            "  --max-file-bytes N    refuse to map files larger than N bytes (default: 536870912; 0=unlimited)\n");
    }

}  // namespace
}  // namespace tiffdir

int
main(int argc, char** argv)
{
    using namespace tiffdir;

    TiffDecodeOptions options;
    uint32_t max_elements   = 8;
    uint64_t max_file_bytes = 512ULL * 1024ULL * 1024ULL;

    int first_path = 1;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (std::strcmp(arg, "--help") == 0) {
            usage(argv[0]);
            return 0;
        }
        if (std::strcmp(arg, "--no-geokeys") == 0) {
            options.parse_geokeys = false;
            first_path += 1;
            continue;
        }
        if (std::strcmp(arg, "--max-dirs") == 0 && i + 1 < argc) {
            if (!parse_u32_arg(argv[i + 1], &options.limits.max_directories)) {
                std::fprintf(stderr, "invalid --max-dirs value\n");
                return 2;
            }
            i += 1;
            first_path += 2;
            continue;
        }
        if (std::strcmp(arg, "--max-value-bytes") == 0 && i + 1 < argc) {
            if (!parse_u64_arg(argv[i + 1], &options.limits.max_value_bytes)) {
                std::fprintf(stderr, "invalid --max-value-bytes value\n");
                return 2;
            }
            i += 1;
            first_path += 2;
            continue;
        }
        if (std::strcmp(arg, "--max-elements") == 0 && i + 1 < argc) {
            if (!parse_u32_arg(argv[i + 1], &max_elements)) {
                std::fprintf(stderr, "invalid --max-elements value\n");
                return 2;
            }
            i += 1;
            first_path += 2;
            continue;
        }
        if (std::strcmp(arg, "--max-file-bytes") == 0 && i + 1 < argc) {
            if (!parse_u64_arg(argv[i + 1], &max_file_bytes)) {
                std::fprintf(stderr, "invalid --max-file-bytes value\n");
                return 2;
            }
            i += 1;
            first_path += 2;
            continue;
        }
        break;
    }

    if (argc <= first_path) {
        usage(argv[0]);
        return 2;
    }

    int exit_code = 0;
    for (int argi = first_path; argi < argc; ++argi) {
        const char* path = argv[argi];

        MappedFile file;
        const MappedFileStatus st = file.open(path, max_file_bytes);
        if (st != MappedFileStatus::Ok) {
            const std::string_view name = mapped_file_status_name(st);
            std::fprintf(stderr, "tiffdump: cannot map `%s`: %.*s\n", path,
                         static_cast<int>(name.size()), name.data());
            exit_code = 1;
            continue;
        }

        TiffFile tiff;
        const TiffDecodeResult r = decode_tiff(file.bytes(), options, &tiff);
        if (!r.ok()) {
            print_error(path, r);
            exit_code = 1;
            continue;
        }

        std::printf("== %s\n", path);
        std::printf("byte_order=%s images=%zu%s\n",
                    tiff.byte_order() == ByteOrder::Little ? "II" : "MM",
                    tiff.images.size(),
                    any(tiff.warnings, DecodeWarnings::DuplicateTag)
                        ? " warnings=duplicate_tag"
                        : "");
        for (size_t i = 0; i < tiff.images.size(); ++i) {
            print_image(file.bytes(), tiff.images[i], static_cast<uint32_t>(i),
                        max_elements);
        }
    }
    return exit_code;
}
