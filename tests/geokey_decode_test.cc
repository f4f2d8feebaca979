#include "tiffdir/geokey_decode.h"

#include "tiffdir/directory_decode.h"
#include "tiffdir/geotiff_keys.h"
#include "tiffdir/tiff_tags.h"
#include "tiff_test_util.h"

#include <gtest/gtest.h>

#include <cstdint>
#include <string_view>
#include <vector>

namespace tiffdir {
namespace {

    using test::TiffBuilder;

    static Directory decode_first(const TiffBuilder& b)
    {
        const std::vector<std::byte> bytes = b.build();
        Directory dir;
        const TiffDecodeResult r = decode_directory(bytes, b.order(), 8,
                                                    TiffDecodeLimits {}, &dir);
        EXPECT_TRUE(r.ok());
        return dir;
    }


    TEST(GeoKeyDecode, InlineDoubleAndAsciiKeys)
    {
        for (const ByteOrder order : { ByteOrder::Little, ByteOrder::Big }) {
            TiffBuilder b(order);
            b.add_short(tags::kImageWidth, 1);
            b.add_shorts(tags::kGeoKeyDirectory,
                         { 1, 1, 0, 4,                                //
                           geokeys::kGTModelType, 0, 1,
                           model_type::kProjected,                    //
                           geokeys::kGTCitation, tags::kGeoAsciiParams,
                           13, 0,                                     //
                           geokeys::kProjCoordTrans, 0, 1,
                           coord_trans::kTransverseMercator,          //
                           geokeys::kProjStdParallel1,
                           tags::kGeoDoubleParams, 2, 1 });
            b.add_doubles(tags::kGeoDoubleParams, { 1.0, 33.5, -12.25 });
            b.add_ascii(tags::kGeoAsciiParams, "TestCitation|");

            const Directory dir = decode_first(b);
            GeoKeyDirectory geo;
            const TiffDecodeResult r = parse_geokeys(dir, TiffDecodeLimits {},
                                                     &geo);
            ASSERT_TRUE(r.ok());
            EXPECT_EQ(geo.version, 1U);
            EXPECT_EQ(geo.key_revision, 1U);
            ASSERT_EQ(geo.keys.size(), 4U);

            // Directory order is kept.
            EXPECT_EQ(geo.keys[0].key_id, geokeys::kGTModelType);
            EXPECT_EQ(geo.keys[3].key_id, geokeys::kProjStdParallel1);

            const GeoKeyValue* model = geo.find(geokeys::kGTModelType);
            ASSERT_NE(model, nullptr);
            EXPECT_EQ(model->kind, GeoKeyKind::Short);
            EXPECT_EQ(model->short_value, model_type::kProjected);

            const GeoKeyValue* citation = geo.find(geokeys::kGTCitation);
            ASSERT_NE(citation, nullptr);
            EXPECT_EQ(citation->kind, GeoKeyKind::Ascii);
            EXPECT_EQ(citation->ascii, "TestCitation");

            const GeoKeyValue* parallels = geo.find(
                geokeys::kProjStdParallel1);
            ASSERT_NE(parallels, nullptr);
            EXPECT_EQ(parallels->kind, GeoKeyKind::Doubles);
            ASSERT_EQ(parallels->doubles.size(), 2U);
            EXPECT_DOUBLE_EQ(parallels->doubles[0], 33.5);
            EXPECT_DOUBLE_EQ(parallels->doubles[1], -12.25);

            EXPECT_EQ(geo.find(geokeys::kVerticalUnits), nullptr);
        }
    }


    TEST(GeoKeyDecode, SliceOfSharedAsciiParams)
    {
        TiffBuilder b;
        b.add_shorts(tags::kGeoKeyDirectory,
                     { 1, 1, 2, 2,                                     //
                       geokeys::kGTCitation, tags::kGeoAsciiParams, 6, 0,
                       geokeys::kGeogCitation, tags::kGeoAsciiParams, 6, 6 });
        b.add_ascii(tags::kGeoAsciiParams, "UTM 1|WGS84|");

        GeoKeyDirectory geo;
        ASSERT_TRUE(parse_geokeys(decode_first(b), TiffDecodeLimits {}, &geo)
                        .ok());
        ASSERT_EQ(geo.keys.size(), 2U);
        EXPECT_EQ(geo.keys[0].ascii, "UTM 1");
        EXPECT_EQ(geo.keys[1].ascii, "WGS84");
    }


    TEST(GeoKeyDecode, ShortSliceOfAnotherTag)
    {
        TiffBuilder b;
        b.add_shorts(tags::kGeoKeyDirectory,
                     { 1, 1, 0, 1,  //
                       geokeys::kGeogLinearUnits, tags::kGeoKeyDirectory, 2,
                       0 });

        GeoKeyDirectory geo;
        ASSERT_TRUE(parse_geokeys(decode_first(b), TiffDecodeLimits {}, &geo)
                        .ok());
        ASSERT_EQ(geo.keys.size(), 1U);
        EXPECT_EQ(geo.keys[0].kind, GeoKeyKind::Shorts);
        EXPECT_EQ(geo.keys[0].shorts, (std::vector<uint16_t> { 1, 1 }));
    }


    TEST(GeoKeyDecode, MissingReferencedTag)
    {
        TiffBuilder b;
        b.add_shorts(tags::kGeoKeyDirectory,
                     { 1, 1, 0, 1,  //
                       geokeys::kProjStdParallel1, tags::kGeoDoubleParams, 1,
                       0 });

        GeoKeyDirectory geo;
        geo.version = 7;
        const TiffDecodeResult r = parse_geokeys(decode_first(b),
                                                 TiffDecodeLimits {}, &geo);
        EXPECT_EQ(r.status, TiffDecodeStatus::MissingReferencedTag);
        EXPECT_EQ(r.stage, TiffDecodeStage::GeoKeys);
        EXPECT_EQ(r.tag, tags::kGeoDoubleParams);
        // Nothing partial is exposed.
        EXPECT_EQ(geo.version, 7U);
        EXPECT_TRUE(geo.keys.empty());
    }


    TEST(GeoKeyDecode, SlicePastReferencedTag)
    {
        TiffBuilder b;
        b.add_shorts(tags::kGeoKeyDirectory,
                     { 1, 1, 0, 1,  //
                       geokeys::kProjStdParallel1, tags::kGeoDoubleParams, 2,
                       1 });
        b.add_doubles(tags::kGeoDoubleParams, { 1.0, 2.0 });

        GeoKeyDirectory geo;
        const TiffDecodeResult r = parse_geokeys(decode_first(b),
                                                 TiffDecodeLimits {}, &geo);
        EXPECT_EQ(r.status, TiffDecodeStatus::Truncated);
        EXPECT_EQ(r.tag, tags::kGeoDoubleParams);
    }


    TEST(GeoKeyDecode, MalformedHeaders)
    {
        GeoKeyDirectory geo;

        TiffBuilder no_dir;
        no_dir.add_short(tags::kImageWidth, 1);
        EXPECT_EQ(parse_geokeys(decode_first(no_dir), TiffDecodeLimits {},
                                &geo)
                      .status,
                  TiffDecodeStatus::MissingTag);

        TiffBuilder short_header;
        short_header.add_shorts(tags::kGeoKeyDirectory, { 1, 1, 0 });
        EXPECT_EQ(parse_geokeys(decode_first(short_header),
                                TiffDecodeLimits {}, &geo)
                      .status,
                  TiffDecodeStatus::Malformed);

        TiffBuilder bad_version;
        bad_version.add_shorts(tags::kGeoKeyDirectory, { 2, 1, 0, 0 });
        EXPECT_EQ(parse_geokeys(decode_first(bad_version), TiffDecodeLimits {},
                                &geo)
                      .status,
                  TiffDecodeStatus::Malformed);

        // Declares two keys but carries one.
        TiffBuilder short_table;
        short_table.add_shorts(tags::kGeoKeyDirectory,
                               { 1, 1, 0, 2, 1024, 0, 1, 1 });
        EXPECT_EQ(parse_geokeys(decode_first(short_table), TiffDecodeLimits {},
                                &geo)
                      .status,
                  TiffDecodeStatus::Malformed);

        TiffBuilder wrong_type;
        wrong_type.add_longs(tags::kGeoKeyDirectory, { 1, 1, 0, 0 });
        EXPECT_EQ(parse_geokeys(decode_first(wrong_type), TiffDecodeLimits {},
                                &geo)
                      .status,
                  TiffDecodeStatus::Malformed);
    }


    TEST(GeoKeyDecode, KeyLimit)
    {
        TiffBuilder b;
        b.add_shorts(tags::kGeoKeyDirectory,
                     { 1, 1, 0, 2, 1024, 0, 1, 1, 1025, 0, 1, 1 });
        TiffDecodeLimits limits;
        limits.max_geokeys = 1;
        GeoKeyDirectory geo;
        EXPECT_EQ(parse_geokeys(decode_first(b), limits, &geo).status,
                  TiffDecodeStatus::LimitExceeded);
    }

}  // namespace
}  // namespace tiffdir
