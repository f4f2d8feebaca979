#include "tiffdir/georeference.h"

#include "tiffdir/directory_decode.h"
#include "tiffdir/tiff_tags.h"
#include "tiff_test_util.h"

#include <gtest/gtest.h>

#include <vector>

namespace tiffdir {
namespace {

    using test::TiffBuilder;

    static Directory decode_first(const TiffBuilder& b)
    {
        const std::vector<std::byte> bytes = b.build();
        Directory dir;
        EXPECT_TRUE(decode_directory(bytes, b.order(), 8, TiffDecodeLimits {},
                                     &dir)
                        .ok());
        return dir;
    }


    TEST(GeoReference, ScaleTiepointsAndGdalTags)
    {
        TiffBuilder b(ByteOrder::Big);
        b.add_doubles(tags::kModelPixelScale, { 30.0, 30.0, 0.0 });
        b.add_doubles(tags::kModelTiepoint,
                      { 0, 0, 0, 440720.0, 3751320.0, 0,  //
                        10, 20, 0, 441020.0, 3750720.0, 0 });
        b.add_ascii(tags::kGdalNoData, "-9999");
        b.add_ascii(tags::kGdalMetadata, "<GDALMetadata></GDALMetadata>");

        GeoReference geo;
        ASSERT_TRUE(read_georeference(decode_first(b), &geo).ok());
        EXPECT_FALSE(geo.empty());
        ASSERT_TRUE(geo.has_pixel_scale);
        EXPECT_DOUBLE_EQ(geo.pixel_scale[0], 30.0);
        ASSERT_EQ(geo.tiepoints.size(), 2U);
        EXPECT_DOUBLE_EQ(geo.tiepoints[0].x, 440720.0);
        EXPECT_DOUBLE_EQ(geo.tiepoints[1].i, 10.0);
        EXPECT_DOUBLE_EQ(geo.tiepoints[1].j, 20.0);
        EXPECT_DOUBLE_EQ(geo.tiepoints[1].y, 3750720.0);
        EXPECT_FALSE(geo.has_transformation);
        EXPECT_EQ(geo.gdal_nodata, "-9999");
        EXPECT_EQ(geo.gdal_metadata, "<GDALMetadata></GDALMetadata>");
    }


    TEST(GeoReference, Transformation)
    {
        std::vector<double> m(16, 0.0);
        m[0]  = 2.0;
        m[3]  = 100.0;
        m[5]  = -2.0;
        m[15] = 1.0;
        TiffBuilder b;
        b.add_doubles(tags::kModelTransformation, m);

        GeoReference geo;
        ASSERT_TRUE(read_georeference(decode_first(b), &geo).ok());
        ASSERT_TRUE(geo.has_transformation);
        EXPECT_DOUBLE_EQ(geo.transformation[3], 100.0);
        EXPECT_DOUBLE_EQ(geo.transformation[5], -2.0);
        EXPECT_TRUE(geo.tiepoints.empty());
    }


    TEST(GeoReference, WrongCountsAreMalformed)
    {
        GeoReference geo;

        TiffBuilder scale;
        scale.add_doubles(tags::kModelPixelScale, { 1.0, 2.0 });
        TiffDecodeResult r = read_georeference(decode_first(scale), &geo);
        EXPECT_EQ(r.status, TiffDecodeStatus::Malformed);
        EXPECT_EQ(r.stage, TiffDecodeStage::GeoReference);
        EXPECT_EQ(r.tag, tags::kModelPixelScale);

        TiffBuilder tie;
        tie.add_doubles(tags::kModelTiepoint, { 0, 0, 0, 1, 2 });
        r = read_georeference(decode_first(tie), &geo);
        EXPECT_EQ(r.status, TiffDecodeStatus::Malformed);
        EXPECT_EQ(r.tag, tags::kModelTiepoint);

        TiffBuilder xform;
        xform.add_doubles(tags::kModelTransformation, { 1, 0, 0, 1 });
        r = read_georeference(decode_first(xform), &geo);
        EXPECT_EQ(r.tag, tags::kModelTransformation);
    }


    TEST(GeoReference, EmptyWithoutTags)
    {
        TiffBuilder b;
        b.add_short(tags::kImageWidth, 1);
        GeoReference geo;
        ASSERT_TRUE(read_georeference(decode_first(b), &geo).ok());
        EXPECT_TRUE(geo.empty());
    }

}  // namespace
}  // namespace tiffdir
