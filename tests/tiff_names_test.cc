#include "tiffdir/tiff_names.h"

#include "tiffdir/decode_status.h"
#include "tiffdir/geotiff_keys.h"
#include "tiffdir/tiff_tags.h"

#include <gtest/gtest.h>

namespace tiffdir {
namespace {

    TEST(TiffNames, Tags)
    {
        EXPECT_EQ(tiff_tag_name(tags::kImageWidth), "ImageWidth");
        EXPECT_EQ(tiff_tag_name(tags::kStripByteCounts), "StripByteCounts");
        EXPECT_EQ(tiff_tag_name(tags::kGeoKeyDirectory), "GeoKeyDirectoryTag");
        EXPECT_EQ(tiff_tag_name(tags::kGdalNoData), "GDAL_NODATA");
        EXPECT_TRUE(tiff_tag_name(0).empty());
        EXPECT_TRUE(tiff_tag_name(65535).empty());
    }


    TEST(TiffNames, TypesAndEnumerations)
    {
        EXPECT_EQ(tiff_type_name(3), "SHORT");
        EXPECT_EQ(tiff_type_name(12), "DOUBLE");
        EXPECT_TRUE(tiff_type_name(0).empty());
        EXPECT_TRUE(tiff_type_name(13).empty());

        EXPECT_EQ(compression_name(compression::kLzw), "lzw");
        EXPECT_EQ(compression_name(compression::kPackBits), "packbits");
        EXPECT_TRUE(compression_name(9).empty());

        EXPECT_EQ(photometric_name(photometric::kPaletted), "paletted");
        EXPECT_TRUE(photometric_name(7).empty());

        EXPECT_EQ(image_mode_name(ImageMode::Nrgba), "nrgba");
        EXPECT_EQ(image_mode_name(ImageMode::GrayInverted), "gray_inverted");
    }


    TEST(TiffNames, GeoKeysAndTransforms)
    {
        EXPECT_EQ(geokey_name(geokeys::kGTModelType), "GTModelTypeGeoKey");
        EXPECT_EQ(geokey_name(geokeys::kProjStraightVertPoleLong),
                  "ProjStraightVertPoleLongGeoKey");
        EXPECT_EQ(geokey_name(geokeys::kVerticalUnits), "VerticalUnitsGeoKey");
        EXPECT_TRUE(geokey_name(1027).empty());

        EXPECT_EQ(coord_transform_name(coord_trans::kTransverseMercator),
                  "CT_TransverseMercator");
        EXPECT_EQ(coord_transform_name(coord_trans::kTransvMercatorSouthOriented),
                  "CT_TransvMercator_SouthOriented");
        EXPECT_TRUE(coord_transform_name(0).empty());
        EXPECT_TRUE(coord_transform_name(28).empty());
    }


    TEST(TiffNames, StatusNames)
    {
        EXPECT_EQ(decode_status_name(TiffDecodeStatus::MissingReferencedTag),
                  "missing_referenced_tag");
        EXPECT_EQ(decode_status_name(TiffDecodeStatus::InvalidFormat),
                  "invalid_format");
        EXPECT_EQ(decode_stage_name(TiffDecodeStage::GeoKeys), "geokeys");
    }


    TEST(TiffTypes, ElementWidths)
    {
        const uint32_t widths[] = { 0, 1, 1, 2, 4, 8, 1, 0, 2, 4, 8, 4, 8 };
        for (uint16_t t = 1; t <= 12; ++t) {
            EXPECT_TRUE(is_valid_tiff_type(t));
            EXPECT_EQ(tiff_type_width(t), widths[t]);
        }
        EXPECT_FALSE(is_valid_tiff_type(0));
        EXPECT_FALSE(is_valid_tiff_type(13));
        // UNDEFINED has width 0 in the table but is read as 1-byte units.
        EXPECT_EQ(tiff_type_unit(7), 1U);

        EXPECT_TRUE(is_integer_type(TiffType::Undefined));
        EXPECT_TRUE(is_integer_type(TiffType::SLong));
        EXPECT_FALSE(is_integer_type(TiffType::Ascii));
        EXPECT_FALSE(is_integer_type(TiffType::Rational));
        EXPECT_TRUE(is_rational_type(TiffType::SRational));
        EXPECT_FALSE(is_rational_type(TiffType::Double));
    }

}  // namespace
}  // namespace tiffdir
