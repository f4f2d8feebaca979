#include "tiffdir/gdal_metadata.h"

#include <gtest/gtest.h>

#include <string>
#include <string_view>
#include <vector>

namespace tiffdir {

TEST(GdalMetadataTest, ParsesDatasetAndBandItems)
{
    if (!gdal_metadata_available()) {
        GTEST_SKIP() << "built without Expat; GDALMetadata parsing is unavailable.";
    }
    const std::string xml
        = "<GDALMetadata>\n"
          "  <Item name=\"AREA_OR_POINT\">Area</Item>\n"
          "  <Item name=\"SCALE\" sample=\"0\" role=\"scale\">0.5</Item>\n"
          "  <Item name=\"COMPRESSION\" domain=\"IMAGE_STRUCTURE\">LZW</Item>\n"
          "</GDALMetadata>\n";

    std::vector<GdalMetadataItem> items;
    ASSERT_EQ(parse_gdal_metadata(xml, GdalMetadataLimits {}, &items),
              GdalMetadataStatus::Ok);
    ASSERT_EQ(items.size(), 3U);

    EXPECT_EQ(items[0].name, "AREA_OR_POINT");
    EXPECT_EQ(items[0].sample, -1);
    EXPECT_EQ(items[0].value, "Area");

    EXPECT_EQ(items[1].name, "SCALE");
    EXPECT_EQ(items[1].sample, 0);
    EXPECT_EQ(items[1].role, "scale");
    EXPECT_EQ(items[1].value, "0.5");

    EXPECT_EQ(items[2].domain, "IMAGE_STRUCTURE");
    EXPECT_EQ(items[2].value, "LZW");
}


TEST(GdalMetadataTest, RejectsForeignRootAndBadAttributes)
{
    if (!gdal_metadata_available()) {
        GTEST_SKIP() << "built without Expat; GDALMetadata parsing is unavailable.";
    }
    std::vector<GdalMetadataItem> items(1);

    EXPECT_EQ(parse_gdal_metadata("<Other><Item name=\"a\">1</Item></Other>",
                                  GdalMetadataLimits {}, &items),
              GdalMetadataStatus::Malformed);
    EXPECT_EQ(parse_gdal_metadata(
                  "<GDALMetadata><Item sample=\"x\" name=\"a\">1</Item>"
                  "</GDALMetadata>",
                  GdalMetadataLimits {}, &items),
              GdalMetadataStatus::Malformed);
    EXPECT_EQ(parse_gdal_metadata("<GDALMetadata><Item>1</Item></GDALMetadata>",
                                  GdalMetadataLimits {}, &items),
              GdalMetadataStatus::Malformed);
    EXPECT_EQ(parse_gdal_metadata("<GDALMetadata><Item name=\"a\">",
                                  GdalMetadataLimits {}, &items),
              GdalMetadataStatus::Malformed);

    // Failed parses leave the output untouched.
    EXPECT_EQ(items.size(), 1U);
}


TEST(GdalMetadataTest, EnforcesLimits)
{
    if (!gdal_metadata_available()) {
        GTEST_SKIP() << "built without Expat; GDALMetadata parsing is unavailable.";
    }
    const std::string_view xml
        = "<GDALMetadata><Item name=\"a\">1</Item><Item name=\"b\">2</Item>"
          "</GDALMetadata>";

    GdalMetadataLimits limits;
    limits.max_items = 1;
    std::vector<GdalMetadataItem> items;
    EXPECT_EQ(parse_gdal_metadata(xml, limits, &items),
              GdalMetadataStatus::LimitExceeded);

    limits                 = GdalMetadataLimits {};
    limits.max_value_bytes = 0;
    EXPECT_EQ(parse_gdal_metadata(xml, limits, &items),
              GdalMetadataStatus::Ok);

    limits.max_input_bytes = 8;
    EXPECT_EQ(parse_gdal_metadata(xml, limits, &items),
              GdalMetadataStatus::LimitExceeded);
}


TEST(GdalMetadataTest, NonXmlIsUnsupported)
{
    std::vector<GdalMetadataItem> items;
    EXPECT_EQ(parse_gdal_metadata("nodata", GdalMetadataLimits {}, &items),
              GdalMetadataStatus::Unsupported);
    EXPECT_EQ(gdal_metadata_status_name(GdalMetadataStatus::LimitExceeded),
              "limit_exceeded");
}

}  // namespace tiffdir
