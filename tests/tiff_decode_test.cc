#include "tiffdir/tiff_decode.h"

#include "tiffdir/geotiff_keys.h"
#include "tiffdir/mapped_file.h"
#include "tiffdir/tiff_tags.h"
#include "tiff_test_util.h"

#include <gtest/gtest.h>

#include <vector>

namespace tiffdir {
namespace {

    using test::TiffBuilder;

    static void add_gray_image(TiffBuilder* b, uint16_t width)
    {
        b->add_short(tags::kImageWidth, width);
        b->add_short(tags::kImageLength, 2);
        b->add_short(tags::kBitsPerSample, 8);
        b->add_short(tags::kPhotometricInterpretation,
                     photometric::kBlackIsZero);
        b->add_long(tags::kStripOffsets, 0);
        b->add_long(tags::kStripByteCounts, 2U * width);
    }


    TEST(TiffDecode, MultiPageFile)
    {
        TiffBuilder b(ByteOrder::Big);
        add_gray_image(&b, 4);
        b.new_directory();
        add_gray_image(&b, 2);
        b.add_short(tags::kImageWidth, 99);  // duplicate, ignored
        const std::vector<std::byte> bytes = b.build();

        TiffFile file;
        const TiffDecodeResult r = decode_tiff(bytes, TiffDecodeOptions {},
                                               &file);
        ASSERT_TRUE(r.ok());
        EXPECT_EQ(file.byte_order(), ByteOrder::Big);
        ASSERT_EQ(file.images.size(), 2U);
        EXPECT_TRUE(any(file.warnings, DecodeWarnings::DuplicateTag));
        EXPECT_TRUE(any(r.warnings, DecodeWarnings::DuplicateTag));

        EXPECT_TRUE(file.images[0].mode_result.ok());
        EXPECT_EQ(file.images[0].info.mode, ImageMode::Gray);
        EXPECT_EQ(file.images[0].info.width, 4U);
        EXPECT_EQ(file.images[0].directory.next_offset(),
                  b.directory_offset(1));
        EXPECT_EQ(file.images[1].info.width, 2U);
        EXPECT_EQ(file.images[1].directory.next_offset(), 0U);
        EXPECT_FALSE(file.images[0].has_geokeys);
    }


    TEST(TiffDecode, UnsupportedImageIsRecordedAndSkippable)
    {
        TiffBuilder b;
        b.add_short(tags::kImageWidth, 4);
        b.add_short(tags::kImageLength, 4);
        b.add_shorts(tags::kBitsPerSample, { 8, 8, 8, 8 });
        b.add_short(tags::kPhotometricInterpretation, photometric::kCmyk);
        b.add_short(tags::kSamplesPerPixel, 4);
        b.new_directory();
        add_gray_image(&b, 3);
        const std::vector<std::byte> bytes = b.build();

        TiffFile file;
        ASSERT_TRUE(decode_tiff(bytes, TiffDecodeOptions {}, &file).ok());
        ASSERT_EQ(file.images.size(), 2U);
        EXPECT_EQ(file.images[0].mode_result.status,
                  TiffDecodeStatus::UnsupportedConfiguration);
        EXPECT_TRUE(file.images[0].directory.has(tags::kSamplesPerPixel));
        EXPECT_TRUE(file.images[1].mode_result.ok());

        TiffDecodeOptions strict;
        strict.stop_on_unsupported = true;
        TiffFile untouched;
        const TiffDecodeResult r = decode_tiff(bytes, strict, &untouched);
        EXPECT_EQ(r.status, TiffDecodeStatus::UnsupportedConfiguration);
        EXPECT_TRUE(untouched.images.empty());
    }


    TEST(TiffDecode, NonRecoverableModeFailureFailsDecode)
    {
        TiffBuilder b;
        b.add_short(tags::kImageLength, 4);
        const std::vector<std::byte> bytes = b.build();

        TiffFile file;
        EXPECT_EQ(decode_tiff(bytes, TiffDecodeOptions {}, &file).status,
                  TiffDecodeStatus::MissingTag);

        TiffDecodeOptions raw_only;
        raw_only.resolve_modes = false;
        ASSERT_TRUE(decode_tiff(bytes, raw_only, &file).ok());
        EXPECT_EQ(file.images.size(), 1U);
    }


    TEST(TiffDecode, GeoKeysAndGeoReference)
    {
        TiffBuilder b;
        add_gray_image(&b, 4);
        b.add_shorts(tags::kGeoKeyDirectory,
                     { 1, 1, 0, 1, geokeys::kGTModelType, 0, 1,
                       model_type::kGeographic });
        b.add_doubles(tags::kModelPixelScale, { 0.25, 0.25, 0.0 });
        const std::vector<std::byte> bytes = b.build();

        TiffFile file;
        ASSERT_TRUE(decode_tiff(bytes, TiffDecodeOptions {}, &file).ok());
        ASSERT_EQ(file.images.size(), 1U);
        const TiffImage& image = file.images[0];
        ASSERT_TRUE(image.has_geokeys);
        const GeoKeyValue* model = image.geokeys.find(geokeys::kGTModelType);
        ASSERT_NE(model, nullptr);
        EXPECT_EQ(model->short_value, model_type::kGeographic);
        ASSERT_TRUE(image.has_georeference);
        EXPECT_DOUBLE_EQ(image.georeference.pixel_scale[0], 0.25);

        TiffDecodeOptions no_geo;
        no_geo.parse_geokeys = false;
        ASSERT_TRUE(decode_tiff(bytes, no_geo, &file).ok());
        EXPECT_FALSE(file.images[0].has_geokeys);
        EXPECT_FALSE(file.images[0].has_georeference);
    }


    TEST(TiffDecode, BrokenGeoKeysFailDecode)
    {
        TiffBuilder b;
        add_gray_image(&b, 4);
        b.add_shorts(tags::kGeoKeyDirectory,
                     { 1, 1, 0, 1, geokeys::kGTCitation,
                       tags::kGeoAsciiParams, 4, 0 });
        const std::vector<std::byte> bytes = b.build();

        TiffFile file;
        const TiffDecodeResult r = decode_tiff(bytes, TiffDecodeOptions {},
                                               &file);
        EXPECT_EQ(r.status, TiffDecodeStatus::MissingReferencedTag);
        EXPECT_EQ(r.tag, tags::kGeoAsciiParams);
    }


    TEST(TiffDecode, HeaderAndChainErrorsPropagate)
    {
        TiffFile file;
        const std::vector<std::byte> junk(16, std::byte { 0x42 });
        EXPECT_EQ(decode_tiff(junk, TiffDecodeOptions {}, &file).status,
                  TiffDecodeStatus::InvalidFormat);

        TiffBuilder b;
        add_gray_image(&b, 4);
        std::vector<std::byte> bytes = b.build();
        bytes.resize(bytes.size() - 6);
        const TiffDecodeResult r = decode_tiff(bytes, TiffDecodeOptions {},
                                               &file);
        EXPECT_EQ(r.status, TiffDecodeStatus::Truncated);
        EXPECT_EQ(r.stage, TiffDecodeStage::Directory);
    }


    TEST(TiffDecode, EmptyChain)
    {
        std::vector<std::byte> bytes;
        bytes.push_back(std::byte { 'I' });
        bytes.push_back(std::byte { 'I' });
        test::append_u16(&bytes, ByteOrder::Little, 42);
        test::append_u32(&bytes, ByteOrder::Little, 0);

        TiffFile file;
        ASSERT_TRUE(decode_tiff(bytes, TiffDecodeOptions {}, &file).ok());
        EXPECT_TRUE(file.images.empty());
    }


    TEST(MappedFile, MissingPathFails)
    {
        MappedFile file;
        EXPECT_EQ(file.open("/nonexistent/tiffdir/input.tif"),
                  MappedFileStatus::OpenFailed);
        EXPECT_EQ(file.open(""), MappedFileStatus::OpenFailed);
        EXPECT_FALSE(file.is_open());
        EXPECT_TRUE(file.bytes().empty());
        EXPECT_EQ(mapped_file_status_name(MappedFileStatus::TooLarge),
                  "too_large");
    }

}  // namespace
}  // namespace tiffdir
