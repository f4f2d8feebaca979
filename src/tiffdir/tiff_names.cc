#include "tiffdir/tiff_names.h"

#include "name_table_internal.h"

namespace tiffdir {
namespace {

    using names_internal::NameEntry;

    // Sorted by id.
    constexpr NameEntry kTagNames[] = {
        { 254, "NewSubfileType" },
        { 255, "SubfileType" },
        { 256, "ImageWidth" },
        { 257, "ImageLength" },
        { 258, "BitsPerSample" },
        { 259, "Compression" },
        { 262, "PhotometricInterpretation" },
        { 266, "FillOrder" },
        { 269, "DocumentName" },
        { 270, "ImageDescription" },
        { 271, "Make" },
        { 272, "Model" },
        { 273, "StripOffsets" },
        { 274, "Orientation" },
        { 277, "SamplesPerPixel" },
        { 278, "RowsPerStrip" },
        { 279, "StripByteCounts" },
        { 280, "MinSampleValue" },
        { 281, "MaxSampleValue" },
        { 282, "XResolution" },
        { 283, "YResolution" },
        { 284, "PlanarConfiguration" },
        { 285, "PageName" },
        { 286, "XPosition" },
        { 287, "YPosition" },
        { 296, "ResolutionUnit" },
        { 297, "PageNumber" },
        { 305, "Software" },
        { 306, "DateTime" },
        { 315, "Artist" },
        { 316, "HostComputer" },
        { 317, "Predictor" },
        { 318, "WhitePoint" },
        { 319, "PrimaryChromaticities" },
        { 320, "ColorMap" },
        { 322, "TileWidth" },
        { 323, "TileLength" },
        { 324, "TileOffsets" },
        { 325, "TileByteCounts" },
        { 332, "InkSet" },
        { 338, "ExtraSamples" },
        { 339, "SampleFormat" },
        { 347, "JPEGTables" },
        { 530, "YCbCrSubSampling" },
        { 532, "ReferenceBlackWhite" },
        { 33432, "Copyright" },
        { 33550, "ModelPixelScaleTag" },
        { 33922, "ModelTiepointTag" },
        { 34264, "ModelTransformationTag" },
        { 34735, "GeoKeyDirectoryTag" },
        { 34736, "GeoDoubleParamsTag" },
        { 34737, "GeoAsciiParamsTag" },
        { 42112, "GDAL_METADATA" },
        { 42113, "GDAL_NODATA" },
    };

    constexpr NameEntry kCompressionNames[] = {
        { 1, "none" },
        { 2, "ccitt" },
        { 3, "g3" },
        { 4, "g4" },
        { 5, "lzw" },
        { 6, "jpeg_old" },
        { 7, "jpeg" },
        { 8, "deflate" },
        { 32773, "packbits" },
        { 32946, "deflate_old" },
    };

    constexpr NameEntry kPhotometricNames[] = {
        { 0, "white_is_zero" },
        { 1, "black_is_zero" },
        { 2, "rgb" },
        { 3, "paletted" },
        { 4, "trans_mask" },
        { 5, "cmyk" },
        { 6, "ycbcr" },
        { 8, "cielab" },
    };

}  // namespace

std::string_view
tiff_tag_name(uint16_t tag) noexcept
{
    return names_internal::find_name(kTagNames, tag);
}


std::string_view
tiff_type_name(uint16_t type) noexcept
{
    switch (type) {
    case 1: return "BYTE";
    case 2: return "ASCII";
    case 3: return "SHORT";
    case 4: return "LONG";
    case 5: return "RATIONAL";
    case 6: return "SBYTE";
    case 7: return "UNDEFINED";
    case 8: return "SSHORT";
    case 9: return "SLONG";
    case 10: return "SRATIONAL";
    case 11: return "FLOAT";
    case 12: return "DOUBLE";
    default: return {};
    }
}


std::string_view
compression_name(uint16_t compression) noexcept
{
    return names_internal::find_name(kCompressionNames, compression);
}


std::string_view
photometric_name(uint16_t photometric) noexcept
{
    return names_internal::find_name(kPhotometricNames, photometric);
}


std::string_view
image_mode_name(ImageMode mode) noexcept
{
    switch (mode) {
    case ImageMode::Bilevel: return "bilevel";
    case ImageMode::Paletted: return "paletted";
    case ImageMode::Gray: return "gray";
    case ImageMode::GrayInverted: return "gray_inverted";
    case ImageMode::Rgb: return "rgb";
    case ImageMode::Rgba: return "rgba";
    case ImageMode::Nrgba: return "nrgba";
    }
    return {};
}

}  // namespace tiffdir
