#pragma once

#include <cstdint>

/**
 * \file tiff_tags.h
 * \brief Numeric TIFF tag ids and the enumerated values of baseline tags.
 */

namespace tiffdir {

/// Tag ids (TIFF 6.0 p. 28-41, GeoTIFF 1.0 and GDAL private tags).
namespace tags {

    inline constexpr uint16_t kNewSubfileType            = 254;
    inline constexpr uint16_t kSubfileType               = 255;
    inline constexpr uint16_t kImageWidth                = 256;
    inline constexpr uint16_t kImageLength               = 257;
    inline constexpr uint16_t kBitsPerSample             = 258;
    inline constexpr uint16_t kCompression               = 259;
    inline constexpr uint16_t kPhotometricInterpretation = 262;
    inline constexpr uint16_t kFillOrder                 = 266;
    inline constexpr uint16_t kDocumentName              = 269;
    inline constexpr uint16_t kImageDescription          = 270;
    inline constexpr uint16_t kMake                      = 271;
    inline constexpr uint16_t kModel                     = 272;
    inline constexpr uint16_t kStripOffsets              = 273;
    inline constexpr uint16_t kOrientation               = 274;
    inline constexpr uint16_t kSamplesPerPixel           = 277;
    inline constexpr uint16_t kRowsPerStrip              = 278;
    inline constexpr uint16_t kStripByteCounts           = 279;
    inline constexpr uint16_t kMinSampleValue            = 280;
    inline constexpr uint16_t kMaxSampleValue            = 281;
    inline constexpr uint16_t kXResolution               = 282;
    inline constexpr uint16_t kYResolution               = 283;
    inline constexpr uint16_t kPlanarConfiguration       = 284;
    inline constexpr uint16_t kPageName                  = 285;
    inline constexpr uint16_t kXPosition                 = 286;
    inline constexpr uint16_t kYPosition                 = 287;
    inline constexpr uint16_t kResolutionUnit            = 296;
    inline constexpr uint16_t kPageNumber                = 297;
    inline constexpr uint16_t kSoftware                  = 305;
    inline constexpr uint16_t kDateTime                  = 306;
    inline constexpr uint16_t kArtist                    = 315;
    inline constexpr uint16_t kHostComputer              = 316;
    inline constexpr uint16_t kPredictor                 = 317;
    inline constexpr uint16_t kWhitePoint                = 318;
    inline constexpr uint16_t kPrimaryChromaticities     = 319;
    inline constexpr uint16_t kColorMap                  = 320;
    inline constexpr uint16_t kTileWidth                 = 322;
    inline constexpr uint16_t kTileLength                = 323;
    inline constexpr uint16_t kTileOffsets               = 324;
    inline constexpr uint16_t kTileByteCounts            = 325;
    inline constexpr uint16_t kInkSet                    = 332;
    inline constexpr uint16_t kExtraSamples              = 338;
    inline constexpr uint16_t kSampleFormat              = 339;
    inline constexpr uint16_t kJpegTables                = 347;
    inline constexpr uint16_t kYCbCrSubSampling          = 530;
    inline constexpr uint16_t kReferenceBlackWhite       = 532;
    inline constexpr uint16_t kCopyright                 = 33432;

    // GeoTIFF.
    inline constexpr uint16_t kModelPixelScale     = 33550;
    inline constexpr uint16_t kModelTiepoint       = 33922;
    inline constexpr uint16_t kModelTransformation = 34264;
    inline constexpr uint16_t kGeoKeyDirectory     = 34735;
    inline constexpr uint16_t kGeoDoubleParams     = 34736;
    inline constexpr uint16_t kGeoAsciiParams      = 34737;

    // GDAL.
    inline constexpr uint16_t kGdalMetadata = 42112;
    inline constexpr uint16_t kGdalNoData   = 42113;

}  // namespace tags

/// Compression scheme ids.
namespace compression {

    inline constexpr uint16_t kNone       = 1;
    inline constexpr uint16_t kCcitt      = 2;
    inline constexpr uint16_t kGroup3Fax  = 3;
    inline constexpr uint16_t kGroup4Fax  = 4;
    inline constexpr uint16_t kLzw        = 5;
    inline constexpr uint16_t kJpegOld    = 6;  // Superseded by kJpeg.
    inline constexpr uint16_t kJpeg       = 7;
    inline constexpr uint16_t kDeflate    = 8;  // zlib.
    inline constexpr uint16_t kPackBits   = 32773;
    inline constexpr uint16_t kDeflateOld = 32946;  // Superseded by kDeflate.

}  // namespace compression

/// PhotometricInterpretation values (p. 37).
namespace photometric {

    inline constexpr uint16_t kWhiteIsZero = 0;
    inline constexpr uint16_t kBlackIsZero = 1;
    inline constexpr uint16_t kRgb         = 2;
    inline constexpr uint16_t kPaletted    = 3;
    inline constexpr uint16_t kTransMask   = 4;
    inline constexpr uint16_t kCmyk        = 5;
    inline constexpr uint16_t kYCbCr       = 6;
    inline constexpr uint16_t kCieLab      = 8;

}  // namespace photometric

/// Predictor values (p. 64-65).
namespace predictor {

    inline constexpr uint16_t kNone       = 1;
    inline constexpr uint16_t kHorizontal = 2;

}  // namespace predictor

/// ResolutionUnit values (p. 18).
namespace resolution_unit {

    inline constexpr uint16_t kNone    = 1;
    inline constexpr uint16_t kPerInch = 2;
    inline constexpr uint16_t kPerCm   = 3;

}  // namespace resolution_unit

/// ExtraSamples values (p. 31-32).
namespace extra_samples {

    inline constexpr uint16_t kUnspecified       = 0;
    inline constexpr uint16_t kAssociatedAlpha   = 1;
    inline constexpr uint16_t kUnassociatedAlpha = 2;

}  // namespace extra_samples

/// PlanarConfiguration values.
namespace planar {

    inline constexpr uint16_t kChunky = 1;
    inline constexpr uint16_t kPlanar = 2;

}  // namespace planar

/// SampleFormat values.
namespace sample_format {

    inline constexpr uint16_t kUnsigned = 1;
    inline constexpr uint16_t kSigned   = 2;
    inline constexpr uint16_t kFloat    = 3;
    inline constexpr uint16_t kVoid     = 4;

}  // namespace sample_format

}  // namespace tiffdir
