#pragma once

#include <cstdint>

/**
 * \file geotiff_keys.h
 * \brief GeoTIFF 1.0 GeoKey ids and coordinate transformation codes.
 */

namespace tiffdir {

namespace geokeys {

    // Configuration keys (GeoTIFF 6.2.1).
    inline constexpr uint16_t kGTModelType  = 1024;
    inline constexpr uint16_t kGTRasterType = 1025;
    inline constexpr uint16_t kGTCitation   = 1026;

    // Geographic CS parameter keys (6.2.2).
    inline constexpr uint16_t kGeographicType        = 2048;
    inline constexpr uint16_t kGeogCitation          = 2049;
    inline constexpr uint16_t kGeogGeodeticDatum     = 2050;
    inline constexpr uint16_t kGeogPrimeMeridian     = 2051;
    inline constexpr uint16_t kGeogLinearUnits       = 2052;
    inline constexpr uint16_t kGeogLinearUnitSize    = 2053;
    inline constexpr uint16_t kGeogAngularUnits      = 2054;
    inline constexpr uint16_t kGeogAngularUnitSize   = 2055;
    inline constexpr uint16_t kGeogEllipsoid         = 2056;
    inline constexpr uint16_t kGeogSemiMajorAxis     = 2057;
    inline constexpr uint16_t kGeogSemiMinorAxis     = 2058;
    inline constexpr uint16_t kGeogInvFlattening     = 2059;
    inline constexpr uint16_t kGeogAzimuthUnits      = 2060;
    inline constexpr uint16_t kGeogPrimeMeridianLong = 2061;

    // Projected CS parameter keys (6.2.3).
    inline constexpr uint16_t kProjectedCSType          = 3072;
    inline constexpr uint16_t kPCSCitation              = 3073;
    inline constexpr uint16_t kProjection               = 3074;
    inline constexpr uint16_t kProjCoordTrans           = 3075;
    inline constexpr uint16_t kProjLinearUnits          = 3076;
    inline constexpr uint16_t kProjLinearUnitSize       = 3077;
    inline constexpr uint16_t kProjStdParallel1         = 3078;
    inline constexpr uint16_t kProjStdParallel2         = 3079;
    inline constexpr uint16_t kProjNatOriginLong        = 3080;
    inline constexpr uint16_t kProjNatOriginLat         = 3081;
    inline constexpr uint16_t kProjFalseEasting         = 3082;
    inline constexpr uint16_t kProjFalseNorthing        = 3083;
    inline constexpr uint16_t kProjFalseOriginLong      = 3084;
    inline constexpr uint16_t kProjFalseOriginLat       = 3085;
    inline constexpr uint16_t kProjFalseOriginEasting   = 3086;
    inline constexpr uint16_t kProjFalseOriginNorthing  = 3087;
    inline constexpr uint16_t kProjCenterLong           = 3088;
    inline constexpr uint16_t kProjCenterLat            = 3089;
    inline constexpr uint16_t kProjCenterEasting        = 3090;
    inline constexpr uint16_t kProjCenterNorthing       = 3091;
    inline constexpr uint16_t kProjScaleAtNatOrigin     = 3092;
    inline constexpr uint16_t kProjScaleAtCenter        = 3093;
    inline constexpr uint16_t kProjAzimuthAngle         = 3094;
    inline constexpr uint16_t kProjStraightVertPoleLong = 3095;

    // Vertical CS parameter keys (6.2.4).
    inline constexpr uint16_t kVerticalCSType   = 4096;
    inline constexpr uint16_t kVerticalCitation = 4097;
    inline constexpr uint16_t kVerticalDatum    = 4098;
    inline constexpr uint16_t kVerticalUnits    = 4099;

}  // namespace geokeys

/// GTModelTypeGeoKey values.
namespace model_type {

    inline constexpr uint16_t kProjected  = 1;
    inline constexpr uint16_t kGeographic = 2;
    inline constexpr uint16_t kGeocentric = 3;

}  // namespace model_type

/// GTRasterTypeGeoKey values.
namespace raster_type {

    inline constexpr uint16_t kPixelIsArea  = 1;
    inline constexpr uint16_t kPixelIsPoint = 2;

}  // namespace raster_type

/// ProjCoordTransGeoKey values (GeoTIFF 6.3.3.3).
namespace coord_trans {

    inline constexpr uint16_t kTransverseMercator            = 1;
    inline constexpr uint16_t kTransvMercatorModifiedAlaska  = 2;
    inline constexpr uint16_t kObliqueMercator               = 3;
    inline constexpr uint16_t kObliqueMercatorLaborde        = 4;
    inline constexpr uint16_t kObliqueMercatorRosenmund      = 5;
    inline constexpr uint16_t kObliqueMercatorSpherical      = 6;
    inline constexpr uint16_t kMercator                      = 7;
    inline constexpr uint16_t kLambertConfConic2SP           = 8;
    inline constexpr uint16_t kLambertConfConicHelmert       = 9;
    inline constexpr uint16_t kLambertAzimEqualArea          = 10;
    inline constexpr uint16_t kAlbersEqualArea               = 11;
    inline constexpr uint16_t kAzimuthalEquidistant          = 12;
    inline constexpr uint16_t kEquidistantConic              = 13;
    inline constexpr uint16_t kStereographic                 = 14;
    inline constexpr uint16_t kPolarStereographic            = 15;
    inline constexpr uint16_t kObliqueStereographic          = 16;
    inline constexpr uint16_t kEquirectangular               = 17;
    inline constexpr uint16_t kCassiniSoldner                = 18;
    inline constexpr uint16_t kGnomonic                      = 19;
    inline constexpr uint16_t kMillerCylindrical             = 20;
    inline constexpr uint16_t kOrthographic                  = 21;
    inline constexpr uint16_t kPolyconic                     = 22;
    inline constexpr uint16_t kRobinson                      = 23;
    inline constexpr uint16_t kSinusoidal                    = 24;
    inline constexpr uint16_t kVanDerGrinten                 = 25;
    inline constexpr uint16_t kNewZealandMapGrid             = 26;
    inline constexpr uint16_t kTransvMercatorSouthOriented   = 27;

}  // namespace coord_trans

}  // namespace tiffdir
