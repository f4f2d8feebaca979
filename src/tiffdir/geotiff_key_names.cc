#include "tiffdir/tiff_names.h"

#include "name_table_internal.h"

namespace tiffdir {
namespace {

    using names_internal::NameEntry;

    constexpr NameEntry kGeoKeyNames[] = {
        { 1024, "GTModelTypeGeoKey" },
        { 1025, "GTRasterTypeGeoKey" },
        { 1026, "GTCitationGeoKey" },
        { 2048, "GeographicTypeGeoKey" },
        { 2049, "GeogCitationGeoKey" },
        { 2050, "GeogGeodeticDatumGeoKey" },
        { 2051, "GeogPrimeMeridianGeoKey" },
        { 2052, "GeogLinearUnitsGeoKey" },
        { 2053, "GeogLinearUnitSizeGeoKey" },
        { 2054, "GeogAngularUnitsGeoKey" },
        { 2055, "GeogAngularUnitSizeGeoKey" },
        { 2056, "GeogEllipsoidGeoKey" },
        { 2057, "GeogSemiMajorAxisGeoKey" },
        { 2058, "GeogSemiMinorAxisGeoKey" },
        { 2059, "GeogInvFlatteningGeoKey" },
        { 2060, "GeogAzimuthUnitsGeoKey" },
        { 2061, "GeogPrimeMeridianLongGeoKey" },
        { 3072, "ProjectedCSTypeGeoKey" },
        { 3073, "PCSCitationGeoKey" },
        { 3074, "ProjectionGeoKey" },
        { 3075, "ProjCoordTransGeoKey" },
        { 3076, "ProjLinearUnitsGeoKey" },
        { 3077, "ProjLinearUnitSizeGeoKey" },
        { 3078, "ProjStdParallel1GeoKey" },
        { 3079, "ProjStdParallel2GeoKey" },
        { 3080, "ProjNatOriginLongGeoKey" },
        { 3081, "ProjNatOriginLatGeoKey" },
        { 3082, "ProjFalseEastingGeoKey" },
        { 3083, "ProjFalseNorthingGeoKey" },
        { 3084, "ProjFalseOriginLongGeoKey" },
        { 3085, "ProjFalseOriginLatGeoKey" },
        { 3086, "ProjFalseOriginEastingGeoKey" },
        { 3087, "ProjFalseOriginNorthingGeoKey" },
        { 3088, "ProjCenterLongGeoKey" },
        { 3089, "ProjCenterLatGeoKey" },
        { 3090, "ProjCenterEastingGeoKey" },
        { 3091, "ProjCenterNorthingGeoKey" },
        { 3092, "ProjScaleAtNatOriginGeoKey" },
        { 3093, "ProjScaleAtCenterGeoKey" },
        { 3094, "ProjAzimuthAngleGeoKey" },
        { 3095, "ProjStraightVertPoleLongGeoKey" },
        { 4096, "VerticalCSTypeGeoKey" },
        { 4097, "VerticalCitationGeoKey" },
        { 4098, "VerticalDatumGeoKey" },
        { 4099, "VerticalUnitsGeoKey" },
    };

    constexpr NameEntry kCoordTransformNames[] = {
        { 1, "CT_TransverseMercator" },
        { 2, "CT_TransvMercator_Modified_Alaska" },
        { 3, "CT_ObliqueMercator" },
        { 4, "CT_ObliqueMercator_Laborde" },
        { 5, "CT_ObliqueMercator_Rosenmund" },
        { 6, "CT_ObliqueMercator_Spherical" },
        { 7, "CT_Mercator" },
        { 8, "CT_LambertConfConic_2SP" },
        { 9, "CT_LambertConfConic_Helmert" },
        { 10, "CT_LambertAzimEqualArea" },
        { 11, "CT_AlbersEqualArea" },
        { 12, "CT_AzimuthalEquidistant" },
        { 13, "CT_EquidistantConic" },
        { 14, "CT_Stereographic" },
        { 15, "CT_PolarStereographic" },
        { 16, "CT_ObliqueStereographic" },
        { 17, "CT_Equirectangular" },
        { 18, "CT_CassiniSoldner" },
        { 19, "CT_Gnomonic" },
        { 20, "CT_MillerCylindrical" },
        { 21, "CT_Orthographic" },
        { 22, "CT_Polyconic" },
        { 23, "CT_Robinson" },
        { 24, "CT_Sinusoidal" },
        { 25, "CT_VanDerGrinten" },
        { 26, "CT_NewZealandMapGrid" },
        { 27, "CT_TransvMercator_SouthOriented" },
    };

}  // namespace

std::string_view
geokey_name(uint16_t key_id) noexcept
{
    return names_internal::find_name(kGeoKeyNames, key_id);
}


std::string_view
coord_transform_name(uint16_t code) noexcept
{
    return names_internal::find_name(kCoordTransformNames, code);
}

}  // namespace tiffdir
