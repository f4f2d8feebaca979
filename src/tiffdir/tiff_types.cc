#include "tiffdir/tiff_types.h"

namespace tiffdir {

bool
is_integer_type(TiffType type) noexcept
{
    switch (type) {
    case TiffType::Byte:
    case TiffType::Short:
    case TiffType::Long:
    case TiffType::SByte:
    case TiffType::Undefined:
    case TiffType::SShort:
    case TiffType::SLong: return true;
    default: break;
    }
    return false;
}


bool
is_rational_type(TiffType type) noexcept
{
    return type == TiffType::Rational || type == TiffType::SRational;
}

}  // namespace tiffdir
