#pragma once

#include <array>
#include <cstdint>

/**
 * \file tiff_types.h
 * \brief TIFF field type codes and their element widths.
 */

namespace tiffdir {

/// TIFF 6.0 field types (p. 14-16 of the TIFF 6.0 specification).
enum class TiffType : uint16_t {
    Byte      = 1,
    Ascii     = 2,
    Short     = 3,
    Long      = 4,
    Rational  = 5,
    SByte     = 6,
    Undefined = 7,
    SShort    = 8,
    SLong     = 9,
    SRational = 10,
    Float     = 11,
    Double    = 12,
};

inline constexpr uint16_t kMinTiffType = 1;
inline constexpr uint16_t kMaxTiffType = 12;

/**
 * \brief Element byte width per type code, indexed by the raw code.
 *
 * Index 0 is not a type. UNDEFINED carries width 0: its elements are treated
 * as raw 1-byte units (see \ref tiff_type_unit).
 */
inline constexpr std::array<uint32_t, 13> kTiffTypeWidths {
    0, 1, 1, 2, 4, 8, 1, 0, 2, 4, 8, 4, 8,
};

/// Returns true for type codes 1..12.
constexpr bool
is_valid_tiff_type(uint16_t code) noexcept
{
    return code >= kMinTiffType && code <= kMaxTiffType;
}

/// Width from \ref kTiffTypeWidths; 0 for codes outside the table.
constexpr uint32_t
tiff_type_width(uint16_t code) noexcept
{
    return code < kTiffTypeWidths.size() ? kTiffTypeWidths[code] : 0U;
}

/// Byte size of one stored element: the table width, or 1 for width-0 types.
constexpr uint32_t
tiff_type_unit(uint16_t code) noexcept
{
    const uint32_t w = tiff_type_width(code);
    return w == 0U ? 1U : w;
}

/// True for BYTE, SHORT, LONG, SBYTE, SSHORT, SLONG and UNDEFINED.
bool
is_integer_type(TiffType type) noexcept;

/// True for RATIONAL and SRATIONAL.
bool
is_rational_type(TiffType type) noexcept;

}  // namespace tiffdir
