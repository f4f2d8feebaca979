#pragma once

#include "tiffdir/byte_arena.h"
#include "tiffdir/tiff_types.h"

#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

/**
 * \file tiff_value.h
 * \brief Typed value sequence of one resolved TIFF field.
 */

namespace tiffdir {

/// Unsigned rational (numerator/denominator).
struct URational final {
    uint32_t numer = 0;
    uint32_t denom = 1;
};

/// Signed rational (numerator/denominator).
struct SRational final {
    int32_t numer = 0;
    int32_t denom = 1;
};

/**
 * \brief A resolved field value.
 *
 * \ref span addresses \ref count elements in the owning \ref ByteArena, already
 * converted to native byte order:
 * - BYTE/UNDEFINED: `uint8_t`, SBYTE: `int8_t`, ASCII: raw chars (NULs kept)
 * - SHORT: `uint16_t`, SSHORT: `int16_t`
 * - LONG: `uint32_t`, SLONG: `int32_t`
 * - RATIONAL: \ref URational, SRATIONAL: \ref SRational
 * - FLOAT: `float`, DOUBLE: `double`
 */
struct TiffValue final {
    TiffType type  = TiffType::Undefined;
    uint32_t count = 0;
    ByteSpan span;
};

/// Native size of one element of \p type as stored in the arena.
uint32_t
native_element_size(TiffType type) noexcept;

/** \name Element accessors
 *  Each returns false when \p index is out of range or the type does not
 *  convert.
 *  @{
 */

/// Unsigned integer types (BYTE, SHORT, LONG, UNDEFINED).
bool
value_u64(const ByteArena& arena, const TiffValue& value, uint32_t index,
          uint64_t* out) noexcept;

/// value_u64() narrowed to 32 bits.
bool
value_u32(const ByteArena& arena, const TiffValue& value, uint32_t index,
          uint32_t* out) noexcept;

/// Any integer type, signed or unsigned.
bool
value_i64(const ByteArena& arena, const TiffValue& value, uint32_t index,
          int64_t* out) noexcept;

/// Any numeric type. Rationals with a zero denominator do not convert.
bool
value_f64(const ByteArena& arena, const TiffValue& value, uint32_t index,
          double* out) noexcept;

bool
value_urational(const ByteArena& arena, const TiffValue& value, uint32_t index,
                URational* out) noexcept;

bool
value_srational(const ByteArena& arena, const TiffValue& value, uint32_t index,
                SRational* out) noexcept;
/** @} */

/// Raw native element bytes of \p value.
std::span<const std::byte>
value_bytes(const ByteArena& arena, const TiffValue& value) noexcept;

/// Whole ASCII payload (including NULs); empty for non-ASCII values.
std::string_view
value_text(const ByteArena& arena, const TiffValue& value) noexcept;

/**
 * \brief Splits an ASCII value into its NUL-terminated runs.
 *
 * A trailing run without terminator is returned as well. Views point into the
 * arena and are invalidated by arena growth.
 */
void
value_ascii_runs(const ByteArena& arena, const TiffValue& value,
                 std::vector<std::string_view>* out);

}  // namespace tiffdir
