#include "tiffdir/value_resolve.h"

#include "tiffdir/tiff_types.h"

#include <cstring>

namespace tiffdir {
namespace {

    // Decodes `count` elements from `src` into `dst`, converting from `order`
    // to native order. Rationals are decoded as two 4-byte halves. `dst` must
    // hold count * native_element_size(type) bytes.
    static bool decode_elements(ByteOrder order, TiffType type, uint32_t count,
                                std::span<const std::byte> src,
                                std::span<std::byte> dst) noexcept
    {
        switch (type) {
        case TiffType::Byte:
        case TiffType::Ascii:
        case TiffType::SByte:
        case TiffType::Undefined:
            if (src.size() < count || dst.size() < count) {
                return false;
            }
            if (count != 0U) {
                std::memcpy(dst.data(), src.data(), count);
            }
            return true;
        case TiffType::Short:
        case TiffType::SShort:
            for (uint32_t i = 0; i < count; ++i) {
                uint16_t v = 0;
                if (!read_u16(order, src, static_cast<uint64_t>(i) * 2U, &v)) {
                    return false;
                }
                std::memcpy(dst.data() + i * 2U, &v, 2U);
            }
            return true;
        case TiffType::Long:
        case TiffType::SLong:
        case TiffType::Float:
            // FLOAT keeps its IEEE-754 bit pattern; only byte order changes.
            for (uint32_t i = 0; i < count; ++i) {
                uint32_t v = 0;
                if (!read_u32(order, src, static_cast<uint64_t>(i) * 4U, &v)) {
                    return false;
                }
                std::memcpy(dst.data() + i * 4U, &v, 4U);
            }
            return true;
        case TiffType::Rational:
        case TiffType::SRational:
            for (uint32_t i = 0; i < count * 2U; ++i) {
                uint32_t v = 0;
                if (!read_u32(order, src, static_cast<uint64_t>(i) * 4U, &v)) {
                    return false;
                }
                std::memcpy(dst.data() + i * 4U, &v, 4U);
            }
            return true;
        case TiffType::Double:
            for (uint32_t i = 0; i < count; ++i) {
                uint64_t v = 0;
                if (!read_u64(order, src, static_cast<uint64_t>(i) * 8U, &v)) {
                    return false;
                }
                std::memcpy(dst.data() + i * 8U, &v, 8U);
            }
            return true;
        }
        return false;
    }


    static uint32_t native_alignment(TiffType type) noexcept
    {
        switch (type) {
        case TiffType::Short:
        case TiffType::SShort: return alignof(uint16_t);
        case TiffType::Long:
        case TiffType::SLong:
        case TiffType::Float:
        case TiffType::Rational:
        case TiffType::SRational: return alignof(uint32_t);
        case TiffType::Double: return alignof(double);
        default: break;
        }
        return 1;
    }

}  // namespace

TiffDecodeResult
locate_entry_value(ByteOrder order, const RawEntry& entry,
                   ValueLocation* out) noexcept
{
    if (!is_valid_tiff_type(entry.type)) {
        return decode_error(TiffDecodeStatus::UnsupportedType,
                            TiffDecodeStage::Value, entry.tag);
    }

    const uint64_t total = static_cast<uint64_t>(entry.count)
                           * tiff_type_unit(entry.type);
    if (total > UINT32_MAX) {
        return decode_error(TiffDecodeStatus::Overflow, TiffDecodeStage::Value,
                            entry.tag);
    }

    ValueLocation loc;
    loc.total_bytes  = static_cast<uint32_t>(total);
    loc.inline_value = total <= entry.value_field.size();
    if (!loc.inline_value) {
        const std::span<const std::byte> field(entry.value_field.data(),
                                               entry.value_field.size());
        if (!read_u32(order, field, 0, &loc.offset)) {
            return decode_error(TiffDecodeStatus::Truncated,
                                TiffDecodeStage::Value, entry.tag);
        }
    }
    *out = loc;
    return decode_ok(TiffDecodeStage::Value);
}


TiffDecodeResult
resolve_entry_value(std::span<const std::byte> bytes, ByteOrder order,
                    const RawEntry& entry, const TiffDecodeLimits& limits,
                    ByteArena& arena, TiffValue* out) noexcept
{
    ValueLocation loc;
    const TiffDecodeResult located = locate_entry_value(order, entry, &loc);
    if (!located.ok()) {
        return located;
    }
    if (limits.max_value_bytes != 0U
        && loc.total_bytes > limits.max_value_bytes) {
        return decode_error(TiffDecodeStatus::LimitExceeded,
                            TiffDecodeStage::Value, entry.tag, loc.offset);
    }

    std::span<const std::byte> src;
    if (loc.inline_value) {
        src = std::span<const std::byte>(entry.value_field.data(),
                                         loc.total_bytes);
    } else {
        if (!range_in_bounds(bytes, loc.offset, loc.total_bytes)) {
            return decode_error(TiffDecodeStatus::Truncated,
                                TiffDecodeStage::Value, entry.tag, loc.offset);
        }
        src = bytes.subspan(loc.offset, loc.total_bytes);
    }

    const TiffType type = static_cast<TiffType>(entry.type);
    const uint64_t native_bytes = static_cast<uint64_t>(entry.count)
                                  * native_element_size(type);
    if (native_bytes > UINT32_MAX) {
        return decode_error(TiffDecodeStatus::Overflow, TiffDecodeStage::Value,
                            entry.tag);
    }

    // ByteSpan offsets are 32-bit; a full arena fails even with no byte limit.
    if (!arena.fits(native_bytes, native_alignment(type))) {
        return decode_error(TiffDecodeStatus::LimitExceeded,
                            TiffDecodeStage::Value, entry.tag, loc.offset);
    }

    TiffValue v;
    v.type  = type;
    v.count = entry.count;
    v.span  = arena.allocate(static_cast<uint32_t>(native_bytes),
                             native_alignment(type));
    if (!decode_elements(order, type, entry.count, src,
                         arena.span_mut(v.span))) {
        return decode_error(TiffDecodeStatus::Truncated,
                            TiffDecodeStage::Value, entry.tag, loc.offset);
    }
    *out = v;
    return decode_ok(TiffDecodeStage::Value);
}

}  // namespace tiffdir
