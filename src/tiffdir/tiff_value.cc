#include "tiffdir/tiff_value.h"

#include <cstring>

namespace tiffdir {
namespace {

    template<typename T>
    static bool load_element(const ByteArena& arena, const TiffValue& value,
                             uint32_t index, T* out) noexcept
    {
        if (index >= value.count) {
            return false;
        }
        const std::span<const std::byte> bytes = arena.span(value.span);
        const size_t off = static_cast<size_t>(index) * sizeof(T);
        if (off + sizeof(T) > bytes.size()) {
            return false;
        }
        std::memcpy(out, bytes.data() + off, sizeof(T));
        return true;
    }

}  // namespace

uint32_t
native_element_size(TiffType type) noexcept
{
    switch (type) {
    case TiffType::Byte:
    case TiffType::Ascii:
    case TiffType::SByte:
    case TiffType::Undefined: return 1;
    case TiffType::Short:
    case TiffType::SShort: return 2;
    case TiffType::Long:
    case TiffType::SLong:
    case TiffType::Float: return 4;
    case TiffType::Rational: return sizeof(URational);
    case TiffType::SRational: return sizeof(SRational);
    case TiffType::Double: return 8;
    }
    return 0;
}


bool
value_u64(const ByteArena& arena, const TiffValue& value, uint32_t index,
          uint64_t* out) noexcept
{
    switch (value.type) {
    case TiffType::Byte:
    case TiffType::Undefined: {
        uint8_t v = 0;
        if (!load_element(arena, value, index, &v)) {
            return false;
        }
        *out = v;
        return true;
    }
    case TiffType::Short: {
        uint16_t v = 0;
        if (!load_element(arena, value, index, &v)) {
            return false;
        }
        *out = v;
        return true;
    }
    case TiffType::Long: {
        uint32_t v = 0;
        if (!load_element(arena, value, index, &v)) {
            return false;
        }
        *out = v;
        return true;
    }
    default: break;
    }
    return false;
}


bool
value_u32(const ByteArena& arena, const TiffValue& value, uint32_t index,
          uint32_t* out) noexcept
{
    uint64_t v = 0;
    if (!value_u64(arena, value, index, &v) || v > UINT32_MAX) {
        return false;
    }
    *out = static_cast<uint32_t>(v);
    return true;
}


bool
value_i64(const ByteArena& arena, const TiffValue& value, uint32_t index,
          int64_t* out) noexcept
{
    switch (value.type) {
    case TiffType::SByte: {
        int8_t v = 0;
        if (!load_element(arena, value, index, &v)) {
            return false;
        }
        *out = v;
        return true;
    }
    case TiffType::SShort: {
        int16_t v = 0;
        if (!load_element(arena, value, index, &v)) {
            return false;
        }
        *out = v;
        return true;
    }
    case TiffType::SLong: {
        int32_t v = 0;
        if (!load_element(arena, value, index, &v)) {
            return false;
        }
        *out = v;
        return true;
    }
    default: break;
    }

    uint64_t u = 0;
    if (!value_u64(arena, value, index, &u)) {
        return false;
    }
    *out = static_cast<int64_t>(u);
    return true;
}


bool
value_f64(const ByteArena& arena, const TiffValue& value, uint32_t index,
          double* out) noexcept
{
    switch (value.type) {
    case TiffType::Float: {
        float v = 0.0F;
        if (!load_element(arena, value, index, &v)) {
            return false;
        }
        *out = static_cast<double>(v);
        return true;
    }
    case TiffType::Double: return load_element(arena, value, index, out);
    case TiffType::Rational: {
        URational r;
        if (!load_element(arena, value, index, &r) || r.denom == 0U) {
            return false;
        }
        *out = static_cast<double>(r.numer) / static_cast<double>(r.denom);
        return true;
    }
    case TiffType::SRational: {
        SRational r;
        if (!load_element(arena, value, index, &r) || r.denom == 0) {
            return false;
        }
        *out = static_cast<double>(r.numer) / static_cast<double>(r.denom);
        return true;
    }
    case TiffType::Ascii: return false;
    default: break;
    }

    int64_t v = 0;
    if (!value_i64(arena, value, index, &v)) {
        return false;
    }
    *out = static_cast<double>(v);
    return true;
}


bool
value_urational(const ByteArena& arena, const TiffValue& value, uint32_t index,
                URational* out) noexcept
{
    if (value.type != TiffType::Rational) {
        return false;
    }
    return load_element(arena, value, index, out);
}


bool
value_srational(const ByteArena& arena, const TiffValue& value, uint32_t index,
                SRational* out) noexcept
{
    if (value.type != TiffType::SRational) {
        return false;
    }
    return load_element(arena, value, index, out);
}


std::span<const std::byte>
value_bytes(const ByteArena& arena, const TiffValue& value) noexcept
{
    return arena.span(value.span);
}


std::string_view
value_text(const ByteArena& arena, const TiffValue& value) noexcept
{
    if (value.type != TiffType::Ascii) {
        return std::string_view();
    }
    const std::span<const std::byte> bytes = arena.span(value.span);
    return std::string_view(reinterpret_cast<const char*>(bytes.data()),
                            bytes.size());
}


void
value_ascii_runs(const ByteArena& arena, const TiffValue& value,
                 std::vector<std::string_view>* out)
{
    out->clear();
    const std::string_view text = value_text(arena, value);
    size_t start = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\0') {
            out->push_back(text.substr(start, i - start));
            start = i + 1;
        }
    }
    if (start < text.size()) {
        out->push_back(text.substr(start));
    }
}

}  // namespace tiffdir
