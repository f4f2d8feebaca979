#include "tiffdir/tiff_header.h"

#include <cstring>

namespace tiffdir {
namespace {

    static bool match_magic(std::span<const std::byte> bytes,
                            const char (&magic)[5]) noexcept
    {
        return std::memcmp(bytes.data(), magic, 4) == 0;
    }

}  // namespace

TiffDecodeResult
read_tiff_header(std::span<const std::byte> bytes, TiffHeader* out) noexcept
{
    if (bytes.size() < 4) {
        return decode_error(TiffDecodeStatus::Truncated,
                            TiffDecodeStage::Header);
    }

    TiffHeader hdr;
    if (match_magic(bytes, "II\x2A\x00")) {
        hdr.order = ByteOrder::Little;
    } else if (match_magic(bytes, "MM\x00\x2A")) {
        hdr.order = ByteOrder::Big;
    } else {
        return decode_error(TiffDecodeStatus::InvalidFormat,
                            TiffDecodeStage::Header);
    }

    if (!read_u32(hdr.order, bytes, 4, &hdr.first_offset)) {
        return decode_error(TiffDecodeStatus::Truncated,
                            TiffDecodeStage::Header, 0, 4);
    }

    if (out) {
        *out = hdr;
    }
    return decode_ok(TiffDecodeStage::Header);
}

}  // namespace tiffdir
