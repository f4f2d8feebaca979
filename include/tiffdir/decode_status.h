#pragma once

#include <cstdint>
#include <string_view>

/**
 * \file decode_status.h
 * \brief Status, stage and advisory warning types shared by all decoders.
 */

namespace tiffdir {

/// Decode outcome. Everything except \ref TiffDecodeStatus::Ok is a failure.
enum class TiffDecodeStatus : uint8_t {
    Ok,
    /// Header magic is not one of the two classic TIFF values.
    InvalidFormat,
    /// A read would go past the end of the source.
    Truncated,
    /// `count * element_width` does not fit the 32-bit offset space.
    Overflow,
    /// Field type code outside 1..12.
    UnsupportedType,
    /// Compression id is not a known scheme.
    UnsupportedCompression,
    /// Tag combination maps to no image mode (CMYK, YCbCr, ...).
    UnsupportedConfiguration,
    /// A required baseline tag is absent.
    MissingTag,
    /// A GeoKey points at a tag that the directory does not carry.
    MissingReferencedTag,
    /// A \ref TiffDecodeLimits bound was hit.
    LimitExceeded,
    /// Structurally invalid content that is not a bounds problem.
    Malformed,
};

/// Pipeline stage that produced a status.
enum class TiffDecodeStage : uint8_t {
    Header,
    Chain,
    Directory,
    Value,
    Mode,
    Layout,
    GeoKeys,
    GeoReference,
};

/// Advisory, non-fatal findings.
enum class DecodeWarnings : uint8_t {
    None         = 0,
    DuplicateTag = 1U << 0U,
};

constexpr DecodeWarnings
operator|(DecodeWarnings a, DecodeWarnings b) noexcept
{
    return static_cast<DecodeWarnings>(static_cast<uint8_t>(a)
                                       | static_cast<uint8_t>(b));
}

constexpr DecodeWarnings
operator&(DecodeWarnings a, DecodeWarnings b) noexcept
{
    return static_cast<DecodeWarnings>(static_cast<uint8_t>(a)
                                       & static_cast<uint8_t>(b));
}

constexpr DecodeWarnings&
operator|=(DecodeWarnings& a, DecodeWarnings b) noexcept
{
    a = a | b;
    return a;
}

constexpr bool
any(DecodeWarnings flags, DecodeWarnings test) noexcept
{
    return static_cast<uint8_t>(flags & test) != 0;
}

/**
 * \brief Result of a decode call.
 *
 * On failure \ref stage, \ref tag and \ref offset identify where decoding
 * stopped (`tag` is 0 when no tag is involved). \ref warnings accumulates
 * advisory findings and may be set on success.
 */
struct TiffDecodeResult final {
    TiffDecodeStatus status = TiffDecodeStatus::Ok;
    TiffDecodeStage stage   = TiffDecodeStage::Header;
    uint16_t tag            = 0;
    uint64_t offset         = 0;
    DecodeWarnings warnings = DecodeWarnings::None;

    constexpr bool ok() const noexcept
    {
        return status == TiffDecodeStatus::Ok;
    }
};

constexpr TiffDecodeResult
decode_ok(TiffDecodeStage stage) noexcept
{
    TiffDecodeResult r;
    r.stage = stage;
    return r;
}

constexpr TiffDecodeResult
decode_error(TiffDecodeStatus status, TiffDecodeStage stage, uint16_t tag = 0,
             uint64_t offset = 0) noexcept
{
    TiffDecodeResult r;
    r.status = status;
    r.stage  = stage;
    r.tag    = tag;
    r.offset = offset;
    return r;
}

/// True for the two statuses after which a caller may skip the image.
constexpr bool
is_recoverable(TiffDecodeStatus status) noexcept
{
    return status == TiffDecodeStatus::UnsupportedCompression
           || status == TiffDecodeStatus::UnsupportedConfiguration;
}

std::string_view
decode_status_name(TiffDecodeStatus status) noexcept;

std::string_view
decode_stage_name(TiffDecodeStage stage) noexcept;

}  // namespace tiffdir
