#include "tiffdir/decode_status.h"

namespace tiffdir {

std::string_view
decode_status_name(TiffDecodeStatus status) noexcept
{
    switch (status) {
    case TiffDecodeStatus::Ok: return "ok";
    case TiffDecodeStatus::InvalidFormat: return "invalid_format";
    case TiffDecodeStatus::Truncated: return "truncated";
    case TiffDecodeStatus::Overflow: return "overflow";
    case TiffDecodeStatus::UnsupportedType: return "unsupported_type";
    case TiffDecodeStatus::UnsupportedCompression:
        return "unsupported_compression";
    case TiffDecodeStatus::UnsupportedConfiguration:
        return "unsupported_configuration";
    case TiffDecodeStatus::MissingTag: return "missing_tag";
    case TiffDecodeStatus::MissingReferencedTag:
        return "missing_referenced_tag";
    case TiffDecodeStatus::LimitExceeded: return "limit_exceeded";
    case TiffDecodeStatus::Malformed: return "malformed";
    }
    return "unknown";
}


std::string_view
decode_stage_name(TiffDecodeStage stage) noexcept
{
    switch (stage) {
    case TiffDecodeStage::Header: return "header";
    case TiffDecodeStage::Chain: return "chain";
    case TiffDecodeStage::Directory: return "directory";
    case TiffDecodeStage::Value: return "value";
    case TiffDecodeStage::Mode: return "mode";
    case TiffDecodeStage::Layout: return "layout";
    case TiffDecodeStage::GeoKeys: return "geokeys";
    case TiffDecodeStage::GeoReference: return "georeference";
    }
    return "unknown";
}

}  // namespace tiffdir
