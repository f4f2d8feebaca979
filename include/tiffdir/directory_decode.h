#pragma once

#include "tiffdir/byte_order.h"
#include "tiffdir/decode_options.h"
#include "tiffdir/decode_status.h"
#include "tiffdir/directory.h"
#include "tiffdir/tiff_header.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

/**
 * \file directory_decode.h
 * \brief Directory (IFD) decoding and chain traversal.
 *
 * Every function here depends only on the source bytes, the byte order and an
 * offset, so directories can be decoded independently (and concurrently) once
 * their offsets are known.
 */

namespace tiffdir {

/**
 * \brief Reads the raw entries of the directory at \p offset.
 *
 * Fails \ref TiffDecodeStatus::Truncated when `2 + 12*N + 4` bytes starting at
 * \p offset are not all inside \p bytes; the entry list is never silently
 * shortened. \p out is written only on success.
 */
TiffDecodeResult
read_raw_directory(std::span<const std::byte> bytes, ByteOrder order,
                   uint64_t offset, const TiffDecodeLimits& limits,
                   RawDirectory* out);

/**
 * \brief Reads and resolves the directory at \p offset.
 *
 * Duplicate tags keep their first occurrence and set
 * \ref DecodeWarnings::DuplicateTag in the result. Decoding is all-or-nothing:
 * \p out is replaced only when every entry resolved.
 */
TiffDecodeResult
decode_directory(std::span<const std::byte> bytes, ByteOrder order,
                 uint64_t offset, const TiffDecodeLimits& limits,
                 Directory* out);

/**
 * \brief Walks the next-offset chain starting at the header's first offset.
 *
 * Only entry counts and next pointers are read. A repeated offset fails
 * \ref TiffDecodeStatus::Malformed at \ref TiffDecodeStage::Chain.
 */
TiffDecodeResult
list_directory_offsets(std::span<const std::byte> bytes,
                       const TiffHeader& header, const TiffDecodeLimits& limits,
                       std::vector<uint64_t>* out);

}  // namespace tiffdir
