#include "tiffdir/directory_decode.h"

#include "tiffdir/value_resolve.h"

#include <algorithm>
#include <cstring>
#include <utility>

namespace tiffdir {
namespace {

    struct DirectoryExtent final {
        uint16_t entry_count = 0;
        uint32_t next_offset = 0;
    };

    // Reads the entry count and next pointer of a directory, checking that the
    // whole `2 + 12*N + 4` byte range is inside the source.
    static TiffDecodeResult read_extent(std::span<const std::byte> bytes,
                                        ByteOrder order, uint64_t offset,
                                        const TiffDecodeLimits& limits,
                                        DirectoryExtent* out) noexcept
    {
        DirectoryExtent ext;
        if (!read_u16(order, bytes, offset, &ext.entry_count)) {
            return decode_error(TiffDecodeStatus::Truncated,
                                TiffDecodeStage::Directory, 0, offset);
        }
        if (limits.max_entries_per_directory != 0U
            && ext.entry_count > limits.max_entries_per_directory) {
            return decode_error(TiffDecodeStatus::LimitExceeded,
                                TiffDecodeStage::Directory, 0, offset);
        }
        const uint64_t size = directory_byte_size(ext.entry_count);
        if (!range_in_bounds(bytes, offset, size)) {
            return decode_error(TiffDecodeStatus::Truncated,
                                TiffDecodeStage::Directory, 0, offset);
        }
        if (!read_u32(order, bytes, offset + size - 4U, &ext.next_offset)) {
            return decode_error(TiffDecodeStatus::Truncated,
                                TiffDecodeStage::Directory, 0, offset);
        }
        *out = ext;
        return decode_ok(TiffDecodeStage::Directory);
    }

}  // namespace

TiffDecodeResult
read_raw_directory(std::span<const std::byte> bytes, ByteOrder order,
                   uint64_t offset, const TiffDecodeLimits& limits,
                   RawDirectory* out)
{
    DirectoryExtent ext;
    const TiffDecodeResult r = read_extent(bytes, order, offset, limits, &ext);
    if (!r.ok()) {
        return r;
    }

    RawDirectory raw;
    raw.offset      = offset;
    raw.next_offset = ext.next_offset;
    raw.entries.resize(ext.entry_count);
    for (uint32_t i = 0; i < ext.entry_count; ++i) {
        const uint64_t eoff = offset + 2U
                              + static_cast<uint64_t>(i) * kDirectoryEntrySize;
        RawEntry& e = raw.entries[i];
        if (!read_u16(order, bytes, eoff + 0, &e.tag)
            || !read_u16(order, bytes, eoff + 2, &e.type)
            || !read_u32(order, bytes, eoff + 4, &e.count)) {
            return decode_error(TiffDecodeStatus::Truncated,
                                TiffDecodeStage::Directory, 0, eoff);
        }
        std::memcpy(e.value_field.data(), bytes.data() + eoff + 8,
                    e.value_field.size());
    }

    *out = std::move(raw);
    return decode_ok(TiffDecodeStage::Directory);
}


TiffDecodeResult
decode_directory(std::span<const std::byte> bytes, ByteOrder order,
                 uint64_t offset, const TiffDecodeLimits& limits,
                 Directory* out)
{
    RawDirectory raw;
    const TiffDecodeResult r = read_raw_directory(bytes, order, offset, limits,
                                                  &raw);
    if (!r.ok()) {
        return r;
    }

    TiffDecodeResult result = decode_ok(TiffDecodeStage::Directory);
    result.offset           = offset;

    Directory dir;
    dir.set_location(order, offset, raw.next_offset);
    for (uint32_t i = 0; i < static_cast<uint32_t>(raw.entries.size()); ++i) {
        const RawEntry& e = raw.entries[i];
        if (dir.has(e.tag)) {
            dir.add_duplicate(e.tag);
            result.warnings |= DecodeWarnings::DuplicateTag;
            continue;
        }

        TiffField field;
        field.tag   = e.tag;
        field.order = i;
        const TiffDecodeResult vr = resolve_entry_value(bytes, order, e, limits,
                                                        dir.arena(),
                                                        &field.value);
        if (!vr.ok()) {
            return vr;
        }
        if (limits.max_directory_bytes != 0U
            && dir.arena().size() > limits.max_directory_bytes) {
            return decode_error(TiffDecodeStatus::LimitExceeded,
                                TiffDecodeStage::Directory, e.tag, offset);
        }
        dir.add_field(field);
    }

    *out = std::move(dir);
    return result;
}


TiffDecodeResult
list_directory_offsets(std::span<const std::byte> bytes,
                       const TiffHeader& header, const TiffDecodeLimits& limits,
                       std::vector<uint64_t>* out)
{
    std::vector<uint64_t> offsets;
    uint64_t next = header.first_offset;
    while (next != 0U) {
        if (std::find(offsets.begin(), offsets.end(), next) != offsets.end()) {
            return decode_error(TiffDecodeStatus::Malformed,
                                TiffDecodeStage::Chain, 0, next);
        }
        if (limits.max_directories != 0U
            && offsets.size() >= limits.max_directories) {
            return decode_error(TiffDecodeStatus::LimitExceeded,
                                TiffDecodeStage::Chain, 0, next);
        }

        DirectoryExtent ext;
        const TiffDecodeResult r = read_extent(bytes, header.order, next,
                                               limits, &ext);
        if (!r.ok()) {
            return r;
        }
        offsets.push_back(next);
        next = ext.next_offset;
    }

    *out = std::move(offsets);
    return decode_ok(TiffDecodeStage::Chain);
}

}  // namespace tiffdir
