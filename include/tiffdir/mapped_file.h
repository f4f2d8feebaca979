#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

/**
 * \file mapped_file.h
 * \brief Read-only whole-file mapping used as a decode source.
 */

namespace tiffdir {

enum class MappedFileStatus : uint8_t {
    Ok,
    OpenFailed,
    StatFailed,
    TooLarge,
    MapFailed,
};

std::string_view
mapped_file_status_name(MappedFileStatus status) noexcept;

/**
 * \brief Maps a file read-only and exposes it as a byte span.
 *
 * The decoders only need "read N bytes at offset", so a mapping and an
 * in-memory buffer are interchangeable sources. An empty file maps to an
 * empty span.
 */
class MappedFile final {
public:
    MappedFile() noexcept = default;
    ~MappedFile() noexcept;

    MappedFile(const MappedFile&)            = delete;
    MappedFile& operator=(const MappedFile&) = delete;

    MappedFile(MappedFile&& other) noexcept;
    MappedFile& operator=(MappedFile&& other) noexcept;

    /// Maps \p path. Files above \p max_file_bytes fail (0 = no cap).
    MappedFileStatus open(const char* path,
                          uint64_t max_file_bytes = 0) noexcept;
    void close() noexcept;

    bool is_open() const noexcept;
    std::span<const std::byte> bytes() const noexcept;

private:
    void release() noexcept;
    void take(MappedFile& other) noexcept;

#if defined(_WIN32)
    void* file_ = nullptr;
    void* map_  = nullptr;
#else
    int fd_ = -1;
#endif
    const std::byte* data_ = nullptr;
    size_t size_           = 0;
};

}  // namespace tiffdir
