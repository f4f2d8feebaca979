#include "tiffdir/mapped_file.h"

#include <limits>

#if defined(_WIN32)
#    define WIN32_LEAN_AND_MEAN
#    include <windows.h>
#else
#    include <fcntl.h>
#    include <sys/mman.h>
#    include <sys/stat.h>
#    include <unistd.h>
#endif

namespace tiffdir {
namespace {

    static MappedFileStatus check_size(uint64_t size,
                                       uint64_t max_file_bytes) noexcept
    {
        if (max_file_bytes != 0U && size > max_file_bytes) {
            return MappedFileStatus::TooLarge;
        }
        if (size > static_cast<uint64_t>(std::numeric_limits<size_t>::max())) {
            return MappedFileStatus::TooLarge;
        }
        return MappedFileStatus::Ok;
    }

}  // namespace

std::string_view
mapped_file_status_name(MappedFileStatus status) noexcept
{
    switch (status) {
    case MappedFileStatus::Ok: return "ok";
    case MappedFileStatus::OpenFailed: return "open_failed";
    case MappedFileStatus::StatFailed: return "stat_failed";
    case MappedFileStatus::TooLarge: return "too_large";
    case MappedFileStatus::MapFailed: return "map_failed";
    }
    return "unknown";
}


MappedFile::~MappedFile() noexcept
{
    release();
}


MappedFile::MappedFile(MappedFile&& other) noexcept
{
    take(other);
}


MappedFile&
MappedFile::operator=(MappedFile&& other) noexcept
{
    if (this != &other) {
        release();
        take(other);
    }
    return *this;
}


void
MappedFile::take(MappedFile& other) noexcept
{
#if defined(_WIN32)
    file_       = other.file_;
    map_        = other.map_;
    other.file_ = nullptr;
    other.map_  = nullptr;
#else
    fd_       = other.fd_;
    other.fd_ = -1;
#endif
    data_       = other.data_;
    size_       = other.size_;
    other.data_ = nullptr;
    other.size_ = 0;
}


MappedFileStatus
MappedFile::open(const char* path, uint64_t max_file_bytes) noexcept
{
    release();
    if (!path || !*path) {
        return MappedFileStatus::OpenFailed;
    }

#if defined(_WIN32)
    HANDLE file = ::CreateFileA(path, GENERIC_READ, FILE_SHARE_READ, nullptr,
                                OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL, nullptr);
    if (file == INVALID_HANDLE_VALUE) {
        return MappedFileStatus::OpenFailed;
    }
    LARGE_INTEGER li;
    if (!::GetFileSizeEx(file, &li) || li.QuadPart < 0) {
        ::CloseHandle(file);
        return MappedFileStatus::StatFailed;
    }
    const uint64_t size = static_cast<uint64_t>(li.QuadPart);
    const MappedFileStatus st = check_size(size, max_file_bytes);
    if (st != MappedFileStatus::Ok) {
        ::CloseHandle(file);
        return st;
    }

    HANDLE map = nullptr;
    if (size != 0U) {
        map = ::CreateFileMappingA(file, nullptr, PAGE_READONLY, 0, 0, nullptr);
        void* view = map ? ::MapViewOfFile(map, FILE_MAP_READ, 0, 0, 0)
                         : nullptr;
        if (!view) {
            if (map) {
                ::CloseHandle(map);
            }
            ::CloseHandle(file);
            return MappedFileStatus::MapFailed;
        }
        data_ = static_cast<const std::byte*>(view);
    }
    file_ = file;
    map_  = map;
    size_ = static_cast<size_t>(size);
#else
    const int fd = ::open(path, O_RDONLY);
    if (fd < 0) {
        return MappedFileStatus::OpenFailed;
    }
    struct stat sb {};
    if (::fstat(fd, &sb) != 0 || sb.st_size < 0) {
        (void)::close(fd);
        return MappedFileStatus::StatFailed;
    }
    const uint64_t size = static_cast<uint64_t>(sb.st_size);
    const MappedFileStatus st = check_size(size, max_file_bytes);
    if (st != MappedFileStatus::Ok) {
        (void)::close(fd);
        return st;
    }

    if (size != 0U) {
        void* view = ::mmap(nullptr, static_cast<size_t>(size), PROT_READ,
                            MAP_PRIVATE, fd, 0);
        if (view == MAP_FAILED) {
            (void)::close(fd);
            return MappedFileStatus::MapFailed;
        }
        data_ = static_cast<const std::byte*>(view);
    }
    fd_   = fd;
    size_ = static_cast<size_t>(size);
#endif
    return MappedFileStatus::Ok;
}


void
MappedFile::close() noexcept
{
    release();
}


void
MappedFile::release() noexcept
{
    void* view = const_cast<void*>(static_cast<const void*>(data_));
#if defined(_WIN32)
    if (view) {
        ::UnmapViewOfFile(view);
    }
    if (map_) {
        ::CloseHandle(static_cast<HANDLE>(map_));
    }
    if (file_) {
        ::CloseHandle(static_cast<HANDLE>(file_));
    }
    file_ = nullptr;
    map_  = nullptr;
#else
    if (view) {
        (void)::munmap(view, size_);
    }
    if (fd_ >= 0) {
        (void)::close(fd_);
    }
    fd_ = -1;
#endif
    data_ = nullptr;
    size_ = 0;
}


bool
MappedFile::is_open() const noexcept
{
#if defined(_WIN32)
    return file_ != nullptr;
#else
    return fd_ >= 0;
#endif
}


std::span<const std::byte>
MappedFile::bytes() const noexcept
{
    if (!data_) {
        return {};
    }
    return std::span<const std::byte>(data_, size_);
}

}  // namespace tiffdir
