#include "tiffdir/byte_arena.h"

#include <cstdint>
#include <cstring>

namespace tiffdir {

static uint64_t
align_up_u64(uint64_t value, uint32_t alignment) noexcept
{
    if (alignment <= 1U) {
        return value;
    }
    const uint64_t mask = alignment - 1U;
    return (value + mask) & ~mask;
}


void
ByteArena::clear() noexcept
{
    buffer_.clear();
}


void
ByteArena::reserve(size_t size_bytes)
{
    buffer_.reserve(size_bytes);
}


bool
ByteArena::fits(uint64_t size_bytes, uint32_t alignment) const noexcept
{
    const uint64_t start = align_up_u64(buffer_.size(), alignment);
    return start <= UINT32_MAX && size_bytes <= UINT32_MAX - start;
}


ByteSpan
ByteArena::append(std::span<const std::byte> bytes)
{
    if (!fits(bytes.size(), 1)) {
        return ByteSpan {};
    }
    const uint32_t offset = static_cast<uint32_t>(buffer_.size());
    buffer_.resize(buffer_.size() + bytes.size());
    if (!bytes.empty()) {
        std::memcpy(buffer_.data() + offset, bytes.data(), bytes.size());
    }
    return ByteSpan { offset, static_cast<uint32_t>(bytes.size()) };
}


ByteSpan
ByteArena::allocate(uint32_t size_bytes, uint32_t alignment)
{
    if (!fits(size_bytes, alignment)) {
        return ByteSpan {};
    }
    const uint32_t start = static_cast<uint32_t>(
        align_up_u64(buffer_.size(), alignment));
    buffer_.resize(static_cast<size_t>(start) + size_bytes, std::byte { 0 });
    return ByteSpan { start, size_bytes };
}


size_t
ByteArena::size() const noexcept
{
    return buffer_.size();
}


std::span<const std::byte>
ByteArena::span(ByteSpan view) const noexcept
{
    if (view.offset > buffer_.size()) {
        return std::span<const std::byte>();
    }
    const size_t end = static_cast<size_t>(view.offset) + view.size;
    if (end > buffer_.size()) {
        return std::span<const std::byte>();
    }
    return std::span<const std::byte>(buffer_.data() + view.offset,
                                      view.size);
}


std::span<std::byte>
ByteArena::span_mut(ByteSpan view) noexcept
{
    if (view.offset > buffer_.size()) {
        return std::span<std::byte>();
    }
    const size_t end = static_cast<size_t>(view.offset) + view.size;
    if (end > buffer_.size()) {
        return std::span<std::byte>();
    }
    return std::span<std::byte>(buffer_.data() + view.offset, view.size);
}

}  // namespace tiffdir
