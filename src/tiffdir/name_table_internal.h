#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace tiffdir::names_internal {

struct NameEntry final {
    uint16_t id      = 0;
    const char* name = nullptr;
};

/// Binary search over a table sorted by id.
template<size_t N>
std::string_view
find_name(const NameEntry (&table)[N], uint16_t id) noexcept
{
    size_t lo = 0;
    size_t hi = N;
    while (lo < hi) {
        const size_t mid = lo + (hi - lo) / 2;
        if (table[mid].id < id) {
            lo = mid + 1;
        } else {
            hi = mid;
        }
    }
    if (lo < N && table[lo].id == id && table[lo].name) {
        return table[lo].name;
    }
    return {};
}

}  // namespace tiffdir::names_internal
