#include "tiffdir/directory.h"

namespace tiffdir {

ByteOrder
Directory::byte_order() const noexcept
{
    return order_;
}


uint64_t
Directory::offset() const noexcept
{
    return offset_;
}


uint32_t
Directory::next_offset() const noexcept
{
    return next_offset_;
}


std::span<const TiffField>
Directory::fields() const noexcept
{
    return std::span<const TiffField>(fields_.data(), fields_.size());
}


std::span<const uint16_t>
Directory::duplicate_tags() const noexcept
{
    return std::span<const uint16_t>(duplicates_.data(), duplicates_.size());
}


size_t
Directory::lower_bound(uint16_t tag) const noexcept
{
    size_t lo = 0;
    size_t hi = by_tag_.size();
    while (lo < hi) {
        const size_t mid = lo + ((hi - lo) / 2U);
        if (fields_[by_tag_[mid]].tag < tag) {
            lo = mid + 1U;
        } else {
            hi = mid;
        }
    }
    return lo;
}


const TiffField*
Directory::find(uint16_t tag) const noexcept
{
    const size_t i = lower_bound(tag);
    if (i < by_tag_.size() && fields_[by_tag_[i]].tag == tag) {
        return &fields_[by_tag_[i]];
    }
    return nullptr;
}


bool
Directory::has(uint16_t tag) const noexcept
{
    return find(tag) != nullptr;
}


bool
Directory::first_u32(uint16_t tag, uint32_t* out) const noexcept
{
    const TiffField* f = find(tag);
    if (!f) {
        return false;
    }
    return value_u32(arena_, f->value, 0, out);
}


bool
Directory::values_u32(uint16_t tag, std::vector<uint32_t>* out) const
{
    out->clear();
    const TiffField* f = find(tag);
    if (!f) {
        return false;
    }
    out->reserve(f->value.count);
    for (uint32_t i = 0; i < f->value.count; ++i) {
        uint32_t v = 0;
        if (!value_u32(arena_, f->value, i, &v)) {
            out->clear();
            return false;
        }
        out->push_back(v);
    }
    return true;
}


bool
Directory::values_f64(uint16_t tag, std::vector<double>* out) const
{
    out->clear();
    const TiffField* f = find(tag);
    if (!f) {
        return false;
    }
    out->reserve(f->value.count);
    for (uint32_t i = 0; i < f->value.count; ++i) {
        double v = 0.0;
        if (!value_f64(arena_, f->value, i, &v)) {
            out->clear();
            return false;
        }
        out->push_back(v);
    }
    return true;
}


bool
Directory::ascii(uint16_t tag, std::string_view* out) const noexcept
{
    const TiffField* f = find(tag);
    if (!f || f->value.type != TiffType::Ascii) {
        return false;
    }
    const std::string_view text = value_text(arena_, f->value);
    const size_t nul            = text.find('\0');
    *out = (nul == std::string_view::npos) ? text : text.substr(0, nul);
    return true;
}


ByteArena&
Directory::arena() noexcept
{
    return arena_;
}


const ByteArena&
Directory::arena() const noexcept
{
    return arena_;
}


void
Directory::set_location(ByteOrder order, uint64_t offset,
                        uint32_t next_offset) noexcept
{
    order_       = order;
    offset_      = offset;
    next_offset_ = next_offset;
}


void
Directory::add_field(const TiffField& field)
{
    const size_t i = lower_bound(field.tag);
    if (i < by_tag_.size() && fields_[by_tag_[i]].tag == field.tag) {
        return;
    }
    const uint32_t id = static_cast<uint32_t>(fields_.size());
    fields_.push_back(field);
    by_tag_.insert(by_tag_.begin() + static_cast<std::ptrdiff_t>(i), id);
}


void
Directory::add_duplicate(uint16_t tag)
{
    duplicates_.push_back(tag);
}

}  // namespace tiffdir
