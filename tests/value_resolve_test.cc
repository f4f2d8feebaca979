#include "tiffdir/value_resolve.h"

#include "tiffdir/directory_decode.h"
#include "tiffdir/tiff_tags.h"
#include "tiff_test_util.h"

#include <gtest/gtest.h>

#include <array>
#include <bit>
#include <cstdint>
#include <string_view>
#include <vector>

namespace tiffdir {
namespace {

    using test::append_u16;
    using test::append_u32;

    static RawEntry make_entry(uint16_t tag, uint16_t type, uint32_t count,
                               const std::vector<std::byte>& field)
    {
        RawEntry e;
        e.tag   = tag;
        e.type  = type;
        e.count = count;
        for (size_t i = 0; i < e.value_field.size() && i < field.size(); ++i) {
            e.value_field[i] = field[i];
        }
        return e;
    }


    TEST(ValueResolve, ImageWidthShortResolvesToSingleValue)
    {
        std::vector<std::byte> field;
        append_u16(&field, ByteOrder::Little, 100);
        const RawEntry e = make_entry(tags::kImageWidth,
                                      3, 1, field);

        ByteArena arena;
        TiffValue v;
        const TiffDecodeResult r = resolve_entry_value(
            {}, ByteOrder::Little, e, TiffDecodeLimits {}, arena, &v);
        ASSERT_TRUE(r.ok());
        EXPECT_EQ(v.type, TiffType::Short);
        ASSERT_EQ(v.count, 1U);
        uint32_t width = 0;
        ASSERT_TRUE(value_u32(arena, v, 0, &width));
        EXPECT_EQ(width, 100U);
        EXPECT_FALSE(value_u32(arena, v, 1, &width));
    }


    TEST(ValueResolve, InlineBoundaryLongAndShortPair)
    {
        for (const ByteOrder order : { ByteOrder::Little, ByteOrder::Big }) {
            // One LONG and two SHORTs both occupy exactly 4 bytes.
            std::vector<std::byte> long_field;
            append_u32(&long_field, order, 0x00020001U);
            std::vector<std::byte> short_field;
            if (order == ByteOrder::Little) {
                append_u16(&short_field, order, 0x0001);
                append_u16(&short_field, order, 0x0002);
            } else {
                append_u16(&short_field, order, 0x0002);
                append_u16(&short_field, order, 0x0001);
            }
            EXPECT_EQ(long_field, short_field);

            ValueLocation long_loc;
            ValueLocation short_loc;
            ASSERT_TRUE(locate_entry_value(order,
                                           make_entry(1, 4, 1,
                                                      long_field),
                                           &long_loc)
                            .ok());
            ASSERT_TRUE(locate_entry_value(order,
                                           make_entry(2, 3, 2,
                                                      short_field),
                                           &short_loc)
                            .ok());
            EXPECT_TRUE(long_loc.inline_value);
            EXPECT_TRUE(short_loc.inline_value);
            EXPECT_EQ(long_loc.total_bytes, 4U);
            EXPECT_EQ(short_loc.total_bytes, 4U);

            ByteArena arena;
            TiffValue lv;
            TiffValue sv;
            ASSERT_TRUE(resolve_entry_value({}, order,
                                            make_entry(1, 4, 1,
                                                       long_field),
                                            TiffDecodeLimits {}, arena, &lv)
                            .ok());
            ASSERT_TRUE(resolve_entry_value({}, order,
                                            make_entry(2, 3, 2,
                                                       short_field),
                                            TiffDecodeLimits {}, arena, &sv)
                            .ok());
            uint32_t l = 0;
            ASSERT_TRUE(value_u32(arena, lv, 0, &l));
            EXPECT_EQ(l, 0x00020001U);

            // Same 4 bytes, read as two SHORTs in file order.
            const uint32_t first  = order == ByteOrder::Little ? 1U : 2U;
            const uint32_t second = order == ByteOrder::Little ? 2U : 1U;
            uint32_t s0 = 0;
            uint32_t s1 = 0;
            EXPECT_EQ(sv.count, 2U);
            ASSERT_TRUE(value_u32(arena, sv, 0, &s0));
            ASSERT_TRUE(value_u32(arena, sv, 1, &s1));
            EXPECT_EQ(s0, first);
            EXPECT_EQ(s1, second);
            EXPECT_FALSE(value_u32(arena, sv, 2, &s0));
        }
    }


    TEST(ValueResolve, InlineAndOffsetPathsDecodeIdentically)
    {
        for (const ByteOrder order : { ByteOrder::Little, ByteOrder::Big }) {
            // Two SHORTs inline vs. three SHORTs out of line: the shared
            // prefix must decode to the same values.
            test::TiffBuilder b(order);
            b.add_shorts(tags::kBitsPerSample, { 8, 16 });
            b.add_shorts(tags::kSampleFormat, { 8, 16, 1 });
            b.add_longs(tags::kStripOffsets, { 7 });
            b.add_longs(tags::kStripByteCounts, { 7, 9 });
            const std::vector<std::byte> bytes = b.build();

            Directory dir;
            ASSERT_TRUE(decode_directory(bytes, order, 8, TiffDecodeLimits {},
                                         &dir)
                            .ok());

            std::vector<uint32_t> inline_vals;
            std::vector<uint32_t> offset_vals;
            ASSERT_TRUE(dir.values_u32(tags::kBitsPerSample, &inline_vals));
            ASSERT_TRUE(dir.values_u32(tags::kSampleFormat, &offset_vals));
            ASSERT_EQ(inline_vals.size(), 2U);
            ASSERT_EQ(offset_vals.size(), 3U);
            EXPECT_EQ(inline_vals[0], offset_vals[0]);
            EXPECT_EQ(inline_vals[1], offset_vals[1]);

            std::vector<uint32_t> one;
            std::vector<uint32_t> two;
            ASSERT_TRUE(dir.values_u32(tags::kStripOffsets, &one));
            ASSERT_TRUE(dir.values_u32(tags::kStripByteCounts, &two));
            EXPECT_EQ(one[0], two[0]);
        }
    }


    TEST(ValueResolve, CountTimesWidthOverflow)
    {
        std::vector<std::byte> field;
        append_u32(&field, ByteOrder::Little, 8);
        // 0x20000000 DOUBLEs is 4 GiB.
        const RawEntry e = make_entry(1, 12, 0x20000000U,
                                      field);

        ValueLocation loc;
        const TiffDecodeResult r = locate_entry_value(ByteOrder::Little, e,
                                                      &loc);
        EXPECT_EQ(r.status, TiffDecodeStatus::Overflow);
        EXPECT_EQ(r.stage, TiffDecodeStage::Value);
        EXPECT_EQ(r.tag, 1U);
    }


    TEST(ValueResolve, TypeCodesOutsideTableAreRejected)
    {
        for (const uint16_t type : { 0, 13, 16, 0xFFFF }) {
            const RawEntry e = make_entry(700, type, 1, {});
            ByteArena arena;
            TiffValue v;
            const TiffDecodeResult r = resolve_entry_value(
                {}, ByteOrder::Little, e, TiffDecodeLimits {}, arena, &v);
            EXPECT_EQ(r.status, TiffDecodeStatus::UnsupportedType);
            EXPECT_EQ(r.tag, 700U);
        }
    }


    TEST(ValueResolve, OutOfLineRangeMustFitSource)
    {
        std::vector<std::byte> source(32, std::byte { 0 });
        std::vector<std::byte> field;
        append_u32(&field, ByteOrder::Little, 28);
        // 4 LONGs = 16 bytes at offset 28 of a 32 byte source.
        const RawEntry e = make_entry(273, 4, 4, field);

        ByteArena arena;
        TiffValue v;
        const TiffDecodeResult r = resolve_entry_value(
            source, ByteOrder::Little, e, TiffDecodeLimits {}, arena, &v);
        EXPECT_EQ(r.status, TiffDecodeStatus::Truncated);
        EXPECT_EQ(r.offset, 28U);
    }


    TEST(ValueResolve, ValueByteLimit)
    {
        std::vector<std::byte> source(64, std::byte { 0 });
        std::vector<std::byte> field;
        append_u32(&field, ByteOrder::Little, 8);
        const RawEntry e = make_entry(273, 1, 40, field);

        TiffDecodeLimits limits;
        limits.max_value_bytes = 32;
        ByteArena arena;
        TiffValue v;
        EXPECT_EQ(resolve_entry_value(source, ByteOrder::Little, e, limits,
                                      arena, &v)
                      .status,
                  TiffDecodeStatus::LimitExceeded);
    }


    TEST(ValueResolve, RationalsFloatsAndSignedValues)
    {
        test::TiffBuilder b(ByteOrder::Big);
        b.add_rationals(tags::kXResolution, { { 300, 1 }, { 1, 0 } });
        b.add_doubles(tags::kModelPixelScale, { 0.5, -2.25 });
        std::vector<std::byte> f;
        append_u32(&f, ByteOrder::Big, std::bit_cast<uint32_t>(1.5f));
        b.add_raw(1000, static_cast<uint16_t>(TiffType::Float), 1, f);
        std::vector<std::byte> s;
        append_u16(&s, ByteOrder::Big, 0xFFFE);
        b.add_raw(1001, static_cast<uint16_t>(TiffType::SShort), 1, s);
        std::vector<std::byte> sr;
        append_u32(&sr, ByteOrder::Big, static_cast<uint32_t>(-3));
        append_u32(&sr, ByteOrder::Big, 4);
        b.add_raw(1002, static_cast<uint16_t>(TiffType::SRational), 1, sr);
        const std::vector<std::byte> bytes = b.build();

        Directory dir;
        ASSERT_TRUE(decode_directory(bytes, ByteOrder::Big, 8,
                                     TiffDecodeLimits {}, &dir)
                        .ok());
        const ByteArena& arena = dir.arena();

        const TiffField* res = dir.find(tags::kXResolution);
        ASSERT_NE(res, nullptr);
        URational ur;
        ASSERT_TRUE(value_urational(arena, res->value, 0, &ur));
        EXPECT_EQ(ur.numer, 300U);
        EXPECT_EQ(ur.denom, 1U);
        double d = 0.0;
        ASSERT_TRUE(value_f64(arena, res->value, 0, &d));
        EXPECT_DOUBLE_EQ(d, 300.0);
        // Zero denominator does not convert.
        EXPECT_FALSE(value_f64(arena, res->value, 1, &d));

        std::vector<double> scale;
        ASSERT_TRUE(dir.values_f64(tags::kModelPixelScale, &scale));
        ASSERT_EQ(scale.size(), 2U);
        EXPECT_DOUBLE_EQ(scale[0], 0.5);
        EXPECT_DOUBLE_EQ(scale[1], -2.25);

        const TiffField* fl = dir.find(1000);
        ASSERT_NE(fl, nullptr);
        ASSERT_TRUE(value_f64(arena, fl->value, 0, &d));
        EXPECT_DOUBLE_EQ(d, 1.5);

        const TiffField* ss = dir.find(1001);
        ASSERT_NE(ss, nullptr);
        int64_t i = 0;
        ASSERT_TRUE(value_i64(arena, ss->value, 0, &i));
        EXPECT_EQ(i, -2);
        uint64_t u = 0;
        EXPECT_FALSE(value_u64(arena, ss->value, 0, &u));

        const TiffField* srf = dir.find(1002);
        ASSERT_NE(srf, nullptr);
        SRational srv;
        ASSERT_TRUE(value_srational(arena, srf->value, 0, &srv));
        EXPECT_EQ(srv.numer, -3);
        EXPECT_EQ(srv.denom, 4);
        ASSERT_TRUE(value_f64(arena, srf->value, 0, &d));
        EXPECT_DOUBLE_EQ(d, -0.75);
    }


    TEST(ValueResolve, AsciiRuns)
    {
        test::TiffBuilder b;
        std::vector<std::byte> p;
        for (const char c : std::string_view("one\0two\0three", 13)) {
            p.push_back(std::byte { static_cast<uint8_t>(c) });
        }
        b.add_raw(tags::kSoftware, static_cast<uint16_t>(TiffType::Ascii),
                  static_cast<uint32_t>(p.size()), p);
        const std::vector<std::byte> bytes = b.build();

        Directory dir;
        ASSERT_TRUE(decode_directory(bytes, ByteOrder::Little, 8,
                                     TiffDecodeLimits {}, &dir)
                        .ok());
        const TiffField* f = dir.find(tags::kSoftware);
        ASSERT_NE(f, nullptr);

        std::vector<std::string_view> runs;
        value_ascii_runs(dir.arena(), f->value, &runs);
        ASSERT_EQ(runs.size(), 3U);
        EXPECT_EQ(runs[0], "one");
        EXPECT_EQ(runs[1], "two");
        EXPECT_EQ(runs[2], "three");

        std::string_view first;
        ASSERT_TRUE(dir.ascii(tags::kSoftware, &first));
        EXPECT_EQ(first, "one");
    }


    TEST(ValueResolve, ArenaRefusesSpansPastOffsetSpace)
    {
        ByteArena arena;
        EXPECT_TRUE(arena.fits(UINT32_MAX, 1));
        EXPECT_FALSE(arena.fits(static_cast<uint64_t>(UINT32_MAX) + 1U, 1));

        const std::array<std::byte, 3> three {};
        const ByteSpan head = arena.append(three);
        EXPECT_EQ(head.size, 3U);
        EXPECT_TRUE(arena.fits(UINT32_MAX - 3U, 1));
        EXPECT_FALSE(arena.fits(UINT32_MAX - 2U, 1));
        // Alignment padding counts against the offset space.
        EXPECT_FALSE(arena.fits(UINT32_MAX - 3U, 8));

        const ByteSpan refused = arena.allocate(UINT32_MAX - 2U, 1);
        EXPECT_EQ(refused.size, 0U);
        EXPECT_EQ(refused.offset, 0U);
        EXPECT_EQ(arena.size(), 3U);

        const ByteSpan next = arena.allocate(4, 4);
        EXPECT_EQ(next.offset, 4U);
        EXPECT_EQ(next.size, 4U);
    }

}  // namespace
}  // namespace tiffdir
