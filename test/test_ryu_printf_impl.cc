// ryu_printf_tables.h comes first: it must compile on its own.
#include "ryu_printf_tables.h"
#include "ryu_printf_intrinsics.h"

#include "catch.hpp"

#include <cstdint>
#include <random>

using namespace ryu_printf::impl;

//==================================================================================================
// Intrinsics
//==================================================================================================

TEST_CASE("Div1E9")
{
    CHECK(Div1E9(0) == 0);
    CHECK(Div1E9(999999999) == 0);
    CHECK(Div1E9(1000000000) == 1);
    CHECK(Div1E9(UINT64_MAX) == 18446744073u);
    CHECK(Mod1E9(UINT64_MAX) == 709551615u);

    std::mt19937_64 random(42);
    for (int i = 0; i < 100000; ++i)
    {
        const uint64_t x = random();
        CAPTURE(x);
        CHECK(Div1E9(x) == x / 1000000000);
        CHECK(Mod1E9(x) == x % 1000000000);
    }
}

TEST_CASE("Uint128Mod1E9")
{
    CHECK(Uint128Mod1E9(0, 999999999) == 999999999u);
    CHECK(Uint128Mod1E9(1, 0) == 709551616u);
    CHECK(Uint128Mod1E9(123456789, 987654321) == 128775345u);
    CHECK(Uint128Mod1E9(UINT64_MAX, UINT64_MAX) == 768211455u);
}

TEST_CASE("Mul128")
{
    const uint64x2 p = Mul128(UINT64_MAX, UINT64_MAX);
    CHECK(p.hi == UINT64_MAX - 1);
    CHECK(p.lo == 1);

    const uint64x2 q = Mul128(uint64_t{1} << 63, 6);
    CHECK(q.hi == 3);
    CHECK(q.lo == 0);
}

TEST_CASE("ShiftRight128")
{
    CHECK(ShiftRight128(0x0123456789ABCDEFu, 0xFEDCBA9876543210u, 0) == 0x0123456789ABCDEFu);
    CHECK(ShiftRight128(0x0123456789ABCDEFu, 0xFEDCBA9876543210u, 4) == 0x00123456789ABCDEu);
    CHECK(ShiftRight128(0, 1, 63) == 2);
}

TEST_CASE("MultipleOfPow5")
{
    uint64_t pow5 = 1;
    for (int32_t e = 0; e <= 24; ++e)
    {
        CAPTURE(e);
        CHECK(MultipleOfPow5(pow5, e));
        CHECK(MultipleOfPow5(3 * pow5, e));
        if (e > 0)
        {
            CHECK(!MultipleOfPow5(pow5 + 1, e));
            CHECK(!MultipleOfPow5(pow5 / 5, e));
        }
        pow5 *= 5;
    }

    CHECK(MultipleOfPow5(0, 30));
    CHECK(!MultipleOfPow5(uint64_t{1} << 52, 30));
}

TEST_CASE("MultipleOfPow2")
{
    CHECK(MultipleOfPow2(0, 63));
    CHECK(MultipleOfPow2(1, 0));
    CHECK(MultipleOfPow2(uint64_t{1} << 52, 52));
    CHECK(!MultipleOfPow2(uint64_t{1} << 52, 53));
    CHECK(!MultipleOfPow2(0x30, 5));
}

//==================================================================================================
// Tables
//==================================================================================================

TEST_CASE("FloorLog10Pow2")
{
    CHECK(FloorLog10Pow2(0) == 0);
    CHECK(FloorLog10Pow2(1) == 0);
    CHECK(FloorLog10Pow2(4) == 1);
    CHECK(FloorLog10Pow2(10) == 3);
    CHECK(FloorLog10Pow2(-1) == -1);
    CHECK(FloorLog10Pow2(1074) == 323);
    CHECK(FloorLog10Pow2(-1074) == -324);
}

TEST_CASE("Table layout")
{
    CHECK(PositiveTableSize == 62);
    CHECK(NegativeTableSize == 68);
    CHECK(Pow10PositiveRowCount() == 1153);
    CHECK(Pow10NegativeRowCount() == 3122);

    CHECK(LengthForIndex(0) == 2);
    CHECK(LengthForIndex(61) == 35);
    CHECK(MinBlock(3) == 0);
    CHECK(MinBlock(67) == 34);
    CHECK(NegativeLengthForIndex(67) == 121);

    for (int32_t idx = 0; idx < NegativeTableSize; ++idx)
    {
        CAPTURE(idx);
        const int32_t len = NegativeLengthForIndex(idx);
        CHECK(Pow10Negative(idx, len - 1) != nullptr);
        CHECK(Pow10Negative(idx, len) == nullptr);
    }

    for (int32_t idx = 0; idx < PositiveTableSize; ++idx)
    {
        CAPTURE(idx);
        CHECK(Pow10PositiveOffsets[idx + 1] - Pow10PositiveOffsets[idx] == LengthForIndex(idx));
    }
    for (int32_t idx = 0; idx < NegativeTableSize; ++idx)
    {
        CAPTURE(idx);
        CHECK(Pow10NegativeOffsets[idx + 1] - Pow10NegativeOffsets[idx] == NegativeLengthForIndex(idx) - MinBlock(idx));
    }
}

TEST_CASE("Table rows")
{
    // 2^120 + 1
    const uint64x3& p0 = Pow10Positive(0, 0);
    CHECK(p0.w0 == 1);
    CHECK(p0.w1 == uint64_t{1} << 56);
    CHECK(p0.w2 == 0);

    // 2^1096 + 1 mod 10^9 * 2^136
    const uint64x3& p61 = Pow10Positive(61, 0);
    CHECK(p61.w0 == 1);
    CHECK(p61.w1 == 0);
    CHECK(p61.w2 == 0x367C3A0000u);

    // 10^9 * 2^120
    const uint64x3* n0 = Pow10Negative(0, 0);
    REQUIRE(n0 != nullptr);
    CHECK(n0->w0 == 0);
    CHECK(n0->w1 == 0);
    CHECK(n0->w2 == 0x3B9ACAu);

    // floor(10^315 / 2^952) + 1
    const uint64x3* n67 = Pow10Negative(67, MinBlock(67));
    REQUIRE(n67 != nullptr);
    CHECK(n67->w0 == 0x71D1E34D59759C3Bu);
    CHECK(n67->w1 == 0x54E13CA5u);
    CHECK(n67->w2 == 0);
}

TEST_CASE("MulShiftMod1E9")
{
    // 1.0 = 2^52 * 2^-52
    {
        const uint64_t m = uint64_t{1} << 52;
        const int32_t e2 = -52;
        const int32_t j = Pow10BitsForIndex(0) - e2 + MantissaShift;
        CHECK(MulShiftMod1E9(m << MantissaShift, Pow10Positive(0, 0), j) == 1u);
        CHECK(MulShiftMod1E9(m << MantissaShift, Pow10Positive(0, 1), j) == 0u);
    }

    // 2^60 = 1 152921504 606846976
    {
        const uint64_t m = uint64_t{1} << 52;
        const int32_t e2 = 8;
        const int32_t idx = IndexForExponent(e2);
        const int32_t j = Pow10BitsForIndex(idx) - e2 + MantissaShift;
        CHECK(MulShiftMod1E9(m << MantissaShift, Pow10Positive(idx, 0), j) == 606846976u);
        CHECK(MulShiftMod1E9(m << MantissaShift, Pow10Positive(idx, 1), j) == 152921504u);
        CHECK(MulShiftMod1E9(m << MantissaShift, Pow10Positive(idx, 2), j) == 1u);
    }

    // 0.375 = 3 * 2^-3, fractional block 0 = 375000000
    {
        const uint64_t m = 3;
        const int32_t e2 = -3;
        const int32_t idx = -e2 / 16;
        const int32_t j = MantissaShift + Pow10AdditionalBits + (-e2 - 16 * idx);
        const uint64x3* row = Pow10Negative(idx, 0);
        REQUIRE(row != nullptr);
        CHECK(MulShiftMod1E9(m << MantissaShift, *row, j) == 375000000u);
    }
}
