// Copyright 2020 Ulf Adams
// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "ryu_printf_intrinsics.h"

#include <cstddef>
#include <cstdint>

namespace ryu_printf {
namespace impl {

//==================================================================================================
// Power-of-ten tables
//
// Let m * 2^e2 be the value to be printed.
//
// Positive tables (integer part, e2 >= -52):
//  Bucket idx = ceil(e2 / 16) (or 0 if e2 < 0) contains LengthForIndex(idx) rows, one for each
//  block of 9 decimal digits, starting with the units block (i = 0). Row i holds
//      floor(2^(16 idx + 120) / 10^(9 i)) + 1  mod  10^9 * 2^136
//  and block i is then MulShiftMod1E9(m << 8, row, 16 idx + 120 - e2 + 8).
//
// Negative tables (fractional part, e2 < 0):
//  Bucket idx = floor(-e2 / 16). Block i contains the digits 9 i + 1 ... 9 i + 9 after the decimal
//  point. Row i holds
//      10^(9 (i + 1)) * 2^(120 - 16 idx)                    if 16 idx <= 120
//      floor(10^(9 (i + 1)) / 2^(16 idx - 120)) + 1         otherwise
//  mod 10^9 * 2^136, and block i is MulShiftMod1E9(m << 8, row, 8 + 120 + (-e2 - 16 idx)).
//  Blocks i < MinBlock(idx) are zero for all values in the bucket and are not stored.
//  Blocks i >= NegativeLengthForIndex(idx) are zero since m * 2^e2 has at most -e2 fractional
//  digits.
//
// The rows are written by tools/gen_ryu_printf_tables.cc at build time and compiled into
// ryu_printf_tables.cc as constant data.
//==================================================================================================

constexpr int32_t MantissaShift = 8;
constexpr int32_t Pow10AdditionalBits = 120;

constexpr int32_t MinBinaryExponent = -1074;
constexpr int32_t MaxBinaryExponent =  971;

// Returns floor(log_10(2^e)).
inline int32_t FloorLog10Pow2(int32_t e)
{
    RYU_PRINTF_ASSERT(e >= -2620);
    RYU_PRINTF_ASSERT(e <=  2620);
    return (e * 315653) >> 20;
}

inline int32_t IndexForExponent(int32_t e2)
{
    RYU_PRINTF_ASSERT(e2 >= 0);
    return (e2 + 15) / 16;
}

inline int32_t Pow10BitsForIndex(int32_t idx)
{
    return 16 * idx + Pow10AdditionalBits;
}

// Number of 9-digit blocks required for m * 2^e2 < 2^(53 + 16 idx).
inline int32_t LengthForIndex(int32_t idx)
{
    // +1 for ceil, +16 for mantissa, +8 to round up when dividing by 9
    return (FloorLog10Pow2(16 * idx) + 1 + 16 + 8) / 9;
}

inline int32_t MinBlock(int32_t idx)
{
    // m * 2^e2 < 2^(53 - 16 idx), i.e. the first floor(log_10(2^(16 idx - 53))) digits after the
    // decimal point are zero.
    const int32_t k = 16 * idx - 53;
    return k > 0 ? FloorLog10Pow2(k) / 9 : 0;
}

inline int32_t NegativeLengthForIndex(int32_t idx)
{
    // ceil((16 idx + 15) / 9)
    return (16 * idx + 15 + 8) / 9;
}

constexpr int32_t PositiveTableSize = (MaxBinaryExponent + 15) / 16 + 1;
constexpr int32_t NegativeTableSize = -MinBinaryExponent / 16 + 1;

// Rows of bucket idx are [Pow10PositiveOffsets[idx], Pow10PositiveOffsets[idx + 1]).
extern const int32_t Pow10PositiveOffsets[PositiveTableSize + 1];
extern const uint64x3 Pow10PositiveRows[];

// Rows of bucket idx are [Pow10NegativeOffsets[idx], Pow10NegativeOffsets[idx + 1]), starting
// with block MinBlock(idx).
extern const int32_t Pow10NegativeOffsets[NegativeTableSize + 1];
extern const uint64x3 Pow10NegativeRows[];

inline const uint64x3& Pow10Positive(int32_t idx, int32_t i)
{
    RYU_PRINTF_ASSERT(idx >= 0);
    RYU_PRINTF_ASSERT(idx < PositiveTableSize);
    RYU_PRINTF_ASSERT(i >= 0);
    RYU_PRINTF_ASSERT(i < LengthForIndex(idx));
    return Pow10PositiveRows[Pow10PositiveOffsets[idx] + i];
}

// Returns nullptr if block i (and every block after it) is zero for all values in the bucket.
inline const uint64x3* Pow10Negative(int32_t idx, int32_t i)
{
    RYU_PRINTF_ASSERT(idx >= 0);
    RYU_PRINTF_ASSERT(idx < NegativeTableSize);
    RYU_PRINTF_ASSERT(i >= MinBlock(idx));

    const int32_t p = Pow10NegativeOffsets[idx] + (i - MinBlock(idx));
    if (p >= Pow10NegativeOffsets[idx + 1])
        return nullptr;
    return &Pow10NegativeRows[p];
}

inline size_t Pow10PositiveRowCount()
{
    return static_cast<size_t>(Pow10PositiveOffsets[PositiveTableSize]);
}

inline size_t Pow10NegativeRowCount()
{
    return static_cast<size_t>(Pow10NegativeOffsets[NegativeTableSize]);
}

} // namespace impl
} // namespace ryu_printf
