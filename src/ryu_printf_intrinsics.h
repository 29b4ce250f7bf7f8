// Copyright 2020 Ulf Adams
// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include <cassert>
#include <cstdint>

#ifndef RYU_PRINTF_ASSERT
#define RYU_PRINTF_ASSERT(X) assert(X)
#endif

namespace ryu_printf {
namespace impl {

// A 192-bit unsigned integer. w0 holds the least significant word.
struct uint64x3 {
    uint64_t w0;
    uint64_t w1;
    uint64_t w2;
};

struct uint64x2 {
    uint64_t hi;
    uint64_t lo;
};

inline uint32_t Lo32(uint64_t x)
{
    return static_cast<uint32_t>(x & 0xFFFFFFFFu);
}

inline uint32_t Hi32(uint64_t x)
{
    return static_cast<uint32_t>(x >> 32);
}

#if defined(__SIZEOF_INT128__)

inline uint64x2 Mul128(uint64_t a, uint64_t b)
{
    __extension__ using uint128_t = unsigned __int128;

    const uint128_t product = uint128_t{a} * b;
    return {static_cast<uint64_t>(product >> 64), static_cast<uint64_t>(product)};
}

#else

inline uint64x2 Mul128(uint64_t a, uint64_t b)
{
    const uint64_t b00 = uint64_t{Lo32(a)} * Lo32(b);
    const uint64_t b01 = uint64_t{Lo32(a)} * Hi32(b);
    const uint64_t b10 = uint64_t{Hi32(a)} * Lo32(b);
    const uint64_t b11 = uint64_t{Hi32(a)} * Hi32(b);

    const uint64_t mid1 = b10 + Hi32(b00);
    const uint64_t mid2 = b01 + Lo32(mid1);

    const uint64_t hi = b11 + Hi32(mid1) + Hi32(mid2);
    const uint64_t lo = Lo32(b00) | uint64_t{Lo32(mid2)} << 32;
    return {hi, lo};
}

#endif

// Returns (hi:lo) >> n.
inline uint64_t ShiftRight128(uint64_t lo, uint64_t hi, int32_t n)
{
    RYU_PRINTF_ASSERT(n >= 0);
    RYU_PRINTF_ASSERT(n <= 63);

    if (n == 0)
        return lo;

    const int32_t lshift = -n & 63;
    const int32_t rshift =  n;
    return (hi << lshift) | (lo >> rshift);
}

// Returns floor(x / 10^9).
inline uint64_t Div1E9(uint64_t x)
{
    // floor(x / 10^9) = floor(floor(x / 2^9) / 5^9)
    // and 0x44B82FA09B5A53 = ceil(2^75 / 5^9) is precise enough for all x < 2^64.
    return Mul128(x >> 9, 0x44B82FA09B5A53u).hi >> 11;
}

inline uint32_t Mod1E9(uint64_t x)
{
    return static_cast<uint32_t>(x - 1000000000 * Div1E9(x));
}

// Returns (hi:lo) mod 10^9.
inline uint32_t Uint128Mod1E9(uint64_t hi, uint64_t lo)
{
    // 2^64 mod 10^9 = 709551616
    const uint64_t r = uint64_t{Mod1E9(hi)} * 709551616u + Mod1E9(lo);
    return Mod1E9(r);
}

// Returns floor(m * mul / 2^j) mod 10^9.
//
// The tables store mul < 10^9 * 2^136 < 2^166 and m has at most 53 + 8 bits, so the shifted
// product has at most 99 bits.
inline uint32_t MulShiftMod1E9(uint64_t m, const uint64x3& mul, int32_t j)
{
    RYU_PRINTF_ASSERT(j >= 128);
    RYU_PRINTF_ASSERT(j <= 180);

    const uint64x2 b0 = Mul128(m, mul.w0); // 0
    const uint64x2 b1 = Mul128(m, mul.w1); // 64
    const uint64x2 b2 = Mul128(m, mul.w2); // 128

    const uint64_t s0hi = b1.lo + b0.hi;   // 64
    const uint64_t c1 = s0hi < b1.lo;
    const uint64_t s1lo = b2.lo + b1.hi + c1; // 128
    const uint64_t c2 = s1lo < b2.lo; // b1.hi + c1 can't overflow
    const uint64_t s1hi = b2.hi + c2;      // 192

    const int32_t dist = j - 128; // [0, 52]
    const uint64_t shifted_hi = s1hi >> dist;
    const uint64_t shifted_lo = ShiftRight128(s1lo, s1hi, dist);
    return Uint128Mod1E9(shifted_hi, shifted_lo);
}

// Returns whether value is divisible by 2^e2
inline bool MultipleOfPow2(uint64_t value, int32_t e2)
{
    RYU_PRINTF_ASSERT(e2 >= 0);
    RYU_PRINTF_ASSERT(e2 <= 63);

    return (value & ((uint64_t{1} << e2) - 1)) == 0;
}

// Returns whether value is divisible by 5^e5
inline bool MultipleOfPow5(uint64_t value, int32_t e5)
{
    struct MulCmp {
        uint64_t mul;
        uint64_t cmp;
    };

    static constexpr MulCmp Mod5[] = {
        {0x0000000000000001u, 0xFFFFFFFFFFFFFFFFu}, // 5^0
        {0xCCCCCCCCCCCCCCCDu, 0x3333333333333333u}, // 5^1
        {0x8F5C28F5C28F5C29u, 0x0A3D70A3D70A3D70u}, // 5^2
        {0x1CAC083126E978D5u, 0x020C49BA5E353F7Cu}, // 5^3
        {0xD288CE703AFB7E91u, 0x0068DB8BAC710CB2u}, // 5^4
        {0x5D4E8FB00BCBE61Du, 0x0014F8B588E368F0u}, // 5^5
        {0x790FB65668C26139u, 0x000431BDE82D7B63u}, // 5^6
        {0xE5032477AE8D46A5u, 0x0000D6BF94D5E57Au}, // 5^7
        {0xC767074B22E90E21u, 0x00002AF31DC46118u}, // 5^8
        {0x8E47CE423A2E9C6Du, 0x0000089705F4136Bu}, // 5^9
        {0x4FA7F60D3ED61F49u, 0x000001B7CDFD9D7Bu}, // 5^10
        {0x0FEE64690C913975u, 0x00000057F5FF85E5u}, // 5^11
        {0x3662E0E1CF503EB1u, 0x000000119799812Du}, // 5^12
        {0xA47A2CF9F6433FBDu, 0x0000000384B84D09u}, // 5^13
        {0x54186F653140A659u, 0x00000000B424DC35u}, // 5^14
        {0x7738164770402145u, 0x0000000024075F3Du}, // 5^15
        {0xE4A4D1417CD9A041u, 0x000000000734ACA5u}, // 5^16
        {0xC75429D9E5C5200Du, 0x000000000170EF54u}, // 5^17
        {0xC1773B91FAC10669u, 0x000000000049C977u}, // 5^18
        {0x26B172506559CE15u, 0x00000000000EC1E4u}, // 5^19
        {0xD489E3A9ADDEC2D1u, 0x000000000002F394u}, // 5^20
        {0x90E860BB892C8D5Du, 0x000000000000971Du}, // 5^21
        {0x502E79BF1B6F4F79u, 0x0000000000001E39u}, // 5^22
        {0xDCD618596BE30FE5u, 0x000000000000060Bu}, // 5^23
        {0x2C2AD1AB7BFA3661u, 0x0000000000000135u}, // 5^24
    };

    RYU_PRINTF_ASSERT(e5 >= 0);

    // 5^23 > 2^53: a nonzero significand cannot be a multiple of larger powers.
    if (e5 > 24)
        return value == 0;

    const auto m5 = Mod5[static_cast<unsigned>(e5)];
    return value * m5.mul <= m5.cmp;
}

} // namespace impl
} // namespace ryu_printf
