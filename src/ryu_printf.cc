// Copyright 2020 Ulf Adams
// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "ryu_printf.h"
#include "ryu_printf_intrinsics.h"
#include "ryu_printf_tables.h"

#include <algorithm>
#include <cstring>
#include <limits>

using namespace ryu_printf::impl;

//==================================================================================================
//
//==================================================================================================

template <typename Dest, typename Source>
static inline Dest ReinterpretBits(Source source)
{
    static_assert(sizeof(Dest) == sizeof(Source), "size mismatch");

    Dest dest;
    std::memcpy(&dest, &source, sizeof(Source));
    return dest;
}

namespace {
struct Double
{
    static_assert(std::numeric_limits<double>::is_iec559
               && std::numeric_limits<double>::digits == 53
               && std::numeric_limits<double>::max_exponent == 1024,
        "IEEE-754 double-precision implementation required");

    using value_type = double;
    using bits_type = uint64_t;

    static constexpr int32_t   SignificandSize = std::numeric_limits<value_type>::digits; // = p   (includes the hidden bit)
    static constexpr int32_t   ExponentBias    = std::numeric_limits<value_type>::max_exponent - 1 + (SignificandSize - 1);
    static constexpr int32_t   MaxIeeeExponent = 2 * std::numeric_limits<value_type>::max_exponent - 1;
    static constexpr bits_type HiddenBit       = bits_type{1} << (SignificandSize - 1);   // = 2^(p-1)
    static constexpr bits_type SignificandMask = HiddenBit - 1;                           // = 2^(p-1) - 1
    static constexpr bits_type ExponentMask    = bits_type{MaxIeeeExponent} << (SignificandSize - 1);
    static constexpr bits_type SignMask        = ~(~bits_type{0} >> 1);

    bits_type bits;

    explicit Double(bits_type bits_) : bits(bits_) {}
    explicit Double(value_type value) : bits(ReinterpretBits<bits_type>(value)) {}

    bits_type PhysicalSignificand() const {
        return bits & SignificandMask;
    }

    bits_type PhysicalExponent() const {
        return (bits & ExponentMask) >> (SignificandSize - 1);
    }

    bool IsInf() const {
        return (bits & ExponentMask) == ExponentMask && (bits & SignificandMask) == 0;
    }

    bool IsNaN() const {
        return (bits & ExponentMask) == ExponentMask && (bits & SignificandMask) != 0;
    }

    bool SignBit() const {
        return (bits & SignMask) != 0;
    }
};
} // namespace

//==================================================================================================
// Decode
//==================================================================================================

namespace {
struct DecodedValue {
    uint64_t mantissa; // value = mantissa * 2^exponent
    int32_t exponent;
};
}

static inline DecodedValue Decode(uint64_t ieee_mantissa, uint32_t ieee_exponent)
{
    RYU_PRINTF_ASSERT(ieee_mantissa <= Double::SignificandMask);
    RYU_PRINTF_ASSERT(ieee_exponent < static_cast<uint32_t>(Double::MaxIeeeExponent));

    if (ieee_exponent == 0)
    {
        // subnormal or zero
        return {ieee_mantissa, 1 - Double::ExponentBias};
    }

    return {Double::HiddenBit | ieee_mantissa, static_cast<int32_t>(ieee_exponent) - Double::ExponentBias};
}

//==================================================================================================
// Digits
//==================================================================================================

static inline void Utoa_2Digits(char* buf, uint32_t digits)
{
    static constexpr char Digits100[200] = {
        '0','0','0','1','0','2','0','3','0','4','0','5','0','6','0','7','0','8','0','9',
        '1','0','1','1','1','2','1','3','1','4','1','5','1','6','1','7','1','8','1','9',
        '2','0','2','1','2','2','2','3','2','4','2','5','2','6','2','7','2','8','2','9',
        '3','0','3','1','3','2','3','3','3','4','3','5','3','6','3','7','3','8','3','9',
        '4','0','4','1','4','2','4','3','4','4','4','5','4','6','4','7','4','8','4','9',
        '5','0','5','1','5','2','5','3','5','4','5','5','5','6','5','7','5','8','5','9',
        '6','0','6','1','6','2','6','3','6','4','6','5','6','6','6','7','6','8','6','9',
        '7','0','7','1','7','2','7','3','7','4','7','5','7','6','7','7','7','8','7','9',
        '8','0','8','1','8','2','8','3','8','4','8','5','8','6','8','7','8','8','8','9',
        '9','0','9','1','9','2','9','3','9','4','9','5','9','6','9','7','9','8','9','9',
    };

    RYU_PRINTF_ASSERT(digits <= 99);
    std::memcpy(buf, &Digits100[2 * digits], 2 * sizeof(char));
}

// Writes the last count decimal digits of digits into [last - count, last).
// Returns the remaining (leading) digits.
static inline uint32_t PrintDigitsBackwards(char* last, uint32_t digits, int32_t count)
{
    for (; count >= 2; count -= 2)
    {
        const uint32_t q = digits / 100;
        const uint32_t r = digits % 100;
        digits = q;
        last -= 2;
        Utoa_2Digits(last, r);
    }

    if (count > 0)
    {
        const uint32_t q = digits / 10;
        const uint32_t r = digits % 10;
        digits = q;
        *--last = static_cast<char>('0' + r);
    }

    return digits;
}

static inline int32_t DecimalLength9(uint32_t v)
{
    RYU_PRINTF_ASSERT(v >= 1);
    RYU_PRINTF_ASSERT(v <= 999999999u);

    if (v >= 100000000u) { return 9; }
    if (v >= 10000000u) { return 8; }
    if (v >= 1000000u) { return 7; }
    if (v >= 100000u) { return 6; }
    if (v >= 10000u) { return 5; }
    if (v >= 1000u) { return 4; }
    if (v >= 100u) { return 3; }
    if (v >= 10u) { return 2; }
    return 1;
}

// Reserves count characters at the end of the buffer and returns a pointer past the new end.
static inline char* Grow(std::string& buffer, int32_t count)
{
    RYU_PRINTF_ASSERT(count >= 0);

    buffer.resize(buffer.size() + static_cast<size_t>(count));
    return &buffer[0] + buffer.size();
}

// Appends the last count decimal digits of digits, including leading zeros.
static inline void AppendDigits(std::string& buffer, uint32_t digits, int32_t count)
{
    PrintDigitsBackwards(Grow(buffer, count), digits, count);
}

static inline void AppendZeros(std::string& buffer, int32_t count)
{
    RYU_PRINTF_ASSERT(count >= 0);
    buffer.append(static_cast<size_t>(count), '0');
}

// Appends the length decimal digits of digits, with a decimal point after the first digit.
static inline void AppendLeadingDigits(std::string& buffer, uint32_t digits, int32_t length, bool print_decimal_point, char decimal_point)
{
    RYU_PRINTF_ASSERT(length >= 1);

    if (print_decimal_point)
    {
        char* const last = Grow(buffer, length + 1);
        const uint32_t lead = PrintDigitsBackwards(last, digits, length - 1);
        RYU_PRINTF_ASSERT(lead <= 9);
        last[-length] = decimal_point;
        last[-length - 1] = static_cast<char>('0' + lead);
    }
    else
    {
        RYU_PRINTF_ASSERT(length == 1);
        RYU_PRINTF_ASSERT(digits <= 9);
        buffer.push_back(static_cast<char>('0' + digits));
    }
}

static inline bool IsDigit(char c)
{
    return c >= '0' && c <= '9';
}

// Removes the last count decimal digits from digits.
// Returns the most significant of the removed digits.
static inline uint32_t RemoveTrailingDigits(uint32_t& digits, int32_t count)
{
    uint32_t removed = 0;
    for (; count > 0; --count)
    {
        const uint32_t q = digits / 10;
        removed = digits - 10 * q;
        digits = q;
    }
    return removed;
}

//==================================================================================================
// Rounding
//==================================================================================================

namespace {
enum class RoundingMode {
    Down,
    Up,
    UpIfOdd, // exact tie: round half to even
};
}

// Returns whether m * 2^(e2 + e10) is an integer.
// Combined with MultipleOfPow5(m, -e10) for e10 < 0 this tests whether m * 2^e2 * 10^e10 is an
// integer.
static inline bool HasTrailingZeros(int32_t e2, int32_t e10, uint64_t m)
{
    const int32_t required_twos = -e2 - e10;
    return required_twos <= 0 || (required_twos < 60 && MultipleOfPow2(m, required_twos));
}

// The first discarded digit has the decimal position 10^-e10 relative to m * 2^e2, i.e. the
// value is exactly halfway iff the digit is 5 and m * 2^e2 * 10^e10 is an integer.
static inline RoundingMode ComputeRoundingMode(uint32_t first_discarded_digit, uint64_t m, int32_t e2, int32_t e10)
{
    if (first_discarded_digit < 5)
        return RoundingMode::Down;
    if (first_discarded_digit > 5)
        return RoundingMode::Up;

    bool exact = HasTrailingZeros(e2, e10, m);
    if (exact && e10 < 0)
        exact = MultipleOfPow5(m, -e10);

    return exact ? RoundingMode::UpIfOdd : RoundingMode::Up;
}

// Increments the decimal number in buffer[first, end), skipping the decimal point.
// Returns true if the carry propagated through all digits; the digits are then all '0'.
// decimal_index is set to the position of the decimal point, if it was passed.
static bool RoundUp(std::string& buffer, size_t first, RoundingMode mode, char decimal_point, size_t& decimal_index)
{
    RYU_PRINTF_ASSERT(mode != RoundingMode::Down);

    decimal_index = std::string::npos;

    for (size_t k = buffer.size(); k > first; )
    {
        --k;
        const char c = buffer[k];
        if (c == decimal_point)
        {
            decimal_index = k;
            continue;
        }

        RYU_PRINTF_ASSERT(IsDigit(c));
        if (c == '9')
        {
            buffer[k] = '0';
            mode = RoundingMode::Up;
            continue;
        }

        if (mode == RoundingMode::UpIfOdd && (c - '0') % 2 == 0)
            return false;

        buffer[k] = static_cast<char>(c + 1);
        return false;
    }

    return true;
}

//==================================================================================================
// Postprocessing
//==================================================================================================

// Removes trailing zeros after the decimal point, and the decimal point itself if no digits
// remain after it.
static void TrimTrailingZeros(std::string& buffer, size_t first, char decimal_point)
{
    const size_t decimal_index = buffer.find(decimal_point, first);
    if (decimal_index == std::string::npos)
        return;

    size_t last = buffer.size();
    while (last > decimal_index + 1 && buffer[last - 1] == '0')
        --last;
    if (last == decimal_index + 1)
        last = decimal_index;

    buffer.resize(last);
}

// Inserts a separator between groups of three digits in buffer[first, last), counted from the right.
static void InsertThousandsSeparators(std::string& buffer, size_t first, size_t last, char thousands_sep)
{
    RYU_PRINTF_ASSERT(first <= last);
    RYU_PRINTF_ASSERT(last <= buffer.size());

    const size_t num_digits = last - first;
    if (num_digits <= 3)
        return;

    const size_t num_separators = (num_digits - 1) / 3;
    const size_t old_size = buffer.size();
    buffer.resize(old_size + num_separators);

    char* const p = &buffer[0];
    std::memmove(p + last + num_separators, p + last, old_size - last);

    size_t src = last;
    size_t dst = last + num_separators;
    for (size_t n = 0; src > first; ++n)
    {
        if (n > 0 && n % 3 == 0)
            p[--dst] = thousands_sep;
        p[--dst] = p[--src];
    }
    RYU_PRINTF_ASSERT(dst == first);
}

static void AppendExponent(std::string& buffer, int32_t e10)
{
    if (e10 == 0)
        return;

    buffer.push_back('E');
    if (e10 < 0)
    {
        buffer.push_back('-');
        e10 = -e10;
    }

    RYU_PRINTF_ASSERT(e10 <= 999);
    const uint32_t k = static_cast<uint32_t>(e10);
    AppendDigits(buffer, k, k >= 100 ? 3 : (k >= 10 ? 2 : 1));
}

//==================================================================================================
// ToExponentialString
//==================================================================================================

void ryu_printf::ToExponentialString(std::string& buffer, uint64_t ieee_mantissa, uint32_t ieee_exponent,
                                     int precision, FormatOptions options, const Locale& locale)
{
    RYU_PRINTF_ASSERT(precision >= 0);
    // The carry and trimming passes locate the decimal point by its glyph.
    RYU_PRINTF_ASSERT(!IsDigit(locale.decimal_point));
    precision = std::min(std::max(precision, 0), MaxPrecision);

    const size_t first = buffer.size();
    const bool print_decimal_point = precision > 0;
    const char decimal_point = locale.decimal_point;

    const auto dec = Decode(ieee_mantissa, ieee_exponent);
    const uint64_t m = dec.mantissa;
    const int32_t e2 = dec.exponent;
    const uint64_t m_shifted = m << MantissaShift;

    const int32_t num_digits = precision + 1;

    uint32_t digits = 0;
    int32_t printed_digits = 0;
    int32_t available_digits = 0;
    int32_t e10 = 0;

    if (m != 0)
    {
        if (e2 >= -52)
        {
            const int32_t idx = e2 < 0 ? 0 : IndexForExponent(e2);
            const int32_t j = Pow10BitsForIndex(idx) - e2 + MantissaShift;
            for (int32_t i = LengthForIndex(idx) - 1; i >= 0; --i)
            {
                digits = MulShiftMod1E9(m_shifted, Pow10Positive(idx, i), j);
                if (printed_digits != 0)
                {
                    if (printed_digits + 9 > num_digits)
                    {
                        available_digits = 9;
                        break;
                    }
                    AppendDigits(buffer, digits, 9);
                    printed_digits += 9;
                }
                else if (digits != 0)
                {
                    available_digits = DecimalLength9(digits);
                    e10 = 9 * i + available_digits - 1;
                    if (available_digits > num_digits)
                        break;
                    AppendLeadingDigits(buffer, digits, available_digits, print_decimal_point, decimal_point);
                    printed_digits = available_digits;
                    available_digits = 0;
                }
            }
        }

        if (e2 < 0 && available_digits == 0)
        {
            const int32_t idx = -e2 / 16;
            const int32_t j = MantissaShift + Pow10AdditionalBits + (-e2 - 16 * idx);
            for (int32_t i = MinBlock(idx); ; ++i)
            {
                const uint64x3* row = Pow10Negative(idx, i);
                if (row == nullptr)
                {
                    // All remaining digits are 0.
                    break;
                }

                digits = MulShiftMod1E9(m_shifted, *row, j);
                if (printed_digits != 0)
                {
                    if (printed_digits + 9 > num_digits)
                    {
                        available_digits = 9;
                        break;
                    }
                    AppendDigits(buffer, digits, 9);
                    printed_digits += 9;
                }
                else if (digits != 0)
                {
                    available_digits = DecimalLength9(digits);
                    e10 = -9 * (i + 1) + available_digits - 1;
                    if (available_digits > num_digits)
                        break;
                    AppendLeadingDigits(buffer, digits, available_digits, print_decimal_point, decimal_point);
                    printed_digits = available_digits;
                    available_digits = 0;
                }
            }
        }
    }

    const int32_t max_digits = num_digits - printed_digits;
    if (available_digits == 0)
        digits = 0;

    uint32_t last_digit = 0;
    if (available_digits > max_digits)
        last_digit = RemoveTrailingDigits(digits, available_digits - max_digits);

    // Is m * 2^e2 * 10^(precision + 1 - e10) an integer?
    const RoundingMode mode = ComputeRoundingMode(last_digit, m, e2, num_digits - e10);

    if (printed_digits != 0)
        AppendDigits(buffer, digits, max_digits);
    else
        AppendLeadingDigits(buffer, digits, max_digits, print_decimal_point, decimal_point);

    if (mode != RoundingMode::Down)
    {
        size_t decimal_index;
        if (RoundUp(buffer, first, mode, decimal_point, decimal_index))
        {
            // 9.99...9 has been rounded to 0.00...0
            buffer[first] = '1';
            ++e10;
        }
    }

    if (HasOption(options, FormatOptions::SoftPrecision))
        TrimTrailingZeros(buffer, first, decimal_point);

    AppendExponent(buffer, e10);
}

//==================================================================================================
// ToFixedString
//==================================================================================================

void ryu_printf::ToFixedString(std::string& buffer, uint64_t ieee_mantissa, uint32_t ieee_exponent,
                               int precision, FormatOptions options, const Locale& locale)
{
    RYU_PRINTF_ASSERT(precision >= 0);
    // The carry and trimming passes locate the decimal point by its glyph.
    RYU_PRINTF_ASSERT(!IsDigit(locale.decimal_point));
    RYU_PRINTF_ASSERT(!HasOption(options, FormatOptions::ThousandsSeparators) || !IsDigit(locale.thousands_sep));
    RYU_PRINTF_ASSERT(!HasOption(options, FormatOptions::ThousandsSeparators) || locale.thousands_sep != locale.decimal_point);
    precision = std::min(std::max(precision, 0), MaxPrecision);

    const size_t first = buffer.size();
    const char decimal_point = locale.decimal_point;

    const auto dec = Decode(ieee_mantissa, ieee_exponent);
    const uint64_t m = dec.mantissa;
    const int32_t e2 = dec.exponent;
    const uint64_t m_shifted = m << MantissaShift;

    //
    // Integer part.
    //

    bool nonzero = false;
    if (e2 >= -52)
    {
        const int32_t idx = e2 < 0 ? 0 : IndexForExponent(e2);
        const int32_t j = Pow10BitsForIndex(idx) - e2 + MantissaShift;
        for (int32_t i = LengthForIndex(idx) - 1; i >= 0; --i)
        {
            const uint32_t digits = MulShiftMod1E9(m_shifted, Pow10Positive(idx, i), j);
            if (nonzero)
            {
                AppendDigits(buffer, digits, 9);
            }
            else if (digits != 0)
            {
                AppendDigits(buffer, digits, DecimalLength9(digits));
                nonzero = true;
            }
        }
    }

    if (!nonzero)
        buffer.push_back('0');

    size_t integer_last = buffer.size();

    if (precision > 0)
        buffer.push_back(decimal_point);

    //
    // Fractional part.
    //

    RoundingMode mode = RoundingMode::Down;
    if (e2 < 0)
    {
        const int32_t idx = -e2 / 16;
        const int32_t j = MantissaShift + Pow10AdditionalBits + (-e2 - 16 * idx);
        const int32_t blocks = precision / 9 + 1;
        const int32_t min_block = MinBlock(idx);

        int32_t i = 0;
        if (blocks <= min_block)
        {
            AppendZeros(buffer, precision);
            i = blocks;
        }
        else if (i < min_block)
        {
            AppendZeros(buffer, 9 * min_block);
            i = min_block;
        }

        for (; i < blocks; ++i)
        {
            const uint64x3* row = Pow10Negative(idx, i);
            if (row == nullptr)
            {
                // All remaining digits are 0. No rounding required.
                AppendZeros(buffer, precision - 9 * i);
                break;
            }

            uint32_t digits = MulShiftMod1E9(m_shifted, *row, j);
            if (i < blocks - 1)
            {
                AppendDigits(buffer, digits, 9);
            }
            else
            {
                const int32_t keep = precision - 9 * i; // [0, 8]
                const uint32_t last_digit = RemoveTrailingDigits(digits, 9 - keep);
                // Is m * 2^e2 * 10^(precision + 1) an integer?
                mode = ComputeRoundingMode(last_digit, m, e2, precision + 1);
                AppendDigits(buffer, digits, keep);
                break;
            }
        }
    }
    else
    {
        AppendZeros(buffer, precision);
    }

    if (mode != RoundingMode::Down)
    {
        size_t decimal_index;
        if (RoundUp(buffer, first, mode, decimal_point, decimal_index))
        {
            // 99.99 has been rounded to 00.00 and becomes 100.00
            buffer[first] = '1';
            if (decimal_index != std::string::npos)
            {
                buffer[decimal_index] = '0';
                buffer[decimal_index + 1] = decimal_point;
            }
            buffer.push_back('0');
            ++integer_last;
        }
    }

    if (HasOption(options, FormatOptions::SoftPrecision))
        TrimTrailingZeros(buffer, first, decimal_point);

    if (HasOption(options, FormatOptions::ThousandsSeparators))
        InsertThousandsSeparators(buffer, first, integer_last, locale.thousands_sep);
}

//==================================================================================================
//
//==================================================================================================

void ryu_printf::Format(std::string& buffer, double value, int precision, FormatOptions options, const Locale& locale)
{
    const Double v(value);

    if (v.IsNaN())
    {
        buffer.append("nan");
        return;
    }

    if (v.SignBit())
        buffer.push_back('-');

    if (v.IsInf())
    {
        buffer.append("inf");
        return;
    }

    const uint64_t ieee_mantissa = v.PhysicalSignificand();
    const uint32_t ieee_exponent = static_cast<uint32_t>(v.PhysicalExponent());

    if (HasOption(options, FormatOptions::FixedMode))
        ToFixedString(buffer, ieee_mantissa, ieee_exponent, precision, options, locale);
    else
        ToExponentialString(buffer, ieee_mantissa, ieee_exponent, precision, options, locale);
}

void ryu_printf::Format(std::string& buffer, float value, int precision, FormatOptions options, const Locale& locale)
{
    Format(buffer, static_cast<double>(value), precision, options, locale);
}

std::string ryu_printf::ToString(double value, int precision, FormatOptions options, const Locale& locale)
{
    std::string str;
    Format(str, value, precision, options, locale);
    return str;
}

std::string ryu_printf::ToSoftString(double value, int precision, const Locale& locale)
{
    return ToString(value, precision, FormatOptions::FixedMode | FormatOptions::SoftPrecision, locale);
}

std::string ryu_printf::ToHardString(double value, int precision, const Locale& locale)
{
    return ToString(value, precision, FormatOptions::FixedMode, locale);
}
