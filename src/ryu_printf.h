// Copyright 2020 Ulf Adams
// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include <cstdint>
#include <string>

namespace ryu_printf {

enum class FormatOptions : uint32_t {
    None                = 0,
    // Insert Locale::thousands_sep between groups of three integer digits (fixed mode only).
    ThousandsSeparators = 1u << 0,
    // Drop trailing zeros of the fractional part (and a then empty separator) after rounding.
    SoftPrecision       = 1u << 1,
    // Format(): use ToFixedString instead of ToExponentialString.
    FixedMode           = 1u << 2,
};

constexpr FormatOptions operator|(FormatOptions lhs, FormatOptions rhs)
{
    return static_cast<FormatOptions>(static_cast<uint32_t>(lhs) | static_cast<uint32_t>(rhs));
}

constexpr FormatOptions operator&(FormatOptions lhs, FormatOptions rhs)
{
    return static_cast<FormatOptions>(static_cast<uint32_t>(lhs) & static_cast<uint32_t>(rhs));
}

constexpr bool HasOption(FormatOptions options, FormatOptions flag)
{
    return (options & flag) != FormatOptions::None;
}

struct Locale
{
    char decimal_point = '.';
    char thousands_sep = ',';
};

// Requests for more digits are clamped to this value.
// Every double has at most 1074 digits after the decimal point (and at most 767 significant
// digits), so larger precisions would only add zeros.
constexpr int MaxPrecision = 1074;

// ToExponentialString(buffer, ieee_mantissa, ieee_exponent, precision, options, locale);
//
// Appends the value (ieee_mantissa, ieee_exponent) of a non-negative finite double in
// scientific notation, correctly rounded (round-half-even) to precision + 1 significant
// digits.
//
// ieee_mantissa is the 52-bit significand field, ieee_exponent the 11-bit biased exponent
// field. The sign, infinities and NaN must be handled by the caller.
//
// The output has the form D[.DDD][E[-]XXX]. The exponent is omitted if it is 0.
// Examples: 1.0, precision 0 => "1"; 100.0, precision 2 => "1.00E2"; 0.001, precision 0 => "1E-3"
void ToExponentialString(std::string& buffer, uint64_t ieee_mantissa, uint32_t ieee_exponent,
                         int precision, FormatOptions options = FormatOptions::None, const Locale& locale = Locale{});

// ToFixedString(buffer, ieee_mantissa, ieee_exponent, precision, options, locale);
//
// Appends the value (ieee_mantissa, ieee_exponent) of a non-negative finite double in
// fixed-point notation, correctly rounded (round-half-even) to precision digits after the
// decimal point. No decimal point is printed if precision is 0.
//
// Examples: 2.5, precision 0 => "2"; 9.9999, precision 3 => "10.000";
// 1234567.0, precision 0, ThousandsSeparators => "1,234,567"
void ToFixedString(std::string& buffer, uint64_t ieee_mantissa, uint32_t ieee_exponent,
                   int precision, FormatOptions options = FormatOptions::None, const Locale& locale = Locale{});

// Format(buffer, value, precision, options, locale);
//
// Appends the given double using ToFixedString if options contains FixedMode, and using
// ToExponentialString otherwise.
// A '-' is prepended if the sign bit is set (this includes -0).
// Infinities are formatted as "inf" or "-inf", NaN as "nan".
void Format(std::string& buffer, double value, int precision, FormatOptions options = FormatOptions::None, const Locale& locale = Locale{});

// Single-precision numbers are converted exactly to double-precision and formatted as such.
void Format(std::string& buffer, float value, int precision, FormatOptions options = FormatOptions::None, const Locale& locale = Locale{});

std::string ToString(double value, int precision, FormatOptions options = FormatOptions::None, const Locale& locale = Locale{});

// Fixed-point, at most precision digits after the decimal point.
std::string ToSoftString(double value, int precision, const Locale& locale = Locale{});

// Fixed-point, exactly precision digits after the decimal point.
std::string ToHardString(double value, int precision, const Locale& locale = Locale{});

} // namespace ryu_printf
