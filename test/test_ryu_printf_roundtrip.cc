#include "catch.hpp"

#include "double-conversion/double-conversion.h"

#include "ryu_printf.h"

#include <cstdint>
#include <cstring>
#include <limits>
#include <random>
#include <string>

using ryu_printf::FormatOptions;

//==================================================================================================
//
//==================================================================================================

template <typename Target, typename Source>
static Target ReinterpretBits(Source source)
{
    static_assert(sizeof(Target) == sizeof(Source), "ouch");

    Target target;
    std::memcpy(&target, &source, sizeof(Source));
    return target;
}

static double strtod_double_conversion(const std::string& str)
{
    double_conversion::StringToDoubleConverter s2d(0, 0.0, 1.0, "inf", "nan");
    int processed_characters_count = 0;
    return s2d.StringToDouble(str.data(), static_cast<int>(str.size()), &processed_characters_count);
}

static void CheckRoundTrip(double value)
{
    // 17 significant digits are always sufficient.
    const std::string str = ryu_printf::ToString(value, 16);

    CAPTURE(value);
    CAPTURE(str);

    const double parsed = strtod_double_conversion(str);
    CHECK(ReinterpretBits<uint64_t>(parsed) == ReinterpretBits<uint64_t>(value));
}

static void CheckExactFixed(double value)
{
    // With the maximum precision the fixed output is the exact value.
    const std::string str = ryu_printf::ToString(value, ryu_printf::MaxPrecision, FormatOptions::FixedMode | FormatOptions::SoftPrecision);

    CAPTURE(value);
    CAPTURE(str);

    const double parsed = strtod_double_conversion(str);
    CHECK(ReinterpretBits<uint64_t>(parsed) == ReinterpretBits<uint64_t>(value));
}

//==================================================================================================
//
//==================================================================================================

TEST_CASE("Round trip - Boundaries")
{
    CheckRoundTrip(0.0);
    CheckRoundTrip(-0.0);
    CheckRoundTrip(std::numeric_limits<double>::denorm_min());
    CheckRoundTrip(std::numeric_limits<double>::min());
    CheckRoundTrip(std::numeric_limits<double>::max());
    CheckRoundTrip(std::numeric_limits<double>::epsilon());
    CheckRoundTrip(ReinterpretBits<double>(uint64_t{0x000FFFFFFFFFFFFF}));
    CheckRoundTrip(0.1);
    CheckRoundTrip(1.0 / 3.0);
}

TEST_CASE("Round trip - Random bits")
{
    std::mt19937_64 random(1);

    for (int i = 0; i < 100000; ++i)
    {
        const uint64_t bits = random();
        const double value = ReinterpretBits<double>(bits);
        if (value != value || value == std::numeric_limits<double>::infinity() || value == -std::numeric_limits<double>::infinity())
            continue;
        CheckRoundTrip(value);
    }
}

TEST_CASE("Round trip - Exact fixed")
{
    CheckExactFixed(std::numeric_limits<double>::denorm_min());
    CheckExactFixed(std::numeric_limits<double>::max());

    std::mt19937_64 random(2);
    std::uniform_real_distribution<double> gen(0.0, 1.0e6);

    for (int i = 0; i < 2000; ++i)
        CheckExactFixed(gen(random));
}
