#include "benchmark/benchmark.h"

#include "ryu_printf.h"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include <algorithm>
#include <random>
#include <string>
#include <utility>
#include <vector>

#define BENCH_RYU_PRINTF()      1
#define BENCH_STD_PRINTF()      0

//==================================================================================================
//
//==================================================================================================

#if BENCH_RYU_PRINTF()
struct D2S
{
    static char const* Name() { return "ryu_printf"; }
    void operator()(std::string& buf, double f, int precision, bool fixed) const {
        ryu_printf::Format(buf, f, precision, fixed ? ryu_printf::FormatOptions::FixedMode : ryu_printf::FormatOptions::None);
    }
};
#endif

#if BENCH_STD_PRINTF()
struct D2S
{
    static char const* Name() { return "std::printf"; }
    void operator()(std::string& buf, double f, int precision, bool fixed) const {
        char tmp[2048];
        const int len = std::snprintf(tmp, sizeof(tmp), fixed ? "%.*f" : "%.*e", precision, f);
        buf.append(tmp, static_cast<size_t>(len));
    }
};
#endif

//==================================================================================================
//
//==================================================================================================

static std::mt19937_64 rng;

static constexpr int NumFloats = 1 << 13;

template <typename ...Args>
static inline char const* StrPrintf(char const* format, Args&&... args)
{
    char buf[1024];
    snprintf(buf, 1024, format, std::forward<Args>(args)...);
    return strdup(buf); // leak...
}

static inline void BenchIt(benchmark::State& state, std::vector<double> const& numbers, int precision, bool fixed)
{
    D2S d2s;

    std::string buffer;
    buffer.reserve(2048);

    int index = 0;

    uint64_t sum = 0;
    for (auto _ : state)
    {
        buffer.clear();
        d2s(buffer, numbers[static_cast<size_t>(index)], precision, fixed);
        sum += static_cast<unsigned char>(buffer[0]);
        index = (index + 1) & (NumFloats - 1);
    }

    if (sum == UINT64_MAX)
        abort();
}

static inline void RegisterBenchmarks(char const* name, std::vector<double> const& numbers, int precision, bool fixed)
{
    auto* bench = benchmark::RegisterBenchmark(StrPrintf("%s %5s p=%-4d   ", name, fixed ? "fixed" : "exp", precision), BenchIt, numbers, precision, fixed);

    bench->ComputeStatistics("min", [](const std::vector<double>& v) -> double {
        return *(std::min_element(std::begin(v), std::end(v)));
    });
    bench->Repetitions(3);
    bench->ReportAggregatesOnly();
}

//--------------------------------------------------------------------------------------------------
//
//--------------------------------------------------------------------------------------------------

static inline std::vector<double> GenRandomBits()
{
    std::uniform_int_distribution<uint64_t> gen(1, 0x7FF0000000000000ull - 1);

    std::vector<double> numbers(NumFloats);
    std::generate(numbers.begin(), numbers.end(), [&] {
        const uint64_t bits = gen(rng);
        double f;
        std::memcpy(&f, &bits, sizeof(double));
        return f;
    });
    return numbers;
}

static inline std::vector<double> GenUniform(double low, double high)
{
    std::uniform_real_distribution<double> gen(low, high);

    std::vector<double> numbers(NumFloats);
    std::generate(numbers.begin(), numbers.end(), [&] { return gen(rng); });
    return numbers;
}

//--------------------------------------------------------------------------------------------------
//
//--------------------------------------------------------------------------------------------------

int main(int argc, char** argv)
{
#if defined(__clang__)
    printf("clang %d.%d\n", __clang_major__, __clang_minor__);
#elif defined(__GNUC__)
    printf("gcc %s\n", __VERSION__);
#elif defined(_MSC_VER)
    printf("msc %d\n", _MSC_FULL_VER);
#endif

    printf("Preparing benchmarks...\n");

    const auto random_bits = GenRandomBits();
    const auto uniform_0_1 = GenUniform(0.0, 1.0);
    const auto uniform_money = GenUniform(0.0, 1.0e7);

    for (int p : {0, 1, 6, 16, 17, 40, 100})
    {
        RegisterBenchmarks("random bits", random_bits, p, /*fixed*/ false);
        RegisterBenchmarks("[0,1)      ", uniform_0_1, p, /*fixed*/ false);
        RegisterBenchmarks("[0,1)      ", uniform_0_1, p, /*fixed*/ true);
        RegisterBenchmarks("[0,1e7)    ", uniform_money, p, /*fixed*/ true);
    }

    printf("Benchmarking %s\n", D2S::Name());

    benchmark::Initialize(&argc, argv);
    benchmark::RunSpecifiedBenchmarks();
}
