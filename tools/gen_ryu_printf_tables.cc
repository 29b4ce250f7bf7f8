// Copyright 2020 Ulf Adams
// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

// Writes the power-of-ten tables used by ryu_printf_tables.cc.
//
// Usage: gen_ryu_printf_tables <output file>

#include "ryu_printf_tables.h"

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <vector>

using namespace ryu_printf::impl;

//==================================================================================================
// Exact arithmetic
//
// The rows are computed exactly, using a little-endian sequence of 32-bit words. Only
// multiplication and division by single words and shifts are required.
//==================================================================================================

namespace {
struct MultiWord
{
    std::vector<uint32_t> words; // words[0] is the least significant

    explicit MultiWord(uint32_t value) : words(1, value) {}

    static MultiWord Pow2(int32_t e)
    {
        RYU_PRINTF_ASSERT(e >= 0);

        MultiWord x(0);
        x.words.assign(static_cast<size_t>(e / 32 + 1), 0);
        x.words.back() = uint32_t{1} << (e % 32);
        return x;
    }

    void Trim()
    {
        while (words.size() > 1 && words.back() == 0)
            words.pop_back();
    }

    void MulSmall(uint32_t factor)
    {
        uint64_t carry = 0;
        for (auto& w : words)
        {
            const uint64_t p = uint64_t{w} * factor + carry;
            w = Lo32(p);
            carry = Hi32(p);
        }
        if (carry != 0)
            words.push_back(static_cast<uint32_t>(carry));
    }

    // Sets x = floor(x / divisor) and returns x mod divisor.
    uint32_t DivSmall(uint32_t divisor)
    {
        RYU_PRINTF_ASSERT(divisor != 0);

        uint64_t rem = 0;
        for (size_t k = words.size(); k-- > 0; )
        {
            const uint64_t cur = (rem << 32) | words[k];
            words[k] = static_cast<uint32_t>(cur / divisor);
            rem = cur % divisor;
        }
        Trim();
        return static_cast<uint32_t>(rem);
    }

    void AddOne()
    {
        for (auto& w : words)
        {
            if (++w != 0)
                return;
        }
        words.push_back(1);
    }

    void ShiftLeft(int32_t n)
    {
        RYU_PRINTF_ASSERT(n >= 0);

        const size_t word_shift = static_cast<size_t>(n / 32);
        const int32_t bit_shift = n % 32;

        words.push_back(0);
        if (bit_shift != 0)
        {
            for (size_t k = words.size() - 1; k > 0; --k)
                words[k] = (words[k] << bit_shift) | (words[k - 1] >> (32 - bit_shift));
            words[0] <<= bit_shift;
        }
        words.insert(words.begin(), word_shift, 0);
        Trim();
    }

    void ShiftRight(int32_t n)
    {
        RYU_PRINTF_ASSERT(n >= 0);

        const size_t word_shift = static_cast<size_t>(n / 32);
        const int32_t bit_shift = n % 32;

        if (word_shift >= words.size())
        {
            words.assign(1, 0);
            return;
        }
        words.erase(words.begin(), words.begin() + static_cast<std::ptrdiff_t>(word_shift));
        if (bit_shift != 0)
        {
            for (size_t k = 0; k + 1 < words.size(); ++k)
                words[k] = (words[k] >> bit_shift) | (words[k + 1] << (32 - bit_shift));
            words.back() >>= bit_shift;
        }
        Trim();
    }

    uint32_t Word(size_t k) const
    {
        return k < words.size() ? words[k] : 0;
    }
};
} // namespace

// Returns x mod 10^9 * 2^136.
static uint64x3 ReduceRow(const MultiWord& x)
{
    // Bits [0, 136) are kept as they are, the remaining bits are reduced mod 10^9 and stored
    // at bits [136, 166).
    MultiWord hi = x;
    hi.ShiftRight(136);
    const uint32_t r = hi.DivSmall(1000000000);

    uint64x3 row;
    row.w0 = uint64_t{x.Word(0)} | uint64_t{x.Word(1)} << 32;
    row.w1 = uint64_t{x.Word(2)} | uint64_t{x.Word(3)} << 32;
    row.w2 = uint64_t{x.Word(4) & 0xFF} | uint64_t{r} << 8;
    return row;
}

//==================================================================================================
// Tables
//==================================================================================================

static void ComputePositiveTable(std::vector<uint64x3>& rows, std::vector<int32_t>& offsets)
{
    for (int32_t idx = 0; idx < PositiveTableSize; ++idx)
    {
        offsets.push_back(static_cast<int32_t>(rows.size()));

        // floor(2^(16 idx + 120) / 10^(9 i)) = floor(floor(2^(16 idx + 120) / 10^(9 (i - 1))) / 10^9)
        MultiWord q = MultiWord::Pow2(Pow10BitsForIndex(idx));
        const int32_t len = LengthForIndex(idx);
        for (int32_t i = 0; i < len; ++i)
        {
            if (i > 0)
                q.DivSmall(1000000000);

            MultiWord row = q;
            row.AddOne();
            rows.push_back(ReduceRow(row));
        }
    }
    offsets.push_back(static_cast<int32_t>(rows.size()));
}

static void ComputeNegativeTable(std::vector<uint64x3>& rows, std::vector<int32_t>& offsets)
{
    for (int32_t idx = 0; idx < NegativeTableSize; ++idx)
    {
        offsets.push_back(static_cast<int32_t>(rows.size()));

        const int32_t min_block = MinBlock(idx);
        const int32_t len = NegativeLengthForIndex(idx);
        const int32_t shift = 16 * idx - Pow10AdditionalBits;

        MultiWord pow10(1);
        for (int32_t i = 0; i < len; ++i)
        {
            // pow10 = 10^(9 (i + 1))
            pow10.MulSmall(1000000000);
            if (i < min_block)
                continue;

            MultiWord row = pow10;
            if (shift <= 0)
            {
                row.ShiftLeft(-shift);
            }
            else
            {
                row.ShiftRight(shift);
                row.AddOne();
            }
            rows.push_back(ReduceRow(row));
        }
    }
    offsets.push_back(static_cast<int32_t>(rows.size()));
}

static void PrintOffsets(FILE* file, const char* name, const std::vector<int32_t>& offsets)
{
    fprintf(file, "const int32_t %s[] = {", name);
    for (size_t k = 0; k < offsets.size(); ++k)
    {
        if (k % 10 == 0)
            fprintf(file, "\n   ");
        fprintf(file, " %d,", offsets[k]);
    }
    fprintf(file, "\n};\n\n");
}

static void PrintRows(FILE* file, const char* name, const std::vector<uint64x3>& rows)
{
    fprintf(file, "const uint64x3 %s[] = {\n", name);
    for (const auto& row : rows)
    {
        fprintf(file, "    {0x%016llXu, 0x%016llXu, 0x%016llXu},\n",
            static_cast<unsigned long long>(row.w0),
            static_cast<unsigned long long>(row.w1),
            static_cast<unsigned long long>(row.w2));
    }
    fprintf(file, "};\n\n");
}

int main(int argc, char** argv)
{
    if (argc != 2)
    {
        fprintf(stderr, "usage: %s <output file>\n", argv[0]);
        return 1;
    }

    std::vector<uint64x3> positive;
    std::vector<int32_t> positive_offsets;
    ComputePositiveTable(positive, positive_offsets);

    std::vector<uint64x3> negative;
    std::vector<int32_t> negative_offsets;
    ComputeNegativeTable(negative, negative_offsets);

    FILE* file = fopen(argv[1], "w");
    if (file == nullptr)
    {
        fprintf(stderr, "cannot open '%s' for writing\n", argv[1]);
        return 1;
    }

    fprintf(file, "// Generated by gen_ryu_printf_tables. Do not edit.\n\n");
    PrintOffsets(file, "Pow10PositiveOffsets", positive_offsets);
    PrintRows(file, "Pow10PositiveRows", positive);
    PrintOffsets(file, "Pow10NegativeOffsets", negative_offsets);
    PrintRows(file, "Pow10NegativeRows", negative);

    if (fclose(file) != 0)
    {
        fprintf(stderr, "error writing '%s'\n", argv[1]);
        return 1;
    }

    printf("%zu positive rows, %zu negative rows\n", positive.size(), negative.size());
    return 0;
}
