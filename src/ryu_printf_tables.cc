// Copyright 2020 Ulf Adams
// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "ryu_printf_tables.h"

namespace ryu_printf {
namespace impl {

// Pow10PositiveOffsets, Pow10PositiveRows, Pow10NegativeOffsets, Pow10NegativeRows
#include "ryu_printf_tables.inc"

static_assert(sizeof(Pow10PositiveRows) / sizeof(Pow10PositiveRows[0]) == 1153, "unexpected table size");
static_assert(sizeof(Pow10NegativeRows) / sizeof(Pow10NegativeRows[0]) == 3122, "unexpected table size");

} // namespace impl
} // namespace ryu_printf
