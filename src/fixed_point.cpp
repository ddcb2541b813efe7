/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "zeroalign/fixed_point.hpp"

// decimal_fixed is a header-only template; instantiate the default quantization type once here.

namespace zeroalign {
template class decimal_fixed<int64_t, 8>;
} // namespace zeroalign
