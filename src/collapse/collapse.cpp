/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "zeroalign/collapse/collapse.hpp"

#include <cmath>
#include <stdexcept>

#include <fmt/core.h>

#include "zeroalign/fixed_point.hpp"

namespace zeroalign {
namespace collapse {

std::int64_t quantize(double input, int precision) {
    if (precision == kDefaultPrecision) {
        return Fixed8::from_double(input).raw();
    }
    if (precision < 0 || precision > kMaxPrecision) {
        throw std::out_of_range(fmt::format("precision {} outside [0, {}]", precision, kMaxPrecision));
    }
    return detail::quantize_scaled<std::int64_t>(input, pow10<std::int64_t>(precision));
}

double attenuate(double value) {
    if (value == 0.0) return value;
    return value / kInfinity;
}

CollapseTrace trace(double input, int precision) {
    CollapseTrace t;
    t.precision = precision;
    t.quantized = quantize(input, precision);

    double v = static_cast<double>(t.quantized);
    for (auto& stage : t.stages) {
        v = attenuate(v);
        stage = v;
    }
    // -0.0 truncates to 0 as well
    t.result = static_cast<std::int64_t>(std::trunc(v));
    return t;
}

std::int64_t collapse(double input, int precision) {
    return trace(input, precision).result;
}

} // namespace collapse
} // namespace zeroalign
