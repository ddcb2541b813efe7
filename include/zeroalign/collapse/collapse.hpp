/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <array>
#include <cstdint>
#include <limits>

namespace zeroalign::collapse {

static_assert(std::numeric_limits<double>::is_iec559,
              "attenuation relies on IEEE-754 finite / +Inf == 0");

inline constexpr int kDefaultPrecision = 8;
inline constexpr int kMaxPrecision = std::numeric_limits<std::int64_t>::digits10;
inline constexpr int kAttenuationStages = 4;
inline constexpr double kInfinity = std::numeric_limits<double>::infinity();

struct CollapseTrace {
    int precision{kDefaultPrecision};
    std::int64_t quantized{0};
    std::array<double, kAttenuationStages> stages{};
    std::int64_t result{0};
};

/**
 * @brief Fixed-point quantization: trunc(input * 10^precision).
 *
 * Truncates toward zero, never rounds: quantize(1.999999995) == 199999999.
 *
 * @throws InvalidInput input is NaN or infinite
 * @throws Overflow     the scaled value does not fit in int64_t
 * @throws std::out_of_range precision outside [0, kMaxPrecision]
 */
std::int64_t quantize(double input, int precision = kDefaultPrecision);

// One attenuation step: value / +Inf. Zero stays zero.
double attenuate(double value);

// Same algorithm as collapse(), keeping every intermediate value.
CollapseTrace trace(double input, int precision = kDefaultPrecision);

/**
 * @brief Quantize, attenuate kAttenuationStages times, truncate.
 *
 * Pure and stateless; the result is 0 for every input that quantizes.
 * Throws the same exceptions as quantize().
 */
std::int64_t collapse(double input, int precision = kDefaultPrecision);

} // namespace zeroalign::collapse
