/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <cstdint>
#include <cmath>
#include <limits>
#include <string>
#include <type_traits>

#include <fmt/format.h>

#include <zeroalign/errors.hpp>

namespace zeroalign {

// 10^digits in IntType. Caller keeps digits within numeric_limits<IntType>::digits10.
template<typename IntType>
constexpr IntType pow10(int digits) {
    IntType result = 1;
    for (int i = 0; i < digits; ++i) result *= 10;
    return result;
}

namespace detail {

// trunc(value * scale) with range checking. Never rounds, never wraps.
template<typename IntType>
IntType quantize_scaled(double value, IntType scale) {
    if (std::isnan(value)) {
        throw InvalidInput("input is NaN");
    }
    if (std::isinf(value)) {
        throw InvalidInput(value > 0 ? "input is +Inf" : "input is -Inf");
    }
    const double scaled = value * static_cast<double>(scale);
    // Bounds are one past the representable range; anything strictly inside truncates safely.
    const double hi = static_cast<double>(std::numeric_limits<IntType>::max()) + 1.0;
    const double lo = static_cast<double>(std::numeric_limits<IntType>::min()) - 1.0;
    if (!(scaled < hi && scaled > lo)) {
        throw Overflow(fmt::format("{} * {} does not fit in {} bits",
                                   value, scale, std::numeric_limits<IntType>::digits + 1));
    }
    return static_cast<IntType>(std::trunc(scaled));
}

} // namespace detail

// Exact decimal text of raw / 10^digits, e.g. (199999999, 8) -> "1.99999999".
template<typename IntType>
std::string format_decimal(IntType raw, int digits) {
    using UnsignedType = typename std::make_unsigned<IntType>::type;
    const bool negative = raw < 0;
    const UnsignedType magnitude = negative ? UnsignedType(0) - static_cast<UnsignedType>(raw)
                                            : static_cast<UnsignedType>(raw);
    const UnsignedType scale = static_cast<UnsignedType>(pow10<IntType>(digits));
    const UnsignedType whole = magnitude / scale;
    if (digits == 0) {
        return fmt::format("{}{}", negative ? "-" : "", whole);
    }
    return fmt::format("{}{}.{:0{}}", negative ? "-" : "", whole, magnitude % scale, digits);
}

/**
 * Decimal fixed-point value: raw integer scaled by 10^Digits.
 * Template parameters:
 * - IntType: underlying integer type (int32_t, int64_t)
 * - Digits: number of fractional decimal digits
 */
template<typename IntType, int Digits>
class decimal_fixed {
public:
    static_assert(std::is_signed<IntType>::value, "IntType must be signed");
    static_assert(Digits >= 0 && Digits <= std::numeric_limits<IntType>::digits10, "Invalid decimal digits");

    using value_type = IntType;
    static constexpr int fractional_digits = Digits;
    static constexpr IntType scale_factor = pow10<IntType>(Digits);

    constexpr decimal_fixed() : value_(0) {}
    constexpr explicit decimal_fixed(IntType raw_value) : value_(raw_value) {}

    static constexpr decimal_fixed from_raw(IntType raw) {
        return decimal_fixed(raw);
    }

    // Truncates toward zero. Throws InvalidInput (NaN/Inf) or Overflow.
    static decimal_fixed from_double(double f) {
        return decimal_fixed(detail::quantize_scaled<IntType>(f, scale_factor));
    }

    constexpr IntType raw() const { return value_; }

    double to_double() const {
        return static_cast<double>(value_) / static_cast<double>(scale_factor);
    }

    // Whole part, truncated toward zero.
    IntType to_int() const {
        return value_ / scale_factor;
    }

    decimal_fixed operator+(const decimal_fixed& other) const {
        return decimal_fixed(value_ + other.value_);
    }

    decimal_fixed operator-(const decimal_fixed& other) const {
        return decimal_fixed(value_ - other.value_);
    }

    bool operator==(const decimal_fixed& other) const { return value_ == other.value_; }
    bool operator!=(const decimal_fixed& other) const { return value_ != other.value_; }
    bool operator<(const decimal_fixed& other) const { return value_ < other.value_; }
    bool operator<=(const decimal_fixed& other) const { return value_ <= other.value_; }
    bool operator>(const decimal_fixed& other) const { return value_ > other.value_; }
    bool operator>=(const decimal_fixed& other) const { return value_ >= other.value_; }

    decimal_fixed operator-() const { return decimal_fixed(-value_); }

    std::string to_string() const {
        return format_decimal<IntType>(value_, Digits);
    }

private:
    IntType value_;
};

// 8 fractional decimal digits, the default alignment precision
using Fixed8 = decimal_fixed<int64_t, 8>;

} // namespace zeroalign
