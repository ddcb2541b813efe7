/*
 * Unit tests for decimal fixed-point type
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <cmath>
#include <cstdint>
#include <limits>

#include <zeroalign/fixed_point.hpp>

using namespace zeroalign;

using Fixed4 = decimal_fixed<int32_t, 4>;

TEST_SUITE("Decimal Fixed-Point") {
    TEST_CASE("pow10") {
        static_assert(pow10<int64_t>(0) == 1, "10^0");
        static_assert(pow10<int64_t>(8) == 100000000, "10^8");
        static_assert(Fixed8::scale_factor == 100000000, "Fixed8 scale");
        static_assert(Fixed4::scale_factor == 10000, "Fixed4 scale");
        CHECK(pow10<int64_t>(18) == 1000000000000000000LL);
    }

    TEST_CASE("construction") {
        CHECK(Fixed8::from_raw(32768).raw() == 32768);
        CHECK(Fixed8().raw() == 0);
        CHECK(Fixed8::from_double(1.0).raw() == 100000000);
        CHECK(Fixed8::from_double(0.5).to_double() == doctest::Approx(0.5));
        CHECK(Fixed4::from_double(-10.5).raw() == -105000);
    }

    TEST_CASE("from_double truncates toward zero") {
        CHECK(Fixed8::from_double(1.999999995).raw() == 199999999);
        CHECK(Fixed8::from_double(-1.999999995).raw() == -199999999);
        CHECK(Fixed4::from_double(2.71828).raw() == 27182);
        CHECK(Fixed4::from_double(-2.71828).raw() == -27182);
        CHECK(Fixed8::from_double(1.999999995).to_int() == 1);
        CHECK(Fixed8::from_double(-1.999999995).to_int() == -1);
    }

    TEST_CASE("from_double rejects NaN, Inf and overflow") {
        CHECK_THROWS_AS(Fixed8::from_double(std::nan("")), InvalidInput);
        CHECK_THROWS_AS(Fixed8::from_double(std::numeric_limits<double>::infinity()), InvalidInput);
        CHECK_THROWS_AS(Fixed8::from_double(1e11), Overflow);
        CHECK_THROWS_AS(Fixed4::from_double(214749.0), Overflow);
        CHECK(Fixed4::from_double(214748.0).raw() == 2147480000);
        CHECK(Fixed4::from_double(-214748.0).raw() == -2147480000);
    }

    TEST_CASE("arithmetic and comparison") {
        Fixed8 a = Fixed8::from_double(2.0);
        Fixed8 b = Fixed8::from_double(3.0);
        CHECK((a + b).raw() == 500000000);
        CHECK((b - a).raw() == 100000000);
        CHECK((-a).raw() == -200000000);
        CHECK(a < b);
        CHECK(b > a);
        CHECK(a <= a);
        CHECK(b >= a);
        CHECK(a != b);
        CHECK(a == Fixed8::from_raw(200000000));
    }

    TEST_CASE("to_string is exact") {
        CHECK(Fixed8::from_double(1.999999995).to_string() == "1.99999999");
        CHECK(Fixed8::from_raw(-1).to_string() == "-0.00000001");
        CHECK(Fixed8::from_raw(0).to_string() == "0.00000000");
        CHECK(Fixed4::from_raw(-105000).to_string() == "-10.5000");
        CHECK(format_decimal<int64_t>(std::numeric_limits<int64_t>::min(), 8) == "-92233720368.54775808");
        CHECK(format_decimal<int64_t>(42, 0) == "42");
    }
}
