/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace zeroalign {

// Input is NaN, infinite or otherwise not a finite real number.
class InvalidInput : public std::invalid_argument {
public:
    explicit InvalidInput(const std::string& what) : std::invalid_argument(what) {}
};

// Fixed-point quantization does not fit the integer width.
class Overflow : public std::overflow_error {
public:
    explicit Overflow(const std::string& what) : std::overflow_error(what) {}
};

} // namespace zeroalign
