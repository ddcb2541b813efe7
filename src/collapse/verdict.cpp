/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "zeroalign/collapse/verdict.hpp"

#include <cmath>

#include <fmt/format.h>

namespace zeroalign::collapse {

namespace {

constexpr double kTargetLine = 7.0;
constexpr double kVerdictModulus = 333.0;
constexpr const char* kVerdictCode = "O333";

// Seal emitted with a confirmed zero: mean of (7*3) mod 333 and (7/3) mod 333.
std::string integrity_seal() {
    const double a = std::fmod(kTargetLine * 3.0, kVerdictModulus);
    const double b = std::fmod(kTargetLine / 3.0, kVerdictModulus);
    return fmt::format("{:.12f}", (a + b) / 2.0);
}

} // namespace

Verdict verdict(std::int64_t result) {
    Verdict v;
    v.code = kVerdictCode;
    if (result == 0) {
        v.status = "ABSOLUTE NATURALNESS";
        v.integrity_hash = integrity_seal();
        v.zero_point = true;
        v.message = "Unit Zero confirmed.";
    } else {
        v.status = "DECOHERENCE";
        v.integrity_hash = fmt::format("{:.12f}", 0.0);
        v.zero_point = false;
        v.message = "Residual error detected. Verify input.";
    }
    return v;
}

} // namespace zeroalign::collapse
