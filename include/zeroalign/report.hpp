/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include <zeroalign/collapse/collapse.hpp>
#include <zeroalign/collapse/verdict.hpp>

namespace zeroalign::report {

struct AlignmentReport {
    std::string session_id;
    double input{0.0};
    collapse::CollapseTrace trace;
    collapse::Verdict verdict;
};

// Local time as YYYYMMDD_HHMMSS.
std::string session_id();

// Runs the collapse for one input. Throws whatever collapse::trace throws.
AlignmentReport make_report(double input, int precision, std::string session);
AlignmentReport make_report(double input, int precision);

nlohmann::json to_json(const AlignmentReport& report);

} // namespace zeroalign::report
