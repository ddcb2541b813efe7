/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "zeroalign/report.hpp"

#include <chrono>
#include <ctime>
#include <utility>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include "zeroalign/fixed_point.hpp"

namespace zeroalign::report {

std::string session_id() {
    using namespace std::chrono;
    std::time_t t = system_clock::to_time_t(system_clock::now());
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    return fmt::format("{:%Y%m%d_%H%M%S}", tm);
}

AlignmentReport make_report(double input, int precision, std::string session) {
    AlignmentReport r;
    r.session_id = std::move(session);
    r.input = input;
    r.trace = collapse::trace(input, precision);
    r.verdict = collapse::verdict(r.trace.result);
    return r;
}

AlignmentReport make_report(double input, int precision) {
    return make_report(input, precision, session_id());
}

nlohmann::json to_json(const AlignmentReport& report) {
    const auto& t = report.trace;
    nlohmann::json stages = nlohmann::json::array();
    for (double s : t.stages) stages.push_back(s);

    return nlohmann::json{
        {"session_id", report.session_id},
        {"input", report.input},
        {"precision", t.precision},
        {"quantized", t.quantized},
        {"quantized_decimal", format_decimal<std::int64_t>(t.quantized, t.precision)},
        {"stages", stages},
        {"nucleus", t.result},
        {"zero_unit", t.result == 0},
        {"verdict", {
            {"status", report.verdict.status},
            {"verdict_code", report.verdict.code},
            {"integrity_hash", report.verdict.integrity_hash},
            {"zero_point", report.verdict.zero_point},
            {"message", report.verdict.message},
        }},
    };
}

} // namespace zeroalign::report
