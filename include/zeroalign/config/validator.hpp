#pragma once

#include <string>

namespace zeroalign::config {

// Precision must lie in [0, 18] (int64_t decimal digits).
bool validate_precision(int precision, std::string& err);

// Whole-string base-10 integer.
bool parse_int(const std::string& text, int& out, std::string& err);

// true/false, 1/0, yes/no, on/off (case-insensitive).
bool parse_bool(const std::string& text, bool& out);

// Whole-string finite real number. Rejects trailing garbage, NaN and Inf.
bool parse_input_value(const std::string& text, double& out, std::string& err);

} // namespace zeroalign::config
