#include <zeroalign/config/validator.hpp>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <stdexcept>

#include <fmt/format.h>

#include <zeroalign/collapse/collapse.hpp>

namespace zeroalign::config {

static std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return {};
    auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

bool validate_precision(int precision, std::string& err) {
    if (precision < 0 || precision > collapse::kMaxPrecision) {
        err = fmt::format("precision {} out of range (0-{})", precision, collapse::kMaxPrecision);
        return false;
    }
    return true;
}

bool parse_int(const std::string& text, int& out, std::string& err) {
    std::string t = trim(text);
    if (t.empty()) { err = "empty integer"; return false; }
    std::size_t start = (t[0] == '-' || t[0] == '+') ? 1 : 0;
    if (start == t.size() || !std::all_of(t.begin() + start, t.end(),
                                          [](unsigned char c) { return std::isdigit(c) != 0; })) {
        err = fmt::format("'{}' is not an integer", t); return false; }
    long v = 0;
    try { v = std::stol(t); } catch (const std::out_of_range&) { err = fmt::format("'{}' out of range", t); return false; }
    if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
        err = fmt::format("'{}' out of range", t); return false; }
    out = static_cast<int>(v);
    return true;
}

bool parse_bool(const std::string& text, bool& out) {
    std::string t = trim(text);
    std::transform(t.begin(), t.end(), t.begin(), [](unsigned char c) { return std::tolower(c); });
    if (t == "true" || t == "1" || t == "yes" || t == "on") { out = true; return true; }
    if (t == "false" || t == "0" || t == "no" || t == "off") { out = false; return true; }
    return false;
}

bool parse_input_value(const std::string& text, double& out, std::string& err) {
    std::string t = trim(text);
    if (t.empty()) { err = "empty input value"; return false; }
    errno = 0;
    char* end = nullptr;
    double v = std::strtod(t.c_str(), &end);
    if (end == t.c_str() || *end != '\0') {
        err = fmt::format("'{}' is not a number", t); return false; }
    if (errno == ERANGE && std::isinf(v)) {
        err = fmt::format("'{}' exceeds the range of double", t); return false; }
    if (!std::isfinite(v)) {
        err = fmt::format("'{}' is not a finite number", t); return false; }
    out = v;
    return true;
}

} // namespace zeroalign::config
