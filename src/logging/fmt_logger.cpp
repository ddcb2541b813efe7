#include <zeroalign/logging/fmt_logger.hpp>

#include <fmt/format.h>

namespace zeroalign::logging {

static inline void print_line_stdout(std::string_view level, std::string_view msg) {
    fmt::print("[{}] {}\n", level, msg);
}

static inline void print_line_stderr(std::string_view level, std::string_view msg) {
    fmt::print(stderr, "[{}] {}\n", level, msg);
}

void FmtLogger::info(std::string_view msg) { print_line_stdout("INFO", msg); }
void FmtLogger::warn(std::string_view msg) { print_line_stderr("WARN", msg); }
void FmtLogger::error(std::string_view msg) { print_line_stderr("ERROR", msg); }
void FmtLogger::debug(std::string_view msg) {
    if (enable_debug_.load()) print_line_stderr("DEBUG", msg);
}

std::string tagged(std::string_view tag, std::string_view msg) {
    return fmt::format("[{:>12}] {}", tag, msg);
}

} // namespace zeroalign::logging
