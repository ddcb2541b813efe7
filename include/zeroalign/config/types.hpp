#pragma once

#include <optional>
#include <string>
#include <vector>

#include <zeroalign/collapse/collapse.hpp>

namespace zeroalign::config {

struct AppConfig {
    int precision{collapse::kDefaultPrecision};
    bool verbose{false};
    bool verdict{false};
    bool json{false};
};

// Settings given on the command line; unset fields leave file/env values alone.
struct CliOptions {
    std::optional<int> precision;
    bool verbose{false};
    bool verdict{false};
    bool json{false};
    std::vector<std::string> values; // raw input values, in order
};

struct ParseResult {
    std::optional<CliOptions> opts; // present when arguments parsed and a value was given
    std::string config_path{"zeroalign.conf"};
    bool show_only{false}; // true if --help/--version was printed
    bool debug{false};     // true if --debug was passed on CLI
};

} // namespace zeroalign::config
