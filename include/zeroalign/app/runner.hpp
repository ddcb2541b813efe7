#pragma once

#include <cstdio>
#include <string>
#include <vector>

#include <zeroalign/config/types.hpp>
#include <zeroalign/logging/logger.hpp>

namespace zeroalign::app {

enum ExitCode : int {
    kExitOk = 0,
    kExitInvalid = 1,  // bad arguments, config or InvalidInput
    kExitOverflow = 2, // Overflow during quantization
};

// Merge defaults, config file, environment and CLI into cfg. Returns errors.
std::vector<std::string> resolve_config(const config::ParseResult& pr, config::AppConfig& cfg);

// Collapse each value in order and print its result to out. Stops at the first failure.
int run(const config::AppConfig& cfg, const std::vector<std::string>& values,
        logging::Logger& log, std::FILE* out);

} // namespace zeroalign::app
