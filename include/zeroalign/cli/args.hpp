#pragma once

#include <string>
#include <vector>

#include <zeroalign/config/types.hpp>
#include <zeroalign/logging/logger.hpp>

namespace zeroalign::cli {

// Parse CLI using cxxopts. Writes help/version through provided logger when requested.
zeroalign::config::ParseResult parse(int argc, char** argv, zeroalign::logging::Logger& log);

// Reorders argv so that every input value follows "--". Negative numbers such as
// "-999999.99999999" would otherwise be read as short options.
std::vector<std::string> normalize_args(int argc, char** argv);

} // namespace zeroalign::cli
