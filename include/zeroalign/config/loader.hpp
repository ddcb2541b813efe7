#pragma once

#include <string>
#include <vector>

#include <zeroalign/config/types.hpp>

namespace zeroalign::config {

// Read configuration from file (JSON or key=value). Returns list of validation errors (empty if ok).
// A missing file is not an error. Nothing is applied when errors are returned.
std::vector<std::string> load_from_file(AppConfig& cfg, const std::string& path);

// Apply ZEROALIGN_* environment variables (PRECISION, VERBOSE, JSON) on top of current cfg.
std::vector<std::string> apply_env_overrides(AppConfig& cfg);

// Apply command-line settings, highest precedence.
void apply_cli_overrides(AppConfig& cfg, const CliOptions& opts);

// Validate final config. Returns list of errors.
std::vector<std::string> validate_final(const AppConfig& cfg);

} // namespace zeroalign::config
