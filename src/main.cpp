/*
 * zeroalign command-line entry point
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#include <cstdio>

#include <fmt/format.h>

#include <zeroalign/app/runner.hpp>
#include <zeroalign/cli/args.hpp>
#include <zeroalign/logging/fmt_logger.hpp>

int main(int argc, char** argv) {
    zeroalign::logging::FmtLogger log;
    auto parsed = zeroalign::cli::parse(argc, argv, log);
    if (parsed.show_only) {
        return zeroalign::app::kExitOk;
    }
    if (!parsed.opts.has_value()) {
        return zeroalign::app::kExitInvalid;
    }
    log.set_debug(parsed.debug);

    zeroalign::config::AppConfig cfg;
    auto errs = zeroalign::app::resolve_config(parsed, cfg);
    if (!errs.empty()) {
        for (const auto& e : errs) log.error(fmt::format("Config: {}", e));
        return zeroalign::app::kExitInvalid;
    }
    return zeroalign::app::run(cfg, parsed.opts->values, log, stdout);
}
