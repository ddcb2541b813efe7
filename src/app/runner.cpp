#include <zeroalign/app/runner.hpp>

#include <stdexcept>

#include <fmt/format.h>

#include <zeroalign/collapse/collapse.hpp>
#include <zeroalign/config/loader.hpp>
#include <zeroalign/config/validator.hpp>
#include <zeroalign/errors.hpp>
#include <zeroalign/fixed_point.hpp>
#include <zeroalign/logging/fmt_logger.hpp>
#include <zeroalign/report.hpp>

namespace zeroalign::app {

std::vector<std::string> resolve_config(const config::ParseResult& pr, config::AppConfig& cfg) {
    // Config file, then env, then CLI (lowest to highest precedence)
    auto errs = config::load_from_file(cfg, pr.config_path);
    auto env_errs = config::apply_env_overrides(cfg);
    errs.insert(errs.end(), env_errs.begin(), env_errs.end());
    if (pr.opts) config::apply_cli_overrides(cfg, *pr.opts);
    auto final_errs = config::validate_final(cfg);
    errs.insert(errs.end(), final_errs.begin(), final_errs.end());
    return errs;
}

static void log_trace(const report::AlignmentReport& r, bool with_verdict, logging::Logger& log) {
    const auto& t = r.trace;
    log.info(logging::tagged("INPUT", fmt::format("Flux received: {}", r.input)));
    log.info(logging::tagged("QUANTIZE", fmt::format("Fixed-point: {} ({})", t.quantized,
                                                     format_decimal<std::int64_t>(t.quantized, t.precision))));
    for (std::size_t i = 0; i < t.stages.size(); ++i) {
        log.info(logging::tagged("COLLAPSE", fmt::format("Step{}: {}", i + 1, t.stages[i])));
    }
    log.info(logging::tagged("COLLAPSE", fmt::format("Final result: {}", t.result)));
    if (!with_verdict) return;
    log.info(logging::tagged("VERDICT", fmt::format("Status: {}", r.verdict.status)));
    log.info(logging::tagged("VERDICT", fmt::format("Hash: {}", r.verdict.integrity_hash)));
    log.info(logging::tagged("VERDICT", r.verdict.message));
}

static void print_text(const report::AlignmentReport& r, bool with_verdict, std::FILE* out) {
    fmt::print(out, "FIXED-POINT {} STATUS: ACTIVE\n", r.trace.precision);
    fmt::print(out, "FINAL ALIGNMENT ERROR: {}\n", r.trace.result);
    if (with_verdict) {
        fmt::print(out, "VERDICT: {} [{} {}]\n", r.verdict.status, r.verdict.code, r.verdict.integrity_hash);
        fmt::print(out, "{}\n", r.verdict.message);
    }
}

int run(const config::AppConfig& cfg, const std::vector<std::string>& values,
        logging::Logger& log, std::FILE* out) {
    const std::string session = report::session_id();
    log.debug(fmt::format("session {} precision {} values {}", session, cfg.precision, values.size()));

    for (const auto& raw : values) {
        double input = 0.0;
        std::string err;
        if (!config::parse_input_value(raw, input, err)) {
            log.error(fmt::format("Invalid input '{}': {}", raw, err));
            return kExitInvalid;
        }
        try {
            auto r = report::make_report(input, cfg.precision, session);
            if (cfg.json) {
                fmt::print(out, "{}\n", report::to_json(r).dump(2));
                continue;
            }
            if (cfg.verbose) log_trace(r, cfg.verdict, log);
            print_text(r, cfg.verdict, out);
        } catch (const InvalidInput& e) {
            log.error(fmt::format("Invalid input '{}': {}", raw, e.what()));
            return kExitInvalid;
        } catch (const Overflow& e) {
            log.error(fmt::format("Overflow for '{}' at precision {}: {}", raw, cfg.precision, e.what()));
            return kExitOverflow;
        } catch (const std::out_of_range& e) {
            log.error(fmt::format("Invalid precision: {}", e.what()));
            return kExitInvalid;
        }
    }
    std::fflush(out);
    return kExitOk;
}

} // namespace zeroalign::app
