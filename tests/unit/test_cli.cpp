/*
 * Unit tests for command-line parsing and the collapse runner
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <cstdio>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include <zeroalign/app/runner.hpp>
#include <zeroalign/cli/args.hpp>

using namespace zeroalign;

namespace {

class RecordingLogger : public logging::Logger {
public:
    void info(std::string_view msg) override { infos.emplace_back(msg); }
    void warn(std::string_view msg) override { warns.emplace_back(msg); }
    void error(std::string_view msg) override { errors.emplace_back(msg); }
    void debug(std::string_view msg) override { debugs.emplace_back(msg); }

    std::vector<std::string> infos, warns, errors, debugs;
};

// Owns argv storage for cli::parse
struct Argv {
    std::vector<std::string> storage;
    std::vector<char*> ptrs;
    explicit Argv(std::vector<std::string> args) : storage(std::move(args)) {
        for (auto& s : storage) ptrs.push_back(s.data());
        ptrs.push_back(nullptr);
    }
    int argc() const { return static_cast<int>(storage.size()); }
    char** argv() { return ptrs.data(); }
};

struct Captured {
    int code;
    std::string out;
};

Captured run_captured(const config::AppConfig& cfg, const std::vector<std::string>& values,
                      logging::Logger& log) {
    std::FILE* f = std::tmpfile();
    REQUIRE(f != nullptr);
    int code = app::run(cfg, values, log, f);
    std::fflush(f);
    std::rewind(f);
    std::string text;
    char buf[512];
    std::size_t n;
    while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) text.append(buf, n);
    std::fclose(f);
    return {code, text};
}

} // namespace

TEST_SUITE("CLI Args") {
    TEST_CASE("normalize_args - values move after --") {
        Argv a({"zeroalign", "-999999.99999999", "--verbose", "24714.9130", "-p", "4", "-.5"});
        auto args = cli::normalize_args(a.argc(), a.argv());
        std::vector<std::string> expected{"zeroalign", "--verbose", "-p", "4", "--",
                                          "-999999.99999999", "24714.9130", "-.5"};
        CHECK(args == expected);
    }

    TEST_CASE("normalize_args - explicit separator") {
        Argv a({"zeroalign", "--json", "--", "--weird", "1"});
        auto args = cli::normalize_args(a.argc(), a.argv());
        std::vector<std::string> expected{"zeroalign", "--json", "--", "--weird", "1"};
        CHECK(args == expected);
    }

    TEST_CASE("parse - values and options") {
        RecordingLogger log;
        Argv a({"zeroalign", "--precision", "4", "--verdict", "-d", "-1.5", "2"});
        auto pr = cli::parse(a.argc(), a.argv(), log);
        REQUIRE(pr.opts.has_value());
        CHECK(pr.opts->precision == 4);
        CHECK(pr.opts->verdict);
        CHECK_FALSE(pr.opts->verbose);
        CHECK_FALSE(pr.opts->json);
        CHECK(pr.debug);
        CHECK(pr.config_path == "zeroalign.conf");
        CHECK(pr.opts->values == std::vector<std::string>{"-1.5", "2"});
        CHECK(log.errors.empty());
    }

    TEST_CASE("parse - negative infinity and nan are values") {
        RecordingLogger log;
        Argv a({"zeroalign", "-inf", "-nan"});
        auto pr = cli::parse(a.argc(), a.argv(), log);
        REQUIRE(pr.opts.has_value());
        CHECK(pr.opts->values.size() == 2);
    }

    TEST_CASE("parse - help and version") {
        RecordingLogger log;
        Argv h({"zeroalign", "--help"});
        auto pr = cli::parse(h.argc(), h.argv(), log);
        CHECK(pr.show_only);
        REQUIRE(log.infos.size() == 1);
        CHECK(log.infos[0].find("precision") != std::string::npos);

        Argv v({"zeroalign", "-v"});
        pr = cli::parse(v.argc(), v.argv(), log);
        CHECK(pr.show_only);
        CHECK(log.infos.back().find("zeroalign v") == 0);
    }

    TEST_CASE("parse - missing value and unknown option") {
        RecordingLogger log;
        Argv none({"zeroalign", "--verbose"});
        auto pr = cli::parse(none.argc(), none.argv(), log);
        CHECK_FALSE(pr.show_only);
        CHECK_FALSE(pr.opts.has_value());
        REQUIRE(log.errors.size() == 1);
        CHECK(log.errors[0].find("No input value") != std::string::npos);

        Argv bad({"zeroalign", "--bogus", "1"});
        pr = cli::parse(bad.argc(), bad.argv(), log);
        CHECK_FALSE(pr.opts.has_value());
        CHECK(log.errors.back().find("Argument error") != std::string::npos);
    }
}

TEST_SUITE("Collapse Runner") {
    TEST_CASE("run - prints status and result") {
        RecordingLogger log;
        config::AppConfig cfg;
        auto c = run_captured(cfg, {"24714.9130"}, log);
        CHECK(c.code == app::kExitOk);
        CHECK(c.out == "FIXED-POINT 8 STATUS: ACTIVE\nFINAL ALIGNMENT ERROR: 0\n");
        CHECK(log.errors.empty());
    }

    TEST_CASE("run - several values and precision") {
        RecordingLogger log;
        config::AppConfig cfg;
        cfg.precision = 2;
        auto c = run_captured(cfg, {"0", "-999999.99999999"}, log);
        CHECK(c.code == app::kExitOk);
        CHECK(c.out == "FIXED-POINT 2 STATUS: ACTIVE\nFINAL ALIGNMENT ERROR: 0\n"
                       "FIXED-POINT 2 STATUS: ACTIVE\nFINAL ALIGNMENT ERROR: 0\n");
    }

    TEST_CASE("run - verdict lines") {
        RecordingLogger log;
        config::AppConfig cfg;
        cfg.verdict = true;
        auto c = run_captured(cfg, {"1"}, log);
        CHECK(c.code == app::kExitOk);
        CHECK(c.out.find("VERDICT: ABSOLUTE NATURALNESS [O333 11.666666666667]\n") != std::string::npos);
        CHECK(c.out.find("Unit Zero confirmed.\n") != std::string::npos);
    }

    TEST_CASE("run - verbose trace goes to the logger") {
        RecordingLogger log;
        config::AppConfig cfg;
        cfg.verbose = true;
        auto c = run_captured(cfg, {"1.999999995"}, log);
        CHECK(c.code == app::kExitOk);
        REQUIRE(log.infos.size() == 7);
        CHECK(log.infos[0].find("[       INPUT]") == 0);
        CHECK(log.infos[1] == "[    QUANTIZE] Fixed-point: 199999999 (1.99999999)");
        CHECK(log.infos[6] == "[    COLLAPSE] Final result: 0");
    }

    TEST_CASE("run - verbose trace with verdict") {
        RecordingLogger log;
        config::AppConfig cfg;
        cfg.verbose = true;
        cfg.verdict = true;
        auto c = run_captured(cfg, {"24714.9130"}, log);
        CHECK(c.code == app::kExitOk);
        REQUIRE(log.infos.size() == 10);
        CHECK(log.infos[7] == "[     VERDICT] Status: ABSOLUTE NATURALNESS");
        CHECK(log.infos[8] == "[     VERDICT] Hash: 11.666666666667");
        CHECK(log.infos[9] == "[     VERDICT] Unit Zero confirmed.");
    }

    TEST_CASE("run - JSON report") {
        RecordingLogger log;
        config::AppConfig cfg;
        cfg.json = true;
        auto c = run_captured(cfg, {"24714.9130"}, log);
        CHECK(c.code == app::kExitOk);
        auto j = nlohmann::json::parse(c.out);
        CHECK(j.at("nucleus") == 0);
        CHECK(j.at("quantized") == 2471491300000LL);
        CHECK(j.at("verdict").at("status") == "ABSOLUTE NATURALNESS");
    }

    TEST_CASE("run - NaN is invalid input") {
        RecordingLogger log;
        config::AppConfig cfg;
        auto c = run_captured(cfg, {"nan"}, log);
        CHECK(c.code == app::kExitInvalid);
        CHECK(c.out.empty());
        REQUIRE(log.errors.size() == 1);
        CHECK(log.errors[0].find("Invalid input 'nan'") == 0);
        CHECK(log.errors[0].find("not a finite number") != std::string::npos);
    }

    TEST_CASE("run - non-numeric input") {
        RecordingLogger log;
        config::AppConfig cfg;
        auto c = run_captured(cfg, {"1", "twelve", "3"}, log);
        CHECK(c.code == app::kExitInvalid);
        CHECK(c.out == "FIXED-POINT 8 STATUS: ACTIVE\nFINAL ALIGNMENT ERROR: 0\n");
        REQUIRE(log.errors.size() == 1);
        CHECK(log.errors[0].find("not a number") != std::string::npos);
    }

    TEST_CASE("run - overflow") {
        RecordingLogger log;
        config::AppConfig cfg;
        auto c = run_captured(cfg, {"1e12"}, log);
        CHECK(c.code == app::kExitOverflow);
        CHECK(c.out.empty());
        REQUIRE(log.errors.size() == 1);
        CHECK(log.errors[0].find("Overflow") == 0);

        cfg.precision = 0;
        c = run_captured(cfg, {"1e12"}, log);
        CHECK(c.code == app::kExitOk);
    }

    TEST_CASE("resolve_config - CLI beats file defaults") {
        config::ParseResult pr;
        pr.config_path = "/nonexistent/zeroalign.conf";
        config::CliOptions opts;
        opts.precision = 3;
        opts.values = {"1"};
        pr.opts = opts;
        config::AppConfig cfg;
        auto errs = app::resolve_config(pr, cfg);
        CHECK(errs.empty());
        CHECK(cfg.precision == 3);

        pr.opts->precision = 40;
        config::AppConfig bad;
        errs = app::resolve_config(pr, bad);
        CHECK(errs.size() == 1);
    }
}
