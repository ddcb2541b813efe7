#include <zeroalign/config/loader.hpp>

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <zeroalign/config/validator.hpp>

namespace zeroalign::config {

static std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r");
    if (b == std::string::npos) return {};
    auto e = s.find_last_not_of(" \t\r");
    return s.substr(b, e - b + 1);
}

static bool is_known_key(const std::string& key) {
    return key == "precision" || key == "verbose" || key == "verdict" || key == "json";
}

// Range-checks before narrowing to int. Unsigned values are compared as uint64_t.
static bool json_precision(const nlohmann::json& v, int& out, std::string& err) {
    if (v.is_number_unsigned() && v.get<std::uint64_t>() > static_cast<std::uint64_t>(collapse::kMaxPrecision)) {
        err = fmt::format("precision {} out of range (0-{})", v.get<std::uint64_t>(), collapse::kMaxPrecision);
        return false;
    }
    const std::int64_t p = v.get<std::int64_t>();
    if (p < 0 || p > collapse::kMaxPrecision) {
        err = fmt::format("precision {} out of range (0-{})", p, collapse::kMaxPrecision);
        return false;
    }
    out = static_cast<int>(p);
    return validate_precision(out, err);
}

static void load_key_value(AppConfig& cfg, const std::string& text, std::vector<std::string>& errs) {
    std::istringstream iss(text);
    std::string line;
    int lineno = 0;
    while (std::getline(iss, line)) {
        ++lineno;
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        std::string key = trim(line.substr(0, eq));
        std::string val = trim(line.substr(eq + 1));
        std::string e;
        if (key == "precision") {
            int p = 0;
            if (!parse_int(val, p, e) || !validate_precision(p, e)) {
                errs.push_back(fmt::format("line {}: {}", lineno, e));
            } else {
                cfg.precision = p;
            }
        } else if (key == "verbose" || key == "verdict" || key == "json") {
            bool b = false;
            if (!parse_bool(val, b)) {
                errs.push_back(fmt::format("line {}: '{}' must be a boolean", lineno, key));
            } else if (key == "verbose") {
                cfg.verbose = b;
            } else if (key == "verdict") {
                cfg.verdict = b;
            } else {
                cfg.json = b;
            }
        } else {
            errs.push_back(fmt::format("line {}: unknown key '{}'", lineno, key));
        }
    }
}

static void load_json(AppConfig& cfg, const std::string& text, std::vector<std::string>& errs) {
    nlohmann::json j = nlohmann::json::parse(text);
    if (!j.is_object()) {
        errs.push_back("config root must be a JSON object");
        return;
    }
    auto expect_bool = [&](const char* key) {
        if (j.contains(key) && !j.at(key).is_boolean()) {
            errs.push_back(fmt::format("'{}' must be a boolean", key));
        }
    };
    expect_bool("verbose");
    expect_bool("verdict");
    expect_bool("json");
    for (const auto& item : j.items()) {
        if (!is_known_key(item.key())) errs.push_back(fmt::format("unknown key '{}'", item.key()));
    }
    int precision = cfg.precision;
    if (j.contains("precision")) {
        if (!j.at("precision").is_number_integer()) {
            errs.push_back("'precision' must be an integer");
        } else {
            std::string e;
            if (!json_precision(j.at("precision"), precision, e)) errs.push_back(e);
        }
    }
    if (!errs.empty()) return;
    cfg.precision = precision;
    if (j.contains("verbose")) cfg.verbose = j.at("verbose").get<bool>();
    if (j.contains("verdict")) cfg.verdict = j.at("verdict").get<bool>();
    if (j.contains("json")) cfg.json = j.at("json").get<bool>();
}

std::vector<std::string> load_from_file(AppConfig& cfg, const std::string& path) {
    std::vector<std::string> errs;
    std::ifstream in(path);
    if (!in.good()) return errs; // optional

    std::stringstream buffer; buffer << in.rdbuf();
    std::string text = buffer.str();
    auto first_non_space = text.find_first_not_of(" \t\n\r");
    if (first_non_space == std::string::npos) return errs;

    AppConfig staged = cfg;
    if (text[first_non_space] == '{') {
        try {
            load_json(staged, text, errs);
        } catch (const std::exception& ex) {
            errs.push_back(fmt::format("failed to read {}: {}", path, ex.what()));
        }
    } else {
        load_key_value(staged, text, errs);
    }
    if (errs.empty()) cfg = staged;
    return errs;
}

std::vector<std::string> apply_env_overrides(AppConfig& cfg) {
    std::vector<std::string> errs;
    if (const char* v = std::getenv("ZEROALIGN_PRECISION")) {
        int p = 0;
        std::string e;
        if (parse_int(v, p, e) && validate_precision(p, e)) cfg.precision = p;
        else errs.push_back(fmt::format("ZEROALIGN_PRECISION: {}", e));
    }
    if (const char* v = std::getenv("ZEROALIGN_VERBOSE")) {
        if (!parse_bool(v, cfg.verbose)) errs.push_back("ZEROALIGN_VERBOSE must be a boolean");
    }
    if (const char* v = std::getenv("ZEROALIGN_JSON")) {
        if (!parse_bool(v, cfg.json)) errs.push_back("ZEROALIGN_JSON must be a boolean");
    }
    return errs;
}

void apply_cli_overrides(AppConfig& cfg, const CliOptions& opts) {
    if (opts.precision) cfg.precision = *opts.precision;
    if (opts.verbose) cfg.verbose = true;
    if (opts.verdict) cfg.verdict = true;
    if (opts.json) cfg.json = true;
}

std::vector<std::string> validate_final(const AppConfig& cfg) {
    std::vector<std::string> errs;
    std::string e;
    if (!validate_precision(cfg.precision, e)) errs.push_back(e);
    return errs;
}

} // namespace zeroalign::config
