#include <zeroalign/cli/args.hpp>

#include <algorithm>
#include <cctype>
#include <string>

#include <cxxopts.hpp>
#include <fmt/format.h>

#ifndef ZEROALIGN_VERSION
#define ZEROALIGN_VERSION "0.0.0"
#endif

namespace zeroalign::cli {

static bool looks_like_negative_value(const std::string& arg) {
    if (arg.size() < 2 || arg[0] != '-') return false;
    unsigned char c = static_cast<unsigned char>(arg[1]);
    if (std::isdigit(c)) return true;
    if (c == '.' && arg.size() > 2 && std::isdigit(static_cast<unsigned char>(arg[2]))) return true;
    std::string rest = arg.substr(1);
    std::transform(rest.begin(), rest.end(), rest.begin(), [](unsigned char ch) { return std::tolower(ch); });
    return rest == "inf" || rest == "infinity" || rest == "nan";
}

static bool takes_argument(const std::string& arg) {
    return arg == "-p" || arg == "--precision" || arg == "--config";
}

std::vector<std::string> normalize_args(int argc, char** argv) {
    std::vector<std::string> options;
    std::vector<std::string> values;
    if (argc > 0) options.emplace_back(argv[0]);
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--") {
            for (++i; i < argc; ++i) values.emplace_back(argv[i]);
            break;
        }
        if (takes_argument(arg)) {
            options.push_back(arg);
            if (i + 1 < argc) options.emplace_back(argv[++i]);
        } else if (looks_like_negative_value(arg) || arg.empty() || arg[0] != '-') {
            values.push_back(arg);
        } else {
            options.push_back(arg);
        }
    }
    if (!values.empty()) {
        options.emplace_back("--");
        options.insert(options.end(), values.begin(), values.end());
    }
    return options;
}

zeroalign::config::ParseResult parse(int argc, char** argv, zeroalign::logging::Logger& log) {
    zeroalign::config::ParseResult pr;
    cxxopts::Options options("zeroalign", "Fixed-point quantization with attenuation to Unit Zero");
    options.positional_help("<value> [<value>...]");
    // clang-format off
    options.add_options()
        ("p,precision", "Fractional decimal digits (0-18)", cxxopts::value<int>())
        ("config",  "Path to config file (zeroalign.conf)", cxxopts::value<std::string>()->default_value("zeroalign.conf"))
        ("verbose", "Print the stage trace")
        ("verdict", "Print the Unit Zero verdict")
        ("json",    "Print a JSON report per value")
        ("d,debug", "Enable debug logging")
        ("v,version", "Show version and exit")
        ("h,help",    "Show help and exit")
        ("values",  "Input values", cxxopts::value<std::vector<std::string>>());
    // clang-format on
    options.parse_positional({"values"});

    std::vector<std::string> args = normalize_args(argc, argv);
    std::vector<char*> ptrs;
    ptrs.reserve(args.size());
    for (auto& a : args) ptrs.push_back(a.data());

    try {
        int n = static_cast<int>(ptrs.size());
        char** av = ptrs.data();
        auto result = options.parse(n, av);
        if (result.count("help")) {
            log.info(options.help());
            pr.show_only = true;
            return pr;
        }
        if (result.count("version")) {
            log.info(fmt::format("zeroalign v{}", ZEROALIGN_VERSION));
            pr.show_only = true;
            return pr;
        }
        zeroalign::config::CliOptions opts;
        if (result.count("precision")) opts.precision = result["precision"].as<int>();
        opts.verbose = result.count("verbose") > 0;
        opts.verdict = result.count("verdict") > 0;
        opts.json = result.count("json") > 0;
        if (result.count("values")) opts.values = result["values"].as<std::vector<std::string>>();
        pr.config_path = result["config"].as<std::string>();
        pr.debug = result.count("debug") > 0;
        if (opts.values.empty()) {
            log.error(fmt::format("No input value given.\n\n{}", options.help()));
            return pr;
        }
        pr.opts = opts;
    } catch (const std::exception& e) {
        log.error(fmt::format("Argument error: {}\n\n{}", e.what(), options.help()));
        return pr;
    }
    return pr;
}

} // namespace zeroalign::cli
