#include <infixcalc/evaluator.hpp>

#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <iostream>
#include <optional>
#include <string>
#include <variant>

namespace {

struct CliConfig {
    infixcalc::Options opts;
    std::optional<std::string> expression; // -e
    bool verbose{false};
    bool help{false};
};

void print_usage(const char* argv0) {
    std::cerr << "usage: " << argv0 << " [--boundary] [-v] [-e EXPR]\n"
              << "  Evaluates one infix expression per line from stdin, or EXPR.\n"
              << "  --boundary   tokens need not be separated by whitespace\n"
              << "  -v           debug logging (or set SPDLOG_LEVEL)\n";
}

// Returns false on a usage error.
bool parse_args(int argc, char** argv, CliConfig& cfg) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            cfg.help = true;
        } else if (arg == "--boundary") {
            cfg.opts.lex_mode = infixcalc::LexMode::Boundary;
        } else if (arg == "-v" || arg == "--verbose") {
            cfg.verbose = true;
        } else if (arg == "-e") {
            if (i + 1 >= argc) return false;
            cfg.expression = argv[++i];
        } else {
            return false;
        }
    }
    return true;
}

// Evaluates one line, prints the result. Returns false on failure.
bool run_line(const std::string& line, const infixcalc::Options& opts) {
    spdlog::debug("evaluating '{}'", line);
    infixcalc::Result r = infixcalc::try_evaluate(line, opts);
    if (std::holds_alternative<double>(r)) {
        std::cout << std::get<double>(r) << "\n";
        return true;
    }
    const auto& err = std::get<infixcalc::EvalError>(r);
    spdlog::error("{}: {}", infixcalc::to_string(err.kind()), err.what());
    return false;
}

} // namespace

int main(int argc, char** argv) {
    auto logger = spdlog::stderr_color_mt("infixcalc");
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%^%l%$] %v");

    CliConfig cfg;
    if (!parse_args(argc, argv, cfg)) {
        print_usage(argv[0]);
        return 2;
    }
    if (cfg.help) {
        print_usage(argv[0]);
        return 0;
    }
    if (cfg.verbose) spdlog::set_level(spdlog::level::debug);
    spdlog::cfg::load_env_levels();

    if (cfg.expression) return run_line(*cfg.expression, cfg.opts) ? 0 : 1;

    bool ok = true;
    std::string line;
    while (std::getline(std::cin, line)) {
        if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
        if (!run_line(line, cfg.opts)) ok = false;
    }
    return ok ? 0 : 1;
}
