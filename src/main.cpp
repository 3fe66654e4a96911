#include "calculator.hpp"
#include "ui.hpp"

#include <ftxui/component/screen_interactive.hpp>

#include <cctype>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

static const std::string VERSION = "1.0.0";

struct Options {
    calculator::Settings      settings;
    calculator::Operation     op = calculator::Operation::Convert;
    std::vector<std::string>  operands;
};

enum class ParseResult { Run, Exit, Fail };

static void print_usage(const char *argv0) {
    std::cerr << "padic_calc " << VERSION << "\n"
              << "Usage: " << argv0 << " [options] [operand ...]\n\n"
              << "Without operands an interactive screen is started.\n\n"
              << "Options:\n"
              << "  -p, --prime <p>         Prime of the p-adic field (default 5)\n"
              << "  -n, --precision <n>     Digits kept after the valuation (default 20)\n"
              << "  -s, --show <n>          Terms printed in series notation (default 10)\n"
              << "  -o, --op <name>         convert (default), add, subtract, multiply,\n"
              << "                          divide or compare; binary ops take two operands\n"
              << "  -d, --debug <1|2>       Trace evaluation on stderr\n"
              << "  -h, --help              Show this help message\n\n"
              << "Operands are rationals (\"-3/7\") or series (\"1/5 + 2 + 3*5 + O(5^3)\").\n";
}

// Positive number following option arg
static bool read_positive(const std::string &arg, const char *value, long &out) {
    try {
        size_t used = 0;
        long v = std::stol(value, &used);
        if (used != std::string(value).size() || v <= 0)
            throw std::invalid_argument("must be a positive integer");
        out = v;
        return true;
    } catch (const std::exception &e) {
        std::cerr << "Error: invalid value for " << arg << ": " << value
                  << " (" << e.what() << ")\n";
        return false;
    }
}

static ParseResult parse_command_line(int argc, char *argv[], Options &opts) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return ParseResult::Exit;
        }

        bool takes_value = (arg == "-p" || arg == "--prime" ||
                            arg == "-n" || arg == "--precision" ||
                            arg == "-s" || arg == "--show" ||
                            arg == "-o" || arg == "--op" ||
                            arg == "-d" || arg == "--debug");
        if (takes_value && i + 1 >= argc) {
            std::cerr << "Error: " << arg << " requires a value.\n";
            return ParseResult::Fail;
        }

        if (arg == "-p" || arg == "--prime") {
            if (!read_positive(arg, argv[++i], opts.settings.prime)) return ParseResult::Fail;
        } else if (arg == "-n" || arg == "--precision") {
            if (!read_positive(arg, argv[++i], opts.settings.precision)) return ParseResult::Fail;
        } else if (arg == "-s" || arg == "--show") {
            if (!read_positive(arg, argv[++i], opts.settings.show_digits)) return ParseResult::Fail;
        } else if (arg == "-o" || arg == "--op") {
            try {
                opts.op = calculator::operation_from_name(argv[++i]);
            } catch (const std::exception &e) {
                std::cerr << "Error: " << e.what() << "\n";
                return ParseResult::Fail;
            }
        } else if (arg == "-d" || arg == "--debug") {
            std::string level = argv[++i];
            if (level == "1") opts.settings.debug_level = 1;
            else if (level == "2") opts.settings.debug_level = 2;
            else {
                std::cerr << "Error: " << arg << " must be 1 or 2.\n";
                return ParseResult::Fail;
            }
        } else if (arg.size() > 1 && arg[0] == '-' && !std::isdigit(static_cast<unsigned char>(arg[1]))) {
            // "-3/7" is an operand, "-x" an unknown switch
            std::cerr << "Error: Unknown option: " << arg << "\n";
            return ParseResult::Fail;
        } else {
            opts.operands.push_back(arg);
        }
    }
    return ParseResult::Run;
}

static void print_rows(const std::vector<calculator::Row> &rows) {
    for (const auto &[name, value] : rows)
        std::cout << name << ": " << value << "\n";
}

static int run_batch(const Options &opts) {
    const calculator::Settings &st = opts.settings;
    if (st.debug_level >= 2) {
        std::cerr << "[batch] p = " << st.prime << ", precision = " << st.precision
                  << ", shown = " << st.show_digits << "\n";
    }

    try {
        if (opts.op == calculator::Operation::Convert) {
            for (size_t i = 0; i < opts.operands.size(); ++i) {
                if (st.debug_level >= 1)
                    std::cerr << "[batch] converting \"" << opts.operands[i] << "\"\n";
                if (i > 0) std::cout << "\n";
                print_rows(calculator::evaluate(opts.op, opts.operands[i], "", st));
            }
            return 0;
        }

        if (opts.operands.size() != 2) {
            std::cerr << "Error: " << calculator::operation_names()[static_cast<int>(opts.op)]
                      << " needs exactly two operands, got " << opts.operands.size() << "\n";
            return 1;
        }
        if (st.debug_level >= 1) {
            std::cerr << "[batch] " << calculator::operation_names()[static_cast<int>(opts.op)]
                      << " \"" << opts.operands[0] << "\" \"" << opts.operands[1] << "\"\n";
        }
        print_rows(calculator::evaluate(opts.op, opts.operands[0], opts.operands[1], st));
        return 0;
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

int main(int argc, char *argv[]) {
    Options opts;
    switch (parse_command_line(argc, argv, opts)) {
    case ParseResult::Exit: return 0;
    case ParseResult::Fail: return 1;
    case ParseResult::Run:  break;
    }

    if (!opts.operands.empty()) return run_batch(opts);

    // the screen re-checks the prime on every redraw
    if (opts.settings.prime > calculator::MAX_INTERACTIVE_PRIME) {
        std::cerr << "Error: the interactive screen takes primes up to "
                  << calculator::MAX_INTERACTIVE_PRIME << "; pass operands for batch mode.\n";
        return 1;
    }

    auto screen = ftxui::ScreenInteractive::Fullscreen();
    ui::run(screen, opts.settings);
    return 0;
}
