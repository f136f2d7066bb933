/// @file src/main.cpp
/// @brief hypercube CLI entry point.
///
/// Usage:
///   hypercube --stream     Execute commands read from stdin, one per line
///   hypercube --demo       Run the built-in unit-economics demonstration
///   hypercube --help       Print usage

#include "hypercube/engine.hpp"
#include "hypercube/log.hpp"
#include "hypercube/script.hpp"

#include <fmt/core.h>

#include <iostream>
#include <string>
#include <string_view>

namespace {

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  hypercube --stream [--verbose]   Execute commands from stdin\n"
        "  hypercube --demo [--verbose]     Run the built-in demonstration\n"
        "  hypercube --help                 Show this help\n"
        "\n"
        "Commands:\n"
        "  dimension <name> <member>,...\n"
        "  metric <id> [name=..] [category=..] [dims=<dim>,...]\n"
        "  formula <id> <expression>\n"
        "  horizon <month>,...\n"
        "  input <id> <month> <value> [<dim>=<member>...] [@<actor>]\n"
        "  recompute | results [<dim>=<member>...] | trace [n]\n"
        "  chain <id> | dag | errors | validation on|off\n"
    );
}

/// Read commands from stdin and execute each as it arrives.
/// Returns 0 if every command succeeded, 1 otherwise.
int run_stream() {
    hypercube::core::Engine       engine;
    hypercube::core::ScriptRunner runner(engine);

    std::string line;
    std::size_t failures = 0;

    while (std::getline(std::cin, line)) {
        // Trim carriage return for Windows-style line endings.
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        const auto result = runner.execute_line(line);
        if (!result.output.empty()) {
            fmt::print(result.ok ? stdout : stderr, "{}", result.output);
        }
        if (!result.ok) {
            ++failures;
        }
    }

    fmt::print(stderr, "{} command(s) failed\n", failures);
    return failures == 0 ? 0 : 1;
}

/// Run the demonstration script, echoing each command before its output.
int run_demo() {
    hypercube::core::Engine       engine;
    hypercube::core::ScriptRunner runner(engine);

    const std::string_view script = hypercube::core::demo_script();
    std::size_t start = 0;
    while (start < script.size()) {
        std::size_t nl = script.find('\n', start);
        if (nl == std::string_view::npos) {
            nl = script.size();
        }
        const std::string_view line = script.substr(start, nl - start);
        start = nl + 1;

        if (line.empty()) {
            fmt::print("\n");
            continue;
        }
        fmt::print("> {}\n", line);
        const auto result = runner.execute_line(line);
        fmt::print("{}", result.output);
    }
    return 0;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string mode(argv[1]);

    if (mode == "--help" || mode == "-h") {
        print_usage();
        return 0;
    }

    if (argc > 2 && std::string(argv[2]) == "--verbose") {
        hypercube::log::set_level(spdlog::level::debug);
    }

    if (mode == "--stream") {
        return run_stream();
    }

    if (mode == "--demo") {
        return run_demo();
    }

    fmt::print(stderr, "Unknown option: {}\n", mode);
    print_usage();
    return 1;
}
