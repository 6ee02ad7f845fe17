#include "rpncalc/repl.hpp"
#include "rpncalc/calculator.hpp"

#include <algorithm>
#include <cctype>

#include <fmt/format.h>
#include <fmt/ostream.h>

namespace rpncalc {

static std::string trim(const std::string& s) {
    auto not_space = [](char c) { return !std::isspace(static_cast<unsigned char>(c)); };
    auto b = std::find_if(s.begin(), s.end(), not_space);
    auto e = std::find_if(s.rbegin(), s.rend(), not_space).base();
    return b < e ? std::string(b, e) : std::string{};
}

static std::string lower(std::string s) {
    for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

static bool is_exit_command(const std::string& line, const ReplOptions& opts) {
    const std::string key = lower(line);
    for (const auto& cmd : opts.exit_commands)
        if (lower(cmd) == key) return true;
    return false;
}

std::string format_result(const Number& n) {
    return fmt::format("Result: {}", to_string(n));
}

int run_repl(std::istream& in, std::ostream& out, const ReplOptions& opts) {
    fmt::print(out, "{}\n", opts.welcome);

    std::string line;
    for (;;) {
        fmt::print(out, "{}", opts.prompt);
        out.flush();
        if (!std::getline(in, line)) break;

        const std::string expr = trim(line);
        if (is_exit_command(expr, opts)) {
            fmt::print(out, "{}\n", opts.farewell);
            break;
        }
        if (expr.empty()) continue;

        try {
            fmt::print(out, "{}\n", format_result(calculate(expr)));
        } catch (const CalculatorError& e) {
            fmt::print(out, "Error: {}\n", e.what());
        }
    }
    return 0;
}

} // namespace rpncalc
