#include <rpncalc/calculator.hpp>
#include <rpncalc/repl.hpp>

#include <iostream>
#include <string>

#include <fmt/format.h>

// rpncalc            -> interactive loop on stdin/stdout
// rpncalc <expr...>  -> evaluate the joined arguments once
int main(int argc, char** argv) {
    if (argc < 2) return rpncalc::run_repl(std::cin, std::cout);

    std::string expr;
    for (int i = 1; i < argc; ++i) {
        if (i > 1) expr += ' ';
        expr += argv[i];
    }

    try {
        fmt::print("{}\n", rpncalc::to_string(rpncalc::calculate(expr)));
    } catch (const rpncalc::CalculatorError& e) {
        fmt::print(stderr, "Error: {}\n", e.what());
        return 1;
    }
    return 0;
}
