#pragma once
#include <istream>
#include <ostream>
#include <string>
#include <vector>
#include "rpncalc/number.hpp"

namespace rpncalc {

struct ReplOptions {
    std::string prompt{"> "};
    std::string welcome{"rpncalc: enter an arithmetic expression (+ - * / // % **), or 'exit' to quit."};
    std::string farewell{"Goodbye!"};
    std::vector<std::string> exit_commands{"exit", "quit", "q"};
};

std::string format_result(const Number& n);

// Read-evaluate-print loop: one expression per line until EOF or an exit
// command. Errors are printed and the loop continues.
int run_repl(std::istream& in, std::ostream& out, const ReplOptions& opts = {});

} // namespace rpncalc
