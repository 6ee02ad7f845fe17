#pragma once
#include <vector>
#include "rpncalc/token.hpp"

namespace rpncalc {

// Shunting-yard: reorder an infix token stream into postfix (RPN).
// Throws InvalidExpression on unbalanced parentheses.
std::vector<Token> to_postfix(const std::vector<Token>& tokens);

} // namespace rpncalc
