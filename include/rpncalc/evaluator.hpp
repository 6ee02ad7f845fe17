#pragma once
#include <vector>
#include "rpncalc/number.hpp"
#include "rpncalc/token.hpp"

namespace rpncalc {

/// Evaluate a postfix token stream with a value stack.
/// Throws InvalidExpression on missing operands, leftover values or Float
/// operands to '//' and '%'; DivisionByZero on a zero divisor.
Number evaluate_postfix(const std::vector<Token>& rpn);

} // namespace rpncalc
