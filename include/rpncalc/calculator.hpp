#pragma once
#include <string_view>
#include "rpncalc/errors.hpp"
#include "rpncalc/number.hpp"

namespace rpncalc {

/// True when every ')' closes an earlier '(' and none stay open.
bool parentheses_balanced(std::string_view text);

/// Strip whitespace, pre-check brackets, then tokenize -> to_postfix ->
/// evaluate_postfix.
/// CalculatorError and its subclasses propagate unchanged; any other
/// std::exception is rethrown as CalculatorError(ErrorCode::Unknown).
Number calculate(std::string_view expression);

} // namespace rpncalc
