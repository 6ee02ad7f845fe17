#include "rpncalc/messages.hpp"

#include <fmt/format.h>

namespace rpncalc {

std::string format_message(ErrorCode code, std::string_view detail) {
    switch (code) {
        case ErrorCode::EmptyExpression:       return "Empty expression";
        case ErrorCode::InvalidSymbol:         return fmt::format("Invalid symbol: '{}'", detail);
        case ErrorCode::InvalidNumber:         return fmt::format("Invalid number: '{}'", detail);
        case ErrorCode::UnbalancedParentheses: return "Unbalanced parentheses";
        case ErrorCode::NotEnoughOperands:     return fmt::format("Not enough operands for operator '{}'", detail);
        case ErrorCode::IncompleteExpression:  return "Invalid expression";
        case ErrorCode::IntegerOperation:      return fmt::format("Operator '{}' requires integer operands", detail);
        case ErrorCode::DivisionByZero:        return "Division by zero";
        case ErrorCode::Unknown:               return fmt::format("Unknown error: {}", detail);
    }
    return fmt::format("Unknown error: {}", detail);
}

} // namespace rpncalc
