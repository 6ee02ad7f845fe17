#pragma once
#include <stdexcept>
#include <string>

namespace rpncalc {

enum class ErrorCode {
    EmptyExpression,
    InvalidSymbol,
    InvalidNumber,
    UnbalancedParentheses,
    NotEnoughOperands,
    IncompleteExpression,
    IntegerOperation,
    DivisionByZero,
    Unknown,
};

/// Base of every error raised by the calculator. what() is the rendered
/// message; code() and detail() keep the raw parts for callers that format
/// their own text.
class CalculatorError : public std::runtime_error {
public:
    explicit CalculatorError(ErrorCode code, std::string detail = {});

    ErrorCode code() const noexcept { return code_; }
    const std::string& detail() const noexcept { return detail_; }

private:
    ErrorCode code_;
    std::string detail_;
};

struct InvalidExpression : CalculatorError { using CalculatorError::CalculatorError; };
struct DivisionByZero : CalculatorError {
    DivisionByZero() : CalculatorError(ErrorCode::DivisionByZero) {}
};

} // namespace rpncalc
