#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace rpncalc {

// Integer or Float. The alternative is decided once, when a literal is parsed.
using Number = std::variant<std::int64_t, double>;

inline bool is_integer(const Number& n) { return std::holds_alternative<std::int64_t>(n); }
inline bool is_float(const Number& n) { return std::holds_alternative<double>(n); }

double to_double(const Number& n);
bool is_zero(const Number& n);

/// Parse a decimal literal ("42", "3.14"). Text containing '.' becomes a Float,
/// anything else an Integer. Returns nullopt for malformed or out-of-range text.
std::optional<Number> parse_number(std::string_view text);

/// Python-like rendering: integers as-is, floats always carry a '.' or exponent.
std::string to_string(const Number& n);

// Arithmetic kernels used by the operator table.
// Non-domain failures (overflow, non-real results) are reported with
// std::overflow_error / std::domain_error.
Number add(const Number& a, const Number& b);
Number sub(const Number& a, const Number& b);
Number mul(const Number& a, const Number& b);
Number true_div(const Number& a, const Number& b);
Number floor_div(const Number& a, const Number& b);
Number mod(const Number& a, const Number& b);
Number power(const Number& a, const Number& b);
Number pos(const Number& a);
Number neg(const Number& a);

} // namespace rpncalc
