#pragma once
#include <optional>
#include <string_view>
#include <vector>
#include "rpncalc/token.hpp"

namespace rpncalc {

// Raw scanner: every '+'/'-' comes out as the binary operator.
class Lexer {
public:
    explicit Lexer(std::string_view s) : s_(s) {}

    /// Next token, or nullopt once the input is exhausted.
    /// Throws InvalidExpression on text that is not a token.
    std::optional<Token> next();

private:
    void skip_ws();
    bool is_end() const { return i_ >= s_.size(); }

    Token lex_number();
    std::string_view invalid_run();

    std::string_view s_;
    std::size_t i_{0};
};

/// Scan `expression` and retag prefix '+'/'-' as unary operators.
std::vector<Token> tokenize(std::string_view expression);

} // namespace rpncalc
