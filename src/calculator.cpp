#include "rpncalc/calculator.hpp"
#include "rpncalc/evaluator.hpp"
#include "rpncalc/lexer.hpp"
#include "rpncalc/postfix.hpp"

#include <cctype>
#include <exception>
#include <string>

namespace rpncalc {

static std::string strip_whitespace(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s)
        if (!std::isspace(static_cast<unsigned char>(c))) out.push_back(c);
    return out;
}

bool parentheses_balanced(std::string_view text) {
    long depth = 0;
    for (char c : text) {
        if (c == '(') {
            ++depth;
        } else if (c == ')') {
            if (depth == 0) return false;
            --depth;
        }
    }
    return depth == 0;
}

Number calculate(std::string_view expression) {
    try {
        const std::string text = strip_whitespace(expression);
        if (text.empty()) throw InvalidExpression(ErrorCode::EmptyExpression);
        if (!parentheses_balanced(text)) throw InvalidExpression(ErrorCode::UnbalancedParentheses);

        auto tokens = tokenize(text);
        auto rpn = to_postfix(tokens);
        return evaluate_postfix(rpn);
    } catch (const CalculatorError&) {
        throw;
    } catch (const std::exception& e) {
        throw CalculatorError(ErrorCode::Unknown, e.what());
    }
}

} // namespace rpncalc
