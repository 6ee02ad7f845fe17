#include "rpncalc/postfix.hpp"
#include "rpncalc/errors.hpp"

#include <utility>

namespace rpncalc {

// Pop the stacked operator before pushing `cur`?
static bool should_pop(Op top, Op cur) {
    const OperatorInfo& t = operator_info(top);
    const OperatorInfo& c = operator_info(cur);
    if (t.precedence > c.precedence) return true;
    return t.precedence == c.precedence && c.assoc == Assoc::Left;
}

std::vector<Token> to_postfix(const std::vector<Token>& tokens) {
    std::vector<Token> output;
    std::vector<Token> opstack;
    output.reserve(tokens.size());

    for (const auto& t : tokens) {
        switch (t.kind) {
            case TokKind::Number:
                output.push_back(t);
                break;

            case TokKind::Operator:
                while (!opstack.empty() && opstack.back().kind == TokKind::Operator
                       && should_pop(opstack.back().op, t.op)) {
                    output.push_back(std::move(opstack.back()));
                    opstack.pop_back();
                }
                opstack.push_back(t);
                break;

            case TokKind::LParen:
                opstack.push_back(t);
                break;

            case TokKind::RParen:
                while (!opstack.empty() && opstack.back().kind != TokKind::LParen) {
                    output.push_back(std::move(opstack.back()));
                    opstack.pop_back();
                }
                if (opstack.empty()) throw InvalidExpression(ErrorCode::UnbalancedParentheses);
                opstack.pop_back(); // pop '('
                break;
        }
    }

    while (!opstack.empty()) {
        if (opstack.back().kind == TokKind::LParen) throw InvalidExpression(ErrorCode::UnbalancedParentheses);
        output.push_back(std::move(opstack.back()));
        opstack.pop_back();
    }
    return output;
}

} // namespace rpncalc
