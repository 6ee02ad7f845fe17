#include "rpncalc/evaluator.hpp"
#include "rpncalc/errors.hpp"

#include <string>
#include <utility>

namespace rpncalc {

static Number literal_value(const Token& t) {
    auto v = parse_number(t.text);
    if (!v) throw InvalidExpression(ErrorCode::InvalidNumber, t.text);
    return *v;
}

static void check_operands(Op op, const Number& left, const Number& right) {
    if (divides(op) && is_zero(right)) throw DivisionByZero();
    if (integer_only(op) && (!is_integer(left) || !is_integer(right)))
        throw InvalidExpression(ErrorCode::IntegerOperation, std::string(symbol(op)));
}

Number evaluate_postfix(const std::vector<Token>& rpn) {
    std::vector<Number> st;
    st.reserve(rpn.size());

    auto pop = [&]() -> Number {
        Number v = std::move(st.back());
        st.pop_back();
        return v;
    };

    for (const auto& t : rpn) {
        switch (t.kind) {
            case TokKind::Number:
                st.push_back(literal_value(t));
                break;

            case TokKind::Operator: {
                const OperatorInfo& info = operator_info(t.op);
                const std::size_t need = info.arity == Arity::Unary ? 1 : 2;
                if (st.size() < need)
                    throw InvalidExpression(ErrorCode::NotEnoughOperands, std::string(info.symbol));

                if (info.arity == Arity::Unary) {
                    Number a = pop();
                    st.push_back(info.unary(a));
                } else {
                    Number b = pop();
                    Number a = pop();
                    check_operands(t.op, a, b);
                    st.push_back(info.binary(a, b));
                }
            } break;

            case TokKind::LParen:
            case TokKind::RParen:
                throw InvalidExpression(ErrorCode::UnbalancedParentheses);
        }
    }

    if (st.size() != 1) throw InvalidExpression(ErrorCode::IncompleteExpression);
    return st.back();
}

} // namespace rpncalc
