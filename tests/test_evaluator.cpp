#include <gtest/gtest.h>
#include <rpncalc/errors.hpp>
#include <rpncalc/evaluator.hpp>

#include <cstdint>
#include <stdexcept>
#include <vector>

namespace {

using rpncalc::Number;
using rpncalc::Op;
using rpncalc::Token;

Token n(const char* text) { return Token::number(text); }
Token op(Op o) { return Token::oper(o); }

std::int64_t eval_int(const std::vector<Token>& rpn) {
    Number v = rpncalc::evaluate_postfix(rpn);
    EXPECT_TRUE(rpncalc::is_integer(v));
    return rpncalc::is_integer(v) ? std::get<std::int64_t>(v) : 0;
}

double eval_float(const std::vector<Token>& rpn) {
    Number v = rpncalc::evaluate_postfix(rpn);
    EXPECT_TRUE(rpncalc::is_float(v));
    return rpncalc::to_double(v);
}

TEST(Evaluator, BasicOperations) {
    EXPECT_EQ(eval_int({n("2"), n("2"), op(Op::Add)}), 4);
    EXPECT_EQ(eval_int({n("5"), n("3"), op(Op::Sub)}), 2);
    EXPECT_EQ(eval_int({n("4"), n("2"), op(Op::Mul)}), 8);
    EXPECT_DOUBLE_EQ(eval_float({n("10"), n("2"), op(Op::Div)}), 5.0);
}

TEST(Evaluator, PowerFloorDivisionModulo) {
    EXPECT_EQ(eval_int({n("2"), n("3"), op(Op::Pow)}), 8);
    EXPECT_EQ(eval_int({n("10"), n("3"), op(Op::FloorDiv)}), 3);
    EXPECT_EQ(eval_int({n("10"), n("3"), op(Op::Mod)}), 1);
}

TEST(Evaluator, UnaryOperations) {
    EXPECT_EQ(eval_int({n("5"), op(Op::Neg)}), -5);
    EXPECT_EQ(eval_int({n("3"), op(Op::Pos)}), 3);
    EXPECT_EQ(eval_int({n("2"), n("3"), op(Op::Neg), op(Op::Add)}), -1);
}

TEST(Evaluator, FloatOperations) {
    EXPECT_DOUBLE_EQ(eval_float({n("2.5"), n("2"), op(Op::Mul)}), 5.0);
    EXPECT_DOUBLE_EQ(eval_float({n("5.5"), n("2.5"), op(Op::Add)}), 8.0);
    EXPECT_DOUBLE_EQ(eval_float({n("10.0"), n("4.0"), op(Op::Div)}), 2.5);
}

TEST(Evaluator, DivisionByZero) {
    EXPECT_THROW(rpncalc::evaluate_postfix({n("5"), n("0"), op(Op::Div)}), rpncalc::DivisionByZero);
    EXPECT_THROW(rpncalc::evaluate_postfix({n("10"), n("0"), op(Op::FloorDiv)}), rpncalc::DivisionByZero);
    EXPECT_THROW(rpncalc::evaluate_postfix({n("5"), n("0"), op(Op::Mod)}), rpncalc::DivisionByZero);
    EXPECT_THROW(rpncalc::evaluate_postfix({n("5"), n("0.0"), op(Op::Div)}), rpncalc::DivisionByZero);
}

TEST(Evaluator, ZeroDivisorIsCheckedBeforeOperandTypes) {
    EXPECT_THROW(rpncalc::evaluate_postfix({n("10.5"), n("0"), op(Op::FloorDiv)}), rpncalc::DivisionByZero);
}

TEST(Evaluator, IntegerOnlyOperators) {
    EXPECT_THROW(rpncalc::evaluate_postfix({n("10.5"), n("3"), op(Op::FloorDiv)}), rpncalc::InvalidExpression);
    EXPECT_THROW(rpncalc::evaluate_postfix({n("10"), n("3.5"), op(Op::Mod)}), rpncalc::InvalidExpression);

    // Integer-valued floats are still floats.
    try {
        rpncalc::evaluate_postfix({n("10.0"), n("2"), op(Op::FloorDiv)});
        FAIL() << "expected InvalidExpression";
    } catch (const rpncalc::InvalidExpression& e) {
        EXPECT_EQ(e.code(), rpncalc::ErrorCode::IntegerOperation);
        EXPECT_EQ(e.detail(), "//");
    }
}

TEST(Evaluator, NotEnoughOperands) {
    EXPECT_THROW(rpncalc::evaluate_postfix({n("2"), op(Op::Add)}), rpncalc::InvalidExpression);
    EXPECT_THROW(rpncalc::evaluate_postfix({op(Op::Add)}), rpncalc::InvalidExpression);

    try {
        rpncalc::evaluate_postfix({op(Op::Neg)});
        FAIL() << "expected InvalidExpression";
    } catch (const rpncalc::InvalidExpression& e) {
        EXPECT_EQ(e.code(), rpncalc::ErrorCode::NotEnoughOperands);
        EXPECT_EQ(e.detail(), "-");
    }
}

TEST(Evaluator, LeftoverValues) {
    try {
        rpncalc::evaluate_postfix({n("2"), n("3")});
        FAIL() << "expected InvalidExpression";
    } catch (const rpncalc::InvalidExpression& e) {
        EXPECT_EQ(e.code(), rpncalc::ErrorCode::IncompleteExpression);
    }
    EXPECT_THROW(rpncalc::evaluate_postfix({}), rpncalc::InvalidExpression);
}

TEST(Evaluator, ParenthesisInPostfixIsRejected) {
    EXPECT_THROW(rpncalc::evaluate_postfix({Token::lparen(), n("1")}), rpncalc::InvalidExpression);
}

TEST(Evaluator, ArithmeticFailuresAreNotDomainErrors) {
    EXPECT_THROW(rpncalc::evaluate_postfix({n("9223372036854775807"), n("1"), op(Op::Add)}),
                 std::overflow_error);
}

} // namespace
