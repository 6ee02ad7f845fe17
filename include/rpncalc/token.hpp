#pragma once
#include <ostream>
#include <string>
#include <utility>
#include "rpncalc/operators.hpp"

namespace rpncalc {

enum class TokKind {
    Number,
    Operator,
    LParen,
    RParen,
};

struct Token {
    TokKind kind{TokKind::Number};
    std::string text{}; // Number literal as written
    Op op{Op::Add};     // Operator

    static Token number(std::string literal) { return {TokKind::Number, std::move(literal), Op::Add}; }
    static Token oper(Op o) { return {TokKind::Operator, std::string(symbol(o)), o}; }
    static Token lparen() { return {TokKind::LParen, "(", Op::Add}; }
    static Token rparen() { return {TokKind::RParen, ")", Op::Add}; }
};

bool operator==(const Token& a, const Token& b);
inline bool operator!=(const Token& a, const Token& b) { return !(a == b); }

// Unary operators print as "u+" / "u-" so token dumps stay unambiguous.
std::ostream& operator<<(std::ostream& os, const Token& t);

} // namespace rpncalc
