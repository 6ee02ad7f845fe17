#include "rpncalc/lexer.hpp"
#include "rpncalc/errors.hpp"

#include <cctype>
#include <string>
#include <utility>

namespace rpncalc {

static bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}
static bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}
static bool starts_token(char c) {
    switch (c) {
        case '+': case '-': case '*': case '/': case '%': case '(': case ')':
            return true;
        default:
            return is_digit(c);
    }
}

void Lexer::skip_ws() {
    while (!is_end() && is_space(s_[i_])) ++i_;
}

std::optional<Token> Lexer::next() {
    skip_ws();
    if (is_end()) return std::nullopt;

    const char c = s_[i_];
    const bool doubled = i_ + 1 < s_.size() && s_[i_ + 1] == c;

    switch (c) {
        case '+': ++i_; return Token::oper(Op::Add);
        case '-': ++i_; return Token::oper(Op::Sub);
        case '%': ++i_; return Token::oper(Op::Mod);
        case '(': ++i_; return Token::lparen();
        case ')': ++i_; return Token::rparen();
        case '*':
            i_ += doubled ? 2 : 1;
            return Token::oper(doubled ? Op::Pow : Op::Mul);
        case '/':
            i_ += doubled ? 2 : 1;
            return Token::oper(doubled ? Op::FloorDiv : Op::Div);
        default: break;
    }

    if (is_digit(c)) return lex_number();

    throw InvalidExpression(ErrorCode::InvalidSymbol, std::string(invalid_run()));
}

// digits [ '.' digits ]
Token Lexer::lex_number() {
    std::size_t start = i_;
    while (!is_end() && is_digit(s_[i_])) ++i_;
    if (i_ + 1 < s_.size() && s_[i_] == '.' && is_digit(s_[i_ + 1])) {
        ++i_;
        while (!is_end() && is_digit(s_[i_])) ++i_;
    }

    std::string_view literal = s_.substr(start, i_ - start);
    if (!parse_number(literal)) throw InvalidExpression(ErrorCode::InvalidNumber, std::string(literal));
    return Token::number(std::string(literal));
}

// Longest run of characters that cannot start a token.
std::string_view Lexer::invalid_run() {
    std::size_t start = i_++;
    while (!is_end() && !is_space(s_[i_]) && !starts_token(s_[i_])) ++i_;
    return s_.substr(start, i_ - start);
}

std::vector<Token> tokenize(std::string_view expression) {
    Lexer lex(expression);
    std::vector<Token> tokens;

    while (auto t = lex.next()) {
        if (t->kind == TokKind::Operator && (t->op == Op::Add || t->op == Op::Sub)) {
            // Prefix position: start of input, after '(' or after any operator.
            const bool unary = tokens.empty()
                || tokens.back().kind == TokKind::LParen
                || tokens.back().kind == TokKind::Operator;
            if (unary) *t = Token::oper(t->op == Op::Add ? Op::Pos : Op::Neg);
        }
        tokens.push_back(std::move(*t));
    }
    return tokens;
}

} // namespace rpncalc
