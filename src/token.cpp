#include "rpncalc/token.hpp"

namespace rpncalc {

bool operator==(const Token& a, const Token& b) {
    if (a.kind != b.kind) return false;
    switch (a.kind) {
        case TokKind::Number:   return a.text == b.text;
        case TokKind::Operator: return a.op == b.op;
        default:                return true;
    }
}

std::ostream& operator<<(std::ostream& os, const Token& t) {
    switch (t.kind) {
        case TokKind::Number: return os << t.text;
        case TokKind::LParen: return os << '(';
        case TokKind::RParen: return os << ')';
        case TokKind::Operator:
            if (is_unary(t.op)) os << 'u';
            return os << symbol(t.op);
    }
    return os;
}

} // namespace rpncalc
