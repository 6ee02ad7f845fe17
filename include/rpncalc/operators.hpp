#pragma once
#include <string_view>
#include "rpncalc/number.hpp"

namespace rpncalc {

enum class Op {
    Add,
    Sub,
    Mul,
    Div,      // '/', always yields Float
    FloorDiv, // '//', Integer operands only
    Mod,      // '%',  Integer operands only
    Pow,      // '**'
    Pos,      // unary +
    Neg,      // unary -
};

enum class Assoc { Left, Right };
enum class Arity { Unary, Binary };

using UnaryFn = Number (*)(const Number&);
using BinaryFn = Number (*)(const Number&, const Number&);

struct OperatorInfo {
    Op op;
    std::string_view symbol;
    int precedence; // higher binds tighter
    Assoc assoc;
    Arity arity;
    UnaryFn unary;   // set when arity == Unary
    BinaryFn binary; // set when arity == Binary
};

/// Descriptor lookup in the static operator table. The table is immutable.
const OperatorInfo& operator_info(Op op);

inline std::string_view symbol(Op op) { return operator_info(op).symbol; }
inline bool is_unary(Op op) { return operator_info(op).arity == Arity::Unary; }

/// Operators whose right operand must not be zero.
bool divides(Op op);
/// Operators accepting Integer operands only.
bool integer_only(Op op);

} // namespace rpncalc
