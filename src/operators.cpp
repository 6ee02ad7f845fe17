#include "rpncalc/operators.hpp"

#include <array>
#include <cstddef>

namespace rpncalc {

// Indexed by Op. Unary operators outrank '**' so `-2 ** 2` groups as (-2) ** 2.
static constexpr std::array<OperatorInfo, 9> kOperators = {{
    {Op::Add,      "+",  2, Assoc::Left,  Arity::Binary, nullptr, &add},
    {Op::Sub,      "-",  2, Assoc::Left,  Arity::Binary, nullptr, &sub},
    {Op::Mul,      "*",  3, Assoc::Left,  Arity::Binary, nullptr, &mul},
    {Op::Div,      "/",  3, Assoc::Left,  Arity::Binary, nullptr, &true_div},
    {Op::FloorDiv, "//", 3, Assoc::Left,  Arity::Binary, nullptr, &floor_div},
    {Op::Mod,      "%",  3, Assoc::Left,  Arity::Binary, nullptr, &mod},
    {Op::Pow,      "**", 4, Assoc::Right, Arity::Binary, nullptr, &power},
    {Op::Pos,      "+",  5, Assoc::Right, Arity::Unary,  &pos,    nullptr},
    {Op::Neg,      "-",  5, Assoc::Right, Arity::Unary,  &neg,    nullptr},
}};

const OperatorInfo& operator_info(Op op) {
    return kOperators[static_cast<std::size_t>(op)];
}

bool divides(Op op) {
    return op == Op::Div || op == Op::FloorDiv || op == Op::Mod;
}

bool integer_only(Op op) {
    return op == Op::FloorDiv || op == Op::Mod;
}

} // namespace rpncalc
