#pragma once
#include "infixcalc/token.hpp"

namespace infixcalc {

// Binding strength of a binary operator; 0 for anything that is not one.
// '*' and '/' bind tighter than '+' and '-'. All operators are left-associative.
int precedence(TokKind k);

bool is_operator(TokKind k);

// Applies a binary operator. Throws EvalError(DivisionByZero) for x / 0.
double apply(TokKind op, double lhs, double rhs);

} // namespace infixcalc
