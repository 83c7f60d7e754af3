#include "infixcalc/precedence.hpp"
#include "infixcalc/error.hpp"
#include <stdexcept>
#include <string>

namespace infixcalc {

int precedence(TokKind k) {
    switch (k) {
        case TokKind::Star:
        case TokKind::Slash: return 2;
        case TokKind::Plus:
        case TokKind::Minus: return 1;
        default:             return 0;
    }
}

bool is_operator(TokKind k) {
    return k == TokKind::Plus || k == TokKind::Minus || k == TokKind::Star || k == TokKind::Slash;
}

double apply(TokKind op, double lhs, double rhs) {
    switch (op) {
        case TokKind::Plus:  return lhs + rhs;
        case TokKind::Minus: return lhs - rhs;
        case TokKind::Star:  return lhs * rhs;
        case TokKind::Slash:
            if (rhs == 0.0) throw EvalError(ErrorKind::DivisionByZero, "Division by zero");
            return lhs / rhs;
        default: break;
    }
    throw std::invalid_argument(std::string("Not a binary operator: ") + to_string(op));
}

} // namespace infixcalc
