#include "infixcalc/engine.hpp"
#include "infixcalc/error.hpp"
#include "infixcalc/precedence.hpp"
#include <string>

namespace infixcalc {

static std::string at(std::size_t offset) {
    return " at offset " + std::to_string(offset);
}

// Pop one operator and its two operands; the first pop is the right-hand side.
void Engine::reduce() {
    Token op = operators_.pop();
    if (operands_.size() < 2) {
        throw EvalError(ErrorKind::StackUnderflow,
                        std::string("Operator '") + to_string(op.kind) + "'" + at(op.offset) +
                            " is missing an operand");
    }
    double rhs = operands_.pop();
    double lhs = operands_.pop();
    operands_.push(apply(op.kind, lhs, rhs));
}

void Engine::push_operand_token(const Token& t) {
    // "3 4", "3 ( 4 )", "( 3 ) 4": two operands with no operator between them.
    // Reported by finish() after the drain.
    if (after_operand_ && !missing_operator_at_) missing_operator_at_ = t.offset;
    if (t.kind == TokKind::Number) {
        operands_.push(t.number);
        after_operand_ = true;
    } else {
        operators_.push(t);
    }
}

void Engine::feed(const Token& t) {
    switch (t.kind) {
        case TokKind::Number:
        case TokKind::LParen:
            push_operand_token(t);
            break;

        case TokKind::Plus:
        case TokKind::Minus:
        case TokKind::Star:
        case TokKind::Slash:
            // >= gives left associativity on ties; LParen has precedence 0 and acts as a barrier.
            while (!operators_.empty() && is_operator(operators_.top().kind) &&
                   precedence(operators_.top().kind) >= precedence(t.kind)) {
                reduce();
            }
            operators_.push(t);
            after_operand_ = false;
            break;

        case TokKind::RParen:
            while (!operators_.empty() && is_operator(operators_.top().kind)) reduce();
            if (operators_.empty()) throw EvalError(ErrorKind::UnbalancedParentheses, "Mismatched ')'" + at(t.offset));
            operators_.pop(); // '('
            after_operand_ = true;
            break;

        case TokKind::End:
            break;
    }
}

double Engine::finish() {
    while (!operators_.empty()) {
        if (operators_.top().kind == TokKind::LParen) {
            throw EvalError(ErrorKind::UnbalancedParentheses, "Unclosed '('" + at(operators_.top().offset));
        }
        reduce();
    }

    if (operands_.empty()) throw EvalError(ErrorKind::StackUnderflow, "Empty expression");
    if (missing_operator_at_) {
        throw EvalError(ErrorKind::TrailingGarbage, "Missing operator" + at(*missing_operator_at_));
    }
    if (operands_.size() > 1) {
        throw EvalError(ErrorKind::TrailingGarbage,
                        "Expression left " + std::to_string(operands_.size()) + " values (missing operator)");
    }
    return operands_.pop();
}

} // namespace infixcalc
