#pragma once
#include <cstddef>
#include <optional>
#include "infixcalc/stack.hpp"
#include "infixcalc/token.hpp"

namespace infixcalc {

/// Dual-stack infix reducer. Tokens are fed one at a time and operators are
/// reduced eagerly by precedence; finish() drains the operator stack and
/// returns the single remaining operand.
///
/// The operator stack only ever holds operators and LParen.
class Engine {
public:
    Engine() = default;

    void feed(const Token& t);
    double finish();

    std::size_t operand_depth() const noexcept { return operands_.size(); }
    std::size_t operator_depth() const noexcept { return operators_.size(); }

private:
    void reduce();
    void push_operand_token(const Token& t);

    Stack<double> operands_;
    Stack<Token> operators_;
    bool after_operand_{false}; // last token was a Number or RParen
    std::optional<std::size_t> missing_operator_at_{};
};

} // namespace infixcalc
