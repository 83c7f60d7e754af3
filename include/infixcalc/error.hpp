#pragma once
#include <stdexcept>
#include <string>

namespace infixcalc {

enum class ErrorKind {
    Lex,
    UnbalancedParentheses,
    StackUnderflow,
    DivisionByZero,
    TrailingGarbage,
};

const char* to_string(ErrorKind k);

struct EvalError : std::runtime_error {
    EvalError(ErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace infixcalc
