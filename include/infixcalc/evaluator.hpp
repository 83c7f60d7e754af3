#pragma once
#include <string_view>
#include <variant>
#include "infixcalc/error.hpp"
#include "infixcalc/lexer.hpp"

namespace infixcalc {

struct Options {
    LexMode lex_mode{LexMode::Whitespace};
};

using Result = std::variant<double, EvalError>;

/// Evaluate an infix expression such as "( 3 + 4 ) * 2".
/// Throws EvalError on malformed input or division by zero.
double evaluate(std::string_view expression, const Options& opts = {});

/// Same as evaluate() but returns the error instead of throwing it.
Result try_evaluate(std::string_view expression, const Options& opts = {});

} // namespace infixcalc
