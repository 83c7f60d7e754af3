#include "infixcalc/evaluator.hpp"
#include "infixcalc/engine.hpp"
#include <vector>

namespace infixcalc {

double evaluate(std::string_view expression, const Options& opts) {
    // Lex everything first so a bad token is reported before any arithmetic error.
    std::vector<Token> tokens = tokenize(expression, opts.lex_mode);

    Engine engine;
    for (const auto& t : tokens) engine.feed(t);
    return engine.finish();
}

Result try_evaluate(std::string_view expression, const Options& opts) {
    try {
        return evaluate(expression, opts);
    } catch (const EvalError& e) {
        return e;
    }
}

} // namespace infixcalc
