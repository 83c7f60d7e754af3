#pragma once
#include <string_view>
#include <vector>
#include "infixcalc/token.hpp"

namespace infixcalc {

enum class LexMode {
    Whitespace, // every token is a whitespace-separated word
    Boundary,   // tokens are recognized at character boundaries, e.g. "(3+4)*2"
};

class Lexer {
public:
    explicit Lexer(std::string_view s, LexMode mode = LexMode::Whitespace)
        : s_(s), mode_(mode) {}

    // Yields the next token, then End forever once the input is exhausted.
    // Throws EvalError(Lex) on anything that is not a number, operator or paren.
    Token next();

    void reset() { i_ = 0; }

private:
    Token next_word();
    Token next_boundary();
    void skip_ws();
    bool is_end() const { return i_ >= s_.size(); }

    std::string_view s_;
    LexMode mode_;
    std::size_t i_{0};
};

// Runs a lexer to completion. The End token is not included.
std::vector<Token> tokenize(std::string_view s, LexMode mode = LexMode::Whitespace);

} // namespace infixcalc
