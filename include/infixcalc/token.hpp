#pragma once
#include <cstddef>

namespace infixcalc {

enum class TokKind {
    Number,

    Plus, Minus, Star, Slash,
    LParen, RParen,
    End,
};

struct Token {
    TokKind kind{TokKind::End};
    double number{0.0};     // Number
    std::size_t offset{0};  // byte offset into the expression
};

const char* to_string(TokKind k);

} // namespace infixcalc
