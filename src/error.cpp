#include "infixcalc/error.hpp"

namespace infixcalc {

const char* to_string(ErrorKind k) {
    switch (k) {
        case ErrorKind::Lex:                   return "LexError";
        case ErrorKind::UnbalancedParentheses: return "UnbalancedParentheses";
        case ErrorKind::StackUnderflow:        return "StackUnderflow";
        case ErrorKind::DivisionByZero:        return "DivisionByZero";
        case ErrorKind::TrailingGarbage:       return "TrailingGarbage";
    }
    return "?";
}

} // namespace infixcalc
