#include "infixcalc/lexer.hpp"
#include "infixcalc/error.hpp"
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <string>

namespace infixcalc {

static bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

static bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// Characters that may not directly follow a number literal.
static bool continues_literal(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '_';
}

static bool single_char_token(char c, TokKind& kind) {
    switch (c) {
        case '+': kind = TokKind::Plus;   return true;
        case '-': kind = TokKind::Minus;  return true;
        case '*': kind = TokKind::Star;   return true;
        case '/': kind = TokKind::Slash;  return true;
        case '(': kind = TokKind::LParen; return true;
        case ')': kind = TokKind::RParen; return true;
        default:  return false;
    }
}

// Longest literal of the form  digits [ '.' digits ]  or  '.' digits  at s[i].
// Returns i when there is none.
static std::size_t scan_number(std::string_view s, std::size_t i) {
    std::size_t j = i;
    std::size_t digits = 0;
    while (j < s.size() && is_digit(s[j])) { ++j; ++digits; }
    if (j < s.size() && s[j] == '.') {
        ++j;
        while (j < s.size() && is_digit(s[j])) { ++j; ++digits; }
    }
    return digits == 0 ? i : j;
}

static EvalError lex_error(std::string_view text, std::size_t offset) {
    return EvalError(ErrorKind::Lex, "Unrecognized token '" + std::string(text) +
                                         "' at offset " + std::to_string(offset));
}

static Token make_number(std::string_view lit, std::size_t offset) {
    // strtod needs a terminated buffer; the view may point into a larger string.
    std::string buf(lit);
    errno = 0;
    double v = std::strtod(buf.c_str(), nullptr);
    if (errno == ERANGE || std::isinf(v)) {
        throw EvalError(ErrorKind::Lex, "Number out of range '" + buf + "' at offset " + std::to_string(offset));
    }
    Token t{TokKind::Number};
    t.number = v;
    t.offset = offset;
    return t;
}

void Lexer::skip_ws() {
    while (!is_end() && is_space(s_[i_])) ++i_;
}

Token Lexer::next() {
    skip_ws();
    if (is_end()) return {TokKind::End, 0.0, s_.size()};
    return mode_ == LexMode::Whitespace ? next_word() : next_boundary();
}

Token Lexer::next_word() {
    std::size_t start = i_;
    while (!is_end() && !is_space(s_[i_])) ++i_;
    std::string_view word = s_.substr(start, i_ - start);

    TokKind kind;
    if (word.size() == 1 && single_char_token(word[0], kind)) return {kind, 0.0, start};

    if (scan_number(word, 0) == word.size()) return make_number(word, start);

    throw lex_error(word, start);
}

Token Lexer::next_boundary() {
    std::size_t start = i_;
    char c = s_[i_];

    TokKind kind;
    if (single_char_token(c, kind)) {
        ++i_;
        return {kind, 0.0, start};
    }

    std::size_t end = scan_number(s_, i_);
    if (end == start) throw lex_error(s_.substr(start, 1), start);
    if (end < s_.size() && continues_literal(s_[end])) {
        std::size_t bad = end;
        while (bad < s_.size() && continues_literal(s_[bad])) ++bad;
        throw lex_error(s_.substr(start, bad - start), start);
    }
    i_ = end;
    return make_number(s_.substr(start, end - start), start);
}

std::vector<Token> tokenize(std::string_view s, LexMode mode) {
    Lexer lex(s, mode);
    std::vector<Token> out;
    for (Token t = lex.next(); t.kind != TokKind::End; t = lex.next()) out.push_back(t);
    return out;
}

const char* to_string(TokKind k) {
    switch (k) {
        case TokKind::Number: return "number";
        case TokKind::Plus:   return "+";
        case TokKind::Minus:  return "-";
        case TokKind::Star:   return "*";
        case TokKind::Slash:  return "/";
        case TokKind::LParen: return "(";
        case TokKind::RParen: return ")";
        case TokKind::End:    return "end of input";
    }
    return "?";
}

} // namespace infixcalc
