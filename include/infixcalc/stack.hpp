#pragma once
#include <cstddef>
#include <utility>
#include <vector>
#include "infixcalc/error.hpp"

namespace infixcalc {

/// LIFO over a growable array. pop() and top() on an empty stack throw
/// EvalError(StackUnderflow).
template <class T>
class Stack {
public:
    void push(T v) { items_.push_back(std::move(v)); }

    T pop() {
        if (items_.empty()) throw EvalError(ErrorKind::StackUnderflow, "Stack underflow (missing operand)");
        T v = std::move(items_.back());
        items_.pop_back();
        return v;
    }

    const T& top() const {
        if (items_.empty()) throw EvalError(ErrorKind::StackUnderflow, "Stack underflow (empty stack)");
        return items_.back();
    }

    bool empty() const noexcept { return items_.empty(); }
    std::size_t size() const noexcept { return items_.size(); }

private:
    std::vector<T> items_;
};

} // namespace infixcalc
