#ifndef FORGE_OPERATORS_H
#define FORGE_OPERATORS_H

#include "heap.h"
#include "source.h"
#include "token.h"
#include "value.h"

namespace forge {

// Arithmetic, comparison, equality and xor. `and`/`or` short-circuit and are
// handled by the evaluator. Errors are reported at `span`.
Value applyBinary(TokenType op, const Value& left, const Value& right, Heap& heap, const Span& span);

// Unary `!` and `-`.
Value applyUnary(TokenType op, const Value& operand, const Span& span);

// `value as target`.
Value castValue(const Value& value, ValueKind target, Heap& heap, const Span& span);

// Maps += -= *= /= %= to the binary operator they apply.
TokenType compoundOperator(TokenType assignOp);

// Integral check for indices, range bounds and repeat counts.
std::int64_t toInteger(const Value& v, const std::string& what, const Span& span);

} // namespace forge

#endif // FORGE_OPERATORS_H
