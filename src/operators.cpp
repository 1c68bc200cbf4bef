#include "operators.h"
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include "errors.h"
#include "host.h"

namespace forge {

namespace {

[[noreturn]] void unsupported(TokenType op, const Value& l, const Value& r, const Span& span) {
    throw TypeError("cannot apply " + tokenTypeSpelling(op) + " to values of type '" + typeName(l) +
                        "' and '" + typeName(r) + "'",
                    span);
}

bool isScalarForConcat(const Value& v) {
    return v.is(ValueKind::Number) || v.is(ValueKind::Bool) || v.is(ValueKind::Null) ||
           v.is(ValueKind::Range);
}

std::u32string asText(const Value& v) {
    if (v.is(ValueKind::Str)) return v.asStr();
    if (v.is(ValueKind::Char)) return std::u32string(1, v.asChar());
    return utf8::decode(displayValue(v));
}

std::optional<Value> coerceCustom(const Value& v, ValueKind target) {
    const auto& c = v.asCustom();
    if (!c.type) return std::nullopt;
    auto converted = c.type->coerce(c, target);
    if (converted && converted->is(ValueKind::Custom)) return std::nullopt;
    return converted;
}

std::size_t repeatCount(const Value& n, const Span& span) {
    std::int64_t count = toInteger(n, "repeat count", span);
    if (count < 0) throw TypeError("repeat count must not be negative, found " + std::to_string(count), span);
    return static_cast<std::size_t>(count);
}

void checkRepeatSize(std::size_t length, std::size_t count, std::size_t limit, const char* what, const Span& span) {
    if (count != 0 && length > limit / count) {
        throw RuntimeError("repeated " + std::string(what) + " would hold " + std::to_string(length) + " x " +
                               std::to_string(count) + " elements, more than can be allocated",
                           span);
    }
}

Value repeat(const Value& seq, const Value& n, Heap& heap, const Span& span) {
    std::size_t count = repeatCount(n, span);
    if (seq.is(ValueKind::Str)) {
        std::u32string out;
        checkRepeatSize(seq.asStr().size(), count, out.max_size(), "string", span);
        out.reserve(seq.asStr().size() * count);
        for (std::size_t i = 0; i < count; ++i) out += seq.asStr();
        return Value::string(std::move(out));
    }
    const auto& items = seq.asList()->items;
    std::vector<Value> out;
    checkRepeatSize(items.size(), count, out.max_size(), "list", span);
    out.reserve(items.size() * count);
    for (std::size_t i = 0; i < count; ++i) out.insert(out.end(), items.begin(), items.end());
    return Value::list(heap.makeList(std::move(out)));
}

int compareOrdered(TokenType op, const Value& l, const Value& r, const Span& span) {
    if (l.is(ValueKind::Number) && r.is(ValueKind::Number)) {
        double a = l.asNumber(), b = r.asNumber();
        return a < b ? -1 : (a > b ? 1 : 0);
    }
    if (l.is(ValueKind::Str) && r.is(ValueKind::Str)) {
        int c = l.asStr().compare(r.asStr());
        return c < 0 ? -1 : (c > 0 ? 1 : 0);
    }
    if (l.is(ValueKind::Char) && r.is(ValueKind::Char)) {
        return l.asChar() < r.asChar() ? -1 : (l.asChar() > r.asChar() ? 1 : 0);
    }
    unsupported(op, l, r, span);
}

// Accepts [+-]digits[.digits][(e|E)[+-]digits] surrounded by optional blanks.
bool parseNumberText(const std::string& text, double& out) {
    std::size_t i = 0, n = text.size();
    auto blank = [&](char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; };
    auto digit = [&](std::size_t k) { return k < n && text[k] >= '0' && text[k] <= '9'; };
    while (i < n && blank(text[i])) ++i;
    std::size_t start = i;
    if (i < n && (text[i] == '+' || text[i] == '-')) ++i;
    if (!digit(i)) return false;
    while (digit(i)) ++i;
    if (i < n && text[i] == '.') {
        ++i;
        if (!digit(i)) return false;
        while (digit(i)) ++i;
    }
    if (i < n && (text[i] == 'e' || text[i] == 'E')) {
        ++i;
        if (i < n && (text[i] == '+' || text[i] == '-')) ++i;
        if (!digit(i)) return false;
        while (digit(i)) ++i;
    }
    std::size_t end = i;
    while (i < n && blank(text[i])) ++i;
    if (i != n) return false;
    out = std::strtod(text.substr(start, end - start).c_str(), nullptr);
    return true;
}

} // namespace

std::int64_t toInteger(const Value& v, const std::string& what, const Span& span) {
    if (!v.is(ValueKind::Number)) {
        throw TypeError(what + " must be a number, found value of type '" + typeName(v) + "'", span);
    }
    double d = v.asNumber();
    if (!isIntegral(d) || std::fabs(d) > 9.0e18) {
        throw TypeError(what + " must be an integral number, found " + formatNumber(d), span);
    }
    return static_cast<std::int64_t>(d);
}

TokenType compoundOperator(TokenType assignOp) {
    switch (assignOp) {
        case TokenType::PLUS_ASSIGN: return TokenType::PLUS;
        case TokenType::MINUS_ASSIGN: return TokenType::MINUS;
        case TokenType::STAR_ASSIGN: return TokenType::STAR;
        case TokenType::SLASH_ASSIGN: return TokenType::SLASH;
        case TokenType::PERCENT_ASSIGN: return TokenType::PERCENT;
        default: return assignOp;
    }
}

Value applyBinary(TokenType op, const Value& left, const Value& right, Heap& heap, const Span& span) {
    if (op == TokenType::EQUAL) return Value::boolean(valuesEqual(left, right));
    if (op == TokenType::NOT_EQUAL) return Value::boolean(!valuesEqual(left, right));

    bool lc = left.is(ValueKind::Custom);
    bool rc = right.is(ValueKind::Custom);
    if (lc || rc) {
        // Ask the host to turn its value into something the core understands
        ValueKind lt = lc ? (rc ? ValueKind::Number : right.kind()) : left.kind();
        ValueKind rt = rc ? (lc ? ValueKind::Number : left.kind()) : right.kind();
        std::optional<Value> l = lc ? coerceCustom(left, rt) : std::optional<Value>(left);
        std::optional<Value> r = rc ? coerceCustom(right, lt) : std::optional<Value>(right);
        if (!l || !r) unsupported(op, left, right, span);
        return applyBinary(op, *l, *r, heap, span);
    }

    const bool numbers = left.is(ValueKind::Number) && right.is(ValueKind::Number);
    switch (op) {
        case TokenType::PLUS: {
            if (numbers) return Value::number(left.asNumber() + right.asNumber());
            bool lt = left.is(ValueKind::Str) || left.is(ValueKind::Char);
            bool rt = right.is(ValueKind::Str) || right.is(ValueKind::Char);
            if ((lt && (rt || isScalarForConcat(right))) || (rt && isScalarForConcat(left))) {
                return Value::string(asText(left) + asText(right));
            }
            if (left.is(ValueKind::List) && right.is(ValueKind::List)) {
                std::vector<Value> items = left.asList()->items;
                const auto& tail = right.asList()->items;
                items.insert(items.end(), tail.begin(), tail.end());
                return Value::list(heap.makeList(std::move(items)));
            }
            unsupported(op, left, right, span);
        }
        case TokenType::MINUS:
            if (numbers) return Value::number(left.asNumber() - right.asNumber());
            unsupported(op, left, right, span);
        case TokenType::STAR:
            if (numbers) return Value::number(left.asNumber() * right.asNumber());
            if ((left.is(ValueKind::Str) || left.is(ValueKind::List)) && right.is(ValueKind::Number)) {
                return repeat(left, right, heap, span);
            }
            if (left.is(ValueKind::Number) && (right.is(ValueKind::Str) || right.is(ValueKind::List))) {
                return repeat(right, left, heap, span);
            }
            unsupported(op, left, right, span);
        case TokenType::SLASH:
            if (numbers) {
                if (right.asNumber() == 0.0) throw ArithmeticError("division by zero", span);
                return Value::number(left.asNumber() / right.asNumber());
            }
            unsupported(op, left, right, span);
        case TokenType::PERCENT:
            if (numbers) {
                if (right.asNumber() == 0.0) throw ArithmeticError("modulo by zero", span);
                return Value::number(std::fmod(left.asNumber(), right.asNumber()));
            }
            unsupported(op, left, right, span);
        case TokenType::LESS:
            return Value::boolean(compareOrdered(op, left, right, span) < 0);
        case TokenType::LESS_EQUAL:
            return Value::boolean(compareOrdered(op, left, right, span) <= 0);
        case TokenType::GREATER:
            return Value::boolean(compareOrdered(op, left, right, span) > 0);
        case TokenType::GREATER_EQUAL:
            return Value::boolean(compareOrdered(op, left, right, span) >= 0);
        case TokenType::XOR:
        case TokenType::AND:
        case TokenType::OR:
            if (left.is(ValueKind::Bool) && right.is(ValueKind::Bool)) {
                if (op == TokenType::XOR) return Value::boolean(left.asBool() != right.asBool());
                if (op == TokenType::AND) return Value::boolean(left.asBool() && right.asBool());
                return Value::boolean(left.asBool() || right.asBool());
            }
            unsupported(op, left, right, span);
        default:
            unsupported(op, left, right, span);
    }
}

Value applyUnary(TokenType op, const Value& operand, const Span& span) {
    Value v = operand;
    if (v.is(ValueKind::Custom)) {
        auto converted = coerceCustom(v, op == TokenType::NOT ? ValueKind::Bool : ValueKind::Number);
        if (converted) v = *converted;
    }
    if (op == TokenType::NOT) {
        if (v.is(ValueKind::Bool)) return Value::boolean(!v.asBool());
        throw TypeError("cannot apply '!' to value of type '" + typeName(operand) + "'", span);
    }
    if (v.is(ValueKind::Number)) return Value::number(-v.asNumber());
    throw TypeError("cannot apply '-' to value of type '" + typeName(operand) + "'", span);
}

Value castValue(const Value& value, ValueKind target, Heap& heap, const Span& span) {
    auto fail = [&]() -> Value {
        throw TypeError("cannot convert value of type '" + typeName(value) + "' to " +
                            valueKindToString(target),
                        span);
    };
    if (value.is(ValueKind::Custom)) {
        if (auto converted = coerceCustom(value, target)) return castValue(*converted, target, heap, span);
        if (target == ValueKind::Str) return Value::string(displayValue(value));
        return fail();
    }

    switch (target) {
        case ValueKind::Number:
            switch (value.kind()) {
                case ValueKind::Number: return value;
                case ValueKind::Bool: return Value::number(value.asBool() ? 1 : 0);
                case ValueKind::Char: return Value::number(static_cast<double>(value.asChar()));
                case ValueKind::Str: {
                    double d = 0;
                    std::string text = utf8::encode(value.asStr());
                    if (!parseNumberText(text, d)) {
                        throw TypeError("cannot convert string \"" + text + "\" to number", span);
                    }
                    return Value::number(d);
                }
                default: return fail();
            }
        case ValueKind::Str:
            if (value.is(ValueKind::Str)) return value;
            return Value::string(displayValue(value));
        case ValueKind::Char:
            switch (value.kind()) {
                case ValueKind::Char: return value;
                case ValueKind::Str:
                    if (value.asStr().size() == 1) return Value::character(value.asStr()[0]);
                    throw TypeError("cannot convert a string of length " + std::to_string(value.asStr().size()) +
                                        " to char",
                                    span);
                case ValueKind::Number: {
                    double d = value.asNumber();
                    if (isIntegral(d) && d >= 0 && d <= 0x10FFFF && utf8::isScalar(static_cast<std::uint32_t>(d))) {
                        return Value::character(static_cast<char32_t>(d));
                    }
                    throw TypeError(formatNumber(d) + " is not a valid character code", span);
                }
                default: return fail();
            }
        case ValueKind::Bool:
            switch (value.kind()) {
                case ValueKind::Bool: return value;
                case ValueKind::Number: return Value::boolean(value.asNumber() != 0.0);
                case ValueKind::Str:
                    if (value.asStr() == U"true") return Value::boolean(true);
                    if (value.asStr() == U"false") return Value::boolean(false);
                    throw TypeError("cannot convert string \"" + utf8::encode(value.asStr()) + "\" to bool", span);
                default: return fail();
            }
        case ValueKind::List:
            switch (value.kind()) {
                case ValueKind::List: return value;
                case ValueKind::Range: {
                    std::vector<Value> items;
                    const auto& r = value.asRange();
                    if (r.hi > r.lo) items.reserve(static_cast<std::uint64_t>(r.hi) - static_cast<std::uint64_t>(r.lo));
                    for (std::int64_t i = r.lo; i < r.hi; ++i) items.push_back(Value::number(static_cast<double>(i)));
                    return Value::list(heap.makeList(std::move(items)));
                }
                case ValueKind::Str: {
                    std::vector<Value> items;
                    for (char32_t c : value.asStr()) items.push_back(Value::character(c));
                    return Value::list(heap.makeList(std::move(items)));
                }
                case ValueKind::Map: {
                    std::vector<Value> items;
                    for (const auto& entry : value.asMap()->entries()) {
                        items.push_back(Value::list(heap.makeList({entry.first, entry.second})));
                    }
                    return Value::list(heap.makeList(std::move(items)));
                }
                default: return fail();
            }
        default:
            return fail();
    }
}

} // namespace forge
