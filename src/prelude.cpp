#include "prelude.h"
#include <chrono>
#include "errors.h"
#include "interpreter.h"

namespace forge {

namespace {

[[noreturn]] void wrongArgument(const std::string& fn, const std::string& expected, const Value& found) {
    throw TypeError(fn + " expects " + expected + ", found value of type '" + typeName(found) + "'", Span{});
}

Value lengthOf(Interpreter&, std::vector<Value>& args) {
    const Value& v = args[0];
    switch (v.kind()) {
        case ValueKind::Str: return Value::number(static_cast<double>(v.asStr().size()));
        case ValueKind::List: return Value::number(static_cast<double>(v.asList()->items.size()));
        case ValueKind::Map: return Value::number(static_cast<double>(v.asMap()->size()));
        case ValueKind::Range: {
            const RangeValue& r = v.asRange();
            return Value::number(r.hi > r.lo ? static_cast<double>(r.hi - r.lo) : 0.0);
        }
        default: wrongArgument("len", "a string, list, map or range", v);
    }
}

Value typeOf(Interpreter&, std::vector<Value>& args) {
    return Value::string(typeName(args[0]));
}

Value push(Interpreter&, std::vector<Value>& args) {
    if (!args[0].is(ValueKind::List)) wrongArgument("push", "a list", args[0]);
    args[0].asList()->items.push_back(args[1]);
    return args[0];
}

Value pop(Interpreter&, std::vector<Value>& args) {
    if (!args[0].is(ValueKind::List)) wrongArgument("pop", "a list", args[0]);
    auto& items = args[0].asList()->items;
    if (items.empty()) throw IndexError("pop from an empty list", Span{});
    Value last = items.back();
    items.pop_back();
    return last;
}

Value keys(Interpreter& interpreter, std::vector<Value>& args) {
    if (!args[0].is(ValueKind::Map)) wrongArgument("keys", "a map", args[0]);
    std::vector<Value> items;
    for (const auto& entry : args[0].asMap()->entries()) items.push_back(entry.first);
    return Value::list(interpreter.environment().heap().makeList(std::move(items)));
}

Value clockSeconds(Interpreter&, std::vector<Value>&) {
    using namespace std::chrono;
    auto since = duration_cast<microseconds>(system_clock::now().time_since_epoch()).count();
    return Value::number(static_cast<double>(since) / 1e6);
}

} // namespace

void registerPrelude(Environment& env) {
    env.defineNative("len", 1, lengthOf);
    env.defineNative("type", 1, typeOf);
    env.defineNative("push", 2, push);
    env.defineNative("pop", 1, pop);
    env.defineNative("keys", 1, keys);
    env.defineNative("clock", 0, clockSeconds);
}

} // namespace forge
