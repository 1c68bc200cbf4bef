#include "interpreter.h"
#include <algorithm>
#include <cstdint>
#include <exception>
#include <iostream>
#include <memory>
#include <new>
#include <stdexcept>
#include <string>
#include <vector>
#include "host.h"
#include "operators.h"

namespace forge {

namespace {

// Marks an environment as the active one for the duration of a run.
class ActiveRun {
public:
    ActiveRun(Environment*& slot, int& depth, Environment& env) : slot_(slot), depth_(depth), saved_(slot) {
        slot_ = &env;
        ++depth_;
    }
    ~ActiveRun() {
        slot_ = saved_;
        --depth_;
    }
    ActiveRun(const ActiveRun&) = delete;
    ActiveRun& operator=(const ActiveRun&) = delete;

private:
    Environment*& slot_;
    int& depth_;
    Environment* saved_;
};

struct Bounds {
    std::size_t lo;
    std::size_t hi;
};

// lo must lie within [0, length]; hi is clamped to the length and never
// falls below lo.
Bounds sliceBounds(const RangeValue& r, std::size_t length, const char* what, const Span& span) {
    if (r.lo < 0 || static_cast<std::uint64_t>(r.lo) > length) {
        throw IndexError("slice start " + std::to_string(r.lo) + " is out of bounds for " + what +
                             " of length " + std::to_string(length),
                         span);
    }
    std::size_t lo = static_cast<std::size_t>(r.lo);
    std::size_t hi = r.hi < 0 ? 0 : static_cast<std::size_t>(std::min<std::uint64_t>(r.hi, length));
    if (hi < lo) hi = lo;
    return {lo, hi};
}

std::size_t elementIndex(const Value& index, std::size_t length, const char* what, const Span& indexSpan,
                         const Span& span) {
    std::int64_t i = toInteger(index, std::string(what) + " index", indexSpan);
    if (i < 0 || static_cast<std::uint64_t>(i) >= length) {
        throw IndexError("index " + std::to_string(i) + " is out of bounds for " + what + " of length " +
                             std::to_string(length),
                         span);
    }
    return static_cast<std::size_t>(i);
}

[[noreturn]] void missingKey(const Value& key, const Span& span) {
    throw IndexError("key " + reprValue(key) + " not found in map", span);
}

} // namespace

Interpreter::Interpreter(InterpreterOptions options) : options_(std::move(options)) {}

Environment& Interpreter::environment() {
    if (!env_) throw RuntimeError("no program is running", Span{});
    return *env_;
}

void Interpreter::run(const std::shared_ptr<BlockStatement>& program, Environment& env) {
    ActiveRun active(env_, runDepth_, env);
    for (const auto& stmt : program->statements) {
        try {
            execute(stmt, env.global());
        } catch (const std::bad_alloc&) {
            throw RuntimeError("out of memory", stmt->span);
        } catch (const std::length_error& e) {
            throw RuntimeError(std::string("allocation too large: ") + e.what(), stmt->span);
        }
        // Only the outermost run collects; nested runs come from host callbacks
        // that may still hold unrooted values on the C++ stack.
        if (runDepth_ == 1 && env.heap().shouldCollect()) env.collectGarbage();
    }
}

Value Interpreter::evaluate(const NodePtr& expr, Environment& env) {
    ActiveRun active(env_, runDepth_, env);
    try {
        return evaluateValue(expr, env.global());
    } catch (const std::bad_alloc&) {
        throw RuntimeError("out of memory", expr->span);
    } catch (const std::length_error& e) {
        throw RuntimeError(std::string("allocation too large: ") + e.what(), expr->span);
    }
}

Value Interpreter::call(const Value& callee, std::vector<Value> args, const Span& site) {
    environment();
    return callValue(callee, args, site, "function");
}

bool Interpreter::truthiness(const Value& v, const Span& span) const {
    if (v.is(ValueKind::Bool)) return v.asBool();
    throw TypeError("cannot determine truthiness of value of type '" + typeName(v) + "'", span);
}

// ---- Statements ----

Interpreter::ExecResult Interpreter::execute(const NodePtr& stmt, const std::shared_ptr<Scope>& scope) {
    if (auto decl = std::dynamic_pointer_cast<VarDeclaration>(stmt)) {
        Value v = decl->initializer ? evaluateValue(decl->initializer, scope) : Value::null();
        scope->declare(decl->name, std::move(v));
        return {};
    }
    if (auto exprStmt = std::dynamic_pointer_cast<ExpressionStatement>(stmt)) {
        evaluateValue(exprStmt->expression, scope);
        return {};
    }
    if (auto printStmt = std::dynamic_pointer_cast<PrintStatement>(stmt)) {
        Value v = evaluateValue(printStmt->expression, scope);
        *options_.out << displayValue(v) << std::endl;
        return {};
    }
    if (auto input = std::dynamic_pointer_cast<InputStatement>(stmt)) {
        executeInput(input, scope);
        return {};
    }
    if (auto ifStmt = std::dynamic_pointer_cast<IfStatement>(stmt)) {
        return executeIf(ifStmt, scope);
    }
    if (auto whileLoop = std::dynamic_pointer_cast<WhileLoop>(stmt)) {
        return executeWhileLoop(whileLoop, scope);
    }
    if (auto forLoop = std::dynamic_pointer_cast<ForLoop>(stmt)) {
        return executeForLoop(forLoop, scope);
    }
    if (auto block = std::dynamic_pointer_cast<BlockStatement>(stmt)) {
        return executeBlock(block, scope);
    }
    if (auto ret = std::dynamic_pointer_cast<ReturnStatement>(stmt)) {
        ExecResult result;
        result.flow = ExecResult::Flow::Return;
        if (ret->expression) result.value = evaluateValue(ret->expression, scope);
        return result;
    }
    if (std::dynamic_pointer_cast<BreakStatement>(stmt)) {
        ExecResult result;
        result.flow = ExecResult::Flow::Break;
        return result;
    }
    if (std::dynamic_pointer_cast<ContinueStatement>(stmt)) {
        ExecResult result;
        result.flow = ExecResult::Flow::Continue;
        return result;
    }
    throw RuntimeError("statement cannot be executed", stmt->span);
}

Interpreter::ExecResult Interpreter::executeStatements(const std::vector<NodePtr>& statements,
                                                       const std::shared_ptr<Scope>& scope) {
    for (const auto& stmt : statements) {
        ExecResult result = execute(stmt, scope);
        if (result.flow != ExecResult::Flow::Normal) return result;
    }
    return {};
}

Interpreter::ExecResult Interpreter::executeBlock(const std::shared_ptr<BlockStatement>& block,
                                                  const std::shared_ptr<Scope>& scope) {
    auto inner = heap().makeScope(scope);
    return executeStatements(block->statements, inner);
}

Interpreter::ExecResult Interpreter::executeIf(const std::shared_ptr<IfStatement>& stmt,
                                               const std::shared_ptr<Scope>& scope) {
    Value condition = evaluateValue(stmt->condition, scope);
    if (truthiness(condition, stmt->condition->span)) {
        return executeBlock(stmt->thenBranch, scope);
    }
    if (auto elseIf = std::dynamic_pointer_cast<IfStatement>(stmt->elseBranch)) {
        return executeIf(elseIf, scope);
    }
    if (auto elseBlock = std::dynamic_pointer_cast<BlockStatement>(stmt->elseBranch)) {
        return executeBlock(elseBlock, scope);
    }
    return {};
}

Interpreter::ExecResult Interpreter::executeWhileLoop(const std::shared_ptr<WhileLoop>& loop,
                                                      const std::shared_ptr<Scope>& scope) {
    for (;;) {
        Value condition = evaluateValue(loop->condition, scope);
        if (!truthiness(condition, loop->condition->span)) break;
        ExecResult result = executeBlock(loop->body, scope);
        if (result.flow == ExecResult::Flow::Break) break;
        if (result.flow == ExecResult::Flow::Return) return result;
    }
    return {};
}

Interpreter::ExecResult Interpreter::executeForLoop(const std::shared_ptr<ForLoop>& loop,
                                                    const std::shared_ptr<Scope>& scope) {
    Value iterable = evaluateValue(loop->iterable, scope);
    ExecResult outcome;

    // Runs one iteration in a fresh scope; false stops the loop.
    auto iterate = [&](Value item) {
        auto iterationScope = heap().makeScope(scope);
        iterationScope->declare(loop->variable, std::move(item));
        ExecResult result = executeStatements(loop->body->statements, iterationScope);
        if (result.flow == ExecResult::Flow::Break) return false;
        if (result.flow == ExecResult::Flow::Return) {
            outcome = std::move(result);
            return false;
        }
        return true;
    };

    switch (iterable.kind()) {
        case ValueKind::Range: {
            RangeValue r = iterable.asRange();
            for (std::int64_t i = r.lo; i < r.hi; ++i) {
                if (!iterate(Value::number(static_cast<double>(i)))) break;
            }
            break;
        }
        case ValueKind::List: {
            // The length is re-read every step so the body may grow or shrink the list
            ListRef list = iterable.asList();
            for (std::size_t i = 0; i < list->items.size(); ++i) {
                if (!iterate(list->items[i])) break;
            }
            break;
        }
        case ValueKind::Custom: {
            const CustomValue& custom = iterable.asCustom();
            std::unique_ptr<HostIterator> it = custom.type ? custom.type->iterate(custom) : nullptr;
            if (!it) {
                throw TypeError("value of type '" + typeName(iterable) + "' is not iterable", loop->iterable->span);
            }
            Value item;
            while (it->next(item)) {
                if (!iterate(item)) break;
            }
            break;
        }
        default:
            throw TypeError("value of type '" + typeName(iterable) + "' is not iterable", loop->iterable->span);
    }
    return outcome;
}

void Interpreter::executeInput(const std::shared_ptr<InputStatement>& stmt, const std::shared_ptr<Scope>& scope) {
    auto place = resolvePlace(stmt->target, scope);
    if (stmt->prompt) {
        Value prompt = evaluateValue(stmt->prompt, scope);
        if (options_.echoPrompt) *options_.out << displayValue(prompt) << std::flush;
    }
    std::string line;
    Value read;
    if (options_.in && std::getline(*options_.in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        read = Value::string(line);
    }
    writePlace(*place, std::move(read));
}

// ---- Expressions ----

Value Interpreter::evaluateValue(const NodePtr& expr, const std::shared_ptr<Scope>& scope) {
    if (auto lit = std::dynamic_pointer_cast<Literal>(expr)) {
        switch (lit->kind) {
            case LiteralKind::Number: return Value::number(lit->number);
            case LiteralKind::String: return Value::string(lit->text);
            case LiteralKind::Char: return Value::character(lit->character);
            case LiteralKind::Bool: return Value::boolean(lit->boolean);
            case LiteralKind::Null: return Value::null();
        }
    }
    if (auto id = std::dynamic_pointer_cast<Identifier>(expr)) {
        Value* v = scope->lookup(id->name);
        if (!v) throw UndefinedVariableError(id->name, id->span);
        return *v;
    }
    if (auto range = std::dynamic_pointer_cast<RangeExpression>(expr)) {
        std::int64_t lo = toInteger(evaluateValue(range->lo, scope), "range start", range->lo->span);
        std::int64_t hi = toInteger(evaluateValue(range->hi, scope), "range end", range->hi->span);
        return Value::range(lo, hi);
    }
    if (auto list = std::dynamic_pointer_cast<ListLiteral>(expr)) {
        std::vector<Value> items;
        items.reserve(list->elements.size());
        for (const auto& element : list->elements) items.push_back(evaluateValue(element, scope));
        return Value::list(heap().makeList(std::move(items)));
    }
    if (auto rep = std::dynamic_pointer_cast<ListRepeat>(expr)) {
        Value item = evaluateValue(rep->item, scope);
        std::int64_t count = toInteger(evaluateValue(rep->count, scope), "repeat count", rep->count->span);
        if (count < 0) {
            throw TypeError("repeat count must not be negative, found " + std::to_string(count), rep->count->span);
        }
        std::vector<Value> items;
        if (static_cast<std::uint64_t>(count) > items.max_size()) {
            throw RuntimeError("repeat count " + std::to_string(count) + " is more than a list can hold",
                               rep->count->span);
        }
        items.assign(static_cast<std::size_t>(count), item);
        return Value::list(heap().makeList(std::move(items)));
    }
    if (auto mapLit = std::dynamic_pointer_cast<MapLiteral>(expr)) {
        MapRef map = heap().makeMap();
        for (const auto& entry : mapLit->entries) {
            Value key = evaluateValue(entry.first, scope);
            Value value = evaluateValue(entry.second, scope);
            map->set(key, std::move(value));
        }
        return Value::map(map);
    }
    if (auto fn = std::dynamic_pointer_cast<FunctionLiteral>(expr)) {
        return makeFunction(fn, scope);
    }
    if (auto unary = std::dynamic_pointer_cast<UnaryExpression>(expr)) {
        return applyUnary(unary->op.type, evaluateValue(unary->operand, scope), unary->span);
    }
    if (auto bin = std::dynamic_pointer_cast<BinaryExpression>(expr)) {
        TokenType op = bin->op.type;
        if (op == TokenType::AND || op == TokenType::OR) {
            Value left = evaluateValue(bin->left, scope);
            if (!left.is(ValueKind::Bool)) {
                throw TypeError("operand of '" + bin->op.value + "' must be bool, found value of type '" +
                                    typeName(left) + "'",
                                bin->left->span);
            }
            if (op == TokenType::AND && !left.asBool()) return left;
            if (op == TokenType::OR && left.asBool()) return left;
            Value right = evaluateValue(bin->right, scope);
            if (!right.is(ValueKind::Bool)) {
                throw TypeError("operand of '" + bin->op.value + "' must be bool, found value of type '" +
                                    typeName(right) + "'",
                                bin->right->span);
            }
            return right;
        }
        Value left = evaluateValue(bin->left, scope);
        Value right = evaluateValue(bin->right, scope);
        return applyBinary(op, left, right, heap(), bin->span);
    }
    if (auto cast = std::dynamic_pointer_cast<CastExpression>(expr)) {
        return castValue(evaluateValue(cast->operand, scope), cast->target, heap(), cast->span);
    }
    if (auto callExpr = std::dynamic_pointer_cast<CallExpression>(expr)) {
        return evaluateCall(callExpr, scope);
    }
    if (auto index = std::dynamic_pointer_cast<IndexExpression>(expr)) {
        return evaluateIndex(index, scope);
    }
    if (auto assign = std::dynamic_pointer_cast<AssignExpression>(expr)) {
        return evaluateAssignment(assign, scope);
    }
    if (auto cloneExpr = std::dynamic_pointer_cast<CloneExpression>(expr)) {
        return cloneValue(evaluateValue(cloneExpr->operand, scope), heap());
    }
    if (auto mirrorExpr = std::dynamic_pointer_cast<MirrorExpression>(expr)) {
        // same handle, no copy
        return evaluateValue(mirrorExpr->operand, scope);
    }
    throw RuntimeError("expression cannot be evaluated", expr->span);
}

Value Interpreter::makeFunction(const std::shared_ptr<FunctionLiteral>& literal, const std::shared_ptr<Scope>& scope) {
    auto fn = std::make_shared<FunctionData>();
    fn->params = literal->params;
    fn->literal = literal;
    fn->closure = scope;
    fn->declaration = literal->span;
    return Value::function(std::move(fn));
}

Value Interpreter::evaluateIndex(const std::shared_ptr<IndexExpression>& index, const std::shared_ptr<Scope>& scope) {
    Value target = evaluateValue(index->target, scope);
    Value key = evaluateValue(index->index, scope);
    switch (target.kind()) {
        case ValueKind::List: {
            const auto& items = target.asList()->items;
            if (key.is(ValueKind::Range)) {
                Bounds b = sliceBounds(key.asRange(), items.size(), "list", index->span);
                std::vector<Value> slice(items.begin() + b.lo, items.begin() + b.hi);
                return Value::list(heap().makeList(std::move(slice)));
            }
            return items[elementIndex(key, items.size(), "list", index->index->span, index->span)];
        }
        case ValueKind::Str: {
            const auto& text = target.asStr();
            if (key.is(ValueKind::Range)) {
                Bounds b = sliceBounds(key.asRange(), text.size(), "string", index->span);
                return Value::string(text.substr(b.lo, b.hi - b.lo));
            }
            return Value::character(text[elementIndex(key, text.size(), "string", index->index->span, index->span)]);
        }
        case ValueKind::Map: {
            Value* found = target.asMap()->find(key);
            if (!found) missingKey(key, index->span);
            return *found;
        }
        default:
            throw TypeError("value of type '" + typeName(target) + "' cannot be indexed", index->target->span);
    }
}

Value Interpreter::evaluateAssignment(const std::shared_ptr<AssignExpression>& assign,
                                      const std::shared_ptr<Scope>& scope) {
    auto place = resolvePlace(assign->target, scope);
    Value result;
    if (assign->op.type == TokenType::ASSIGN) {
        result = evaluateValue(assign->value, scope);
    } else {
        Value rhs = evaluateValue(assign->value, scope);
        Value current = readPlace(*place);
        result = applyBinary(compoundOperator(assign->op.type), current, rhs, heap(), assign->span);
    }
    writePlace(*place, result);
    return result;
}

Value Interpreter::evaluateCall(const std::shared_ptr<CallExpression>& callExpr, const std::shared_ptr<Scope>& scope) {
    Value callee = evaluateValue(callExpr->callee, scope);
    std::vector<Value> args;
    args.reserve(callExpr->args.size());
    for (const auto& arg : callExpr->args) args.push_back(evaluateValue(arg, scope));
    std::string label = "function";
    if (auto id = std::dynamic_pointer_cast<Identifier>(callExpr->callee)) label = "'" + id->name + "'";
    return callValue(callee, args, callExpr->span, label);
}

Value Interpreter::callValue(const Value& callee, std::vector<Value>& args, const Span& site, const std::string& label) {
    if (callee.is(ValueKind::Function)) {
        FunctionRef fn = callee.asFunction();
        if (fn->isNative()) {
            if (fn->arity != FunctionData::kVariadic && args.size() != static_cast<std::size_t>(fn->arity)) {
                throw ArityError(label, static_cast<std::size_t>(fn->arity), args.size(), site);
            }
            try {
                return fn->native(*this, args);
            } catch (RuntimeError& e) {
                if (!e.span().valid()) e.setSpan(site);
                throw;
            } catch (const Error&) {
                throw;
            } catch (const std::exception& e) {
                throw RuntimeError("native " + label + " failed: " + e.what(), site);
            }
        }

        if (args.size() != fn->params.size()) {
            ArityError error(label, fn->params.size(), args.size(), site);
            error.setSecondary(Frame{"declared", fn->declaration});
            throw error;
        }
        auto callScope = heap().makeScope(fn->closure);
        for (std::size_t i = 0; i < args.size(); ++i) callScope->declare(fn->params[i], std::move(args[i]));
        try {
            ExecResult result = executeStatements(fn->literal->body->statements, callScope);
            if (result.flow == ExecResult::Flow::Return) return result.value;
            return Value::null();
        } catch (RuntimeError& e) {
            e.addCallFrame(label);
            throw;
        }
    }

    if (callee.is(ValueKind::Custom)) {
        const CustomValue& custom = callee.asCustom();
        if (custom.type && custom.type->callable()) {
            int arity = custom.type->arity();
            if (arity != FunctionData::kVariadic && args.size() != static_cast<std::size_t>(arity)) {
                throw ArityError(label, static_cast<std::size_t>(arity), args.size(), site);
            }
            try {
                return custom.type->call(*this, custom, args);
            } catch (RuntimeError& e) {
                if (!e.span().valid()) e.setSpan(site);
                throw;
            } catch (const Error&) {
                throw;
            } catch (const std::exception& e) {
                throw RuntimeError(label + " failed: " + e.what(), site);
            }
        }
    }
    throw TypeError("value of type '" + typeName(callee) + "' is not callable", site);
}

// ---- Places ----

std::shared_ptr<Interpreter::Place> Interpreter::resolvePlace(const NodePtr& target, const std::shared_ptr<Scope>& scope) {
    auto place = std::make_shared<Place>();
    place->span = target->span;

    if (auto id = std::dynamic_pointer_cast<Identifier>(target)) {
        auto owner = scope->owner(id->name);
        if (!owner) throw UndefinedVariableError(id->name, id->span);
        place->kind = Place::Kind::Variable;
        place->scope = owner;
        place->name = id->name;
        return place;
    }

    auto index = std::dynamic_pointer_cast<IndexExpression>(target);
    if (!index) throw TypeError("expression is not assignable", target->span);

    std::shared_ptr<Place> base;
    if (std::dynamic_pointer_cast<Identifier>(index->target) || std::dynamic_pointer_cast<IndexExpression>(index->target)) {
        base = resolvePlace(index->target, scope);
    } else {
        base = std::make_shared<Place>();
        base->span = index->target->span;
        base->temp = evaluateValue(index->target, scope);
    }
    Value container = readPlace(*base);
    Value key = evaluateValue(index->index, scope);

    switch (container.kind()) {
        case ValueKind::List: {
            place->list = container.asList();
            std::size_t length = place->list->items.size();
            if (key.is(ValueKind::Range)) {
                Bounds b = sliceBounds(key.asRange(), length, "list", index->span);
                place->kind = Place::Kind::ListSlice;
                place->lo = b.lo;
                place->hi = b.hi;
            } else {
                place->kind = Place::Kind::ListElement;
                place->index = elementIndex(key, length, "list", index->index->span, index->span);
            }
            return place;
        }
        case ValueKind::Str: {
            std::size_t length = container.asStr().size();
            place->base = base;
            if (key.is(ValueKind::Range)) {
                Bounds b = sliceBounds(key.asRange(), length, "string", index->span);
                place->kind = Place::Kind::StrSlice;
                place->lo = b.lo;
                place->hi = b.hi;
            } else {
                place->kind = Place::Kind::StrElement;
                place->index = elementIndex(key, length, "string", index->index->span, index->span);
            }
            return place;
        }
        case ValueKind::Map:
            place->kind = Place::Kind::MapEntry;
            place->map = container.asMap();
            place->key = key;
            return place;
        default:
            throw TypeError("value of type '" + typeName(container) + "' does not support indexed assignment",
                            index->target->span);
    }
}

Value Interpreter::readPlace(const Place& place) {
    switch (place.kind) {
        case Place::Kind::Variable: {
            Value* v = place.scope->findLocal(place.name);
            if (!v) throw UndefinedVariableError(place.name, place.span);
            return *v;
        }
        case Place::Kind::ListElement: {
            const auto& items = place.list->items;
            if (place.index >= items.size()) {
                throw IndexError("index " + std::to_string(place.index) + " is out of bounds for list of length " +
                                     std::to_string(items.size()),
                                 place.span);
            }
            return items[place.index];
        }
        case Place::Kind::ListSlice: {
            const auto& items = place.list->items;
            std::size_t lo = std::min(place.lo, items.size());
            std::size_t hi = std::min(place.hi, items.size());
            return Value::list(heap().makeList(std::vector<Value>(items.begin() + lo, items.begin() + hi)));
        }
        case Place::Kind::MapEntry: {
            Value* found = place.map->find(place.key);
            if (!found) missingKey(place.key, place.span);
            return *found;
        }
        case Place::Kind::StrElement:
        case Place::Kind::StrSlice: {
            Value owner = readPlace(*place.base);
            if (!owner.is(ValueKind::Str)) {
                throw TypeError("value of type '" + typeName(owner) + "' is no longer a string", place.span);
            }
            const auto& text = owner.asStr();
            if (place.kind == Place::Kind::StrElement) {
                if (place.index >= text.size()) {
                    throw IndexError("index " + std::to_string(place.index) +
                                         " is out of bounds for string of length " + std::to_string(text.size()),
                                     place.span);
                }
                return Value::character(text[place.index]);
            }
            std::size_t lo = std::min(place.lo, text.size());
            std::size_t hi = std::min(place.hi, text.size());
            return Value::string(text.substr(lo, hi - lo));
        }
        case Place::Kind::Temporary:
            return place.temp;
    }
    return Value::null();
}

void Interpreter::writePlace(const Place& place, Value value) {
    switch (place.kind) {
        case Place::Kind::Variable:
            place.scope->declare(place.name, std::move(value));
            return;
        case Place::Kind::ListElement: {
            auto& items = place.list->items;
            if (place.index >= items.size()) {
                throw IndexError("index " + std::to_string(place.index) + " is out of bounds for list of length " +
                                     std::to_string(items.size()),
                                 place.span);
            }
            items[place.index] = std::move(value);
            return;
        }
        case Place::Kind::ListSlice: {
            std::vector<Value> replacement;
            if (value.is(ValueKind::List)) {
                replacement = value.asList()->items;
            } else if (value.is(ValueKind::Range)) {
                const auto& r = value.asRange();
                for (std::int64_t i = r.lo; i < r.hi; ++i) replacement.push_back(Value::number(static_cast<double>(i)));
            } else {
                throw TypeError("cannot splice a value of type '" + typeName(value) +
                                    "' into a list slice; expected a list or a range",
                                place.span);
            }
            auto& items = place.list->items;
            std::size_t lo = std::min(place.lo, items.size());
            std::size_t hi = std::min(place.hi, items.size());
            items.erase(items.begin() + lo, items.begin() + hi);
            items.insert(items.begin() + lo, replacement.begin(), replacement.end());
            return;
        }
        case Place::Kind::MapEntry:
            place.map->set(place.key, std::move(value));
            return;
        case Place::Kind::StrElement:
        case Place::Kind::StrSlice: {
            Value owner = readPlace(*place.base);
            if (!owner.is(ValueKind::Str)) {
                throw TypeError("value of type '" + typeName(owner) + "' is no longer a string", place.span);
            }
            std::u32string text = owner.asStr();
            if (place.kind == Place::Kind::StrElement) {
                char32_t c;
                if (value.is(ValueKind::Char)) {
                    c = value.asChar();
                } else if (value.is(ValueKind::Str) && value.asStr().size() == 1) {
                    c = value.asStr()[0];
                } else {
                    throw TypeError("cannot store a value of type '" + typeName(value) +
                                        "' in a string element; expected a char",
                                    place.span);
                }
                if (place.index >= text.size()) {
                    throw IndexError("index " + std::to_string(place.index) +
                                         " is out of bounds for string of length " + std::to_string(text.size()),
                                     place.span);
                }
                text[place.index] = c;
            } else {
                std::u32string replacement;
                if (value.is(ValueKind::Str)) {
                    replacement = value.asStr();
                } else if (value.is(ValueKind::Char)) {
                    replacement = std::u32string(1, value.asChar());
                } else {
                    throw TypeError("cannot splice a value of type '" + typeName(value) +
                                        "' into a string slice; expected a string",
                                    place.span);
                }
                std::size_t lo = std::min(place.lo, text.size());
                std::size_t hi = std::min(place.hi, text.size());
                text.replace(lo, hi - lo, replacement);
            }
            writePlace(*place.base, Value::string(std::move(text)));
            return;
        }
        case Place::Kind::Temporary:
            return;
    }
}

} // namespace forge
