#ifndef FORGE_INTERPRETER_H
#define FORGE_INTERPRETER_H

#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include "ast.h"
#include "env.h"
#include "errors.h"
#include "value.h"

namespace forge {

struct InterpreterOptions {
    std::ostream* out = &std::cout;  // print
    std::istream* in = &std::cin;    // input
    // Echo the prompt of `input` to `out` before reading.
    bool echoPrompt = true;
};

class Interpreter {
public:
    explicit Interpreter(InterpreterOptions options = {});

    // Runs every statement of a parsed program in env's top-level scope.
    // A RuntimeError aborts the program and propagates to the caller.
    void run(const std::shared_ptr<BlockStatement>& program, Environment& env);

    // Evaluates one expression in env's top-level scope (REPL echo).
    Value evaluate(const NodePtr& expr, Environment& env);

    // Calls a function value from host code, e.g. from inside a native.
    Value call(const Value& callee, std::vector<Value> args, const Span& site = Span{});

    // Environment of the innermost active run()/evaluate(); throws if idle.
    Environment& environment();

    const InterpreterOptions& options() const { return options_; }

private:
    // How a statement finished. Return/Break/Continue travel up as values,
    // never as exceptions.
    struct ExecResult {
        enum class Flow { Normal, Return, Break, Continue };
        Flow flow = Flow::Normal;
        Value value;
    };

    // A settable location produced by lvalue resolution.
    struct Place {
        enum class Kind { Variable, ListElement, ListSlice, MapEntry, StrElement, StrSlice, Temporary };
        Kind kind = Kind::Temporary;
        Span span;
        std::shared_ptr<Scope> scope;
        std::string name;
        ListRef list;
        MapRef map;
        Value key;
        std::size_t index = 0;
        std::size_t lo = 0;
        std::size_t hi = 0;
        std::shared_ptr<Place> base;  // owner of a string element or slice
        Value temp;
    };

    ExecResult execute(const NodePtr& stmt, const std::shared_ptr<Scope>& scope);
    ExecResult executeStatements(const std::vector<NodePtr>& statements, const std::shared_ptr<Scope>& scope);
    ExecResult executeBlock(const std::shared_ptr<BlockStatement>& block, const std::shared_ptr<Scope>& scope);
    ExecResult executeIf(const std::shared_ptr<IfStatement>& stmt, const std::shared_ptr<Scope>& scope);
    ExecResult executeWhileLoop(const std::shared_ptr<WhileLoop>& loop, const std::shared_ptr<Scope>& scope);
    ExecResult executeForLoop(const std::shared_ptr<ForLoop>& loop, const std::shared_ptr<Scope>& scope);
    void executeInput(const std::shared_ptr<InputStatement>& stmt, const std::shared_ptr<Scope>& scope);

    Value evaluateValue(const NodePtr& expr, const std::shared_ptr<Scope>& scope);
    Value evaluateAssignment(const std::shared_ptr<AssignExpression>& assign, const std::shared_ptr<Scope>& scope);
    Value evaluateCall(const std::shared_ptr<CallExpression>& call, const std::shared_ptr<Scope>& scope);
    Value evaluateIndex(const std::shared_ptr<IndexExpression>& index, const std::shared_ptr<Scope>& scope);
    Value makeFunction(const std::shared_ptr<FunctionLiteral>& literal, const std::shared_ptr<Scope>& scope);

    Value callValue(const Value& callee, std::vector<Value>& args, const Span& site, const std::string& label);

    std::shared_ptr<Place> resolvePlace(const NodePtr& target, const std::shared_ptr<Scope>& scope);
    Value readPlace(const Place& place);
    void writePlace(const Place& place, Value value);

    bool truthiness(const Value& v, const Span& span) const;
    Heap& heap() { return env_->heap(); }

    InterpreterOptions options_;
    Environment* env_ = nullptr;
    int runDepth_ = 0;
};

} // namespace forge

#endif // FORGE_INTERPRETER_H
