#ifndef FORGE_AST_H
#define FORGE_AST_H

#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "source.h"
#include "token.h"
#include "types.h"

namespace forge {

class ASTNode {
public:
    Span span;
    virtual ~ASTNode() = default;
};

using NodePtr = std::shared_ptr<ASTNode>;

// ---- Expressions ----

enum class LiteralKind { Number, String, Char, Bool, Null };

class Literal : public ASTNode {
public:
    LiteralKind kind;
    double number = 0.0;
    std::u32string text;
    char32_t character = 0;
    bool boolean = false;
    explicit Literal(LiteralKind kind) : kind(kind) {}
};

class Identifier : public ASTNode {
public:
    std::string name;
    explicit Identifier(std::string name) : name(std::move(name)) {}
};

// lo..hi
class RangeExpression : public ASTNode {
public:
    NodePtr lo;
    NodePtr hi;
    RangeExpression(NodePtr lo, NodePtr hi) : lo(std::move(lo)), hi(std::move(hi)) {}
};

// [a, b, c]
class ListLiteral : public ASTNode {
public:
    std::vector<NodePtr> elements;
    explicit ListLiteral(std::vector<NodePtr> elements) : elements(std::move(elements)) {}
};

// [item; count]
class ListRepeat : public ASTNode {
public:
    NodePtr item;
    NodePtr count;
    ListRepeat(NodePtr item, NodePtr count) : item(std::move(item)), count(std::move(count)) {}
};

// [k: v, ...] and [:]
class MapLiteral : public ASTNode {
public:
    std::vector<std::pair<NodePtr, NodePtr>> entries;
    explicit MapLiteral(std::vector<std::pair<NodePtr, NodePtr>> entries) : entries(std::move(entries)) {}
};

class BlockStatement;

// |a, b| { ... }; the node span is the declaration site of every closure made from it
class FunctionLiteral : public ASTNode {
public:
    std::vector<std::string> params;
    std::shared_ptr<BlockStatement> body;
    FunctionLiteral(std::vector<std::string> params, std::shared_ptr<BlockStatement> body)
        : params(std::move(params)), body(std::move(body)) {}
};

// ! or unary -
class UnaryExpression : public ASTNode {
public:
    Token op;
    NodePtr operand;
    UnaryExpression(Token op, NodePtr operand) : op(std::move(op)), operand(std::move(operand)) {}
};

class BinaryExpression : public ASTNode {
public:
    NodePtr left;
    Token op;
    NodePtr right;
    BinaryExpression(NodePtr left, Token op, NodePtr right)
        : left(std::move(left)), op(std::move(op)), right(std::move(right)) {}
};

// expr as <type>
class CastExpression : public ASTNode {
public:
    NodePtr operand;
    ValueKind target;
    CastExpression(NodePtr operand, ValueKind target) : operand(std::move(operand)), target(target) {}
};

class CallExpression : public ASTNode {
public:
    NodePtr callee;
    std::vector<NodePtr> args;
    CallExpression(NodePtr callee, std::vector<NodePtr> args)
        : callee(std::move(callee)), args(std::move(args)) {}
};

// target[index]; index may be a range
class IndexExpression : public ASTNode {
public:
    NodePtr target;
    NodePtr index;
    IndexExpression(NodePtr target, NodePtr index) : target(std::move(target)), index(std::move(index)) {}
};

// target op value, op one of = += -= *= /= %=
class AssignExpression : public ASTNode {
public:
    NodePtr target;
    Token op;
    NodePtr value;
    AssignExpression(NodePtr target, Token op, NodePtr value)
        : target(std::move(target)), op(std::move(op)), value(std::move(value)) {}
};

class CloneExpression : public ASTNode {
public:
    NodePtr operand;
    explicit CloneExpression(NodePtr operand) : operand(std::move(operand)) {}
};

class MirrorExpression : public ASTNode {
public:
    NodePtr operand;
    explicit MirrorExpression(NodePtr operand) : operand(std::move(operand)) {}
};

// ---- Statements ----

class BlockStatement : public ASTNode {
public:
    std::vector<NodePtr> statements;
    explicit BlockStatement(std::vector<NodePtr> statements) : statements(std::move(statements)) {}
};

class VarDeclaration : public ASTNode {
public:
    std::string name;
    NodePtr initializer;
    VarDeclaration(std::string name, NodePtr initializer)
        : name(std::move(name)), initializer(std::move(initializer)) {}
};

class ExpressionStatement : public ASTNode {
public:
    NodePtr expression;
    explicit ExpressionStatement(NodePtr expression) : expression(std::move(expression)) {}
};

// elseBranch is a BlockStatement, another IfStatement (else if) or null
class IfStatement : public ASTNode {
public:
    NodePtr condition;
    std::shared_ptr<BlockStatement> thenBranch;
    NodePtr elseBranch;
    IfStatement(NodePtr condition, std::shared_ptr<BlockStatement> thenBranch, NodePtr elseBranch)
        : condition(std::move(condition)), thenBranch(std::move(thenBranch)), elseBranch(std::move(elseBranch)) {}
};

class WhileLoop : public ASTNode {
public:
    NodePtr condition;
    std::shared_ptr<BlockStatement> body;
    WhileLoop(NodePtr condition, std::shared_ptr<BlockStatement> body)
        : condition(std::move(condition)), body(std::move(body)) {}
};

// for variable in iterable { body }
class ForLoop : public ASTNode {
public:
    std::string variable;
    NodePtr iterable;
    std::shared_ptr<BlockStatement> body;
    ForLoop(std::string variable, NodePtr iterable, std::shared_ptr<BlockStatement> body)
        : variable(std::move(variable)), iterable(std::move(iterable)), body(std::move(body)) {}
};

class PrintStatement : public ASTNode {
public:
    NodePtr expression;
    explicit PrintStatement(NodePtr expression) : expression(std::move(expression)) {}
};

// input target[, prompt];
class InputStatement : public ASTNode {
public:
    NodePtr target;
    NodePtr prompt;  // may be null
    InputStatement(NodePtr target, NodePtr prompt) : target(std::move(target)), prompt(std::move(prompt)) {}
};

class ReturnStatement : public ASTNode {
public:
    NodePtr expression;  // may be null
    explicit ReturnStatement(NodePtr expression) : expression(std::move(expression)) {}
};

class BreakStatement : public ASTNode {};
class ContinueStatement : public ASTNode {};

} // namespace forge

#endif // FORGE_AST_H
