#ifndef FORGE_PARSER_H
#define FORGE_PARSER_H

#include <memory>
#include <string>
#include <vector>
#include "ast.h"
#include "errors.h"
#include "lexer.h"
#include "token.h"

namespace forge {

// Recursive descent parser with statement level error recovery.
//
// parse() never throws for bad input: every independent ParseError is
// collected and the parser resynchronizes at the next statement. A LexError
// ends the pass. Callers check hasErrors() before evaluating the program.
class Parser {
private:
    Lexer lexer;
    Token current;
    Token previous;
    std::vector<std::string> context;
    std::vector<std::shared_ptr<Error>> errors;
    int loopDepth = 0;
    int functionDepth = 0;

    // Pushes a label onto the context trail for the lifetime of the guard.
    class ContextGuard {
    public:
        ContextGuard(Parser& parser, const std::string& label) : parser_(parser) {
            parser_.context.push_back(label);
        }
        ~ContextGuard() { parser_.context.pop_back(); }
        ContextGuard(const ContextGuard&) = delete;
        ContextGuard& operator=(const ContextGuard&) = delete;
    private:
        Parser& parser_;
    };

    const Token& peek() const { return current; }
    Token advance();
    bool check(TokenType type) const { return current.type == type; }
    bool match(TokenType type);
    Token consume(TokenType type);
    Token consume(TokenType type, const std::string& what);
    [[noreturn]] void fail(std::vector<std::string> expected);
    [[noreturn]] void failAt(const std::string& message, const Span& span);
    bool isStatementStart(TokenType type) const;
    void synchronize(std::size_t statementStart, const ParseError& error);
    bool missingTerminator(const ParseError& error) const;

    template <typename T, typename... Args>
    std::shared_ptr<T> node(const Span& span, Args&&... args) {
        auto n = std::make_shared<T>(std::forward<Args>(args)...);
        n->span = span;
        return n;
    }

    NodePtr parseStatement();
    NodePtr parseVariableDeclaration();
    NodePtr parsePrintStatement();
    NodePtr parseInputStatement();
    NodePtr parseIfStatement();
    NodePtr parseWhileLoop();
    NodePtr parseForLoop();
    NodePtr parseReturnStatement();
    NodePtr parseLoopControl();
    NodePtr parseExpressionStatement();
    std::shared_ptr<BlockStatement> parseBlock();

    NodePtr parseExpression();
    NodePtr parseAssignment();
    NodePtr parseLogical();
    NodePtr parseEquality();
    NodePtr parseComparison();
    NodePtr parseMidUnary();
    NodePtr parseRange();
    NodePtr parseAdditive();
    NodePtr parseMultiplicative();
    NodePtr parseUnary();
    NodePtr parseCast();
    NodePtr parsePostfix();
    NodePtr parsePrimary();
    NodePtr parseBracketLiteral();
    NodePtr parseFunctionLiteral();
    NodePtr requireLvalue(NodePtr target);

public:
    explicit Parser(SourceRef source);

    std::shared_ptr<BlockStatement> parse();

    // Parses the whole input as a single expression; returns nullptr if it is
    // anything else. Used by the REPL to decide whether to echo a value.
    NodePtr parseExpressionOnly();

    bool hasErrors() const { return !errors.empty(); }
    const std::vector<std::shared_ptr<Error>>& getErrors() const { return errors; }
};

// Short phrase for an expression node ("call expression", "identifier 'x'").
std::string describeNode(const ASTNode& node);

} // namespace forge

#endif // FORGE_PARSER_H
