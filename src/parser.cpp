#include "parser.h"
#include <memory>
#include <vector>

namespace forge {

// Constructor
Parser::Parser(SourceRef source) : lexer(std::move(source)) {}

// Advances and returns the token that was current.
Token Parser::advance() {
    previous = current;
    current = lexer.next();
    return previous;
}

// If the current token matches type, consume it and return true.
bool Parser::match(TokenType type) {
    if (check(type)) {
        advance();
        return true;
    }
    return false;
}

Token Parser::consume(TokenType type) {
    if (check(type)) return advance();
    fail({tokenTypeSpelling(type)});
}

Token Parser::consume(TokenType type, const std::string& what) {
    if (check(type)) return advance();
    fail({what});
}

void Parser::fail(std::vector<std::string> expected) {
    throw ParseError(std::move(expected), current.describe(), current.span, context);
}

void Parser::failAt(const std::string& message, const Span& span) {
    throw ParseError(message, span, context);
}

bool Parser::missingTerminator(const ParseError& error) const {
    return error.expected().size() == 1 && error.expected().front() == tokenTypeSpelling(TokenType::SEMICOLON);
}

bool Parser::isStatementStart(TokenType type) const {
    switch (type) {
        case TokenType::VAR:
        case TokenType::PRINT:
        case TokenType::INPUT:
        case TokenType::IF:
        case TokenType::WHILE:
        case TokenType::FOR:
        case TokenType::RETURN:
        case TokenType::BREAK:
        case TokenType::CONTINUE:
            return true;
        default:
            return false;
    }
}

// Skip to the next plausible statement boundary. Always makes progress when
// the failing statement consumed nothing, so recovery cannot loop.
// A ';' missing at the end of a line leaves the next line untouched: the
// token that was found in its place already starts the next statement.
void Parser::synchronize(std::size_t statementStart, const ParseError& error) {
    if (missingTerminator(error) && current.span.offset != statementStart && previous.span.valid() &&
        current.span.line > previous.span.line) {
        return;
    }
    if (current.span.offset == statementStart && !check(TokenType::END)) advance();
    while (!check(TokenType::END)) {
        if (check(TokenType::SEMICOLON)) {
            advance();
            return;
        }
        if (check(TokenType::RBRACE) || isStatementStart(current.type)) return;
        advance();
    }
}

std::shared_ptr<BlockStatement> Parser::parse() {
    std::vector<NodePtr> statements;
    errors.clear();
    context.clear();
    loopDepth = 0;
    functionDepth = 0;
    lexer.reset();
    Span programSpan;
    try {
        current = lexer.next();
        programSpan = current.span;
        while (!check(TokenType::END)) {
            std::size_t start = current.span.offset;
            try {
                statements.push_back(parseStatement());
            } catch (const ParseError& e) {
                errors.push_back(std::make_shared<ParseError>(e));
                loopDepth = 0;
                functionDepth = 0;
                synchronize(start, e);
            }
        }
    } catch (const LexError& e) {
        errors.push_back(std::make_shared<LexError>(e));
    }
    return node<BlockStatement>(programSpan, std::move(statements));
}

NodePtr Parser::parseExpressionOnly() {
    errors.clear();
    context.clear();
    lexer.reset();
    try {
        current = lexer.next();
        if (check(TokenType::END)) return nullptr;
        NodePtr expr = parseExpression();
        if (!check(TokenType::END)) return nullptr;
        return expr;
    } catch (const Error&) {
        // Not a bare expression; parse() reports the problem in context
        return nullptr;
    }
}

// ---- Statements ----

NodePtr Parser::parseStatement() {
    switch (current.type) {
        case TokenType::VAR: return parseVariableDeclaration();
        case TokenType::PRINT: return parsePrintStatement();
        case TokenType::INPUT: return parseInputStatement();
        case TokenType::IF: return parseIfStatement();
        case TokenType::WHILE: return parseWhileLoop();
        case TokenType::FOR: return parseForLoop();
        case TokenType::RETURN: return parseReturnStatement();
        case TokenType::BREAK:
        case TokenType::CONTINUE: return parseLoopControl();
        case TokenType::LBRACE: return parseBlock();
        default: return parseExpressionStatement();
    }
}

std::shared_ptr<BlockStatement> Parser::parseBlock() {
    Token open = consume(TokenType::LBRACE);
    std::vector<NodePtr> statements;
    while (!check(TokenType::RBRACE) && !check(TokenType::END)) {
        std::size_t start = current.span.offset;
        int savedLoop = loopDepth;
        int savedFunction = functionDepth;
        try {
            statements.push_back(parseStatement());
        } catch (const ParseError& e) {
            errors.push_back(std::make_shared<ParseError>(e));
            loopDepth = savedLoop;
            functionDepth = savedFunction;
            synchronize(start, e);
        }
    }
    Token close = consume(TokenType::RBRACE);
    return node<BlockStatement>(open.span.to(close.span), std::move(statements));
}

// var name = expr;   (initializer optional, defaults to null)
NodePtr Parser::parseVariableDeclaration() {
    ContextGuard guard(*this, "variable declaration");
    Token keyword = advance();
    Token name = consume(TokenType::IDENTIFIER, "variable name");
    NodePtr init;
    if (match(TokenType::ASSIGN)) {
        init = parseExpression();
    } else if (!check(TokenType::SEMICOLON)) {
        fail({"'='", "';'"});
    }
    Token semi = consume(TokenType::SEMICOLON);
    auto decl = node<VarDeclaration>(keyword.span.to(semi.span), name.value, init);
    return decl;
}

NodePtr Parser::parsePrintStatement() {
    ContextGuard guard(*this, "print statement");
    Token keyword = advance();
    NodePtr expr = parseExpression();
    Token semi = consume(TokenType::SEMICOLON);
    return node<PrintStatement>(keyword.span.to(semi.span), expr);
}

// input target;  or  input target, prompt;
NodePtr Parser::parseInputStatement() {
    ContextGuard guard(*this, "input statement");
    Token keyword = advance();
    NodePtr target = requireLvalue(parseLogical());
    NodePtr prompt;
    if (match(TokenType::COMMA)) prompt = parseExpression();
    Token semi = consume(TokenType::SEMICOLON);
    return node<InputStatement>(keyword.span.to(semi.span), target, prompt);
}

NodePtr Parser::parseIfStatement() {
    ContextGuard guard(*this, "if-else statement");
    Token keyword = advance();
    NodePtr condition = parseExpression();
    auto thenBranch = parseBlock();
    NodePtr elseBranch;
    Span end = thenBranch->span;
    if (match(TokenType::ELSE)) {
        if (check(TokenType::IF)) {
            elseBranch = parseIfStatement();
        } else if (check(TokenType::LBRACE)) {
            elseBranch = parseBlock();
        } else {
            fail({"'if'", "'{'"});
        }
        end = elseBranch->span;
    }
    return node<IfStatement>(keyword.span.to(end), condition, thenBranch, elseBranch);
}

NodePtr Parser::parseWhileLoop() {
    ContextGuard guard(*this, "while statement");
    Token keyword = advance();
    NodePtr condition = parseExpression();
    ++loopDepth;
    auto body = parseBlock();
    --loopDepth;
    return node<WhileLoop>(keyword.span.to(body->span), condition, body);
}

// for name in iterable { ... }
NodePtr Parser::parseForLoop() {
    ContextGuard guard(*this, "for statement");
    Token keyword = advance();
    Token name = consume(TokenType::IDENTIFIER, "loop variable");
    consume(TokenType::IN);
    NodePtr iterable = parseExpression();
    ++loopDepth;
    auto body = parseBlock();
    --loopDepth;
    return node<ForLoop>(keyword.span.to(body->span), name.value, iterable, body);
}

NodePtr Parser::parseReturnStatement() {
    ContextGuard guard(*this, "return statement");
    Token keyword = advance();
    if (functionDepth == 0) failAt("'return' outside of a function", keyword.span);
    NodePtr value;
    if (!check(TokenType::SEMICOLON)) value = parseExpression();
    Token semi = consume(TokenType::SEMICOLON);
    return node<ReturnStatement>(keyword.span.to(semi.span), value);
}

NodePtr Parser::parseLoopControl() {
    bool isBreak = check(TokenType::BREAK);
    ContextGuard guard(*this, isBreak ? "break statement" : "continue statement");
    Token keyword = advance();
    if (loopDepth == 0) failAt("'" + keyword.value + "' outside of a loop", keyword.span);
    Token semi = consume(TokenType::SEMICOLON);
    if (isBreak) return node<BreakStatement>(keyword.span.to(semi.span));
    return node<ContinueStatement>(keyword.span.to(semi.span));
}

NodePtr Parser::parseExpressionStatement() {
    ContextGuard guard(*this, "expression statement");
    NodePtr expr = parseExpression();
    Token semi = consume(TokenType::SEMICOLON);
    return node<ExpressionStatement>(expr->span.to(semi.span), expr);
}

// ---- Expressions ----

NodePtr Parser::parseExpression() {
    return parseAssignment();
}

static bool isAssignmentOperator(TokenType type) {
    switch (type) {
        case TokenType::ASSIGN:
        case TokenType::PLUS_ASSIGN:
        case TokenType::MINUS_ASSIGN:
        case TokenType::STAR_ASSIGN:
        case TokenType::SLASH_ASSIGN:
        case TokenType::PERCENT_ASSIGN:
            return true;
        default:
            return false;
    }
}

NodePtr Parser::requireLvalue(NodePtr target) {
    if (std::dynamic_pointer_cast<Identifier>(target) || std::dynamic_pointer_cast<IndexExpression>(target)) {
        return target;
    }
    ContextGuard guard(*this, "lvalue");
    throw ParseError({"l-value (a variable or an indexed element)"}, describeNode(*target), target->span, context);
}

// Right associative: a = b = c
NodePtr Parser::parseAssignment() {
    NodePtr target = parseLogical();
    if (isAssignmentOperator(current.type)) {
        requireLvalue(target);
        Token op = advance();
        NodePtr value = parseAssignment();
        return node<AssignExpression>(target->span.to(value->span), target, op, value);
    }
    return target;
}

NodePtr Parser::parseLogical() {
    NodePtr left = parseEquality();
    while (check(TokenType::AND) || check(TokenType::OR) || check(TokenType::XOR)) {
        Token op = advance();
        NodePtr right = parseEquality();
        left = node<BinaryExpression>(left->span.to(right->span), left, op, right);
    }
    return left;
}

NodePtr Parser::parseEquality() {
    NodePtr left = parseComparison();
    while (check(TokenType::EQUAL) || check(TokenType::NOT_EQUAL)) {
        Token op = advance();
        NodePtr right = parseComparison();
        left = node<BinaryExpression>(left->span.to(right->span), left, op, right);
    }
    return left;
}

NodePtr Parser::parseComparison() {
    NodePtr left = parseMidUnary();
    while (check(TokenType::LESS) || check(TokenType::LESS_EQUAL) ||
           check(TokenType::GREATER) || check(TokenType::GREATER_EQUAL)) {
        Token op = advance();
        NodePtr right = parseMidUnary();
        left = node<BinaryExpression>(left->span.to(right->span), left, op, right);
    }
    return left;
}

// clone x / mirror x bind looser than arithmetic: clone a + b clones the sum
NodePtr Parser::parseMidUnary() {
    if (check(TokenType::CLONE) || check(TokenType::MIRROR)) {
        Token keyword = advance();
        NodePtr operand = parseMidUnary();
        Span span = keyword.span.to(operand->span);
        if (keyword.type == TokenType::CLONE) return node<CloneExpression>(span, operand);
        return node<MirrorExpression>(span, operand);
    }
    return parseRange();
}

NodePtr Parser::parseRange() {
    NodePtr lo = parseAdditive();
    if (match(TokenType::DOT_DOT)) {
        NodePtr hi = parseAdditive();
        return node<RangeExpression>(lo->span.to(hi->span), lo, hi);
    }
    return lo;
}

NodePtr Parser::parseAdditive() {
    NodePtr left = parseMultiplicative();
    while (check(TokenType::PLUS) || check(TokenType::MINUS)) {
        Token op = advance();
        NodePtr right = parseMultiplicative();
        left = node<BinaryExpression>(left->span.to(right->span), left, op, right);
    }
    return left;
}

NodePtr Parser::parseMultiplicative() {
    NodePtr left = parseUnary();
    while (check(TokenType::STAR) || check(TokenType::SLASH) || check(TokenType::PERCENT)) {
        Token op = advance();
        NodePtr right = parseUnary();
        left = node<BinaryExpression>(left->span.to(right->span), left, op, right);
    }
    return left;
}

NodePtr Parser::parseUnary() {
    if (check(TokenType::NOT) || check(TokenType::MINUS)) {
        Token op = advance();
        NodePtr operand = parseUnary();
        return node<UnaryExpression>(op.span.to(operand->span), op, operand);
    }
    return parseCast();
}

// expr as number|string|char|bool|list
NodePtr Parser::parseCast() {
    NodePtr expr = parsePostfix();
    while (match(TokenType::AS)) {
        if (!check(TokenType::IDENTIFIER) || !parseCastTarget(current.value)) {
            fail({"type name (" + castTargetNames() + ")"});
        }
        Token type = advance();
        expr = node<CastExpression>(expr->span.to(type.span), expr, *parseCastTarget(type.value));
    }
    return expr;
}

NodePtr Parser::parsePostfix() {
    NodePtr expr = parsePrimary();
    for (;;) {
        if (check(TokenType::LPAREN)) {
            ContextGuard guard(*this, "call arguments");
            advance();
            std::vector<NodePtr> args;
            if (!check(TokenType::RPAREN)) {
                do {
                    args.push_back(parseExpression());
                } while (match(TokenType::COMMA));
            }
            if (!check(TokenType::RPAREN)) fail({"','", "')'"});
            Token close = advance();
            expr = node<CallExpression>(expr->span.to(close.span), expr, std::move(args));
        } else if (check(TokenType::LBRACKET)) {
            ContextGuard guard(*this, "index");
            advance();
            NodePtr index = parseExpression();
            Token close = consume(TokenType::RBRACKET);
            expr = node<IndexExpression>(expr->span.to(close.span), expr, index);
        } else {
            return expr;
        }
    }
}

NodePtr Parser::parsePrimary() {
    const Token& token = peek();
    switch (token.type) {
        case TokenType::NUMBER: {
            Token t = advance();
            auto lit = node<Literal>(t.span, LiteralKind::Number);
            lit->number = t.number;
            return lit;
        }
        case TokenType::STRING: {
            Token t = advance();
            auto lit = node<Literal>(t.span, LiteralKind::String);
            lit->text = t.text;
            return lit;
        }
        case TokenType::CHAR: {
            Token t = advance();
            auto lit = node<Literal>(t.span, LiteralKind::Char);
            lit->character = t.text.empty() ? 0 : t.text[0];
            return lit;
        }
        case TokenType::BOOLEAN: {
            Token t = advance();
            auto lit = node<Literal>(t.span, LiteralKind::Bool);
            lit->boolean = (t.value == "true");
            return lit;
        }
        case TokenType::NULL_LITERAL: {
            Token t = advance();
            return node<Literal>(t.span, LiteralKind::Null);
        }
        case TokenType::IDENTIFIER: {
            Token t = advance();
            return node<Identifier>(t.span, t.value);
        }
        case TokenType::LPAREN: {
            ContextGuard guard(*this, "parenthesized expression");
            advance();
            NodePtr inner = parseExpression();
            consume(TokenType::RPAREN);
            return inner;
        }
        case TokenType::LBRACKET:
            return parseBracketLiteral();
        case TokenType::PIPE:
            return parseFunctionLiteral();
        default:
            fail({"expression"});
    }
}

// [] [a, b] [x; n] [:] [k: v, ...]
NodePtr Parser::parseBracketLiteral() {
    ContextGuard guard(*this, "list");
    Token open = advance();
    if (check(TokenType::RBRACKET)) {
        Token close = advance();
        return node<ListLiteral>(open.span.to(close.span), std::vector<NodePtr>{});
    }
    if (check(TokenType::COLON)) {
        context.back() = "map";
        advance();
        Token close = consume(TokenType::RBRACKET);
        return node<MapLiteral>(open.span.to(close.span), std::vector<std::pair<NodePtr, NodePtr>>{});
    }

    NodePtr first = parseExpression();

    if (match(TokenType::COLON)) {
        context.back() = "map";
        std::vector<std::pair<NodePtr, NodePtr>> entries;
        entries.emplace_back(first, parseExpression());
        while (match(TokenType::COMMA)) {
            if (check(TokenType::RBRACKET)) break;
            NodePtr key = parseExpression();
            consume(TokenType::COLON);
            entries.emplace_back(key, parseExpression());
        }
        if (!check(TokenType::RBRACKET)) fail({"','", "']'"});
        Token close = advance();
        return node<MapLiteral>(open.span.to(close.span), std::move(entries));
    }

    if (match(TokenType::SEMICOLON)) {
        NodePtr count = parseExpression();
        Token close = consume(TokenType::RBRACKET);
        return node<ListRepeat>(open.span.to(close.span), first, count);
    }

    std::vector<NodePtr> elements{first};
    while (match(TokenType::COMMA)) {
        if (check(TokenType::RBRACKET)) break;
        elements.push_back(parseExpression());
    }
    if (!check(TokenType::RBRACKET)) fail({"','", "']'"});
    Token close = advance();
    return node<ListLiteral>(open.span.to(close.span), std::move(elements));
}

// |a, b| { ... }  and  || { ... }
NodePtr Parser::parseFunctionLiteral() {
    ContextGuard guard(*this, "function");
    Token open = advance();
    std::vector<std::string> params;
    if (!check(TokenType::PIPE)) {
        do {
            Token param = consume(TokenType::IDENTIFIER, "parameter name");
            for (const auto& existing : params) {
                if (existing == param.value) failAt("duplicate parameter '" + param.value + "'", param.span);
            }
            params.push_back(param.value);
        } while (match(TokenType::COMMA));
    }
    if (!check(TokenType::PIPE)) fail({"','", "'|'"});
    advance();

    int savedLoop = loopDepth;
    loopDepth = 0;
    ++functionDepth;
    auto body = parseBlock();
    --functionDepth;
    loopDepth = savedLoop;
    return node<FunctionLiteral>(open.span.to(body->span), std::move(params), body);
}

std::string describeNode(const ASTNode& n) {
    if (auto id = dynamic_cast<const Identifier*>(&n)) return "identifier '" + id->name + "'";
    if (auto lit = dynamic_cast<const Literal*>(&n)) {
        switch (lit->kind) {
            case LiteralKind::Number: return "number literal";
            case LiteralKind::String: return "string literal";
            case LiteralKind::Char: return "char literal";
            case LiteralKind::Bool: return "boolean literal";
            case LiteralKind::Null: return "'null'";
        }
    }
    if (dynamic_cast<const CallExpression*>(&n)) return "call expression";
    if (dynamic_cast<const IndexExpression*>(&n)) return "index expression";
    if (dynamic_cast<const BinaryExpression*>(&n)) return "binary expression";
    if (dynamic_cast<const UnaryExpression*>(&n)) return "unary expression";
    if (dynamic_cast<const RangeExpression*>(&n)) return "range expression";
    if (dynamic_cast<const ListLiteral*>(&n)) return "list literal";
    if (dynamic_cast<const ListRepeat*>(&n)) return "list literal";
    if (dynamic_cast<const MapLiteral*>(&n)) return "map literal";
    if (dynamic_cast<const FunctionLiteral*>(&n)) return "function literal";
    if (dynamic_cast<const CastExpression*>(&n)) return "cast expression";
    if (dynamic_cast<const CloneExpression*>(&n)) return "clone expression";
    if (dynamic_cast<const MirrorExpression*>(&n)) return "mirror expression";
    if (dynamic_cast<const AssignExpression*>(&n)) return "assignment";
    return "expression";
}

} // namespace forge
