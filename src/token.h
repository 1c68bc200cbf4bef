#ifndef FORGE_TOKEN_H
#define FORGE_TOKEN_H

#include <string>
#include <utility>
#include <vector>
#include "source.h"

namespace forge {

enum class TokenType {
    NUMBER, STRING, CHAR, IDENTIFIER, BOOLEAN, NULL_LITERAL,
    VAR, PRINT, INPUT, IF, ELSE, WHILE, FOR, IN, RETURN, BREAK, CONTINUE,
    AND, OR, XOR, CLONE, MIRROR, AS,
    PLUS, MINUS, STAR, SLASH, PERCENT,
    ASSIGN, PLUS_ASSIGN, MINUS_ASSIGN, STAR_ASSIGN, SLASH_ASSIGN, PERCENT_ASSIGN,
    EQUAL, NOT_EQUAL, NOT, LESS, LESS_EQUAL, GREATER, GREATER_EQUAL,
    DOT_DOT, LPAREN, RPAREN, LBRACKET, RBRACKET, LBRACE, RBRACE,
    COMMA, SEMICOLON, COLON, PIPE,
    END
};

inline std::string tokenTypeToString(TokenType type) {
    switch (type) {
        case TokenType::NUMBER: return "NUMBER";
        case TokenType::STRING: return "STRING";
        case TokenType::CHAR: return "CHAR";
        case TokenType::IDENTIFIER: return "IDENTIFIER";
        case TokenType::BOOLEAN: return "BOOLEAN";
        case TokenType::NULL_LITERAL: return "NULL";
        case TokenType::VAR: return "VAR";
        case TokenType::PRINT: return "PRINT";
        case TokenType::INPUT: return "INPUT";
        case TokenType::IF: return "IF";
        case TokenType::ELSE: return "ELSE";
        case TokenType::WHILE: return "WHILE";
        case TokenType::FOR: return "FOR";
        case TokenType::IN: return "IN";
        case TokenType::RETURN: return "RETURN";
        case TokenType::BREAK: return "BREAK";
        case TokenType::CONTINUE: return "CONTINUE";
        case TokenType::AND: return "AND";
        case TokenType::OR: return "OR";
        case TokenType::XOR: return "XOR";
        case TokenType::CLONE: return "CLONE";
        case TokenType::MIRROR: return "MIRROR";
        case TokenType::AS: return "AS";
        case TokenType::PLUS: return "PLUS";
        case TokenType::MINUS: return "MINUS";
        case TokenType::STAR: return "STAR";
        case TokenType::SLASH: return "SLASH";
        case TokenType::PERCENT: return "PERCENT";
        case TokenType::ASSIGN: return "ASSIGN";
        case TokenType::PLUS_ASSIGN: return "PLUS_ASSIGN";
        case TokenType::MINUS_ASSIGN: return "MINUS_ASSIGN";
        case TokenType::STAR_ASSIGN: return "STAR_ASSIGN";
        case TokenType::SLASH_ASSIGN: return "SLASH_ASSIGN";
        case TokenType::PERCENT_ASSIGN: return "PERCENT_ASSIGN";
        case TokenType::EQUAL: return "EQUAL";
        case TokenType::NOT_EQUAL: return "NOT_EQUAL";
        case TokenType::NOT: return "NOT";
        case TokenType::LESS: return "LESS";
        case TokenType::LESS_EQUAL: return "LESS_EQUAL";
        case TokenType::GREATER: return "GREATER";
        case TokenType::GREATER_EQUAL: return "GREATER_EQUAL";
        case TokenType::DOT_DOT: return "DOT_DOT";
        case TokenType::LPAREN: return "LPAREN";
        case TokenType::RPAREN: return "RPAREN";
        case TokenType::LBRACKET: return "LBRACKET";
        case TokenType::RBRACKET: return "RBRACKET";
        case TokenType::LBRACE: return "LBRACE";
        case TokenType::RBRACE: return "RBRACE";
        case TokenType::COMMA: return "COMMA";
        case TokenType::SEMICOLON: return "SEMICOLON";
        case TokenType::COLON: return "COLON";
        case TokenType::PIPE: return "PIPE";
        case TokenType::END: return "END";
        default: return "UNKNOWN";
    }
}

// Source spelling of a punctuation or keyword token, used in "expected" lists.
inline std::string tokenTypeSpelling(TokenType type) {
    switch (type) {
        case TokenType::NUMBER: return "number";
        case TokenType::STRING: return "string";
        case TokenType::CHAR: return "char";
        case TokenType::IDENTIFIER: return "identifier";
        case TokenType::BOOLEAN: return "boolean";
        case TokenType::NULL_LITERAL: return "'null'";
        case TokenType::VAR: return "'var'";
        case TokenType::PRINT: return "'print'";
        case TokenType::INPUT: return "'input'";
        case TokenType::IF: return "'if'";
        case TokenType::ELSE: return "'else'";
        case TokenType::WHILE: return "'while'";
        case TokenType::FOR: return "'for'";
        case TokenType::IN: return "'in'";
        case TokenType::RETURN: return "'return'";
        case TokenType::BREAK: return "'break'";
        case TokenType::CONTINUE: return "'continue'";
        case TokenType::AND: return "'and'";
        case TokenType::OR: return "'or'";
        case TokenType::XOR: return "'xor'";
        case TokenType::CLONE: return "'clone'";
        case TokenType::MIRROR: return "'mirror'";
        case TokenType::AS: return "'as'";
        case TokenType::PLUS: return "'+'";
        case TokenType::MINUS: return "'-'";
        case TokenType::STAR: return "'*'";
        case TokenType::SLASH: return "'/'";
        case TokenType::PERCENT: return "'%'";
        case TokenType::ASSIGN: return "'='";
        case TokenType::PLUS_ASSIGN: return "'+='";
        case TokenType::MINUS_ASSIGN: return "'-='";
        case TokenType::STAR_ASSIGN: return "'*='";
        case TokenType::SLASH_ASSIGN: return "'/='";
        case TokenType::PERCENT_ASSIGN: return "'%='";
        case TokenType::EQUAL: return "'=='";
        case TokenType::NOT_EQUAL: return "'!='";
        case TokenType::NOT: return "'!'";
        case TokenType::LESS: return "'<'";
        case TokenType::LESS_EQUAL: return "'<='";
        case TokenType::GREATER: return "'>'";
        case TokenType::GREATER_EQUAL: return "'>='";
        case TokenType::DOT_DOT: return "'..'";
        case TokenType::LPAREN: return "'('";
        case TokenType::RPAREN: return "')'";
        case TokenType::LBRACKET: return "'['";
        case TokenType::RBRACKET: return "']'";
        case TokenType::LBRACE: return "'{'";
        case TokenType::RBRACE: return "'}'";
        case TokenType::COMMA: return "','";
        case TokenType::SEMICOLON: return "';'";
        case TokenType::COLON: return "':'";
        case TokenType::PIPE: return "'|'";
        case TokenType::END: return "end of input";
        default: return "token";
    }
}

struct Token {
    TokenType type = TokenType::END;
    std::string value;    // lexeme; cooked contents for STRING and CHAR
    Span span;
    double number = 0.0;
    std::u32string text;  // cooked contents for STRING and CHAR

    Token() = default;
    Token(TokenType type, std::string value, Span span)
        : type(type), value(std::move(value)), span(std::move(span)) {}

    TokenType getType() const { return type; }
    const std::string& getValue() const { return value; }

    // Human readable form for "found ..." in diagnostics.
    std::string describe() const {
        switch (type) {
            case TokenType::NUMBER: return "number " + value;
            case TokenType::STRING: return "string \"" + value + "\"";
            case TokenType::CHAR: return "char '" + value + "'";
            case TokenType::IDENTIFIER: return "identifier '" + value + "'";
            case TokenType::BOOLEAN: return "'" + value + "'";
            default: return tokenTypeSpelling(type);
        }
    }
};

} // namespace forge

#endif // FORGE_TOKEN_H
