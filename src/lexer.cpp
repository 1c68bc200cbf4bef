#include "lexer.h"
#include <cstdlib>
#include <string>
#include <unordered_map>
#include <vector>

namespace forge {

namespace {

const std::unordered_map<std::string, TokenType>& keywords() {
    static const std::unordered_map<std::string, TokenType> table = {
        {"var", TokenType::VAR},       {"print", TokenType::PRINT},
        {"input", TokenType::INPUT},   {"if", TokenType::IF},
        {"else", TokenType::ELSE},     {"while", TokenType::WHILE},
        {"for", TokenType::FOR},       {"in", TokenType::IN},
        {"return", TokenType::RETURN}, {"break", TokenType::BREAK},
        {"continue", TokenType::CONTINUE},
        {"true", TokenType::BOOLEAN},  {"false", TokenType::BOOLEAN},
        {"null", TokenType::NULL_LITERAL},
        {"and", TokenType::AND},       {"or", TokenType::OR},
        {"xor", TokenType::XOR},       {"clone", TokenType::CLONE},
        {"mirror", TokenType::MIRROR}, {"as", TokenType::AS},
    };
    return table;
}

std::string printable(char32_t c) {
    if (c < 0x20 || c == 0x7F) {
        static const char* hex = "0123456789ABCDEF";
        std::string out = "\\x";
        out += hex[(c >> 4) & 0xF];
        out += hex[c & 0xF];
        return out;
    }
    return utf8::encode(c);
}

bool atEnd(const SourceRef& src, std::size_t pos) { return pos >= src->text().size(); }

} // namespace

Lexer::Lexer(SourceRef source)
    : source(std::move(source)), currentPos(0), line(1), column(1), currentChar(U'\0') {
    reset();
}

void Lexer::reset() {
    currentPos = 0;
    line = 1;
    column = 1;
    const auto& text = source->text();
    currentChar = text.empty() ? U'\0' : text[0];
}

void Lexer::advance() {
    const auto& text = source->text();
    if (currentPos >= text.size()) return;
    if (text[currentPos] == U'\n') {
        ++line;
        column = 1;
    } else {
        ++column;
    }
    ++currentPos;
    currentChar = currentPos < text.size() ? text[currentPos] : U'\0';
}

char32_t Lexer::peekNextChar() const {
    const auto& text = source->text();
    if (currentPos + 1 < text.size()) {
        return text[currentPos + 1];
    }
    return U'\0';
}

bool Lexer::isAlpha(char32_t c) const {
    return (c >= U'a' && c <= U'z') || (c >= U'A' && c <= U'Z') || c == U'_';
}

bool Lexer::isDigit(char32_t c) const {
    return c >= U'0' && c <= U'9';
}

Span Lexer::spanFrom(std::size_t startPos, std::size_t startLine, std::size_t startColumn) const {
    Span s;
    s.source = source;
    s.line = startLine;
    s.column = startColumn;
    s.offset = startPos;
    s.length = currentPos > startPos ? currentPos - startPos : 1;
    return s;
}

Span Lexer::here(std::size_t length) const {
    Span s;
    s.source = source;
    s.line = line;
    s.column = column;
    s.offset = currentPos;
    s.length = length;
    return s;
}

void Lexer::checkValid() const {
    if (currentPos < source->text().size() && source->isInvalidAt(currentPos)) {
        throw LexError("malformed UTF-8 sequence", here());
    }
}

void Lexer::skipWhitespaceAndComments() {
    for (;;) {
        if (atEnd(source, currentPos)) return;
        if (currentChar == U' ' || currentChar == U'\t' || currentChar == U'\r' || currentChar == U'\n') {
            advance();
        } else if (currentChar == U'#') {
            while (!atEnd(source, currentPos) && currentChar != U'\n') advance();
        } else {
            return;
        }
    }
}

// identifier parser with keywords
Token Lexer::parseIdentifier() {
    std::size_t startPos = currentPos, startLine = line, startColumn = column;
    std::string identifier;
    while (isAlpha(currentChar) || isDigit(currentChar)) {
        identifier += static_cast<char>(currentChar);
        advance();
    }
    Span span = spanFrom(startPos, startLine, startColumn);
    auto it = keywords().find(identifier);
    if (it != keywords().end()) return Token(it->second, identifier, span);
    return Token(TokenType::IDENTIFIER, identifier, span);
}

Token Lexer::parseNumber() {
    std::size_t startPos = currentPos, startLine = line, startColumn = column;
    std::string number;
    while (isDigit(currentChar)) {
        number += static_cast<char>(currentChar);
        advance();
    }
    // "1..4" is a range, so the dot only belongs to the number when a digit follows
    if (currentChar == U'.' && isDigit(peekNextChar())) {
        number += '.';
        advance();
        while (isDigit(currentChar)) {
            number += static_cast<char>(currentChar);
            advance();
        }
    }
    Token tok(TokenType::NUMBER, number, spanFrom(startPos, startLine, startColumn));
    tok.number = std::strtod(number.c_str(), nullptr);
    return tok;
}

char32_t Lexer::parseEscape() {
    Span at = here(2);
    advance(); // backslash
    if (atEnd(source, currentPos)) throw LexError("unterminated escape sequence", at);
    char32_t c = currentChar;
    advance();
    switch (c) {
        case U'n': return U'\n';
        case U't': return U'\t';
        case U'r': return U'\r';
        case U'0': return U'\0';
        case U'\\': return U'\\';
        case U'"': return U'"';
        case U'\'': return U'\'';
        default:
            throw LexError("unknown escape sequence '\\" + printable(c) + "'", at);
    }
}

Token Lexer::parseString() {
    std::size_t startPos = currentPos, startLine = line, startColumn = column;
    advance(); // Skip opening quote
    std::u32string value;
    while (currentChar != U'"') {
        if (atEnd(source, currentPos)) {
            Span s = spanFrom(startPos, startLine, startColumn);
            throw LexError("unterminated string literal", s);
        }
        checkValid();
        if (currentChar == U'\\') {
            value.push_back(parseEscape());
        } else {
            value.push_back(currentChar);
            advance();
        }
    }
    advance(); // Skip closing quote
    Token tok(TokenType::STRING, utf8::encode(value), spanFrom(startPos, startLine, startColumn));
    tok.text = std::move(value);
    return tok;
}

Token Lexer::parseChar() {
    std::size_t startPos = currentPos, startLine = line, startColumn = column;
    advance(); // Skip opening quote
    std::u32string value;
    while (currentChar != U'\'') {
        if (atEnd(source, currentPos) || currentChar == U'\n') {
            throw LexError("unterminated char literal", spanFrom(startPos, startLine, startColumn));
        }
        checkValid();
        if (currentChar == U'\\') {
            value.push_back(parseEscape());
        } else {
            value.push_back(currentChar);
            advance();
        }
    }
    advance(); // Skip closing quote
    Span span = spanFrom(startPos, startLine, startColumn);
    if (value.size() != 1) {
        throw LexError("char literal must contain exactly one character", span);
    }
    Token tok(TokenType::CHAR, utf8::encode(value), span);
    tok.text = std::move(value);
    return tok;
}

Token Lexer::parseOperator() {
    std::size_t startPos = currentPos, startLine = line, startColumn = column;
    char32_t c = currentChar;
    char32_t n = peekNextChar();
    auto two = [&](TokenType type, const char* lexeme) {
        advance();
        advance();
        return Token(type, lexeme, spanFrom(startPos, startLine, startColumn));
    };
    auto one = [&](TokenType type) {
        advance();
        return Token(type, std::string(1, static_cast<char>(c)), spanFrom(startPos, startLine, startColumn));
    };
    switch (c) {
        case U'+': return n == U'=' ? two(TokenType::PLUS_ASSIGN, "+=") : one(TokenType::PLUS);
        case U'-': return n == U'=' ? two(TokenType::MINUS_ASSIGN, "-=") : one(TokenType::MINUS);
        case U'*': return n == U'=' ? two(TokenType::STAR_ASSIGN, "*=") : one(TokenType::STAR);
        case U'/': return n == U'=' ? two(TokenType::SLASH_ASSIGN, "/=") : one(TokenType::SLASH);
        case U'%': return n == U'=' ? two(TokenType::PERCENT_ASSIGN, "%=") : one(TokenType::PERCENT);
        case U'=': return n == U'=' ? two(TokenType::EQUAL, "==") : one(TokenType::ASSIGN);
        case U'!': return n == U'=' ? two(TokenType::NOT_EQUAL, "!=") : one(TokenType::NOT);
        case U'<': return n == U'=' ? two(TokenType::LESS_EQUAL, "<=") : one(TokenType::LESS);
        case U'>': return n == U'=' ? two(TokenType::GREATER_EQUAL, ">=") : one(TokenType::GREATER);
        case U'.':
            if (n == U'.') return two(TokenType::DOT_DOT, "..");
            break;
        case U'(': return one(TokenType::LPAREN);
        case U')': return one(TokenType::RPAREN);
        case U'[': return one(TokenType::LBRACKET);
        case U']': return one(TokenType::RBRACKET);
        case U'{': return one(TokenType::LBRACE);
        case U'}': return one(TokenType::RBRACE);
        case U',': return one(TokenType::COMMA);
        case U';': return one(TokenType::SEMICOLON);
        case U':': return one(TokenType::COLON);
        case U'|': return one(TokenType::PIPE);
        default:
            break;
    }
    throw LexError("unexpected character '" + printable(c) + "'", here());
}

Token Lexer::next() {
    skipWhitespaceAndComments();
    if (atEnd(source, currentPos)) {
        return Token(TokenType::END, "", here());
    }
    checkValid();
    if (currentChar == U'"') return parseString();
    if (currentChar == U'\'') return parseChar();
    if (isDigit(currentChar)) return parseNumber();
    if (isAlpha(currentChar)) return parseIdentifier();
    return parseOperator();
}

std::vector<Token> Lexer::tokenize() {
    std::vector<Token> tokens;
    for (;;) {
        tokens.push_back(next());
        if (tokens.back().type == TokenType::END) break;
    }
    return tokens;
}

} // namespace forge
