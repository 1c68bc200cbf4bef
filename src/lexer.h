#ifndef FORGE_LEXER_H
#define FORGE_LEXER_H

#include <memory>
#include <string>
#include <vector>
#include "errors.h"
#include "source.h"
#include "token.h"

namespace forge {

// Pull-based tokenizer. next() yields one token at a time and keeps
// returning END once the input is exhausted; reset() rewinds to the start.
// Malformed input raises LexError at the offending character.
class Lexer {
private:
    SourceRef source;
    std::size_t currentPos;
    std::size_t line;
    std::size_t column;
    char32_t currentChar;

    void advance();
    char32_t peekNextChar() const;
    bool isAlpha(char32_t c) const;
    bool isDigit(char32_t c) const;
    void skipWhitespaceAndComments();
    void checkValid() const;

    Span spanFrom(std::size_t startPos, std::size_t startLine, std::size_t startColumn) const;
    Span here(std::size_t length = 1) const;

    Token parseIdentifier();
    Token parseNumber();
    Token parseString();
    Token parseChar();
    char32_t parseEscape();
    Token parseOperator();

public:
    explicit Lexer(SourceRef source);

    Token next();
    void reset();
    std::vector<Token> tokenize();

    const SourceRef& getSource() const { return source; }
};

} // namespace forge

#endif // FORGE_LEXER_H
