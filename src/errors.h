#ifndef FORGE_ERRORS_H
#define FORGE_ERRORS_H

#include <exception>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "source.h"

namespace forge {

// Base of everything the lexer, parser and evaluator raise.
class Error : public std::exception {
public:
    Error(std::string message, Span span)
        : message_(std::move(message)), span_(std::move(span)) {}

    const char* what() const noexcept override { return message_.c_str(); }
    const std::string& message() const { return message_; }
    const Span& span() const { return span_; }
    void setSpan(Span span) { span_ = std::move(span); }

    // "Parsing" or "Runtime", as shown in the report header.
    virtual std::string stage() const = 0;
    // Context lines, innermost first, already phrased ("while parsing list").
    virtual std::vector<std::string> trail() const { return {}; }
    // Error class shown in front of the message.
    virtual std::string className() const = 0;

private:
    std::string message_;
    Span span_;
};

class LexError : public Error {
public:
    using Error::Error;
    std::string stage() const override { return "Parsing"; }
    std::string className() const override { return "LexError"; }
};

class ParseError : public Error {
public:
    ParseError(std::vector<std::string> expected, std::string found, Span span,
               std::vector<std::string> context = {});
    // Free-form message, e.g. an invalid assignment target.
    ParseError(std::string message, Span span, std::vector<std::string> context = {});

    const std::vector<std::string>& expected() const { return expected_; }
    const std::string& found() const { return found_; }
    const std::vector<std::string>& context() const { return context_; }
    void setContext(std::vector<std::string> context) { context_ = std::move(context); }

    std::string stage() const override { return "Parsing"; }
    std::string className() const override { return "ParseError"; }
    std::vector<std::string> trail() const override;

private:
    std::vector<std::string> expected_;
    std::string found_;
    std::vector<std::string> context_;  // outermost first
};

// A labelled location reported after the primary one.
struct Frame {
    std::string label;
    Span span;
};

class RuntimeError : public Error {
public:
    using Error::Error;

    std::string stage() const override { return "Runtime"; }
    std::string className() const override { return "RuntimeError"; }
    std::vector<std::string> trail() const override;

    const std::optional<Frame>& secondary() const { return secondary_; }
    void setSecondary(Frame frame) { secondary_ = std::move(frame); }

    // Called as the error unwinds out of a call; innermost call first.
    void addCallFrame(const std::string& callee) { calls_.push_back(callee); }
    const std::vector<std::string>& calls() const { return calls_; }

private:
    std::optional<Frame> secondary_;
    std::vector<std::string> calls_;
};

class UndefinedVariableError : public RuntimeError {
public:
    UndefinedVariableError(const std::string& name, Span span)
        : RuntimeError("undefined variable '" + name + "'", std::move(span)), name_(name) {}
    const std::string& name() const { return name_; }
    std::string className() const override { return "UndefinedVariableError"; }
private:
    std::string name_;
};

class TypeError : public RuntimeError {
public:
    using RuntimeError::RuntimeError;
    std::string className() const override { return "TypeError"; }
};

class ArityError : public RuntimeError {
public:
    ArityError(const std::string& callee, std::size_t expected, std::size_t found, Span callSite);
    std::size_t expected() const { return expected_; }
    std::size_t found() const { return found_; }
    std::string className() const override { return "ArityError"; }
private:
    std::size_t expected_;
    std::size_t found_;
};

class IndexError : public RuntimeError {
public:
    using RuntimeError::RuntimeError;
    std::string className() const override { return "IndexError"; }
};

class ArithmeticError : public RuntimeError {
public:
    using RuntimeError::RuntimeError;
    std::string className() const override { return "ArithmeticError"; }
};

} // namespace forge

#endif // FORGE_ERRORS_H
