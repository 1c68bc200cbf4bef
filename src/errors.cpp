#include "errors.h"

namespace forge {

namespace {

std::string joinExpected(const std::vector<std::string>& expected) {
    std::string out;
    for (std::size_t i = 0; i < expected.size(); ++i) {
        if (i > 0) out += (i + 1 == expected.size()) ? " or " : ", ";
        out += expected[i];
    }
    return out;
}

} // namespace

ParseError::ParseError(std::vector<std::string> expected, std::string found, Span span,
                       std::vector<std::string> context)
    : Error("expected " + joinExpected(expected) + ", found " + found, std::move(span)),
      expected_(std::move(expected)), found_(std::move(found)), context_(std::move(context)) {}

ParseError::ParseError(std::string message, Span span, std::vector<std::string> context)
    : Error(std::move(message), std::move(span)), context_(std::move(context)) {}

std::vector<std::string> ParseError::trail() const {
    std::vector<std::string> lines;
    for (auto it = context_.rbegin(); it != context_.rend(); ++it) {
        lines.push_back("while parsing " + *it);
    }
    return lines;
}

std::vector<std::string> RuntimeError::trail() const {
    std::vector<std::string> lines;
    for (const auto& callee : calls_) lines.push_back("while calling " + callee);
    return lines;
}

ArityError::ArityError(const std::string& callee, std::size_t expected, std::size_t found, Span callSite)
    : RuntimeError(callee + " expected " + std::to_string(expected) +
                       (expected == 1 ? " argument" : " arguments") + ", found " + std::to_string(found),
                   std::move(callSite)),
      expected_(expected), found_(found) {}

} // namespace forge
