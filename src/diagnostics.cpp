#include "diagnostics.h"
#include <algorithm>
#include <sstream>
#include "utf8.h"

namespace forge {

namespace {

const char* const kRed = "\x1b[91m";
const char* const kGrey = "\x1b[90m";
const char* const kCyan = "\x1b[96m";
const char* const kBold = "\x1b[1m";
const char* const kReset = "\x1b[0m";

std::string paint(const std::string& text, const char* code, bool color) {
    if (!color) return text;
    return std::string(code) + text + kReset;
}

std::string position(const Span& span) {
    return std::to_string(span.line) + ":" + std::to_string(span.column);
}

} // namespace

std::string formatSnippet(const Span& span, bool color) {
    if (!span.valid()) return std::string();
    std::u32string text = span.source->line(span.line);
    std::string number = std::to_string(span.line);
    std::string margin(8, ' ');

    // Tabs in the prefix are copied so the carets line up under them.
    std::size_t start = span.column > 0 ? span.column - 1 : 0;
    std::string pad;
    for (std::size_t i = 0; i < start; ++i) {
        pad += (i < text.size() && text[i] == U'\t') ? '\t' : ' ';
    }
    std::size_t available = start < text.size() ? text.size() - start : 0;
    std::size_t carets = std::max<std::size_t>(1, std::min(span.length, available));

    std::ostringstream out;
    out << margin << paint(number + "|", kGrey, color) << " " << utf8::encode(text) << "\n";
    out << margin << std::string(number.size(), ' ') << paint("|", kGrey, color) << " " << pad
        << paint(std::string(carets, '^'), kRed, color) << "\n";
    return out.str();
}

std::string formatError(const Error& error, bool color) {
    std::ostringstream out;
    std::string header = "[ERROR] " + error.stage() + " error";
    if (error.span().valid()) header += " at " + position(error.span());
    header += "...";
    out << paint(header, kRed, color) << "\n";

    for (const auto& line : error.trail()) {
        out << "   " << paint("..." + line + "...", kGrey, color) << "\n";
    }
    out << formatSnippet(error.span(), color);

    if (auto runtime = dynamic_cast<const RuntimeError*>(&error)) {
        if (runtime->secondary() && runtime->secondary()->span.valid()) {
            const Frame& frame = *runtime->secondary();
            out << "   " << paint("..." + frame.label + " at " + position(frame.span) + "...", kCyan, color) << "\n";
            out << formatSnippet(frame.span, color);
        }
    }

    out << "   " << paint(error.className() + ":", kBold, color) << " " << error.message() << "\n";
    return out.str();
}

void report(std::ostream& out, const Error& error, bool color) {
    out << formatError(error, color) << std::flush;
}

void report(std::ostream& out, const std::vector<std::shared_ptr<Error>>& errors, bool color) {
    for (const auto& error : errors) report(out, *error, color);
}

} // namespace forge
