#ifndef FORGE_SOURCE_H
#define FORGE_SOURCE_H

#include <algorithm>
#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "utf8.h"

namespace forge {

// One unit of program text (a script file or a single REPL line).
// Positions everywhere are counted in unicode scalars, not bytes.
class Source {
    struct Tag {};

public:
    explicit Source(Tag) {}

    static std::shared_ptr<const Source> fromUtf8(std::string name, const std::string& bytes) {
        auto src = std::make_shared<Source>(Tag{});
        src->name_ = std::move(name);
        src->text_ = utf8::decode(bytes, &src->invalid_);
        src->lineStarts_.push_back(0);
        for (std::size_t i = 0; i < src->text_.size(); ++i) {
            if (src->text_[i] == U'\n') src->lineStarts_.push_back(i + 1);
        }
        return src;
    }

    const std::string& name() const { return name_; }
    const std::u32string& text() const { return text_; }
    std::size_t lineCount() const { return lineStarts_.size(); }

    bool isInvalidAt(std::size_t offset) const {
        return std::binary_search(invalid_.begin(), invalid_.end(), offset);
    }

    // 1-based line, without its terminator.
    std::u32string line(std::size_t lineNo) const {
        if (lineNo == 0 || lineNo > lineStarts_.size()) return std::u32string();
        std::size_t start = lineStarts_[lineNo - 1];
        std::size_t end = lineNo < lineStarts_.size() ? lineStarts_[lineNo] - 1 : text_.size();
        if (end > start && text_[end - 1] == U'\r') --end;
        return text_.substr(start, end - start);
    }

private:
    std::string name_;
    std::u32string text_;
    std::vector<std::size_t> lineStarts_;
    std::vector<std::size_t> invalid_;
};

using SourceRef = std::shared_ptr<const Source>;

struct Span {
    SourceRef source;
    std::size_t line = 0;    // 1-based
    std::size_t column = 0;  // 1-based
    std::size_t offset = 0;
    std::size_t length = 0;

    bool valid() const { return source != nullptr && line > 0; }

    // Covering span from the start of this one to the end of `last`.
    Span to(const Span& last) const {
        if (!valid()) return last;
        if (!last.valid()) return *this;
        Span s = *this;
        std::size_t end = std::max(offset + length, last.offset + last.length);
        s.length = end - offset;
        return s;
    }
};

} // namespace forge

#endif // FORGE_SOURCE_H
