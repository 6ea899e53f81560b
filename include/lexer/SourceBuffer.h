/**
 * Name: rbparse::lex::SourceBuffer
 * Purpose: Immutable Ruby source bytes with a stable name and a line table.
 * Theory of Operation:
 *   Line starts are computed once at construction; lineOf/columnOf binary
 *   search them. The first line number is configurable so that code
 *   extracted from a larger file keeps its original numbering.
 */
#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace rbparse::lex {

class SourceBuffer {
public:
    SourceBuffer(std::string name, std::string text, int firstLine = 1);

    // Throws exceptions::FileReadError when the file cannot be read.
    static SourceBuffer fromFile(const std::string& path);

    const std::string& name() const { return name_; }
    std::string_view text() const { return text_; }
    size_t size() const { return text_.size(); }
    int firstLine() const { return firstLine_; }

    int lineOf(size_t offset) const; // 1-based unless firstLine says otherwise
    int columnOf(size_t offset) const; // 1-based byte column
    std::string_view lineText(int line) const; // without the trailing newline

private:
    size_t lineIndex(size_t offset) const;

    std::string name_;
    std::string text_;
    int firstLine_;
    std::vector<size_t> lineStarts_{};
};

} // namespace rbparse::lex
