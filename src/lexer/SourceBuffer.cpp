/***
 * Name: rbparse::lex::SourceBuffer
 * Purpose: Line table construction and offset to line/column mapping.
 */
#include "lexer/SourceBuffer.h"

#include <algorithm>
#include <utility>
#include "rbparse/exceptions/file_read_error.h"
#include "rbparse/support/fs.h"

namespace rbparse::lex {

SourceBuffer::SourceBuffer(std::string name, std::string text, const int firstLine)
  : name_(std::move(name)), text_(std::move(text)), firstLine_(firstLine) {
  lineStarts_.push_back(0);
  for (size_t i = 0; i < text_.size(); ++i) {
    if (text_[i] == '\n') { lineStarts_.push_back(i + 1); }
  }
}

SourceBuffer SourceBuffer::fromFile(const std::string& path) {
  std::string text;
  std::string err;
  if (!support::ReadFile(path, text, err)) { throw exceptions::FileReadError(err); }
  return SourceBuffer(path, std::move(text));
}

size_t SourceBuffer::lineIndex(const size_t offset) const {
  const auto it = std::upper_bound(lineStarts_.begin(), lineStarts_.end(), offset);
  return static_cast<size_t>(std::distance(lineStarts_.begin(), it)) - 1;
}

int SourceBuffer::lineOf(const size_t offset) const {
  return static_cast<int>(lineIndex(offset)) + firstLine_;
}

int SourceBuffer::columnOf(const size_t offset) const {
  const size_t idx = lineIndex(offset);
  return static_cast<int>(offset - lineStarts_[idx]) + 1;
}

std::string_view SourceBuffer::lineText(const int line) const {
  const int idx = line - firstLine_;
  if (idx < 0 || static_cast<size_t>(idx) >= lineStarts_.size()) { return {}; }
  const size_t begin = lineStarts_[static_cast<size_t>(idx)];
  size_t end = text_.find('\n', begin);
  if (end == std::string::npos) { end = text_.size(); }
  if (end > begin && text_[end - 1] == '\r') { --end; }
  return std::string_view(text_).substr(begin, end - begin);
}

} // namespace rbparse::lex
