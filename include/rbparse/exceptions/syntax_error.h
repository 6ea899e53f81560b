/***
 * Name: rbparse::exceptions::SyntaxError
 * Purpose: Base for every error tied to a position in Ruby source.
 * Inputs: Message, file name, byte range, 1-based line and column
 * Outputs: Exception object; what() renders "file:line:col: message"
 * Theory of Operation: The structured fields let tools place carets and
 *   highlight ranges without re-parsing the rendered text.
 */
#pragma once

#include <string>

#include "rbparse/exceptions/rbparse_exception.h"
#include "rbparse/support/SourceRange.h"

namespace rbparse {
namespace exceptions {

class SyntaxError : public RbparseException {
 public:
  SyntaxError(std::string message, std::string file, SourceRange range, int line, int column);

  const std::string& message() const noexcept { return detail_; }
  const std::string& file() const noexcept { return file_; }
  SourceRange range() const noexcept { return range_; }
  int line() const noexcept { return line_; }
  int column() const noexcept { return column_; }

 private:
  std::string detail_;
  std::string file_;
  SourceRange range_;
  int line_;
  int column_;
};

}  // namespace exceptions
}  // namespace rbparse
