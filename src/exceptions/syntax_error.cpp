/***
 * Name: rbparse::exceptions::SyntaxError::SyntaxError
 * Purpose: Construct a positioned syntax error.
 * Theory of Operation: Keeps the bare message for structured consumers and
 *   passes the "file:line:col: message" rendering to the base for what().
 */
#include "rbparse/exceptions/syntax_error.h"

#include <utility>

namespace rbparse::exceptions {

SyntaxError::SyntaxError(std::string message, std::string file, SourceRange range, int line, int column)
    : RbparseException(file + ":" + std::to_string(line) + ":" + std::to_string(column) + ": " + message),
      detail_(std::move(message)),
      file_(std::move(file)),
      range_(range),
      line_(line),
      column_(column) {}

}  // namespace rbparse::exceptions
