/***
 * Name: rbparse::exceptions::ParseError::ParseError
 * Purpose: Construct a driver error carrying the acceptable terminals.
 */
#include "rbparse/exceptions/parse_error.h"

#include <utility>

namespace rbparse::exceptions {

ParseError::ParseError(std::string message, std::string file, SourceRange range, int line, int column,
                       std::string lexeme, std::vector<std::string> expected)
    : SyntaxError(std::move(message), std::move(file), range, line, column),
      lexeme_(std::move(lexeme)),
      expected_(std::move(expected)) {}

}  // namespace rbparse::exceptions
