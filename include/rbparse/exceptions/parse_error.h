/***
 * Name: rbparse::exceptions::ParseError
 * Purpose: Grammar error raised by the table driver.
 * Inputs: Message, position, offending lexeme, acceptable terminal names
 * Outputs: Exception object
 * Theory of Operation: The expected list is the exact set of terminals with
 *   an action in the state where the driver stopped.
 */
#pragma once

#include <string>
#include <vector>

#include "rbparse/exceptions/syntax_error.h"

namespace rbparse {
namespace exceptions {

class ParseError : public SyntaxError {
 public:
  ParseError(std::string message, std::string file, SourceRange range, int line, int column, std::string lexeme,
             std::vector<std::string> expected);

  const std::string& lexeme() const noexcept { return lexeme_; }
  const std::vector<std::string>& expected() const noexcept { return expected_; }

 private:
  std::string lexeme_;
  std::vector<std::string> expected_;
};

}  // namespace exceptions
}  // namespace rbparse
