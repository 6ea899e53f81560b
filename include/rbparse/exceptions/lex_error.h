/***
 * Name: rbparse::exceptions::LexError
 * Purpose: Tokenization failure (unterminated literal, bad escape, invalid byte sequence).
 * Inputs: Message, position, offending lexeme
 * Outputs: Exception object
 */
#pragma once

#include <string>
#include <utility>

#include "rbparse/exceptions/syntax_error.h"

namespace rbparse {
namespace exceptions {

class LexError : public SyntaxError {
 public:
  LexError(std::string message, std::string file, SourceRange range, int line, int column, std::string lexeme)
      : SyntaxError(std::move(message), std::move(file), range, line, column), lexeme_(std::move(lexeme)) {}

  const std::string& lexeme() const noexcept { return lexeme_; }

 private:
  std::string lexeme_;
};

}  // namespace exceptions
}  // namespace rbparse
