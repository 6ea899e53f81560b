/***
 * Name: rbparse::exceptions::ValidationError
 * Purpose: Static semantic error found by the validation pass after a successful parse.
 * Inputs: Message and position of the offending node
 * Outputs: Exception object
 */
#pragma once

#include "rbparse/exceptions/syntax_error.h"

namespace rbparse {
namespace exceptions {

class ValidationError : public SyntaxError {
 public:
  using SyntaxError::SyntaxError;
};

}  // namespace exceptions
}  // namespace rbparse
