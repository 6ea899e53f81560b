/***
 * Name: rbparse::exceptions::AstError
 * Purpose: Exception for a malformed tree handed to a visitor or printer.
 */
#pragma once

#include <string>
#include <utility>

#include "rbparse/exceptions/rbparse_exception.h"

namespace rbparse {
namespace exceptions {

class AstError : public RbparseException {
 public:
  explicit AstError(std::string msg) noexcept : RbparseException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace rbparse
