/***
 * Name: rbparse::exceptions::GrammarError
 * Purpose: Exception for malformed grammar files and table construction failures.
 * Inputs: Error message (already prefixed with the grammar line where known)
 * Outputs: Exception object
 * Theory of Operation: Marker type deriving from RbparseException. Raised by
 *   the table generator, and at parse time when the tables and the reduction
 *   actions disagree.
 */
#pragma once

#include <string>
#include <utility>

#include "rbparse/exceptions/rbparse_exception.h"

namespace rbparse {
namespace exceptions {

class GrammarError : public RbparseException {
 public:
  explicit GrammarError(std::string msg) noexcept : RbparseException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace rbparse
