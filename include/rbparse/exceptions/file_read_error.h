/***
 * Name: rbparse::exceptions::FileReadError
 * Purpose: Exception for filesystem read failures.
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Marker type deriving from RbparseException.
 */
#pragma once

#include <string>
#include <utility>

#include "rbparse/exceptions/rbparse_exception.h"

namespace rbparse {
namespace exceptions {

class FileReadError : public RbparseException {
 public:
  explicit FileReadError(std::string msg) noexcept : RbparseException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace rbparse
