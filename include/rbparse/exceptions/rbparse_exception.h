/***
 * Name: rbparse::exceptions::RbparseException
 * Purpose: Base class for all rbparse exceptions; do not use built-in exceptions directly.
 * Inputs: Message string describing the error condition
 * Outputs: Exception object providing `what()` text
 * Theory of Operation: Derives from std::exception to interoperate with catch sites,
 *   but all throws in rbparse must use a custom type derived from this base.
 */
#pragma once

#include <exception>
#include <string>

namespace rbparse {
namespace exceptions {

class RbparseException : public std::exception {
 public:
  virtual ~RbparseException() noexcept = default;
  const char* what() const noexcept override;

 protected:
  explicit RbparseException(std::string msg) noexcept;
  std::string message_;
};

}  // namespace exceptions
}  // namespace rbparse
