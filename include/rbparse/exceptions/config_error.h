/***
 * Name: rbparse::exceptions::ConfigError
 * Purpose: Exception for invalid configuration values (unknown variant, bad encoding name).
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

class ConfigError : public RbparseException {
 public:
  explicit ConfigError(std::string msg) noexcept : RbparseException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace rbparse
