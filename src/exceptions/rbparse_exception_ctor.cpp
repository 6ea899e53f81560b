/***
 * Name: rbparse::exceptions::RbparseException::RbparseException
 * Purpose: Construct base exception with a message.
 * Inputs:
 *   - msg: human-readable error description
 * Outputs: Initialized exception object
 * Theory of Operation: Stores the message for later retrieval by what().
 */
#include "rbparse/exceptions/rbparse_exception.h"

namespace rbparse {
namespace exceptions {

RbparseException::RbparseException(std::string msg) noexcept : message_(std::move(msg)) {}

}  // namespace exceptions
}  // namespace rbparse
