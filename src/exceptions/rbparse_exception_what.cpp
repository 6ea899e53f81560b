/***
 * Name: rbparse::exceptions::RbparseException::what
 * Purpose: Return the stored error message.
 * Inputs: none
 * Outputs: C-string pointer valid for the lifetime of the exception
 * Theory of Operation: Returns message_.c_str(); noexcept.
 */
#include "rbparse/exceptions/rbparse_exception.h"

namespace rbparse::exceptions {

const char* RbparseException::what() const noexcept { return message_.c_str(); }

}  // namespace rbparse::exceptions
