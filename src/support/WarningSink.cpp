/***
 * Name: rbparse::StreamWarningSink::warn
 * Purpose: Write one warning line to the configured stream.
 */
#include "rbparse/support/WarningSink.h"

namespace rbparse {

void StreamWarningSink::warn(const Warning& warning) {
  out_ << warning.file << ':' << warning.line << ':' << warning.column << ": warning: " << warning.message << '\n';
}

} // namespace rbparse
