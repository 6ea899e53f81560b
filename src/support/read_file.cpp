/***
 * Name: rbparse::support::ReadFile
 * Purpose: Read the full contents of a source file into a string.
 * Inputs:
 *   - path: filesystem path to read
 * Outputs:
 *   - out: populated with file contents on success
 *   - err: error message on failure
 * Theory of Operation: Uses std::ifstream in binary mode; checks .good() and .bad().
 */
// NOLINTNEXTLINE(misc-include-cleaner) - include interface to ensure signature stays in sync
#include "rbparse/support/fs.h"

#include <fstream>
#include <ios>
#include <sstream>
#include <string>

namespace rbparse {
namespace support {

bool ReadFile(const std::string& path, std::string& out, std::string& err) {
  std::ifstream file_stream(path, std::ios::binary);
  if (!file_stream.good()) {
    err = "cannot open file: " + path;
    return false;
  }
  std::ostringstream stream;
  stream << file_stream.rdbuf();
  if (file_stream.bad()) {
    err = "error while reading file: " + path;
    return false;
  }
  out = stream.str();
  return true;
}

}  // namespace support
}  // namespace rbparse
