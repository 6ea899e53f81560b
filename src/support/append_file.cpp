/***
 * Name: rbparse::support::AppendFile
 * Purpose: Append a dump to a log file, creating it when missing.
 * Inputs:
 *   - path: log file
 *   - data: bytes to append
 * Outputs:
 *   - err: reason on failure
 */
#include "rbparse/support/fs.h"

#include <fstream>
#include <ios>
#include <string>

namespace rbparse {
namespace support {

bool AppendFile(const std::string& path, const std::string& data, std::string& err) {
  std::ofstream log(path, std::ios::binary | std::ios::app);
  if (!log) {
    err = "cannot open log file '" + path + "'";
    return false;
  }
  log.write(data.data(), static_cast<std::streamsize>(data.size()));
  log.flush();
  if (!log) {
    err = "short write to log file '" + path + "'";
    return false;
  }
  return true;
}

}  // namespace support
}  // namespace rbparse
