/***
 * Name: rbparse::support (fs)
 * Purpose: Minimal file IO helpers for reading sources and writing logs.
 * Inputs: Paths and string buffers
 * Outputs: File contents to/from disk
 * Theory of Operation: Thin wrappers over fstream to centralize error handling.
 */
#pragma once

#include <string>

namespace rbparse {
namespace support {

/*** ReadFile: Read entire file (binary) into out. Return true on success. */
bool ReadFile(const std::string& path, std::string& out, std::string& err);

/*** AppendFile: Append data to path, creating the file. Return true on success. */
bool AppendFile(const std::string& path, const std::string& data, std::string& err);

}  // namespace support
}  // namespace rbparse
