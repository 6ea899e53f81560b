/***
 * Name: rbparse::WarningSink
 * Purpose: Injected collaborator receiving non-fatal diagnostics from the lexer and passes.
 * Theory of Operation:
 *   Parsing never writes to global streams; callers decide where warnings go.
 *   StreamWarningSink renders "file:line:col: warning: message" lines.
 */
#pragma once

#include <ostream>
#include <string>
#include "rbparse/support/SourceRange.h"

namespace rbparse {

struct Warning {
  std::string message;
  std::string file;
  SourceRange range{};
  int line{0};
  int column{0};
};

class WarningSink {
 public:
  virtual ~WarningSink() = default;
  virtual void warn(const Warning& warning) = 0;
};

class StreamWarningSink final : public WarningSink {
 public:
  explicit StreamWarningSink(std::ostream& out) : out_(out) {}
  void warn(const Warning& warning) override;

 private:
  std::ostream& out_;
};

} // namespace rbparse
