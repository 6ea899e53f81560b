/***
 * Name: rbparse::cli::ParseCommand
 * Purpose: The rbparse tool: parse every input and report dumps, metrics and errors.
 * Inputs:
 *   - Options from ParseArgs; output, error and input streams
 * Outputs:
 *   - exit status: 0 when every input parsed, 1 on a syntax error, 2 on
 *     usage, configuration or I/O errors
 * Theory of Operation:
 *   Each input becomes a SourceBuffer and goes through one Parser. A
 *   SyntaxError is rendered with its source line and a caret, then the next
 *   input is parsed. Dumps and metrics go to the output stream and, with
 *   --log-path, are appended to files in that directory.
 */
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "cli/Options.h"
#include "lexer/SourceBuffer.h"
#include "observability/Metrics.h"
#include "parser/Parser.h"
#include "rbparse/exceptions/syntax_error.h"

namespace rbparse::cli {

class ParseCommand {
 public:
  ParseCommand(const Options& opts, std::ostream& out, std::ostream& err, std::istream& in)
      : opts_(opts), out_(out), err_(err), in_(in) {}

  int run();

  static void print_error(std::ostream& err, const exceptions::SyntaxError& error, std::string_view sourceLine,
                          bool color);
  static bool use_env_color();

 private:
  int parseOne(const parse::Parser& parser, const lex::SourceBuffer& source);
  void dumpTokens(const lex::SourceBuffer& source);
  void emit(const std::string& text, const char* logName);
  bool prepareLogDir();

  const Options& opts_;
  std::ostream& out_;
  std::ostream& err_;
  std::istream& in_;
  bool color_{false};
  bool logsEnabled_{false};
  obs::Metrics metrics_{};
};

} // namespace rbparse::cli
