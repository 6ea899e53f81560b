/***
 * Name: rbparse::cli::ParseCommand
 * Purpose: Drive the parser over the tool's inputs.
 */
#include "cli/ParseCommand.h"

#include <filesystem>
#include <istream>
#include <iterator>
#include <ostream>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

#include "lexer/Lexer.h"
#include "observability/AstPrinter.h"
#include "rbparse/exceptions/config_error.h"
#include "rbparse/support/WarningSink.h"
#include "rbparse/support/fs.h"

namespace rbparse::cli {

namespace fs = std::filesystem;

bool ParseCommand::prepareLogDir() {
  if (opts_.logPath.empty()) { return false; }
  std::error_code errCode;
  if (!fs::exists(opts_.logPath, errCode)) {
    if (!fs::create_directories(opts_.logPath, errCode) && !fs::exists(opts_.logPath)) {
      err_ << "rbparse: failed to create log directory '" << opts_.logPath << "': " << errCode.message() << "\n";
      return false;
    }
  }
  return true;
}

void ParseCommand::emit(const std::string& text, const char* logName) {
  out_ << text;
  if (!logsEnabled_) { return; }
  std::string error;
  if (!support::AppendFile(opts_.logPath + "/" + logName, text, error)) {
    err_ << "rbparse: " << error << "\n";
    logsEnabled_ = false;
  }
}

int ParseCommand::run() {
  color_ = opts_.color == ColorMode::Always || (opts_.color == ColorMode::Auto && use_env_color());
  logsEnabled_ = prepareLogDir();

  parse::ParserOptions parserOptions;
  try {
    parserOptions.variant = parse::variantFromName(opts_.variant);
  } catch (const exceptions::ConfigError& ex) {
    err_ << "rbparse: " << ex.what() << "\n";
    return 2;
  }
  StreamWarningSink warnings(err_);
  parserOptions.defaultEncoding = opts_.encoding;
  parserOptions.startLine = opts_.startLine;
  parserOptions.trace = opts_.traceParser ? &out_ : nullptr;
  parserOptions.warnings = &warnings;
  parserOptions.metrics = (opts_.metrics || opts_.metricsJson) ? &metrics_ : nullptr;
  const parse::Parser parser(parserOptions);

  int status = 0;
  if (!opts_.inlineSource.empty()) {
    std::string text;
    for (const auto& line : opts_.inlineSource) { text += line + "\n"; }
    status = parseOne(parser, lex::SourceBuffer("-e", std::move(text), opts_.startLine));
  }
  for (const auto& input : opts_.inputs) {
    std::string text;
    if (input == "-") {
      text.assign(std::istreambuf_iterator<char>(in_), std::istreambuf_iterator<char>());
    } else {
      std::string error;
      if (!support::ReadFile(input, text, error)) {
        err_ << "rbparse: " << error << "\n";
        status = 2;
        continue;
      }
    }
    const int fileStatus = parseOne(parser, lex::SourceBuffer(input, std::move(text), opts_.startLine));
    if (status == 0) { status = fileStatus; }
  }

  if (opts_.metrics) { emit(metrics_.summaryText(), "rbparse.metrics.log"); }
  if (opts_.metricsJson) { emit(metrics_.summaryJson(), "rbparse.metrics.json"); }
  return status;
}

void ParseCommand::dumpTokens(const lex::SourceBuffer& source) {
  lex::Lexer lexer(source, lex::LexerOptions{opts_.encoding, nullptr, false, 0, std::string::npos});
  std::ostringstream oss;
  for (const lex::Token& token : lexer.tokens()) {
    oss << token.line << ":" << token.col << " " << lex::to_string(token.kind);
    if (!token.text.empty()) { oss << " '" << token.text << "'"; }
    oss << "\n";
  }
  emit(oss.str(), "rbparse.tokens.log");
}

int ParseCommand::parseOne(const parse::Parser& parser, const lex::SourceBuffer& source) {
  try {
    if (opts_.dumpTokens) { dumpTokens(source); }
    const parse::ParseResult result = parser.parse(source);
    if (opts_.dumpAst) {
      obs::AstPrinter printer(opts_.astRanges);
      emit(printer.print(*result.root), "rbparse.ast.log");
    }
    return 0;
  } catch (const exceptions::SyntaxError& error) {
    print_error(err_, error, source.lineText(error.line()), color_);
    return 1;
  }
}

} // namespace rbparse::cli
