/***
 * Name: test_parse_command
 * Purpose: End-to-end runs of the rbparse tool over in-memory streams.
 */
#include <gtest/gtest.h>
#include <sstream>
#include <string>

#include "cli/Options.h"
#include "cli/ParseCommand.h"
#include "rbparse/exceptions/syntax_error.h"

using namespace rbparse;

namespace {

struct CommandRun {
  int status{0};
  std::string out;
  std::string err;
};

CommandRun runWith(cli::Options opts, const std::string& stdinText = "") {
  opts.color = cli::ColorMode::Never;
  std::ostringstream out;
  std::ostringstream err;
  std::istringstream in(stdinText);
  cli::ParseCommand command(opts, out, err, in);
  CommandRun run;
  run.status = command.run();
  run.out = out.str();
  run.err = err.str();
  return run;
}

} // namespace

TEST(ParseCommand, ValidInlineSourceSucceedsQuietly) {
  cli::Options opts;
  opts.inlineSource = {"x = 1", "x"};
  const CommandRun run = runWith(opts);
  EXPECT_EQ(run.status, 0);
  EXPECT_TRUE(run.out.empty());
  EXPECT_TRUE(run.err.empty());
}

TEST(ParseCommand, DumpAst) {
  cli::Options opts;
  opts.inlineSource = {"1 + 2"};
  opts.dumpAst = true;
  opts.astRanges = false;
  const CommandRun run = runWith(opts);
  EXPECT_EQ(run.status, 0);
  EXPECT_EQ(run.out.rfind("Root file=\"-e\"", 0), 0u);
  EXPECT_NE(run.out.find("  Call name=\"+\"\n"), std::string::npos);
}

TEST(ParseCommand, DumpTokens) {
  cli::Options opts;
  opts.inlineSource = {"a = 1"};
  opts.dumpTokens = true;
  const CommandRun run = runWith(opts);
  EXPECT_EQ(run.status, 0);
  EXPECT_NE(run.out.find("1:1 Identifier 'a'\n"), std::string::npos);
  EXPECT_NE(run.out.find("1:5 Integer '1'\n"), std::string::npos);
}

TEST(ParseCommand, SyntaxErrorReportsCaret) {
  cli::Options opts;
  opts.inputs = {"-"};
  const CommandRun run = runWith(opts, "foo\nend\n");
  EXPECT_EQ(run.status, 1);
  EXPECT_EQ(run.err.rfind("-:2:1: error: syntax error, unexpected", 0), 0u);
  EXPECT_NE(run.err.find("\n  end\n  ^~~\n"), std::string::npos);
}

TEST(ParseCommand, UnknownVariantIsUsageError) {
  cli::Options opts;
  opts.inlineSource = {"1"};
  opts.variant = "bogus";
  const CommandRun run = runWith(opts);
  EXPECT_EQ(run.status, 2);
  EXPECT_NE(run.err.find("unknown parser variant: bogus"), std::string::npos);
}

TEST(ParseCommand, MissingFileIsIoError) {
  cli::Options opts;
  opts.inputs = {"/nonexistent/dir/missing.rb"};
  const CommandRun run = runWith(opts);
  EXPECT_EQ(run.status, 2);
  EXPECT_EQ(run.err.rfind("rbparse: ", 0), 0u);
}

TEST(ParseCommand, MetricsSummaryFollowsParse) {
  cli::Options opts;
  opts.inlineSource = {"x = 1"};
  opts.metrics = true;
  const CommandRun run = runWith(opts);
  EXPECT_EQ(run.status, 0);
  EXPECT_NE(run.out.find("== Metrics =="), std::string::npos);
  EXPECT_NE(run.out.find("parse.tokens = "), std::string::npos);
}

TEST(ParseCommand, WarningsGoToErrorStream) {
  cli::Options opts;
  opts.inlineSource = {"if 1 then 2 end"};
  const CommandRun run = runWith(opts);
  EXPECT_EQ(run.status, 0);
  EXPECT_NE(run.err.find("-e:1:4: warning: literal in condition"), std::string::npos);
}

TEST(PrintError, PlainRendering) {
  const exceptions::SyntaxError error("unterminated string meets end of file", "a.rb", SourceRange{4, 3}, 1, 5);
  std::ostringstream err;
  cli::ParseCommand::print_error(err, error, "x = \"ab", false);
  EXPECT_EQ(err.str(),
            "a.rb:1:5: error: unterminated string meets end of file\n"
            "  x = \"ab\n"
            "      ^~~\n");
}

TEST(PrintError, ColorWrapsLabelAndCaret) {
  const exceptions::SyntaxError error("boom", "a.rb", SourceRange{0, 1}, 1, 1);
  std::ostringstream err;
  cli::ParseCommand::print_error(err, error, "x", true);
  EXPECT_NE(err.str().find("\033[31merror: \033[0m"), std::string::npos);
  EXPECT_NE(err.str().find("\033[31m^\033[0m"), std::string::npos);
}
