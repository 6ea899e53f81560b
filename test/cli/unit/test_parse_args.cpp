/***
 * Name: test_parse_args
 * Purpose: Command line parsing for the rbparse tool.
 */
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "cli/Options.h"
#include "cli/ParseArgs.h"

using namespace rbparse;

namespace {

struct Argv {
  explicit Argv(std::vector<std::string> args) : storage(std::move(args)) {
    storage.insert(storage.begin(), "rbparse");
    for (auto& arg : storage) { pointers.push_back(arg.data()); }
  }
  int argc() const { return static_cast<int>(pointers.size()); }
  char** argv() { return pointers.data(); }

  std::vector<std::string> storage;
  std::vector<char*> pointers;
};

bool parseArgs(std::vector<std::string> args, cli::Options& opts, std::string* error = nullptr) {
  Argv argv(std::move(args));
  std::ostringstream err;
  const bool ok = cli::ParseArgs(argv.argc(), argv.argv(), opts, err);
  if (error != nullptr) { *error = err.str(); }
  return ok;
}

} // namespace

TEST(ParseArgs, FilesAndFlags) {
  cli::Options opts;
  ASSERT_TRUE(parseArgs({"--dump-ast", "--no-ranges", "--metrics", "a.rb", "b.rb"}, opts));
  EXPECT_TRUE(opts.dumpAst);
  EXPECT_FALSE(opts.astRanges);
  EXPECT_TRUE(opts.metrics);
  EXPECT_FALSE(opts.metricsJson);
  ASSERT_EQ(opts.inputs.size(), 2u);
  EXPECT_EQ(opts.inputs[1], "b.rb");
}

TEST(ParseArgs, PrefixedOptions) {
  cli::Options opts;
  ASSERT_TRUE(parseArgs({"--variant=expression", "--encoding=US-ASCII", "--start-line=7", "--color=never",
                         "--log-path=/tmp/rb", "x.rb"},
                        opts));
  EXPECT_EQ(opts.variant, "expression");
  EXPECT_EQ(opts.encoding, "US-ASCII");
  EXPECT_EQ(opts.startLine, 7);
  EXPECT_EQ(opts.color, cli::ColorMode::Never);
  EXPECT_EQ(opts.logPath, "/tmp/rb");
}

TEST(ParseArgs, BadStartLineFallsBackToOne) {
  cli::Options opts;
  ASSERT_TRUE(parseArgs({"--start-line=abc", "x.rb"}, opts));
  EXPECT_EQ(opts.startLine, 1);
}

TEST(ParseArgs, InlineSourceLines) {
  cli::Options opts;
  ASSERT_TRUE(parseArgs({"-e", "x = 1", "-e", "x"}, opts));
  ASSERT_EQ(opts.inlineSource.size(), 2u);
  EXPECT_EQ(opts.inlineSource[0], "x = 1");
}

TEST(ParseArgs, DashIsStdinAndDoubleDashEndsOptions) {
  cli::Options opts;
  ASSERT_TRUE(parseArgs({"-", "--", "--dump-ast"}, opts));
  ASSERT_EQ(opts.inputs.size(), 2u);
  EXPECT_EQ(opts.inputs[0], "-");
  EXPECT_EQ(opts.inputs[1], "--dump-ast");
  EXPECT_FALSE(opts.dumpAst);
}

TEST(ParseArgs, Rejections) {
  std::string error;
  cli::Options unknown;
  EXPECT_FALSE(parseArgs({"--frobnicate", "x.rb"}, unknown, &error));
  EXPECT_EQ(error, "rbparse: unknown option '--frobnicate'\n");

  cli::Options missing;
  EXPECT_FALSE(parseArgs({"-e"}, missing, &error));
  EXPECT_EQ(error, "rbparse: no code specified for -e\n");

  cli::Options both;
  EXPECT_FALSE(parseArgs({"-e", "1", "x.rb"}, both, &error));
  EXPECT_EQ(error, "rbparse: cannot use -e together with input files\n");

  cli::Options none;
  EXPECT_FALSE(parseArgs({}, none, &error));
  EXPECT_EQ(error, "rbparse: no input given\n");
}

TEST(ParseArgs, HelpNeedsNoInput) {
  cli::Options opts;
  ASSERT_TRUE(parseArgs({"--help"}, opts));
  EXPECT_TRUE(opts.showHelp);
}
