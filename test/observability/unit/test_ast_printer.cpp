/***
 * Name: test_ast_printer
 * Purpose: Node descriptions and the indented dump used by --dump-ast.
 */
#include <gtest/gtest.h>
#include <string>

#include "ast/Nodes.h"
#include "observability/AstPrinter.h"
#include "parser/Parser.h"

using namespace rbparse;

static std::string dump(const std::string& text, bool ranges) {
  const parse::Parser parser;
  const auto result = parser.parse("p.rb", text);
  obs::AstPrinter printer(ranges);
  return printer.print(*result.root);
}

TEST(AstPrinter, IndentsByDepth) {
  const std::string expected =
      "Root file=\"p.rb\" encoding=UTF-8\n"
      "  Call name=\"+\"\n"
      "    Fixnum 1\n"
      "    List\n"
      "      Fixnum 2\n";
  EXPECT_EQ(dump("1 + 2", false), expected);
}

TEST(AstPrinter, RangesAreHalfOpen) {
  const std::string out = dump("1 + 2", true);
  EXPECT_NE(out.find("Call name=\"+\" [0,5)"), std::string::npos);
  EXPECT_NE(out.find("Fixnum 2 [4,5)"), std::string::npos);
}

TEST(AstPrinter, GapsPrintAsTilde) {
  const std::string out = dump("case\nwhen a then 1\nend\n", false);
  EXPECT_NE(out.find("  Case\n    ~\n    List\n"), std::string::npos);
}

TEST(AstPrinter, DescribeNodeFields) {
  const SourceRange r{0, 1};
  EXPECT_EQ(obs::DescribeNode(ast::FixnumNode(r, 42)), "Fixnum 42");
  EXPECT_EQ(obs::DescribeNode(ast::LocalVarNode(r, "x")), "LocalVar name=\"x\"");
  EXPECT_EQ(obs::DescribeNode(ast::DotNode(r, nullptr, nullptr, true)), "Dot ...");
  ast::StrNode str(r, "hi");
  str.frozen = true;
  EXPECT_EQ(obs::DescribeNode(str), "Str \"hi\" frozen");
}
