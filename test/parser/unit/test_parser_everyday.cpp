/***
 * Name: test_parser_everyday
 * Purpose: Common one-line programs where a variable or keyword value sits
 *   next to `,`, a newline or a closing token, and the assignment forms that
 *   share those names.
 */
#include <gtest/gtest.h>
#include <ostream>
#include <string>

#include "ast/Nodes.h"
#include "parser/Parser.h"
#include "rbparse/exceptions/parse_error.h"

using namespace rbparse;

namespace {

struct ProgramCase {
    const char* source;
    const char* lastKind; // kind of the last top-level statement
};

void PrintTo(const ProgramCase& c, std::ostream* os) { *os << '"' << c.source << '"'; }

const ast::Node* lastStatement(const ast::RootNode& root) {
  const ast::Node* body = root.body.get();
  if (const auto* block = ast::as<ast::BlockNode>(body)) { return block->items.back().get(); }
  return body;
}

class EverydayPrograms : public ::testing::TestWithParam<ProgramCase> {};

class SingleStatementPrograms : public ::testing::TestWithParam<const char*> {};

} // namespace

TEST_P(EverydayPrograms, ParsesToExpectedStatement) {
  const ProgramCase& c = GetParam();
  const parse::Parser parser;
  const auto result = parser.parse("p.rb", c.source);
  const ast::Node* last = lastStatement(*result.root);
  ASSERT_NE(last, nullptr);
  EXPECT_STREQ(ast::to_string(last->kind), c.lastKind);
}

INSTANTIATE_TEST_SUITE_P(
    KeywordValues, EverydayPrograms,
    ::testing::Values(ProgramCase{"nil\n", "Nil"}, ProgramCase{"self\n", "Self"}, ProgramCase{"true; false", "False"},
                      ProgramCase{"__FILE__\n", "File"}, ProgramCase{"x = nil\n", "LocalAsgn"},
                      ProgramCase{"p(nil)", "FCall"}, ProgramCase{"foo(self)", "FCall"},
                      ProgramCase{"return true\n", "Return"}, ProgramCase{"if nil then 1 end", "If"},
                      ProgramCase{"[nil, true, self]", "Array"}, ProgramCase{"puts a, nil\n", "FCall"},
                      ProgramCase{"case x\nwhen nil, false then 0\nend\n", "Case"},
                      ProgramCase{"class << self; end", "SClass"}));

INSTANTIATE_TEST_SUITE_P(
    VariablesBeforeComma, EverydayPrograms,
    ::testing::Values(ProgramCase{"x = 1; [x, 2]", "Array"}, ProgramCase{"x = 1; bar(x, 1)", "FCall"},
                      ProgramCase{"foo(*a, **h, &b)", "FCall"}, ProgramCase{"foo(::Foo, 1)", "FCall"},
                      ProgramCase{"p(a.b, c[0], A::B)", "FCall"}, ProgramCase{"@a = 1; p(@a, $b, @@c)", "FCall"},
                      ProgramCase{"x = y = nil", "LocalAsgn"}));

INSTANTIATE_TEST_SUITE_P(
    AssignmentTargets, EverydayPrograms,
    ::testing::Values(ProgramCase{"a, b = b, a", "MultipleAsgn"}, ProgramCase{"a.b, c[0] = 1, 2", "MultipleAsgn"},
                      ProgramCase{"(a, b), c = x", "MultipleAsgn"}, ProgramCase{"*a, b = list", "MultipleAsgn"},
                      ProgramCase{"for i in list do i end", "For"}, ProgramCase{"for a, b in pairs do a end", "For"},
                      ProgramCase{"begin\n  work\nrescue Error => e\n  e\nend\n", "Begin"}));

TEST_P(SingleStatementPrograms, OneNodeSpansTheTrimmedSource) {
  const std::string text = GetParam();
  const parse::Parser parser;
  const auto result = parser.parse("m.rb", text);
  const ast::Node* body = result.root->body.get();
  ASSERT_NE(body, nullptr);
  EXPECT_EQ(ast::as<ast::BlockNode>(body), nullptr);
  const std::size_t first = text.find_first_not_of(" \n");
  const std::size_t last = text.find_last_not_of(" \n") + 1;
  EXPECT_EQ(body->range.start, first);
  EXPECT_EQ(body->range.end(), last);
}

INSTANTIATE_TEST_SUITE_P(OneLiners, SingleStatementPrograms,
                         ::testing::Values("nil\n", "x = nil\n", "p(nil)", "foo(self)", "return true\n",
                                           "if nil then 1 end", "[x, 2]", "bar(x, 1)", "a, b = b, a",
                                           "foo(*a, **h, &b)", "class << self; end", "  __LINE__  \n"));

TEST(EverydayAssignments, KeywordTargetsStillFail) {
  const parse::Parser parser;
  const struct {
      const char* source;
      const char* message;
  } cases[] = {
      {"nil = 1", "Can't assign to nil"},
      {"a, self = 1, 2", "Can't change the value of self"},
      {"for true in x do end", "Can't assign to true"},
  };
  for (const auto& c : cases) {
    try {
      (void)parser.parse("k.rb", c.source);
      ADD_FAILURE() << "expected ParseError for " << c.source;
    } catch (const exceptions::ParseError& err) {
      EXPECT_EQ(err.message(), c.message) << c.source;
    }
  }
}
