/***
 * Name: test_parser_properties
 * Purpose: Whole-tree properties: range containment, determinism and parses sharing the table across threads.
 */
#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <vector>

#include "ast/Nodes.h"
#include "ast/TreeWalker.h"
#include "observability/AstPrinter.h"
#include "parser/Parser.h"
#include "rbparse/exceptions/lex_error.h"

using namespace rbparse;

namespace {

const char* const kProgram =
    "class Stack < Base\n"
    "  def push(item, *rest, limit: 10)\n"
    "    @items ||= []\n"
    "    @items << item unless full?\n"
    "    rest.each { |r| push(r) }\n"
    "    \"size=#{@items.size}\"\n"
    "  end\n"
    "end\n";

const char* const kSmall =
    "total = 0\n"
    "[1, 2, 3].each do |n|\n"
    "  total += n * 2\n"
    "end\n"
    "case total\n"
    "when 0..5 then :low\n"
    "else :high\n"
    "end\n";

// Records the first parent whose range does not contain a child's range.
class ContainmentCheck final : public ast::TreeWalker {
  public:
#define RBPARSE_TEST_CONTAINMENT(Name) \
    void visit(const ast::Name##Node& node) override { check(node); }
    RBPARSE_AST_NODE_LIST(RBPARSE_TEST_CONTAINMENT)
#undef RBPARSE_TEST_CONTAINMENT

    std::string violation;

  private:
    void check(const ast::Node& node) {
      for (std::size_t i = 0; i < node.slotCount(); ++i) {
        const ast::Node* child = node.slot(i)->get();
        if (child == nullptr) { continue; }
        if (!node.range.contains(child->range) && violation.empty()) {
          violation = obs::DescribeNode(*child) + " escapes " + obs::DescribeNode(node);
        }
      }
      visitChildren(node);
    }
};

std::string dump(const std::string& text) {
  const parse::Parser parser;
  const auto result = parser.parse("p.rb", text);
  return obs::AstPrinter().print(*result.root);
}

} // namespace

TEST(ParserProperties, ChildrenStayInsideParents) {
  const parse::Parser parser;
  const auto result = parser.parse("p.rb", kSmall);
  ContainmentCheck check;
  check.walk(result.root.get());
  EXPECT_EQ(check.violation, "");
}

TEST(ParserProperties, SameInputSameTree) {
  EXPECT_EQ(dump(kSmall), dump(kSmall));
}

TEST(ParserProperties, ConcurrentParsesShareTheTable) {
  const std::string expected = dump(kSmall);
  std::vector<std::string> results(4);
  std::vector<std::thread> threads;
  for (std::size_t i = 0; i < results.size(); ++i) {
    threads.emplace_back([&results, i] { results[i] = dump(kSmall); });
  }
  for (auto& thread : threads) { thread.join(); }
  for (const auto& result : results) { EXPECT_EQ(result, expected); }
}

TEST(ParserProperties, LargerProgramParses) {
  const parse::Parser parser;
  const auto result = parser.parse("p.rb", kProgram);
  const auto* klass = ast::as<ast::ClassNode>(result.root->body.get());
  ASSERT_NE(klass, nullptr);
  EXPECT_NE(ast::as<ast::DefnNode>(klass->body.get()), nullptr);
  ContainmentCheck check;
  check.walk(result.root.get());
  EXPECT_EQ(check.violation, "");
}

TEST(ParserProperties, MinimalProgramsSpanTheTrimmedSource) {
  const parse::Parser parser;
  for (const std::string text : {"1", "a = 1", "case x; when 1; end", "  foo.bar(1)  \n"}) {
    const auto result = parser.parse("m.rb", text);
    const ast::Node* body = result.root->body.get();
    ASSERT_NE(body, nullptr) << text;
    const std::size_t first = text.find_first_not_of(" \n");
    const std::size_t last = text.find_last_not_of(" \n") + 1;
    EXPECT_EQ(body->range.start, first) << text;
    EXPECT_EQ(body->range.end(), last) << text;
  }
}

TEST(ParserProperties, CaseWithoutSubjectKeepsLeadingGap) {
  const parse::Parser parser;
  const auto result = parser.parse("c.rb", "case\nwhen 1\n  :a\nelse\n  :b\nend");
  const auto* node = ast::as<ast::CaseNode>(result.root->body.get());
  ASSERT_NE(node, nullptr);
  EXPECT_EQ(node->caseNode(), nullptr);
  ASSERT_NE(node->cases(), nullptr);
  EXPECT_EQ(node->cases()->slotCount(), 1u);
  EXPECT_NE(node->elseNode(), nullptr);
  const auto children = node->childNodes();
  ASSERT_EQ(children.size(), 2u);
  EXPECT_EQ(children[0], nullptr);
  EXPECT_EQ(children[1], node->cases());
}

TEST(ParserProperties, UnterminatedStringPointsAtOpeningQuote) {
  const parse::Parser parser;
  try {
    (void)parser.parse("s.rb", "x = \"abc");
    FAIL() << "expected LexError";
  } catch (const exceptions::LexError& err) {
    EXPECT_EQ(err.range().start, 4u);
    EXPECT_EQ(err.line(), 1);
    EXPECT_EQ(err.column(), 5);
  }
}
