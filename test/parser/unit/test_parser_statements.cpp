/***
 * Name: test_parser_statements
 * Purpose: Definitions, control flow, case and rescue structures.
 */
#include <gtest/gtest.h>
#include <string>

#include "ast/Nodes.h"
#include "parser/Parser.h"

using namespace rbparse;

static parse::ParseResult parseText(const std::string& text) {
  const parse::Parser parser;
  return parser.parse("stmt.rb", text);
}

TEST(ParserStatements, MethodDefinitionParameters) {
  const auto result = parseText("def f(a, b = 1, *r, k:, **o, &blk)\n  a\nend\n");
  const auto* defn = ast::as<ast::DefnNode>(result.root->body.get());
  ASSERT_NE(defn, nullptr);
  EXPECT_EQ(defn->name, "f");
  const auto* args = ast::as<ast::ArgsNode>(defn->args.get());
  ASSERT_NE(args, nullptr);
  ASSERT_NE(args->pre, nullptr);
  EXPECT_EQ(args->pre->slotCount(), 1u);
  ASSERT_NE(args->optional, nullptr);
  EXPECT_EQ(args->optional->slotCount(), 1u);
  EXPECT_NE(ast::as<ast::RestArgNode>(args->rest.get()), nullptr);
  ASSERT_NE(args->keywords, nullptr);
  EXPECT_EQ(args->keywords->slotCount(), 1u);
  EXPECT_NE(ast::as<ast::KeywordRestArgNode>(args->keywordRest.get()), nullptr);
  EXPECT_NE(ast::as<ast::BlockArgNode>(args->block.get()), nullptr);
  EXPECT_NE(ast::as<ast::LocalVarNode>(defn->body.get()), nullptr);
}

TEST(ParserStatements, ClassWithSuperclass) {
  const auto result = parseText("class Foo < Bar\n  def x; end\nend\n");
  const auto* klass = ast::as<ast::ClassNode>(result.root->body.get());
  ASSERT_NE(klass, nullptr);
  EXPECT_NE(ast::as<ast::ConstNode>(klass->cpath.get()), nullptr);
  EXPECT_NE(ast::as<ast::ConstNode>(klass->superclass.get()), nullptr);
  EXPECT_NE(ast::as<ast::DefnNode>(klass->body.get()), nullptr);
}

TEST(ParserStatements, CaseWhenElse) {
  const auto result = parseText("case x\nwhen 1, 2 then :a\nelse :b\nend\n");
  const auto* node = ast::as<ast::CaseNode>(result.root->body.get());
  ASSERT_NE(node, nullptr);
  EXPECT_NE(node->caseNode(), nullptr);
  ASSERT_NE(node->cases(), nullptr);
  EXPECT_EQ(node->cases()->slotCount(), 1u);
  const auto* when = ast::as<ast::WhenNode>(node->cases()->slot(0)->get());
  ASSERT_NE(when, nullptr);
  EXPECT_EQ(when->expressions->slotCount(), 2u);
  EXPECT_NE(ast::as<ast::SymbolNode>(node->elseNode()), nullptr);
  EXPECT_EQ(node->childCount(), 2u);
}

TEST(ParserStatements, CaseWithoutSubjectLeavesGap) {
  const auto result = parseText("case\nwhen a then 1\nend\n");
  const auto* node = ast::as<ast::CaseNode>(result.root->body.get());
  ASSERT_NE(node, nullptr);
  EXPECT_EQ(node->caseNode(), nullptr);
  EXPECT_EQ(node->child(0), nullptr);
  EXPECT_NE(node->child(1), nullptr);
}

TEST(ParserStatements, ModifierIfKeepsSourceOrder) {
  const auto result = parseText("a if b");
  const auto* node = ast::as<ast::IfNode>(result.root->body.get());
  ASSERT_NE(node, nullptr);
  EXPECT_TRUE(node->modifier());
  ASSERT_NE(node->slot(0)->get(), nullptr);
  EXPECT_LT(node->slot(0)->get()->range.start, node->slot(2)->get()->range.start);
}

TEST(ParserStatements, UnlessSwapsBranches) {
  const auto result = parseText("unless c then 1 else 2 end");
  const auto* node = ast::as<ast::IfNode>(result.root->body.get());
  ASSERT_NE(node, nullptr);
  const auto* thenValue = ast::as<ast::FixnumNode>(node->thenBody.get());
  ASSERT_NE(thenValue, nullptr);
  EXPECT_EQ(thenValue->value, 2);
}

TEST(ParserStatements, WhileLoop) {
  const auto result = parseText("while x\n  break\nend\n");
  const auto* loop = ast::as<ast::WhileNode>(result.root->body.get());
  ASSERT_NE(loop, nullptr);
  EXPECT_NE(ast::as<ast::BreakNode>(loop->body.get()), nullptr);
}

TEST(ParserStatements, BeginRescueEnsure) {
  const auto result = parseText("begin\n  a\nrescue StandardError => e\n  e\nensure\n  b\nend\n");
  const ast::Node* body = result.root->body.get();
  ASSERT_NE(body, nullptr);
  const ast::Node* inner = body;
  if (const auto* begin = ast::as<ast::BeginNode>(body)) { inner = begin->body.get(); }
  const auto* ensure = ast::as<ast::EnsureNode>(inner);
  ASSERT_NE(ensure, nullptr);
  const auto* rescue = ast::as<ast::RescueNode>(ensure->body.get());
  ASSERT_NE(rescue, nullptr);
  const auto* clause = ast::as<ast::RescueBodyNode>(rescue->clauses->slot(0)->get());
  ASSERT_NE(clause, nullptr);
  EXPECT_NE(ast::as<ast::LocalAsgnNode>(clause->target.get()), nullptr);
  EXPECT_NE(ast::as<ast::LocalVarNode>(clause->body.get()), nullptr);
}

TEST(ParserStatements, MultipleAssignmentWithSplat) {
  const auto result = parseText("a, *b, c = 1, 2, 3, 4");
  const auto* masgn = ast::as<ast::MultipleAsgnNode>(result.root->body.get());
  ASSERT_NE(masgn, nullptr);
}

TEST(ParserStatements, PatternMatchingBindsLocals) {
  const auto result = parseText("case v\nin [x, *rest] then x\nend\n");
  const auto* node = ast::as<ast::CaseNode>(result.root->body.get());
  ASSERT_NE(node, nullptr);
  const auto* in = ast::as<ast::InNode>(node->cases()->slot(0)->get());
  ASSERT_NE(in, nullptr);
  EXPECT_NE(ast::as<ast::ArrayPatternNode>(in->pattern.get()), nullptr);
  EXPECT_NE(ast::as<ast::LocalVarNode>(in->body.get()), nullptr);
}
