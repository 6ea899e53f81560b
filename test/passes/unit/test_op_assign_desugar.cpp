/***
 * Name: test_op_assign_desugar
 * Purpose: Lowering of operator assignments on variables and constants.
 */
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <utility>

#include "ast/Nodes.h"
#include "parser/Parser.h"
#include "passes/OpAssignDesugar.h"

using namespace rbparse;

static parse::ParseResult parseText(const std::string& text) {
  const parse::Parser parser;
  return parser.parse("opasgn.rb", text);
}

TEST(OpAssignDesugar, ArithmeticBecomesAssignmentOfCall) {
  const auto result = parseText("a += 2");
  const auto* asgn = ast::as<ast::LocalAsgnNode>(result.root->body.get());
  ASSERT_NE(asgn, nullptr);
  EXPECT_EQ(asgn->name, "a");
  const auto* call = ast::as<ast::CallNode>(asgn->value.get());
  ASSERT_NE(call, nullptr);
  EXPECT_EQ(call->name, "+");
  EXPECT_NE(ast::as<ast::LocalVarNode>(call->receiver.get()), nullptr);
}

TEST(OpAssignDesugar, OrAssignKeepsShortCircuit) {
  const auto result = parseText("@a ||= 1");
  const auto* orAsgn = ast::as<ast::OpAsgnOrNode>(result.root->body.get());
  ASSERT_NE(orAsgn, nullptr);
  EXPECT_NE(ast::as<ast::InstVarNode>(orAsgn->first.get()), nullptr);
  const auto* write = ast::as<ast::InstAsgnNode>(orAsgn->second.get());
  ASSERT_NE(write, nullptr);
  EXPECT_NE(ast::as<ast::FixnumNode>(write->value.get()), nullptr);
}

TEST(OpAssignDesugar, AndAssign) {
  const auto result = parseText("$g &&= 2");
  EXPECT_NE(ast::as<ast::OpAsgnAndNode>(result.root->body.get()), nullptr);
}

TEST(OpAssignDesugar, ScopedConstantIsKept) {
  const auto result = parseText("A::B += 1");
  const auto* op = ast::as<ast::OpAsgnNode>(result.root->body.get());
  ASSERT_NE(op, nullptr);
  EXPECT_EQ(op->op, "+");
}

TEST(OpAssignDesugar, TopLevelConstant) {
  const auto result = parseText("C ||= 1");
  const auto* orAsgn = ast::as<ast::OpAsgnOrNode>(result.root->body.get());
  ASSERT_NE(orAsgn, nullptr);
  EXPECT_NE(ast::as<ast::ConstNode>(orAsgn->first.get()), nullptr);
  EXPECT_NE(ast::as<ast::ConstDeclNode>(orAsgn->second.get()), nullptr);
}

TEST(OpAssignDesugar, SecondRunChangesNothing) {
  const SourceRange r{0, 6};
  auto target = std::make_unique<ast::LocalAsgnNode>(SourceRange{0, 1}, "a", nullptr);
  auto op = std::make_unique<ast::OpAsgnNode>(r, std::move(target), "+", std::make_unique<ast::FixnumNode>(SourceRange{5, 1}, 1));
  ast::RootNode root(r, std::move(op), "t.rb", "UTF-8");

  passes::OpAssignDesugar first;
  first.run(root);
  EXPECT_EQ(first.rewrites(), 1u);
  const auto* asgn = ast::as<ast::LocalAsgnNode>(root.body.get());
  ASSERT_NE(asgn, nullptr);
  EXPECT_EQ(asgn->range, r);

  passes::OpAssignDesugar second;
  second.run(root);
  EXPECT_EQ(second.rewrites(), 0u);
  EXPECT_EQ(root.body.get(), asgn);
}
