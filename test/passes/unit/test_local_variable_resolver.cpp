/***
 * Name: test_local_variable_resolver
 * Purpose: Local variable scoping and the rewrites that depend on it.
 */
#include <gtest/gtest.h>
#include <string>

#include "ast/Nodes.h"
#include "observability/Metrics.h"
#include "parser/Parser.h"

using namespace rbparse;

static parse::ParseResult parseText(const std::string& text) {
  const parse::Parser parser;
  return parser.parse("locals.rb", text);
}

static const ast::Node* statement(const parse::ParseResult& result, std::size_t index) {
  const auto* block = ast::as<ast::BlockNode>(result.root->body.get());
  if (block == nullptr) { return index == 0 ? result.root->body.get() : nullptr; }
  return index < block->size() ? block->items[index].get() : nullptr;
}

TEST(LocalVariableResolver, ReadBeforeAssignmentStaysCall) {
  const auto result = parseText("x\nx = 1\nx\n");
  EXPECT_NE(ast::as<ast::VCallNode>(statement(result, 0)), nullptr);
  EXPECT_NE(ast::as<ast::LocalVarNode>(statement(result, 2)), nullptr);
}

TEST(LocalVariableResolver, MethodBodyDoesNotSeeOuterLocals) {
  const auto result = parseText("x = 1\ndef f\n  x\nend\n");
  const auto* defn = ast::as<ast::DefnNode>(statement(result, 1));
  ASSERT_NE(defn, nullptr);
  EXPECT_NE(ast::as<ast::VCallNode>(defn->body.get()), nullptr);
}

TEST(LocalVariableResolver, ParametersAreLocals) {
  const auto result = parseText("def f(a, b = a)\n  b\nend\n");
  const auto* defn = ast::as<ast::DefnNode>(statement(result, 0));
  ASSERT_NE(defn, nullptr);
  EXPECT_NE(ast::as<ast::LocalVarNode>(defn->body.get()), nullptr);
}

TEST(LocalVariableResolver, BlocksSeeEnclosingLocals) {
  const auto result = parseText("x = 1\nlist.each { x }\n");
  const auto* call = ast::as<ast::CallNode>(statement(result, 1));
  ASSERT_NE(call, nullptr);
  const auto* iter = ast::as<ast::IterNode>(call->block.get());
  ASSERT_NE(iter, nullptr);
  EXPECT_NE(ast::as<ast::LocalVarNode>(iter->body.get()), nullptr);
}

TEST(LocalVariableResolver, BlockLocalsDoNotLeak) {
  const auto result = parseText("list.each { y = 1 }\ny\n");
  EXPECT_NE(ast::as<ast::VCallNode>(statement(result, 1)), nullptr);
}

TEST(LocalVariableResolver, NamedCapturesDeclareLocals) {
  const auto result = parseText("/(?<year>\\d+)/ =~ s\nyear\n");
  EXPECT_NE(ast::as<ast::LocalVarNode>(statement(result, 1)), nullptr);
}

TEST(LocalVariableResolver, CapitalizedCaptureIsNotALocal) {
  const auto result = parseText("/(?<Year>\\d+)/ =~ s\n");
  EXPECT_NE(ast::as<ast::CallNode>(statement(result, 0)), nullptr);
}

TEST(LocalVariableResolver, CommandOnLocalBecomesBinaryCall) {
  const auto result = parseText("x = 1\nx -1\n");
  const auto* call = ast::as<ast::CallNode>(statement(result, 1));
  ASSERT_NE(call, nullptr);
  EXPECT_EQ(call->name, "-");
  EXPECT_NE(ast::as<ast::LocalVarNode>(call->receiver.get()), nullptr);
}

TEST(LocalVariableResolver, RewritesAreCounted) {
  obs::Metrics metrics;
  parse::ParserOptions options;
  options.metrics = &metrics;
  (void)parse::Parser(options).parse("m.rb", "a = 1\na\na\n");
  EXPECT_EQ(metrics.counters().at("pass.LocalVariableResolver.rewrites"), 2u);
}
