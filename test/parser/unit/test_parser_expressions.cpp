/***
 * Name: test_parser_expressions
 * Purpose: Operators, calls, assignments and literals through the full parse pipeline.
 */
#include <gtest/gtest.h>
#include <string>

#include "ast/Nodes.h"
#include "parser/Parser.h"

using namespace rbparse;

static parse::ParseResult parseText(const std::string& text) {
  const parse::Parser parser;
  return parser.parse("expr.rb", text);
}

static const ast::Node* bodyOf(const parse::ParseResult& result) { return result.root->body.get(); }

TEST(ParserExpressions, BinaryOperatorIsMethodCall) {
  const auto result = parseText("1 + 2");
  const auto* call = ast::as<ast::CallNode>(bodyOf(result));
  ASSERT_NE(call, nullptr);
  EXPECT_EQ(call->name, "+");
  const auto* lhs = ast::as<ast::FixnumNode>(call->receiver.get());
  ASSERT_NE(lhs, nullptr);
  EXPECT_EQ(lhs->value, 1);
  const auto* args = ast::as<ast::ListNode>(call->args.get());
  ASSERT_NE(args, nullptr);
  ASSERT_EQ(args->size(), 1u);
  EXPECT_NE(ast::as<ast::FixnumNode>(args->items[0].get()), nullptr);
}

TEST(ParserExpressions, MultiplicationBindsTighter) {
  const auto result = parseText("1 + 2 * 3");
  const auto* plus = ast::as<ast::CallNode>(bodyOf(result));
  ASSERT_NE(plus, nullptr);
  EXPECT_EQ(plus->name, "+");
  const auto* times = ast::as<ast::CallNode>(plus->args->slot(0)->get());
  ASSERT_NE(times, nullptr);
  EXPECT_EQ(times->name, "*");
}

TEST(ParserExpressions, PowerIsRightAssociativeAndBindsOverUnaryMinus) {
  const auto result = parseText("-2 ** 2");
  const auto* neg = ast::as<ast::CallNode>(bodyOf(result));
  ASSERT_NE(neg, nullptr);
  EXPECT_EQ(neg->name, "-@");
  const auto* pow = ast::as<ast::CallNode>(neg->receiver.get());
  ASSERT_NE(pow, nullptr);
  EXPECT_EQ(pow->name, "**");
}

TEST(ParserExpressions, StatementsFormBlock) {
  const auto result = parseText("x = 1\nx\n");
  const auto* block = ast::as<ast::BlockNode>(bodyOf(result));
  ASSERT_NE(block, nullptr);
  ASSERT_EQ(block->size(), 2u);
  const auto* asgn = ast::as<ast::LocalAsgnNode>(block->items[0].get());
  ASSERT_NE(asgn, nullptr);
  EXPECT_EQ(asgn->name, "x");
  EXPECT_NE(ast::as<ast::FixnumNode>(asgn->value.get()), nullptr);
  EXPECT_NE(ast::as<ast::LocalVarNode>(block->items[1].get()), nullptr);
}

TEST(ParserExpressions, UnknownIdentifierIsVCall) {
  const auto result = parseText("foo");
  const auto* vcall = ast::as<ast::VCallNode>(bodyOf(result));
  ASSERT_NE(vcall, nullptr);
  EXPECT_EQ(vcall->name, "foo");
}

TEST(ParserExpressions, CommandCallWithoutParens) {
  const auto result = parseText("puts 1, 2");
  const auto* fcall = ast::as<ast::FCallNode>(bodyOf(result));
  ASSERT_NE(fcall, nullptr);
  EXPECT_EQ(fcall->name, "puts");
  EXPECT_FALSE(fcall->hasParens);
  ASSERT_NE(fcall->args, nullptr);
  EXPECT_EQ(fcall->args->slotCount(), 2u);
}

TEST(ParserExpressions, MethodCallWithBlock) {
  const auto result = parseText("list.each { |item| item }");
  const auto* call = ast::as<ast::CallNode>(bodyOf(result));
  ASSERT_NE(call, nullptr);
  EXPECT_EQ(call->name, "each");
  const auto* iter = ast::as<ast::IterNode>(call->block.get());
  ASSERT_NE(iter, nullptr);
  EXPECT_NE(ast::as<ast::LocalVarNode>(iter->body.get()), nullptr);
}

TEST(ParserExpressions, InterpolatedString) {
  const auto result = parseText("\"a#{1}b\"");
  const auto* dstr = ast::as<ast::DStrNode>(bodyOf(result));
  ASSERT_NE(dstr, nullptr);
  ASSERT_EQ(dstr->size(), 3u);
  const auto* evstr = ast::as<ast::EvStrNode>(dstr->items[1].get());
  ASSERT_NE(evstr, nullptr);
  EXPECT_NE(ast::as<ast::FixnumNode>(evstr->body.get()), nullptr);
}

TEST(ParserExpressions, InterpolationSeesOuterLocals) {
  const auto result = parseText("x = 1\n\"#{x}\"\n");
  const auto* block = ast::as<ast::BlockNode>(bodyOf(result));
  ASSERT_NE(block, nullptr);
  const auto* dstr = ast::as<ast::DStrNode>(block->items[1].get());
  ASSERT_NE(dstr, nullptr);
  const auto* evstr = ast::as<ast::EvStrNode>(dstr->items[0].get());
  ASSERT_NE(evstr, nullptr);
  EXPECT_NE(ast::as<ast::LocalVarNode>(evstr->body.get()), nullptr);
}

TEST(ParserExpressions, RangesKeepExclusivity) {
  const auto result = parseText("1...3");
  const auto* dot = ast::as<ast::DotNode>(bodyOf(result));
  ASSERT_NE(dot, nullptr);
  EXPECT_TRUE(dot->exclusive);
}

TEST(ParserExpressions, NodeRangesCoverTheirSource) {
  const auto result = parseText("  foo(1, 2)");
  const ast::Node* body = bodyOf(result);
  ASSERT_NE(body, nullptr);
  EXPECT_EQ(body->range.start, 2u);
  EXPECT_EQ(body->range.end(), 11u);
}
