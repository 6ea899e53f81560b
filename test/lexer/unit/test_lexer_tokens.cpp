/***
 * Name: test_lexer_tokens
 * Purpose: Token kinds for operators, keywords and context-dependent lexemes.
 */
#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "lexer/Lexer.h"

using namespace rbparse;

static std::vector<lex::TokenKind> kindsOf(const char* src) {
  const lex::SourceBuffer source("tokens.rb", src);
  lex::Lexer lexer(source);
  std::vector<lex::TokenKind> out;
  for (const auto& tok : lexer.tokens()) { out.push_back(tok.kind); }
  return out;
}

TEST(LexerTokens, Assignment) {
  using enum lex::TokenKind;
  const std::vector<lex::TokenKind> expected{Identifier, Assign, Integer, Plus, Integer, EndOfInput};
  EXPECT_EQ(kindsOf("x = 1 + 2"), expected);
}

TEST(LexerTokens, ModifierKeywords) {
  using enum lex::TokenKind;
  const std::vector<lex::TokenKind> ifMod{Identifier, KwIfMod, Identifier, EndOfInput};
  EXPECT_EQ(kindsOf("a if b"), ifMod);
  const std::vector<lex::TokenKind> whileMod{Identifier, KwWhileMod, Identifier, EndOfInput};
  EXPECT_EQ(kindsOf("a while b"), whileMod);
}

TEST(LexerTokens, KeywordIfStartsStatement) {
  auto kinds = kindsOf("if a then b end");
  ASSERT_FALSE(kinds.empty());
  EXPECT_EQ(kinds.front(), lex::TokenKind::KwIf);
}

TEST(LexerTokens, ComparisonOperators) {
  using enum lex::TokenKind;
  const std::vector<lex::TokenKind> expected{Identifier, Cmp, Identifier, Eqq, Identifier, Neq, Identifier,
                                             Match, Identifier, EndOfInput};
  EXPECT_EQ(kindsOf("a <=> b === c != d =~ e"), expected);
}

TEST(LexerTokens, OpAssignCarriesOperator) {
  const lex::SourceBuffer source("op.rb", "a ||= 1");
  lex::Lexer lexer(source);
  const auto toks = lexer.tokens();
  ASSERT_GE(toks.size(), 2u);
  ASSERT_EQ(toks[1].kind, lex::TokenKind::OpAssign);
  ASSERT_TRUE(std::holds_alternative<std::string>(toks[1].value));
  EXPECT_EQ(std::get<std::string>(toks[1].value), "||");
}

TEST(LexerTokens, VariablesBySigil) {
  using enum lex::TokenKind;
  const std::vector<lex::TokenKind> expected{InstanceVar, Semicolon, ClassVar, Semicolon, GlobalVar, Semicolon,
                                             Constant, EndOfInput};
  EXPECT_EQ(kindsOf("@a; @@b; $c; D"), expected);
}

TEST(LexerTokens, LabelInsideHash) {
  auto kinds = kindsOf("{a: 1}");
  ASSERT_GE(kinds.size(), 2u);
  EXPECT_EQ(kinds[0], lex::TokenKind::LBrace);
  EXPECT_EQ(kinds[1], lex::TokenKind::Label);
}

TEST(LexerTokens, LambdaArrow) {
  auto kinds = kindsOf("->(x) { x }");
  ASSERT_FALSE(kinds.empty());
  EXPECT_EQ(kinds.front(), lex::TokenKind::Lambda);
}

TEST(LexerTokens, PeekDoesNotConsume) {
  const lex::SourceBuffer source("peek.rb", "a b");
  lex::Lexer lexer(source);
  EXPECT_EQ(lexer.peek().text, "a");
  EXPECT_EQ(lexer.peek(1).text, "b");
  EXPECT_EQ(lexer.next().text, "a");
  EXPECT_EQ(lexer.next().text, "b");
  EXPECT_EQ(lexer.next().kind, lex::TokenKind::EndOfInput);
  EXPECT_EQ(lexer.next().kind, lex::TokenKind::EndOfInput);
}

TEST(LexerTokens, PositionsAreOneBased) {
  const lex::SourceBuffer source("pos.rb", "a\n  bb");
  lex::Lexer lexer(source);
  const auto toks = lexer.tokens();
  ASSERT_GE(toks.size(), 3u);
  EXPECT_EQ(toks[0].line, 1);
  EXPECT_EQ(toks[0].col, 1);
  EXPECT_EQ(toks[1].kind, lex::TokenKind::Newline);
  EXPECT_EQ(toks[2].line, 2);
  EXPECT_EQ(toks[2].col, 3);
  EXPECT_EQ(toks[2].range.start, 4u);
  EXPECT_EQ(toks[2].range.length, 2u);
}
