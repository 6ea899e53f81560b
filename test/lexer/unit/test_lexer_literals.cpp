/***
 * Name: test_lexer_literals
 * Purpose: Number payloads, string parts, heredocs and escapes.
 */
#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "lexer/Lexer.h"
#include "rbparse/exceptions/lex_error.h"

using namespace rbparse;

static lex::Token firstToken(const char* src) {
  const lex::SourceBuffer source("lit.rb", src);
  lex::Lexer lexer(source);
  return lexer.next();
}

static std::string literalText(const lex::StringParts& parts) {
  std::string out;
  for (const auto& part : parts) {
    if (!part.isCode()) { out += part.text; }
  }
  return out;
}

TEST(LexerNumbers, HexDigitsAndBase) {
  const auto tok = firstToken("0x1F");
  ASSERT_EQ(tok.kind, lex::TokenKind::Integer);
  const auto& lit = std::get<lex::NumberLiteral>(tok.value);
  EXPECT_EQ(lit.base, 16);
  EXPECT_EQ(lit.digits, "1F");
}

TEST(LexerNumbers, UnderscoresRemoved) {
  const auto tok = firstToken("1_000_000");
  EXPECT_EQ(std::get<lex::NumberLiteral>(tok.value).digits, "1000000");
}

TEST(LexerNumbers, FloatRationalImaginarySuffixes) {
  EXPECT_EQ(firstToken("3.5e2").kind, lex::TokenKind::Float);
  EXPECT_TRUE(std::get<lex::NumberLiteral>(firstToken("3.5e2").value).isFloat);
  EXPECT_TRUE(std::get<lex::NumberLiteral>(firstToken("2r").value).rational);
  EXPECT_TRUE(std::get<lex::NumberLiteral>(firstToken("3i").value).imaginary);
}

TEST(LexerNumbers, PrefixedBasesTakeSuffixes) {
  const auto hex = firstToken("0x1fr");
  EXPECT_EQ(hex.text, "0x1fr");
  const auto& hexLit = std::get<lex::NumberLiteral>(hex.value);
  EXPECT_EQ(hexLit.base, 16);
  EXPECT_EQ(hexLit.digits, "1f");
  EXPECT_TRUE(hexLit.rational);

  const auto bin = firstToken("0b11ri");
  EXPECT_EQ(bin.text, "0b11ri");
  EXPECT_TRUE(std::get<lex::NumberLiteral>(bin.value).rational);
  EXPECT_TRUE(std::get<lex::NumberLiteral>(bin.value).imaginary);

  const auto exp = firstToken("1e3r");
  EXPECT_EQ(exp.text, "1e3");
  EXPECT_FALSE(std::get<lex::NumberLiteral>(exp.value).rational);
}

TEST(LexerNumbers, TrailingUnderscoreIsAnError) {
  EXPECT_THROW(firstToken("1_"), exceptions::LexError);
}

TEST(LexerNumbers, BadOctalDigit) {
  try {
    firstToken("0o79");
    FAIL() << "expected LexError";
  } catch (const exceptions::LexError& err) {
    EXPECT_EQ(err.message(), "Invalid octal digit");
    EXPECT_EQ(err.line(), 1);
  }
}

TEST(LexerStrings, InterpolationSplitsParts) {
  const auto tok = firstToken("\"a#{b}c\"");
  ASSERT_EQ(tok.kind, lex::TokenKind::String);
  const auto& parts = std::get<lex::StringParts>(tok.value);
  ASSERT_EQ(parts.size(), 3u);
  EXPECT_FALSE(parts[0].isCode());
  EXPECT_TRUE(parts[1].isCode());
  EXPECT_EQ(parts[1].code.start, 4u);
  EXPECT_EQ(parts[1].code.length, 1u);
  EXPECT_EQ(literalText(parts), "ac");
}

TEST(LexerStrings, EscapesDecodedInDoubleQuotes) {
  const auto tok = firstToken("\"a\\tb\\u00e9\"");
  EXPECT_EQ(literalText(std::get<lex::StringParts>(tok.value)), "a\tb\xC3\xA9");
}

TEST(LexerStrings, SingleQuotesKeepBackslashes) {
  const auto tok = firstToken("'a\\nb'");
  EXPECT_EQ(literalText(std::get<lex::StringParts>(tok.value)), "a\\nb");
}

TEST(LexerStrings, SquigglyHeredocStripsIndentation) {
  const lex::SourceBuffer source("heredoc.rb", "x = <<~EOS\n  hi\n    there\nEOS\n");
  lex::Lexer lexer(source);
  const auto toks = lexer.tokens();
  ASSERT_GE(toks.size(), 3u);
  ASSERT_EQ(toks[2].kind, lex::TokenKind::String);
  EXPECT_EQ(literalText(std::get<lex::StringParts>(toks[2].value)), "hi\n  there\n");
}

TEST(LexerStrings, UnterminatedStringReportsPosition) {
  try {
    firstToken("\n  \"abc");
    FAIL() << "expected LexError";
  } catch (const exceptions::LexError& err) {
    EXPECT_EQ(err.file(), "lit.rb");
    EXPECT_EQ(err.line(), 2);
    EXPECT_EQ(err.column(), 3);
  }
}

TEST(LexerStrings, BacktickIsRejected) {
  EXPECT_THROW(firstToken("`ls`"), exceptions::LexError);
}
