/***
 * Name: test_lexer_encoding
 * Purpose: Magic comments, encoding validation and warnings.
 */
#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "lexer/Lexer.h"
#include "rbparse/exceptions/lex_error.h"
#include "rbparse/support/WarningSink.h"

using namespace rbparse;

namespace {

class CollectingSink final : public WarningSink {
 public:
  void warn(const Warning& warning) override { warnings.push_back(warning); }
  std::vector<Warning> warnings;
};

} // namespace

TEST(LexerEncoding, DefaultIsUtf8) {
  const lex::SourceBuffer source("enc.rb", "x");
  lex::Lexer lexer(source);
  EXPECT_EQ(lexer.encoding(), "UTF-8");
  EXPECT_FALSE(lexer.frozenStringLiteral().has_value());
}

TEST(LexerEncoding, MagicCommentSelectsEncoding) {
  const lex::SourceBuffer source("enc.rb", "# -*- coding: binary -*-\nx\n");
  lex::Lexer lexer(source);
  EXPECT_EQ(lexer.encoding(), "ASCII-8BIT");
}

TEST(LexerEncoding, FrozenStringLiteralComment) {
  const lex::SourceBuffer source("frozen.rb", "# frozen_string_literal: true\nx\n");
  lex::Lexer lexer(source);
  ASSERT_TRUE(lexer.frozenStringLiteral().has_value());
  EXPECT_TRUE(*lexer.frozenStringLiteral());
}

TEST(LexerEncoding, UnknownEncodingFails) {
  const lex::SourceBuffer source("enc.rb", "# encoding: no-such-thing\n");
  try {
    lex::Lexer lexer(source);
    FAIL() << "expected LexError";
  } catch (const exceptions::LexError& err) {
    EXPECT_EQ(err.message(), "unknown encoding name - no-such-thing");
    EXPECT_EQ(err.line(), 1);
  }
}

TEST(LexerEncoding, InvalidUtf8Fails) {
  const lex::SourceBuffer source("bad.rb", std::string("x = \"\xff\"\n"));
  EXPECT_THROW({ lex::Lexer lexer(source); }, exceptions::LexError);
}

TEST(LexerEncoding, AmbiguousArgumentWarns) {
  CollectingSink sink;
  const lex::SourceBuffer source("warn.rb", "foo -1\n");
  lex::LexerOptions options;
  options.warnings = &sink;
  lex::Lexer lexer(source, options);
  (void)lexer.tokens();
  ASSERT_EQ(sink.warnings.size(), 1u);
  EXPECT_NE(sink.warnings[0].message.find("ambiguous first argument"), std::string::npos);
  EXPECT_EQ(sink.warnings[0].line, 1);
  EXPECT_EQ(sink.warnings[0].column, 5);
}

TEST(LexerEncoding, EmbeddedRangeIsLexedAlone) {
  const lex::SourceBuffer source("embed.rb", "\"#{a + b}\"");
  lex::LexerOptions options;
  options.embedded = true;
  options.begin = 3;
  options.end = 8;
  lex::Lexer lexer(source, options);
  const auto toks = lexer.tokens();
  ASSERT_EQ(toks.size(), 4u);
  EXPECT_EQ(toks[0].text, "a");
  EXPECT_EQ(toks[1].kind, lex::TokenKind::Plus);
  EXPECT_EQ(toks[2].text, "b");
}

TEST(SourceBuffer, LinesAndColumns) {
  const lex::SourceBuffer source("buf.rb", "ab\ncd\r\nef", 10);
  EXPECT_EQ(source.lineOf(0), 10);
  EXPECT_EQ(source.lineOf(3), 11);
  EXPECT_EQ(source.columnOf(4), 2);
  EXPECT_EQ(source.lineText(11), "cd");
  EXPECT_EQ(source.lineText(12), "ef");
  EXPECT_TRUE(source.lineText(13).empty());
}
