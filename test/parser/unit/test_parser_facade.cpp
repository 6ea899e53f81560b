/***
 * Name: test_parser_facade
 * Purpose: Parser options, variants, errors and result metadata.
 */
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <vector>

#include "ast/Nodes.h"
#include "observability/Metrics.h"
#include "parser/Parser.h"
#include "rbparse/exceptions/config_error.h"
#include "rbparse/exceptions/lex_error.h"
#include "rbparse/exceptions/parse_error.h"

using namespace rbparse;

TEST(ParserFacade, VariantNames) {
  EXPECT_EQ(parse::variantFromName("program"), parse::Variant::Program);
  EXPECT_EQ(parse::variantFromName("expression"), parse::Variant::Expression);
  EXPECT_STREQ(parse::to_string(parse::Variant::Expression), "expression");
  EXPECT_THROW(parse::variantFromName("statement"), exceptions::ConfigError);
}

TEST(ParserFacade, SyntaxErrorCarriesPositionAndExpectations) {
  const parse::Parser parser;
  try {
    parser.parse("bad.rb", "x = (1 +\n");
    FAIL() << "expected ParseError";
  } catch (const exceptions::ParseError& err) {
    EXPECT_EQ(err.file(), "bad.rb");
    EXPECT_GE(err.line(), 1);
    EXPECT_NE(err.message().find("syntax error, unexpected"), std::string::npos);
    EXPECT_FALSE(err.expected().empty());
    EXPECT_NE(std::string(err.what()).find("bad.rb:"), std::string::npos);
  }
}

TEST(ParserFacade, UnexpectedEndKeyword) {
  const parse::Parser parser;
  try {
    parser.parse("bad.rb", "foo\nend\n");
    FAIL() << "expected ParseError";
  } catch (const exceptions::ParseError& err) {
    EXPECT_EQ(err.line(), 2);
    EXPECT_EQ(err.column(), 1);
    EXPECT_EQ(err.lexeme(), "end");
  }
}

TEST(ParserFacade, LexErrorsPropagate) {
  const parse::Parser parser;
  EXPECT_THROW(parser.parse("bad.rb", "x = 1_\n"), exceptions::LexError);
}

TEST(ParserFacade, ErrorInsideInterpolation) {
  const parse::Parser parser;
  EXPECT_THROW(parser.parse("bad.rb", "\"#{1 +}\"\n"), exceptions::ParseError);
}

TEST(ParserFacade, ExpressionVariantAcceptsOneExpression) {
  parse::ParserOptions options;
  options.variant = parse::Variant::Expression;
  const parse::Parser parser(options);
  const auto result = parser.parse("e.rb", "a + b\n");
  EXPECT_NE(ast::as<ast::CallNode>(result.root->body.get()), nullptr);
  EXPECT_THROW(parser.parse("e.rb", "a = 1; b"), exceptions::ParseError);
}

TEST(ParserFacade, StartLineShiftsLineNumbers) {
  parse::ParserOptions options;
  options.startLine = 5;
  const parse::Parser parser(options);
  const auto result = parser.parse("l.rb", "__LINE__");
  const auto* line = ast::as<ast::FixnumNode>(result.root->body.get());
  ASSERT_NE(line, nullptr);
  EXPECT_EQ(line->value, 5);
}

TEST(ParserFacade, EncodingAndFrozenStrings) {
  const parse::Parser parser;
  const auto plain = parser.parse("a.rb", "'x'");
  EXPECT_EQ(plain.encoding, "UTF-8");
  EXPECT_FALSE(plain.root->frozenStringLiteral.has_value());

  const auto frozen = parser.parse("b.rb", "# frozen_string_literal: true\n'x'\n");
  ASSERT_TRUE(frozen.root->frozenStringLiteral.has_value());
  EXPECT_TRUE(*frozen.root->frozenStringLiteral);
  const auto* str = ast::as<ast::StrNode>(frozen.root->body.get());
  ASSERT_NE(str, nullptr);
  EXPECT_TRUE(str->frozen);

  parse::ParserOptions options;
  options.defaultEncoding = "US-ASCII";
  const auto ascii = parse::Parser(options).parse("c.rb", "1");
  EXPECT_EQ(ascii.encoding, "US-ASCII");
}

TEST(ParserFacade, RootRecordsFileName) {
  const parse::Parser parser;
  const auto result = parser.parse("named.rb", "nil");
  EXPECT_EQ(result.root->file, "named.rb");
  EXPECT_NE(ast::as<ast::NilNode>(result.root->body.get()), nullptr);
}

TEST(ParserFacade, EmptyProgramHasNoBody) {
  const parse::Parser parser;
  const auto result = parser.parse("empty.rb", "\n# only a comment\n");
  EXPECT_EQ(result.root->body, nullptr);
}

TEST(ParserFacade, TraceListsShiftsAndAccept) {
  std::ostringstream trace;
  parse::ParserOptions options;
  options.trace = &trace;
  const parse::Parser parser(options);
  (void)parser.parse("t.rb", "1");
  EXPECT_NE(trace.str().find("shift Integer '1'"), std::string::npos);
  EXPECT_NE(trace.str().find("accept"), std::string::npos);
}

TEST(ParserFacade, MetricsCountStagesAndNodes) {
  obs::Metrics metrics;
  parse::ParserOptions options;
  options.metrics = &metrics;
  const parse::Parser parser(options);
  (void)parser.parse("m.rb", "x = 1 + 2\n");
  EXPECT_GE(metrics.counters().at("parse.tokens"), 5u);
  EXPECT_GT(metrics.counters().at("parse.reductions"), 0u);
  EXPECT_EQ(metrics.durations().count("Parse"), 1u);
  EXPECT_EQ(metrics.durations().count("Validator"), 1u);
  ASSERT_TRUE(metrics.astGeometry().has_value());
  EXPECT_EQ(metrics.astGeometry()->nodes, 6u);
}

TEST(ParserFacade, MetricsStagesFollowThePipeline) {
  obs::Metrics metrics;
  parse::ParserOptions options;
  options.metrics = &metrics;
  const parse::Parser parser(options);
  (void)parser.parse("m.rb", "# frozen_string_literal: true\nputs 'a'\n");
  std::vector<std::string> names;
  for (const auto& stage : metrics.stages()) { names.push_back(stage.name); }
  const std::vector<std::string> expected{"MagicComments",           "Parse",           "LocalVariableResolver",
                                          "NumericLiteralNormalizer", "OpAssignDesugar", "Validator"};
  EXPECT_EQ(names, expected);
  EXPECT_EQ(metrics.durations().count("Lex"), 0u);
}
