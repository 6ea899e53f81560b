/***
 * Name: test_numeric_literal_normalizer
 * Purpose: Typed numeric nodes and negative literal folding.
 */
#include <gtest/gtest.h>
#include <cstdint>
#include <limits>
#include <memory>
#include <string>

#include "ast/Nodes.h"
#include "parser/Parser.h"
#include "passes/NumericLiteralNormalizer.h"

using namespace rbparse;

static parse::ParseResult parseText(const std::string& text) {
  const parse::Parser parser;
  return parser.parse("num.rb", text);
}

static std::int64_t fixnumOf(const ast::Node* node) {
  const auto* fix = ast::as<ast::FixnumNode>(node);
  EXPECT_NE(fix, nullptr);
  return fix == nullptr ? 0 : fix->value;
}

TEST(NumericLiteralNormalizer, RadixPrefixes) {
  EXPECT_EQ(fixnumOf(parseText("0x1f").root->body.get()), 31);
  EXPECT_EQ(fixnumOf(parseText("0b101").root->body.get()), 5);
  EXPECT_EQ(fixnumOf(parseText("0o17").root->body.get()), 15);
  EXPECT_EQ(fixnumOf(parseText("1_000").root->body.get()), 1000);
}

TEST(NumericLiteralNormalizer, LargeIntegersBecomeBignum) {
  const auto result = parseText("99999999999999999999");
  const auto* big = ast::as<ast::BignumNode>(result.root->body.get());
  ASSERT_NE(big, nullptr);
  EXPECT_EQ(big->value, "99999999999999999999");
}

TEST(NumericLiteralNormalizer, NegativeLiteralsFold) {
  EXPECT_EQ(fixnumOf(parseText("-5").root->body.get()), -5);
  EXPECT_EQ(fixnumOf(parseText("-9223372036854775808").root->body.get()),
            std::numeric_limits<std::int64_t>::min());
}

TEST(NumericLiteralNormalizer, FloatRationalImaginary) {
  const auto flo = parseText("1.5");
  const auto* f = ast::as<ast::FloatNode>(flo.root->body.get());
  ASSERT_NE(f, nullptr);
  EXPECT_DOUBLE_EQ(f->value, 1.5);

  const auto rat = parseText("0.75r");
  const auto* r = ast::as<ast::RationalNode>(rat.root->body.get());
  ASSERT_NE(r, nullptr);
  EXPECT_EQ(fixnumOf(r->numerator.get()), 3);
  EXPECT_EQ(fixnumOf(r->denominator.get()), 4);

  const auto img = parseText("2i");
  const auto* c = ast::as<ast::ComplexNode>(img.root->body.get());
  ASSERT_NE(c, nullptr);
  EXPECT_EQ(fixnumOf(c->number.get()), 2);
}

TEST(NumericLiteralNormalizer, RewritesRawNodesDirectly) {
  ast::RootNode root(SourceRange{0, 4}, std::make_unique<ast::RawNumberNode>(SourceRange{0, 4}, "ff", 16), "t.rb",
                     "UTF-8");
  passes::NumericLiteralNormalizer pass;
  pass.run(root);
  EXPECT_EQ(fixnumOf(root.body.get()), 255);
  EXPECT_EQ(pass.rewrites(), 1u);
}

TEST(NumericLiteralNormalizer, SecondRunChangesNothing) {
  const SourceRange r{0, 2};
  auto negate = std::make_unique<ast::CallNode>(r, std::make_unique<ast::RawNumberNode>(SourceRange{1, 1}, "7", 10),
                                                "-@", nullptr);
  ast::RootNode root(r, std::move(negate), "t.rb", "UTF-8");
  passes::NumericLiteralNormalizer first;
  first.run(root);
  EXPECT_EQ(fixnumOf(root.body.get()), -7);
  EXPECT_EQ(first.rewrites(), 2u);

  passes::NumericLiteralNormalizer second;
  second.run(root);
  EXPECT_EQ(second.rewrites(), 0u);
  EXPECT_EQ(fixnumOf(root.body.get()), -7);
}
