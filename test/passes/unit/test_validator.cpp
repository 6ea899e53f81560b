/***
 * Name: test_validator
 * Purpose: Semantic checks reported as ValidationError, and condition warnings.
 */
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>

#include "ast/Nodes.h"
#include "lexer/SourceBuffer.h"
#include "parser/Parser.h"
#include "passes/Validator.h"
#include "rbparse/exceptions/validation_error.h"
#include "rbparse/support/WarningSink.h"

using namespace rbparse;

namespace {

class CollectingSink final : public WarningSink {
  public:
    void warn(const Warning& warning) override { warnings.push_back(warning); }
    std::vector<Warning> warnings;
};

std::string validationMessage(const std::string& text) {
  const parse::Parser parser;
  try {
    (void)parser.parse("v.rb", text);
  } catch (const exceptions::ValidationError& err) {
    return err.message();
  }
  return "";
}

} // namespace

TEST(Validator, JumpsOutsideLoops) {
  EXPECT_EQ(validationMessage("break"), "Invalid break");
  EXPECT_EQ(validationMessage("def f\n  next\nend\n"), "Invalid next");
  EXPECT_EQ(validationMessage("redo"), "Invalid redo");
  EXPECT_EQ(validationMessage("retry"), "Invalid retry");
  EXPECT_EQ(validationMessage("while x\n  break\nend\n"), "");
  EXPECT_EQ(validationMessage("list.each { next }"), "");
  EXPECT_EQ(validationMessage("begin\n  a\nrescue\n  retry\nend\n"), "");
}

TEST(Validator, ReturnInClassBody) {
  EXPECT_EQ(validationMessage("class A\n  return\nend\n"), "Invalid return in class/module body");
  EXPECT_EQ(validationMessage("class A\n  def f\n    return\n  end\nend\n"), "");
}

TEST(Validator, DynamicConstantAssignment) {
  EXPECT_EQ(validationMessage("def f\n  A = 1\nend\n"), "dynamic constant assignment");
  EXPECT_EQ(validationMessage("A = 1"), "");
}

TEST(Validator, DuplicatedArgumentName) {
  EXPECT_EQ(validationMessage("def f(a, a)\nend\n"), "duplicated argument name");
  EXPECT_EQ(validationMessage("def f(_, _)\nend\n"), "");
}

TEST(Validator, ElseWithoutRescue) {
  EXPECT_EQ(validationMessage("begin\n  a\nelse\n  b\nend\n"), "else without rescue is useless");
}

TEST(Validator, ErrorCarriesPosition) {
  const parse::Parser parser;
  try {
    (void)parser.parse("v.rb", "x = 1\n  break\n");
    FAIL() << "expected ValidationError";
  } catch (const exceptions::ValidationError& err) {
    EXPECT_EQ(err.line(), 2);
    EXPECT_EQ(err.column(), 3);
    EXPECT_EQ(err.file(), "v.rb");
  }
}

TEST(Validator, MixedCaseClauses) {
  const SourceRange r{0, 1};
  auto cases = std::make_unique<ast::ListNode>(r);
  cases->add(std::make_unique<ast::WhenNode>(r, std::make_unique<ast::ListNode>(r), nullptr));
  cases->add(std::make_unique<ast::InNode>(r, std::make_unique<ast::NilNode>(r), nullptr, nullptr));
  ast::RootNode root(r, ast::CaseNode::Builder(r, nullptr, std::move(cases)).finish(), "v.rb", "UTF-8");

  const lex::SourceBuffer source("v.rb", "x");
  passes::Validator validator(source, nullptr);
  EXPECT_THROW(validator.run(root), exceptions::ValidationError);
}

TEST(Validator, LiteralConditionWarnings) {
  CollectingSink sink;
  parse::ParserOptions options;
  options.warnings = &sink;
  const parse::Parser parser(options);
  (void)parser.parse("w.rb", "if 'a' then 1 end\nif /a/ then 1 end\nif 1 then 1 end\nif x = 2 then 1 end\n");
  ASSERT_EQ(sink.warnings.size(), 4u);
  EXPECT_EQ(sink.warnings[0].message, "string literal in condition");
  EXPECT_EQ(sink.warnings[1].message, "regex literal in condition");
  EXPECT_EQ(sink.warnings[2].message, "literal in condition");
  EXPECT_EQ(sink.warnings[3].message, "found `= literal' in conditional, should be ==");
  EXPECT_EQ(sink.warnings[3].line, 4);
}
