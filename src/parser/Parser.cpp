/***
 * Name: rbparse::parse::Parser
 * Purpose: Wire lexer, driver, reducer and passes into one parse.
 */
#include "parser/Parser.h"

#include <memory>
#include <string>
#include <utility>

#include "ast/GeometrySummary.h"
#include "lexer/Lexer.h"
#include "observability/Metrics.h"
#include "parser/Driver.h"
#include "parser/GrammarTable.h"
#include "parser/NodeFactory.h"
#include "parser/Reducer.h"
#include "passes/LocalVariableResolver.h"
#include "passes/NumericLiteralNormalizer.h"
#include "passes/OpAssignDesugar.h"
#include "passes/Validator.h"
#include "rbparse/exceptions/config_error.h"

namespace rbparse::parse {

Variant variantFromName(const std::string& name) {
  if (name == "program") { return Variant::Program; }
  if (name == "expression") { return Variant::Expression; }
  throw exceptions::ConfigError("unknown parser variant: " + name + " (expected program or expression)");
}

const char* to_string(const Variant variant) {
  switch (variant) {
    case Variant::Program: return "program";
    case Variant::Expression: return "expression";
  }
  return "program";
}

ParseResult Parser::parse(const std::string& name, const std::string& text) const {
  const lex::SourceBuffer source(name, text, options_.startLine);
  return parse(source);
}

ParseResult Parser::parse(const lex::SourceBuffer& source) const {
  obs::Metrics* metrics = options_.metrics;
  lex::Lexer lexer(source, lex::LexerOptions{options_.defaultEncoding, options_.warnings, false, 0,
                                             std::string::npos});
  // Magic comments precede the first token; the factory needs their outcome up front.
  {
    const obs::ScopedStage stage(metrics, "MagicComments");
    lexer.peek();
  }
  const std::string encoding = lexer.encoding();
  const bool frozen = lexer.frozenStringLiteral().value_or(false);

  const NodeFactory factory(source, encoding, [this, &source, &encoding, frozen](const SourceRange code) {
    return parseEmbedded(source, encoding, frozen, code);
  }, frozen);
  Reducer reducer(factory);
  Driver driver(RubyGrammarTable(), lexer, reducer, source.name(), options_.trace);

  // The driver pulls tokens on demand, so "Parse" includes lexing.
  ast::NodePtr tree;
  {
    const obs::ScopedStage stage(metrics, "Parse");
    tree = driver.parse(options_.variant == Variant::Expression ? lex::TokenKind::EntryExpression
                                                                 : lex::TokenKind::EntryProgram);
  }
  std::unique_ptr<ast::RootNode> root(static_cast<ast::RootNode*>(tree.release()));
  root->frozenStringLiteral = lexer.frozenStringLiteral();

  passes::LocalVariableResolver resolver;
  passes::NumericLiteralNormalizer numbers;
  passes::OpAssignDesugar opAssign;
  passes::Validator validator(source, options_.warnings);
  passes::Pass* const pipeline[] = {&resolver, &numbers, &opAssign, &validator};
  for (passes::Pass* pass : pipeline) {
    const obs::ScopedStage stage(metrics, pass->name());
    pass->run(*root);
  }

  if (metrics != nullptr) {
    metrics->setCounter("parse.tokens", driver.shiftCount());
    metrics->setCounter("parse.reductions", driver.reductionCount());
    for (const passes::Pass* pass : pipeline) {
      metrics->setCounter(std::string("pass.") + pass->name() + ".rewrites", pass->rewrites());
    }
    const ast::GeometrySummary geometry = ast::ComputeGeometry(*root);
    metrics->setAstGeometry(obs::AstGeometry{geometry.nodes, geometry.maxDepth});
  }

  ParseResult result;
  result.encoding = root->encoding;
  result.root = std::move(root);
  return result;
}

ast::NodePtr Parser::parseEmbedded(const lex::SourceBuffer& source, const std::string& encoding, const bool frozen,
                                   const SourceRange code) const {
  lex::Lexer lexer(source, lex::LexerOptions{encoding, options_.warnings, true, code.start, code.end()});
  const NodeFactory factory(source, encoding, [this, &source, &encoding, frozen](const SourceRange inner) {
    return parseEmbedded(source, encoding, frozen, inner);
  }, frozen);
  Reducer reducer(factory);
  Driver driver(RubyGrammarTable(), lexer, reducer, source.name());
  ast::NodePtr tree = driver.parse(lex::TokenKind::EntryProgram);
  return std::move(static_cast<ast::RootNode&>(*tree).body);
}

} // namespace rbparse::parse
