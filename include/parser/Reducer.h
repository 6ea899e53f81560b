/***
 * Name: rbparse::parse::Reducer
 * Purpose: Semantic actions of grammar/ruby.grammar.
 * Theory of Operation:
 *   Dispatches on the generated ActionId of the reduced rule. Each action
 *   reads its right-hand side by position (the layouts are fixed by the
 *   grammar), moves the child nodes out of the value stack and builds the
 *   rule's node through NodeFactory. New nodes take the rule's range so
 *   keywords and delimiters are part of the span.
 */
#pragma once

#include <span>
#include <string>

#include "parser/IReducer.h"
#include "parser/NodeFactory.h"

namespace rbparse::parse {

class Reducer final : public IReducer {
  public:
    explicit Reducer(const NodeFactory& factory) : factory_(factory) {}

    ast::NodePtr reduce(const RuleInfo& rule, std::span<Value> rhs, SourceRange range) override;

  private:
    ast::NodePtr callMethod(std::span<Value> rhs, SourceRange range) const;
    ast::NodePtr multipleTargets(std::span<Value> rhs, SourceRange range) const;
    ast::NodePtr arrayPattern(SourceRange range, ast::NodePtr constant, ast::NodePtr items) const;
    ast::NodePtr bodyStatement(std::span<Value> rhs, SourceRange range) const;
    std::string paramName(const lex::Token& token) const;

    const NodeFactory& factory_;
};

} // namespace rbparse::parse
