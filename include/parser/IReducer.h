/**
 * Name: rbparse::parse::IReducer
 * Purpose: Abstract interface for the semantic actions run on reductions.
 */
#pragma once

#include <span>

#include "ast/Node.h"
#include "parser/GrammarTable.h"
#include "parser/Value.h"

namespace rbparse::parse {

class IReducer {
  public:
    virtual ~IReducer() = default;

    // rhs holds the values of the rule's right-hand side; range is their union.
    virtual ast::NodePtr reduce(const RuleInfo& rule, std::span<Value> rhs, SourceRange range) = 0;
};

} // namespace rbparse::parse
