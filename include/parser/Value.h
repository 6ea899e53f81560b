/***
 * Name: rbparse::parse::Value
 * Purpose: Semantic value on the driver's value stack.
 * Theory of Operation:
 *   A shifted terminal keeps its Token, a reduction leaves the node its
 *   action built (or nothing for rules without a value). The range is the
 *   source span the grammar symbol covered, which can be wider than the
 *   node's own range (parentheses, keywords).
 */
#pragma once

#include <utility>
#include <variant>

#include "ast/Node.h"
#include "lexer/Token.h"
#include "rbparse/support/SourceRange.h"

namespace rbparse::parse {

struct Value {
    SourceRange range{};
    std::variant<std::monostate, lex::Token, ast::NodePtr> data{};

    const lex::Token* token() const { return std::get_if<lex::Token>(&data); }
    ast::Node* node() const {
        const auto* held = std::get_if<ast::NodePtr>(&data);
        return held != nullptr ? held->get() : nullptr;
    }
    // Moves the node out; empty values and tokens yield null.
    ast::NodePtr takeNode() {
        auto* held = std::get_if<ast::NodePtr>(&data);
        return held != nullptr ? std::move(*held) : nullptr;
    }
};

} // namespace rbparse::parse
