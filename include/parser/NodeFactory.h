/***
 * Name: rbparse::parse::NodeFactory
 * Purpose: Node construction helpers shared by the reduction actions.
 * Inputs:
 *   - SourceBuffer of the parse (file name, positions for errors)
 *   - declared source encoding
 *   - EmbeddedParser callback for the code inside interpolations
 * Outputs:
 *   - AST nodes for literals, variables, assignment targets, calls and
 *     parameter lists
 * Theory of Operation:
 *   Tokens carry decoded payloads (StringParts, NumberLiteral, names); the
 *   factory turns them into nodes. Interpolated code is parsed on demand by
 *   the embedded parser, which runs a nested parse over the code range of
 *   the same buffer. Semantic errors detected while building a node (an
 *   assignment to a keyword, a block passed twice) raise ParseError at the
 *   offending token.
 */
#pragma once

#include <functional>
#include <string>
#include <utility>

#include "ast/Nodes.h"
#include "lexer/SourceBuffer.h"
#include "lexer/Token.h"
#include "rbparse/support/SourceRange.h"

namespace rbparse::parse {

// Parses the code of one interpolation; null for an empty `#{}`.
using EmbeddedParser = std::function<ast::NodePtr(SourceRange code)>;

class NodeFactory {
  public:
    NodeFactory(const lex::SourceBuffer& source, std::string encoding, EmbeddedParser embedded,
                const bool frozenStrings = false)
        : source_(source), encoding_(std::move(encoding)), embedded_(std::move(embedded)), frozen_(frozenStrings) {}

    [[noreturn]] void fail(const std::string& message, SourceRange at) const;
    [[noreturn]] void fail(const std::string& message, const lex::Token& at) const;

    const lex::SourceBuffer& source() const { return source_; }
    const std::string& encoding() const { return encoding_; }

    // Name carried by an identifier-like or operator token.
    static std::string nameOf(const lex::Token& token);

    // Variables and targets
    ast::NodePtr variable(const lex::Token& token) const;
    ast::NodePtr assignable(const lex::Token& token) const;

    // Literals
    ast::NodePtr number(const lex::Token& token) const;
    ast::NodePtr string(const lex::Token& token) const;
    ast::NodePtr concat(ast::NodePtr head, const lex::Token& tail) const;
    ast::NodePtr symbol(const lex::Token& token) const;
    ast::NodePtr symbolFromName(const lex::Token& token) const;
    ast::NodePtr regexp(const lex::Token& token) const;
    ast::NodePtr words(const lex::Token& token, bool symbols) const;
    ast::NodePtr arrayFrom(ast::NodePtr list, SourceRange range) const;

    // Calls
    ast::NodePtr call(SourceRange range, ast::NodePtr receiver, std::string name, ast::NodePtr args,
                      bool safeNavigation = false) const;
    ast::NodePtr fcall(SourceRange range, std::string name, ast::NodePtr args, bool hasParens) const;
    ast::NodePtr negate(SourceRange range, ast::NodePtr operand) const;
    ast::NodePtr attachBlock(ast::NodePtr call, ast::NodePtr iter) const;
    // Detaches a trailing BlockPassNode from an argument list.
    static ast::NodePtr takeBlockPass(ast::NodePtr& args);
    // Value of return/break/next: nothing, the single argument or an array.
    ast::NodePtr jumpValue(ast::NodePtr args) const;

    // Parameters
    ast::NodePtr params(SourceRange range, ast::NodePtr items, ast::NodePtr locals) const;

  private:
    ast::NodePtr parts(const lex::StringParts& parts, SourceRange range, ast::NodePtr sequence) const;
    ast::NodePtr evaluated(const lex::StringPart& part) const;
    const lex::SourceBuffer& source_;
    std::string encoding_;
    EmbeddedParser embedded_;
    bool frozen_;
};

} // namespace rbparse::parse
