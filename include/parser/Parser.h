/***
 * Name: rbparse::parse::Parser
 * Purpose: Public entry point: Ruby source text in, validated AST out.
 * Inputs:
 *   - SourceBuffer (or a name and text) and ParserOptions
 * Outputs:
 *   - ParseResult owning an immutable RootNode and the effective encoding
 * Theory of Operation:
 *   One parse runs the lexer and the table-driven Driver over the shared
 *   generated grammar, then the post-processing passes in a fixed order:
 *   LocalVariableResolver, NumericLiteralNormalizer, OpAssignDesugar and
 *   Validator. Code inside string interpolations is parsed by a nested
 *   Driver over the same buffer. Any stage failing raises a SyntaxError
 *   subclass (LexError, ParseError, ValidationError); nothing is returned
 *   for a source with an error.
 *
 *   A Parser holds only configuration; separate parse() calls share no
 *   state, so one instance may be used from several threads.
 */
#pragma once

#include <memory>
#include <ostream>
#include <string>
#include <utility>

#include "ast/Nodes.h"
#include "lexer/SourceBuffer.h"
#include "rbparse/support/WarningSink.h"

namespace rbparse::obs {
class Metrics;
}

namespace rbparse::parse {

enum class Variant { Program, Expression };

// "program" or "expression"; throws exceptions::ConfigError otherwise.
Variant variantFromName(const std::string& name);
const char* to_string(Variant variant);

struct ParserOptions {
    Variant variant{Variant::Program};
    std::string defaultEncoding{"UTF-8"}; // used when no magic comment is present
    int startLine{1}; // line number of the first line of text
    std::ostream* trace{nullptr}; // shift/reduce trace of the top-level parse
    WarningSink* warnings{nullptr};
    obs::Metrics* metrics{nullptr};
};

struct ParseResult {
    std::unique_ptr<const ast::RootNode> root;
    std::string encoding;
};

class Parser {
  public:
    explicit Parser(ParserOptions options = {}) : options_(std::move(options)) {}

    ParseResult parse(const lex::SourceBuffer& source) const;
    ParseResult parse(const std::string& name, const std::string& text) const;

    const ParserOptions& options() const { return options_; }

  private:
    ast::NodePtr parseEmbedded(const lex::SourceBuffer& source, const std::string& encoding, bool frozen,
                               SourceRange code) const;

    ParserOptions options_;
};

} // namespace rbparse::parse
