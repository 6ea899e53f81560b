/***
 * Name: rbparse::parse::Driver
 * Purpose: Table-driven LALR(1) shift-reduce engine.
 * Inputs:
 *   - GrammarTable (shared, immutable)
 *   - token stream (pull-based, ends with EndOfInput)
 *   - IReducer running the grammar's named actions
 * Outputs:
 *   - the node built by the start symbol of the selected entry point
 * Theory of Operation:
 *   The entry pseudo-token is shifted first and picks the start symbol.
 *   Each step looks up ACTION[state, lookahead]: shifts push the token,
 *   reductions pop the right-hand side and push the action's result, an
 *   empty cell raises ParseError listing the terminals the state accepts.
 *   Pass-through rules move a value up without calling the reducer.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "ast/Node.h"
#include "lexer/ITokenStream.h"
#include "lexer/TokenKind.h"
#include "parser/GrammarTable.h"
#include "parser/IReducer.h"
#include "parser/Value.h"

namespace rbparse::parse {

class Driver {
  public:
    Driver(const GrammarTable& table, lex::ITokenStream& tokens, IReducer& reducer, std::string file,
           std::ostream* trace = nullptr)
        : table_(table), tokens_(tokens), reducer_(reducer), file_(std::move(file)), trace_(trace) {}

    // Throws exceptions::ParseError on a syntax error; lexer and reducer errors propagate.
    ast::NodePtr parse(lex::TokenKind entry);

    std::size_t shiftCount() const { return shifts_; }
    std::size_t reductionCount() const { return reductions_; }

  private:
    [[noreturn]] void syntaxError(const lex::Token& lookahead) const;
    void reduce(std::uint32_t ruleIndex, const lex::Token& lookahead);

    const GrammarTable& table_;
    lex::ITokenStream& tokens_;
    IReducer& reducer_;
    std::string file_;
    std::ostream* trace_;

    std::vector<std::uint32_t> states_{};
    std::vector<Value> values_{};
    std::size_t shifts_{0};
    std::size_t reductions_{0};
};

} // namespace rbparse::parse
