/***
 * Name: rbparse::parse::GrammarTable
 * Purpose: Immutable LALR(1) ACTION/GOTO tables consumed by the Driver.
 * Inputs:
 *   - TableData: spans over constant arrays written by rbparse_lalr
 * Outputs:
 *   - action(state, terminal), gotoState(state, nonterminal), rule metadata
 * Theory of Operation:
 *   Rows are stored flat with per-state offsets; each row is sorted by
 *   terminal (or nonterminal) so lookups are binary searches. The table
 *   is read-only after construction and shared by every parse; the
 *   TokenKind -> terminal index is built once in the constructor.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

#include "lexer/TokenKind.h"

namespace rbparse::parse {

enum class ActionKind : std::uint8_t { Shift, Reduce, Accept };

struct ActionEntry {
    std::uint16_t terminal;
    ActionKind kind;
    std::uint32_t value; // state for Shift, rule for Reduce/Accept
};

struct GotoEntry {
    std::uint16_t nonterminal;
    std::uint32_t state;
};

struct RuleInfo {
    std::uint16_t lhs; // nonterminal index
    std::uint16_t length; // right-hand side symbol count
    std::int16_t passIndex; // rhs value passed through when action is 0; -1 for none
    std::uint16_t action; // grammar-specific action id; 0 is "None"
    const char* text; // "lhs : rhs..." for traces
};

struct TableData {
    std::span<const lex::TokenKind> terminalKinds;
    std::span<const char* const> symbolNames; // terminals first, then nonterminals
    std::span<const RuleInfo> rules;
    std::span<const ActionEntry> actions;
    std::span<const std::uint32_t> actionOffsets; // stateCount + 1
    std::span<const GotoEntry> gotos;
    std::span<const std::uint32_t> gotoOffsets; // stateCount + 1
};

class GrammarTable {
  public:
    explicit GrammarTable(TableData data);

    // nullptr means a syntax error in this state.
    const ActionEntry* action(std::uint32_t state, std::uint16_t terminal) const;
    std::optional<std::uint32_t> gotoState(std::uint32_t state, std::uint16_t nonterminal) const;
    std::optional<std::uint16_t> terminalOf(lex::TokenKind kind) const;
    // Names of the terminals with an action in `state`, in table order.
    std::vector<std::string> expectedTokens(std::uint32_t state) const;

    const RuleInfo& rule(std::size_t index) const { return data_.rules[index]; }
    const char* symbolName(std::size_t symbol) const { return data_.symbolNames[symbol]; }
    const char* nonterminalName(std::size_t nonterminal) const { return data_.symbolNames[terminalCount() + nonterminal]; }
    std::size_t terminalCount() const { return data_.terminalKinds.size(); }
    std::size_t stateCount() const { return data_.actionOffsets.size() - 1; }
    std::size_t ruleCount() const { return data_.rules.size(); }

  private:
    TableData data_;
    std::unordered_map<lex::TokenKind, std::uint16_t> terminals_;
};

// The Ruby grammar, generated from grammar/ruby.grammar at build time.
const GrammarTable& RubyGrammarTable();

} // namespace rbparse::parse
