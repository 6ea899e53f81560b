/***
 * Name: rbparse::parse::GrammarTable
 * Purpose: Lookups over the generated table arrays.
 */
#include "parser/GrammarTable.h"

#include <algorithm>
#include <utility>

namespace rbparse::parse {

GrammarTable::GrammarTable(TableData data) : data_(std::move(data)) {
  for (std::size_t i = 0; i < data_.terminalKinds.size(); ++i) {
    terminals_.emplace(data_.terminalKinds[i], static_cast<std::uint16_t>(i));
  }
}

const ActionEntry* GrammarTable::action(const std::uint32_t state, const std::uint16_t terminal) const {
  if (state >= stateCount()) { return nullptr; }
  const ActionEntry* first = data_.actions.data() + data_.actionOffsets[state];
  const ActionEntry* last = data_.actions.data() + data_.actionOffsets[state + 1];
  const ActionEntry* found = std::lower_bound(
      first, last, terminal, [](const ActionEntry& entry, std::uint16_t key) { return entry.terminal < key; });
  return (found != last && found->terminal == terminal) ? found : nullptr;
}

std::optional<std::uint32_t> GrammarTable::gotoState(const std::uint32_t state, const std::uint16_t nonterminal) const {
  if (state >= stateCount()) { return std::nullopt; }
  const GotoEntry* first = data_.gotos.data() + data_.gotoOffsets[state];
  const GotoEntry* last = data_.gotos.data() + data_.gotoOffsets[state + 1];
  const GotoEntry* found = std::lower_bound(
      first, last, nonterminal, [](const GotoEntry& entry, std::uint16_t key) { return entry.nonterminal < key; });
  if (found == last || found->nonterminal != nonterminal) { return std::nullopt; }
  return found->state;
}

std::optional<std::uint16_t> GrammarTable::terminalOf(const lex::TokenKind kind) const {
  const auto it = terminals_.find(kind);
  if (it == terminals_.end()) { return std::nullopt; }
  return it->second;
}

std::vector<std::string> GrammarTable::expectedTokens(const std::uint32_t state) const {
  std::vector<std::string> names;
  if (state >= stateCount()) { return names; }
  for (std::uint32_t i = data_.actionOffsets[state]; i < data_.actionOffsets[state + 1]; ++i) {
    const lex::TokenKind kind = data_.terminalKinds[data_.actions[i].terminal];
    if (kind == lex::TokenKind::EntryProgram || kind == lex::TokenKind::EntryExpression) { continue; }
    names.emplace_back(lex::to_string(kind));
  }
  return names;
}

} // namespace rbparse::parse
