/***
 * Name: rbparse::grammar::LalrBuilder
 * Purpose: LALR(1) construction with yacc-compatible conflict resolution.
 */
#include "grammar/LalrBuilder.h"

#include <algorithm>
#include <iterator>
#include <utility>

#include "rbparse/exceptions/grammar_error.h"

namespace rbparse::grammar {

std::string Conflict::describe(const Grammar& grammar) const {
  std::string text = "state " + std::to_string(state) + ": ";
  text += kind == Kind::ShiftReduce ? "shift/reduce" : "reduce/reduce";
  text += " conflict on " + grammar.terminalName(terminal) + ": ";
  if (kept < 0) {
    text += "shift wins over `" + grammar.productionText(dropped) + "`";
  } else {
    text += "`" + grammar.productionText(kept) + "` wins over `" + grammar.productionText(dropped) + "`";
  }
  return text;
}

void checkConflicts(const Grammar& grammar, const LalrTables& tables) {
  const size_t allowed = grammar.expectedConflicts ? static_cast<size_t>(*grammar.expectedConflicts) : 0;
  if (tables.conflicts.size() == allowed) { return; }
  throw exceptions::GrammarError("expected " + std::to_string(allowed) + " conflicts, found " +
                                 std::to_string(tables.conflicts.size()));
}

bool LalrBuilder::Bitset::merge(const Bitset& other) {
  bool changed = false;
  for (size_t w = 0; w < words_.size(); ++w) {
    const std::uint64_t before = words_[w];
    words_[w] |= other.words_[w];
    changed = changed || words_[w] != before;
  }
  return changed;
}

LalrBuilder::LalrBuilder(const Grammar& grammar) : grammar_(grammar) {
  probeBit_ = grammar_.terminalCount();
  int next = 0;
  const auto& prods = grammar_.productions();
  for (size_t p = 0; p < prods.size(); ++p) {
    itemBase_.push_back(next);
    for (size_t d = 0; d <= prods[p].rhs.size(); ++d) { itemProduction_.push_back(static_cast<int>(p)); }
    next += static_cast<int>(prods[p].rhs.size()) + 1;
  }
}

int LalrBuilder::symbolAfterDot(const int item) const {
  const Production& prod = grammar_.productions()[static_cast<size_t>(productionOfItem(item))];
  const auto dot = static_cast<size_t>(dotOfItem(item));
  return dot < prod.rhs.size() ? prod.rhs[dot] : -1;
}

LalrTables LalrBuilder::build() {
  computeNullableAndFirst();
  buildLr0();
  computeLookaheads();
  LalrTables out;
  fillTables(out);
  return out;
}

void LalrBuilder::computeNullableAndFirst() {
  const size_t count = grammar_.nonterminalCount();
  nullable_.assign(count, false);
  first_.assign(count, Bitset(probeBit_ + 1));
  bool changed = true;
  while (changed) {
    changed = false;
    for (const auto& prod : grammar_.productions()) {
      const auto lhs = static_cast<size_t>(prod.lhs);
      bool allNullable = true;
      for (const int sym : prod.rhs) {
        if (grammar_.isTerminal(sym)) {
          if (!first_[lhs].test(static_cast<size_t>(sym))) {
            first_[lhs].set(static_cast<size_t>(sym));
            changed = true;
          }
          allNullable = false;
          break;
        }
        const auto nt = static_cast<size_t>(grammar_.nonterminalOf(sym));
        if (nt != lhs) { changed = first_[lhs].merge(first_[nt]) || changed; }
        if (!nullable_[nt]) {
          allNullable = false;
          break;
        }
      }
      if (allNullable && !nullable_[lhs]) {
        nullable_[lhs] = true;
        changed = true;
      }
    }
  }
}

std::vector<int> LalrBuilder::closure0(const std::vector<int>& kernel) const {
  std::vector<int> items = kernel;
  std::vector<bool> added(grammar_.nonterminalCount(), false);
  for (size_t i = 0; i < items.size(); ++i) {
    const int sym = symbolAfterDot(items[i]);
    if (sym < 0 || grammar_.isTerminal(sym)) { continue; }
    const auto nt = static_cast<size_t>(grammar_.nonterminalOf(sym));
    if (added[nt]) { continue; }
    added[nt] = true;
    for (const int p : grammar_.productionsOf(static_cast<int>(nt))) { items.push_back(itemOf(p, 0)); }
  }
  return items;
}

void LalrBuilder::buildLr0() {
  std::map<std::vector<int>, int> index;
  State initial;
  for (size_t e = 0; e < grammar_.entries().size(); ++e) { initial.kernel.push_back(itemOf(static_cast<int>(e), 0)); }
  std::sort(initial.kernel.begin(), initial.kernel.end());
  index[initial.kernel] = 0;
  states_.push_back(std::move(initial));

  for (size_t s = 0; s < states_.size(); ++s) {
    const std::vector<int> items = closure0(states_[s].kernel);
    std::map<int, std::vector<int>> moves;
    for (const int item : items) {
      const int sym = symbolAfterDot(item);
      if (sym >= 0) { moves[sym].push_back(item + 1); }
    }
    for (auto& [sym, kernel] : moves) {
      std::sort(kernel.begin(), kernel.end());
      kernel.erase(std::unique(kernel.begin(), kernel.end()), kernel.end());
      auto found = index.find(kernel);
      int target = 0;
      if (found == index.end()) {
        target = static_cast<int>(states_.size());
        index.emplace(kernel, target);
        State next;
        next.kernel = kernel;
        states_.push_back(std::move(next));
      } else {
        target = found->second;
      }
      states_[s].transitions[sym] = target;
    }
  }
}

LalrBuilder::ItemLookaheads LalrBuilder::closure1(const ItemLookaheads& seed) const {
  ItemLookaheads result = seed;
  std::vector<int> work;
  work.reserve(result.size());
  for (const auto& entry : result) { work.push_back(entry.first); }
  while (!work.empty()) {
    const int item = work.back();
    work.pop_back();
    const int sym = symbolAfterDot(item);
    if (sym < 0 || grammar_.isTerminal(sym)) { continue; }
    const Production& prod = grammar_.productions()[static_cast<size_t>(productionOfItem(item))];
    Bitset follow(probeBit_ + 1);
    bool restNullable = true;
    for (size_t i = static_cast<size_t>(dotOfItem(item)) + 1; i < prod.rhs.size(); ++i) {
      const int next = prod.rhs[i];
      if (grammar_.isTerminal(next)) {
        follow.set(static_cast<size_t>(next));
        restNullable = false;
        break;
      }
      const auto nt = static_cast<size_t>(grammar_.nonterminalOf(next));
      follow.merge(first_[nt]);
      if (!nullable_[nt]) {
        restNullable = false;
        break;
      }
    }
    if (restNullable) { follow.merge(result.at(item)); }
    for (const int p : grammar_.productionsOf(grammar_.nonterminalOf(sym))) {
      const int child = itemOf(p, 0);
      auto [it, inserted] = result.try_emplace(child, Bitset(probeBit_ + 1));
      if (it->second.merge(follow) || inserted) { work.push_back(child); }
    }
  }
  return result;
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
void LalrBuilder::computeLookaheads() {
  struct Link {
    size_t state;
    size_t kernel;
  };
  lookaheads_.clear();
  std::vector<std::vector<std::vector<Link>>> links(states_.size());
  for (size_t s = 0; s < states_.size(); ++s) {
    lookaheads_.emplace_back(states_[s].kernel.size(), Bitset(probeBit_ + 1));
    links[s].resize(states_[s].kernel.size());
  }
  for (auto& la : lookaheads_[0]) { la.set(0); }

  for (size_t s = 0; s < states_.size(); ++s) {
    for (size_t k = 0; k < states_[s].kernel.size(); ++k) {
      ItemLookaheads seed;
      Bitset probe(probeBit_ + 1);
      probe.set(probeBit_);
      seed.emplace(states_[s].kernel[k], probe);
      for (const auto& [item, la] : closure1(seed)) {
        const int sym = symbolAfterDot(item);
        if (sym < 0) { continue; }
        const auto target = static_cast<size_t>(states_[s].transitions.at(sym));
        const auto& kernel = states_[target].kernel;
        const auto pos = static_cast<size_t>(std::lower_bound(kernel.begin(), kernel.end(), item + 1) - kernel.begin());
        la.forEach([&](size_t bit) {
          if (bit == probeBit_) {
            links[s][k].push_back(Link{target, pos});
          } else {
            lookaheads_[target][pos].set(bit);
          }
        });
      }
    }
  }

  bool changed = true;
  while (changed) {
    changed = false;
    for (size_t s = 0; s < states_.size(); ++s) {
      for (size_t k = 0; k < links[s].size(); ++k) {
        for (const Link& link : links[s][k]) {
          if (link.state == s && link.kernel == k) { continue; }
          changed = lookaheads_[link.state][link.kernel].merge(lookaheads_[s][k]) || changed;
        }
      }
    }
  }
}

void LalrBuilder::fillTables(LalrTables& out) {
  out.actions.assign(states_.size(), {});
  out.gotos.assign(states_.size(), {});
  for (size_t s = 0; s < states_.size(); ++s) {
    for (const auto& [sym, target] : states_[s].transitions) {
      if (grammar_.isTerminal(sym)) {
        out.actions[s][sym] = LrAction{LrAction::Kind::Shift, target};
      } else {
        out.gotos[s][grammar_.nonterminalOf(sym)] = target;
      }
    }
    ItemLookaheads seed;
    for (size_t k = 0; k < states_[s].kernel.size(); ++k) { seed.emplace(states_[s].kernel[k], lookaheads_[s][k]); }
    std::vector<std::pair<int, Bitset>> reductions;
    for (const auto& [item, la] : closure1(seed)) {
      if (symbolAfterDot(item) < 0) { reductions.emplace_back(productionOfItem(item), la); }
    }
    std::sort(reductions.begin(), reductions.end(),
              [](const auto& lhs, const auto& rhs) { return lhs.first < rhs.first; });
    for (const auto& reduction : reductions) {
      const int production = reduction.first;
      if (grammar_.productions()[static_cast<size_t>(production)].lhs == 0) {
        if (reduction.second.test(0)) { out.actions[s][0] = LrAction{LrAction::Kind::Accept, production}; }
        continue;
      }
      reduction.second.forEach([&](size_t bit) {
        if (bit != probeBit_) { addReduce(out, static_cast<int>(s), static_cast<int>(bit), production); }
      });
    }
  }
  for (auto& row : out.actions) {
    for (auto it = row.begin(); it != row.end();) {
      it = it->second.kind == LrAction::Kind::Error ? row.erase(it) : std::next(it);
    }
  }
}

void LalrBuilder::addReduce(LalrTables& out, const int state, const int terminal, const int production) {
  auto& row = out.actions[static_cast<size_t>(state)];
  const auto found = row.find(terminal);
  if (found == row.end()) {
    row[terminal] = LrAction{LrAction::Kind::Reduce, production};
    return;
  }
  LrAction& existing = found->second;
  Conflict conflict;
  conflict.state = state;
  conflict.terminal = terminal;
  conflict.dropped = production;
  switch (existing.kind) {
    case LrAction::Kind::Error:
      return;
    case LrAction::Kind::Accept:
    case LrAction::Kind::Reduce:
      conflict.kind = Conflict::Kind::ReduceReduce;
      conflict.kept = existing.value;
      out.conflicts.push_back(conflict);
      return;
    case LrAction::Kind::Shift:
      break;
  }
  const Precedence rule = grammar_.productions()[static_cast<size_t>(production)].prec;
  const Precedence token = grammar_.terminalPrecedence(terminal);
  if (rule.level == 0 || token.level == 0) {
    conflict.kind = Conflict::Kind::ShiftReduce;
    conflict.kept = -1;
    out.conflicts.push_back(conflict);
    return;
  }
  ++out.resolvedByPrecedence;
  if (rule.level > token.level) {
    existing = LrAction{LrAction::Kind::Reduce, production};
  } else if (rule.level == token.level) {
    if (token.assoc == Assoc::Left) {
      existing = LrAction{LrAction::Kind::Reduce, production};
    } else if (token.assoc == Assoc::NonAssoc) {
      existing = LrAction{LrAction::Kind::Error, 0};
    }
  }
}

} // namespace rbparse::grammar
