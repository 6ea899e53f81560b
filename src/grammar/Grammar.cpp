/***
 * Name: rbparse::grammar::Grammar
 * Purpose: Symbol tables, precedence lookup and augmentation for grammars.
 */
#include "grammar/Grammar.h"

#include <algorithm>
#include <utility>

#include "rbparse/exceptions/grammar_error.h"

namespace rbparse::grammar {

Grammar::Grammar() {
  terminals_.emplace_back("$end");
  terminalPrec_.emplace_back();
  terminalIndex_["$end"] = 0;
  nonterminals_.emplace_back("$accept");
  nonterminalIndex_["$accept"] = 0;
}

int Grammar::declareTerminal(const std::string& name) {
  if (rulesStarted_) { throw exceptions::GrammarError("token '" + name + "' declared after the first rule"); }
  if (terminalIndex_.count(name) != 0) { throw exceptions::GrammarError("token '" + name + "' declared twice"); }
  const int index = static_cast<int>(terminals_.size());
  terminals_.push_back(name);
  terminalPrec_.push_back(Precedence{});
  terminalIndex_[name] = index;
  if (const auto it = tags_.find(name); it != tags_.end()) { terminalPrec_.back() = it->second; }
  return index;
}

void Grammar::setEndTerminal(const std::string& name) {
  if (terminalIndex_.count(name) != 0) { throw exceptions::GrammarError("end token '" + name + "' already declared"); }
  terminalIndex_.erase(terminals_[0]);
  terminals_[0] = name;
  terminalIndex_[name] = 0;
}

int Grammar::internNonterminal(const std::string& name) {
  if (terminalIndex_.count(name) != 0) { throw exceptions::GrammarError("'" + name + "' is a token, not a rule"); }
  if (const auto it = nonterminalIndex_.find(name); it != nonterminalIndex_.end()) { return it->second; }
  const int index = static_cast<int>(nonterminals_.size());
  nonterminals_.push_back(name);
  nonterminalIndex_[name] = index;
  return index;
}

void Grammar::declarePrecedence(const std::string& name, const Precedence prec) {
  if (tags_.count(name) != 0) { throw exceptions::GrammarError("precedence of '" + name + "' declared twice"); }
  tags_[name] = prec;
  if (const auto it = terminalIndex_.find(name); it != terminalIndex_.end()) {
    terminalPrec_[static_cast<size_t>(it->second)] = prec;
  }
}

std::optional<Precedence> Grammar::precedenceOf(const std::string& name) const {
  if (const auto it = tags_.find(name); it != tags_.end()) { return it->second; }
  return std::nullopt;
}

void Grammar::addEntry(const std::string& terminal, const std::string& startSymbol) {
  const auto it = terminalIndex_.find(terminal);
  if (it == terminalIndex_.end()) { throw exceptions::GrammarError("entry token '" + terminal + "' is not declared"); }
  EntryPoint entry;
  entry.terminal = it->second;
  entry.start = internNonterminal(startSymbol);
  entries_.push_back(entry);
}

void Grammar::addProduction(Production production) {
  rulesStarted_ = true;
  if (production.prec.level == 0) {
    for (auto sym = production.rhs.rbegin(); sym != production.rhs.rend(); ++sym) {
      if (isTerminal(*sym) && terminalPrec_[static_cast<size_t>(*sym)].level != 0) {
        production.prec = terminalPrec_[static_cast<size_t>(*sym)];
        break;
      }
    }
  }
  rules_.push_back(std::move(production));
}

void Grammar::finalize() {
  if (finalized_) { return; }
  if (entries_.empty()) { throw exceptions::GrammarError("grammar declares no %entry"); }
  productions_.clear();
  for (const auto& entry : entries_) {
    Production accept;
    accept.lhs = 0;
    accept.rhs = {entry.terminal, nonterminalSymbol(entry.start)};
    accept.passIndex = 1;
    productions_.push_back(std::move(accept));
  }
  productions_.insert(productions_.end(), rules_.begin(), rules_.end());
  byLhs_.assign(nonterminals_.size(), {});
  for (size_t i = 0; i < productions_.size(); ++i) {
    byLhs_[static_cast<size_t>(productions_[i].lhs)].push_back(static_cast<int>(i));
  }
  for (size_t nt = 1; nt < nonterminals_.size(); ++nt) {
    if (byLhs_[nt].empty()) {
      throw exceptions::GrammarError("symbol '" + nonterminals_[nt] + "' is used but not defined");
    }
  }
  finalized_ = true;
}

std::optional<int> Grammar::findSymbol(const std::string& name) const {
  if (const auto it = terminalIndex_.find(name); it != terminalIndex_.end()) { return it->second; }
  if (const auto it = nonterminalIndex_.find(name); it != nonterminalIndex_.end()) {
    return nonterminalSymbol(it->second);
  }
  return std::nullopt;
}

int Grammar::actionIndex(const std::string& action) {
  const auto it = std::find(actions_.begin(), actions_.end(), action);
  if (it != actions_.end()) { return static_cast<int>(it - actions_.begin()) + 1; }
  actions_.push_back(action);
  return static_cast<int>(actions_.size());
}

int Grammar::actionIdOf(const std::string& action) const {
  const auto it = std::find(actions_.begin(), actions_.end(), action);
  return it == actions_.end() ? 0 : static_cast<int>(it - actions_.begin()) + 1;
}

const std::string& Grammar::symbolName(const int symbol) const {
  if (isTerminal(symbol)) { return terminals_.at(static_cast<size_t>(symbol)); }
  return nonterminals_.at(static_cast<size_t>(nonterminalOf(symbol)));
}

std::string Grammar::productionText(const int production) const {
  const Production& prod = productions_.at(static_cast<size_t>(production));
  std::string text = nonterminals_.at(static_cast<size_t>(prod.lhs)) + " :";
  for (const int sym : prod.rhs) { text += " " + symbolName(sym); }
  if (prod.rhs.empty()) { text += " <empty>"; }
  return text;
}

} // namespace rbparse::grammar
