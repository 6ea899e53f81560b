/***
 * Name: rbparse::grammar::Grammar
 * Purpose: In-memory context-free grammar with yacc-style precedence, the
 *   input of the LALR(1) table builder.
 * Inputs:
 *   - Declarations and rules added by GrammarReader
 * Outputs:
 *   - Symbol numbering shared by the builder and the table writer
 * Theory of Operation:
 *   Symbols use one id space: terminals occupy [0, terminalCount()) with the
 *   end-of-input terminal at 0, nonterminals follow. Nonterminal 0 is the
 *   synthetic `$accept`; production i < entries().size() is the augmented
 *   rule `$accept : <entry token> <start symbol>` for entry i.
 *   Precedence tags named in %left/%right/%nonassoc lines without a %token
 *   declaration are usable only through %prec.
 */
#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace rbparse::grammar {

enum class Assoc { None, Left, Right, NonAssoc };

struct Precedence {
    int level{0}; // 0: none; higher binds tighter
    Assoc assoc{Assoc::None};
};

struct Production {
    int lhs{0}; // nonterminal index (not a symbol id)
    std::vector<int> rhs{}; // symbol ids
    std::string action{}; // named reduction action; empty for pass-through
    int passIndex{-1}; // rhs index passed through when action is empty; -1 yields no value
    Precedence prec{};
    int line{0};
};

struct EntryPoint {
    int terminal{0}; // symbol id of the entry pseudo-token
    int start{0}; // nonterminal index of the start symbol
};

class Grammar {
  public:
    Grammar();

    // Terminal declarations must all precede the first rule.
    int declareTerminal(const std::string& name);
    void setEndTerminal(const std::string& name);
    // Returns the existing nonterminal index when already known.
    int internNonterminal(const std::string& name);

    void declarePrecedence(const std::string& name, Precedence prec);
    std::optional<Precedence> precedenceOf(const std::string& name) const;

    void addEntry(const std::string& terminal, const std::string& startSymbol);
    void addProduction(Production production);
    // Appends the augmented $accept rules and checks every nonterminal is defined.
    void finalize();

    std::optional<int> findSymbol(const std::string& name) const;
    int actionIndex(const std::string& action); // 1-based; 0 is reserved for "None"
    int actionIdOf(const std::string& action) const; // 0 when not a named action

    size_t terminalCount() const { return terminals_.size(); }
    size_t nonterminalCount() const { return nonterminals_.size(); }
    size_t symbolCount() const { return terminals_.size() + nonterminals_.size(); }
    bool isTerminal(int symbol) const { return symbol >= 0 && static_cast<size_t>(symbol) < terminals_.size(); }
    int nonterminalSymbol(int nonterminal) const { return static_cast<int>(terminals_.size()) + nonterminal; }
    int nonterminalOf(int symbol) const { return symbol - static_cast<int>(terminals_.size()); }
    const std::string& symbolName(int symbol) const;
    const std::string& terminalName(int terminal) const { return terminals_.at(static_cast<size_t>(terminal)); }
    const std::string& nonterminalName(int nonterminal) const { return nonterminals_.at(static_cast<size_t>(nonterminal)); }

    Precedence terminalPrecedence(int terminal) const { return terminalPrec_.at(static_cast<size_t>(terminal)); }
    const std::vector<Production>& productions() const { return productions_; }
    const std::vector<EntryPoint>& entries() const { return entries_; }
    const std::vector<std::string>& actions() const { return actions_; }
    // Production indices grouped by left-hand side nonterminal.
    const std::vector<int>& productionsOf(int nonterminal) const { return byLhs_.at(static_cast<size_t>(nonterminal)); }

    std::string productionText(int production) const;

    std::optional<int> expectedConflicts{};

  private:
    std::vector<std::string> terminals_{};
    std::vector<Precedence> terminalPrec_{};
    std::vector<std::string> nonterminals_{};
    std::map<std::string, int> terminalIndex_{};
    std::map<std::string, int> nonterminalIndex_{};
    std::map<std::string, Precedence> tags_{};
    std::vector<EntryPoint> entries_{};
    std::vector<Production> rules_{}; // user rules in file order
    std::vector<Production> productions_{}; // augmented rules first, then rules_
    std::vector<std::vector<int>> byLhs_{};
    std::vector<std::string> actions_{};
    bool rulesStarted_{false};
    bool finalized_{false};
};

} // namespace rbparse::grammar
