/***
 * Name: rbparse::grammar::LalrBuilder
 * Purpose: Construct LALR(1) ACTION/GOTO tables from a finalized Grammar.
 * Inputs:
 *   - Grammar (augmented, finalized)
 * Outputs:
 *   - LalrTables: per-state actions keyed by terminal, gotos keyed by
 *     nonterminal, and the list of conflicts precedence could not settle
 * Theory of Operation:
 *   1. nullable and FIRST sets by fixed-point iteration;
 *   2. the LR(0) canonical collection over kernel items;
 *   3. lookaheads by spontaneous generation and propagation: every kernel
 *      item is closed with a probe lookahead, probe bits propagate and
 *      concrete bits are generated (the classic two-pass LALR method);
 *   4. table filling with yacc conflict resolution: production precedence
 *      against the lookahead terminal's precedence, associativity on ties,
 *      %nonassoc turning the cell into an error. Unresolved shift/reduce
 *      conflicts shift; reduce/reduce conflicts keep the earlier rule.
 *   No default reductions are emitted, so an error is detected in the
 *   state whose expected set is reported.
 */
#pragma once

#include <bit>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "grammar/Grammar.h"

namespace rbparse::grammar {

struct LrAction {
    enum class Kind { Shift, Reduce, Accept, Error };
    Kind kind{Kind::Error};
    int value{0}; // target state (Shift) or production (Reduce, Accept)
};

struct Conflict {
    enum class Kind { ShiftReduce, ReduceReduce };
    Kind kind{Kind::ShiftReduce};
    int state{0};
    int terminal{0};
    int kept{-1}; // production kept, -1 when the shift won
    int dropped{0}; // production discarded

    std::string describe(const Grammar& grammar) const;
};

struct LalrTables {
    std::vector<std::map<int, LrAction>> actions{}; // state -> terminal -> action
    std::vector<std::map<int, int>> gotos{}; // state -> nonterminal -> state
    std::vector<Conflict> conflicts{}; // unresolved, in discovery order
    size_t resolvedByPrecedence{0};

    size_t stateCount() const { return actions.size(); }
};

// Throws GrammarError unless the number of unresolved conflicts equals the
// grammar's %expect count (zero when the grammar declares none).
void checkConflicts(const Grammar& grammar, const LalrTables& tables);

class LalrBuilder {
  public:
    explicit LalrBuilder(const Grammar& grammar);

    LalrTables build();

  private:
    class Bitset {
      public:
        explicit Bitset(size_t bits = 0) : words_((bits + 63) / 64, 0) {}
        void set(size_t bit) { words_[bit / 64] |= (std::uint64_t{1} << (bit % 64)); }
        bool test(size_t bit) const { return ((words_[bit / 64] >> (bit % 64)) & 1U) != 0; }
        bool merge(const Bitset& other); // returns true when bits were added
        template <typename Fn>
        void forEach(Fn&& fn) const {
            for (size_t w = 0; w < words_.size(); ++w) {
                for (std::uint64_t bits = words_[w]; bits != 0; bits &= bits - 1) {
                    fn(w * 64 + static_cast<size_t>(std::countr_zero(bits)));
                }
            }
        }

      private:
        std::vector<std::uint64_t> words_;
    };

    struct State {
        std::vector<int> kernel; // sorted item ids
        std::map<int, int> transitions; // symbol -> state
    };

    using ItemLookaheads = std::map<int, Bitset>;

    int itemOf(int production, int dot) const { return itemBase_[static_cast<size_t>(production)] + dot; }
    int productionOfItem(int item) const { return itemProduction_[static_cast<size_t>(item)]; }
    int dotOfItem(int item) const { return item - itemBase_[static_cast<size_t>(productionOfItem(item))]; }
    int symbolAfterDot(int item) const; // -1 when the dot is at the end

    void computeNullableAndFirst();
    void buildLr0();
    std::vector<int> closure0(const std::vector<int>& kernel) const;
    ItemLookaheads closure1(const ItemLookaheads& seed) const;
    void computeLookaheads();
    void fillTables(LalrTables& out);
    void addReduce(LalrTables& out, int state, int terminal, int production);

    const Grammar& grammar_;
    size_t probeBit_{0}; // lookahead bit standing for "propagated from the kernel"
    std::vector<int> itemBase_{};
    std::vector<int> itemProduction_{};
    std::vector<bool> nullable_{};
    std::vector<Bitset> first_{}; // per nonterminal, over terminals
    std::vector<State> states_{};
    std::vector<std::vector<Bitset>> lookaheads_{}; // state -> kernel index -> terminals
};

} // namespace rbparse::grammar
