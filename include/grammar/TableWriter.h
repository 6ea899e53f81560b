/***
 * Name: rbparse::grammar::TableWriter
 * Purpose: Emit the C++ header and source that embed LALR tables.
 * Inputs:
 *   - Grammar, LalrTables and naming options
 * Outputs:
 *   - Header: `enum class ActionId` (one enumerator per named action) and
 *     table dimensions, in the configured namespace
 *   - Source: constant arrays plus the accessor returning the shared
 *     rbparse::parse::GrammarTable
 */
#pragma once

#include <ostream>
#include <string>

#include "grammar/Grammar.h"
#include "grammar/LalrBuilder.h"

namespace rbparse::grammar {

struct TableWriterOptions {
    std::string headerInclude{"RubyGrammar.h"};
    std::string actionNamespace{"rbparse::parse::grammar"};
    std::string functionName{"RubyGrammarTable"};
    std::string grammarName{"ruby.grammar"};
};

class TableWriter {
  public:
    TableWriter(const Grammar& grammar, const LalrTables& tables, TableWriterOptions options);

    void writeHeader(std::ostream& out) const;
    void writeSource(std::ostream& out) const;

  private:
    const Grammar& grammar_;
    const LalrTables& tables_;
    TableWriterOptions options_;
};

} // namespace rbparse::grammar
