/***
 * Name: rbparse::grammar::GrammarReader
 * Purpose: Parse the yacc-like grammar file format into a Grammar.
 * Inputs:
 *   - Grammar text and a display name used in error messages
 * Outputs:
 *   - A finalized Grammar
 * Theory of Operation:
 *   The declaration section (%token, %left, %right, %nonassoc, %entry,
 *   %expect, %eof) ends at `%%`; the rule section holds
 *     lhs : sym... [%prec TAG] [{ Action | $N | None }] | ... ;
 *   An alternative without braces passes $1 through, or no value when it is
 *   empty. `#` starts a comment running to end of line.
 *   Errors raise exceptions::GrammarError prefixed with "name:line: ".
 */
#pragma once

#include <string>
#include <string_view>

#include "grammar/Grammar.h"

namespace rbparse::grammar {

class GrammarReader {
  public:
    static Grammar parse(std::string_view text, const std::string& name);
    static Grammar readFile(const std::string& path);
};

} // namespace rbparse::grammar
