/***
 * Name: rbparse::lex::to_string(LexState)
 * Purpose: Stable names for lexer states, used by token dumps and tests.
 */
#include "lexer/LexState.h"

namespace rbparse::lex {

const char* to_string(const LexState s) {
  using enum LexState;
  switch (s) {
    case Beg: return "Beg";
    case Mid: return "Mid";
    case End: return "End";
    case Arg: return "Arg";
    case CmdArg: return "CmdArg";
    case EndFn: return "EndFn";
    case Fname: return "Fname";
    case Dot: return "Dot";
    case Class: return "Class";
  }
  return "unknown";
}

} // namespace rbparse::lex
