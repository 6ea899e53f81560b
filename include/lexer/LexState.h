/**
 * Name: rbparse::lex::LexState
 * Purpose: Lexer context describing what may legally come next.
 */
#pragma once

namespace rbparse::lex {

enum class LexState {
    Beg, // start of an expression
    Mid, // after return/break/next/rescue: an optional value may follow
    End, // after a complete operand
    Arg, // after a method name that may take arguments
    CmdArg, // like Arg, for a method name at the start of a statement
    EndFn, // after a method name in a def, or after ->
    Fname, // expecting a method name (def, alias, undef)
    Dot, // after . &. or ::
    Class, // after the class keyword (so << is an operator)
};

const char* to_string(LexState s);

} // namespace rbparse::lex
