/**
 * Name: rbparse::lex::TokenKind
 * Purpose: Token kinds produced by the Ruby lexer.
 * Note: enumerator names double as terminal names in grammar/ruby.grammar.
 */
#pragma once

namespace rbparse::lex {

enum class TokenKind {
    EndOfInput, // end of input
    EntryProgram, // entry marker for a full program
    EntryExpression, // entry marker for a single expression
    KwClass, // class
    KwModule, // module
    KwDef, // def
    KwUndef, // undef
    KwBegin, // begin
    KwRescue, // rescue
    KwEnsure, // ensure
    KwEnd, // end
    KwIf, // if
    KwUnless, // unless
    KwThen, // then
    KwElsif, // elsif
    KwElse, // else
    KwCase, // case
    KwWhen, // when
    KwIn, // in
    KwWhile, // while
    KwUntil, // until
    KwFor, // for
    KwBreak, // break
    KwNext, // next
    KwRedo, // redo
    KwRetry, // retry
    KwDo, // do (parenthesized call or bare block)
    KwDoCond, // do closing a while/until/for condition
    KwDoBlock, // do attached to a command call
    KwDoLambda, // do opening a lambda body
    KwReturn, // return
    KwYield, // yield
    KwSuper, // super
    KwSelf, // self
    KwNil, // nil
    KwTrue, // true
    KwFalse, // false
    KwAnd, // and
    KwOr, // or
    KwNot, // not
    KwIfMod, // if (modifier)
    KwUnlessMod, // unless (modifier)
    KwWhileMod, // while (modifier)
    KwUntilMod, // until (modifier)
    KwRescueMod, // rescue (modifier)
    KwAlias, // alias
    KwDefined, // defined?
    KwFile, // __FILE__
    KwLine, // __LINE__
    KwEncoding, // __ENCODING__
    Identifier, // local name or method name
    FunctionId, // method name ending in ? or !
    Constant, // capitalized name
    InstanceVar, // @name
    ClassVar, // @@name
    GlobalVar, // $name
    NthRef, // $1 .. $9
    BackRef, // $& $` $' $+
    Label, // name: inside hashes and argument lists
    Integer, // integer literal
    Float, // float literal
    String, // string or character literal (plain or interpolated)
    Symbol, // symbol literal
    Regexp, // regular expression literal
    Words, // %w[] word list
    Symbols, // %i[] symbol list
    Plus, // +
    Minus, // -
    Star, // *
    Pow, // **
    Slash, // /
    Percent, // %
    Eq, // ==
    Eqq, // ===
    Neq, // !=
    Match, // =~
    NMatch, // !~
    Lt, // <
    Le, // <=
    Gt, // >
    Ge, // >=
    Cmp, // <=>
    AndOp, // &&
    OrOp, // ||
    Bang, // !
    Tilde, // ~
    UPlus, // unary +
    UMinus, // unary -
    UMinusNum, // unary - applied to a numeric literal
    Amper, // & (binary)
    AmperArg, // & block argument prefix
    Pipe, // |
    Caret, // ^
    LShift, // <<
    RShift, // >>
    Dot2, // ..
    Dot3, // ...
    BDot2, // .. without a begin
    BDot3, // ... without a begin
    Colon2, // :: after an expression
    Colon3, // :: at expression start
    Assign, // =
    OpAssign, // += -= ||= and friends
    Question, // ? of the ternary operator
    Colon, // : of the ternary operator
    Assoc, // =>
    Dot, // .
    AndDot, // &.
    Comma, // ,
    Semicolon, // ;
    Newline, // significant newline
    LParen, // ( grouping
    LParenCall, // ( directly after a method name
    RParen, // )
    LBracket, // [ array literal
    LBracketIndex, // [ index
    RBracket, // ]
    Aref, // [] as a method name
    Aset, // []= as a method name
    LBrace, // { hash literal
    LBraceBlock, // { block
    LambdaBeg, // { lambda body
    RBrace, // }
    Lambda, // ->
    StarArg, // * splat prefix
    DStarArg, // ** double splat prefix
};

const char* to_string(TokenKind k);

} // namespace rbparse::lex
