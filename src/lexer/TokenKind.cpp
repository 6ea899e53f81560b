/**
 * Name: rbparse::lex::TokenKind helpers
 * Purpose: Implementation for TokenKind utilities.
 */
#include "lexer/TokenKind.h"

namespace rbparse::lex {
    const char *to_string(const TokenKind k) {
        using enum rbparse::lex::TokenKind;
        switch (k) {
            case EndOfInput: return "EndOfInput";
            case EntryProgram: return "EntryProgram";
            case EntryExpression: return "EntryExpression";
            case KwClass: return "KwClass";
            case KwModule: return "KwModule";
            case KwDef: return "KwDef";
            case KwUndef: return "KwUndef";
            case KwBegin: return "KwBegin";
            case KwRescue: return "KwRescue";
            case KwEnsure: return "KwEnsure";
            case KwEnd: return "KwEnd";
            case KwIf: return "KwIf";
            case KwUnless: return "KwUnless";
            case KwThen: return "KwThen";
            case KwElsif: return "KwElsif";
            case KwElse: return "KwElse";
            case KwCase: return "KwCase";
            case KwWhen: return "KwWhen";
            case KwIn: return "KwIn";
            case KwWhile: return "KwWhile";
            case KwUntil: return "KwUntil";
            case KwFor: return "KwFor";
            case KwBreak: return "KwBreak";
            case KwNext: return "KwNext";
            case KwRedo: return "KwRedo";
            case KwRetry: return "KwRetry";
            case KwDo: return "KwDo";
            case KwDoCond: return "KwDoCond";
            case KwDoBlock: return "KwDoBlock";
            case KwDoLambda: return "KwDoLambda";
            case KwReturn: return "KwReturn";
            case KwYield: return "KwYield";
            case KwSuper: return "KwSuper";
            case KwSelf: return "KwSelf";
            case KwNil: return "KwNil";
            case KwTrue: return "KwTrue";
            case KwFalse: return "KwFalse";
            case KwAnd: return "KwAnd";
            case KwOr: return "KwOr";
            case KwNot: return "KwNot";
            case KwIfMod: return "KwIfMod";
            case KwUnlessMod: return "KwUnlessMod";
            case KwWhileMod: return "KwWhileMod";
            case KwUntilMod: return "KwUntilMod";
            case KwRescueMod: return "KwRescueMod";
            case KwAlias: return "KwAlias";
            case KwDefined: return "KwDefined";
            case KwFile: return "KwFile";
            case KwLine: return "KwLine";
            case KwEncoding: return "KwEncoding";
            case Identifier: return "Identifier";
            case FunctionId: return "FunctionId";
            case Constant: return "Constant";
            case InstanceVar: return "InstanceVar";
            case ClassVar: return "ClassVar";
            case GlobalVar: return "GlobalVar";
            case NthRef: return "NthRef";
            case BackRef: return "BackRef";
            case Label: return "Label";
            case Integer: return "Integer";
            case Float: return "Float";
            case String: return "String";
            case Symbol: return "Symbol";
            case Regexp: return "Regexp";
            case Words: return "Words";
            case Symbols: return "Symbols";
            case Plus: return "Plus";
            case Minus: return "Minus";
            case Star: return "Star";
            case Pow: return "Pow";
            case Slash: return "Slash";
            case Percent: return "Percent";
            case Eq: return "Eq";
            case Eqq: return "Eqq";
            case Neq: return "Neq";
            case Match: return "Match";
            case NMatch: return "NMatch";
            case Lt: return "Lt";
            case Le: return "Le";
            case Gt: return "Gt";
            case Ge: return "Ge";
            case Cmp: return "Cmp";
            case AndOp: return "AndOp";
            case OrOp: return "OrOp";
            case Bang: return "Bang";
            case Tilde: return "Tilde";
            case UPlus: return "UPlus";
            case UMinus: return "UMinus";
            case UMinusNum: return "UMinusNum";
            case Amper: return "Amper";
            case AmperArg: return "AmperArg";
            case Pipe: return "Pipe";
            case Caret: return "Caret";
            case LShift: return "LShift";
            case RShift: return "RShift";
            case Dot2: return "Dot2";
            case Dot3: return "Dot3";
            case BDot2: return "BDot2";
            case BDot3: return "BDot3";
            case Colon2: return "Colon2";
            case Colon3: return "Colon3";
            case Assign: return "Assign";
            case OpAssign: return "OpAssign";
            case Question: return "Question";
            case Colon: return "Colon";
            case Assoc: return "Assoc";
            case Dot: return "Dot";
            case AndDot: return "AndDot";
            case Comma: return "Comma";
            case Semicolon: return "Semicolon";
            case Newline: return "Newline";
            case LParen: return "LParen";
            case LParenCall: return "LParenCall";
            case RParen: return "RParen";
            case LBracket: return "LBracket";
            case LBracketIndex: return "LBracketIndex";
            case RBracket: return "RBracket";
            case Aref: return "Aref";
            case Aset: return "Aset";
            case LBrace: return "LBrace";
            case LBraceBlock: return "LBraceBlock";
            case LambdaBeg: return "LambdaBeg";
            case RBrace: return "RBrace";
            case Lambda: return "Lambda";
            case StarArg: return "StarArg";
            case DStarArg: return "DStarArg";
        }
        return "Unknown";
    }
} // namespace rbparse::lex
