/***
 * Name: RBPARSE_AST_NODE_LIST
 * Purpose: Single list of AST node variants.
 * Theory of Operation:
 *   X(Name) expands once per variant; Name##Node is the concrete struct and
 *   NodeKind::Name its tag. NodeKind, Visitor<R>, the accept() switch and
 *   TreeWalker are all generated from this list, so adding a variant breaks
 *   every visitor until it handles the new node.
 */
#pragma once

// clang-format off
#define RBPARSE_AST_NODE_LIST(X) \
    /* structure */                                                                  \
    X(Root) X(Block) X(List) X(Begin)                                                \
    /* literals */                                                                   \
    X(Nil) X(True) X(False) X(Self) X(RawNumber) X(Fixnum) X(Bignum) X(Float)        \
    X(Rational) X(Complex) X(Str) X(DStr) X(EvStr) X(Symbol) X(DSymbol) X(Regexp)    \
    X(DRegexp) X(Array) X(Hash) X(HashPair) X(Splat) X(DoubleSplat) X(Dot) X(File)   \
    X(Encoding)                                                                      \
    /* variables */                                                                  \
    X(LocalVar) X(InstVar) X(ClassVar) X(GlobalVar) X(NthRef) X(BackRef) X(Const)    \
    X(Colon2) X(Colon3) X(VCall)                                                     \
    /* assignment */                                                                 \
    X(LocalAsgn) X(InstAsgn) X(ClassVarAsgn) X(GlobalAsgn) X(ConstDecl)              \
    X(AttrAssign) X(MultipleAsgn) X(OpAsgn) X(OpAsgnOr) X(OpAsgnAnd) X(OpAsgnAttr)   \
    X(OpElementAsgn)                                                                 \
    /* operators */                                                                  \
    X(And) X(Or) X(Defined)                                                          \
    /* calls */                                                                      \
    X(Call) X(FCall) X(Super) X(ZSuper) X(Yield) X(BlockPass) X(Iter) X(Lambda)      \
    /* parameters */                                                                 \
    X(Args) X(Argument) X(OptArg) X(RestArg) X(KeywordArg) X(KeywordRestArg)         \
    X(BlockArg)                                                                      \
    /* definitions */                                                                \
    X(Defn) X(Defs) X(Class) X(SClass) X(Module) X(Alias) X(Undef)                   \
    /* control flow */                                                               \
    X(If) X(While) X(Until) X(Case) X(When) X(In) X(For) X(Break) X(Next) X(Redo)    \
    X(Retry) X(Return) X(Rescue) X(RescueBody) X(Ensure)                             \
    /* patterns */                                                                   \
    X(ArrayPattern) X(HashPattern) X(PatternCapture) X(Pin)
// clang-format on
