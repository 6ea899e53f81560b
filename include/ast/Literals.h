/***
 * Name: rbparse::ast literal nodes
 * Purpose: Keyword values, numbers, strings, symbols, regexps, collections and ranges.
 * Theory of Operation:
 *   The parser produces RawNumberNode for every numeric literal; the
 *   NumericLiteralNormalizer pass replaces it with the typed variants.
 *   Interpolated literals are sequences of StrNode and EvStrNode parts.
 */
#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include "ast/Node.h"

namespace rbparse::ast {

    struct NilNode final : NodeBase<NodeKind::Nil> {
        using NodeBase::NodeBase;
    };

    struct TrueNode final : NodeBase<NodeKind::True> {
        using NodeBase::NodeBase;
    };

    struct FalseNode final : NodeBase<NodeKind::False> {
        using NodeBase::NodeBase;
    };

    struct SelfNode final : NodeBase<NodeKind::Self> {
        using NodeBase::NodeBase;
    };

    struct RawNumberNode final : NodeBase<NodeKind::RawNumber> {
        std::string digits; // radix prefix and underscores removed
        int base{10};
        bool isFloat{false};
        bool rational{false};
        bool imaginary{false};

        RawNumberNode(const SourceRange r, std::string d, const int b) : NodeBase(r), digits(std::move(d)), base(b) {}
    };

    struct FixnumNode final : NodeBase<NodeKind::Fixnum> {
        std::int64_t value;
        FixnumNode(const SourceRange r, const std::int64_t v) : NodeBase(r), value(v) {}
    };

    // Integer outside the 64-bit range, kept as signed decimal digits.
    struct BignumNode final : NodeBase<NodeKind::Bignum> {
        std::string value;
        BignumNode(const SourceRange r, std::string v) : NodeBase(r), value(std::move(v)) {}
    };

    struct FloatNode final : NodeBase<NodeKind::Float> {
        double value;
        FloatNode(const SourceRange r, const double v) : NodeBase(r), value(v) {}
    };

    // numerator/denominator are Fixnum or Bignum nodes, reduced when both fit 64 bits.
    struct RationalNode final : NodeBase<NodeKind::Rational> {
        NodePtr numerator;
        NodePtr denominator;

        RationalNode(const SourceRange r, NodePtr n, NodePtr d)
            : NodeBase(r), numerator(std::move(n)), denominator(std::move(d)) {}
        RBPARSE_AST_SLOTS(numerator, denominator)
    };

    // Imaginary literal; number is the coefficient of i.
    struct ComplexNode final : NodeBase<NodeKind::Complex> {
        NodePtr number;

        ComplexNode(const SourceRange r, NodePtr n) : NodeBase(r), number(std::move(n)) {}
        RBPARSE_AST_SLOTS(number)
    };

    struct StrNode final : NodeBase<NodeKind::Str> {
        std::string value;
        bool frozen{false}; // frozen_string_literal: true

        StrNode(const SourceRange r, std::string v) : NodeBase(r), value(std::move(v)) {}
    };

    struct DStrNode final : Sequence<NodeKind::DStr> {
        using Sequence::Sequence;
    };

    // #{...} inside an interpolated literal.
    struct EvStrNode final : NodeBase<NodeKind::EvStr> {
        NodePtr body;

        EvStrNode(const SourceRange r, NodePtr b) : NodeBase(r), body(std::move(b)) {}
        RBPARSE_AST_SLOTS(body)
    };

    struct SymbolNode final : NodeBase<NodeKind::Symbol>, HasName {
        SymbolNode(const SourceRange r, std::string n) : NodeBase(r), HasName{std::move(n)} {}
    };

    struct DSymbolNode final : Sequence<NodeKind::DSymbol> {
        using Sequence::Sequence;
    };

    struct RegexpNode final : NodeBase<NodeKind::Regexp> {
        std::string source;
        std::string options;

        RegexpNode(const SourceRange r, std::string s, std::string o)
            : NodeBase(r), source(std::move(s)), options(std::move(o)) {}
    };

    struct DRegexpNode final : Sequence<NodeKind::DRegexp> {
        std::string options;
        using Sequence::Sequence;
    };

    struct ArrayNode final : Sequence<NodeKind::Array> {
        using Sequence::Sequence;
    };

    // Elements are HashPairNode and DoubleSplatNode.
    struct HashNode final : Sequence<NodeKind::Hash> {
        bool braces{true}; // false for trailing keyword arguments of a call
        using Sequence::Sequence;
    };

    // `key => value`; a label key is a SymbolNode.
    struct HashPairNode final : NodeBase<NodeKind::HashPair> {
        NodePtr key;
        NodePtr value;

        HashPairNode(const SourceRange r, NodePtr k, NodePtr v) : NodeBase(r), key(std::move(k)), value(std::move(v)) {}
        RBPARSE_AST_SLOTS(key, value)
    };

    // *value; value is null for an anonymous splat target or forwarded `*`.
    struct SplatNode final : NodeBase<NodeKind::Splat> {
        NodePtr value;

        SplatNode(const SourceRange r, NodePtr v) : NodeBase(r), value(std::move(v)) {}
        RBPARSE_AST_SLOTS(value)
    };

    struct DoubleSplatNode final : NodeBase<NodeKind::DoubleSplat> {
        NodePtr value;

        DoubleSplatNode(const SourceRange r, NodePtr v) : NodeBase(r), value(std::move(v)) {}
        RBPARSE_AST_SLOTS(value)
    };

    // Range literal; either bound may be absent (beginless / endless).
    struct DotNode final : NodeBase<NodeKind::Dot> {
        NodePtr begin;
        NodePtr end;
        bool exclusive{false};

        DotNode(const SourceRange r, NodePtr b, NodePtr e, const bool excl)
            : NodeBase(r), begin(std::move(b)), end(std::move(e)), exclusive(excl) {}
        RBPARSE_AST_SLOTS(begin, end)
    };

    struct FileNode final : NodeBase<NodeKind::File> {
        std::string path;
        FileNode(const SourceRange r, std::string p) : NodeBase(r), path(std::move(p)) {}
    };

    struct EncodingNode final : NodeBase<NodeKind::Encoding>, HasName {
        EncodingNode(const SourceRange r, std::string n) : NodeBase(r), HasName{std::move(n)} {}
    };

} // namespace rbparse::ast
