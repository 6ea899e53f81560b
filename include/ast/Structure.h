/***
 * Name: rbparse::ast structural nodes
 * Purpose: Program root, statement blocks, generic lists and begin/end groups.
 */
#pragma once

#include <optional>
#include <string>
#include <utility>
#include "ast/Node.h"

namespace rbparse::ast {

    // Holds the single top-level node (a Block for multi-statement programs).
    struct RootNode final : NodeBase<NodeKind::Root> {
        NodePtr body;
        std::string file;
        std::string encoding;
        std::optional<bool> frozenStringLiteral;

        RootNode(const SourceRange r, NodePtr b, std::string f, std::string enc)
            : NodeBase(r), body(std::move(b)), file(std::move(f)), encoding(std::move(enc)) {}
        RBPARSE_AST_SLOTS(body)
    };

    // Two or more statements evaluated in order.
    struct BlockNode final : Sequence<NodeKind::Block> {
        using Sequence::Sequence;
    };

    // Comma-separated elements: call arguments, when-values, case clauses, multiple-assignment targets.
    struct ListNode final : Sequence<NodeKind::List> {
        using Sequence::Sequence;
    };

    // begin ... end, or a parenthesized statement sequence.
    struct BeginNode final : NodeBase<NodeKind::Begin> {
        NodePtr body;

        BeginNode(const SourceRange r, NodePtr b) : NodeBase(r), body(std::move(b)) {}
        RBPARSE_AST_SLOTS(body)
    };

} // namespace rbparse::ast
