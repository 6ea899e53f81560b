/***
 * Name: rbparse::ast parameter nodes
 * Purpose: Formal parameter lists of methods, blocks and lambdas.
 * Theory of Operation:
 *   ArgsNode groups parameters by kind in Ruby's fixed order:
 *   required, optional, rest, post-required, keywords, keyword rest, block.
 *   Absent groups are null slots. A destructuring block parameter
 *   `|(a, b)|` is a MultipleAsgnNode without value in the required list.
 */
#pragma once

#include <string>
#include <utility>
#include "ast/Node.h"

namespace rbparse::ast {

    struct ArgsNode final : NodeBase<NodeKind::Args> {
        NodePtr pre; // ListNode
        NodePtr optional; // ListNode of OptArgNode
        NodePtr rest; // RestArgNode
        NodePtr post; // ListNode
        NodePtr keywords; // ListNode of KeywordArgNode
        NodePtr keywordRest; // KeywordRestArgNode
        NodePtr block; // BlockArgNode
        NodePtr locals; // ListNode of ArgumentNode: block-local `|a; b|`

        explicit ArgsNode(const SourceRange r) : NodeBase(r) {}
        RBPARSE_AST_SLOTS(pre, optional, rest, post, keywords, keywordRest, block, locals)
    };

    struct ArgumentNode final : NodeBase<NodeKind::Argument>, HasName {
        ArgumentNode(const SourceRange r, std::string n) : NodeBase(r), HasName{std::move(n)} {}
    };

    struct OptArgNode final : NodeBase<NodeKind::OptArg>, HasName {
        NodePtr value;

        OptArgNode(const SourceRange r, std::string n, NodePtr v) : NodeBase(r), HasName{std::move(n)}, value(std::move(v)) {}
        RBPARSE_AST_SLOTS(value)
    };

    // *name; name is empty for an anonymous rest parameter.
    struct RestArgNode final : NodeBase<NodeKind::RestArg>, HasName {
        RestArgNode(const SourceRange r, std::string n) : NodeBase(r), HasName{std::move(n)} {}
    };

    // name: value; value is null for a required keyword.
    struct KeywordArgNode final : NodeBase<NodeKind::KeywordArg>, HasName {
        NodePtr value;

        KeywordArgNode(const SourceRange r, std::string n, NodePtr v)
            : NodeBase(r), HasName{std::move(n)}, value(std::move(v)) {}
        RBPARSE_AST_SLOTS(value)
    };

    struct KeywordRestArgNode final : NodeBase<NodeKind::KeywordRestArg>, HasName {
        KeywordRestArgNode(const SourceRange r, std::string n) : NodeBase(r), HasName{std::move(n)} {}
    };

    struct BlockArgNode final : NodeBase<NodeKind::BlockArg>, HasName {
        BlockArgNode(const SourceRange r, std::string n) : NodeBase(r), HasName{std::move(n)} {}
    };

} // namespace rbparse::ast
