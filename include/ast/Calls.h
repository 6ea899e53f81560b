/***
 * Name: rbparse::ast call nodes
 * Purpose: Method calls, super/yield, blocks and lambdas.
 * Theory of Operation:
 *   args is a ListNode (null when the call has no argument list); a trailing
 *   keyword hash is a HashNode with braces == false. block holds an IterNode
 *   for a literal block or a BlockPassNode for `&blk`, never both.
 *   Unary and binary operators are calls: `a + b` is CallNode(a, "+", [b]),
 *   `!a` and `not a` are CallNode(a, "!"), `-a` is CallNode(a, "-@").
 */
#pragma once

#include <string>
#include <utility>
#include "ast/Node.h"

namespace rbparse::ast {

    // receiver.name(args) { block }
    struct CallNode final : NodeBase<NodeKind::Call>, HasName {
        NodePtr receiver;
        NodePtr args;
        NodePtr block;
        bool safeNavigation{false}; // &.

        CallNode(const SourceRange r, NodePtr recv, std::string n, NodePtr a, NodePtr b = nullptr)
            : NodeBase(r), HasName{std::move(n)}, receiver(std::move(recv)), args(std::move(a)), block(std::move(b)) {}
        RBPARSE_AST_SLOTS(receiver, args, block)
    };

    // name(args) { block } with an implicit self receiver.
    struct FCallNode final : NodeBase<NodeKind::FCall>, HasName {
        NodePtr args;
        NodePtr block;
        bool hasParens{false}; // `foo(1)` rather than the command form `foo 1`

        FCallNode(const SourceRange r, std::string n, NodePtr a, NodePtr b = nullptr)
            : NodeBase(r), HasName{std::move(n)}, args(std::move(a)), block(std::move(b)) {}
        RBPARSE_AST_SLOTS(args, block)
    };

    struct SuperNode final : NodeBase<NodeKind::Super> {
        NodePtr args;
        NodePtr block;

        SuperNode(const SourceRange r, NodePtr a, NodePtr b) : NodeBase(r), args(std::move(a)), block(std::move(b)) {}
        RBPARSE_AST_SLOTS(args, block)
    };

    // `super` without an argument list: forwards the method's arguments.
    struct ZSuperNode final : NodeBase<NodeKind::ZSuper> {
        NodePtr block;

        ZSuperNode(const SourceRange r, NodePtr b) : NodeBase(r), block(std::move(b)) {}
        RBPARSE_AST_SLOTS(block)
    };

    struct YieldNode final : NodeBase<NodeKind::Yield> {
        NodePtr args;

        YieldNode(const SourceRange r, NodePtr a) : NodeBase(r), args(std::move(a)) {}
        RBPARSE_AST_SLOTS(args)
    };

    // &body as the block argument of a call; body is null for anonymous `&`.
    struct BlockPassNode final : NodeBase<NodeKind::BlockPass> {
        NodePtr body;

        BlockPassNode(const SourceRange r, NodePtr b) : NodeBase(r), body(std::move(b)) {}
        RBPARSE_AST_SLOTS(body)
    };

    // { |params| body } or do |params| body end
    struct IterNode final : NodeBase<NodeKind::Iter> {
        NodePtr params; // ArgsNode or null
        NodePtr body;

        IterNode(const SourceRange r, NodePtr p, NodePtr b) : NodeBase(r), params(std::move(p)), body(std::move(b)) {}
        RBPARSE_AST_SLOTS(params, body)
    };

    // -> (params) { body }
    struct LambdaNode final : NodeBase<NodeKind::Lambda> {
        NodePtr params;
        NodePtr body;

        LambdaNode(const SourceRange r, NodePtr p, NodePtr b) : NodeBase(r), params(std::move(p)), body(std::move(b)) {}
        RBPARSE_AST_SLOTS(params, body)
    };

} // namespace rbparse::ast
