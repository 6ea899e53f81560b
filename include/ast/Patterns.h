/***
 * Name: rbparse::ast pattern nodes
 * Purpose: Structural patterns of `case ... in`.
 * Theory of Operation:
 *   Value patterns reuse expression nodes (literals, ranges, constants);
 *   a bare identifier binds through a valueless LocalAsgnNode, `a | b` is an
 *   OrNode and `^x` a PinNode.
 */
#pragma once

#include <utility>
#include "ast/Node.h"

namespace rbparse::ast {

    // Const(pre..., *rest, post...) or [pre..., *rest, post...]
    struct ArrayPatternNode final : NodeBase<NodeKind::ArrayPattern> {
        NodePtr constant;
        NodePtr pre; // ListNode
        NodePtr rest; // SplatNode; its value is null for an anonymous `*`
        NodePtr post; // ListNode

        ArrayPatternNode(const SourceRange r, NodePtr c, NodePtr p, NodePtr s, NodePtr q)
            : NodeBase(r), constant(std::move(c)), pre(std::move(p)), rest(std::move(s)), post(std::move(q)) {}
        RBPARSE_AST_SLOTS(constant, pre, rest, post)
    };

    // Const(key: pattern, **rest) or {key: pattern, **rest}
    struct HashPatternNode final : NodeBase<NodeKind::HashPattern> {
        NodePtr constant;
        NodePtr pairs; // ListNode of HashPairNode; `key:` alone binds a local named key
        NodePtr rest; // DoubleSplatNode, or NilNode for `**nil`

        HashPatternNode(const SourceRange r, NodePtr c, NodePtr p, NodePtr s)
            : NodeBase(r), constant(std::move(c)), pairs(std::move(p)), rest(std::move(s)) {}
        RBPARSE_AST_SLOTS(constant, pairs, rest)
    };

    // pattern => target
    struct PatternCaptureNode final : NodeBase<NodeKind::PatternCapture> {
        NodePtr pattern;
        NodePtr target; // valueless LocalAsgnNode

        PatternCaptureNode(const SourceRange r, NodePtr p, NodePtr t) : NodeBase(r), pattern(std::move(p)), target(std::move(t)) {}
        RBPARSE_AST_SLOTS(pattern, target)
    };

    // ^expression
    struct PinNode final : NodeBase<NodeKind::Pin> {
        NodePtr expression;

        PinNode(const SourceRange r, NodePtr e) : NodeBase(r), expression(std::move(e)) {}
        RBPARSE_AST_SLOTS(expression)
    };

} // namespace rbparse::ast
