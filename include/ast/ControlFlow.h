/***
 * Name: rbparse::ast control-flow nodes
 * Purpose: Conditionals, loops, jumps, boolean operators, defined? and exception handling.
 * Theory of Operation:
 *   `unless c; a; else b; end` is IfNode(c, b, a) and `a unless c` is
 *   IfNode(c, nullptr, a); modifier forms list the condition slot last.
 *   `begin; a; rescue E => e; b; else c; ensure d; end` is
 *   EnsureNode(RescueNode(a, [RescueBody(E, e = nil, b)], c), d).
 */
#pragma once

#include <cstddef>
#include <utility>
#include "ast/Node.h"

namespace rbparse::ast {

    struct IfNode final : NodeBase<NodeKind::If> {
        NodePtr condition;
        NodePtr thenBody;
        NodePtr elseBody;

        IfNode(const SourceRange r, NodePtr c, NodePtr t, NodePtr e)
            : NodeBase(r), condition(std::move(c)), thenBody(std::move(t)), elseBody(std::move(e)) {}

        // Modifier form (`a if c`): the body comes first in the source, the condition last.
        bool modifier() const {
            const Node* body = thenBody ? thenBody.get() : elseBody.get();
            return condition && body != nullptr && body->range.start < condition->range.start;
        }
        std::size_t slotCount() const override { return 3; }
        const NodePtr* slot(const std::size_t index) const override {
            if (modifier()) { return detail::pickSlot(index, thenBody, elseBody, condition); }
            return detail::pickSlot(index, condition, thenBody, elseBody);
        }
    };

    template <NodeKind K>
    struct LoopNode : NodeBase<K> {
        NodePtr condition;
        NodePtr body;
        bool evaluateBodyFirst{false}; // begin ... end while cond

        LoopNode(const SourceRange r, NodePtr c, NodePtr b, const bool bodyFirst)
            : NodeBase<K>(r), condition(std::move(c)), body(std::move(b)), evaluateBodyFirst(bodyFirst) {}
        // Slots follow the source: `a while c` and `begin ... end while c` list the body first.
        std::size_t slotCount() const override { return 2; }
        const NodePtr* slot(const std::size_t index) const override {
            if (index > 1) { return nullptr; }
            const bool bodyFirst = body && condition && body->range.start < condition->range.start;
            return (index == 0) != bodyFirst ? &condition : &body;
        }
    };

    struct WhileNode final : LoopNode<NodeKind::While> {
        using LoopNode::LoopNode;
    };

    struct UntilNode final : LoopNode<NodeKind::Until> {
        using LoopNode::LoopNode;
    };

    // for var in iter; body; end
    struct ForNode final : NodeBase<NodeKind::For> {
        NodePtr var; // valueless assignment or MultipleAsgn
        NodePtr iter;
        NodePtr body;

        ForNode(const SourceRange r, NodePtr v, NodePtr i, NodePtr b)
            : NodeBase(r), var(std::move(v)), iter(std::move(i)), body(std::move(b)) {}
        RBPARSE_AST_SLOTS(var, iter, body)
    };

    template <NodeKind K>
    struct JumpNode : NodeBase<K> {
        NodePtr value;

        JumpNode(const SourceRange r, NodePtr v) : NodeBase<K>(r), value(std::move(v)) {}
        RBPARSE_AST_SLOTS(value)
    };

    struct BreakNode final : JumpNode<NodeKind::Break> {
        using JumpNode::JumpNode;
    };

    struct NextNode final : JumpNode<NodeKind::Next> {
        using JumpNode::JumpNode;
    };

    struct ReturnNode final : JumpNode<NodeKind::Return> {
        using JumpNode::JumpNode;
    };

    struct RedoNode final : NodeBase<NodeKind::Redo> {
        using NodeBase::NodeBase;
    };

    struct RetryNode final : NodeBase<NodeKind::Retry> {
        using NodeBase::NodeBase;
    };

    template <NodeKind K>
    struct BinaryNode : NodeBase<K> {
        NodePtr first;
        NodePtr second;

        BinaryNode(const SourceRange r, NodePtr f, NodePtr s) : NodeBase<K>(r), first(std::move(f)), second(std::move(s)) {}
        RBPARSE_AST_SLOTS(first, second)
    };

    // && and `and`
    struct AndNode final : BinaryNode<NodeKind::And> {
        using BinaryNode::BinaryNode;
    };

    // || and `or`
    struct OrNode final : BinaryNode<NodeKind::Or> {
        using BinaryNode::BinaryNode;
    };

    struct DefinedNode final : NodeBase<NodeKind::Defined> {
        NodePtr expression;

        DefinedNode(const SourceRange r, NodePtr e) : NodeBase(r), expression(std::move(e)) {}
        RBPARSE_AST_SLOTS(expression)
    };

    struct RescueNode final : NodeBase<NodeKind::Rescue> {
        NodePtr body;
        NodePtr clauses; // ListNode of RescueBodyNode; null when only `else` was given
        NodePtr elseBody;

        RescueNode(const SourceRange r, NodePtr b, NodePtr c, NodePtr e)
            : NodeBase(r), body(std::move(b)), clauses(std::move(c)), elseBody(std::move(e)) {}
        RBPARSE_AST_SLOTS(body, clauses, elseBody)
    };

    // rescue exceptions => target; body
    struct RescueBodyNode final : NodeBase<NodeKind::RescueBody> {
        NodePtr exceptions; // ListNode or null (StandardError)
        NodePtr target; // valueless assignment or null
        NodePtr body;

        RescueBodyNode(const SourceRange r, NodePtr ex, NodePtr t, NodePtr b)
            : NodeBase(r), exceptions(std::move(ex)), target(std::move(t)), body(std::move(b)) {}
        RBPARSE_AST_SLOTS(exceptions, target, body)
    };

    struct EnsureNode final : NodeBase<NodeKind::Ensure> {
        NodePtr body;
        NodePtr ensureBody;

        EnsureNode(const SourceRange r, NodePtr b, NodePtr e) : NodeBase(r), body(std::move(b)), ensureBody(std::move(e)) {}
        RBPARSE_AST_SLOTS(body, ensureBody)
    };

} // namespace rbparse::ast
