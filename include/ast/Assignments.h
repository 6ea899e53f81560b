/***
 * Name: rbparse::ast assignment nodes
 * Purpose: Variable, constant, attribute and multiple assignment, plus operator-assignment forms.
 * Theory of Operation:
 *   An assignment node with a null value is an assignment target: the left
 *   side of a multiple assignment, a block parameter destructuring, a rescue
 *   `=> var`, a for-loop variable or a pattern binding.
 *   The parser emits OpAsgnNode for `var op= value`; OpAssignDesugar rewrites
 *   it to a plain assignment, OpAsgnOrNode or OpAsgnAndNode.
 */
#pragma once

#include <string>
#include <utility>
#include "ast/Node.h"

namespace rbparse::ast {

    template <NodeKind K>
    struct AssignmentNode : NodeBase<K>, HasName {
        NodePtr value;

        AssignmentNode(const SourceRange r, std::string n, NodePtr v)
            : NodeBase<K>(r), HasName{std::move(n)}, value(std::move(v)) {}
        RBPARSE_AST_SLOTS(value)
    };

    struct LocalAsgnNode final : AssignmentNode<NodeKind::LocalAsgn> {
        using AssignmentNode::AssignmentNode;
    };

    struct InstAsgnNode final : AssignmentNode<NodeKind::InstAsgn> {
        using AssignmentNode::AssignmentNode;
    };

    struct ClassVarAsgnNode final : AssignmentNode<NodeKind::ClassVarAsgn> {
        using AssignmentNode::AssignmentNode;
    };

    struct GlobalAsgnNode final : AssignmentNode<NodeKind::GlobalAsgn> {
        using AssignmentNode::AssignmentNode;
    };

    // path is null for a plain `Name = v`, otherwise the Colon2/Colon3 being assigned.
    struct ConstDeclNode final : NodeBase<NodeKind::ConstDecl>, HasName {
        NodePtr path;
        NodePtr value;

        ConstDeclNode(const SourceRange r, std::string n, NodePtr p, NodePtr v)
            : NodeBase(r), HasName{std::move(n)}, path(std::move(p)), value(std::move(v)) {}
        RBPARSE_AST_SLOTS(path, value)
    };

    // recv.name = v and recv[args] = v; the assigned value is the last element of args.
    struct AttrAssignNode final : NodeBase<NodeKind::AttrAssign>, HasName {
        NodePtr receiver;
        NodePtr args; // ListNode
        bool safeNavigation{false};

        AttrAssignNode(const SourceRange r, NodePtr recv, std::string n, NodePtr a)
            : NodeBase(r), HasName{std::move(n)}, receiver(std::move(recv)), args(std::move(a)) {}
        RBPARSE_AST_SLOTS(receiver, args)
    };

    // pre, *rest, post = value
    struct MultipleAsgnNode final : NodeBase<NodeKind::MultipleAsgn> {
        NodePtr pre; // ListNode of targets
        NodePtr rest; // SplatNode; its value is null for a bare `*`
        NodePtr post; // ListNode of targets
        NodePtr value;

        MultipleAsgnNode(const SourceRange r, NodePtr p, NodePtr s, NodePtr q)
            : NodeBase(r), pre(std::move(p)), rest(std::move(s)), post(std::move(q)) {}
        RBPARSE_AST_SLOTS(pre, rest, post, value)
    };

    // target op= value, before desugaring; target is a valueless assignment node.
    struct OpAsgnNode final : NodeBase<NodeKind::OpAsgn> {
        NodePtr target;
        std::string op; // "+", "||", "<<", ...
        NodePtr value;

        OpAsgnNode(const SourceRange r, NodePtr t, std::string o, NodePtr v)
            : NodeBase(r), target(std::move(t)), op(std::move(o)), value(std::move(v)) {}
        RBPARSE_AST_SLOTS(target, value)
    };

    // first || second, where second assigns
    struct OpAsgnOrNode final : NodeBase<NodeKind::OpAsgnOr> {
        NodePtr first;
        NodePtr second;

        OpAsgnOrNode(const SourceRange r, NodePtr f, NodePtr s) : NodeBase(r), first(std::move(f)), second(std::move(s)) {}
        RBPARSE_AST_SLOTS(first, second)
    };

    struct OpAsgnAndNode final : NodeBase<NodeKind::OpAsgnAnd> {
        NodePtr first;
        NodePtr second;

        OpAsgnAndNode(const SourceRange r, NodePtr f, NodePtr s)
            : NodeBase(r), first(std::move(f)), second(std::move(s)) {}
        RBPARSE_AST_SLOTS(first, second)
    };

    // recv.name op= value
    struct OpAsgnAttrNode final : NodeBase<NodeKind::OpAsgnAttr>, HasName {
        NodePtr receiver;
        std::string op;
        NodePtr value;
        bool safeNavigation{false};

        OpAsgnAttrNode(const SourceRange r, NodePtr recv, std::string n, std::string o, NodePtr v)
            : NodeBase(r), HasName{std::move(n)}, receiver(std::move(recv)), op(std::move(o)), value(std::move(v)) {}
        RBPARSE_AST_SLOTS(receiver, value)
    };

    // recv[args] op= value
    struct OpElementAsgnNode final : NodeBase<NodeKind::OpElementAsgn> {
        NodePtr receiver;
        NodePtr args; // ListNode or null
        std::string op;
        NodePtr value;

        OpElementAsgnNode(const SourceRange r, NodePtr recv, NodePtr a, std::string o, NodePtr v)
            : NodeBase(r), receiver(std::move(recv)), args(std::move(a)), op(std::move(o)), value(std::move(v)) {}
        RBPARSE_AST_SLOTS(receiver, args, value)
    };

} // namespace rbparse::ast
