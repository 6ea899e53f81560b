/***
 * Name: rbparse::ast variable reference nodes
 * Purpose: Reads of locals, instance/class/global variables, constants and regexp match references.
 * Theory of Operation:
 *   A bare identifier is parsed as VCallNode; LocalVariableResolver turns it
 *   into LocalVarNode when an assignment to the name is in scope.
 */
#pragma once

#include <string>
#include <utility>
#include "ast/Node.h"

namespace rbparse::ast {

    template <NodeKind K>
    struct NamedNode : NodeBase<K>, HasName {
        NamedNode(const SourceRange r, std::string n) : NodeBase<K>(r), HasName{std::move(n)} {}
    };

    struct LocalVarNode final : NamedNode<NodeKind::LocalVar> {
        using NamedNode::NamedNode;
    };

    struct InstVarNode final : NamedNode<NodeKind::InstVar> {
        using NamedNode::NamedNode;
    };

    struct ClassVarNode final : NamedNode<NodeKind::ClassVar> {
        using NamedNode::NamedNode;
    };

    struct GlobalVarNode final : NamedNode<NodeKind::GlobalVar> {
        using NamedNode::NamedNode;
    };

    // $1 .. $n
    struct NthRefNode final : NodeBase<NodeKind::NthRef> {
        int number;
        NthRefNode(const SourceRange r, const int n) : NodeBase(r), number(n) {}
    };

    // $& $` $' $+
    struct BackRefNode final : NodeBase<NodeKind::BackRef> {
        char type;
        BackRefNode(const SourceRange r, const char t) : NodeBase(r), type(t) {}
    };

    struct ConstNode final : NamedNode<NodeKind::Const> {
        using NamedNode::NamedNode;
    };

    // scope::Name
    struct Colon2Node final : NodeBase<NodeKind::Colon2>, HasName {
        NodePtr scope;

        Colon2Node(const SourceRange r, NodePtr s, std::string n)
            : NodeBase(r), HasName{std::move(n)}, scope(std::move(s)) {}
        RBPARSE_AST_SLOTS(scope)
    };

    // ::Name
    struct Colon3Node final : NamedNode<NodeKind::Colon3> {
        using NamedNode::NamedNode;
    };

    // Identifier that is either a local variable or a call to self without arguments.
    struct VCallNode final : NamedNode<NodeKind::VCall> {
        using NamedNode::NamedNode;
    };

} // namespace rbparse::ast
