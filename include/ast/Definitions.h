/***
 * Name: rbparse::ast definition nodes
 * Purpose: Method, class, singleton class and module definitions; alias and undef.
 */
#pragma once

#include <string>
#include <utility>
#include "ast/Node.h"

namespace rbparse::ast {

    struct DefnNode final : NodeBase<NodeKind::Defn>, HasName {
        NodePtr args; // ArgsNode
        NodePtr body;

        DefnNode(const SourceRange r, std::string n, NodePtr a, NodePtr b)
            : NodeBase(r), HasName{std::move(n)}, args(std::move(a)), body(std::move(b)) {}
        RBPARSE_AST_SLOTS(args, body)
    };

    // def receiver.name
    struct DefsNode final : NodeBase<NodeKind::Defs>, HasName {
        NodePtr receiver;
        NodePtr args;
        NodePtr body;

        DefsNode(const SourceRange r, NodePtr recv, std::string n, NodePtr a, NodePtr b)
            : NodeBase(r), HasName{std::move(n)}, receiver(std::move(recv)), args(std::move(a)), body(std::move(b)) {}
        RBPARSE_AST_SLOTS(receiver, args, body)
    };

    struct ClassNode final : NodeBase<NodeKind::Class> {
        NodePtr cpath; // Const, Colon2 or Colon3
        NodePtr superclass;
        NodePtr body;

        ClassNode(const SourceRange r, NodePtr p, NodePtr s, NodePtr b)
            : NodeBase(r), cpath(std::move(p)), superclass(std::move(s)), body(std::move(b)) {}
        RBPARSE_AST_SLOTS(cpath, superclass, body)
    };

    // class << receiver
    struct SClassNode final : NodeBase<NodeKind::SClass> {
        NodePtr receiver;
        NodePtr body;

        SClassNode(const SourceRange r, NodePtr recv, NodePtr b) : NodeBase(r), receiver(std::move(recv)), body(std::move(b)) {}
        RBPARSE_AST_SLOTS(receiver, body)
    };

    struct ModuleNode final : NodeBase<NodeKind::Module> {
        NodePtr cpath;
        NodePtr body;

        ModuleNode(const SourceRange r, NodePtr p, NodePtr b) : NodeBase(r), cpath(std::move(p)), body(std::move(b)) {}
        RBPARSE_AST_SLOTS(cpath, body)
    };

    // Method names are Symbol/DSymbol nodes; global aliases use GlobalVar, BackRef and NthRef nodes.
    struct AliasNode final : NodeBase<NodeKind::Alias> {
        NodePtr newName;
        NodePtr oldName;

        AliasNode(const SourceRange r, NodePtr n, NodePtr o) : NodeBase(r), newName(std::move(n)), oldName(std::move(o)) {}
        RBPARSE_AST_SLOTS(newName, oldName)
    };

    // undef a, :b; items are Symbol/DSymbol nodes.
    struct UndefNode final : Sequence<NodeKind::Undef> {
        using Sequence::Sequence;
    };

} // namespace rbparse::ast
