/***
 * Name: rbparse::ast::Visitor
 * Purpose: Double dispatch over the closed node hierarchy.
 * Inputs:
 *   - R: result type of every visit overload
 * Outputs:
 *   - Node::accept<R>(visitor) returns what the matching visit() returns
 * Theory of Operation:
 *   dispatch() switches on the NodeKind tag and calls exactly one overload.
 *   Both the overload set and the switch are generated from
 *   RBPARSE_AST_NODE_LIST, so a new variant is a compile error in every
 *   concrete visitor until it is handled.
 */
#pragma once

#include "ast/Nodes.h"
#include "rbparse/exceptions/ast_error.h"

namespace rbparse::ast {

template <typename R>
class Visitor {
  public:
    virtual ~Visitor() = default;

#define RBPARSE_AST_VISIT_DECL(Name) virtual R visit(const Name##Node& node) = 0;
    RBPARSE_AST_NODE_LIST(RBPARSE_AST_VISIT_DECL)
#undef RBPARSE_AST_VISIT_DECL
};

template <typename R>
R dispatch(const Node& n, Visitor<R>& v) {
    switch (n.kind) {
#define RBPARSE_AST_DISPATCH_CASE(Name) \
        case NodeKind::Name: return v.visit(static_cast<const Name##Node&>(n));
        RBPARSE_AST_NODE_LIST(RBPARSE_AST_DISPATCH_CASE)
#undef RBPARSE_AST_DISPATCH_CASE
    }
    throw exceptions::AstError("node with an unknown kind");
}

template <typename R>
R Node::accept(Visitor<R>& visitor) const {
    return dispatch(*this, visitor);
}

} // namespace rbparse::ast
