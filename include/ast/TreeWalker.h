/***
 * Name: rbparse::ast::TreeWalker
 * Purpose: Visitor<void> whose hooks default to visiting every owned child slot.
 * Theory of Operation:
 *   Override only the variants of interest and call visitChildren() to keep
 *   descending. Gaps are skipped. Derived classes should add
 *   `using TreeWalker::visit;` so their overrides do not hide the rest.
 */
#pragma once

#include "ast/Visitor.h"

namespace rbparse::ast {

class TreeWalker : public Visitor<void> {
  public:
#define RBPARSE_AST_WALK_DEFAULT(Name) \
    void visit(const Name##Node& node) override { visitChildren(node); }
    RBPARSE_AST_NODE_LIST(RBPARSE_AST_WALK_DEFAULT)
#undef RBPARSE_AST_WALK_DEFAULT

    void walk(const Node* node) {
        if (node != nullptr) { node->accept(*this); }
    }

  protected:
    void visitChildren(const Node& node) {
        for (std::size_t i = 0; i < node.slotCount(); ++i) { walk(node.slot(i)->get()); }
    }
};

} // namespace rbparse::ast
