/***
 * Name: rbparse::ast::CaseNode
 * Purpose: case/when and case/in expressions.
 * Inputs:
 *   - optional subject (absent for `case` without an expression)
 *   - ListNode of WhenNode or InNode clauses, never empty
 *   - optional else branch, attached through CaseNode::Builder
 * Outputs:
 *   - childNodes(): [subject-or-gap, cases]
 * Theory of Operation:
 *   The reduction that sees `else` runs after the clause list is complete,
 *   so the node is assembled by a Builder and only finish() hands out the
 *   node; a finished CaseNode has no setter. The else branch is the third
 *   owned slot: rewriting passes reach it through slot(2) while childNodes()
 *   reports the subject and the clause list only.
 */
#pragma once

#include <memory>
#include <utility>
#include "ast/Node.h"

namespace rbparse::ast {

    class CaseNode final : public NodeBase<NodeKind::Case> {
        struct BuildKey {
            explicit BuildKey() = default;
        };

      public:
        class Builder {
          public:
            Builder(SourceRange range, NodePtr subject, NodePtr cases);

            Builder& setElse(NodePtr elseNode);
            std::unique_ptr<CaseNode> finish();

          private:
            std::unique_ptr<CaseNode> node_;
        };

        const Node* caseNode() const { return subject_.get(); }
        const Node* cases() const { return cases_.get(); }
        const Node* elseNode() const { return else_.get(); }

        // Only Builder can name BuildKey.
        CaseNode(BuildKey, SourceRange range, NodePtr subject, NodePtr cases);

        RBPARSE_AST_SLOTS(subject_, cases_, else_)
        std::size_t childCount() const override { return 2; }

      private:
        NodePtr subject_;
        NodePtr cases_;
        NodePtr else_;
    };

    // when expressions then body
    struct WhenNode final : NodeBase<NodeKind::When> {
        NodePtr expressions; // ListNode
        NodePtr body;

        WhenNode(const SourceRange r, NodePtr e, NodePtr b) : NodeBase(r), expressions(std::move(e)), body(std::move(b)) {}
        RBPARSE_AST_SLOTS(expressions, body)
    };

    // in pattern [if|unless guard] then body; an unless guard is negated with `!`.
    struct InNode final : NodeBase<NodeKind::In> {
        NodePtr pattern;
        NodePtr guard;
        NodePtr body;

        InNode(const SourceRange r, NodePtr p, NodePtr g, NodePtr b)
            : NodeBase(r), pattern(std::move(p)), guard(std::move(g)), body(std::move(b)) {}
        RBPARSE_AST_SLOTS(pattern, guard, body)
    };

} // namespace rbparse::ast
