/**
 * @file
 * @brief Walker behind ComputeGeometry: counts nodes and tracks the deepest level reached.
 */
#pragma once

#include <cstdint>
#include "ast/GeometrySummary.h"
#include "ast/TreeWalker.h"

namespace rbparse::ast {

class GeometryVisitor final : public TreeWalker {
  public:
    const GeometrySummary& summary() const { return summary_; }

#define RBPARSE_AST_GEOMETRY_VISIT(Name) \
    void visit(const Name##Node& node) override { measure(node); }
    RBPARSE_AST_NODE_LIST(RBPARSE_AST_GEOMETRY_VISIT)
#undef RBPARSE_AST_GEOMETRY_VISIT

  private:
    void measure(const Node& node);

    GeometrySummary summary_{};
    uint64_t level_{0};
};

} // namespace rbparse::ast
