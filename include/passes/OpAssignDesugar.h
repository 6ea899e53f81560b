/***
 * Name: rbparse::passes::OpAssignDesugar
 * Purpose: Lowers `target op= value` on variables and constants.
 * Theory of Operation:
 *   `a += 1`  becomes LocalAsgn(a, Call(LocalVar a, "+", [1]))
 *   `a ||= 1` becomes OpAsgnOr(LocalVar a, LocalAsgn(a, 1))
 *   `a &&= 1` becomes OpAsgnAnd(LocalVar a, LocalAsgn(a, 1))
 *   The same holds for instance, class and global variables, `Name` and
 *   `::Name`. `Scope::Name op= v` keeps its OpAsgnNode: reading the
 *   constant would evaluate the scope expression twice.
 */
#pragma once

#include "passes/Pass.h"

namespace rbparse::passes {

class OpAssignDesugar final : public Rewriter {
  public:
    const char* name() const override { return "OpAssignDesugar"; }

  protected:
    ast::NodePtr rewrite(ast::NodePtr node) override;
};

} // namespace rbparse::passes
