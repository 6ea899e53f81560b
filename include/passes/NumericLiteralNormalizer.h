/***
 * Name: rbparse::passes::NumericLiteralNormalizer
 * Purpose: Replaces RawNumberNode with the typed numeric nodes.
 * Inputs:
 *   - RawNumberNode (digits, base, float / rational / imaginary flags)
 * Outputs:
 *   - FixnumNode or BignumNode for integers, FloatNode, RationalNode and
 *     ComplexNode for the suffixed forms
 * Theory of Operation:
 *   Bottom-up, so `-@` applied to a literal sees the already typed operand
 *   and folds into a negative literal. `-2 ** 2` is not folded: the
 *   receiver of `-@` there is the power call.
 */
#pragma once

#include "passes/Pass.h"

namespace rbparse::passes {

class NumericLiteralNormalizer final : public Rewriter {
  public:
    const char* name() const override { return "NumericLiteralNormalizer"; }

  protected:
    ast::NodePtr rewrite(ast::NodePtr node) override;

  private:
    ast::NodePtr normalize(const ast::RawNumberNode& raw);
};

} // namespace rbparse::passes
