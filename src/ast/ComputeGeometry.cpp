/***
 * Name: rbparse::ast::ComputeGeometry
 * Purpose: Size and depth of a tree, for --metrics.
 */
#include "ast/GeometrySummary.h"
#include "ast/GeometryVisitor.h"

namespace rbparse::ast {

GeometrySummary ComputeGeometry(const Node& root) {
  GeometryVisitor visitor;
  visitor.walk(&root);
  return visitor.summary();
}

} // namespace rbparse::ast
