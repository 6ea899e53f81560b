/***
 * Name: rbparse::ast::GeometryVisitor
 * Purpose: Node count and depth, one level per owned slot.
 */
#include "ast/GeometryVisitor.h"

#include <algorithm>

namespace rbparse::ast {

void GeometryVisitor::measure(const Node& node) {
  ++level_;
  ++summary_.nodes;
  summary_.maxDepth = std::max(summary_.maxDepth, level_);
  visitChildren(node);
  --level_;
}

} // namespace rbparse::ast
