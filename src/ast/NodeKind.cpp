/***
 * Name: rbparse::ast::to_string(NodeKind)
 * Purpose: Variant names for printers and diagnostics.
 */
#include "ast/NodeKind.h"

namespace rbparse::ast {

const char* to_string(const NodeKind kind) {
  switch (kind) {
#define RBPARSE_AST_KIND_NAME(Name) \
    case NodeKind::Name: return #Name;
    RBPARSE_AST_NODE_LIST(RBPARSE_AST_KIND_NAME)
#undef RBPARSE_AST_KIND_NAME
  }
  return "unknown";
}

} // namespace rbparse::ast
