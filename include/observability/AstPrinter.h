/***
 * Name: rbparse::obs::AstPrinter
 * Purpose: Visitor-based AST pretty-printer for diagnostics and --dump-ast.
 * Inputs:
 *   - any ast::Node, usually the RootNode of a parse
 * Outputs:
 *   - one line per node: kind, salient fields and byte range, indented by depth
 * Theory of Operation:
 *   Walks every owned slot in source order. An absent optional child is
 *   printed as `~` so positional slots stay readable; a trailing run of
 *   absent slots is omitted.
 */
#pragma once

#include <sstream>
#include <string>
#include "ast/TreeWalker.h"

namespace rbparse::obs {

// Kind name plus the node's own fields, e.g. `Call name="+"` or `Fixnum 42`.
std::string DescribeNode(const ast::Node& node);

class AstPrinter : public ast::TreeWalker {
 public:
  explicit AstPrinter(bool showRanges = true) : ranges_(showRanges) {}

  std::string print(const ast::Node& root) {
    ss_.str(""); ss_.clear(); depth_ = 0;
    walk(&root);
    return ss_.str();
  }

#define RBPARSE_OBS_PRINT_NODE(Name) \
  void visit(const ast::Name##Node& n) override { enter(n); }
  RBPARSE_AST_NODE_LIST(RBPARSE_OBS_PRINT_NODE)
#undef RBPARSE_OBS_PRINT_NODE

 private:
  void enter(const ast::Node& node);
  void indent() { for (int i = 0; i < depth_; ++i) ss_ << "  "; }
  void line(const std::string& s) { indent(); ss_ << s << "\n"; }
  std::ostringstream ss_{};
  int depth_{0};
  bool ranges_;
};

} // namespace rbparse::obs
