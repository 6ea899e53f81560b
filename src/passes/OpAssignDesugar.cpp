/***
 * Name: rbparse::passes::OpAssignDesugar
 * Purpose: Operator assignment lowering.
 */
#include "passes/OpAssignDesugar.h"

#include <memory>
#include <string>
#include <utility>

namespace rbparse::passes {

namespace {

// Read of the variable a valueless assignment target writes; null when it cannot be repeated.
ast::NodePtr readOf(const ast::Node& target) {
  const SourceRange r = target.range;
  switch (target.kind) {
    case ast::NodeKind::LocalAsgn:
      return std::make_unique<ast::LocalVarNode>(r, static_cast<const ast::LocalAsgnNode&>(target).name);
    case ast::NodeKind::InstAsgn:
      return std::make_unique<ast::InstVarNode>(r, static_cast<const ast::InstAsgnNode&>(target).name);
    case ast::NodeKind::ClassVarAsgn:
      return std::make_unique<ast::ClassVarNode>(r, static_cast<const ast::ClassVarAsgnNode&>(target).name);
    case ast::NodeKind::GlobalAsgn:
      return std::make_unique<ast::GlobalVarNode>(r, static_cast<const ast::GlobalAsgnNode&>(target).name);
    case ast::NodeKind::ConstDecl: {
      const auto& decl = static_cast<const ast::ConstDeclNode&>(target);
      if (!decl.path) { return std::make_unique<ast::ConstNode>(r, decl.name); }
      if (decl.path->kind == ast::NodeKind::Colon3) { return std::make_unique<ast::Colon3Node>(r, decl.name); }
      return nullptr;
    }
    default: return nullptr;
  }
}

void assignValue(ast::Node& target, ast::NodePtr value) {
  if (auto* decl = ast::as<ast::ConstDeclNode>(&target)) {
    decl->value = std::move(value);
  } else {
    *target.mutableSlot(0) = std::move(value);
  }
}

} // namespace

ast::NodePtr OpAssignDesugar::rewrite(ast::NodePtr node) {
  auto* op = ast::as<ast::OpAsgnNode>(node.get());
  if (op == nullptr) { return node; }
  ast::NodePtr read = readOf(*op->target);
  if (!read) { return node; }
  const SourceRange range = op->range;
  ast::NodePtr target = std::move(op->target);
  ++rewrites_;
  if (op->op == "||" || op->op == "&&") {
    assignValue(*target, std::move(op->value));
    target->setRange(range);
    if (op->op == "||") { return std::make_unique<ast::OpAsgnOrNode>(range, std::move(read), std::move(target)); }
    return std::make_unique<ast::OpAsgnAndNode>(range, std::move(read), std::move(target));
  }
  const SourceRange valueRange = op->value->range;
  auto args = std::make_unique<ast::ListNode>(valueRange);
  args->add(std::move(op->value));
  assignValue(*target, std::make_unique<ast::CallNode>(range, std::move(read), op->op, std::move(args)));
  target->setRange(range);
  return target;
}

} // namespace rbparse::passes
