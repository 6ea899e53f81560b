/***
 * Name: rbparse::passes::Validator
 * Purpose: Context checks for jumps, constants, parameters and conditions.
 */
#include "passes/Validator.h"

#include <cstddef>
#include <string>
#include <unordered_set>

#include "rbparse/exceptions/validation_error.h"

namespace rbparse::passes {

namespace {

// Collects parameter names, including those bound by a destructuring parameter.
class ParameterNames final : public ast::TreeWalker {
  public:
    using TreeWalker::visit;

    const ast::Node* duplicate{nullptr};

    void visit(const ast::ArgumentNode& node) override { add(node, node.name); }
    void visit(const ast::OptArgNode& node) override { add(node, node.name); }
    void visit(const ast::RestArgNode& node) override { add(node, node.name); }
    void visit(const ast::KeywordArgNode& node) override { add(node, node.name); }
    void visit(const ast::KeywordRestArgNode& node) override { add(node, node.name); }
    void visit(const ast::BlockArgNode& node) override { add(node, node.name); }
    void visit(const ast::LocalAsgnNode& node) override { add(node, node.name); }

  private:
    void add(const ast::Node& node, const std::string& name) {
      if (name.empty() || name.front() == '_' || duplicate != nullptr) { return; }
      if (!seen_.insert(name).second) { duplicate = &node; }
    }

    std::unordered_set<std::string> seen_{};
};

bool isStringLiteral(const ast::Node& node) {
  return node.kind == ast::NodeKind::Str || node.kind == ast::NodeKind::DStr;
}

bool isRegexpLiteral(const ast::Node& node) {
  return node.kind == ast::NodeKind::Regexp || node.kind == ast::NodeKind::DRegexp;
}

bool isLiteral(const ast::Node& node) {
  using enum ast::NodeKind;
  switch (node.kind) {
    case Fixnum:
    case Bignum:
    case Float:
    case Rational:
    case Complex:
    case Symbol:
    case DSymbol:
    case Str:
    case DStr:
    case Regexp:
    case DRegexp:
    case Nil:
    case True:
    case False: return true;
    default: return false;
  }
}

const ast::Node* assignedValue(const ast::Node& node) {
  using enum ast::NodeKind;
  switch (node.kind) {
    case LocalAsgn:
    case InstAsgn:
    case ClassVarAsgn:
    case GlobalAsgn: return node.slot(0)->get();
    default: return nullptr;
  }
}

} // namespace

void Validator::run(ast::RootNode& root) { check(root); }

void Validator::check(const ast::RootNode& root) {
  context_ = Context{};
  walk(root.body.get());
}

void Validator::fail(const ast::Node& node, const std::string& message) const {
  throw exceptions::ValidationError(message, source_.name(), node.range, source_.lineOf(node.range.start),
                                    source_.columnOf(node.range.start));
}

void Validator::warn(const ast::Node& node, const std::string& message) const {
  if (warnings_ == nullptr) { return; }
  warnings_->warn(Warning{message, source_.name(), node.range, source_.lineOf(node.range.start),
                          source_.columnOf(node.range.start)});
}

void Validator::walkIn(const ast::Node& node, const Context context) {
  const Context saved = context_;
  context_ = context;
  visitChildren(node);
  context_ = saved;
}

void Validator::walkLoop(const ast::Node& node) {
  Context inner = context_;
  inner.loop = true;
  walkIn(node, inner);
}

void Validator::visit(const ast::DefnNode& node) { walkIn(node, Context{false, false, false, true}); }

void Validator::visit(const ast::DefsNode& node) {
  walk(node.receiver.get());
  const Context saved = context_;
  context_ = Context{false, false, false, true};
  walk(node.args.get());
  walk(node.body.get());
  context_ = saved;
}

void Validator::visit(const ast::ClassNode& node) {
  walk(node.cpath.get());
  walk(node.superclass.get());
  const Context saved = context_;
  context_ = Context{false, false, true, false};
  walk(node.body.get());
  context_ = saved;
}

void Validator::visit(const ast::SClassNode& node) {
  walk(node.receiver.get());
  const Context saved = context_;
  context_ = Context{false, false, true, false};
  walk(node.body.get());
  context_ = saved;
}

void Validator::visit(const ast::ModuleNode& node) {
  walk(node.cpath.get());
  const Context saved = context_;
  context_ = Context{false, false, true, false};
  walk(node.body.get());
  context_ = saved;
}

void Validator::visit(const ast::IterNode& node) {
  Context inner = context_;
  inner.loop = true;
  inner.classBody = false;
  walkIn(node, inner);
}

void Validator::visit(const ast::LambdaNode& node) {
  Context inner = context_;
  inner.loop = true;
  inner.classBody = false;
  walkIn(node, inner);
}

void Validator::visit(const ast::WhileNode& node) {
  checkCondition(node.condition.get());
  walkLoop(node);
}

void Validator::visit(const ast::UntilNode& node) {
  checkCondition(node.condition.get());
  walkLoop(node);
}

void Validator::visit(const ast::ForNode& node) { walkLoop(node); }

void Validator::visit(const ast::IfNode& node) {
  checkCondition(node.condition.get());
  visitChildren(node);
}

void Validator::visit(const ast::CaseNode& node) {
  if (const ast::Node* cases = node.cases()) {
    bool sawWhen = false;
    bool sawIn = false;
    for (std::size_t i = 0; i < cases->slotCount(); ++i) {
      const ast::Node* clause = cases->slot(i)->get();
      if (clause == nullptr) { continue; }
      sawWhen = sawWhen || clause->kind == ast::NodeKind::When;
      sawIn = sawIn || clause->kind == ast::NodeKind::In;
      if (sawWhen && sawIn) { fail(*clause, "case cannot mix `when' and `in' clauses"); }
    }
  }
  visitChildren(node);
}

void Validator::visit(const ast::RescueNode& node) {
  if (!node.clauses && node.elseBody) { fail(*node.elseBody, "else without rescue is useless"); }
  visitChildren(node);
}

void Validator::visit(const ast::RescueBodyNode& node) {
  walk(node.exceptions.get());
  walk(node.target.get());
  Context inner = context_;
  inner.rescue = true;
  const Context saved = context_;
  context_ = inner;
  walk(node.body.get());
  context_ = saved;
}

void Validator::visit(const ast::BreakNode& node) {
  if (!context_.loop) { fail(node, "Invalid break"); }
  visitChildren(node);
}

void Validator::visit(const ast::NextNode& node) {
  if (!context_.loop) { fail(node, "Invalid next"); }
  visitChildren(node);
}

void Validator::visit(const ast::RedoNode& node) {
  if (!context_.loop) { fail(node, "Invalid redo"); }
}

void Validator::visit(const ast::RetryNode& node) {
  if (!context_.rescue) { fail(node, "Invalid retry"); }
}

void Validator::visit(const ast::ReturnNode& node) {
  if (context_.classBody) { fail(node, "Invalid return in class/module body"); }
  visitChildren(node);
}

void Validator::visit(const ast::ConstDeclNode& node) {
  if (context_.method) { fail(node, "dynamic constant assignment"); }
  visitChildren(node);
}

void Validator::visit(const ast::ArgsNode& node) {
  ParameterNames names;
  names.walk(&node);
  if (names.duplicate != nullptr) { fail(*names.duplicate, "duplicated argument name"); }
  visitChildren(node);
}

void Validator::checkCondition(const ast::Node* condition) {
  if (condition == nullptr) { return; }
  if (isStringLiteral(*condition)) {
    warn(*condition, "string literal in condition");
  } else if (isRegexpLiteral(*condition)) {
    warn(*condition, "regex literal in condition");
  } else if (isLiteral(*condition)) {
    warn(*condition, "literal in condition");
  } else if (const ast::Node* value = assignedValue(*condition); value != nullptr && isLiteral(*value)) {
    warn(*condition, "found `= literal' in conditional, should be ==");
  }
}

} // namespace rbparse::passes
