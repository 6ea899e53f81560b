/***
 * Name: rbparse::passes::LocalVariableResolver
 * Purpose: Scope-aware VCall resolution and local-variable command fixups.
 */
#include "passes/LocalVariableResolver.h"

#include <cctype>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace rbparse::passes {

namespace {

// Binding strength of the binary operator methods, 0 for anything else.
int binaryLevel(const std::string& op) {
  if (op == "**") { return 8; }
  if (op == "*" || op == "/" || op == "%") { return 7; }
  if (op == "+" || op == "-") { return 6; }
  if (op == "<<" || op == ">>") { return 5; }
  if (op == "&") { return 4; }
  if (op == "|" || op == "^") { return 3; }
  if (op == ">" || op == ">=" || op == "<" || op == "<=") { return 2; }
  if (op == "<=>" || op == "==" || op == "===" || op == "!=" || op == "=~" || op == "!~") { return 1; }
  return 0;
}

ast::CallNode* binaryCall(ast::Node* node) {
  auto* call = ast::as<ast::CallNode>(node);
  if (call == nullptr || !call->receiver || call->block || binaryLevel(call->name) == 0) { return nullptr; }
  const auto* args = ast::as<ast::ListNode>(call->args.get());
  return args != nullptr && args->size() == 1 ? call : nullptr;
}

ast::NodePtr* leftmost(ast::NodePtr& expr) {
  ast::NodePtr* at = &expr;
  while (ast::CallNode* call = binaryCall(at->get())) { at = &call->receiver; }
  return at;
}

void widenChain(ast::NodePtr& expr) {
  if (ast::CallNode* call = binaryCall(expr.get())) {
    widenChain(call->receiver);
    call->setRange(SourceRange::cover(call->range, call->receiver->range));
  }
}

ast::NodePtr binary(ast::NodePtr lhs, const std::string& op, ast::NodePtr rhs) {
  const SourceRange range = SourceRange::cover(lhs->range, rhs->range);
  auto args = std::make_unique<ast::ListNode>(rhs->range);
  args->add(std::move(rhs));
  return std::make_unique<ast::CallNode>(range, std::move(lhs), op, std::move(args));
}

// `local op expr`, re-associated so that operators binding looser than op stay on top.
ast::NodePtr combine(ast::NodePtr local, const std::string& op, ast::NodePtr expr) {
  ast::CallNode* call = binaryCall(expr.get());
  if (call != nullptr && binaryLevel(call->name) <= binaryLevel(op)) {
    call->receiver = combine(std::move(local), op, std::move(call->receiver));
    call->setRange(SourceRange::cover(call->range, call->receiver->range));
    return expr;
  }
  return binary(std::move(local), op, std::move(expr));
}

bool isUnaryCall(const ast::Node* node, const char* name) {
  const auto* call = ast::as<ast::CallNode>(node);
  return call != nullptr && call->name == name && call->receiver && !call->args && !call->block;
}

bool isIdentifierStart(const char c) { return c == '_' || std::islower(static_cast<unsigned char>(c)) != 0; }
bool isIdentifierChar(const char c) { return c == '_' || std::isalnum(static_cast<unsigned char>(c)) != 0; }

} // namespace

void LocalVariableResolver::run(ast::RootNode& root) {
  scopes_.clear();
  scopes_.push_back(Scope{{}, false});
  visit(root.body);
  scopes_.clear();
}

void LocalVariableResolver::declare(const std::string& name) {
  if (!name.empty()) { scopes_.back().names.insert(name); }
}

bool LocalVariableResolver::isLocal(const std::string& name) const {
  for (auto it = scopes_.rbegin(); it != scopes_.rend(); ++it) {
    if (it->names.count(name) != 0) { return true; }
    if (!it->inherits) { break; }
  }
  return false;
}

void LocalVariableResolver::visitChildren(ast::Node& node) {
  for (std::size_t i = 0; i < node.slotCount(); ++i) { visit(*node.mutableSlot(i)); }
}

void LocalVariableResolver::visitInScope(ast::Node& node, const bool inherits, const std::size_t firstSlot) {
  scopes_.push_back(Scope{{}, inherits});
  for (std::size_t i = firstSlot; i < node.slotCount(); ++i) { visit(*node.mutableSlot(i)); }
  scopes_.pop_back();
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
void LocalVariableResolver::visit(ast::NodePtr& slot) {
  if (!slot) { return; }
  ast::Node& node = *slot;
  switch (node.kind) {
    case ast::NodeKind::VCall: {
      const auto& vcall = static_cast<const ast::VCallNode&>(node);
      if (isLocal(vcall.name)) {
        slot = std::make_unique<ast::LocalVarNode>(vcall.range, vcall.name);
        ++rewrites_;
      }
      return;
    }
    case ast::NodeKind::LocalAsgn:
      declare(static_cast<const ast::LocalAsgnNode&>(node).name);
      visitChildren(node);
      return;
    case ast::NodeKind::Argument: declare(static_cast<const ast::ArgumentNode&>(node).name); return;
    case ast::NodeKind::RestArg: declare(static_cast<const ast::RestArgNode&>(node).name); return;
    case ast::NodeKind::KeywordRestArg: declare(static_cast<const ast::KeywordRestArgNode&>(node).name); return;
    case ast::NodeKind::BlockArg: declare(static_cast<const ast::BlockArgNode&>(node).name); return;
    case ast::NodeKind::OptArg:
      visitChildren(node);
      declare(static_cast<const ast::OptArgNode&>(node).name);
      return;
    case ast::NodeKind::KeywordArg:
      visitChildren(node);
      declare(static_cast<const ast::KeywordArgNode&>(node).name);
      return;
    case ast::NodeKind::Defn: visitInScope(node, false); return;
    case ast::NodeKind::Defs:
      visit(static_cast<ast::DefsNode&>(node).receiver);
      visitInScope(node, false, 1);
      return;
    case ast::NodeKind::Class: {
      auto& klass = static_cast<ast::ClassNode&>(node);
      visit(klass.cpath);
      visit(klass.superclass);
      visitInScope(node, false, 2);
      return;
    }
    case ast::NodeKind::SClass:
      visit(static_cast<ast::SClassNode&>(node).receiver);
      visitInScope(node, false, 1);
      return;
    case ast::NodeKind::Module:
      visit(static_cast<ast::ModuleNode&>(node).cpath);
      visitInScope(node, false, 1);
      return;
    case ast::NodeKind::Iter:
    case ast::NodeKind::Lambda: visitInScope(node, true); return;
    case ast::NodeKind::Call:
      visitChildren(node);
      declareNamedCaptures(static_cast<const ast::CallNode&>(node));
      return;
    case ast::NodeKind::FCall:
      visitChildren(node);
      fixCommand(slot);
      return;
    default: visitChildren(node); return;
  }
}

void LocalVariableResolver::declareNamedCaptures(const ast::CallNode& call) {
  const auto* regexp = ast::as<ast::RegexpNode>(call.receiver.get());
  if (call.name != "=~" || regexp == nullptr) { return; }
  const std::string_view source = regexp->source;
  for (std::size_t i = 0; i + 3 < source.size(); ++i) {
    if (source[i] == '\\') {
      ++i;
      continue;
    }
    if (source[i] != '(' || source[i + 1] != '?' || (source[i + 2] != '<' && source[i + 2] != '\'')) { continue; }
    const char close = source[i + 2] == '<' ? '>' : '\'';
    std::size_t end = i + 3;
    if (end >= source.size() || !isIdentifierStart(source[end])) { continue; }
    while (end < source.size() && isIdentifierChar(source[end])) { ++end; }
    if (end < source.size() && source[end] == close) { declare(std::string(source.substr(i + 3, end - i - 3))); }
  }
}

// The lexer cannot know that `x` is a variable, so `x -1` arrives as the command x(-1).
// NOLINTNEXTLINE(readability-function-cognitive-complexity)
void LocalVariableResolver::fixCommand(ast::NodePtr& slot) {
  auto& fcall = static_cast<ast::FCallNode&>(*slot);
  if (fcall.hasParens || !isLocal(fcall.name)) { return; }
  auto* args = ast::as<ast::ListNode>(fcall.args.get());
  const SourceRange callRange = fcall.range;
  auto local = std::make_unique<ast::LocalVarNode>(
      SourceRange{callRange.start, static_cast<std::uint32_t>(fcall.name.size())}, fcall.name);

  ast::NodePtr result;
  if (args == nullptr) {
    auto* pass = ast::as<ast::BlockPassNode>(fcall.block.get());
    if (pass == nullptr || !pass->body) { return; }
    result = combine(std::move(local), "&", std::move(pass->body));
  } else {
    if (args->size() != 1 || fcall.block) { return; }
    ast::NodePtr& arg = args->items.front();
    if (auto* splat = ast::as<ast::SplatNode>(arg.get())) {
      if (!splat->value) { return; }
      result = combine(std::move(local), "*", std::move(splat->value));
    } else {
      ast::NodePtr* leaf = leftmost(arg);
      if (isUnaryCall(leaf->get(), "-@") || isUnaryCall(leaf->get(), "+@")) {
        const std::string op = static_cast<ast::CallNode&>(**leaf).name == "-@" ? "-" : "+";
        *leaf = std::move(static_cast<ast::CallNode&>(**leaf).receiver);
        result = combine(std::move(local), op, std::move(arg));
      } else if (auto* array = ast::as<ast::ArrayNode>(leaf->get())) {
        ast::NodePtr index;
        if (!array->empty()) {
          index = std::make_unique<ast::ListNode>(array->items.front()->range);
          for (auto& item : array->items) { static_cast<ast::ListNode*>(index.get())->add(std::move(item)); }
        }
        const SourceRange range = SourceRange::cover(local->range, array->range);
        *leaf = std::make_unique<ast::CallNode>(range, std::move(local), "[]", std::move(index));
        widenChain(arg);
        result = std::move(arg);
      } else {
        return;
      }
    }
  }
  result->setRange(SourceRange::cover(result->range, callRange));
  slot = std::move(result);
  ++rewrites_;
}

} // namespace rbparse::passes
