/***
 * Name: rbparse::parse::Reducer
 * Purpose: Builds AST nodes for the reductions of grammar/ruby.grammar.
 * Theory of Operation:
 *   rhs positions follow the rule layouts of the grammar file. Optional
 *   symbols that reduced to nothing leave an empty Value, so actions shared
 *   by several rules scan the right-hand side instead of indexing it where
 *   the layouts differ.
 */
#include "parser/Reducer.h"

#include <memory>
#include <string>
#include <utility>

#include "ast/Nodes.h"
#include "parser/RubyGrammar.h"
#include "rbparse/exceptions/grammar_error.h"

namespace rbparse::parse {

namespace {

using lex::TokenKind;

const lex::Token& tok(const std::span<Value> rhs, const std::size_t index) {
  const lex::Token* token = index < rhs.size() ? rhs[index].token() : nullptr;
  if (token == nullptr) {
    throw exceptions::GrammarError("reduction expected a token at position " + std::to_string(index));
  }
  return *token;
}

ast::NodePtr take(const std::span<Value> rhs, const std::size_t index) {
  return index < rhs.size() ? rhs[index].takeNode() : nullptr;
}

ast::NodePtr takeLast(const std::span<Value> rhs) {
  for (std::size_t i = rhs.size(); i > 0; --i) {
    if (rhs[i - 1].node() != nullptr) { return rhs[i - 1].takeNode(); }
  }
  return nullptr;
}

SourceRange coverOf(const std::span<Value> rhs, const std::size_t first, const std::size_t last) {
  SourceRange range{};
  for (std::size_t i = first; i <= last && i < rhs.size(); ++i) {
    if (!rhs[i].range.empty()) { range = SourceRange::cover(range, rhs[i].range); }
  }
  return range;
}

ast::SequenceNode* sequenceOf(ast::Node* node) {
  if (node == nullptr) { return nullptr; }
  switch (node->kind) {
    case ast::NodeKind::List:
    case ast::NodeKind::Hash:
    case ast::NodeKind::Undef:
    case ast::NodeKind::Array:
    case ast::NodeKind::Block: return static_cast<ast::SequenceNode*>(node);
    default: return nullptr;
  }
}

ast::NodePtr listOf(ast::NodePtr item, const SourceRange fallback) {
  auto list = std::make_unique<ast::ListNode>(item ? item->range : fallback);
  if (item) { list->add(std::move(item)); }
  return list;
}

ast::NodePtr localTarget(const lex::Token& token) {
  return std::make_unique<ast::LocalAsgnNode>(token.range, NodeFactory::nameOf(token), nullptr);
}

// Stores the right-hand side into a valueless assignment target.
void setAssignedValue(const NodeFactory& factory, ast::Node& target, ast::NodePtr value) {
  if (ast::as<ast::ListNode>(value.get()) != nullptr) {
    const SourceRange range = value->range;
    value = factory.arrayFrom(std::move(value), range);
  }
  switch (target.kind) {
    case ast::NodeKind::LocalAsgn:
    case ast::NodeKind::InstAsgn:
    case ast::NodeKind::ClassVarAsgn:
    case ast::NodeKind::GlobalAsgn: *target.mutableSlot(0) = std::move(value); return;
    case ast::NodeKind::ConstDecl: static_cast<ast::ConstDeclNode&>(target).value = std::move(value); return;
    case ast::NodeKind::MultipleAsgn: static_cast<ast::MultipleAsgnNode&>(target).value = std::move(value); return;
    case ast::NodeKind::AttrAssign: {
      auto& attr = static_cast<ast::AttrAssignNode&>(target);
      if (!attr.args) { attr.args = std::make_unique<ast::ListNode>(value->range); }
      static_cast<ast::ListNode*>(attr.args.get())->add(std::move(value));
      return;
    }
    default: break;
  }
  factory.fail(std::string("cannot assign to ") + ast::to_string(target.kind), target.range);
}

struct SplitList {
  ast::NodePtr pre;
  ast::NodePtr rest;
  ast::NodePtr post;
};

// Splits a target list at its SplatNode into the pre / rest / post groups.
SplitList splitAtSplat(const NodeFactory& factory, ast::NodePtr items, const char* secondSplat) {
  SplitList out;
  auto* list = ast::as<ast::ListNode>(items.get());
  if (list == nullptr) { return out; }
  for (auto& item : list->items) {
    if (ast::as<ast::SplatNode>(item.get()) != nullptr) {
      if (out.rest) { factory.fail(secondSplat, item->range); }
      out.rest = std::move(item);
      continue;
    }
    ast::NodePtr& group = out.rest ? out.post : out.pre;
    if (!group) { group = std::make_unique<ast::ListNode>(item->range); }
    static_cast<ast::ListNode*>(group.get())->add(std::move(item));
  }
  return out;
}

template <typename Loop>
ast::NodePtr modifierLoop(const std::span<Value> rhs, const SourceRange range) {
  ast::NodePtr body = take(rhs, 0);
  const bool bodyFirst = ast::as<ast::BeginNode>(body.get()) != nullptr;
  return std::make_unique<Loop>(range, take(rhs, 2), std::move(body), bodyFirst);
}

template <typename Jump>
ast::NodePtr jump(const NodeFactory& factory, const std::span<Value> rhs, const SourceRange range) {
  return std::make_unique<Jump>(range, rhs.size() > 1 ? factory.jumpValue(take(rhs, 1)) : nullptr);
}

const char* unaryName(const TokenKind kind) {
  switch (kind) {
    case TokenKind::UPlus: return "+@";
    case TokenKind::UMinus:
    case TokenKind::UMinusNum: return "-@";
    default: return "~";
  }
}

} // namespace

std::string Reducer::paramName(const lex::Token& token) const {
  switch (token.kind) {
    case TokenKind::Constant: factory_.fail("formal argument cannot be a constant", token);
    case TokenKind::InstanceVar: factory_.fail("formal argument cannot be an instance variable", token);
    case TokenKind::GlobalVar: factory_.fail("formal argument cannot be a global variable", token);
    case TokenKind::ClassVar: factory_.fail("formal argument cannot be a class variable", token);
    default: return NodeFactory::nameOf(token);
  }
}

ast::NodePtr Reducer::bodyStatement(const std::span<Value> rhs, const SourceRange range) const {
  ast::NodePtr body = take(rhs, 0);
  ast::NodePtr clauses = take(rhs, 1);
  ast::NodePtr elseBody = take(rhs, 2);
  ast::NodePtr ensure = take(rhs, 3);
  if (clauses || elseBody) {
    SourceRange rescueRange = coverOf(rhs, 0, 2);
    if (rescueRange.empty()) { rescueRange = range; }
    body = std::make_unique<ast::RescueNode>(rescueRange, std::move(body), std::move(clauses), std::move(elseBody));
  }
  if (ensure) { body = std::make_unique<ast::EnsureNode>(range, std::move(body), std::move(ensure)); }
  return body;
}

// recv op name args block, where the name, the arguments and the block are optional.
ast::NodePtr Reducer::callMethod(const std::span<Value> rhs, const SourceRange range) const {
  ast::NodePtr receiver = take(rhs, 0);
  const bool safe = tok(rhs, 1).kind == TokenKind::AndDot;
  std::string name = "call";
  std::size_t next = 2;
  if (const lex::Token* token = rhs[2].token()) {
    name = NodeFactory::nameOf(*token);
    ++next;
  }
  ast::NodePtr args;
  ast::NodePtr iter;
  for (; next < rhs.size(); ++next) {
    ast::NodePtr node = take(rhs, next);
    if (ast::as<ast::IterNode>(node.get()) != nullptr) {
      iter = std::move(node);
    } else if (node) {
      args = std::move(node);
    }
  }
  ast::NodePtr call = factory_.call(range, std::move(receiver), std::move(name), std::move(args), safe);
  return iter ? factory_.attachBlock(std::move(call), std::move(iter)) : std::move(call);
}

// mlhs_head, *target, mlhs_post in any of the layouts of mlhs_basic.
ast::NodePtr Reducer::multipleTargets(const std::span<Value> rhs, const SourceRange range) const {
  ast::NodePtr pre;
  ast::NodePtr restTarget;
  ast::NodePtr post;
  const lex::Token* star = nullptr;
  bool afterComma = false;
  for (std::size_t i = 0; i < rhs.size(); ++i) {
    if (const lex::Token* token = rhs[i].token()) {
      if (token->kind == TokenKind::StarArg) { star = token; }
      if (token->kind == TokenKind::Comma && star != nullptr) { afterComma = true; }
      continue;
    }
    ast::NodePtr node = take(rhs, i);
    if (!node) { continue; }
    if (star == nullptr) {
      // mlhs_head is already a list; a single item after it is appended.
      if (!pre) {
        pre = ast::as<ast::ListNode>(node.get()) != nullptr ? std::move(node) : listOf(std::move(node), range);
      } else {
        static_cast<ast::ListNode*>(pre.get())->add(std::move(node));
      }
    } else if (!afterComma) {
      restTarget = std::move(node);
    } else {
      post = std::move(node);
    }
  }
  ast::NodePtr rest;
  if (star != nullptr) {
    const SourceRange splatRange = restTarget ? SourceRange::cover(star->range, restTarget->range) : star->range;
    rest = std::make_unique<ast::SplatNode>(splatRange, std::move(restTarget));
  }
  return std::make_unique<ast::MultipleAsgnNode>(range, std::move(pre), std::move(rest), std::move(post));
}

ast::NodePtr Reducer::arrayPattern(const SourceRange range, ast::NodePtr constant, ast::NodePtr items) const {
  SplitList split = splitAtSplat(factory_, std::move(items), "find pattern is not supported");
  return std::make_unique<ast::ArrayPatternNode>(range, std::move(constant), std::move(split.pre),
                                                 std::move(split.rest), std::move(split.post));
}

// NOLINTNEXTLINE(readability-function-size,readability-function-cognitive-complexity)
ast::NodePtr Reducer::reduce(const RuleInfo& rule, const std::span<Value> rhs, const SourceRange range) {
  using A = grammar::ActionId;
  const std::size_t n = rhs.size();
  switch (static_cast<A>(rule.action)) {
    // ---- program and statements
    case A::Program: {
      ast::NodePtr body = take(rhs, 0);
      const SourceRange rootRange = body ? body->range : SourceRange{};
      return std::make_unique<ast::RootNode>(rootRange, std::move(body), factory_.source().name(),
                                             factory_.encoding());
    }
    case A::BodyStmt: return bodyStatement(rhs, range);
    case A::ClauseBody: {
      ast::NodePtr body = take(rhs, 1);
      return body ? std::move(body) : std::make_unique<ast::NilNode>(tok(rhs, 0).range);
    }
    case A::RescueClause: {
      const SourceRange clauseRange = coverOf(rhs, 0, 4);
      auto list = std::make_unique<ast::ListNode>(clauseRange);
      list->add(std::make_unique<ast::RescueBodyNode>(clauseRange, take(rhs, 1), take(rhs, 2), take(rhs, 4)));
      if (auto* rest = ast::as<ast::ListNode>(rhs[5].node())) {
        for (auto& clause : rest->items) { list->add(std::move(clause)); }
      }
      return list;
    }
    case A::BlockAppend: {
      ast::NodePtr head = take(rhs, 0);
      ast::NodePtr stmt = take(rhs, 2);
      if (!stmt) { return head; }
      if (!head) { return stmt; }
      if (auto* block = ast::as<ast::BlockNode>(head.get())) {
        block->add(std::move(stmt));
        return head;
      }
      auto block = std::make_unique<ast::BlockNode>(head->range);
      block->add(std::move(head));
      block->add(std::move(stmt));
      return block;
    }
    case A::ListOf: return listOf(takeLast(rhs), range);
    case A::ListAppend: {
      ast::NodePtr list = take(rhs, 0);
      ast::NodePtr item = takeLast(rhs);
      ast::SequenceNode* seq = sequenceOf(list.get());
      if (seq == nullptr) { throw exceptions::GrammarError(std::string("ListAppend onto a non-list in ") + rule.text); }
      seq->add(std::move(item));
      return list;
    }
    case A::Enclose: {
      ast::NodePtr node = takeLast(rhs);
      if (!node) { throw exceptions::GrammarError(std::string("nothing to enclose in ") + rule.text); }
      node->setRange(SourceRange::cover(node->range, range));
      return node;
    }

    // ---- alias, modifiers
    case A::Alias: return std::make_unique<ast::AliasNode>(range, take(rhs, 1), take(rhs, 2));
    case A::AliasGlobal:
      return std::make_unique<ast::AliasNode>(range, factory_.variable(tok(rhs, 1)), factory_.variable(tok(rhs, 2)));
    case A::AliasNthRef: factory_.fail("can't make alias for the number variables", tok(rhs, 2));
    case A::IfMod: return std::make_unique<ast::IfNode>(range, take(rhs, 2), take(rhs, 0), nullptr);
    case A::UnlessMod: return std::make_unique<ast::IfNode>(range, take(rhs, 2), nullptr, take(rhs, 0));
    case A::WhileMod: return modifierLoop<ast::WhileNode>(rhs, range);
    case A::UntilMod: return modifierLoop<ast::UntilNode>(rhs, range);
    case A::RescueMod: {
      ast::NodePtr body = take(rhs, 0);
      ast::NodePtr rescue = take(rhs, 2);
      const SourceRange clauseRange = SourceRange::cover(tok(rhs, 1).range, rescue->range);
      auto clauses = std::make_unique<ast::ListNode>(clauseRange);
      clauses->add(std::make_unique<ast::RescueBodyNode>(clauseRange, nullptr, nullptr, std::move(rescue)));
      return std::make_unique<ast::RescueNode>(range, std::move(body), std::move(clauses), nullptr);
    }

    // ---- assignment
    case A::Assign: {
      ast::NodePtr target = take(rhs, 0);
      setAssignedValue(factory_, *target, take(rhs, 2));
      target->setRange(range);
      return target;
    }
    case A::OpAssign:
      return std::make_unique<ast::OpAsgnNode>(range, take(rhs, 0), NodeFactory::nameOf(tok(rhs, 1)), take(rhs, 2));
    case A::OpAssignIndex:
      return std::make_unique<ast::OpElementAsgnNode>(range, take(rhs, 0), take(rhs, 2), NodeFactory::nameOf(tok(rhs, 4)),
                                                      take(rhs, 5));
    case A::OpAssignAttr: {
      auto node = std::make_unique<ast::OpAsgnAttrNode>(range, take(rhs, 0), NodeFactory::nameOf(tok(rhs, 2)),
                                                        NodeFactory::nameOf(tok(rhs, 3)), take(rhs, 4));
      node->safeNavigation = tok(rhs, 1).kind == TokenKind::AndDot;
      return node;
    }
    case A::OpAssignConst: {
      const SourceRange pathRange = coverOf(rhs, 0, 2);
      const std::string name = NodeFactory::nameOf(tok(rhs, 2));
      auto path = std::make_unique<ast::Colon2Node>(pathRange, take(rhs, 0), name);
      auto target = std::make_unique<ast::ConstDeclNode>(pathRange, name, std::move(path), nullptr);
      return std::make_unique<ast::OpAsgnNode>(range, std::move(target), NodeFactory::nameOf(tok(rhs, 3)), take(rhs, 4));
    }
    case A::OpAssignTopConst: {
      const SourceRange pathRange = coverOf(rhs, 0, 1);
      const std::string name = NodeFactory::nameOf(tok(rhs, 1));
      auto path = std::make_unique<ast::Colon3Node>(pathRange, name);
      auto target = std::make_unique<ast::ConstDeclNode>(pathRange, name, std::move(path), nullptr);
      return std::make_unique<ast::OpAsgnNode>(range, std::move(target), NodeFactory::nameOf(tok(rhs, 2)), take(rhs, 3));
    }
    case A::BackrefAssign: return factory_.assignable(tok(rhs, 0));
    case A::Mlhs: return multipleTargets(rhs, range);
    case A::MlhsWrap: return std::make_unique<ast::MultipleAsgnNode>(range, listOf(take(rhs, 1), range), nullptr, nullptr);
    case A::AssignableVar: return factory_.assignable(tok(rhs, 0));
    case A::AssignableIndex: return std::make_unique<ast::AttrAssignNode>(range, take(rhs, 0), "[]=", take(rhs, 2));
    case A::AssignableAttr: {
      auto node = std::make_unique<ast::AttrAssignNode>(range, take(rhs, 0), NodeFactory::nameOf(tok(rhs, 2)) + "=",
                                                        nullptr);
      node->safeNavigation = tok(rhs, 1).kind == TokenKind::AndDot;
      return node;
    }
    case A::AssignableColon2: {
      const std::string name = NodeFactory::nameOf(tok(rhs, 2));
      auto path = std::make_unique<ast::Colon2Node>(range, take(rhs, 0), name);
      return std::make_unique<ast::ConstDeclNode>(range, name, std::move(path), nullptr);
    }
    case A::AssignableColon3: {
      const std::string name = NodeFactory::nameOf(tok(rhs, 1));
      return std::make_unique<ast::ConstDeclNode>(range, name, std::make_unique<ast::Colon3Node>(range, name), nullptr);
    }

    // ---- boolean operators
    case A::And: return std::make_unique<ast::AndNode>(range, take(rhs, 0), take(rhs, 2));
    case A::Or: return std::make_unique<ast::OrNode>(range, take(rhs, 0), take(rhs, 2));
    case A::Not: {
      ast::NodePtr operand = takeLast(rhs);
      if (!operand) { operand = std::make_unique<ast::NilNode>(coverOf(rhs, 1, n - 1)); }
      return factory_.negate(range, std::move(operand));
    }
    case A::Defined: return std::make_unique<ast::DefinedNode>(range, takeLast(rhs));

    // ---- calls
    case A::CallMethod: return callMethod(rhs, range);
    case A::FCallCommand: return factory_.fcall(range, NodeFactory::nameOf(tok(rhs, 0)), take(rhs, 1), false);
    case A::FCallParen: return factory_.fcall(range, NodeFactory::nameOf(tok(rhs, 0)), take(rhs, 1), true);
    case A::FCallBare: return factory_.fcall(range, NodeFactory::nameOf(tok(rhs, 0)), nullptr, false);
    case A::FCallBlock: {
      const lex::Token& name = tok(rhs, 0);
      return factory_.attachBlock(factory_.fcall(name.range, NodeFactory::nameOf(name), nullptr, false), take(rhs, 1));
    }
    case A::AttachBlock: return factory_.attachBlock(take(rhs, 0), take(rhs, 1));
    case A::Super: {
      if (n == 1) { return std::make_unique<ast::ZSuperNode>(range, nullptr); }
      ast::NodePtr args = take(rhs, 1);
      ast::NodePtr block = NodeFactory::takeBlockPass(args);
      return std::make_unique<ast::SuperNode>(range, std::move(args), std::move(block));
    }
    case A::Yield: {
      ast::NodePtr args;
      for (std::size_t i = 1; i < n; ++i) {
        if (ast::as<ast::ListNode>(rhs[i].node()) != nullptr) { args = take(rhs, i); }
      }
      if (auto* list = ast::as<ast::ListNode>(args.get())) {
        for (const auto& item : list->items) {
          if (ast::as<ast::BlockPassNode>(item.get()) != nullptr) { factory_.fail("block argument should not be given", item->range); }
        }
      }
      return std::make_unique<ast::YieldNode>(range, std::move(args));
    }
    case A::Index: return factory_.call(range, take(rhs, 0), "[]", take(rhs, 2));
    case A::Return: return jump<ast::ReturnNode>(factory_, rhs, range);
    case A::Break: return jump<ast::BreakNode>(factory_, rhs, range);
    case A::Next: return jump<ast::NextNode>(factory_, rhs, range);
    case A::Redo: return std::make_unique<ast::RedoNode>(range);
    case A::Retry: return std::make_unique<ast::RetryNode>(range);

    // ---- call arguments
    case A::CallArgs: {
      ast::NodePtr list;
      for (std::size_t i = 0; i < n && !list; ++i) {
        if (ast::as<ast::ListNode>(rhs[i].node()) != nullptr) { list = take(rhs, i); }
      }
      for (std::size_t i = 0; i < n; ++i) {
        ast::NodePtr item = take(rhs, i);
        if (!item) { continue; }
        if (!list) {
          list = listOf(std::move(item), range);
        } else {
          static_cast<ast::ListNode*>(list.get())->add(std::move(item));
        }
      }
      return list;
    }
    case A::ParenArgs: {
      ast::NodePtr args = take(rhs, 1);
      return args ? std::move(args) : std::make_unique<ast::ListNode>(range);
    }
    case A::BlockPass: return std::make_unique<ast::BlockPassNode>(range, take(rhs, 1));
    case A::ArgsSplat: {
      std::size_t star = 0;
      while (star < n && (rhs[star].token() == nullptr || rhs[star].token()->kind != TokenKind::StarArg)) { ++star; }
      ast::NodePtr value = take(rhs, star + 1);
      const SourceRange splatRange = coverOf(rhs, star, star + 1);
      auto splat = std::make_unique<ast::SplatNode>(splatRange, std::move(value));
      ast::NodePtr list = star > 0 ? take(rhs, 0) : nullptr;
      if (auto* seq = ast::as<ast::ListNode>(list.get())) {
        seq->add(std::move(splat));
        return list;
      }
      return listOf(std::move(splat), range);
    }

    // ---- names and variables
    case A::CnameError: factory_.fail("class/module name must be CONSTANT", tok(rhs, 0));
    case A::Colon3: return std::make_unique<ast::Colon3Node>(range, NodeFactory::nameOf(tok(rhs, n - 1)));
    case A::Colon2: return std::make_unique<ast::Colon2Node>(range, take(rhs, 0), NodeFactory::nameOf(tok(rhs, 2)));
    case A::VarRef: return factory_.variable(tok(rhs, 0));
    case A::SymbolFromName: return factory_.symbolFromName(tok(rhs, 0));
    case A::SymbolLit: return factory_.symbol(tok(rhs, 0));
    case A::UndefList: {
      auto undef = std::make_unique<ast::UndefNode>(range);
      undef->add(take(rhs, 0));
      return undef;
    }

    // ---- operators
    case A::Range: {
      const std::size_t op = rhs[0].token() != nullptr ? 0 : 1;
      const TokenKind kind = tok(rhs, op).kind;
      const bool exclusive = kind == TokenKind::Dot3 || kind == TokenKind::BDot3;
      return std::make_unique<ast::DotNode>(range, op == 1 ? take(rhs, 0) : nullptr, take(rhs, op + 1), exclusive);
    }
    case A::BinOp: {
      ast::NodePtr operand = take(rhs, 2);
      const SourceRange at = operand->range;
      return factory_.call(range, take(rhs, 0), NodeFactory::nameOf(tok(rhs, 1)), listOf(std::move(operand), at));
    }
    case A::NegPow: {
      ast::NodePtr exponent = take(rhs, 3);
      const SourceRange at = exponent->range;
      ast::NodePtr power =
          factory_.call(coverOf(rhs, 1, 3), take(rhs, 1), "**", listOf(std::move(exponent), at));
      return factory_.call(range, std::move(power), "-@", nullptr);
    }
    case A::UnaryOp: return factory_.call(range, take(rhs, 1), unaryName(tok(rhs, 0).kind), nullptr);
    case A::NegNumber: return factory_.call(range, take(rhs, 1), "-@", nullptr);
    case A::Ternary: return std::make_unique<ast::IfNode>(range, take(rhs, 0), take(rhs, 2), take(rhs, 5));
    case A::Number: return factory_.number(tok(rhs, 0));

    // ---- literals
    case A::StringLit: return factory_.string(tok(rhs, 0));
    case A::StringConcat: return factory_.concat(take(rhs, 0), tok(rhs, 1));
    case A::RegexpLit: return factory_.regexp(tok(rhs, 0));
    case A::WordsLit: return factory_.words(tok(rhs, 0), false);
    case A::SymbolsLit: return factory_.words(tok(rhs, 0), true);
    case A::ArrayLit: return factory_.arrayFrom(take(rhs, 1), range);
    case A::HashLit: {
      ast::NodePtr hash = take(rhs, 1);
      if (!hash) { return std::make_unique<ast::HashNode>(range); }
      static_cast<ast::HashNode*>(hash.get())->braces = true;
      hash->setRange(range);
      return hash;
    }
    case A::HashOf: {
      auto hash = std::make_unique<ast::HashNode>(range);
      hash->braces = false;
      hash->add(take(rhs, 0));
      return hash;
    }
    case A::Pair: return std::make_unique<ast::HashPairNode>(range, take(rhs, 0), take(rhs, 2));
    case A::LabelPair: {
      const lex::Token& label = tok(rhs, 0);
      const std::string name = NodeFactory::nameOf(label);
      ast::NodePtr value = n > 1 ? take(rhs, 1) : std::make_unique<ast::VCallNode>(label.range, name);
      return std::make_unique<ast::HashPairNode>(range, std::make_unique<ast::SymbolNode>(label.range, name),
                                                 std::move(value));
    }
    case A::DoubleSplat: return std::make_unique<ast::DoubleSplatNode>(range, take(rhs, 1));
    case A::Begin: return std::make_unique<ast::BeginNode>(range, take(rhs, 1));
    case A::Paren: {
      ast::NodePtr body = take(rhs, 1);
      if (!body) { return std::make_unique<ast::NilNode>(range); }
      body->setRange(range);
      return body;
    }

    // ---- control flow
    case A::If:
    case A::Elsif: return std::make_unique<ast::IfNode>(range, take(rhs, 1), take(rhs, 3), take(rhs, 4));
    case A::Unless: return std::make_unique<ast::IfNode>(range, take(rhs, 1), take(rhs, 4), take(rhs, 3));
    case A::While: return std::make_unique<ast::WhileNode>(range, take(rhs, 1), take(rhs, 3), false);
    case A::Until: return std::make_unique<ast::UntilNode>(range, take(rhs, 1), take(rhs, 3), false);
    case A::Case: {
      const bool subject = n == 6;
      ast::NodePtr value = subject ? take(rhs, 1) : nullptr;
      ast::NodePtr clauses = take(rhs, subject ? 3 : 2);
      ast::NodePtr elseBody = take(rhs, subject ? 4 : 3);
      return ast::CaseNode::Builder(range, std::move(value), std::move(clauses)).setElse(std::move(elseBody)).finish();
    }
    case A::When: return std::make_unique<ast::WhenNode>(range, take(rhs, 1), take(rhs, 3));
    case A::In: return std::make_unique<ast::InNode>(range, take(rhs, 1), nullptr, take(rhs, 3));
    case A::InGuard: {
      ast::NodePtr guard = take(rhs, 3);
      if (tok(rhs, 2).kind == TokenKind::KwUnlessMod) {
        const SourceRange at = guard->range;
        guard = factory_.negate(at, std::move(guard));
      }
      return std::make_unique<ast::InNode>(range, take(rhs, 1), std::move(guard), take(rhs, 5));
    }
    case A::For: return std::make_unique<ast::ForNode>(range, take(rhs, 1), take(rhs, 3), take(rhs, 5));

    // ---- definitions
    case A::Class: return std::make_unique<ast::ClassNode>(range, take(rhs, 1), take(rhs, 2), take(rhs, 3));
    case A::SClass: return std::make_unique<ast::SClassNode>(range, take(rhs, 2), take(rhs, 4));
    case A::Module: return std::make_unique<ast::ModuleNode>(range, take(rhs, 1), take(rhs, 2));
    case A::Defn: {
      const lex::Token& name = tok(rhs, 1);
      ast::NodePtr args = take(rhs, 2);
      if (!args) { args = std::make_unique<ast::ArgsNode>(SourceRange{name.range.end(), 0}); }
      return std::make_unique<ast::DefnNode>(range, NodeFactory::nameOf(name), std::move(args), take(rhs, 3));
    }
    case A::Defs: {
      const lex::Token& name = tok(rhs, 3);
      ast::NodePtr args = take(rhs, 4);
      if (!args) { args = std::make_unique<ast::ArgsNode>(SourceRange{name.range.end(), 0}); }
      return std::make_unique<ast::DefsNode>(range, take(rhs, 1), NodeFactory::nameOf(name), std::move(args),
                                             take(rhs, 5));
    }

    // ---- parameters
    case A::Params: return factory_.params(range, take(rhs, 0), nullptr);
    case A::Param: return std::make_unique<ast::ArgumentNode>(range, paramName(tok(rhs, 0)));
    case A::OptParam: return std::make_unique<ast::OptArgNode>(range, paramName(tok(rhs, 0)), take(rhs, 2));
    case A::RestParam: return std::make_unique<ast::RestArgNode>(range, n > 1 ? paramName(tok(rhs, 1)) : "");
    case A::KwRestParam: return std::make_unique<ast::KeywordRestArgNode>(range, n > 1 ? paramName(tok(rhs, 1)) : "");
    case A::BlockParam: return std::make_unique<ast::BlockArgNode>(range, n > 1 ? paramName(tok(rhs, 1)) : "");
    case A::KwParam:
      return std::make_unique<ast::KeywordArgNode>(range, NodeFactory::nameOf(tok(rhs, 0)), take(rhs, 1));
    case A::BlockParams: {
      if (n == 1) { return std::make_unique<ast::ArgsNode>(range); }
      return factory_.params(range, take(rhs, 1), take(rhs, 2));
    }
    case A::ExcessComma: {
      ast::NodePtr list = take(rhs, 0);
      static_cast<ast::ListNode*>(list.get())->add(std::make_unique<ast::RestArgNode>(tok(rhs, 1).range, ""));
      return list;
    }
    case A::BlockLocal: return std::make_unique<ast::ArgumentNode>(range, NodeFactory::nameOf(tok(rhs, 0)));
    case A::Margs: {
      SplitList split = splitAtSplat(factory_, take(rhs, 0), "unexpected second splat in a destructuring parameter");
      return std::make_unique<ast::MultipleAsgnNode>(range, std::move(split.pre), std::move(split.rest),
                                                     std::move(split.post));
    }
    case A::MargTarget:
      return std::make_unique<ast::LocalAsgnNode>(range, paramName(tok(rhs, 0)), nullptr);
    case A::MargSplat: {
      ast::NodePtr target;
      if (n > 1) { target = std::make_unique<ast::LocalAsgnNode>(tok(rhs, 1).range, paramName(tok(rhs, 1)), nullptr); }
      return std::make_unique<ast::SplatNode>(range, std::move(target));
    }
    case A::Lambda: return std::make_unique<ast::LambdaNode>(range, take(rhs, 1), take(rhs, 2));
    case A::LambdaParams: {
      ast::NodePtr args = take(rhs, 1);
      if (!args) { args = std::make_unique<ast::ArgsNode>(range); }
      auto* params = static_cast<ast::ArgsNode*>(args.get());
      params->locals = take(rhs, 2);
      params->setRange(range);
      return args;
    }
    case A::Iter: return std::make_unique<ast::IterNode>(range, take(rhs, 1), take(rhs, 2));

    // ---- patterns
    case A::PatTopList: {
      auto items = std::make_unique<ast::ListNode>(range);
      for (std::size_t i = 0; i < n; ++i) {
        ast::NodePtr node = take(rhs, i);
        if (auto* list = ast::as<ast::ListNode>(node.get())) {
          for (auto& item : list->items) { items->add(std::move(item)); }
        } else if (node) {
          items->add(std::move(node));
        }
      }
      if (const lex::Token* last = rhs[n - 1].token(); last != nullptr && last->kind == TokenKind::Comma) {
        items->add(std::make_unique<ast::SplatNode>(last->range, nullptr));
      }
      return arrayPattern(range, nullptr, std::move(items));
    }
    case A::PatRest: return std::make_unique<ast::SplatNode>(range, n > 1 ? localTarget(tok(rhs, 1)) : nullptr);
    case A::PatCapture: return std::make_unique<ast::PatternCaptureNode>(range, take(rhs, 0), take(rhs, 2));
    case A::PatBind: return localTarget(tok(rhs, 0));
    case A::PatArrayConst: {
      ast::NodePtr constant = rhs[0].node() != nullptr ? take(rhs, 0) : nullptr;
      ast::NodePtr items;
      for (std::size_t i = 1; i < n && !items; ++i) { items = take(rhs, i); }
      return arrayPattern(range, std::move(constant), std::move(items));
    }
    case A::PatHashConst: {
      ast::NodePtr constant = rhs[0].node() != nullptr ? take(rhs, 0) : nullptr;
      ast::NodePtr pattern;
      for (std::size_t i = 1; i < n && !pattern; ++i) { pattern = take(rhs, i); }
      if (!pattern) { return std::make_unique<ast::HashPatternNode>(range, std::move(constant), nullptr, nullptr); }
      static_cast<ast::HashPatternNode*>(pattern.get())->constant = std::move(constant);
      pattern->setRange(range);
      return pattern;
    }
    case A::PatKwargs: {
      ast::NodePtr pairs;
      ast::NodePtr rest;
      for (std::size_t i = 0; i < n; ++i) {
        ast::NodePtr node = take(rhs, i);
        if (ast::as<ast::ListNode>(node.get()) != nullptr) {
          pairs = std::move(node);
        } else if (node) {
          rest = std::move(node);
        }
      }
      return std::make_unique<ast::HashPatternNode>(range, nullptr, std::move(pairs), std::move(rest));
    }
    case A::PatPair: {
      const lex::Token& label = tok(rhs, 0);
      ast::NodePtr value = n > 1 ? take(rhs, 1) : localTarget(label);
      return std::make_unique<ast::HashPairNode>(
          range, std::make_unique<ast::SymbolNode>(label.range, NodeFactory::nameOf(label)), std::move(value));
    }
    case A::PatKwRest:
      return std::make_unique<ast::DoubleSplatNode>(range, n > 1 ? localTarget(tok(rhs, 1)) : nullptr);
    case A::PatKwNil: return std::make_unique<ast::NilNode>(range);
    case A::PinVar: return std::make_unique<ast::PinNode>(range, factory_.variable(tok(rhs, 1)));
    case A::Pin: return std::make_unique<ast::PinNode>(range, take(rhs, 2));

    case A::None: break;
  }
  throw exceptions::GrammarError(std::string("unhandled reduction action for ") + rule.text);
}

} // namespace rbparse::parse
