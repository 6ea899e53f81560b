/***
 * Name: rbparse::parse::NodeFactory
 * Purpose: Token payloads to AST nodes.
 */
#include "parser/NodeFactory.h"

#include <algorithm>
#include <memory>
#include <string_view>
#include <variant>

#include "rbparse/exceptions/parse_error.h"

namespace rbparse::parse {

namespace {

bool allLiteral(const lex::StringParts& parts) {
  for (const auto& part : parts) {
    if (part.isCode()) { return false; }
  }
  return true;
}

std::string joined(const lex::StringParts& parts) {
  std::string out;
  for (const auto& part : parts) { out += part.text; }
  return out;
}

const lex::StringParts& partsOf(const NodeFactory& factory, const lex::Token& token) {
  const auto* parts = std::get_if<lex::StringParts>(&token.value);
  if (parts == nullptr) { factory.fail("literal token without content", token); }
  return *parts;
}

} // namespace

void NodeFactory::fail(const std::string& message, const SourceRange at) const {
  const std::string_view text = source_.text();
  const std::size_t start = std::min<std::size_t>(at.start, text.size());
  const std::string lexeme(text.substr(start, std::min<std::size_t>(at.length, text.size() - start)));
  throw exceptions::ParseError(message, source_.name(), at, source_.lineOf(at.start), source_.columnOf(at.start),
                               lexeme, {});
}

void NodeFactory::fail(const std::string& message, const lex::Token& at) const {
  throw exceptions::ParseError(message, source_.name(), at.range, at.line, at.col, at.text, {});
}

std::string NodeFactory::nameOf(const lex::Token& token) {
  if (const auto* name = std::get_if<std::string>(&token.value)) { return *name; }
  if (token.text == "!@") { return "!"; }
  if (token.text == "~@") { return "~"; }
  return token.text;
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
ast::NodePtr NodeFactory::variable(const lex::Token& token) const {
  using enum lex::TokenKind;
  const SourceRange r = token.range;
  switch (token.kind) {
    case Identifier: return std::make_unique<ast::VCallNode>(r, nameOf(token));
    case InstanceVar: return std::make_unique<ast::InstVarNode>(r, token.text);
    case ClassVar: return std::make_unique<ast::ClassVarNode>(r, token.text);
    case GlobalVar: return std::make_unique<ast::GlobalVarNode>(r, token.text);
    case Constant: return std::make_unique<ast::ConstNode>(r, nameOf(token));
    case KwNil: return std::make_unique<ast::NilNode>(r);
    case KwSelf: return std::make_unique<ast::SelfNode>(r);
    case KwTrue: return std::make_unique<ast::TrueNode>(r);
    case KwFalse: return std::make_unique<ast::FalseNode>(r);
    case KwFile: return std::make_unique<ast::FileNode>(r, source_.name());
    case KwLine: return std::make_unique<ast::FixnumNode>(r, token.line);
    case KwEncoding: return std::make_unique<ast::EncodingNode>(r, encoding_);
    case NthRef: return std::make_unique<ast::NthRefNode>(r, std::stoi(token.text.substr(1)));
    case BackRef: return std::make_unique<ast::BackRefNode>(r, token.text.size() > 1 ? token.text[1] : '&');
    default: break;
  }
  fail(std::string("unexpected ") + lex::to_string(token.kind) + " as a variable", token);
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
ast::NodePtr NodeFactory::assignable(const lex::Token& token) const {
  using enum lex::TokenKind;
  const SourceRange r = token.range;
  switch (token.kind) {
    case Identifier: return std::make_unique<ast::LocalAsgnNode>(r, nameOf(token), nullptr);
    case InstanceVar: return std::make_unique<ast::InstAsgnNode>(r, token.text, nullptr);
    case ClassVar: return std::make_unique<ast::ClassVarAsgnNode>(r, token.text, nullptr);
    case GlobalVar: return std::make_unique<ast::GlobalAsgnNode>(r, token.text, nullptr);
    case Constant: return std::make_unique<ast::ConstDeclNode>(r, nameOf(token), nullptr, nullptr);
    case KwNil: fail("Can't assign to nil", token);
    case KwSelf: fail("Can't change the value of self", token);
    case KwTrue: fail("Can't assign to true", token);
    case KwFalse: fail("Can't assign to false", token);
    case KwFile: fail("Can't assign to __FILE__", token);
    case KwLine: fail("Can't assign to __LINE__", token);
    case KwEncoding: fail("Can't assign to __ENCODING__", token);
    case NthRef:
    case BackRef: fail("Can't set variable " + token.text, token);
    default: break;
  }
  fail(std::string("unexpected ") + lex::to_string(token.kind) + " as an assignment target", token);
}

ast::NodePtr NodeFactory::number(const lex::Token& token) const {
  const auto* lit = std::get_if<lex::NumberLiteral>(&token.value);
  if (lit == nullptr) { fail("numeric token without a value", token); }
  auto node = std::make_unique<ast::RawNumberNode>(token.range, lit->digits, lit->base);
  node->isFloat = lit->isFloat;
  node->rational = lit->rational;
  node->imaginary = lit->imaginary;
  return node;
}

ast::NodePtr NodeFactory::evaluated(const lex::StringPart& part) const {
  ast::NodePtr body;
  if (!part.code.empty() && embedded_) { body = embedded_(part.code); }
  return std::make_unique<ast::EvStrNode>(part.range, std::move(body));
}

ast::NodePtr NodeFactory::parts(const lex::StringParts& parts, const SourceRange range, ast::NodePtr sequence) const {
  auto* seq = static_cast<ast::SequenceNode*>(sequence.get());
  for (const auto& part : parts) {
    if (part.isCode()) {
      seq->add(evaluated(part));
    } else if (!part.text.empty()) {
      seq->add(std::make_unique<ast::StrNode>(part.range, part.text));
    }
  }
  seq->setRange(SourceRange::cover(seq->range, range));
  return sequence;
}

ast::NodePtr NodeFactory::string(const lex::Token& token) const {
  const lex::StringParts& list = partsOf(*this, token);
  if (allLiteral(list)) {
    auto node = std::make_unique<ast::StrNode>(token.range, joined(list));
    node->frozen = frozen_;
    return node;
  }
  return parts(list, token.range, std::make_unique<ast::DStrNode>(token.range));
}

ast::NodePtr NodeFactory::concat(ast::NodePtr head, const lex::Token& tail) const {
  const lex::StringParts& list = partsOf(*this, tail);
  const SourceRange range = SourceRange::cover(head->range, tail.range);
  if (auto* str = ast::as<ast::StrNode>(head.get()); str != nullptr && allLiteral(list)) {
    str->value += joined(list);
    str->setRange(range);
    return head;
  }
  ast::NodePtr dstr;
  if (ast::as<ast::DStrNode>(head.get()) != nullptr) {
    dstr = std::move(head);
  } else {
    dstr = std::make_unique<ast::DStrNode>(head->range);
    auto* seq = static_cast<ast::SequenceNode*>(dstr.get());
    auto* str = ast::as<ast::StrNode>(head.get());
    if (str != nullptr && !str->value.empty()) {
      str->frozen = false;
      seq->add(std::move(head));
    }
  }
  return parts(list, range, std::move(dstr));
}

ast::NodePtr NodeFactory::symbol(const lex::Token& token) const {
  if (const auto* name = std::get_if<std::string>(&token.value)) {
    return std::make_unique<ast::SymbolNode>(token.range, *name);
  }
  const lex::StringParts& list = partsOf(*this, token);
  if (allLiteral(list)) { return std::make_unique<ast::SymbolNode>(token.range, joined(list)); }
  return parts(list, token.range, std::make_unique<ast::DSymbolNode>(token.range));
}

ast::NodePtr NodeFactory::symbolFromName(const lex::Token& token) const {
  return std::make_unique<ast::SymbolNode>(token.range, nameOf(token));
}

ast::NodePtr NodeFactory::regexp(const lex::Token& token) const {
  const auto* lit = std::get_if<lex::RegexpLiteral>(&token.value);
  if (lit == nullptr) { fail("regexp token without content", token); }
  if (allLiteral(lit->parts)) { return std::make_unique<ast::RegexpNode>(token.range, joined(lit->parts), lit->options); }
  auto node = std::make_unique<ast::DRegexpNode>(token.range);
  node->options = lit->options;
  return parts(lit->parts, token.range, std::move(node));
}

ast::NodePtr NodeFactory::words(const lex::Token& token, const bool symbols) const {
  auto array = std::make_unique<ast::ArrayNode>(token.range);
  for (const auto& part : partsOf(*this, token)) {
    if (symbols) {
      array->add(std::make_unique<ast::SymbolNode>(part.range, part.text));
    } else {
      array->add(std::make_unique<ast::StrNode>(part.range, part.text));
    }
  }
  array->setRange(SourceRange::cover(array->range, token.range));
  return array;
}

ast::NodePtr NodeFactory::arrayFrom(ast::NodePtr list, const SourceRange range) const {
  auto array = std::make_unique<ast::ArrayNode>(range);
  if (auto* items = ast::as<ast::ListNode>(list.get())) {
    for (auto& item : items->items) { array->add(std::move(item)); }
  } else if (list) {
    array->add(std::move(list));
  }
  return array;
}

ast::NodePtr NodeFactory::takeBlockPass(ast::NodePtr& args) {
  auto* list = ast::as<ast::ListNode>(args.get());
  if (list == nullptr || list->empty() || ast::as<ast::BlockPassNode>(list->items.back().get()) == nullptr) {
    return nullptr;
  }
  ast::NodePtr pass = std::move(list->items.back());
  list->items.pop_back();
  if (list->empty()) { args.reset(); }
  return pass;
}

ast::NodePtr NodeFactory::call(const SourceRange range, ast::NodePtr receiver, std::string name, ast::NodePtr args,
                               const bool safeNavigation) const {
  ast::NodePtr block = takeBlockPass(args);
  auto node = std::make_unique<ast::CallNode>(range, std::move(receiver), std::move(name), std::move(args),
                                              std::move(block));
  node->safeNavigation = safeNavigation;
  return node;
}

ast::NodePtr NodeFactory::fcall(const SourceRange range, std::string name, ast::NodePtr args,
                                const bool hasParens) const {
  ast::NodePtr block = takeBlockPass(args);
  auto node = std::make_unique<ast::FCallNode>(range, std::move(name), std::move(args), std::move(block));
  node->hasParens = hasParens;
  return node;
}

ast::NodePtr NodeFactory::negate(const SourceRange range, ast::NodePtr operand) const {
  return std::make_unique<ast::CallNode>(range, std::move(operand), "!", nullptr);
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
ast::NodePtr NodeFactory::attachBlock(ast::NodePtr call, ast::NodePtr iter) const {
  ast::NodePtr* slot = nullptr;
  switch (call->kind) {
    case ast::NodeKind::Call: slot = &static_cast<ast::CallNode*>(call.get())->block; break;
    case ast::NodeKind::FCall: slot = &static_cast<ast::FCallNode*>(call.get())->block; break;
    case ast::NodeKind::Super: slot = &static_cast<ast::SuperNode*>(call.get())->block; break;
    case ast::NodeKind::ZSuper: slot = &static_cast<ast::ZSuperNode*>(call.get())->block; break;
    case ast::NodeKind::Yield: fail("block given to yield", iter->range);
    case ast::NodeKind::Return:
    case ast::NodeKind::Break:
    case ast::NodeKind::Next: {
      // `break foo 1 do ... end`: the block belongs to the command inside the jump.
      ast::NodePtr* value = call->mutableSlot(0);
      if (*value == nullptr) { fail("block given to " + std::string(ast::to_string(call->kind)), iter->range); }
      *value = attachBlock(std::move(*value), std::move(iter));
      call->setRange(SourceRange::cover(call->range, (*value)->range));
      return call;
    }
    default: fail("block given to a non-call expression", iter->range);
  }
  if (*slot != nullptr) { fail("both block arg and actual block given", iter->range); }
  call->setRange(SourceRange::cover(call->range, iter->range));
  *slot = std::move(iter);
  return call;
}

ast::NodePtr NodeFactory::jumpValue(ast::NodePtr args) const {
  auto* list = ast::as<ast::ListNode>(args.get());
  if (list == nullptr) { return args; }
  for (const auto& item : list->items) {
    if (ast::as<ast::BlockPassNode>(item.get()) != nullptr) { fail("block argument should not be given", item->range); }
  }
  if (list->size() == 1 && ast::as<ast::SplatNode>(list->items.front().get()) == nullptr) {
    return std::move(list->items.front());
  }
  const SourceRange range = list->range;
  return arrayFrom(std::move(args), range);
}

// NOLINTNEXTLINE(readability-function-size,readability-function-cognitive-complexity)
ast::NodePtr NodeFactory::params(const SourceRange range, ast::NodePtr items, ast::NodePtr locals) const {
  enum Phase { Pre, Opt, Rest, Post, Keywords, KeywordRest, Block };
  auto args = std::make_unique<ast::ArgsNode>(range);
  auto append = [](ast::NodePtr& list, ast::NodePtr item) {
    if (!list) { list = std::make_unique<ast::ListNode>(item->range); }
    static_cast<ast::ListNode*>(list.get())->add(std::move(item));
  };
  Phase phase = Pre;
  if (auto* list = ast::as<ast::ListNode>(items.get())) {
    for (auto& item : list->items) {
      const SourceRange at = item->range;
      switch (item->kind) {
        case ast::NodeKind::Argument:
        case ast::NodeKind::MultipleAsgn:
          if (phase == Pre) {
            append(args->pre, std::move(item));
          } else if (phase <= Post) {
            phase = Post;
            append(args->post, std::move(item));
          } else {
            fail("required argument after keyword arguments", at);
          }
          break;
        case ast::NodeKind::OptArg:
          if (phase > Opt) { fail("optional argument after rest or post arguments", at); }
          phase = Opt;
          append(args->optional, std::move(item));
          break;
        case ast::NodeKind::RestArg:
          if (phase > Opt) { fail("unexpected rest argument", at); }
          phase = Rest;
          args->rest = std::move(item);
          break;
        case ast::NodeKind::KeywordArg:
          if (phase > Keywords) { fail("keyword argument after keyword rest or block argument", at); }
          phase = Keywords;
          append(args->keywords, std::move(item));
          break;
        case ast::NodeKind::KeywordRestArg:
          if (phase >= KeywordRest) { fail("unexpected keyword rest argument", at); }
          phase = KeywordRest;
          args->keywordRest = std::move(item);
          break;
        case ast::NodeKind::BlockArg:
          if (phase == Block) { fail("unexpected block argument", at); }
          phase = Block;
          args->block = std::move(item);
          break;
        default:
          fail(std::string("unexpected ") + ast::to_string(item->kind) + " in a parameter list", at);
      }
    }
  }
  if (locals) {
    args->setRange(SourceRange::cover(args->range, locals->range));
    args->locals = std::move(locals);
  }
  return args;
}

} // namespace rbparse::parse
