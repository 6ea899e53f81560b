/***
 * Name: rbparse::parse::Driver
 * Purpose: Shift-reduce loop, range bookkeeping and syntax errors.
 */
#include "parser/Driver.h"

#include <span>

#include "rbparse/exceptions/grammar_error.h"
#include "rbparse/exceptions/parse_error.h"

namespace rbparse::parse {

namespace {

std::string describe(const lex::Token& token) {
  switch (token.kind) {
    case lex::TokenKind::EndOfInput: return "end-of-input";
    case lex::TokenKind::Newline: return "'\\n'";
    default: break;
  }
  return std::string(lex::to_string(token.kind)) + " '" + token.text + "'";
}

} // namespace

ast::NodePtr Driver::parse(const lex::TokenKind entry) {
  states_.assign(1, 0);
  values_.clear();
  shifts_ = 0;
  reductions_ = 0;

  lex::Token lookahead;
  lookahead.kind = entry;
  bool entryPending = true;
  while (true) {
    const auto terminal = table_.terminalOf(lookahead.kind);
    if (!terminal) { syntaxError(lookahead); }
    const ActionEntry* action = table_.action(states_.back(), *terminal);
    if (action == nullptr) { syntaxError(lookahead); }
    switch (action->kind) {
      case ActionKind::Shift: {
        if (trace_ != nullptr) {
          *trace_ << "shift " << lex::to_string(lookahead.kind);
          if (!lookahead.text.empty()) { *trace_ << " '" << lookahead.text << "'"; }
          *trace_ << " -> " << action->value << "\n";
        }
        states_.push_back(action->value);
        const SourceRange range = lookahead.range;
        values_.push_back(Value{range, std::move(lookahead)});
        if (!entryPending) { ++shifts_; }
        entryPending = false;
        lookahead = tokens_.next();
        break;
      }
      case ActionKind::Reduce:
        reduce(action->value, lookahead);
        break;
      case ActionKind::Accept: {
        // $accept : <entry> <start>; the start symbol's value is on top.
        if (trace_ != nullptr) { *trace_ << "accept " << table_.rule(action->value).text << "\n"; }
        ast::NodePtr result = values_.back().takeNode();
        values_.clear();
        states_.clear();
        return result;
      }
    }
  }
}

void Driver::reduce(const std::uint32_t ruleIndex, const lex::Token& lookahead) {
  const RuleInfo& rule = table_.rule(ruleIndex);
  const std::size_t length = rule.length;
  const std::span<Value> rhs(values_.data() + (values_.size() - length), length);

  SourceRange range{};
  bool any = false;
  for (const Value& value : rhs) {
    if (value.range.empty()) { continue; }
    range = any ? SourceRange::cover(range, value.range) : value.range;
    any = true;
  }
  if (!any) { range = SourceRange{lookahead.range.start, 0}; }

  Value result;
  result.range = range;
  if (rule.action != 0) {
    ast::NodePtr node = reducer_.reduce(rule, rhs, range);
    if (node) { result.range = any ? SourceRange::cover(range, node->range) : node->range; }
    result.data = std::move(node);
  } else if (rule.passIndex >= 0) {
    result.data = std::move(rhs[static_cast<std::size_t>(rule.passIndex)].data);
  }
  ++reductions_;

  values_.resize(values_.size() - length);
  states_.resize(states_.size() - length);
  const auto target = table_.gotoState(states_.back(), rule.lhs);
  if (!target) { throw exceptions::GrammarError(std::string("no goto entry after reducing ") + rule.text); }
  if (trace_ != nullptr) { *trace_ << "reduce " << rule.text << " -> " << *target << "\n"; }
  states_.push_back(*target);
  values_.push_back(std::move(result));
}

void Driver::syntaxError(const lex::Token& lookahead) const {
  std::vector<std::string> expected = table_.expectedTokens(states_.back());
  std::string message = "syntax error, unexpected " + describe(lookahead);
  if (!expected.empty() && expected.size() <= 4) {
    message += ", expecting ";
    for (std::size_t i = 0; i < expected.size(); ++i) {
      if (i > 0) { message += " or "; }
      message += expected[i];
    }
  }
  throw exceptions::ParseError(message, file_, lookahead.range, lookahead.line, lookahead.col, lookahead.text,
                               std::move(expected));
}

} // namespace rbparse::parse
