/***
 * Name: rbparse::lex::Lexer (streaming)
 * Purpose: Tokenize Ruby source into a context-sensitive token stream.
 */
#include "lexer/Lexer.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <unicode/utf.h>
#include <unicode/utf8.h>

#include "lexer/Encoding.h"
#include "rbparse/exceptions/lex_error.h"
#include "rbparse/support/WarningSink.h"

namespace rbparse::lex {

namespace {

bool isIdentStart(const char chr) {
  const auto uch = static_cast<unsigned char>(chr);
  return (std::isalpha(uch) != 0) || chr == '_' || uch >= 0x80;
}
bool isIdentChar(const char chr) {
  const auto uch = static_cast<unsigned char>(chr);
  return (std::isalnum(uch) != 0) || chr == '_' || uch >= 0x80;
}
bool isDigit(const char chr) { return chr >= '0' && chr <= '9'; }
bool isOctal(const char chr) { return chr >= '0' && chr <= '7'; }
bool isHex(const char chr) { return std::isxdigit(static_cast<unsigned char>(chr)) != 0; }
bool isBlank(const char chr) { return chr == ' ' || chr == '\t' || chr == '\f' || chr == '\r' || chr == '\v'; }
bool isSpace(const char chr) { return isBlank(chr) || chr == '\n' || chr == '\0'; }
int hexValue(const char chr) {
  if (isDigit(chr)) { return chr - '0'; }
  return (std::tolower(static_cast<unsigned char>(chr)) - 'a') + 10;
}

struct Keyword {
  std::string_view name;
  TokenKind kind;
  TokenKind modifier;
  LexState next;
};

constexpr std::array<Keyword, 39> kKeywords{{
    {"alias", TokenKind::KwAlias, TokenKind::KwAlias, LexState::Fname},
    {"and", TokenKind::KwAnd, TokenKind::KwAnd, LexState::Beg},
    {"begin", TokenKind::KwBegin, TokenKind::KwBegin, LexState::Beg},
    {"break", TokenKind::KwBreak, TokenKind::KwBreak, LexState::Mid},
    {"case", TokenKind::KwCase, TokenKind::KwCase, LexState::Beg},
    {"class", TokenKind::KwClass, TokenKind::KwClass, LexState::Class},
    {"def", TokenKind::KwDef, TokenKind::KwDef, LexState::Fname},
    {"defined?", TokenKind::KwDefined, TokenKind::KwDefined, LexState::Arg},
    {"do", TokenKind::KwDo, TokenKind::KwDo, LexState::Beg},
    {"else", TokenKind::KwElse, TokenKind::KwElse, LexState::Beg},
    {"elsif", TokenKind::KwElsif, TokenKind::KwElsif, LexState::Beg},
    {"end", TokenKind::KwEnd, TokenKind::KwEnd, LexState::End},
    {"ensure", TokenKind::KwEnsure, TokenKind::KwEnsure, LexState::Beg},
    {"false", TokenKind::KwFalse, TokenKind::KwFalse, LexState::End},
    {"for", TokenKind::KwFor, TokenKind::KwFor, LexState::Beg},
    {"if", TokenKind::KwIf, TokenKind::KwIfMod, LexState::Beg},
    {"in", TokenKind::KwIn, TokenKind::KwIn, LexState::Beg},
    {"module", TokenKind::KwModule, TokenKind::KwModule, LexState::Beg},
    {"next", TokenKind::KwNext, TokenKind::KwNext, LexState::Mid},
    {"nil", TokenKind::KwNil, TokenKind::KwNil, LexState::End},
    {"not", TokenKind::KwNot, TokenKind::KwNot, LexState::Arg},
    {"or", TokenKind::KwOr, TokenKind::KwOr, LexState::Beg},
    {"redo", TokenKind::KwRedo, TokenKind::KwRedo, LexState::End},
    {"rescue", TokenKind::KwRescue, TokenKind::KwRescueMod, LexState::Mid},
    {"retry", TokenKind::KwRetry, TokenKind::KwRetry, LexState::End},
    {"return", TokenKind::KwReturn, TokenKind::KwReturn, LexState::Mid},
    {"self", TokenKind::KwSelf, TokenKind::KwSelf, LexState::End},
    {"super", TokenKind::KwSuper, TokenKind::KwSuper, LexState::Arg},
    {"then", TokenKind::KwThen, TokenKind::KwThen, LexState::Beg},
    {"true", TokenKind::KwTrue, TokenKind::KwTrue, LexState::End},
    {"undef", TokenKind::KwUndef, TokenKind::KwUndef, LexState::Fname},
    {"unless", TokenKind::KwUnless, TokenKind::KwUnlessMod, LexState::Beg},
    {"until", TokenKind::KwUntil, TokenKind::KwUntilMod, LexState::Beg},
    {"when", TokenKind::KwWhen, TokenKind::KwWhen, LexState::Beg},
    {"while", TokenKind::KwWhile, TokenKind::KwWhileMod, LexState::Beg},
    {"yield", TokenKind::KwYield, TokenKind::KwYield, LexState::Arg},
    {"__ENCODING__", TokenKind::KwEncoding, TokenKind::KwEncoding, LexState::End},
    {"__FILE__", TokenKind::KwFile, TokenKind::KwFile, LexState::End},
    {"__LINE__", TokenKind::KwLine, TokenKind::KwLine, LexState::End},
}};

const Keyword* findKeyword(std::string_view name) {
  for (const auto& kw : kKeywords) {
    if (kw.name == name) { return &kw; }
  }
  return nullptr;
}

// Operator method names usable after ':' (longest first).
constexpr std::array<std::string_view, 27> kSymbolOperators{{
    "[]=", "<=>", "===", "[]", "==", "=~", "!=", "!~", "<<", "<=", ">>", ">=", "**", "+@", "-@",
    "!", "<", ">", "*", "+", "-", "/", "%", "~", "&", "|", "^",
}};

// Tokens that may begin the first argument of a command call (`foo x`, `foo -1`, `foo [1]`).
bool startsArgument(const TokenKind kind) {
  using enum TokenKind;
  switch (kind) {
    case Identifier: case FunctionId: case Constant: case InstanceVar: case ClassVar: case GlobalVar:
    case NthRef: case BackRef: case Label: case Integer: case Float: case String: case Symbol: case Regexp:
    case Words: case Symbols: case UMinusNum: case UMinus: case UPlus: case Bang: case Tilde: case StarArg:
    case DStarArg: case AmperArg: case LParen: case LBracket: case LBrace: case Colon3: case Lambda:
    case BDot2: case BDot3: case KwNil: case KwTrue: case KwFalse: case KwSelf: case KwNot: case KwDefined:
    case KwCase: case KwBegin: case KwDef: case KwSuper: case KwYield: case KwFile: case KwLine:
    case KwEncoding: case KwIf: case KwUnless: case KwWhile: case KwUntil:
      return true;
    default:
      return false;
  }
}

// Keywords after which a pending command's arguments are known to be closed.
bool closesCommandArguments(const TokenKind kind) {
  using enum TokenKind;
  switch (kind) {
    case KwThen: case KwIfMod: case KwUnlessMod: case KwWhileMod: case KwUntilMod: case KwRescueMod:
    case KwAnd: case KwOr: case KwDoCond:
      return true;
    default:
      return false;
  }
}

template <typename Stack>
void dropFrom(Stack& stack, const int depth) {
  while (!stack.empty() && stack.back() >= depth) { stack.pop_back(); }
}

} // namespace

Lexer::Lexer(const SourceBuffer& source, LexerOptions options)
  : source_(source), text_(source.text()), options_(std::move(options)) {
  pos_ = std::min(options_.begin, text_.size());
  end_ = std::min(options_.end, text_.size());
  encoding_ = CanonicalEncodingName(options_.defaultEncoding);
  if (!options_.embedded) { validateEncoding(); }
}

void Lexer::validateEncoding() {
  const std::string_view region = text_.substr(pos_, end_ - pos_);
  const MagicComments magic = DetectMagicComments(region);
  frozen_ = magic.frozenStringLiteral;
  if (magic.encoding) {
    const size_t found = text_.find(*magic.encoding, pos_);
    const size_t where = found == std::string_view::npos ? pos_ : found;
    if (!IsKnownEncoding(*magic.encoding)) {
      fail("unknown encoding name - " + *magic.encoding, where, magic.encoding->size());
    }
    encoding_ = CanonicalEncodingName(*magic.encoding);
  }
  if (!IsKnownEncoding(encoding_)) { fail("unknown encoding name - " + encoding_, pos_, 0); }
  if (!IsAsciiCompatible(encoding_)) { fail(encoding_ + " is not ASCII compatible", pos_, 0); }
  if (const auto bad = FindInvalidSequence(region, encoding_)) {
    fail("invalid multibyte char (" + encoding_ + ")", pos_ + *bad, 1);
  }
}

const Token& Lexer::peek(const size_t lookahead) {
  ensure(lookahead);
  return lookahead < buffer_.size() ? buffer_[lookahead] : buffer_.back();
}

Token Lexer::next() {
  ensure(0);
  Token tok = buffer_.front();
  if (buffer_.size() > 1 || tok.kind != TokenKind::EndOfInput) { buffer_.pop_front(); }
  return tok;
}

std::vector<Token> Lexer::tokens() {
  std::vector<Token> out;
  while (true) {
    Token tok = next();
    const bool last = tok.kind == TokenKind::EndOfInput;
    out.push_back(std::move(tok));
    if (last) { break; }
  }
  return out;
}

bool Lexer::ensure(const size_t lookahead) {
  while (buffer_.size() <= lookahead && !done_) {
    Token tok = scan();
    if (tok.kind == TokenKind::EndOfInput) { done_ = true; }
    buffer_.push_back(std::move(tok));
  }
  return buffer_.size() > lookahead;
}

void Lexer::fail(const std::string& message, const size_t start, const size_t length) const {
  const size_t begin = std::min(start, text_.size());
  const size_t stop = std::min(begin + length, text_.size());
  throw exceptions::LexError(message, source_.name(),
                             SourceRange{static_cast<std::uint32_t>(begin), static_cast<std::uint32_t>(stop - begin)},
                             source_.lineOf(begin), source_.columnOf(begin),
                             std::string(text_.substr(begin, stop - begin)));
}

void Lexer::warn(const std::string& message, const size_t at) const {
  if (options_.warnings == nullptr) { return; }
  Warning warning;
  warning.message = message;
  warning.file = source_.name();
  warning.range = SourceRange{static_cast<std::uint32_t>(at), 1};
  warning.line = source_.lineOf(at);
  warning.column = source_.columnOf(at);
  options_.warnings->warn(warning);
}

bool Lexer::isBeg() const { return state_ == LexState::Beg || state_ == LexState::Mid || state_ == LexState::Class; }
bool Lexer::isArg() const { return state_ == LexState::Arg || state_ == LexState::CmdArg; }
bool Lexer::isEnd() const { return state_ == LexState::End || state_ == LexState::EndFn; }

bool Lexer::spaceBeforeArgument() const {
  // pos_ sits on the operator; the caller checks the byte after it.
  return isArg() && spaceSeen_;
}

bool Lexer::newlineIgnored() const {
  return state_ == LexState::Beg || state_ == LexState::Dot || state_ == LexState::Fname ||
         state_ == LexState::Class;
}

bool Lexer::continuesWithLeadingDot(size_t p) const {
  while (p < end_) {
    while (p < end_ && isBlank(text_[p])) { ++p; }
    if (p >= end_) { return false; }
    if (text_[p] == '#') {
      while (p < end_ && text_[p] != '\n') { ++p; }
      if (p < end_) { ++p; }
      continue;
    }
    if (text_[p] == '\n') { return false; }
    if (text_[p] == '&' && at(p + 1) == '.') { return true; }
    return text_[p] == '.' && at(p + 1) != '.';
  }
  return false;
}

LexState Lexer::afterOperator() const {
  if (state_ == LexState::Fname) { return LexState::EndFn; }
  if (state_ == LexState::Dot) { return LexState::Arg; }
  return LexState::Beg;
}

void Lexer::popStacksAtDepth() {
  dropFrom(condStack_, parenDepth_);
  dropFrom(cmdArgStack_, parenDepth_);
  dropFrom(lambdaStack_, parenDepth_);
}

void Lexer::skipEmbeddedDocument() {
  const size_t start = pos_;
  size_t p = pos_;
  while (true) {
    size_t eol = text_.find('\n', p);
    if (eol == std::string_view::npos || eol >= end_) { fail("embedded document meets end of file", start, 6); }
    p = eol + 1;
    if (text_.substr(p).rfind("=end", 0) == 0 && (p + 4 >= end_ || isSpace(text_[p + 4]))) {
      const size_t close = text_.find('\n', p);
      pos_ = (close == std::string_view::npos || close >= end_) ? end_ : close + 1;
      return;
    }
  }
}

Token Lexer::emit(const TokenKind kind, const size_t start, const size_t stop, LexState next, TokenValue value) {
  using enum TokenKind;
  const LexState prev = state_;
  if (commandNamePending_ && spaceSeen_ && startsArgument(kind)) {
    if (cmdArgStack_.empty() || cmdArgStack_.back() != parenDepth_) { cmdArgStack_.push_back(parenDepth_); }
  }
  commandNamePending_ = (kind == Identifier || kind == FunctionId || kind == Constant || kind == KwSuper ||
                         kind == KwYield) &&
                        (next == LexState::Arg || next == LexState::CmdArg);
  switch (kind) {
    case LParen: case LParenCall: case LBracket: case LBracketIndex: case LBrace: case LBraceBlock:
    case LambdaBeg:
      ++parenDepth_;
      break;
    case RParen: case RBracket: case RBrace:
      if (parenDepth_ > 0) { --parenDepth_; }
      dropFrom(condStack_, parenDepth_ + 1);
      dropFrom(cmdArgStack_, parenDepth_ + 1);
      dropFrom(lambdaStack_, parenDepth_ + 1);
      break;
    case Newline: case Semicolon:
      popStacksAtDepth();
      fitem_ = FitemMode::None;
      break;
    case Lambda:
      lambdaStack_.push_back(parenDepth_);
      break;
    case KwWhile: case KwUntil: case KwFor:
      condStack_.push_back(parenDepth_);
      break;
    default:
      if (closesCommandArguments(kind)) { dropFrom(cmdArgStack_, parenDepth_); }
      break;
  }
  if (prev == LexState::Fname && kind != Comma) {
    if (fitem_ == FitemMode::AliasFirst) {
      next = LexState::Fname;
      fitem_ = FitemMode::AliasSecond;
    } else if (fitem_ == FitemMode::AliasSecond) {
      fitem_ = FitemMode::None;
    }
  }
  if (kind == Comma && fitem_ == FitemMode::Undef) { next = LexState::Fname; }
  if (kind == KwAlias) { fitem_ = FitemMode::AliasFirst; }
  if (kind == KwUndef) { fitem_ = FitemMode::Undef; }

  labelOk_ = kind == LParen || kind == LParenCall || kind == LBracket || kind == LBracketIndex || kind == LBrace ||
             kind == LBraceBlock || kind == Comma || kind == Pipe;
  cmdStart_ = kind == Newline || kind == Semicolon || kind == KwThen || kind == KwDo || kind == KwDoCond ||
              kind == KwDoBlock || kind == KwDoLambda || kind == KwElse || kind == KwBegin || kind == KwEnsure ||
              kind == LBraceBlock || kind == LambdaBeg || kind == LParen;
  state_ = next;
  lastKind_ = kind;

  Token tok;
  tok.kind = kind;
  tok.text = std::string(text_.substr(start, stop - start));
  tok.range = SourceRange::fromBounds(static_cast<std::uint32_t>(start), static_cast<std::uint32_t>(stop));
  tok.line = source_.lineOf(start);
  tok.col = source_.columnOf(start);
  tok.value = std::move(value);
  return tok;
}

Token Lexer::scan() {
  spaceSeen_ = false;
  while (true) {
    if (pos_ < end_ && (pos_ == 0 || text_[pos_ - 1] == '\n')) {
      const std::string_view rest = text_.substr(pos_, end_ - pos_);
      if (rest.rfind("=begin", 0) == 0 && (rest.size() == 6 || isSpace(rest[6]))) {
        skipEmbeddedDocument();
        continue;
      }
      if (rest.rfind("__END__", 0) == 0 &&
          (rest.size() == 7 || rest[7] == '\n' || (rest[7] == '\r' && rest.size() > 8 && rest[8] == '\n'))) {
        end_ = pos_;
      }
    }
    if (pos_ >= end_) { return emit(TokenKind::EndOfInput, end_, end_, state_); }
    const char chr = text_[pos_];
    if (isBlank(chr)) {
      ++pos_;
      spaceSeen_ = true;
      continue;
    }
    if (chr == '\\' && (at(pos_ + 1) == '\n' || (at(pos_ + 1) == '\r' && at(pos_ + 2) == '\n'))) {
      pos_ += at(pos_ + 1) == '\n' ? 2 : 3;
      spaceSeen_ = true;
      continue;
    }
    if (chr == '#') {
      while (pos_ < end_ && text_[pos_] != '\n') { ++pos_; }
      continue;
    }
    if (chr == '\0' || chr == '\x04' || chr == '\x1a') {
      end_ = pos_;
      continue;
    }
    if (chr == '\n') {
      const size_t newline = pos_;
      if (heredocResume_ != std::string::npos) {
        pos_ = heredocResume_;
        heredocResume_ = std::string::npos;
      } else {
        ++pos_;
      }
      if (newlineIgnored() || continuesWithLeadingDot(pos_)) {
        spaceSeen_ = true;
        continue;
      }
      return emit(TokenKind::Newline, newline, newline + 1, LexState::Beg);
    }
    return scanToken();
  }
}

// NOLINTNEXTLINE(readability-function-size,readability-function-cognitive-complexity)
Token Lexer::scanToken() {
  using enum TokenKind;
  const size_t start = pos_;
  const char chr = text_[pos_];
  const char nxt = at(pos_ + 1);
  const bool fnameOrDot = state_ == LexState::Fname || state_ == LexState::Dot;
  auto op = [&](TokenKind kind, size_t width, LexState next) {
    pos_ += width;
    return emit(kind, start, pos_, next);
  };
  auto opAssign = [&](std::string name) {
    pos_ += name.size() + 1;
    return emit(OpAssign, start, pos_, LexState::Beg, std::move(name));
  };
  // `foo -1`, `foo *args`: an operator glued to its operand after a spaced method name.
  auto argumentPrefix = [&](size_t width) { return spaceBeforeArgument() && !isSpace(at(pos_ + width)); };

  if (isIdentStart(chr)) { return scanIdentifier(start); }
  if (isDigit(chr)) { return scanNumber(start, false); }

  switch (chr) {
    case '"': case '\'':
      return scanQuoted(start, chr);
    case '`':
      fail("backtick command strings are not supported", start, 1);
    case '?':
      return scanCharLiteral(start);
    case ':':
      return scanColon(start);
    case '@':
      return scanInstanceVar(start);
    case '$':
      return scanGlobalVar(start);
    case ',':
      return op(Comma, 1, LexState::Beg);
    case ';':
      return op(Semicolon, 1, LexState::Beg);
    case '~':
      if (fnameOrDot && nxt == '@') { return op(Tilde, 2, afterOperator()); }
      return op(Tilde, 1, afterOperator());
    case '(': {
      const bool callParen =
          state_ == LexState::EndFn ||
          (!spaceSeen_ && isArg() &&
           (lastKind_ == Identifier || lastKind_ == FunctionId || lastKind_ == Constant || lastKind_ == KwSuper ||
            lastKind_ == KwYield || lastKind_ == KwDefined || lastKind_ == KwNot));
      return op(callParen ? LParenCall : LParen, 1, LexState::Beg);
    }
    case ')':
      return op(RParen, 1, LexState::End);
    case ']':
      return op(RBracket, 1, LexState::End);
    case '}':
      return op(RBrace, 1, LexState::End);
    case '[':
      if (fnameOrDot) {
        if (nxt == ']' && at(pos_ + 2) == '=') { return op(Aset, 3, afterOperator()); }
        if (nxt == ']') { return op(Aref, 2, afterOperator()); }
        return op(LBracketIndex, 1, LexState::Beg);
      }
      if (isBeg() || (isArg() && spaceSeen_)) { return op(LBracket, 1, LexState::Beg); }
      return op(LBracketIndex, 1, LexState::Beg);
    case '{':
      if (!lambdaStack_.empty() && lambdaStack_.back() == parenDepth_) {
        lambdaStack_.pop_back();
        return op(LambdaBeg, 1, LexState::Beg);
      }
      if (isArg() || isEnd()) { return op(LBraceBlock, 1, LexState::Beg); }
      return op(LBrace, 1, LexState::Beg);
    case '.':
      if (nxt == '.' && at(pos_ + 2) == '.') { return op(isBeg() ? BDot3 : Dot3, 3, LexState::Beg); }
      if (nxt == '.') { return op(isBeg() ? BDot2 : Dot2, 2, LexState::Beg); }
      if (isDigit(nxt)) { fail("no .<digit> floating literal anymore; put 0 before dot", start, 2); }
      {
        const LexState next = defSingleton_ ? LexState::Fname : LexState::Dot;
        defSingleton_ = false;
        return op(Dot, 1, next);
      }
    case '=':
      if (nxt == '=' && at(pos_ + 2) == '=') { return op(Eqq, 3, afterOperator()); }
      if (nxt == '=') { return op(Eq, 2, afterOperator()); }
      if (nxt == '~') { return op(Match, 2, afterOperator()); }
      if (nxt == '>') { return op(Assoc, 2, LexState::Beg); }
      return op(Assign, 1, LexState::Beg);
    case '!':
      if (nxt == '=') { return op(Neq, 2, afterOperator()); }
      if (nxt == '~') { return op(NMatch, 2, afterOperator()); }
      if (fnameOrDot && nxt == '@') { return op(Bang, 2, afterOperator()); }
      return op(Bang, 1, afterOperator());
    case '<':
      if (nxt == '=' && at(pos_ + 2) == '>') { return op(Cmp, 3, afterOperator()); }
      if (nxt == '=') { return op(Le, 2, afterOperator()); }
      if (nxt == '<') {
        if (at(pos_ + 2) == '=') { return opAssign("<<"); }
        if (!fnameOrDot && state_ != LexState::Class && !isEnd() && (!isArg() || spaceSeen_)) {
          if (auto heredoc = scanHeredoc(start)) { return std::move(*heredoc); }
        }
        return op(LShift, 2, afterOperator());
      }
      return op(Lt, 1, afterOperator());
    case '>':
      if (nxt == '=') { return op(Ge, 2, afterOperator()); }
      if (nxt == '>') {
        if (at(pos_ + 2) == '=') { return opAssign(">>"); }
        return op(RShift, 2, afterOperator());
      }
      return op(Gt, 1, afterOperator());
    case '+':
      if (fnameOrDot) { return nxt == '@' ? op(UPlus, 2, afterOperator()) : op(Plus, 1, afterOperator()); }
      if (nxt == '=') { return opAssign("+"); }
      if (isBeg() || argumentPrefix(1)) {
        if (!isBeg()) { warn("ambiguous first argument; put parentheses or a space even after `+' operator", start); }
        if (isDigit(nxt)) {
          ++pos_;
          return scanNumber(start, false);
        }
        return op(UPlus, 1, LexState::Beg);
      }
      return op(Plus, 1, LexState::Beg);
    case '-':
      if (fnameOrDot) { return nxt == '@' ? op(UMinus, 2, afterOperator()) : op(Minus, 1, afterOperator()); }
      if (nxt == '=') { return opAssign("-"); }
      if (nxt == '>') { return op(Lambda, 2, LexState::EndFn); }
      if (isBeg() || argumentPrefix(1)) {
        if (!isBeg()) { warn("ambiguous first argument; put parentheses or a space even after `-' operator", start); }
        return op(isDigit(nxt) ? UMinusNum : UMinus, 1, LexState::Beg);
      }
      return op(Minus, 1, LexState::Beg);
    case '*':
      if (nxt == '*') {
        if (at(pos_ + 2) == '=') { return opAssign("**"); }
        if (fnameOrDot) { return op(Pow, 2, afterOperator()); }
        if (isBeg() || argumentPrefix(2)) {
          if (!isBeg()) { warn("`**' interpreted as argument prefix", start); }
          return op(DStarArg, 2, LexState::Beg);
        }
        return op(Pow, 2, LexState::Beg);
      }
      if (nxt == '=') { return opAssign("*"); }
      if (fnameOrDot) { return op(Star, 1, afterOperator()); }
      if (isBeg() || argumentPrefix(1)) {
        if (!isBeg()) { warn("`*' interpreted as argument prefix", start); }
        return op(StarArg, 1, LexState::Beg);
      }
      return op(Star, 1, LexState::Beg);
    case '&':
      if (nxt == '&') {
        if (at(pos_ + 2) == '=') { return opAssign("&&"); }
        return op(AndOp, 2, LexState::Beg);
      }
      if (nxt == '=') { return opAssign("&"); }
      if (nxt == '.' && !fnameOrDot) { return op(AndDot, 2, LexState::Dot); }
      if (fnameOrDot) { return op(Amper, 1, afterOperator()); }
      if (isBeg() || argumentPrefix(1)) {
        if (!isBeg()) { warn("`&' interpreted as argument prefix", start); }
        return op(AmperArg, 1, LexState::Beg);
      }
      return op(Amper, 1, LexState::Beg);
    case '|':
      if (nxt == '|' && !fnameOrDot) {
        if (at(pos_ + 2) == '=') { return opAssign("||"); }
        return op(OrOp, 2, LexState::Beg);
      }
      if (nxt == '=') { return opAssign("|"); }
      return op(Pipe, 1, afterOperator());
    case '^':
      if (nxt == '=') { return opAssign("^"); }
      return op(Caret, 1, afterOperator());
    case '/':
      if (fnameOrDot) { return op(Slash, 1, afterOperator()); }
      if (isBeg()) { return scanRegexp(start, pos_ + 1, '/', '/'); }
      if (nxt == '=') { return opAssign("/"); }
      if (argumentPrefix(1)) {
        warn("ambiguity between regexp and two divisions: wrap regexp in parentheses or add a space after `/' operator",
             start);
        return scanRegexp(start, pos_ + 1, '/', '/');
      }
      return op(Slash, 1, LexState::Beg);
    case '%':
      if (fnameOrDot) { return op(Percent, 1, afterOperator()); }
      if (isBeg() || (argumentPrefix(1) && nxt != '=')) { return scanPercent(start); }
      if (nxt == '=') { return opAssign("%"); }
      return op(Percent, 1, LexState::Beg);
    default:
      break;
  }
  const auto byte = static_cast<unsigned char>(chr);
  static constexpr char kHex[] = "0123456789abcdef";
  fail(std::string("Invalid char '\\x") + kHex[byte >> 4] + kHex[byte & 0xf] + "' in expression", start, 1);
}

Token Lexer::scanIdentifier(const size_t start) {
  using enum TokenKind;
  size_t p = start;
  while (p < end_ && isIdentChar(text_[p])) { ++p; }
  bool fid = false;
  if ((at(p) == '?' || at(p) == '!') && (at(p + 1) != '=' || at(p + 2) == '=' || at(p + 2) == '~')) {
    fid = true;
    ++p;
  }
  std::string name(text_.substr(start, p - start));

  if (at(p) == ':' && at(p + 1) != ':' && state_ != LexState::Dot && state_ != LexState::Fname &&
      (labelOk_ || (isArg() && spaceSeen_) || state_ == LexState::EndFn)) {
    pos_ = p + 1;
    return emit(Label, start, pos_, LexState::Beg, std::move(name));
  }

  if (state_ == LexState::Fname) {
    if (lastKind_ == KwDef && at(p) == '.' && at(p + 1) != '.') {
      pos_ = p;
      defSingleton_ = true;
      const TokenKind kind = name == "self" ? KwSelf : (std::isupper(static_cast<unsigned char>(name[0])) != 0 ? Constant : Identifier);
      return emit(kind, start, pos_, LexState::End, std::move(name));
    }
    if (!fid && at(p) == '=' && at(p + 1) != '~' && at(p + 1) != '>' && (at(p + 1) != '=' || at(p + 2) == '>')) {
      ++p;
      name.push_back('=');
    }
  } else if (state_ != LexState::Dot) {
    if (const Keyword* kw = findKeyword(name)) {
      pos_ = p;
      TokenKind kind = kw->kind;
      if (kind == KwDo) {
        if (!lambdaStack_.empty() && lambdaStack_.back() == parenDepth_) {
          lambdaStack_.pop_back();
          kind = KwDoLambda;
        } else if (!condStack_.empty() && condStack_.back() == parenDepth_) {
          condStack_.pop_back();
          kind = KwDoCond;
        } else if (!cmdArgStack_.empty() && cmdArgStack_.back() == parenDepth_) {
          cmdArgStack_.pop_back();
          kind = KwDoBlock;
        }
        return emit(kind, start, pos_, LexState::Beg);
      }
      if (kw->modifier != kw->kind && state_ != LexState::Beg && state_ != LexState::Class) {
        return emit(kw->modifier, start, pos_, LexState::Beg);
      }
      return emit(kind, start, pos_, kw->next);
    }
  }

  pos_ = p;
  TokenKind kind = Identifier;
  if (fid) {
    kind = FunctionId;
  } else if (std::isupper(static_cast<unsigned char>(name[0])) != 0) {
    kind = Constant;
  }
  LexState next = cmdStart_ ? LexState::CmdArg : LexState::Arg;
  if (state_ == LexState::Fname) {
    next = LexState::EndFn;
  } else if (state_ == LexState::Dot) {
    next = LexState::Arg;
  }
  return emit(kind, start, pos_, next, std::move(name));
}

// NOLINTNEXTLINE(readability-function-size,readability-function-cognitive-complexity)
Token Lexer::scanNumber(const size_t start, bool /*negative*/) {
  NumberLiteral lit;
  size_t p = pos_;
  auto digits = [&](bool (*accept)(char), size_t from) {
    size_t q = from;
    bool lastUnderscore = false;
    while (q < end_) {
      const char c = text_[q];
      if (accept(c)) {
        lit.digits.push_back(c);
        lastUnderscore = false;
      } else if (c == '_') {
        if (lastUnderscore || q == from) { fail("trailing '_' in number", q, 1); }
        lastUnderscore = true;
      } else {
        break;
      }
      ++q;
    }
    if (lastUnderscore) { fail("trailing '_' in number", q - 1, 1); }
    return q;
  };
  bool exponent = false;
  if (text_[p] == '0' && p + 1 < end_ && !isSpace(text_[p + 1])) {
    const char n = text_[p + 1];
    size_t from = 0;
    if (n == 'x' || n == 'X') {
      lit.base = 16;
      from = p + 2;
    } else if (n == 'b' || n == 'B') {
      lit.base = 2;
      from = p + 2;
    } else if (n == 'o' || n == 'O') {
      lit.base = 8;
      from = p + 2;
    } else if (n == 'd' || n == 'D') {
      lit.base = 10;
      from = p + 2;
    } else if (isOctal(n) || n == '_') {
      lit.base = 8;
      from = n == '_' ? p + 2 : p + 1;
    } else if (n == '8' || n == '9') {
      fail("Invalid octal digit", p + 1, 1);
    }
    if (from != 0) {
      bool (*accept)(char) = isDigit;
      if (lit.base == 16) { accept = isHex; }
      if (lit.base == 8) { accept = isOctal; }
      if (lit.base == 2) { accept = [](char c) { return c == '0' || c == '1'; }; }
      const size_t q = digits(accept, from);
      if (lit.digits.empty()) { fail("numeric literal without digits", start, q - start); }
      if (lit.base == 8 && (at(q) == '8' || at(q) == '9')) { fail("Invalid octal digit", q, 1); }
      return finishNumber(start, q, false, std::move(lit));
    }
  }
  p = digits(isDigit, p);
  if (at(p) == '.' && isDigit(at(p + 1))) {
    lit.isFloat = true;
    lit.digits.push_back('.');
    p = digits(isDigit, p + 1);
  }
  if ((at(p) == 'e' || at(p) == 'E') &&
      (isDigit(at(p + 1)) || ((at(p + 1) == '+' || at(p + 1) == '-') && isDigit(at(p + 2))))) {
    lit.isFloat = true;
    exponent = true;
    lit.digits.push_back('e');
    ++p;
    if (text_[p] == '+' || text_[p] == '-') { lit.digits.push_back(text_[p++]); }
    p = digits(isDigit, p);
  }
  return finishNumber(start, p, exponent, std::move(lit));
}

// Rational and imaginary suffixes; `r` never follows an exponent.
Token Lexer::finishNumber(const size_t start, size_t p, const bool exponent, NumberLiteral lit) {
  if (!exponent && at(p) == 'r' && at(p + 1) == 'i' && !isIdentChar(at(p + 2))) {
    lit.rational = true;
    lit.imaginary = true;
    p += 2;
  } else if (!exponent && at(p) == 'r' && !isIdentChar(at(p + 1))) {
    lit.rational = true;
    ++p;
  } else if (at(p) == 'i' && !isIdentChar(at(p + 1))) {
    lit.imaginary = true;
    ++p;
  }
  pos_ = p;
  const TokenKind kind = lit.isFloat ? TokenKind::Float : TokenKind::Integer;
  return emit(kind, start, pos_, LexState::End, std::move(lit));
}

Token Lexer::scanQuoted(const size_t start, const char quote) {
  pos_ = start + 1;
  Delimiters delims;
  delims.open = quote;
  delims.close = quote;
  delims.interpolate = quote == '"';
  delims.escapes = quote == '"' ? Escapes::Double : Escapes::Single;
  StringParts parts = scanContent(delims, start, end_);
  return emit(TokenKind::String, start, pos_, LexState::End, std::move(parts));
}

Token Lexer::scanCharLiteral(const size_t start) {
  const char c = at(start + 1);
  if (isEnd() || start + 1 >= end_ || isSpace(c) || (isIdentChar(c) && isIdentChar(at(start + 2)))) {
    pos_ = start + 1;
    return emit(TokenKind::Question, start, pos_, LexState::Beg);
  }
  std::string value;
  pos_ = start + 1;
  if (c == '\\') {
    readEscape(value, end_);
  } else {
    const auto lead = static_cast<unsigned char>(c);
    size_t width = 1;
    if ((lead & 0xE0) == 0xC0) {
      width = 2;
    } else if ((lead & 0xF0) == 0xE0) {
      width = 3;
    } else if ((lead & 0xF8) == 0xF0) {
      width = 4;
    }
    width = std::min(width, end_ - pos_);
    value.assign(text_.substr(pos_, width));
    pos_ += width;
  }
  StringPart part;
  part.text = std::move(value);
  part.range = SourceRange::fromBounds(static_cast<std::uint32_t>(start + 1), static_cast<std::uint32_t>(pos_));
  return emit(TokenKind::String, start, pos_, LexState::End, StringParts{std::move(part)});
}

Token Lexer::scanColon(const size_t start) {
  const char nxt = at(start + 1);
  if (nxt == ':') {
    if (isBeg() || state_ == LexState::Class || (isArg() && spaceSeen_ && !isSpace(at(start + 2)))) {
      pos_ = start + 2;
      return emit(TokenKind::Colon3, start, pos_, LexState::Beg);
    }
    pos_ = start + 2;
    return emit(TokenKind::Colon2, start, pos_, LexState::Dot);
  }
  if (isEnd() || isSpace(nxt) || nxt == '#' || start + 1 >= end_) {
    pos_ = start + 1;
    return emit(TokenKind::Colon, start, pos_, LexState::Beg);
  }
  if (nxt == '"' || nxt == '\'') {
    pos_ = start + 2;
    Delimiters delims;
    delims.open = nxt;
    delims.close = nxt;
    delims.interpolate = nxt == '"';
    delims.escapes = nxt == '"' ? Escapes::Double : Escapes::Single;
    StringParts parts = scanContent(delims, start, end_);
    return emit(TokenKind::Symbol, start, pos_, LexState::End, std::move(parts));
  }
  return scanSymbol(start);
}

Token Lexer::scanSymbol(const size_t start) {
  size_t p = start + 1;
  const char c = at(p);
  if (c == '@') {
    ++p;
    if (at(p) == '@') { ++p; }
    if (!isIdentStart(at(p)) || isDigit(at(p))) { fail("invalid symbol", start, p - start + 1); }
    while (isIdentChar(at(p))) { ++p; }
  } else if (c == '$') {
    ++p;
    if (isIdentStart(at(p))) {
      while (isIdentChar(at(p))) { ++p; }
    } else if (isDigit(at(p))) {
      while (isDigit(at(p))) { ++p; }
    } else if (at(p) != '\0' && std::string_view("~*$?!@/\\;,.=:<>\"&`'+0").find(at(p)) != std::string_view::npos) {
      ++p;
    } else {
      fail("invalid symbol", start, 2);
    }
  } else if (isIdentStart(c)) {
    while (isIdentChar(at(p))) { ++p; }
    if ((at(p) == '?' || at(p) == '!') && at(p + 1) != '=') {
      ++p;
    } else if (at(p) == '=' && at(p + 1) != '~' && at(p + 1) != '>' && (at(p + 1) != '=' || at(p + 2) == '>')) {
      ++p;
    }
  } else {
    const std::string_view rest = text_.substr(p, end_ - p);
    bool matched = false;
    for (const auto opName : kSymbolOperators) {
      if (rest.rfind(opName, 0) == 0) {
        p += opName.size();
        matched = true;
        break;
      }
    }
    if (!matched) {
      pos_ = start + 1;
      return emit(TokenKind::Colon, start, pos_, LexState::Beg);
    }
  }
  pos_ = p;
  return emit(TokenKind::Symbol, start, pos_, LexState::End, std::string(text_.substr(start + 1, p - start - 1)));
}

Token Lexer::scanPercent(const size_t start) {
  char type = 'Q';
  size_t p = start + 1;
  if (std::isalnum(static_cast<unsigned char>(at(p))) != 0) {
    type = at(p);
    ++p;
  }
  const char open = at(p);
  if (p >= end_ || std::isalnum(static_cast<unsigned char>(open)) != 0 || isSpace(open)) {
    fail("unknown type of %string", start, p - start + 1);
  }
  char close = open;
  if (open == '(') { close = ')'; }
  if (open == '[') { close = ']'; }
  if (open == '{') { close = '}'; }
  if (open == '<') { close = '>'; }
  pos_ = p + 1;
  Delimiters delims;
  delims.open = open;
  delims.close = close;
  switch (type) {
    case 'Q':
      delims.interpolate = true;
      delims.escapes = Escapes::Double;
      break;
    case 'q':
      delims.escapes = Escapes::Single;
      break;
    case 's': {
      delims.escapes = Escapes::Single;
      StringParts parts = scanContent(delims, start, end_);
      return emit(TokenKind::Symbol, start, pos_, LexState::End, std::move(parts));
    }
    case 'w':
    case 'i': {
      StringParts words = scanWords(open, close, start);
      return emit(type == 'w' ? TokenKind::Words : TokenKind::Symbols, start, pos_, LexState::End, std::move(words));
    }
    case 'r':
      return scanRegexp(start, pos_, close, open);
    default:
      fail(std::string("unsupported %-literal type '") + type + "'", start, p - start + 1);
  }
  StringParts parts = scanContent(delims, start, end_);
  return emit(TokenKind::String, start, pos_, LexState::End, std::move(parts));
}

Token Lexer::scanRegexp(const size_t start, const size_t contentStart, const char close, const char open) {
  pos_ = contentStart;
  Delimiters delims;
  delims.open = open;
  delims.close = close;
  delims.interpolate = true;
  delims.escapes = Escapes::Regexp;
  RegexpLiteral lit;
  lit.parts = scanContent(delims, start, end_);
  lit.options = readOptions();
  return emit(TokenKind::Regexp, start, pos_, LexState::End, std::move(lit));
}

std::string Lexer::readOptions() {
  std::string options;
  while (pos_ < end_ && isIdentChar(text_[pos_])) {
    const char c = text_[pos_];
    if (std::string_view("imxounse").find(c) == std::string_view::npos) {
      fail(std::string("unknown regexp option - ") + c, pos_, 1);
    }
    options.push_back(c);
    ++pos_;
  }
  return options;
}

// NOLINTNEXTLINE(readability-function-size,readability-function-cognitive-complexity)
std::optional<Token> Lexer::scanHeredoc(const size_t start) {
  size_t p = start + 2;
  bool squiggly = false;
  bool indented = false;
  if (at(p) == '~') {
    squiggly = true;
    ++p;
  } else if (at(p) == '-') {
    indented = true;
    ++p;
  }
  char quote = 0;
  std::string id;
  if (at(p) == '\'' || at(p) == '"' || at(p) == '`') {
    quote = at(p);
    const size_t idStart = p + 1;
    size_t q = idStart;
    while (q < end_ && text_[q] != quote && text_[q] != '\n') { ++q; }
    if (at(q) != quote) { fail("unterminated here document identifier", start, q - start); }
    id.assign(text_.substr(idStart, q - idStart));
    p = q + 1;
  } else {
    if (!isIdentChar(at(p))) { return std::nullopt; }
    const size_t idStart = p;
    while (isIdentChar(at(p))) { ++p; }
    id.assign(text_.substr(idStart, p - idStart));
  }
  if (quote == '`') { fail("backtick command strings are not supported", start, p - start); }
  const size_t openerEnd = p;

  const size_t lineEnd = text_.find('\n', openerEnd);
  if (lineEnd == std::string_view::npos || lineEnd >= end_) {
    fail("can't find string \"" + id + "\" anywhere before EOF", start, openerEnd - start);
  }
  const size_t bodyStart = heredocResume_ != std::string::npos ? heredocResume_ : lineEnd + 1;
  size_t bodyEnd = std::string::npos;
  size_t resume = end_;
  for (size_t ls = bodyStart; ls < end_;) {
    size_t le = text_.find('\n', ls);
    if (le == std::string_view::npos || le > end_) { le = end_; }
    std::string_view line = text_.substr(ls, le - ls);
    if (!line.empty() && line.back() == '\r') { line.remove_suffix(1); }
    if (squiggly || indented) {
      const size_t first = line.find_first_not_of(" \t");
      line = first == std::string_view::npos ? std::string_view{} : line.substr(first);
    }
    if (line == id) {
      bodyEnd = ls;
      resume = le < end_ ? le + 1 : end_;
      break;
    }
    ls = le + 1;
  }
  if (bodyEnd == std::string::npos) {
    fail("can't find string \"" + id + "\" anywhere before EOF", start, openerEnd - start);
  }

  size_t dedent = 0;
  if (squiggly) {
    dedent = std::string::npos;
    for (size_t ls = bodyStart; ls < bodyEnd;) {
      size_t le = text_.find('\n', ls);
      if (le == std::string_view::npos || le > bodyEnd) { le = bodyEnd; }
      size_t width = 0;
      size_t q = ls;
      while (q < le && (text_[q] == ' ' || text_[q] == '\t')) {
        width += text_[q] == '\t' ? 8 - (width % 8) : 1;
        ++q;
      }
      const bool blank = q >= le || text_[q] == '\r';
      if (!blank) { dedent = std::min(dedent, width); }
      ls = le + 1;
    }
    if (dedent == std::string::npos) { dedent = 0; }
  }

  Delimiters delims;
  delims.interpolate = quote != '\'';
  delims.escapes = quote == '\'' ? Escapes::Raw : Escapes::Double;
  pos_ = bodyStart;
  StringParts parts = scanContent(delims, start, bodyEnd, dedent);
  pos_ = openerEnd;
  heredocResume_ = resume;
  return emit(TokenKind::String, start, openerEnd, LexState::End, std::move(parts));
}

Token Lexer::scanInstanceVar(const size_t start) {
  size_t p = start + 1;
  TokenKind kind = TokenKind::InstanceVar;
  if (at(p) == '@') {
    kind = TokenKind::ClassVar;
    ++p;
  }
  if (isDigit(at(p))) {
    const std::string what = kind == TokenKind::ClassVar ? "a class variable" : "an instance variable";
    fail("'" + std::string(text_.substr(start, p - start + 1)) + "' is not allowed as " + what + " name", start,
         p - start + 1);
  }
  if (!isIdentStart(at(p))) {
    const std::string what = kind == TokenKind::ClassVar ? "a class variable" : "an instance variable";
    fail("'" + std::string(text_.substr(start, p - start)) + "' without identifiers is not allowed as " + what +
             " name",
         start, p - start);
  }
  while (isIdentChar(at(p))) { ++p; }
  pos_ = p;
  return emit(kind, start, pos_, LexState::End, std::string(text_.substr(start, p - start)));
}

Token Lexer::scanGlobalVar(const size_t start) {
  size_t p = start + 1;
  const char c = at(p);
  if (c == '&' || c == '`' || c == '\'' || c == '+') {
    pos_ = p + 1;
    return emit(TokenKind::BackRef, start, pos_, LexState::End, std::string(1, c));
  }
  if (isDigit(c) && c != '0') {
    while (isDigit(at(p))) { ++p; }
    pos_ = p;
    return emit(TokenKind::NthRef, start, pos_, LexState::End, std::string(text_.substr(start + 1, p - start - 1)));
  }
  if (c == '-' && isIdentChar(at(p + 1))) {
    pos_ = p + 2;
    return emit(TokenKind::GlobalVar, start, pos_, LexState::End, std::string(text_.substr(start, 3)));
  }
  if (c != '\0' && std::string_view("~*$?!@/\\;,.=:<>\"0").find(c) != std::string_view::npos) {
    pos_ = p + 1;
    return emit(TokenKind::GlobalVar, start, pos_, LexState::End, std::string(text_.substr(start, 2)));
  }
  if (!isIdentStart(c)) {
    fail("'$' without identifiers is not allowed as a global variable name", start, 1);
  }
  while (isIdentChar(at(p))) { ++p; }
  pos_ = p;
  return emit(TokenKind::GlobalVar, start, pos_, LexState::End, std::string(text_.substr(start, p - start)));
}

// NOLINTNEXTLINE(readability-function-size,readability-function-cognitive-complexity)
StringParts Lexer::scanContent(const Delimiters& delims, const size_t openerStart, const size_t limit,
                               const size_t dedent) {
  StringParts parts;
  std::string buf;
  size_t segStart = pos_;
  int depth = 0;
  bool lineStart = dedent > 0;
  auto flush = [&](size_t stop) {
    if (buf.empty()) { return; }
    StringPart part;
    part.text = std::move(buf);
    part.range = SourceRange::fromBounds(static_cast<std::uint32_t>(segStart), static_cast<std::uint32_t>(stop));
    parts.push_back(std::move(part));
    buf.clear();
  };
  auto pushCode = [&](size_t begin, size_t codeBegin, size_t codeEnd, size_t stop) {
    flush(begin);
    StringPart part;
    part.kind = StringPart::Kind::Code;
    part.range = SourceRange::fromBounds(static_cast<std::uint32_t>(begin), static_cast<std::uint32_t>(stop));
    part.code = SourceRange::fromBounds(static_cast<std::uint32_t>(codeBegin), static_cast<std::uint32_t>(codeEnd));
    parts.push_back(std::move(part));
    pos_ = stop;
    segStart = pos_;
  };
  const char* what = delims.escapes == Escapes::Regexp ? "regexp" : "string";
  while (true) {
    if (lineStart) {
      size_t width = 0;
      while (pos_ < limit && width < dedent && (text_[pos_] == ' ' || text_[pos_] == '\t')) {
        const size_t step = text_[pos_] == '\t' ? 8 - (width % 8) : 1;
        if (width + step > dedent) { break; }
        width += step;
        ++pos_;
      }
      if (buf.empty()) { segStart = pos_; }
      lineStart = false;
    }
    if (pos_ >= limit) {
      if (delims.close == 0) {
        flush(pos_);
        break;
      }
      fail(std::string("unterminated ") + what + " meets end of file", openerStart, 1);
    }
    const char c = text_[pos_];
    if (delims.close != 0 && c == delims.close && depth == 0) {
      flush(pos_);
      ++pos_;
      break;
    }
    if (delims.close != 0 && delims.open != delims.close) {
      if (c == delims.open) { ++depth; }
      if (c == delims.close) { --depth; }
    }
    if (c == '\\' && delims.escapes != Escapes::Raw) {
      const char n = pos_ + 1 < limit ? text_[pos_ + 1] : '\0';
      switch (delims.escapes) {
        case Escapes::Double:
          readEscape(buf, limit);
          break;
        case Escapes::Single:
          if (n == '\\' || (n != '\0' && (n == delims.close || n == delims.open))) {
            buf.push_back(n);
            pos_ += 2;
          } else {
            buf.push_back('\\');
            ++pos_;
          }
          break;
        case Escapes::Regexp:
          if (n == '/' && delims.close == '/') {
            buf.push_back('/');
          } else {
            buf.push_back('\\');
            if (n != '\0') { buf.push_back(n); }
          }
          pos_ += n != '\0' ? 2 : 1;
          break;
        case Escapes::Raw:
          break;
      }
      continue;
    }
    if (delims.interpolate && c == '#' && pos_ + 1 < limit) {
      const char n = text_[pos_ + 1];
      if (n == '{') {
        const size_t close = findInterpolationEnd(pos_ + 2, limit);
        pushCode(pos_, pos_ + 2, close, close + 1);
        continue;
      }
      if (n == '@' || n == '$') {
        size_t q = pos_ + 2;
        if (n == '@' && at(q) == '@') { ++q; }
        const bool valid = n == '@' ? (isIdentStart(at(q)) && !isDigit(at(q))) : (isIdentStart(at(q)) || isDigit(at(q)));
        if (valid && q < limit) {
          while (q < limit && isIdentChar(text_[q])) { ++q; }
          pushCode(pos_, pos_ + 1, q, q);
          continue;
        }
      }
    }
    buf.push_back(c);
    ++pos_;
    if (c == '\n' && dedent > 0) { lineStart = true; }
  }
  return parts;
}

StringParts Lexer::scanWords(const char open, const char close, const size_t openerStart) {
  StringParts words;
  std::string buf;
  size_t wordStart = std::string::npos;
  int depth = 0;
  auto finishWord = [&]() {
    if (wordStart == std::string::npos) { return; }
    StringPart part;
    part.text = std::move(buf);
    part.range = SourceRange::fromBounds(static_cast<std::uint32_t>(wordStart), static_cast<std::uint32_t>(pos_));
    words.push_back(std::move(part));
    buf.clear();
    wordStart = std::string::npos;
  };
  while (true) {
    if (pos_ >= end_) { fail("unterminated list meets end of file", openerStart, 1); }
    const char c = text_[pos_];
    if (c == close && depth == 0) {
      finishWord();
      ++pos_;
      break;
    }
    if (open != close) {
      if (c == open) { ++depth; }
      if (c == close) { --depth; }
    }
    if (isSpace(c)) {
      finishWord();
      ++pos_;
      continue;
    }
    if (wordStart == std::string::npos) { wordStart = pos_; }
    if (c == '\\' && pos_ + 1 < end_) {
      const char n = text_[pos_ + 1];
      if (isSpace(n) || n == '\\' || n == open || n == close) {
        buf.push_back(n);
        pos_ += 2;
        continue;
      }
    }
    buf.push_back(c);
    ++pos_;
  }
  return words;
}

size_t Lexer::findInterpolationEnd(const size_t codeStart, const size_t limit) const {
  LexerOptions sub;
  sub.defaultEncoding = encoding_;
  sub.embedded = true;
  sub.begin = codeStart;
  sub.end = limit;
  Lexer nested(source_, sub);
  int depth = 0;
  while (true) {
    const Token tok = nested.next();
    switch (tok.kind) {
      case TokenKind::LBrace:
      case TokenKind::LBraceBlock:
      case TokenKind::LambdaBeg:
        ++depth;
        break;
      case TokenKind::RBrace:
        if (depth == 0) { return tok.range.start; }
        --depth;
        break;
      case TokenKind::EndOfInput:
        fail("unterminated string meets end of file", codeStart >= 2 ? codeStart - 2 : codeStart, 2);
      default:
        break;
    }
  }
}

// NOLINTNEXTLINE(readability-function-size,readability-function-cognitive-complexity)
void Lexer::readEscape(std::string& out, const size_t limit) {
  const size_t escStart = pos_;
  ++pos_;
  if (pos_ >= limit) { fail("invalid escape at end of input", escStart, 1); }
  const char c = text_[pos_++];
  auto peekChar = [&]() { return pos_ < limit ? text_[pos_] : '\0'; };
  auto control = [](char t) { return static_cast<char>(t == '?' ? 0x7f : (t & 0x9f)); };
  switch (c) {
    case 'n': out.push_back('\n'); return;
    case 't': out.push_back('\t'); return;
    case 'r': out.push_back('\r'); return;
    case 'f': out.push_back('\f'); return;
    case 'v': out.push_back('\v'); return;
    case 'a': out.push_back('\a'); return;
    case 'b': out.push_back('\b'); return;
    case 'e': out.push_back('\x1b'); return;
    case 's': out.push_back(' '); return;
    case '\n': return;
    case 'x': {
      unsigned value = 0;
      int count = 0;
      while (count < 2 && isHex(peekChar())) {
        value = value * 16 + static_cast<unsigned>(hexValue(text_[pos_]));
        ++pos_;
        ++count;
      }
      if (count == 0) { fail("invalid hex escape", escStart, pos_ - escStart); }
      out.push_back(static_cast<char>(value));
      return;
    }
    case 'u': {
      if (peekChar() == '{') {
        ++pos_;
        bool any = false;
        while (true) {
          while (peekChar() == ' ' || peekChar() == '\t') { ++pos_; }
          if (peekChar() == '}') {
            ++pos_;
            break;
          }
          unsigned long cp = 0;
          int count = 0;
          while (isHex(peekChar())) {
            cp = cp * 16 + static_cast<unsigned long>(hexValue(text_[pos_]));
            ++pos_;
            ++count;
          }
          if (count == 0 || count > 6) { fail("invalid Unicode escape", escStart, pos_ - escStart + 1); }
          appendCodepoint(out, cp, escStart);
          any = true;
        }
        if (!any) { fail("invalid Unicode escape", escStart, pos_ - escStart); }
        return;
      }
      unsigned long cp = 0;
      for (int i = 0; i < 4; ++i) {
        if (!isHex(peekChar())) { fail("invalid Unicode escape", escStart, pos_ - escStart + 1); }
        cp = cp * 16 + static_cast<unsigned long>(hexValue(text_[pos_]));
        ++pos_;
      }
      appendCodepoint(out, cp, escStart);
      return;
    }
    case 'c': {
      if (peekChar() == '\0') { fail("invalid control escape", escStart, 2); }
      out.push_back(control(text_[pos_++]));
      return;
    }
    case 'C': {
      if (peekChar() != '-' || pos_ + 1 >= limit) { fail("invalid control escape", escStart, 2); }
      ++pos_;
      out.push_back(control(text_[pos_++]));
      return;
    }
    case 'M': {
      if (peekChar() != '-' || pos_ + 1 >= limit) { fail("invalid meta escape", escStart, 2); }
      ++pos_;
      char t = text_[pos_];
      if (t == '\\') {
        std::string inner;
        readEscape(inner, limit);
        t = inner.empty() ? '\0' : inner[0];
      } else {
        ++pos_;
      }
      out.push_back(static_cast<char>(static_cast<unsigned char>(t) | 0x80U));
      return;
    }
    default:
      break;
  }
  if (isOctal(c)) {
    unsigned value = static_cast<unsigned>(c - '0');
    int count = 1;
    while (count < 3 && isOctal(peekChar())) {
      value = value * 8 + static_cast<unsigned>(text_[pos_] - '0');
      ++pos_;
      ++count;
    }
    out.push_back(static_cast<char>(value & 0xffU));
    return;
  }
  out.push_back(c);
}

void Lexer::appendCodepoint(std::string& out, const unsigned long cp, const size_t at) const {
  if (cp > 0x10FFFFUL || U_IS_SURROGATE(cp)) { fail("invalid Unicode codepoint", at, pos_ - at); }
  std::uint8_t bytes[U8_MAX_LENGTH];
  std::int32_t length = 0;
  U8_APPEND_UNSAFE(bytes, length, static_cast<UChar32>(cp));
  out.append(reinterpret_cast<const char*>(bytes), static_cast<size_t>(length));
}

} // namespace rbparse::lex
