/***
 * Name: rbparse::grammar::GrammarReader
 * Purpose: Tokenize and parse grammar files.
 */
#include "grammar/GrammarReader.h"

#include <cctype>
#include <fstream>
#include <sstream>
#include <utility>
#include <vector>

#include "rbparse/exceptions/file_read_error.h"
#include "rbparse/exceptions/grammar_error.h"

namespace rbparse::grammar {

namespace {

struct Word {
  enum class Kind { Name, Directive, Punct, Action, Separator, End };
  Kind kind{Kind::End};
  std::string text{};
  int line{0};
};

class Scanner {
 public:
  Scanner(std::string_view text, std::string name) : text_(text), name_(std::move(name)) {}

  [[noreturn]] void fail(const std::string& message, const int line) const {
    throw exceptions::GrammarError(name_ + ":" + std::to_string(line) + ": " + message);
  }

  // NOLINTNEXTLINE(readability-function-cognitive-complexity)
  Word next() {
    skipTrivia();
    Word word;
    word.line = line_;
    if (pos_ >= text_.size()) { return word; }
    const char chr = text_[pos_];
    if (std::isalnum(static_cast<unsigned char>(chr)) != 0 || chr == '_' || chr == '$') {
      const size_t start = pos_;
      ++pos_;
      while (pos_ < text_.size() &&
             (std::isalnum(static_cast<unsigned char>(text_[pos_])) != 0 || text_[pos_] == '_')) {
        ++pos_;
      }
      word.kind = Word::Kind::Name;
      word.text = std::string(text_.substr(start, pos_ - start));
      return word;
    }
    if (chr == '%') {
      if (pos_ + 1 < text_.size() && text_[pos_ + 1] == '%') {
        pos_ += 2;
        word.kind = Word::Kind::Separator;
        return word;
      }
      const size_t start = ++pos_;
      while (pos_ < text_.size() && std::isalpha(static_cast<unsigned char>(text_[pos_])) != 0) { ++pos_; }
      word.kind = Word::Kind::Directive;
      word.text = std::string(text_.substr(start, pos_ - start));
      return word;
    }
    if (chr == '{') {
      const size_t close = text_.find('}', pos_);
      if (close == std::string_view::npos) { fail("unterminated action block", line_); }
      const std::string body(text_.substr(pos_ + 1, close - pos_ - 1));
      for (const char c : body) {
        if (c == '\n') { ++line_; }
      }
      const size_t first = body.find_first_not_of(" \t\r\n");
      const size_t last = body.find_last_not_of(" \t\r\n");
      word.kind = Word::Kind::Action;
      word.text = first == std::string::npos ? std::string{} : body.substr(first, last - first + 1);
      pos_ = close + 1;
      return word;
    }
    if (chr == ':' || chr == '|' || chr == ';') {
      ++pos_;
      word.kind = Word::Kind::Punct;
      word.text = std::string(1, chr);
      return word;
    }
    fail(std::string("unexpected character '") + chr + "'", line_);
  }

  // Names remaining on the current line (declaration arguments).
  std::vector<std::string> restOfLine() {
    std::vector<std::string> names;
    while (true) {
      while (pos_ < text_.size() && (text_[pos_] == ' ' || text_[pos_] == '\t' || text_[pos_] == '\r')) { ++pos_; }
      if (pos_ >= text_.size() || text_[pos_] == '\n' || text_[pos_] == '#') { return names; }
      const Word word = next();
      if (word.kind != Word::Kind::Name) { fail("expected a symbol name in declaration", word.line); }
      names.push_back(word.text);
    }
  }

  int line() const { return line_; }

 private:
  void skipTrivia() {
    while (pos_ < text_.size()) {
      const char chr = text_[pos_];
      if (chr == '\n') {
        ++line_;
        ++pos_;
      } else if (std::isspace(static_cast<unsigned char>(chr)) != 0) {
        ++pos_;
      } else if (chr == '#') {
        while (pos_ < text_.size() && text_[pos_] != '\n') { ++pos_; }
      } else {
        return;
      }
    }
  }

  std::string_view text_;
  std::string name_;
  size_t pos_{0};
  int line_{1};
};

int parseCount(const Scanner& scanner, const std::string& text, const int line) {
  if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
    scanner.fail("%expect takes a number, got '" + text + "'", line);
  }
  return std::stoi(text);
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
void readDeclarations(Scanner& scanner, Grammar& grammar) {
  int level = 0;
  while (true) {
    const Word word = scanner.next();
    if (word.kind == Word::Kind::Separator) { return; }
    if (word.kind != Word::Kind::Directive) { scanner.fail("expected a declaration or %%", word.line); }
    const std::vector<std::string> args = scanner.restOfLine();
    if (word.text == "entry" && args.size() != 2) { scanner.fail("%entry takes a token and a start symbol", word.line); }
    if ((word.text == "eof" || word.text == "expect") && args.size() != 1) {
      scanner.fail("%" + word.text + " takes one argument", word.line);
    }
    if (word.text == "expect") {
      grammar.expectedConflicts = parseCount(scanner, args[0], word.line);
      continue;
    }
    const bool known = word.text == "token" || word.text == "left" || word.text == "right" ||
                       word.text == "nonassoc" || word.text == "entry" || word.text == "eof";
    if (!known) { scanner.fail("unknown directive %" + word.text, word.line); }
    try {
      if (word.text == "token") {
        for (const auto& name : args) { grammar.declareTerminal(name); }
      } else if (word.text == "entry") {
        grammar.addEntry(args[0], args[1]);
      } else if (word.text == "eof") {
        grammar.setEndTerminal(args[0]);
      } else {
        Precedence prec;
        prec.level = ++level;
        prec.assoc = word.text == "left" ? Assoc::Left : (word.text == "right" ? Assoc::Right : Assoc::NonAssoc);
        for (const auto& name : args) { grammar.declarePrecedence(name, prec); }
      }
    } catch (const exceptions::GrammarError& err) {
      scanner.fail(err.what(), word.line);
    }
  }
}

} // namespace

// NOLINTNEXTLINE(readability-function-size,readability-function-cognitive-complexity)
Grammar GrammarReader::parse(std::string_view text, const std::string& name) {
  Grammar grammar;
  Scanner scanner(text, name);
  readDeclarations(scanner, grammar);

  while (true) {
    const Word lhsWord = scanner.next();
    if (lhsWord.kind == Word::Kind::End || lhsWord.kind == Word::Kind::Separator) { break; }
    if (lhsWord.kind != Word::Kind::Name) { scanner.fail("expected a rule name", lhsWord.line); }
    int lhs = 0;
    try {
      lhs = grammar.internNonterminal(lhsWord.text);
    } catch (const exceptions::GrammarError& err) {
      scanner.fail(err.what(), lhsWord.line);
    }
    const Word colon = scanner.next();
    if (colon.kind != Word::Kind::Punct || colon.text != ":") {
      scanner.fail("expected ':' after " + lhsWord.text, colon.line);
    }

    Production current;
    current.lhs = lhs;
    current.line = scanner.line();
    bool explicitAction = false;
    auto finish = [&]() {
      if (!explicitAction) { current.passIndex = current.rhs.empty() ? -1 : 0; }
      grammar.addProduction(std::move(current));
      current = Production{};
      current.lhs = lhs;
      current.line = scanner.line();
      explicitAction = false;
    };
    while (true) {
      const Word word = scanner.next();
      if (word.kind == Word::Kind::End) { scanner.fail("rule '" + lhsWord.text + "' is missing ';'", word.line); }
      if (word.kind == Word::Kind::Punct && word.text == ";") {
        finish();
        break;
      }
      if (word.kind == Word::Kind::Punct && word.text == "|") {
        finish();
        continue;
      }
      if (explicitAction) { scanner.fail("symbols after the action block", word.line); }
      if (word.kind == Word::Kind::Directive) {
        if (word.text != "prec") { scanner.fail("unknown directive %" + word.text + " in rule", word.line); }
        const Word tag = scanner.next();
        const auto prec = grammar.precedenceOf(tag.text);
        if (tag.kind != Word::Kind::Name || !prec) { scanner.fail("%prec names no precedence: " + tag.text, tag.line); }
        current.prec = *prec;
        continue;
      }
      if (word.kind == Word::Kind::Action) {
        explicitAction = true;
        if (word.text == "None" || word.text.empty()) {
          current.passIndex = -1;
        } else if (word.text[0] == '$') {
          const std::string digits = word.text.substr(1);
          if (digits.empty() || digits.find_first_not_of("0123456789") != std::string::npos) {
            scanner.fail("bad pass-through '" + word.text + "'", word.line);
          }
          const int index = std::stoi(digits);
          if (index < 1 || static_cast<size_t>(index) > current.rhs.size()) {
            scanner.fail("pass-through " + word.text + " is out of range", word.line);
          }
          current.passIndex = index - 1;
        } else {
          current.action = word.text;
          grammar.actionIndex(word.text);
        }
        continue;
      }
      if (word.kind != Word::Kind::Name) { scanner.fail("unexpected '" + word.text + "' in rule", word.line); }
      if (const auto sym = grammar.findSymbol(word.text)) {
        current.rhs.push_back(*sym);
        continue;
      }
      try {
        current.rhs.push_back(grammar.nonterminalSymbol(grammar.internNonterminal(word.text)));
      } catch (const exceptions::GrammarError& err) {
        scanner.fail(err.what(), word.line);
      }
    }
  }
  try {
    grammar.finalize();
  } catch (const exceptions::GrammarError& err) {
    throw exceptions::GrammarError(name + ": " + err.what());
  }
  return grammar;
}

Grammar GrammarReader::readFile(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) { throw exceptions::FileReadError("cannot open grammar file: " + path); }
  std::ostringstream content;
  content << in.rdbuf();
  return parse(content.str(), path);
}

} // namespace rbparse::grammar
