/**
 * Name: rbparse::lex::Lexer
 * Purpose: Context-sensitive Ruby tokenizer over a SourceBuffer (or a byte range of one).
 * Theory of Operation:
 *   Tokens are produced on demand into a lookahead buffer. A LexState plus
 *   three paren-depth keyed stacks (pending loop conditions, command
 *   arguments, lambdas) decide the ambiguous tokens without parser feedback.
 *   Heredoc bodies are consumed out of line: the opener records where
 *   lexing resumes once the current line ends.
 */
#pragma once

#include <cstddef>
#include <deque>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "lexer/ITokenStream.h"
#include "lexer/LexState.h"
#include "lexer/LexerOptions.h"
#include "lexer/SourceBuffer.h"

namespace rbparse::lex {

class Lexer : public ITokenStream {
public:
    // Throws exceptions::LexError for an unknown or invalid source encoding.
    explicit Lexer(const SourceBuffer& source, LexerOptions options = {});

    // ITokenStream
    const Token& peek(size_t lookahead = 0) override;

    Token next() override;

    // Drains the remaining tokens, EndOfInput included.
    std::vector<Token> tokens();

    const std::string& encoding() const { return encoding_; }
    std::optional<bool> frozenStringLiteral() const { return frozen_; }
    LexState state() const { return state_; }

private:
    enum class Escapes { Single, Double, Regexp, Raw };
    enum class FitemMode { None, AliasFirst, AliasSecond, Undef };

    struct Delimiters {
        char open{0};
        char close{0}; // 0: runs to the scan limit (heredoc bodies)
        bool interpolate{false};
        Escapes escapes{Escapes::Double};
    };

    const SourceBuffer& source_;
    std::string_view text_;
    LexerOptions options_;
    size_t pos_{0};
    size_t end_{0};
    std::string encoding_{};
    std::optional<bool> frozen_{};

    LexState state_{LexState::Beg};
    bool spaceSeen_{false};
    bool cmdStart_{true};
    bool labelOk_{false};
    bool commandNamePending_{false};
    bool defSingleton_{false};
    FitemMode fitem_{FitemMode::None};
    int parenDepth_{0};
    std::vector<int> condStack_{}; // while/until/for conditions awaiting do
    std::vector<int> cmdArgStack_{}; // command calls whose arguments are open
    std::vector<int> lambdaStack_{}; // -> awaiting its body
    size_t heredocResume_{std::string::npos};
    TokenKind lastKind_{TokenKind::EndOfInput};

    std::deque<Token> buffer_{}; // lookahead buffer
    bool done_{false};

    // helpers
    bool ensure(size_t lookahead); // ensure buffer has at least k+1 tokens
    Token scan(); // scan a single token
    Token scanToken();
    Token emit(TokenKind kind, size_t start, size_t stop, LexState next, TokenValue value = {});
    [[noreturn]] void fail(const std::string& message, size_t start, size_t length) const;
    void warn(const std::string& message, size_t at) const;

    bool isBeg() const;
    bool isArg() const;
    bool isEnd() const;
    bool spaceBeforeArgument() const; // `foo -1`, `foo *a`, `foo [1]`
    bool newlineIgnored() const;
    bool continuesWithLeadingDot(size_t from) const;
    LexState afterOperator() const;
    char at(size_t p) const { return p < end_ ? text_[p] : '\0'; }

    void validateEncoding();
    void skipEmbeddedDocument();
    void popStacksAtDepth();

    Token scanIdentifier(size_t start);
    Token scanNumber(size_t start, bool negative);
    Token finishNumber(size_t start, size_t p, bool exponent, NumberLiteral lit);
    Token scanQuoted(size_t start, char quote);
    Token scanCharLiteral(size_t start);
    Token scanColon(size_t start);
    Token scanSymbol(size_t start);
    Token scanPercent(size_t start);
    Token scanRegexp(size_t start, size_t contentStart, char close, char open);
    std::optional<Token> scanHeredoc(size_t start);
    Token scanInstanceVar(size_t start);
    Token scanGlobalVar(size_t start);

    StringParts scanContent(const Delimiters& delims, size_t openerStart, size_t limit, size_t dedent = 0);
    StringParts scanWords(char open, char close, size_t openerStart);
    size_t findInterpolationEnd(size_t codeStart, size_t limit) const;
    void readEscape(std::string& out, size_t limit);
    void appendCodepoint(std::string& out, unsigned long cp, size_t at) const;
    std::string readOptions();
};

} // namespace rbparse::lex
