/**
 * Name: rbparse::lex::Token
 * Purpose: Token structure with source range, location and literal payload.
 */
#pragma once

#include <string>
#include <variant>
#include "lexer/NumberLiteral.h"
#include "lexer/RegexpLiteral.h"
#include "lexer/StringPart.h"
#include "lexer/TokenKind.h"
#include "rbparse/support/SourceRange.h"

namespace rbparse::lex {

// monostate: no payload; string: names (labels, symbols, op-assign operator, $-refs);
// StringParts: strings, dynamic symbols, %w/%i elements.
using TokenValue = std::variant<std::monostate, NumberLiteral, std::string, StringParts, RegexpLiteral>;

struct Token {
    TokenKind kind{TokenKind::EndOfInput};
    std::string text{}; // raw lexeme
    SourceRange range{};
    int line{1}; // 1-based line number
    int col{1}; // 1-based column at token start
    TokenValue value{};
};

} // namespace rbparse::lex
