/**
 * Name: rbparse::lex::LexerOptions
 * Purpose: Construction-time configuration of a Lexer.
 */
#pragma once

#include <cstddef>
#include <string>

namespace rbparse {
class WarningSink;
}

namespace rbparse::lex {

struct LexerOptions {
    std::string defaultEncoding{"UTF-8"}; // used when no magic comment is present
    WarningSink* warnings{nullptr};
    // Fragment lexing (interpolated code): no magic comments, no re-validation.
    bool embedded{false};
    size_t begin{0};
    size_t end{std::string::npos};
};

} // namespace rbparse::lex
