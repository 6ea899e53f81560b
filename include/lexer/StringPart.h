/**
 * Name: rbparse::lex::StringPart
 * Purpose: One segment of a string-like literal: decoded text or an embedded code range.
 */
#pragma once

#include <string>
#include <vector>
#include "rbparse/support/SourceRange.h"

namespace rbparse::lex {

struct StringPart {
    enum class Kind { Literal, Code };

    Kind kind{Kind::Literal};
    std::string text{}; // decoded content for Literal parts
    SourceRange range{}; // whole segment, including #{ and } for Code parts
    SourceRange code{}; // inner code range for Code parts

    bool isCode() const { return kind == Kind::Code; }
};

using StringParts = std::vector<StringPart>;

} // namespace rbparse::lex
