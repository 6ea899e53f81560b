/**
 * Name: rbparse::lex::RegexpLiteral
 * Purpose: Payload of a regexp token: source parts plus option letters.
 */
#pragma once

#include <string>
#include "lexer/StringPart.h"

namespace rbparse::lex {

struct RegexpLiteral {
    StringParts parts{};
    std::string options{};
};

} // namespace rbparse::lex
