/**
 * Name: rbparse::lex::NumberLiteral
 * Purpose: Lexer-level description of a numeric literal, prior to evaluation.
 */
#pragma once

#include <string>

namespace rbparse::lex {

struct NumberLiteral {
    std::string digits{}; // underscores and radix prefix removed; floats keep '.', 'e' and sign
    int base{10};
    bool isFloat{false};
    bool rational{false}; // trailing r
    bool imaginary{false}; // trailing i
};

} // namespace rbparse::lex
