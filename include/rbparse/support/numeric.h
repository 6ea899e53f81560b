/***
 * Name: rbparse::support (numeric)
 * Purpose: Digit-string helpers behind numeric literal normalization.
 * Inputs: Digit strings as produced by the lexer (no prefix, no underscores) and a radix
 * Outputs: 64-bit values when they fit, decimal renderings otherwise
 * Theory of Operation: No exceptions; callers pick the node type from the status.
 */
#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace rbparse {
namespace support {

/*** ParseIntegerDigits: Parse digits in base 2..16 into out. False on overflow or a bad digit. */
bool ParseIntegerDigits(std::string_view digits, int base, std::int64_t& out, std::string* err = nullptr);

/*** DigitsToDecimal: Render digits of any length in base 2..16 as unsigned decimal text. */
std::string DigitsToDecimal(std::string_view digits, int base);

}  // namespace support
}  // namespace rbparse
