/***
 * Name: rbparse::support::DigitsToDecimal
 * Purpose: Convert an arbitrarily long digit string to decimal text.
 * Inputs: digits (base 2..16, no sign), base
 * Outputs: decimal digits without leading zeros ("0" for zero)
 * Theory of Operation: Schoolbook multiply-add over little-endian base-10 limbs.
 */
#include "rbparse/support/numeric.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace rbparse {
namespace support {

auto DigitsToDecimal(std::string_view digits, int base) -> std::string {
  constexpr int kBase10 = 10;
  std::vector<int> limbs{0};
  for (const char digit_char : digits) {
    int carry = 0;
    if (digit_char >= '0' && digit_char <= '9') {
      carry = digit_char - '0';
    } else if (digit_char >= 'a' && digit_char <= 'f') {
      carry = digit_char - 'a' + kBase10;
    } else if (digit_char >= 'A' && digit_char <= 'F') {
      carry = digit_char - 'A' + kBase10;
    }
    for (int& limb : limbs) {
      const int value = (limb * base) + carry;
      limb = value % kBase10;
      carry = value / kBase10;
    }
    while (carry > 0) {
      limbs.push_back(carry % kBase10);
      carry /= kBase10;
    }
  }
  std::string out;
  out.reserve(limbs.size());
  for (std::size_t i = limbs.size(); i > 0; --i) { out.push_back(static_cast<char>('0' + limbs[i - 1])); }
  const std::size_t first = out.find_first_not_of('0');
  return first == std::string::npos ? std::string("0") : out.substr(first);
}

}  // namespace support
}  // namespace rbparse
