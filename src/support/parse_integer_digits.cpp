/***
 * Name: rbparse::support::ParseIntegerDigits
 * Purpose: Parse contiguous digits of a given radix into a signed 64-bit value.
 * Inputs: digit view, base (2..16), out value, optional error string pointer
 * Outputs: value and status; err set on failure
 */
#include "rbparse/support/numeric.h"

#include <cstdint>
#include <limits>
#include <string>
#include <string_view>

namespace rbparse {
namespace support {

namespace {
int DigitValue(const char digit_char) {
  if (digit_char >= '0' && digit_char <= '9') { return digit_char - '0'; }
  if (digit_char >= 'a' && digit_char <= 'f') { return digit_char - 'a' + 10; }
  if (digit_char >= 'A' && digit_char <= 'F') { return digit_char - 'A' + 10; }
  return -1;
}
}  // namespace

auto ParseIntegerDigits(std::string_view digits, int base, std::int64_t& out, std::string* err) -> bool {
  out = 0;
  constexpr std::int64_t kMax = std::numeric_limits<std::int64_t>::max();
  std::string local_err;
  bool is_success = !digits.empty();
  if (!is_success) { local_err = "numeric literal without digits"; }
  for (const char digit_char : digits) {
    const int value = DigitValue(digit_char);
    if (value < 0 || value >= base) {
      local_err = "invalid digit in integer literal";
      is_success = false;
      break;
    }
    if (out > (kMax - value) / base) {
      local_err = "integer overflow";
      is_success = false;
      break;
    }
    out = (out * base) + value;
  }
  if (!is_success) {
    if (err != nullptr) { *err = local_err; }
    return false;
  }
  return true;
}

}  // namespace support
}  // namespace rbparse
