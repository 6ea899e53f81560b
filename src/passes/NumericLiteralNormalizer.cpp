/***
 * Name: rbparse::passes::NumericLiteralNormalizer
 * Purpose: Typed numeric literals and negative literal folding.
 */
#include "passes/NumericLiteralNormalizer.h"

#include <cstdint>
#include <cstdlib>
#include <limits>
#include <memory>
#include <numeric>
#include <string>
#include <utility>

#include "rbparse/support/numeric.h"

namespace rbparse::passes {

namespace {

ast::NodePtr integer(const SourceRange range, const std::string& digits, const int base) {
  std::int64_t value = 0;
  if (support::ParseIntegerDigits(digits, base, value)) { return std::make_unique<ast::FixnumNode>(range, value); }
  return std::make_unique<ast::BignumNode>(range, support::DigitsToDecimal(digits, base));
}

// `1.25r` is 125/100, reduced when both parts fit 64 bits.
ast::NodePtr rational(const SourceRange range, const std::string& digits, const int base, const bool isFloat) {
  std::string numerator = digits;
  std::string denominator = "1";
  if (isFloat) {
    const std::size_t dot = digits.find('.');
    if (dot != std::string::npos) {
      numerator = digits.substr(0, dot) + digits.substr(dot + 1);
      denominator = "1" + std::string(digits.size() - dot - 1, '0');
    }
  }
  std::int64_t num = 0;
  std::int64_t den = 1;
  if (support::ParseIntegerDigits(numerator, base, num) && support::ParseIntegerDigits(denominator, 10, den)) {
    const std::int64_t divisor = std::gcd(num, den);
    if (divisor > 1) {
      num /= divisor;
      den /= divisor;
    }
    return std::make_unique<ast::RationalNode>(range, std::make_unique<ast::FixnumNode>(range, num),
                                               std::make_unique<ast::FixnumNode>(range, den));
  }
  return std::make_unique<ast::RationalNode>(range, integer(range, numerator, base), integer(range, denominator, 10));
}

// Negates a typed literal in place; false when the node is not a numeric literal.
bool negateLiteral(ast::Node& node) {
  switch (node.kind) {
    case ast::NodeKind::Fixnum: {
      auto& fix = static_cast<ast::FixnumNode&>(node);
      if (fix.value == std::numeric_limits<std::int64_t>::min()) { return false; }
      fix.value = -fix.value;
      return true;
    }
    case ast::NodeKind::Bignum: {
      auto& big = static_cast<ast::BignumNode&>(node);
      big.value = big.value.starts_with('-') ? big.value.substr(1) : "-" + big.value;
      return true;
    }
    case ast::NodeKind::Float: {
      auto& flo = static_cast<ast::FloatNode&>(node);
      flo.value = -flo.value;
      return true;
    }
    case ast::NodeKind::Rational: return negateLiteral(*static_cast<ast::RationalNode&>(node).numerator);
    case ast::NodeKind::Complex: return negateLiteral(*static_cast<ast::ComplexNode&>(node).number);
    default: return false;
  }
}

bool isNumericLiteral(const ast::Node* node) {
  if (node == nullptr) { return false; }
  switch (node->kind) {
    case ast::NodeKind::Fixnum:
    case ast::NodeKind::Bignum:
    case ast::NodeKind::Float:
    case ast::NodeKind::Rational:
    case ast::NodeKind::Complex: return true;
    default: return false;
  }
}

// -9223372036854775808 arrives as a Bignum and fits a Fixnum once negated.
ast::NodePtr shrink(ast::NodePtr node) {
  auto* big = ast::as<ast::BignumNode>(node.get());
  if (big == nullptr || big->value != "-9223372036854775808") { return node; }
  return std::make_unique<ast::FixnumNode>(big->range, std::numeric_limits<std::int64_t>::min());
}

} // namespace

ast::NodePtr NumericLiteralNormalizer::normalize(const ast::RawNumberNode& raw) {
  const SourceRange range = raw.range;
  ast::NodePtr value;
  if (raw.rational) {
    value = rational(range, raw.digits, raw.base, raw.isFloat);
  } else if (raw.isFloat) {
    value = std::make_unique<ast::FloatNode>(range, std::strtod(raw.digits.c_str(), nullptr));
  } else {
    value = integer(range, raw.digits, raw.base);
  }
  if (raw.imaginary) { value = std::make_unique<ast::ComplexNode>(range, std::move(value)); }
  return value;
}

ast::NodePtr NumericLiteralNormalizer::rewrite(ast::NodePtr node) {
  if (const auto* raw = ast::as<ast::RawNumberNode>(node.get())) {
    ++rewrites_;
    return normalize(*raw);
  }
  auto* call = ast::as<ast::CallNode>(node.get());
  if (call == nullptr || call->name != "-@" || call->args || call->block || !isNumericLiteral(call->receiver.get())) {
    return node;
  }
  if (!negateLiteral(*call->receiver)) { return node; }
  ast::NodePtr literal = std::move(call->receiver);
  literal->setRange(call->range);
  ++rewrites_;
  return shrink(std::move(literal));
}

} // namespace rbparse::passes
