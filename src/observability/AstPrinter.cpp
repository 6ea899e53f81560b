/***
 * Name: rbparse::obs::AstPrinter (impl)
 * Purpose: Node descriptions and the indented tree dump.
 */
#include "observability/AstPrinter.h"

#include <cstddef>
#include <iomanip>
#include <sstream>
#include <string>

#include "ast/Nodes.h"

namespace rbparse::obs {

namespace {

std::string quoted(const std::string& s) {
  std::ostringstream oss;
  oss << std::quoted(s);
  return oss.str();
}

} // namespace

// NOLINTNEXTLINE(readability-function-size,readability-function-cognitive-complexity)
std::string DescribeNode(const ast::Node& node) {
  std::ostringstream oss;
  oss << ast::to_string(node.kind);
  using enum ast::NodeKind;
  switch (node.kind) {
    case Root: {
      const auto& root = static_cast<const ast::RootNode&>(node);
      oss << " file=" << quoted(root.file) << " encoding=" << root.encoding;
      if (root.frozenStringLiteral) { oss << " frozen=" << (*root.frozenStringLiteral ? "true" : "false"); }
      break;
    }
    case RawNumber: {
      const auto& raw = static_cast<const ast::RawNumberNode&>(node);
      oss << " " << raw.digits << " base=" << raw.base;
      break;
    }
    case Fixnum: oss << " " << static_cast<const ast::FixnumNode&>(node).value; break;
    case Bignum: oss << " " << static_cast<const ast::BignumNode&>(node).value; break;
    case Float: oss << " " << std::setprecision(17) << static_cast<const ast::FloatNode&>(node).value; break;
    case Str: {
      const auto& str = static_cast<const ast::StrNode&>(node);
      oss << " " << quoted(str.value);
      if (str.frozen) { oss << " frozen"; }
      break;
    }
    case Regexp: {
      const auto& re = static_cast<const ast::RegexpNode&>(node);
      oss << " /" << re.source << "/" << re.options;
      break;
    }
    case DRegexp: oss << " options=" << static_cast<const ast::DRegexpNode&>(node).options; break;
    case Hash:
      if (!static_cast<const ast::HashNode&>(node).braces) { oss << " bare"; }
      break;
    case Dot:
      oss << (static_cast<const ast::DotNode&>(node).exclusive ? " ..." : " ..");
      break;
    case File: oss << " " << quoted(static_cast<const ast::FileNode&>(node).path); break;
    case NthRef: oss << " $" << static_cast<const ast::NthRefNode&>(node).number; break;
    case BackRef: oss << " $" << static_cast<const ast::BackRefNode&>(node).type; break;
    case OpAsgn: oss << " op=" << quoted(static_cast<const ast::OpAsgnNode&>(node).op); break;
    case OpAsgnAttr: {
      const auto& op = static_cast<const ast::OpAsgnAttrNode&>(node);
      oss << " name=" << quoted(op.name) << " op=" << quoted(op.op);
      break;
    }
    case OpElementAsgn: oss << " op=" << quoted(static_cast<const ast::OpElementAsgnNode&>(node).op); break;
    case Call: {
      const auto& call = static_cast<const ast::CallNode&>(node);
      oss << " name=" << quoted(call.name);
      if (call.safeNavigation) { oss << " &."; }
      break;
    }
    case FCall: {
      const auto& call = static_cast<const ast::FCallNode&>(node);
      oss << " name=" << quoted(call.name);
      if (call.hasParens) { oss << " parens"; }
      break;
    }
    default:
      if (const auto* named = dynamic_cast<const ast::HasName*>(&node)) { oss << " name=" << quoted(named->name); }
      break;
  }
  return oss.str();
}

void AstPrinter::enter(const ast::Node& node) {
  std::string text = DescribeNode(node);
  if (ranges_) {
    text += " [" + std::to_string(node.range.start) + "," + std::to_string(node.range.end()) + ")";
  }
  line(text);
  std::size_t last = node.slotCount();
  while (last > 0 && !*node.slot(last - 1)) { --last; }
  depth_++;
  for (std::size_t i = 0; i < last; ++i) {
    const ast::Node* child = node.slot(i)->get();
    if (child == nullptr) {
      line("~");
    } else {
      walk(child);
    }
  }
  depth_--;
}

} // namespace rbparse::obs
