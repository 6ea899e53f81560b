/***
 * Name: rbparse::ast::Node / ChildRange
 * Purpose: Child access shared by every node variant.
 */
#include "ast/Node.h"

namespace rbparse::ast {

const Node* Node::child(const std::size_t index) const {
  if (index >= childCount()) { return nullptr; }
  const NodePtr* owned = slot(index);
  return owned != nullptr ? owned->get() : nullptr;
}

ChildRange::ChildRange(const Node& owner) : owner_(&owner), size_(owner.childCount()) {}

const Node* ChildRange::operator[](const std::size_t index) const { return owner_->child(index); }

const Node* ChildRange::iterator::operator*() const { return owner_->child(index_); }

} // namespace rbparse::ast
