/***
 * Name: rbparse::ast::CaseNode::Builder
 * Purpose: Two-phase construction of case nodes.
 */
#include "ast/CaseNode.h"

namespace rbparse::ast {

CaseNode::CaseNode(BuildKey /*key*/, const SourceRange range, NodePtr subject, NodePtr cases)
    : NodeBase(range), subject_(std::move(subject)), cases_(std::move(cases)) {}

CaseNode::Builder::Builder(const SourceRange range, NodePtr subject, NodePtr cases)
    : node_(std::make_unique<CaseNode>(BuildKey{}, range, std::move(subject), std::move(cases))) {}

CaseNode::Builder& CaseNode::Builder::setElse(NodePtr elseNode) {
  if (elseNode) { node_->range = SourceRange::cover(node_->range, elseNode->range); }
  node_->else_ = std::move(elseNode);
  return *this;
}

std::unique_ptr<CaseNode> CaseNode::Builder::finish() { return std::move(node_); }

} // namespace rbparse::ast
