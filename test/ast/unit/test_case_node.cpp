/***
 * Name: test_case_node
 * Purpose: CaseNode assembly through its builder and the childNodes() view.
 */
#include <gtest/gtest.h>
#include <memory>
#include <type_traits>
#include <utility>

#include "ast/Nodes.h"

using namespace rbparse;

static std::unique_ptr<ast::ListNode> oneWhen(const SourceRange r) {
  auto values = std::make_unique<ast::ListNode>(r);
  values->add(std::make_unique<ast::FixnumNode>(r, 1));
  auto cases = std::make_unique<ast::ListNode>(r);
  cases->add(std::make_unique<ast::WhenNode>(r, std::move(values), std::make_unique<ast::NilNode>(r)));
  return cases;
}

TEST(CaseNode, OnlyTheBuilderConstructs) {
  static_assert(!std::is_constructible_v<ast::CaseNode, SourceRange, ast::NodePtr, ast::NodePtr>);
  static_assert(!std::is_copy_constructible_v<ast::CaseNode>);
  auto node = ast::CaseNode::Builder(SourceRange{0, 8}, nullptr, oneWhen(SourceRange{0, 8})).finish();
  ASSERT_NE(node, nullptr);
  EXPECT_EQ(node->caseNode(), nullptr);
  EXPECT_EQ(node->elseNode(), nullptr);
}

TEST(CaseNode, BuilderAttachesElseAndWidensRange) {
  const SourceRange head{0, 10};
  auto node = ast::CaseNode::Builder(head, std::make_unique<ast::VCallNode>(SourceRange{5, 1}, "x"), oneWhen(head))
                  .setElse(std::make_unique<ast::TrueNode>(SourceRange{20, 4}))
                  .finish();
  ASSERT_NE(node, nullptr);
  EXPECT_NE(ast::as<ast::VCallNode>(node->caseNode()), nullptr);
  EXPECT_NE(ast::as<ast::TrueNode>(node->elseNode()), nullptr);
  EXPECT_EQ(node->range.start, 0u);
  EXPECT_EQ(node->range.end(), 24u);
}

TEST(CaseNode, ChildNodesReportSubjectAndClausesOnly) {
  const SourceRange r{0, 3};
  auto node = ast::CaseNode::Builder(r, nullptr, oneWhen(r)).setElse(std::make_unique<ast::NilNode>(r)).finish();
  EXPECT_EQ(node->slotCount(), 3u);
  EXPECT_EQ(node->childCount(), 2u);

  std::size_t seen = 0;
  std::size_t gaps = 0;
  for (const ast::Node* child : node->childNodes()) {
    ++seen;
    if (child == nullptr) { ++gaps; }
  }
  EXPECT_EQ(seen, 2u);
  EXPECT_EQ(gaps, 1u);
  EXPECT_EQ(node->childNodes()[1], node->cases());
  EXPECT_NE(node->slot(2)->get(), nullptr);
}

TEST(CaseNode, AsChecksTheKindTag) {
  const SourceRange r{0, 3};
  std::unique_ptr<ast::Node> node = ast::CaseNode::Builder(r, nullptr, oneWhen(r)).finish();
  EXPECT_NE(ast::as<ast::CaseNode>(node.get()), nullptr);
  EXPECT_EQ(ast::as<ast::IfNode>(node.get()), nullptr);
  EXPECT_EQ(ast::as<ast::CaseNode>(static_cast<const ast::Node*>(nullptr)), nullptr);
  EXPECT_STREQ(ast::to_string(node->kind), "Case");
}
