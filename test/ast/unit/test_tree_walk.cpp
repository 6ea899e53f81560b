/***
 * Name: test_tree_walk
 * Purpose: Visitor dispatch, TreeWalker defaults, source ranges and geometry.
 */
#include <gtest/gtest.h>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "ast/GeometrySummary.h"
#include "ast/Nodes.h"
#include "ast/TreeWalker.h"

using namespace rbparse;

namespace {

// `a = 1 + 2`
std::unique_ptr<ast::RootNode> sample() {
  auto args = std::make_unique<ast::ListNode>(SourceRange{8, 1});
  args->add(std::make_unique<ast::FixnumNode>(SourceRange{8, 1}, 2));
  auto sum = std::make_unique<ast::CallNode>(SourceRange{4, 5}, std::make_unique<ast::FixnumNode>(SourceRange{4, 1}, 1),
                                             "+", std::move(args));
  auto asgn = std::make_unique<ast::LocalAsgnNode>(SourceRange{0, 9}, "a", std::move(sum));
  return std::make_unique<ast::RootNode>(SourceRange{0, 9}, std::move(asgn), "w.rb", "UTF-8");
}

class FixnumCollector final : public ast::TreeWalker {
  public:
    using TreeWalker::visit;
    void visit(const ast::FixnumNode& node) override { values.push_back(node.value); }
    std::vector<std::int64_t> values;
};

} // namespace

TEST(TreeWalker, VisitsOwnedSlotsInSourceOrder) {
  const auto root = sample();
  FixnumCollector collector;
  collector.walk(root.get());
  ASSERT_EQ(collector.values.size(), 2u);
  EXPECT_EQ(collector.values[0], 1);
  EXPECT_EQ(collector.values[1], 2);
}

TEST(TreeWalker, NullRootIsIgnored) {
  FixnumCollector collector;
  collector.walk(nullptr);
  EXPECT_TRUE(collector.values.empty());
}

TEST(Geometry, CountsNodesAndDepth) {
  const auto root = sample();
  const ast::GeometrySummary geometry = ast::ComputeGeometry(*root);
  EXPECT_EQ(geometry.nodes, 6u);
  EXPECT_EQ(geometry.maxDepth, 5u);
}

TEST(SourceRange, CoverAndBounds) {
  const SourceRange a{2, 3};
  const SourceRange b{10, 4};
  const SourceRange both = SourceRange::cover(a, b);
  EXPECT_EQ(both.start, 2u);
  EXPECT_EQ(both.end(), 14u);
  EXPECT_EQ(SourceRange::fromBounds(5, 9).length, 4u);
}

TEST(Sequence, AddWidensRange) {
  ast::BlockNode block(SourceRange{4, 1});
  block.add(std::make_unique<ast::NilNode>(SourceRange{10, 3}));
  block.add(nullptr);
  EXPECT_EQ(block.size(), 2u);
  EXPECT_EQ(block.range.end(), 13u);
  EXPECT_EQ(block.childNodes()[1], nullptr);
}
