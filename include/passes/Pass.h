/***
 * Name: rbparse::passes::Pass / Rewriter
 * Purpose: Common shape of the post-processing passes run after a parse.
 * Inputs:
 *   - the RootNode produced by the reduction actions
 * Outputs:
 *   - the same tree, rewritten in place; rewrites() counts replaced nodes
 * Theory of Operation:
 *   Passes own no state across runs: every run() starts from a fresh
 *   object built by the parser facade. Rewriter walks the owned slots
 *   bottom-up and lets the derived pass swap a node for a replacement after
 *   its children have been rewritten.
 */
#pragma once

#include <cstddef>
#include <utility>

#include "ast/Nodes.h"

namespace rbparse::passes {

class Pass {
  public:
    virtual ~Pass() = default;

    virtual const char* name() const = 0;
    virtual void run(ast::RootNode& root) = 0;

    std::size_t rewrites() const { return rewrites_; }

  protected:
    std::size_t rewrites_{0};
};

class Rewriter : public Pass {
  public:
    void run(ast::RootNode& root) override { rewriteChildren(root); }

  protected:
    // Returns the node that replaces `node`; its children are already rewritten.
    virtual ast::NodePtr rewrite(ast::NodePtr node) = 0;

    void rewriteSlot(ast::NodePtr& slot) {
        if (!slot) { return; }
        rewriteChildren(*slot);
        slot = rewrite(std::move(slot));
    }

    void rewriteChildren(ast::Node& node) {
        for (std::size_t i = 0; i < node.slotCount(); ++i) { rewriteSlot(*node.mutableSlot(i)); }
    }
};

} // namespace rbparse::passes
