/***
 * Name: rbparse::passes::LocalVariableResolver
 * Purpose: Turns identifiers that name an assigned local variable into LocalVarNode.
 * Inputs:
 *   - tree straight from the reduction actions: every bare identifier is a VCallNode
 * Outputs:
 *   - LocalVarNode for identifiers declared earlier in the same scope chain
 *   - command calls on a local variable rewritten to the operator they were
 *     meant to be: `x -1` is `x - 1`, `x [1]` is `x[1]`, `x *y` is `x * y`,
 *     `x &y` is `x & y`
 * Theory of Operation:
 *   Walks the tree top-down in source order. A name is declared by an
 *   assignment target (declared before its value is read, as in `a = a`),
 *   a parameter, a block-local variable, a pattern binding, a rescue
 *   variable or a named capture of a literal regexp on the left of `=~`.
 *   def, class, sclass and module bodies open a scope that sees nothing of
 *   the enclosing one; blocks and lambdas open a scope that does.
 */
#pragma once

#include <string>
#include <unordered_set>
#include <vector>

#include "passes/Pass.h"

namespace rbparse::passes {

class LocalVariableResolver final : public Pass {
  public:
    const char* name() const override { return "LocalVariableResolver"; }
    void run(ast::RootNode& root) override;

  private:
    struct Scope {
        std::unordered_set<std::string> names;
        bool inherits;
    };

    void visit(ast::NodePtr& slot);
    void visitChildren(ast::Node& node);
    void visitInScope(ast::Node& node, bool inherits, std::size_t firstSlot = 0);
    void declare(const std::string& name);
    bool isLocal(const std::string& name) const;
    void declareNamedCaptures(const ast::CallNode& call);
    void fixCommand(ast::NodePtr& slot);

    std::vector<Scope> scopes_{};
};

} // namespace rbparse::passes
