/***
 * Name: rbparse::passes::Validator
 * Purpose: Static checks that the grammar accepts but Ruby rejects or warns about.
 * Inputs:
 *   - the rewritten tree, the SourceBuffer it came from, an optional WarningSink
 * Outputs:
 *   - throws ValidationError at the first offending node
 *   - warnings for suspicious conditions
 * Theory of Operation:
 *   A read-only TreeWalker tracking three contexts: inside a loop or block
 *   (break, next, redo), inside a rescue clause (retry) and directly inside a
 *   class or module body (return). def bodies reset all of them.
 */
#pragma once

#include <string>

#include "ast/TreeWalker.h"
#include "lexer/SourceBuffer.h"
#include "passes/Pass.h"
#include "rbparse/support/WarningSink.h"

namespace rbparse::passes {

class Validator final : public Pass, private ast::TreeWalker {
  public:
    Validator(const lex::SourceBuffer& source, WarningSink* warnings) : source_(source), warnings_(warnings) {}

    const char* name() const override { return "Validator"; }
    void run(ast::RootNode& root) override;
    void check(const ast::RootNode& root);

  private:
    using TreeWalker::visit;
    void visit(const ast::DefnNode& node) override;
    void visit(const ast::DefsNode& node) override;
    void visit(const ast::ClassNode& node) override;
    void visit(const ast::SClassNode& node) override;
    void visit(const ast::ModuleNode& node) override;
    void visit(const ast::IterNode& node) override;
    void visit(const ast::LambdaNode& node) override;
    void visit(const ast::WhileNode& node) override;
    void visit(const ast::UntilNode& node) override;
    void visit(const ast::ForNode& node) override;
    void visit(const ast::IfNode& node) override;
    void visit(const ast::CaseNode& node) override;
    void visit(const ast::RescueNode& node) override;
    void visit(const ast::RescueBodyNode& node) override;
    void visit(const ast::BreakNode& node) override;
    void visit(const ast::NextNode& node) override;
    void visit(const ast::RedoNode& node) override;
    void visit(const ast::RetryNode& node) override;
    void visit(const ast::ReturnNode& node) override;
    void visit(const ast::ConstDeclNode& node) override;
    void visit(const ast::ArgsNode& node) override;

    struct Context {
        bool loop{false};
        bool rescue{false};
        bool classBody{false};
        bool method{false};
    };

    void walkIn(const ast::Node& node, Context context);
    void walkLoop(const ast::Node& node);
    void checkCondition(const ast::Node* condition);
    [[noreturn]] void fail(const ast::Node& node, const std::string& message) const;
    void warn(const ast::Node& node, const std::string& message) const;

    const lex::SourceBuffer& source_;
    WarningSink* warnings_;
    Context context_{};
};

} // namespace rbparse::passes
