/***
 * Name: test_lalr_builder
 * Purpose: Grammar reading, precedence resolution and conflict reporting of the table generator.
 */
#include <gtest/gtest.h>
#include <string>

#include "grammar/GrammarReader.h"
#include "grammar/LalrBuilder.h"
#include "rbparse/exceptions/grammar_error.h"

using namespace rbparse;

namespace {

const char* kHeader =
    "%token Start Num Plus Star LParen RParen\n"
    "%eof End\n"
    "%entry Start expr\n";

} // namespace

TEST(LalrBuilder, PrecedenceSettlesAmbiguousExpressions) {
  const std::string text = std::string(kHeader) +
                           "%left Plus\n%left Star\n%%\n"
                           "expr : expr Plus expr { Add } | expr Star expr { Mul } | LParen expr RParen { $2 } | Num ;\n";
  const grammar::Grammar g = grammar::GrammarReader::parse(text, "calc.grammar");
  grammar::LalrBuilder builder(g);
  const grammar::LalrTables tables = builder.build();
  EXPECT_TRUE(tables.conflicts.empty());
  EXPECT_GT(tables.resolvedByPrecedence, 0u);
  EXPECT_GT(tables.stateCount(), 0u);
  EXPECT_NE(g.actionIdOf("Add"), 0);
  EXPECT_EQ(g.actionIdOf("NoSuchAction"), 0);
}

TEST(LalrBuilder, UnresolvedConflictsAreReported) {
  const std::string text = std::string(kHeader) + "%%\nexpr : expr Plus expr { Add } | Num ;\n";
  const grammar::Grammar g = grammar::GrammarReader::parse(text, "ambiguous.grammar");
  grammar::LalrBuilder builder(g);
  const grammar::LalrTables tables = builder.build();
  ASSERT_FALSE(tables.conflicts.empty());
  EXPECT_EQ(tables.conflicts.front().kind, grammar::Conflict::Kind::ShiftReduce);
  EXPECT_FALSE(tables.conflicts.front().describe(g).empty());
}

TEST(LalrBuilder, ExpectDirectiveIsRecorded) {
  const std::string text = std::string(kHeader) + "%expect 1\n%%\nexpr : expr Plus expr { Add } | Num ;\n";
  const grammar::Grammar g = grammar::GrammarReader::parse(text, "expect.grammar");
  ASSERT_TRUE(g.expectedConflicts.has_value());
  EXPECT_EQ(*g.expectedConflicts, 1);
}

TEST(LalrBuilder, ConflictsWithoutExpectFailTheBuild) {
  const std::string text = std::string(kHeader) + "%%\nexpr : expr Plus expr { Add } | Num ;\n";
  const grammar::Grammar g = grammar::GrammarReader::parse(text, "ambiguous.grammar");
  grammar::LalrBuilder builder(g);
  const grammar::LalrTables tables = builder.build();
  EXPECT_THROW(grammar::checkConflicts(g, tables), exceptions::GrammarError);
}

TEST(LalrBuilder, DeclaredConflictsAreAccepted) {
  const std::string text = std::string(kHeader) + "%expect 1\n%%\nexpr : expr Plus expr { Add } | Num ;\n";
  const grammar::Grammar g = grammar::GrammarReader::parse(text, "expect.grammar");
  grammar::LalrBuilder builder(g);
  const grammar::LalrTables tables = builder.build();
  ASSERT_EQ(tables.conflicts.size(), 1u);
  EXPECT_NO_THROW(grammar::checkConflicts(g, tables));
}

namespace {

// `var` is an assignment target before `=` or inside a `for` header (which
// ends at a newline), and a value before `,` or a newline.
std::string targetGrammar(const std::string& forVar) {
  return "%token Start Id Nil Assign Comma Newline For Dot\n"
         "%eof End\n"
         "%entry Start stmts\n"
         "%%\n"
         "stmts : stmt | stmts Newline stmt ;\n"
         "stmt : lhs Assign value { Assign } | value | For for_var Newline value { For } ;\n"
         "value : ref | value Comma ref { List } ;\n"
         "ref : var { VarRef } | ref Dot Id { Attr } ;\n"
         "lhs : var { AssignableVar } | ref Dot Id { AssignableAttr } ;\n"
         "target : var { AssignableVar } | ref Dot Id { AssignableAttr } ;\n"
         "for_var : " + forVar + " ;\n"
         "var : Id | Nil ;\n";
}

} // namespace

TEST(LalrBuilder, SharedTargetRuleCollidesWithValues) {
  const grammar::Grammar g = grammar::GrammarReader::parse(targetGrammar("lhs"), "targets.grammar");
  grammar::LalrBuilder builder(g);
  const grammar::LalrTables tables = builder.build();
  ASSERT_FALSE(tables.conflicts.empty());
  EXPECT_EQ(tables.conflicts.front().kind, grammar::Conflict::Kind::ReduceReduce);
  EXPECT_EQ(tables.conflicts.front().terminal, *g.findSymbol("Newline"));
  EXPECT_THROW(grammar::checkConflicts(g, tables), exceptions::GrammarError);
}

TEST(LalrBuilder, SeparateTargetRuleIsConflictFree) {
  const grammar::Grammar g = grammar::GrammarReader::parse(targetGrammar("target"), "targets.grammar");
  grammar::LalrBuilder builder(g);
  const grammar::LalrTables tables = builder.build();
  EXPECT_TRUE(tables.conflicts.empty());
  EXPECT_NO_THROW(grammar::checkConflicts(g, tables));
}

TEST(GrammarReader, UndefinedSymbolFails) {
  const std::string text = std::string(kHeader) + "%%\nexpr : term Plus Num ;\n";
  EXPECT_THROW(grammar::GrammarReader::parse(text, "broken.grammar"), exceptions::GrammarError);
}

TEST(GrammarReader, UnknownDirectiveFails) {
  const std::string text = std::string(kHeader) + "%bogus Num\n%%\nexpr : Num ;\n";
  EXPECT_THROW(grammar::GrammarReader::parse(text, "broken.grammar"), exceptions::GrammarError);
}

TEST(GrammarReader, RubyGrammarBuilds) {
  const grammar::Grammar g = grammar::GrammarReader::readFile(RBPARSE_GRAMMAR_FILE);
  EXPECT_EQ(g.entries().size(), 2u);
  grammar::LalrBuilder builder(g);
  const grammar::LalrTables tables = builder.build();
  EXPECT_GT(tables.stateCount(), 100u);
  EXPECT_NE(g.actionIdOf("Program"), 0);
  for (const auto& conflict : tables.conflicts) { ADD_FAILURE() << conflict.describe(g); }
  EXPECT_NO_THROW(grammar::checkConflicts(g, tables));
}
