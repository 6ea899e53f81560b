/***
 * Name: rbparse::grammar::TableWriter
 * Purpose: Serialize LALR tables as constant C++ arrays.
 */
#include "grammar/TableWriter.h"

#include <cstddef>
#include <utility>

#include "rbparse/exceptions/grammar_error.h"

namespace rbparse::grammar {

namespace {

std::string quoted(const std::string& text) {
  std::string out = "\"";
  for (const char c : text) {
    if (c == '"' || c == '\\') { out.push_back('\\'); }
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

const char* kindName(const LrAction::Kind kind) {
  switch (kind) {
    case LrAction::Kind::Shift: return "ActionKind::Shift";
    case LrAction::Kind::Reduce: return "ActionKind::Reduce";
    case LrAction::Kind::Accept: return "ActionKind::Accept";
    case LrAction::Kind::Error: break;
  }
  throw exceptions::GrammarError("error cells are not serialized");
}

} // namespace

TableWriter::TableWriter(const Grammar& grammar, const LalrTables& tables, TableWriterOptions options)
  : grammar_(grammar), tables_(tables), options_(std::move(options)) {}

void TableWriter::writeHeader(std::ostream& out) const {
  out << "// Generated by rbparse_lalr from " << options_.grammarName << ". Do not edit.\n";
  out << "#pragma once\n\n#include <cstddef>\n#include <cstdint>\n\n";
  out << "namespace " << options_.actionNamespace << " {\n\n";
  out << "enum class ActionId : std::uint16_t {\n    None,\n";
  for (const auto& action : grammar_.actions()) { out << "    " << action << ",\n"; }
  out << "};\n\n";
  out << "inline constexpr std::size_t kTerminalCount = " << grammar_.terminalCount() << ";\n";
  out << "inline constexpr std::size_t kNonterminalCount = " << grammar_.nonterminalCount() << ";\n";
  out << "inline constexpr std::size_t kRuleCount = " << grammar_.productions().size() << ";\n";
  out << "inline constexpr std::size_t kStateCount = " << tables_.stateCount() << ";\n\n";
  out << "const char* to_string(ActionId id);\n\n";
  out << "} // namespace " << options_.actionNamespace << "\n";
}

// NOLINTNEXTLINE(readability-function-size)
void TableWriter::writeSource(std::ostream& out) const {
  const std::string& ns = options_.actionNamespace;
  out << "// Generated by rbparse_lalr from " << options_.grammarName << ". Do not edit.\n";
  out << "#include \"" << options_.headerInclude << "\"\n\n";
  out << "#include <array>\n#include <cstdint>\n\n#include \"lexer/TokenKind.h\"\n#include \"parser/GrammarTable.h\"\n\n";

  out << "namespace " << ns << " {\n\n";
  out << "const char* to_string(const ActionId id) {\n  switch (id) {\n";
  out << "    case ActionId::None: return \"None\";\n";
  for (const auto& action : grammar_.actions()) {
    out << "    case ActionId::" << action << ": return \"" << action << "\";\n";
  }
  out << "  }\n  return \"unknown\";\n}\n\n} // namespace " << ns << "\n\n";

  out << "namespace rbparse::parse {\n\nnamespace {\n\n";

  out << "constexpr std::array<lex::TokenKind, " << grammar_.terminalCount() << "> kTerminalKinds{{\n";
  for (size_t t = 0; t < grammar_.terminalCount(); ++t) {
    out << "    lex::TokenKind::" << grammar_.terminalName(static_cast<int>(t)) << ",\n";
  }
  out << "}};\n\n";

  out << "constexpr std::array<const char*, " << grammar_.symbolCount() << "> kSymbolNames{{\n";
  for (size_t s = 0; s < grammar_.symbolCount(); ++s) {
    out << "    " << quoted(grammar_.symbolName(static_cast<int>(s))) << ",\n";
  }
  out << "}};\n\n";

  out << "constexpr std::array<RuleInfo, " << grammar_.productions().size() << "> kRules{{\n";
  for (size_t p = 0; p < grammar_.productions().size(); ++p) {
    const Production& prod = grammar_.productions()[p];
    const int action = grammar_.actionIdOf(prod.action);
    out << "    {" << prod.lhs << ", " << prod.rhs.size() << ", " << (prod.action.empty() ? prod.passIndex : -1) << ", "
        << action << ", " << quoted(grammar_.productionText(static_cast<int>(p))) << "},\n";
  }
  out << "}};\n\n";

  size_t actionCount = 0;
  size_t gotoCount = 0;
  for (const auto& row : tables_.actions) { actionCount += row.size(); }
  for (const auto& row : tables_.gotos) { gotoCount += row.size(); }

  out << "constexpr std::array<ActionEntry, " << actionCount << "> kActions{{\n";
  for (size_t s = 0; s < tables_.stateCount(); ++s) {
    for (const auto& [terminal, act] : tables_.actions[s]) {
      out << "    {" << terminal << ", " << kindName(act.kind) << ", " << act.value << "},\n";
    }
  }
  out << "}};\n\n";

  out << "constexpr std::array<std::uint32_t, " << (tables_.stateCount() + 1) << "> kActionOffsets{{\n   ";
  size_t offset = 0;
  for (size_t s = 0; s <= tables_.stateCount(); ++s) {
    out << " " << offset << ",";
    if (s % 16 == 15) { out << "\n   "; }
    if (s < tables_.stateCount()) { offset += tables_.actions[s].size(); }
  }
  out << "\n}};\n\n";

  out << "constexpr std::array<GotoEntry, " << gotoCount << "> kGotos{{\n";
  for (size_t s = 0; s < tables_.stateCount(); ++s) {
    for (const auto& [nonterminal, target] : tables_.gotos[s]) {
      out << "    {" << nonterminal << ", " << target << "},\n";
    }
  }
  out << "}};\n\n";

  out << "constexpr std::array<std::uint32_t, " << (tables_.stateCount() + 1) << "> kGotoOffsets{{\n   ";
  offset = 0;
  for (size_t s = 0; s <= tables_.stateCount(); ++s) {
    out << " " << offset << ",";
    if (s % 16 == 15) { out << "\n   "; }
    if (s < tables_.stateCount()) { offset += tables_.gotos[s].size(); }
  }
  out << "\n}};\n\n} // namespace\n\n";

  out << "const GrammarTable& " << options_.functionName << "() {\n";
  out << "  static const GrammarTable table(TableData{kTerminalKinds, kSymbolNames, kRules, kActions, kActionOffsets, "
         "kGotos, kGotoOffsets});\n";
  out << "  return table;\n}\n\n} // namespace rbparse::parse\n";
}

} // namespace rbparse::grammar
