/**
 * rbparse_lalr: build-time LALR(1) table generator.
 * Usage: rbparse_lalr <grammar> <out-header> <out-source>
 *          [--namespace=NS] [--function=NAME] [--include=HEADER] [--verbose]
 * Conflicts that precedence does not settle are reported on stderr; a
 * count differing from the grammar's %expect (zero when absent) fails the
 * build.
 */
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "grammar/GrammarReader.h"
#include "grammar/LalrBuilder.h"
#include "grammar/TableWriter.h"
#include "rbparse/exceptions/rbparse_exception.h"

namespace {

bool writeFile(const std::string& path, const std::string& content) {
  std::ifstream existing(path, std::ios::binary);
  if (existing) {
    const std::string old((std::istreambuf_iterator<char>(existing)), std::istreambuf_iterator<char>());
    if (old == content) { return true; } // keep the timestamp; nothing to rebuild
  }
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) { return false; }
  out << content;
  return static_cast<bool>(out);
}

std::string baseName(const std::string& path) {
  const auto slash = path.find_last_of("/\\");
  return slash == std::string::npos ? path : path.substr(slash + 1);
}

} // namespace

int main(int argc, char** argv) {
  std::vector<std::string> positional;
  rbparse::grammar::TableWriterOptions options;
  bool verbose = false;
  bool includeGiven = false;
  for (int i = 1; i < argc; ++i) {
    const std::string_view arg(argv[i]);
    if (arg.rfind("--namespace=", 0) == 0) {
      options.actionNamespace = std::string(arg.substr(12));
    } else if (arg.rfind("--function=", 0) == 0) {
      options.functionName = std::string(arg.substr(11));
    } else if (arg.rfind("--include=", 0) == 0) {
      options.headerInclude = std::string(arg.substr(10));
      includeGiven = true;
    } else if (arg == "--verbose") {
      verbose = true;
    } else {
      positional.emplace_back(arg);
    }
  }
  if (positional.size() != 3) {
    std::cerr << "usage: rbparse_lalr <grammar> <out-header> <out-source> [--namespace=NS] [--function=NAME] "
                 "[--include=HEADER] [--verbose]\n";
    return 2;
  }
  if (!includeGiven) { options.headerInclude = baseName(positional[1]); }
  options.grammarName = baseName(positional[0]);

  try {
    const rbparse::grammar::Grammar grammar = rbparse::grammar::GrammarReader::readFile(positional[0]);
    rbparse::grammar::LalrBuilder builder(grammar);
    const rbparse::grammar::LalrTables tables = builder.build();

    for (const auto& conflict : tables.conflicts) {
      std::cerr << options.grammarName << ": warning: " << conflict.describe(grammar) << "\n";
    }
    if (verbose) {
      std::cerr << options.grammarName << ": " << grammar.terminalCount() << " terminals, "
                << grammar.nonterminalCount() << " nonterminals, " << grammar.productions().size() << " rules, "
                << tables.stateCount() << " states, " << tables.resolvedByPrecedence
                << " conflicts resolved by precedence\n";
    }
    rbparse::grammar::checkConflicts(grammar, tables);

    const rbparse::grammar::TableWriter writer(grammar, tables, options);
    std::ostringstream header;
    std::ostringstream source;
    writer.writeHeader(header);
    writer.writeSource(source);
    if (!writeFile(positional[1], header.str()) || !writeFile(positional[2], source.str())) {
      std::cerr << "rbparse_lalr: cannot write generated files\n";
      return 1;
    }
  } catch (const rbparse::exceptions::RbparseException& err) {
    std::cerr << "rbparse_lalr: " << err.what() << "\n";
    return 1;
  }
  return 0;
}
