#include "cli/ParseArgs.h"
#include "cli/ParseCommand.h"
#include "cli/Usage.h"
#include "rbparse/exceptions/rbparse_exception.h"
#include <exception>
#include <iostream>
/***
 * Name: rbparse::main
 * Purpose: CLI entry point for the rbparse tool.
 * Inputs:
 *   - argv
 * Outputs:
 *   - Exit status
 * Theory of Operation:
 *   Parse args then invoke ParseCommand::run. Errors that are not tied to a
 *   source position (unreadable grammar tables, internal failures) end the
 *   process with status 2.
 */
int main(const int argc, char** argv) {
  try {
    rbparse::cli::Options opts;
    if (!rbparse::cli::ParseArgs(argc, argv, opts, std::cerr)) {
      std::cerr << rbparse::cli::Usage();
      return 2;
    }
    if (opts.showHelp) {
      std::cout << rbparse::cli::Usage();
      return 0;
    }
    rbparse::cli::ParseCommand command(opts, std::cout, std::cerr, std::cin);
    return command.run();
  } catch (const rbparse::exceptions::RbparseException& ex) {
    std::cerr << "rbparse: " << ex.what() << '\n';
    return 2;
  } catch (const std::exception& ex) {
    std::cerr << "rbparse: internal error: " << ex.what() << '\n';
    return 2;
  }
}
