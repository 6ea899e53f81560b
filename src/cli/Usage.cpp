#include "cli/Usage.h"
#include <string>
#include <string_view>
namespace rbparse::cli {

namespace {
constexpr std::string_view kUsageText = R"(rbparse [options] file...
rbparse [options] -e 'code'

Parses Ruby source and reports syntax errors; nothing is executed.

Options:
  -h, --help           Print this help and exit
  -e <code>            Parse <code> instead of files; repeat for more lines
  -                    Read the source from standard input
  --variant=<v>        Grammar entry: program|expression (default: program)
  --encoding=<name>    Source encoding when no magic comment says (default: UTF-8)
  --start-line=<N>     Line number of the first source line (default: 1)
  --dump-tokens        Print the token stream
  --dump-ast           Print the syntax tree
  --no-ranges          Omit byte ranges from --dump-ast
  --trace-parser       Print every shift and reduction
  --metrics            Print stage timings and counters
  --metrics-json       Print stage timings and counters in JSON
  --log-path=<dir>     Also write dumps and metrics to files in <dir>
  --color=<mode>       Color diagnostics: always|never|auto (default: auto)
  --                   End of options

Environment:
  RBPARSE_COLOR        1/true/yes enables color when --color=auto

Exit status: 0 when every input parses, 1 on a syntax error, 2 on usage or I/O errors.
)";
} // namespace

std::string Usage() { return std::string(kUsageText); }
} // namespace rbparse::cli
