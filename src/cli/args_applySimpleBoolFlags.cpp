#include "cli/ParseArgsInternals.h"

namespace rbparse::cli::detail {
    /***
     * Name: rbparse::cli::detail::applySimpleBoolFlags
     * Purpose: Handle flag-only boolean options and set outputs.
     */
    bool applySimpleBoolFlags(std::string_view arg, Options &out) {
        if (isFlag(arg, "-h") || isFlag(arg, "--help")) {
            out.showHelp = true;
            return true;
        }
        if (isFlag(arg, "--dump-tokens")) {
            out.dumpTokens = true;
            return true;
        }
        if (isFlag(arg, "--dump-ast")) {
            out.dumpAst = true;
            return true;
        }
        if (isFlag(arg, "--no-ranges")) {
            out.astRanges = false;
            return true;
        }
        if (isFlag(arg, "--trace-parser")) {
            out.traceParser = true;
            return true;
        }
        if (isFlag(arg, "--metrics")) {
            out.metrics = true;
            return true;
        }
        if (isFlag(arg, "--metrics-json")) {
            out.metricsJson = true;
            return true;
        }
        return false;
    }
} // namespace rbparse::cli::detail
