#include "cli/ParseArgsInternals.h"

namespace rbparse::cli::detail {
    /***
     * Name: rbparse::cli::detail::hasConflictingInputs
     * Purpose: Inline code and input files are mutually exclusive; one of them is required.
     */
    bool hasConflictingInputs(const Options &opts) {
        if (opts.showHelp) { return false; }
        if (!opts.inlineSource.empty() && !opts.inputs.empty()) { return true; }
        return opts.inlineSource.empty() && opts.inputs.empty();
    }
} // namespace rbparse::cli::detail
