#include "cli/ParseArgs.h"
#include "cli/ColorMode.h"
#include "cli/Options.h"
#include "cli/ParseArgsInternals.h"

#include <ostream>
#include <string>
#include <string_view>

namespace rbparse::cli {
    /***
     * Name: rbparse::cli::ParseArgs
     * Purpose: Minimal ruby-like CLI argument parser for rbparse.
     */
    bool ParseArgs(const int argc, char **argv, Options &out, std::ostream &err) {
        for (int i = 1; i < argc; ++i) {
            // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            const std::string_view arg{argv[i]};
            if (detail::isFlag(arg, "--")) {
                detail::collectRemainingAsInputs(i + 1, argc, argv, out);
                break;
            }
            if (detail::isFlag(arg, "-e")) {
                if (!detail::handleInlineSourceFlag(i, argc, argv, out)) {
                    err << "rbparse: no code specified for -e\n";
                    return false;
                }
                continue;
            }
            if (detail::applySimpleBoolFlags(arg, out)) { continue; }
            if (detail::applyPrefixedOptions(arg, out)) { continue; }

            // Positional
            if (detail::isUnknownOptionArg(arg)) {
                err << "rbparse: unknown option '" << arg << "'\n";
                return false;
            }
            out.inputs.emplace_back(std::string(arg));
        }

        if (detail::hasConflictingInputs(out)) {
            err << (out.inputs.empty() ? "rbparse: no input given\n" : "rbparse: cannot use -e together with input files\n");
            return false;
        }

        return true;
    }
} // namespace rbparse::cli
