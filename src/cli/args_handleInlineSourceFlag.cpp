#include "cli/ParseArgsInternals.h"

namespace rbparse::cli::detail {
    /***
     * Name: rbparse::cli::detail::handleInlineSourceFlag
     * Purpose: Handle `-e <code>` by consuming the next argument; repeated -e add lines.
     */
    bool handleInlineSourceFlag(int &idx, int argc, char **argv, Options &out) {
        if (idx + 1 >= argc) { return false; }
        // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        out.inlineSource.emplace_back(argv[++idx]);
        return true;
    }
} // namespace rbparse::cli::detail
