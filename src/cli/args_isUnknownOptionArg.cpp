#include "cli/ParseArgsInternals.h"

namespace rbparse::cli::detail {
    /***
     * Name: rbparse::cli::detail::isUnknownOptionArg
     * Purpose: Detect unsupported option-like arguments that start with '-'.
     */
    bool isUnknownOptionArg(const std::string_view arg) {
        return arg.size() > 1 && arg[0] == '-';
    }
} // namespace rbparse::cli::detail
