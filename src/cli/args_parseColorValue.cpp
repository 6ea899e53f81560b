#include "cli/ParseArgsInternals.h"

namespace rbparse::cli::detail {

ColorMode parseColorValue(std::string_view value) {
    using enum rbparse::cli::ColorMode;
    if (value == "always") { return Always; }
    if (value == "never") { return Never; }
    return Auto;
}

} // namespace rbparse::cli::detail
