#pragma once

namespace rbparse::cli {

    // Colored diagnostics: Auto follows RBPARSE_COLOR.
    enum class ColorMode {
        Auto,
        Always,
        Never
    };

} // namespace rbparse::cli
