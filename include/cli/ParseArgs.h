#pragma once

#include <ostream>

#include "ColorMode.h"
#include "Options.h"

namespace rbparse::cli {

    // Parse argv into Options. Returns false on fatal parse error, reported on err.
    bool ParseArgs(int argc, char** argv, Options& out, std::ostream& err);

} // namespace rbparse::cli
