#pragma once

#include <string>

namespace rbparse::cli {

    // Help text printed by -h and after argument errors.
    std::string Usage();

} // namespace rbparse::cli
