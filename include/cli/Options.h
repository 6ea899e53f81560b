#pragma once

#include <string>
#include <vector>

#include "ColorMode.h"

namespace rbparse::cli {

    struct Options {
        bool showHelp{false};
        bool dumpTokens{false};       // --dump-tokens
        bool dumpAst{false};          // --dump-ast
        bool astRanges{true};         // --no-ranges turns them off in --dump-ast
        bool traceParser{false};      // --trace-parser
        bool metrics{false};          // --metrics
        bool metricsJson{false};      // --metrics-json
        std::string variant{"program"};   // --variant=program|expression
        std::string encoding{"UTF-8"};    // --encoding=<name>, default when no magic comment
        int startLine{1};                 // --start-line=<N>
        std::vector<std::string> inputs{};
        std::vector<std::string> inlineSource{}; // -e <code>, one line each
        ColorMode color{ColorMode::Auto};
        std::string logPath{};        // --log-path=<dir>: dumps also go to files there
    };

} // namespace rbparse::cli
