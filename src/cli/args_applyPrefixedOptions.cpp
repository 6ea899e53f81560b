#include "cli/ParseArgsInternals.h"

#include <algorithm>
#include <charconv>
#include <string>

namespace rbparse::cli::detail {
    /***
     * Name: rbparse::cli::detail::applyPrefixedOptions
     * Purpose: Parse and apply --key=value options like variant/encoding/color/start-line.
     */
    bool applyPrefixedOptions(std::string_view arg, Options &out) {
        if (constexpr std::string_view variantPrefix{"--variant="}; arg.rfind(variantPrefix, 0) == 0) {
            out.variant = std::string(arg.substr(variantPrefix.size()));
            return true;
        }

        if (constexpr std::string_view encodingPrefix{"--encoding="}; arg.rfind(encodingPrefix, 0) == 0) {
            out.encoding = std::string(arg.substr(encodingPrefix.size()));
            return true;
        }

        if (constexpr std::string_view logPathPrefix{"--log-path="}; arg.rfind(logPathPrefix, 0) == 0) {
            out.logPath = std::string(arg.substr(logPathPrefix.size()));
            return true;
        }

        if (constexpr std::string_view colorPrefix{"--color="}; arg.rfind(colorPrefix, 0) == 0) {
            out.color = parseColorValue(arg.substr(colorPrefix.size()));
            return true;
        }

        if (constexpr std::string_view linePrefix{"--start-line="}; arg.rfind(linePrefix, 0) == 0) {
            const std::string_view digits = arg.substr(linePrefix.size());
            int line = 1;
            const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), line);
            if (ec != std::errc{} || ptr != digits.data() + digits.size()) { line = 1; }
            out.startLine = std::max(line, 1);
            return true;
        }
        return false;
    }
} // namespace rbparse::cli::detail
