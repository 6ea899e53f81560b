#include "cli/ParseCommand.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string_view>

namespace rbparse::cli {
    namespace {
        constexpr std::string_view kEnabled[] = {"1", "true", "yes", "always"};

        bool sameIgnoringCase(const std::string_view a, const std::string_view b) {
            return std::ranges::equal(a, b, [](const unsigned char x, const unsigned char y) {
                return std::tolower(x) == std::tolower(y);
            });
        }
    } // namespace

    // RBPARSE_COLOR=1|true|yes|always turns color on for --color=auto.
    bool ParseCommand::use_env_color() {
        const char *value = std::getenv("RBPARSE_COLOR");
        if (value == nullptr) { return false; }
        const std::string_view setting{value};
        return std::ranges::any_of(kEnabled, [setting](const std::string_view on) { return sameIgnoringCase(setting, on); });
    }
} // namespace rbparse::cli
