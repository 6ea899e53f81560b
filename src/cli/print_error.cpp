#include "cli/ParseCommand.h"
#include <algorithm>
#include <cstddef>
#include <ostream>
#include <string_view>

namespace rbparse::cli {
    // ANSI fragments
    static constexpr std::string_view kRed = "\033[31m";
    static constexpr std::string_view kBold = "\033[1m";
    static constexpr std::string_view kReset = "\033[0m";

    static void print_header(std::ostream &err, const exceptions::SyntaxError &error, const bool color) {
        if (error.file().empty()) { return; }
        if (color) { err << kBold; }
        err << error.file() << ":" << error.line() << ":" << error.column() << ": ";
        if (color) { err << kReset; }
    }

    static void print_label(std::ostream &err, const bool color) {
        if (color) {
            err << kRed << "error: " << kReset;
        } else { err << "error: "; }
    }

    // Caret under the first byte, tildes under the rest of the range on that line.
    static void print_source_with_caret(std::ostream &err, const exceptions::SyntaxError &error,
                                        const std::string_view sourceLine, const bool color) {
        if (error.line() <= 0 || error.column() <= 0) { return; }
        const auto col = static_cast<std::size_t>(error.column());
        if (col > sourceLine.size() + 1) { return; }
        err << "  " << sourceLine << "\n  ";
        for (std::size_t i = 1; i < col; ++i) { err << (sourceLine[i - 1] == '\t' ? '\t' : ' '); }
        if (color) { err << kRed; }
        const std::size_t available = sourceLine.size() >= col ? sourceLine.size() - col + 1 : 1;
        const std::size_t width = std::clamp<std::size_t>(error.range().length, 1, available);
        err << '^';
        for (std::size_t i = 1; i < width; ++i) { err << '~'; }
        if (color) { err << kReset; }
        err << "\n";
    }

    void ParseCommand::print_error(std::ostream &err, const exceptions::SyntaxError &error,
                                   const std::string_view sourceLine, const bool color) {
        print_header(err, error, color);
        print_label(err, color);
        err << error.message() << "\n";
        print_source_with_caret(err, error, sourceLine, color);
    }
} // namespace rbparse::cli
