/**
 * @file
 * @brief Declarations for rbparse CLI argument parsing helpers.
 */
#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "cli/Options.h"
#include "cli/ColorMode.h"

namespace rbparse::cli::detail {

/** Return true if `arg` exactly matches the `flag`. */
bool isFlag(std::string_view arg, std::string_view flag);

/** Parse `--color=<value>` to ColorMode with default fallback. */
ColorMode parseColorValue(std::string_view value);

/** Collect remaining argv items as input paths starting at index. */
void collectRemainingAsInputs(std::size_t startIndex, int argc, char** argv, Options& out);

/** Detect unknown option-like arguments beginning with '-' that aren't supported. "-" alone is stdin. */
bool isUnknownOptionArg(std::string_view arg);

/** Reject combinations that cannot run (inline code together with files, no input at all). */
bool hasConflictingInputs(const Options& opts);

/** Handle boolean, flag-only options like -h, --dump-ast, --metrics, etc. */
bool applySimpleBoolFlags(std::string_view arg, Options& out);

/** Handle `--key=value` style options (variant, encoding, log-path, color, start-line). */
bool applyPrefixedOptions(std::string_view arg, Options& out);

/** Handle `-e <code>` by consuming the next argv item; false when the code is missing. */
bool handleInlineSourceFlag(int& idx, int argc, char** argv, Options& out);

} // namespace rbparse::cli::detail
