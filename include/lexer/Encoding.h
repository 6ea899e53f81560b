/**
 * Name: rbparse::lex encoding helpers
 * Purpose: Magic-comment detection and byte-sequence validation for source encodings.
 * Theory of Operation:
 *   Ruby names (UTF-8, Shift_JIS, EUC-JP, ASCII-8BIT, ...) are canonicalized to
 *   upper case and mapped onto ICU converter names. Validation runs the bytes
 *   through an ICU converter configured to stop at the first illegal or
 *   truncated sequence.
 */
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace rbparse::lex {

struct MagicComments {
    std::optional<std::string> encoding{}; // as written in the comment
    std::optional<bool> frozenStringLiteral{};
};

// Scans the leading comment lines (line 1, or line 2 after a shebang, for the
// encoding; any leading comment for frozen_string_literal).
MagicComments DetectMagicComments(std::string_view source);

// Upper-cased Ruby name with aliases folded (BINARY -> ASCII-8BIT, CP932 -> WINDOWS-31J, ...).
std::string CanonicalEncodingName(std::string_view name);

// True when ICU (or the built-in byte rules) can validate the encoding.
bool IsKnownEncoding(std::string_view name);

// True for encodings whose 7-bit range coincides with ASCII; only those can hold Ruby source.
bool IsAsciiCompatible(std::string_view name);

// Offset of the first byte that does not start a valid sequence, or nullopt.
std::optional<size_t> FindInvalidSequence(std::string_view bytes, std::string_view encoding);

} // namespace rbparse::lex
