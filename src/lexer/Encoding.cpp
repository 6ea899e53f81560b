/***
 * Name: rbparse::lex encoding helpers
 * Purpose: ICU-backed validation of Ruby source encodings.
 */
#include "lexer/Encoding.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <memory>
#include <vector>

#include <unicode/ucnv.h>
#include <unicode/ucnv_err.h>
#include <unicode/utypes.h>

namespace rbparse::lex {

namespace {

struct EncodingAlias {
  std::string_view ruby;
  std::string_view canonical;
};

constexpr std::array<EncodingAlias, 12> kAliases{{
    {"BINARY", "ASCII-8BIT"},
    {"ASCII", "US-ASCII"},
    {"ANSI_X3.4-1968", "US-ASCII"},
    {"646", "US-ASCII"},
    {"UTF8", "UTF-8"},
    {"CP65001", "UTF-8"},
    {"CP932", "WINDOWS-31J"},
    {"CSWINDOWS31J", "WINDOWS-31J"},
    {"SJIS", "WINDOWS-31J"},
    {"EUCJP", "EUC-JP"},
    {"CP1252", "WINDOWS-1252"},
    {"ISO8859-1", "ISO-8859-1"},
}};

// Canonical Ruby name -> ICU converter name. Encodings missing here fall back
// to asking ICU for the canonical name directly.
constexpr std::array<EncodingAlias, 9> kIcuNames{{
    {"UTF-8", "UTF-8"},
    {"SHIFT_JIS", "Shift_JIS"},
    {"WINDOWS-31J", "windows-31j"},
    {"EUC-JP", "EUC-JP"},
    {"EUC-KR", "EUC-KR"},
    {"BIG5", "Big5"},
    {"GB18030", "GB18030"},
    {"WINDOWS-1252", "windows-1252"},
    {"KOI8-R", "KOI8-R"},
}};

std::string icuName(const std::string& canonical) {
  for (const auto& entry : kIcuNames) {
    if (entry.ruby == canonical) { return std::string(entry.canonical); }
  }
  return canonical;
}

bool isWide(const std::string& canonical) {
  return canonical.rfind("UTF-16", 0) == 0 || canonical.rfind("UTF-32", 0) == 0 || canonical == "UCS-2BE" ||
         canonical == "UCS-4LE";
}

using ConverterPtr = std::unique_ptr<UConverter, decltype(&ucnv_close)>;

ConverterPtr openConverter(const std::string& canonical) {
  UErrorCode status = U_ZERO_ERROR;
  UConverter* conv = ucnv_open(icuName(canonical).c_str(), &status);
  if (U_FAILURE(status)) { conv = nullptr; }
  return ConverterPtr(conv, &ucnv_close);
}

std::string readEncodingName(std::string_view line, size_t pos) {
  while (pos < line.size() && (line[pos] == ' ' || line[pos] == '\t')) { ++pos; }
  size_t end = pos;
  while (end < line.size() &&
         (std::isalnum(static_cast<unsigned char>(line[end])) != 0 || line[end] == '-' || line[end] == '_' ||
          line[end] == '.')) {
    ++end;
  }
  return std::string(line.substr(pos, end - pos));
}

std::string lowered(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

// "coding" followed by ':' or '=' anywhere in a comment line covers the plain,
// Emacs (-*- coding: x -*-) and Vim (fileencoding=x) spellings.
std::optional<std::string> codingFromComment(std::string_view line) {
  const std::string lower = lowered(line);
  size_t pos = lower.find("coding");
  while (pos != std::string::npos) {
    const size_t after = pos + 6;
    if (after < lower.size() && (lower[after] == ':' || lower[after] == '=')) {
      std::string name = readEncodingName(line, after + 1);
      if (!name.empty()) { return name; }
    }
    pos = lower.find("coding", after);
  }
  return std::nullopt;
}

std::optional<bool> frozenFromComment(std::string_view line) {
  const std::string lower = lowered(line);
  size_t pos = lower.find("frozen_string_literal");
  if (pos == std::string::npos) { pos = lower.find("frozen-string-literal"); }
  if (pos == std::string::npos) { return std::nullopt; }
  pos += 21;
  while (pos < lower.size() && (lower[pos] == ' ' || lower[pos] == '\t')) { ++pos; }
  if (pos >= lower.size() || lower[pos] != ':') { return std::nullopt; }
  const std::string value = lowered(readEncodingName(line, pos + 1));
  if (value == "true") { return true; }
  if (value == "false") { return false; }
  return std::nullopt;
}

} // namespace

MagicComments DetectMagicComments(std::string_view source) {
  MagicComments out;
  size_t pos = 0;
  int lineNo = 0;
  while (pos < source.size()) {
    size_t end = source.find('\n', pos);
    if (end == std::string_view::npos) { end = source.size(); }
    std::string_view line = source.substr(pos, end - pos);
    ++lineNo;
    size_t first = line.find_first_not_of(" \t\r");
    if (first == std::string_view::npos) {
      pos = end + 1;
      continue;
    }
    if (line[first] != '#') { break; }
    const bool shebang = lineNo == 1 && line.rfind("#!", 0) == 0;
    if (!shebang) {
      if (!out.encoding && lineNo <= 2) { out.encoding = codingFromComment(line); }
      if (auto frozen = frozenFromComment(line)) { out.frozenStringLiteral = frozen; }
    }
    pos = end + 1;
  }
  return out;
}

std::string CanonicalEncodingName(std::string_view name) {
  std::string upper(name);
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  for (const auto& alias : kAliases) {
    if (alias.ruby == upper) { return std::string(alias.canonical); }
  }
  return upper;
}

bool IsKnownEncoding(std::string_view name) {
  const std::string canonical = CanonicalEncodingName(name);
  if (canonical == "ASCII-8BIT" || canonical == "US-ASCII") { return true; }
  return static_cast<bool>(openConverter(canonical));
}

bool IsAsciiCompatible(std::string_view name) {
  return !isWide(CanonicalEncodingName(name));
}

std::optional<size_t> FindInvalidSequence(std::string_view bytes, std::string_view encoding) {
  const std::string canonical = CanonicalEncodingName(encoding);
  if (canonical == "ASCII-8BIT") { return std::nullopt; }
  if (canonical == "US-ASCII") {
    for (size_t i = 0; i < bytes.size(); ++i) {
      if (static_cast<unsigned char>(bytes[i]) >= 0x80) { return i; }
    }
    return std::nullopt;
  }
  ConverterPtr conv = openConverter(canonical);
  if (!conv) { return std::nullopt; }
  UErrorCode status = U_ZERO_ERROR;
  ucnv_setToUCallBack(conv.get(), UCNV_TO_U_CALLBACK_STOP, nullptr, nullptr, nullptr, &status);
  if (U_FAILURE(status)) { return std::nullopt; }

  std::vector<UChar> scratch(4096);
  const char* source = bytes.data();
  const char* const limit = bytes.data() + bytes.size();
  while (true) {
    UChar* target = scratch.data();
    status = U_ZERO_ERROR;
    ucnv_toUnicode(conv.get(), &target, scratch.data() + scratch.size(), &source, limit, nullptr, true, &status);
    if (status == U_BUFFER_OVERFLOW_ERROR) { continue; }
    if (U_SUCCESS(status)) { return std::nullopt; }
    std::array<char, 32> invalid{};
    int8_t invalidLength = static_cast<int8_t>(invalid.size());
    UErrorCode invalidStatus = U_ZERO_ERROR;
    ucnv_getInvalidChars(conv.get(), invalid.data(), &invalidLength, &invalidStatus);
    const size_t consumed = static_cast<size_t>(source - bytes.data());
    const size_t back = U_SUCCESS(invalidStatus) ? static_cast<size_t>(invalidLength) : 0;
    return consumed >= back ? consumed - back : 0;
  }
}

} // namespace rbparse::lex
