#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace batchexec::core {

// One row for Tabulate: column name -> cell (std::nullopt renders "(undef)").
using TableRecord = std::map<std::string, std::optional<std::string>>;

inline constexpr std::size_t kDefaultMaxLen = 30;
inline constexpr std::string_view kWhitespacePattern = "\\s+";

// Removes one leading and one trailing match of the ECMAScript `pattern`.
// Returns false with `error` set when the pattern does not compile.
bool TrimPattern(std::string_view text, std::string_view pattern, std::string& out,
                 std::string& error);

std::string TrimWhitespace(std::string_view text);

// Shortens `text` to `max_len` characters, ending in "..." when cut.
std::string Truncate(std::string_view text, std::size_t max_len = kDefaultMaxLen);

// Drops carriage returns (and any newlines directly before them), turning DOS
// records into plain lines.
std::string StripCarriageReturns(std::string_view text);

// Removes embedded NUL bytes left behind by UTF-16 shell output.
std::string StripNulBytes(std::string_view text);

// Splits on runs of whitespace; no empty tokens.
std::vector<std::string> SplitWhitespace(std::string_view text);

// Renders records as left-aligned fixed-width lines: a header line followed
// by one line per record ordered by `sort_key`. Columns are taken from the
// first record with `sort_key` first and the rest alphabetical. Cells are
// truncated to `max_len`.
std::vector<std::string> Tabulate(const std::vector<TableRecord>& records,
                                  std::string_view sort_key = "name",
                                  std::size_t max_len = kDefaultMaxLen);

} // namespace batchexec::core
