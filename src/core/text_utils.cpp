#include "core/text_utils.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

namespace batchexec::core {

namespace {

constexpr std::string_view kEllipsis = "...";
constexpr std::string_view kUndefinedCell = "(undef)";

std::string PadRight(std::string_view text, std::size_t width) {
  std::string out(text);
  if (out.size() < width) {
    out.append(width - out.size(), ' ');
  }
  return out;
}

} // namespace

bool TrimPattern(std::string_view text, std::string_view pattern, std::string& out,
                 std::string& error) {
  error.clear();

  std::regex leading;
  std::regex trailing;
  try {
    leading = std::regex("^(?:" + std::string(pattern) + ")");
    trailing = std::regex("(?:" + std::string(pattern) + ")$");
  } catch (const std::regex_error& ex) {
    error = "invalid trim pattern '" + std::string(pattern) + "': " + ex.what();
    return false;
  }

  const std::string input(text);
  const std::string without_leading =
      std::regex_replace(input, leading, "", std::regex_constants::format_first_only);
  out = std::regex_replace(without_leading, trailing, "",
                           std::regex_constants::format_first_only);
  return true;
}

std::string TrimWhitespace(std::string_view text) {
  std::size_t begin = 0;
  while (begin < text.size() && std::isspace(static_cast<unsigned char>(text[begin])) != 0) {
    ++begin;
  }

  std::size_t end = text.size();
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1])) != 0) {
    --end;
  }

  return std::string(text.substr(begin, end - begin));
}

std::string Truncate(std::string_view text, std::size_t max_len) {
  if (text.size() <= max_len) {
    return std::string(text);
  }
  if (max_len <= kEllipsis.size()) {
    return std::string(kEllipsis.substr(0, max_len));
  }
  return std::string(text.substr(0, max_len - kEllipsis.size())) + std::string(kEllipsis);
}

std::string StripCarriageReturns(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (const char c : text) {
    if (c == '\r') {
      while (!out.empty() && out.back() == '\n') {
        out.pop_back();
      }
      continue;
    }
    out.push_back(c);
  }
  return out;
}

std::string StripNulBytes(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (const char c : text) {
    if (c != '\0') {
      out.push_back(c);
    }
  }
  return out;
}

std::vector<std::string> SplitWhitespace(std::string_view text) {
  std::vector<std::string> tokens;
  std::size_t cursor = 0;
  while (cursor < text.size()) {
    while (cursor < text.size() && std::isspace(static_cast<unsigned char>(text[cursor])) != 0) {
      ++cursor;
    }
    const std::size_t start = cursor;
    while (cursor < text.size() && std::isspace(static_cast<unsigned char>(text[cursor])) == 0) {
      ++cursor;
    }
    if (cursor > start) {
      tokens.emplace_back(text.substr(start, cursor - start));
    }
  }
  return tokens;
}

std::vector<std::string> Tabulate(const std::vector<TableRecord>& records,
                                  std::string_view sort_key, std::size_t max_len) {
  std::vector<std::string> lines;
  if (records.empty()) {
    return lines;
  }

  std::vector<std::string> header;
  for (const auto& [column, _] : records.front()) {
    if (column == sort_key) {
      header.insert(header.begin(), column);
    } else {
      header.push_back(column);
    }
  }

  std::vector<std::size_t> width;
  width.reserve(header.size());
  for (const std::string& column : header) {
    width.push_back(column.size());
  }

  std::vector<std::vector<std::string>> rows;
  rows.reserve(records.size());
  for (const TableRecord& record : records) {
    std::vector<std::string> row;
    row.reserve(header.size());
    for (std::size_t i = 0; i < header.size(); ++i) {
      const auto it = record.find(header[i]);
      std::string cell;
      if (it == record.end() || !it->second.has_value()) {
        cell = std::string(kUndefinedCell);
      } else {
        cell = Truncate(it->second.value(), max_len);
      }
      width[i] = std::max(width[i], cell.size());
      row.push_back(std::move(cell));
    }
    rows.push_back(std::move(row));
  }

  // Column 0 holds the sort key whenever the records carry it.
  const bool sortable = !header.empty() && header.front() == sort_key;
  if (sortable) {
    std::stable_sort(rows.begin(), rows.end(),
                     [](const auto& lhs, const auto& rhs) { return lhs.front() < rhs.front(); });
  }

  std::string line;
  for (std::size_t i = 0; i < header.size(); ++i) {
    line += PadRight(header[i], width[i] + 1U);
  }
  lines.push_back(std::move(line));

  for (const auto& row : rows) {
    line.clear();
    for (std::size_t i = 0; i < row.size(); ++i) {
      line += PadRight(row[i], width[i] + 1U);
    }
    lines.push_back(std::move(line));
  }

  return lines;
}

} // namespace batchexec::core
