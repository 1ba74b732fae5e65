#include "xclog/parse/text_utils.hpp"

#include <cctype>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <system_error>

namespace xclog::parse {

auto TrimBlanks(std::string_view text) -> std::string_view {
  auto start = text.find_first_not_of(" \t");
  if (start == std::string_view::npos) {
    return {};
  }
  auto end = text.find_last_not_of(" \t");
  return text.substr(start, end - start + 1);
}

auto StartsWithIgnoreCase(std::string_view text, std::string_view prefix)
    -> bool {
  if (text.size() < prefix.size()) {
    return false;
  }
  for (size_t i = 0; i < prefix.size(); ++i) {
    auto a = static_cast<unsigned char>(text[i]);
    auto b = static_cast<unsigned char>(prefix[i]);
    if (std::tolower(a) != std::tolower(b)) {
      return false;
    }
  }
  return true;
}

auto ParseInteger(std::string_view text) -> std::optional<int64_t> {
  int64_t value = 0;
  const char* end = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(text.data(), end, value);
  if (ec != std::errc{} || ptr != end) {
    return std::nullopt;
  }
  return value;
}

auto ParseDecimal(std::string_view text) -> std::optional<double> {
  double value = 0.0;
  const char* end = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(text.data(), end, value);
  if (ec != std::errc{} || ptr != end) {
    return std::nullopt;
  }
  return value;
}

namespace {

auto DigitRunEnd(std::string_view text, size_t pos) -> size_t {
  while (pos < text.size() &&
         std::isdigit(static_cast<unsigned char>(text[pos])) != 0) {
    ++pos;
  }
  return pos;
}

}  // namespace

auto ScanLineColumn(std::string_view text, size_t colon)
    -> std::optional<LineColumn> {
  if (colon >= text.size() || text[colon] != ':') {
    return std::nullopt;
  }
  size_t line_begin = colon + 1;
  size_t line_end = DigitRunEnd(text, line_begin);
  if (line_end == line_begin || line_end >= text.size() ||
      text[line_end] != ':') {
    return std::nullopt;
  }
  size_t column_begin = line_end + 1;
  size_t column_end = DigitRunEnd(text, column_begin);
  if (column_end == column_begin || column_end >= text.size() ||
      text[column_end] != ':') {
    return std::nullopt;
  }
  return LineColumn{
      .line = text.substr(line_begin, line_end - line_begin),
      .column = text.substr(column_begin, column_end - column_begin),
      .end = column_end + 1,
  };
}

auto SafeRegexSearch(
    const std::string& line, std::smatch& match, const std::regex& pattern)
    -> bool {
  if (line.size() > kMaxRegexLineLength) {
    return false;
  }
  return std::regex_search(line, match, pattern);
}

auto CaptureOf(const std::smatch& match, size_t group)
    -> std::optional<std::string> {
  if (group >= match.size() || !match[group].matched) {
    return std::nullopt;
  }
  return match[group].str();
}

}  // namespace xclog::parse
