#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <regex>
#include <string>
#include <string_view>

namespace xclog::parse {

// Lines longer than this are not handed to std::regex. libstdc++'s matcher
// recurses per character and overflows the stack somewhere past 50k bytes.
// Only short result lines go through regex; file:line:column lines, which
// can carry arbitrarily long messages, use ScanLineColumn instead.
constexpr size_t kMaxRegexLineLength = 16384;

// Characters matched by \s.
constexpr std::string_view kWhitespace = " \t\r\n\f\v";

// "<line>:<column>:" as it follows a file path in compiler output.
struct LineColumn {
  std::string_view line;
  std::string_view column;
  size_t end;  // offset just past the colon after the column
};

// Strip leading and trailing spaces and tabs (not other whitespace).
auto TrimBlanks(std::string_view text) -> std::string_view;

// ASCII case-insensitive prefix test.
auto StartsWithIgnoreCase(std::string_view text, std::string_view prefix)
    -> bool;

// Whole-string integer conversion; nullopt on junk or overflow.
auto ParseInteger(std::string_view text) -> std::optional<int64_t>;

// Whole-string decimal conversion; nullopt on junk such as "1.2.3".
auto ParseDecimal(std::string_view text) -> std::optional<double>;

// Match "<digits>:<digits>:" directly after the colon at text[colon].
auto ScanLineColumn(std::string_view text, size_t colon)
    -> std::optional<LineColumn>;

// std::regex_search guarded by kMaxRegexLineLength.
auto SafeRegexSearch(
    const std::string& line, std::smatch& match, const std::regex& pattern)
    -> bool;

// Text of a capture group, or nullopt when the group did not participate.
auto CaptureOf(const std::smatch& match, size_t group)
    -> std::optional<std::string>;

}  // namespace xclog::parse
