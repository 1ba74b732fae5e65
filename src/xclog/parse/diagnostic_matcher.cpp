#include "xclog/parse/diagnostic_matcher.hpp"

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "xclog/log/build_diagnostic.hpp"
#include "xclog/parse/text_utils.hpp"

namespace xclog::parse {

namespace {

// Tool errors that carry no file:line:col but still fail the build.
constexpr std::array<std::string_view, 9> kToolErrorPrefixes = {
    "clang: error:",          "ld: error:",
    "swiftc: error:",         "error: linker command failed",
    "error: fatalError",      "fatal error:",
    "xcodebuild: error:",     "error: unable to",
    "error: cannot",
};

// Severity keyword and message after "<file>:<line>:<column>:". Mirrors
// `\s+(error|warning):\s+(.+)$`.
auto MatchSeverityAndMessage(std::string_view rest)
    -> std::optional<std::pair<log::Severity, std::string_view>> {
  size_t keyword = rest.find_first_not_of(kWhitespace);
  if (keyword == 0 || keyword == std::string_view::npos) {
    return std::nullopt;
  }
  rest.remove_prefix(keyword);

  log::Severity severity = log::Severity::kError;
  if (rest.starts_with("error:")) {
    rest.remove_prefix(std::string_view("error:").size());
  } else if (rest.starts_with("warning:")) {
    severity = log::Severity::kWarning;
    rest.remove_prefix(std::string_view("warning:").size());
  } else {
    return std::nullopt;
  }

  size_t message = rest.find_first_not_of(kWhitespace);
  if (message == 0) {
    return std::nullopt;
  }
  if (message == std::string_view::npos) {
    // All blank: the regex gives the last blank to the message.
    if (rest.size() < 2) {
      return std::nullopt;
    }
    message = rest.size() - 1;
  }
  return std::pair{severity, rest.substr(message)};
}

// /path/to/File.swift:15:5: error: cannot find 'foo' in scope
//
// Scanned rather than matched with a regex: compiler messages can run to
// many kilobytes. The path is the shortest prefix that is followed by a
// complete location and severity.
auto MatchLocatedDiagnostic(std::string_view line)
    -> std::optional<log::BuildDiagnostic> {
  for (size_t colon = line.find(':', 1); colon != std::string_view::npos;
       colon = line.find(':', colon + 1)) {
    auto location = ScanLineColumn(line, colon);
    if (!location) {
      continue;
    }
    auto tail = MatchSeverityAndMessage(line.substr(location->end));
    if (!tail) {
      continue;
    }
    return log::BuildDiagnostic{
        .file = std::string(line.substr(0, colon)),
        .line = ParseInteger(location->line),
        .column = ParseInteger(location->column),
        .message = std::string(tail->second),
        .severity = tail->first,
    };
  }
  return std::nullopt;
}

}  // namespace

auto MatchDiagnostic(std::string_view line)
    -> std::optional<log::BuildDiagnostic> {
  if (auto located = MatchLocatedDiagnostic(line)) {
    return located;
  }

  std::string_view trimmed = TrimBlanks(line);

  if (line.find(kBuildFailedBanner) != std::string_view::npos) {
    return log::BuildDiagnostic::UnlocatedError(std::string(trimmed));
  }

  for (std::string_view prefix : kToolErrorPrefixes) {
    if (StartsWithIgnoreCase(trimmed, prefix)) {
      return log::BuildDiagnostic::UnlocatedError(std::string(trimmed));
    }
  }

  return std::nullopt;
}

}  // namespace xclog::parse
