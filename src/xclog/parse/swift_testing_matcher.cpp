#include "xclog/parse/swift_testing_matcher.hpp"

#include <cstdint>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "xclog/log/test_outcome.hpp"
#include "xclog/parse/text_utils.hpp"

namespace xclog::parse {

namespace {

constexpr std::string_view kPassedMarker = "✔ Test";
constexpr std::string_view kFailedMarker = "✘ Test";
constexpr std::string_view kFailedAltMarker = "✗ Test";

const std::regex kSuccessPattern(
    "✔ Test (?:\"([^\"]+)\"|(\\w+\\(\\))) "
    "(?:with (\\d+) test cases )?passed after ([\\d.]+) seconds\\.");

const std::regex kFailurePattern(
    "(?:✗|✘) Test (?:\"([^\"]+)\"|(\\w+\\(\\))) "
    "(?:with (\\d+) test cases )?failed after ([\\d.]+) seconds");

auto Contains(std::string_view line, std::string_view needle) -> bool {
  return line.find(needle) != std::string_view::npos;
}

struct IssueLocation {
  std::string_view file;
  std::string_view line;
  std::string_view message;
};

// "<file>:<line>:<column>: <message>" following the last "at " that starts
// one, as in `.*at ([^:]+):(\d+):\d+: (.+)$`.
auto FindIssueLocation(std::string_view details)
    -> std::optional<IssueLocation> {
  for (size_t at = details.rfind("at "); at != std::string_view::npos;
       at = at == 0 ? std::string_view::npos : details.rfind("at ", at - 1)) {
    size_t file_begin = at + 3;
    size_t colon = details.find(':', file_begin);
    if (colon == std::string_view::npos || colon == file_begin) {
      continue;
    }
    auto location = ScanLineColumn(details, colon);
    if (!location || location->end + 1 >= details.size() ||
        details[location->end] != ' ') {
      continue;
    }
    return IssueLocation{
        .file = details.substr(file_begin, colon - file_begin),
        .line = location->line,
        .message = details.substr(location->end + 1),
    };
  }
  return std::nullopt;
}

// Expand a (possibly parameterized) result line into one outcome per case.
// Groups: 1 quoted name, 2 bare `name()`, 3 case count, 4 duration.
auto ExpandCases(
    const std::smatch& match, std::string_view suite, log::TestStatus status)
    -> std::vector<log::TestOutcome> {
  std::string name;
  if (auto quoted = CaptureOf(match, 1)) {
    name = std::move(*quoted);
  } else if (auto bare = CaptureOf(match, 2)) {
    name = std::move(*bare);
  }

  int64_t count = 1;
  if (auto count_text = CaptureOf(match, 3)) {
    count = ParseInteger(*count_text).value_or(1);
  }
  if (count > kMaxExpandedCases) {
    spdlog::warn(
        "test '{}' reports {} cases; recording the first {}", name, count,
        kMaxExpandedCases);
    count = kMaxExpandedCases;
  }
  std::optional<double> duration = ParseDecimal(match[4].str());

  std::vector<log::TestOutcome> outcomes;
  for (int64_t index = 0; index < count; ++index) {
    outcomes.push_back(
        log::TestOutcome{
            .suite = std::string(suite),
            .test_case =
                count > 1 ? fmt::format("{} [case {}]", name, index + 1)
                          : name,
            .status = status,
            .duration = duration,
            .failure_message = std::nullopt,
            .file = std::nullopt,
            .line = std::nullopt,
        });
  }
  return outcomes;
}

}  // namespace

auto MatchSwiftTestingIssue(std::string_view line, std::string_view suite)
    -> std::optional<std::vector<log::TestOutcome>> {
  constexpr std::string_view kHeader = "✘ Test \"";
  constexpr std::string_view kRecorded = "\" recorded an issue";

  if (!Contains(line, kFailedMarker) || !Contains(line, "recorded an issue")) {
    return std::nullopt;
  }

  // Scanned rather than matched with a regex: issue messages carry the
  // failed expression and can be arbitrarily long.
  for (size_t header = line.find(kHeader); header != std::string_view::npos;
       header = line.find(kHeader, header + 1)) {
    size_t name_begin = header + kHeader.size();
    size_t name_end = line.find('"', name_begin);
    if (name_end == std::string_view::npos || name_end == name_begin ||
        line.substr(name_end).substr(0, kRecorded.size()) != kRecorded) {
      continue;
    }

    auto location = FindIssueLocation(line.substr(name_end + kRecorded.size()));
    if (!location) {
      continue;
    }

    return std::vector<log::TestOutcome>{
        log::TestOutcome{
            .suite = std::string(suite),
            .test_case =
                std::string(line.substr(name_begin, name_end - name_begin)),
            .status = log::TestStatus::kFailed,
            .duration = std::nullopt,
            .failure_message = std::string(location->message),
            .file = std::string(location->file),
            .line = ParseInteger(location->line),
        },
    };
  }
  return std::nullopt;
}

auto MatchSwiftTestingSuccess(std::string_view line, std::string_view suite)
    -> std::optional<std::vector<log::TestOutcome>> {
  if (!Contains(line, kPassedMarker) || !Contains(line, "passed after")) {
    return std::nullopt;
  }

  std::string text(line);
  std::smatch match;
  if (!SafeRegexSearch(text, match, kSuccessPattern)) {
    return std::nullopt;
  }
  return ExpandCases(match, suite, log::TestStatus::kPassed);
}

auto MatchSwiftTestingFailure(std::string_view line, std::string_view suite)
    -> std::optional<std::vector<log::TestOutcome>> {
  if ((!Contains(line, kFailedAltMarker) && !Contains(line, kFailedMarker)) ||
      !Contains(line, "failed after")) {
    return std::nullopt;
  }

  // Parameterized rollup: its failures are reported as individual issues.
  if (Contains(line, "with") && Contains(line, "test cases") &&
      Contains(line, "issues")) {
    return std::vector<log::TestOutcome>{};
  }

  std::string text(line);
  std::smatch match;
  if (!SafeRegexSearch(text, match, kFailurePattern)) {
    return std::nullopt;
  }
  return ExpandCases(match, suite, log::TestStatus::kFailed);
}

}  // namespace xclog::parse
