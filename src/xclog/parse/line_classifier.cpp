#include "xclog/parse/line_classifier.hpp"

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "xclog/log/test_outcome.hpp"
#include "xclog/parse/diagnostic_matcher.hpp"
#include "xclog/parse/result_bundle_matcher.hpp"
#include "xclog/parse/suite_context.hpp"
#include "xclog/parse/swift_testing_matcher.hpp"
#include "xclog/parse/xctest_matcher.hpp"

namespace xclog::parse {

namespace {

// Priority order matters: the markers are distinct, but an issue line must be
// seen before the generic failure matcher.
constexpr std::array<TestResultMatcher, 4> kTestResultMatchers = {
    &MatchSwiftTestingIssue,
    &MatchSwiftTestingSuccess,
    &MatchSwiftTestingFailure,
    [](std::string_view line, std::string_view /*suite*/) {
      return MatchXcTestResult(line);
    },
};

constexpr std::array<std::string_view, 3> kCompletionMarkers = {
    "Test session results",
    "BUILD SUCCEEDED",
    "BUILD FAILED",
};

}  // namespace

auto MatchTestResults(std::string_view line, std::string_view suite)
    -> std::vector<log::TestOutcome> {
  for (TestResultMatcher matcher : kTestResultMatchers) {
    if (auto outcomes = matcher(line, suite)) {
      return std::move(*outcomes);
    }
  }
  return {};
}

auto IsCompletionMarker(std::string_view line) -> bool {
  for (std::string_view marker : kCompletionMarkers) {
    if (line.find(marker) != std::string_view::npos) {
      return true;
    }
  }
  return false;
}

auto ClassifyLine(std::string_view line, const SuiteContext& suite_context)
    -> LineClassification {
  LineClassification result;

  result.diagnostic = MatchDiagnostic(line);
  if (result.diagnostic) {
    spdlog::trace(
        "{} diagnostic: {}", log::ToString(result.diagnostic->severity),
        result.diagnostic->message);
  }

  result.suite_started = MatchSuiteStarted(line);
  if (result.suite_started) {
    spdlog::trace("test suite started: {}", *result.suite_started);
  }

  std::string suite = result.suite_started ? *result.suite_started
                                           : suite_context.NameOrLabel();
  result.test_outcomes = MatchTestResults(line, suite);
  for (const auto& outcome : result.test_outcomes) {
    spdlog::trace(
        "test {}: {} / {}", log::ToString(outcome.status), outcome.suite,
        outcome.test_case);
  }

  result.result_bundle_path = MatchResultBundlePath(line);
  if (result.result_bundle_path) {
    spdlog::trace("result bundle: {}", *result.result_bundle_path);
  }

  result.completion_marker = IsCompletionMarker(line);
  if (result.completion_marker) {
    spdlog::trace("completion marker: {}", line);
  }

  return result;
}

}  // namespace xclog::parse
