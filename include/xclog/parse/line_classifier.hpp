#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "xclog/log/build_diagnostic.hpp"
#include "xclog/log/test_outcome.hpp"
#include "xclog/parse/suite_context.hpp"

namespace xclog::parse {

// Everything one line contributes. Categories are independent and may all be
// populated for the same line; test outcomes come from at most one matcher.
struct LineClassification {
  std::optional<log::BuildDiagnostic> diagnostic;
  std::optional<std::string> suite_started;
  std::vector<log::TestOutcome> test_outcomes;
  std::optional<std::string> result_bundle_path;
  bool completion_marker = false;
};

// Signature shared by the test-result matchers in the dispatch table.
using TestResultMatcher = auto (*)(std::string_view line, std::string_view suite)
    -> std::optional<std::vector<log::TestOutcome>>;

// Try the test-result matchers in priority order (Swift Testing issue,
// success, failure, then XCTest). The first matcher returning a value wins,
// including a deliberately empty one.
auto MatchTestResults(std::string_view line, std::string_view suite)
    -> std::vector<log::TestOutcome>;

// True for lines that mark the end of a build or test session.
auto IsCompletionMarker(std::string_view line) -> bool;

// Classify one line against the suite context as it was before this line.
// A suite announced on the same line applies to that line's own results.
// Pure: the caller applies suite_started to its context.
auto ClassifyLine(std::string_view line, const SuiteContext& suite_context)
    -> LineClassification;

}  // namespace xclog::parse
