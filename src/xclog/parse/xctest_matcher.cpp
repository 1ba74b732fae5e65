#include "xclog/parse/xctest_matcher.hpp"

#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include "xclog/log/test_outcome.hpp"
#include "xclog/parse/text_utils.hpp"

namespace xclog::parse {

namespace {

// Test Case '-[MyAppTests testExample]' passed (0.001 seconds).
const std::regex kXcTestPattern(
    R"(Test Case '-\[(.+?)\s+(.+?)\]' (passed|failed) \((\d+\.\d+) seconds\)\.)");

}  // namespace

auto MatchXcTestResult(std::string_view line)
    -> std::optional<std::vector<log::TestOutcome>> {
  if (line.find("Test Case '-[") == std::string_view::npos) {
    return std::nullopt;
  }

  std::string text(line);
  std::smatch match;
  if (!SafeRegexSearch(text, match, kXcTestPattern)) {
    return std::nullopt;
  }

  return std::vector<log::TestOutcome>{
      log::TestOutcome{
          .suite = match[1].str(),
          .test_case = match[2].str(),
          .status = match[3].str() == "passed" ? log::TestStatus::kPassed
                                               : log::TestStatus::kFailed,
          .duration = ParseDecimal(match[4].str()),
          .failure_message = std::nullopt,
          .file = std::nullopt,
          .line = std::nullopt,
      },
  };
}

}  // namespace xclog::parse
