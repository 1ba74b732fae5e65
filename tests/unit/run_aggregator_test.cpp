#include <gtest/gtest.h>

#include <chrono>
#include <optional>
#include <utility>

#include "tests/common/stepping_clock.hpp"
#include "xclog/log/build_diagnostic.hpp"
#include "xclog/log/report.hpp"
#include "xclog/log/test_outcome.hpp"
#include "xclog/report/clock.hpp"
#include "xclog/report/run_aggregator.hpp"

namespace xclog::report {
namespace {

using namespace std::chrono_literals;

auto Outcome(log::TestStatus status) -> log::TestOutcome {
  return log::TestOutcome{
      .suite = "S",
      .test_case = "t",
      .status = status,
      .duration = 0.5,
      .failure_message = std::nullopt,
      .file = std::nullopt,
      .line = std::nullopt,
  };
}

// =============================================================================
// FormatBuildTime
// =============================================================================

TEST(FormatBuildTimeTest, ThreeDecimals) {
  Clock::TimePoint start{};
  EXPECT_EQ(FormatBuildTime(start, start + 1500ms), "1.500");
  EXPECT_EQ(FormatBuildTime(start, start + 2s), "2.000");
  EXPECT_EQ(FormatBuildTime(start, start), "0.000");
}

TEST(FormatBuildTimeTest, MissingEndpoint) {
  Clock::TimePoint start{};
  EXPECT_EQ(FormatBuildTime(std::nullopt, start), "0.000");
  EXPECT_EQ(FormatBuildTime(start, std::nullopt), "0.000");
}

// =============================================================================
// BuildReport
// =============================================================================

TEST(BuildReportTest, EmptyStateIsSuccess) {
  auto report = BuildReport(RunState{}, ReportOptions{});

  EXPECT_EQ(report.status, log::RunStatus::kSuccess);
  EXPECT_EQ(report.summary, log::ReportSummary{});
  EXPECT_FALSE(report.warnings.has_value());
  EXPECT_FALSE(report.result_bundle_path.has_value());
}

TEST(BuildReportTest, ErrorsMakeFailure) {
  RunState state;
  state.errors.push_back(log::BuildDiagnostic::UnlocatedError("** BUILD FAILED **"));
  auto report = BuildReport(state, ReportOptions{});

  EXPECT_EQ(report.status, log::RunStatus::kFailure);
  EXPECT_EQ(report.summary.errors, 1);
}

TEST(BuildReportTest, FailedTestsMakeFailure) {
  RunState state;
  state.test_outcomes = {
      Outcome(log::TestStatus::kPassed),
      Outcome(log::TestStatus::kFailed),
      Outcome(log::TestStatus::kPassed),
  };
  auto report = BuildReport(state, ReportOptions{});

  EXPECT_EQ(report.status, log::RunStatus::kFailure);
  EXPECT_EQ(report.summary.passed_tests, 2);
  EXPECT_EQ(report.summary.failed_tests, 1);
  ASSERT_EQ(report.failed_tests.size(), 1U);
  EXPECT_EQ(report.failed_tests.front().status, log::TestStatus::kFailed);
}

TEST(BuildReportTest, WarningsListedOnlyWhenRequested) {
  RunState state;
  state.warnings.push_back(
      log::BuildDiagnostic{
          .file = "a.swift",
          .line = 1,
          .column = 2,
          .message = "unused",
          .severity = log::Severity::kWarning,
      });

  auto quiet = BuildReport(state, ReportOptions{});
  EXPECT_EQ(quiet.summary.warnings, 1);
  EXPECT_FALSE(quiet.warnings.has_value());
  EXPECT_EQ(quiet.status, log::RunStatus::kSuccess);

  auto loud = BuildReport(state, ReportOptions{.print_warnings = true});
  ASSERT_TRUE(loud.warnings.has_value());
  EXPECT_EQ(loud.warnings->size(), 1U);
}

// =============================================================================
// RunAggregator
// =============================================================================

TEST(RunAggregatorTest, RoutesDiagnosticsBySeverity) {
  test::SteppingClock clock(1s);
  RunAggregator aggregator(clock);
  aggregator.Consume("/a.swift:1:1: error: boom");
  aggregator.Consume("/a.swift:2:1: warning: hmm");
  aggregator.Consume("clang: error: linker failed");

  EXPECT_EQ(aggregator.State().errors.size(), 2U);
  EXPECT_EQ(aggregator.State().warnings.size(), 1U);
}

TEST(RunAggregatorTest, SuiteContextCarriesAcrossLines) {
  test::SteppingClock clock(1s);
  RunAggregator aggregator(clock);
  aggregator.Consume("Test Suite 'First' started at now");
  aggregator.Consume("✘ Test one() failed after 0.1 seconds.");
  aggregator.Consume("Test Suite 'Second' started at now");
  aggregator.Consume("✘ Test two() failed after 0.1 seconds.");

  auto report = std::move(aggregator).Finish(ReportOptions{});
  ASSERT_EQ(report.failed_tests.size(), 2U);
  EXPECT_EQ(report.failed_tests[0].suite, "First");
  EXPECT_EQ(report.failed_tests[1].suite, "Second");
}

TEST(RunAggregatorTest, LastResultBundleWins) {
  test::SteppingClock clock(1s);
  RunAggregator aggregator(clock);
  aggregator.Consume("/tmp/first.xcresult");
  aggregator.Consume("/tmp/second.xcresult");

  EXPECT_EQ(aggregator.State().result_bundle_path, "/tmp/second.xcresult");
}

TEST(RunAggregatorTest, StartsTimingAtFirstLine) {
  test::SteppingClock clock(2s);
  RunAggregator aggregator(clock);
  aggregator.Consume("first");
  aggregator.Consume("second");

  EXPECT_EQ(clock.Calls(), 1);
  EXPECT_TRUE(aggregator.State().start_time.has_value());
  EXPECT_FALSE(aggregator.State().end_time.has_value());
}

TEST(RunAggregatorTest, LastCompletionMarkerWins) {
  test::SteppingClock clock(2s);
  RunAggregator aggregator(clock);
  aggregator.Consume("** BUILD SUCCEEDED **");  // start, end
  aggregator.Consume("Test session results, code coverage, and logs:");

  auto report = std::move(aggregator).Finish(ReportOptions{});
  EXPECT_EQ(report.summary.build_time, "4.000");
  EXPECT_EQ(clock.Calls(), 3);
}

TEST(RunAggregatorTest, EndOfInputClosesTiming) {
  test::SteppingClock clock(3s);
  RunAggregator aggregator(clock);
  aggregator.Consume("compiling");

  auto report = std::move(aggregator).Finish(ReportOptions{});
  EXPECT_EQ(report.summary.build_time, "3.000");
}

TEST(RunAggregatorTest, NoLinesMeansNoBuildTime) {
  test::SteppingClock clock(3s);
  RunAggregator aggregator(clock);

  auto report = std::move(aggregator).Finish(ReportOptions{});
  EXPECT_EQ(report.summary.build_time, "0.000");
  EXPECT_EQ(report.status, log::RunStatus::kSuccess);
}

}  // namespace
}  // namespace xclog::report
