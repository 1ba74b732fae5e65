#include "xclog/report/run_aggregator.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "xclog/log/build_diagnostic.hpp"
#include "xclog/log/report.hpp"
#include "xclog/log/test_outcome.hpp"
#include "xclog/parse/line_classifier.hpp"

namespace xclog::report {

auto FormatBuildTime(
    const std::optional<Clock::TimePoint>& start,
    const std::optional<Clock::TimePoint>& end) -> std::string {
  if (!start || !end) {
    return "0.000";
  }
  std::chrono::duration<double> elapsed = *end - *start;
  return fmt::format("{:.3f}", elapsed.count());
}

auto BuildReport(const RunState& state, const ReportOptions& options)
    -> log::Report {
  auto is_failed = [](const log::TestOutcome& outcome) {
    return outcome.status == log::TestStatus::kFailed;
  };

  log::Report report;
  report.summary.errors = static_cast<int64_t>(state.errors.size());
  report.summary.warnings = static_cast<int64_t>(state.warnings.size());
  report.summary.failed_tests = std::ranges::count_if(
      state.test_outcomes, is_failed);
  report.summary.passed_tests =
      static_cast<int64_t>(state.test_outcomes.size()) -
      report.summary.failed_tests;
  report.summary.build_time = FormatBuildTime(state.start_time, state.end_time);

  report.status = state.errors.empty() && report.summary.failed_tests == 0
                      ? log::RunStatus::kSuccess
                      : log::RunStatus::kFailure;

  report.errors = state.errors;
  if (options.print_warnings) {
    report.warnings = state.warnings;
  }
  std::ranges::copy_if(
      state.test_outcomes, std::back_inserter(report.failed_tests), is_failed);
  report.result_bundle_path = state.result_bundle_path;
  return report;
}

void RunAggregator::Consume(std::string_view line) {
  if (!state_.start_time) {
    state_.start_time = clock_.Now();
  }

  auto classified = parse::ClassifyLine(line, state_.suite_context);

  if (classified.diagnostic) {
    if (classified.diagnostic->severity == log::Severity::kError) {
      state_.errors.push_back(std::move(*classified.diagnostic));
    } else {
      state_.warnings.push_back(std::move(*classified.diagnostic));
    }
  }

  if (classified.suite_started) {
    state_.suite_context.Set(std::move(*classified.suite_started));
  }

  std::ranges::move(
      classified.test_outcomes, std::back_inserter(state_.test_outcomes));

  if (classified.result_bundle_path) {
    state_.result_bundle_path = std::move(classified.result_bundle_path);
  }

  if (classified.completion_marker) {
    state_.end_time = clock_.Now();
  }
}

auto RunAggregator::Finish(const ReportOptions& options) && -> log::Report {
  if (!state_.end_time) {
    state_.end_time = clock_.Now();
  }
  auto report = BuildReport(state_, options);
  spdlog::debug(
      "parse pass finished: {} errors, {} warnings, {} passed, {} failed",
      report.summary.errors, report.summary.warnings,
      report.summary.passed_tests, report.summary.failed_tests);
  return report;
}

}  // namespace xclog::report
