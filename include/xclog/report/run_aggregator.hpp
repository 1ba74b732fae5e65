#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "xclog/log/build_diagnostic.hpp"
#include "xclog/log/report.hpp"
#include "xclog/log/test_outcome.hpp"
#include "xclog/parse/suite_context.hpp"
#include "xclog/report/clock.hpp"

namespace xclog::report {

struct ReportOptions {
  bool print_warnings = false;
};

// Accumulated state of one parse pass.
struct RunState {
  std::vector<log::BuildDiagnostic> errors;
  std::vector<log::BuildDiagnostic> warnings;
  std::vector<log::TestOutcome> test_outcomes;  // passed and failed
  parse::SuiteContext suite_context;
  std::optional<std::string> result_bundle_path;  // last one wins
  std::optional<Clock::TimePoint> start_time;     // first line
  std::optional<Clock::TimePoint> end_time;       // last completion marker
};

// Format elapsed seconds with three decimals; "0.000" when either end is
// missing.
auto FormatBuildTime(
    const std::optional<Clock::TimePoint>& start,
    const std::optional<Clock::TimePoint>& end) -> std::string;

// Derive the final report from a finished pass.
auto BuildReport(const RunState& state, const ReportOptions& options)
    -> log::Report;

// Owns the RunState of exactly one pass. Not reusable: Finish() consumes it.
class RunAggregator {
 public:
  explicit RunAggregator(Clock& clock) : clock_(clock) {
  }

  void Consume(std::string_view line);

  // Close the pass at end of input and produce the report.
  auto Finish(const ReportOptions& options) && -> log::Report;

  [[nodiscard]] auto State() const -> const RunState& {
    return state_;
  }

 private:
  Clock& clock_;
  RunState state_;
};

}  // namespace xclog::report
