#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "xclog/log/build_diagnostic.hpp"
#include "xclog/log/test_outcome.hpp"

namespace xclog::log {

enum class RunStatus : uint8_t {
  kSuccess,
  kFailure,
};

auto ToString(RunStatus status) -> const char*;

struct ReportSummary {
  int64_t errors = 0;
  int64_t warnings = 0;
  int64_t passed_tests = 0;
  int64_t failed_tests = 0;
  std::string build_time = "0.000";  // seconds, three decimals

  auto operator==(const ReportSummary&) const -> bool = default;
};

// Final result of one parse pass.
//
// Invariants:
// - status == kSuccess iff errors is empty and summary.failed_tests == 0
// - failed_tests holds only kFailed outcomes, summary.failed_tests of them
// - warnings has_value() iff warning reporting was requested
struct Report {
  RunStatus status = RunStatus::kSuccess;
  ReportSummary summary;
  std::vector<BuildDiagnostic> errors;
  std::optional<std::vector<BuildDiagnostic>> warnings;
  std::vector<TestOutcome> failed_tests;
  std::optional<std::string> result_bundle_path;

  auto operator==(const Report&) const -> bool = default;
};

}  // namespace xclog::log
