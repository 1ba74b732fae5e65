#pragma once

#include <istream>
#include <memory>
#include <string>
#include <vector>

#include "xclog/log/report.hpp"
#include "xclog/report/clock.hpp"
#include "xclog/report/run_aggregator.hpp"

namespace xclog::report {

// Parses xcodebuild output into a Report.
//
// Every Parse call runs a fresh RunAggregator, so one LogParser can be used
// for any number of independent passes.
//
// Usage:
//   LogParser parser({.print_warnings = true});
//   auto report = parser.Parse(std::cin);
class LogParser {
 public:
  explicit LogParser(
      ReportOptions options = {},
      std::unique_ptr<Clock> clock = std::make_unique<SteadyClock>());

  // Read lines until end of stream. A trailing '\r' is dropped per line.
  auto Parse(std::istream& in) -> log::Report;

  auto ParseLines(const std::vector<std::string>& lines) -> log::Report;

 private:
  ReportOptions options_;
  std::unique_ptr<Clock> clock_;
};

}  // namespace xclog::report
