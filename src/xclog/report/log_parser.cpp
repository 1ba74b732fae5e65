#include "xclog/report/log_parser.hpp"

#include <istream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "xclog/log/report.hpp"
#include "xclog/report/clock.hpp"
#include "xclog/report/run_aggregator.hpp"

namespace xclog::report {

LogParser::LogParser(ReportOptions options, std::unique_ptr<Clock> clock)
    : options_(options), clock_(std::move(clock)) {
}

auto LogParser::Parse(std::istream& in) -> log::Report {
  RunAggregator aggregator(*clock_);
  spdlog::debug("parse pass started");

  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    aggregator.Consume(line);
  }
  return std::move(aggregator).Finish(options_);
}

auto LogParser::ParseLines(const std::vector<std::string>& lines)
    -> log::Report {
  RunAggregator aggregator(*clock_);
  spdlog::debug("parse pass started ({} lines)", lines.size());

  for (const auto& line : lines) {
    aggregator.Consume(line);
  }
  return std::move(aggregator).Finish(options_);
}

}  // namespace xclog::report
