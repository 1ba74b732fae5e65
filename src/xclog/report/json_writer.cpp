#include "xclog/report/json_writer.hpp"

#include <expected>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "xclog/common/diagnostic/diagnostic.hpp"
#include "xclog/log/build_diagnostic.hpp"
#include "xclog/log/report.hpp"
#include "xclog/log/test_outcome.hpp"

namespace xclog::report {

namespace {

using Json = nlohmann::ordered_json;

template <typename T>
void SetIfPresent(Json& j, const char* key, const std::optional<T>& value) {
  if (value) {
    j[key] = *value;
  }
}

auto ToJson(const log::BuildDiagnostic& diag) -> Json {
  Json j = Json::object();
  SetIfPresent(j, "file", diag.file);
  SetIfPresent(j, "line", diag.line);
  SetIfPresent(j, "column", diag.column);
  j["message"] = diag.message;
  j["type"] = log::ToString(diag.severity);
  return j;
}

auto ToJson(const log::TestOutcome& outcome) -> Json {
  Json j = Json::object();
  j["suite"] = outcome.suite;
  j["testCase"] = outcome.test_case;
  j["status"] = log::ToString(outcome.status);
  SetIfPresent(j, "duration", outcome.duration);
  SetIfPresent(j, "failureMessage", outcome.failure_message);
  SetIfPresent(j, "file", outcome.file);
  SetIfPresent(j, "line", outcome.line);
  return j;
}

auto ToJson(const std::vector<log::BuildDiagnostic>& diags) -> Json {
  Json arr = Json::array();
  for (const auto& diag : diags) {
    arr.push_back(ToJson(diag));
  }
  return arr;
}

}  // namespace

auto ToJson(const log::Report& report) -> nlohmann::ordered_json {
  Json j = Json::object();
  j["status"] = log::ToString(report.status);
  j["summary"] = {
      {"errors", report.summary.errors},
      {"warnings", report.summary.warnings},
      {"passedTests", report.summary.passed_tests},
      {"failedTests", report.summary.failed_tests},
      {"buildTime", report.summary.build_time},
  };
  j["errors"] = ToJson(report.errors);
  if (report.warnings) {
    j["warnings"] = ToJson(*report.warnings);
  }
  Json tests = Json::array();
  for (const auto& outcome : report.failed_tests) {
    tests.push_back(ToJson(outcome));
  }
  j["testResults"] = std::move(tests);
  SetIfPresent(j, "xcresultPath", report.result_bundle_path);
  return j;
}

auto SerializeReport(const log::Report& report, int indent)
    -> Result<std::string> {
  try {
    return ToJson(report).dump(indent);
  } catch (const nlohmann::json::exception& e) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format("failed to encode build summary: {}", e.what())));
  }
}

auto WriteReport(const log::Report& report, std::ostream& out, int indent)
    -> Result<void> {
  auto text = SerializeReport(report, indent);
  if (!text) {
    return std::unexpected(std::move(text.error()));
  }
  out << *text << '\n';
  out.flush();
  if (!out) {
    return std::unexpected(
        Diagnostic::HostError("failed to write build summary"));
  }
  return {};
}

}  // namespace xclog::report
