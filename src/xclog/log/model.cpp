#include "xclog/log/build_diagnostic.hpp"
#include "xclog/log/report.hpp"
#include "xclog/log/test_outcome.hpp"

namespace xclog::log {

auto ToString(Severity severity) -> const char* {
  switch (severity) {
    case Severity::kError:
      return "error";
    case Severity::kWarning:
      return "warning";
  }
  return "error";
}

auto ToString(TestStatus status) -> const char* {
  switch (status) {
    case TestStatus::kPassed:
      return "passed";
    case TestStatus::kFailed:
      return "failed";
  }
  return "failed";
}

auto ToString(RunStatus status) -> const char* {
  switch (status) {
    case RunStatus::kSuccess:
      return "success";
    case RunStatus::kFailure:
      return "failure";
  }
  return "failure";
}

}  // namespace xclog::log
