#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace xclog::log {

enum class Severity : uint8_t {
  kError,
  kWarning,
};

auto ToString(Severity severity) -> const char*;

// One compiler or tool message extracted from the build log. Location fields
// are populated together for `file:line:col:` diagnostics and are all absent
// for banner and tool-prefix errors.
struct BuildDiagnostic {
  std::optional<std::string> file;
  std::optional<int64_t> line;
  std::optional<int64_t> column;
  std::string message;
  Severity severity = Severity::kError;

  auto operator==(const BuildDiagnostic&) const -> bool = default;

  // Factory: error without source location
  static auto UnlocatedError(std::string msg) -> BuildDiagnostic {
    return BuildDiagnostic{
        .file = std::nullopt,
        .line = std::nullopt,
        .column = std::nullopt,
        .message = std::move(msg),
        .severity = Severity::kError,
    };
  }
};

}  // namespace xclog::log
