#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace xclog::parse {

// Suite name used by Swift Testing results when no suite was announced yet.
inline constexpr std::string_view kSwiftTestingSuiteLabel = "Swift Testing";

// Extract <name> from "Test Suite '<name>' started at ...".
auto MatchSuiteStarted(std::string_view line) -> std::optional<std::string>;

// Most recently announced test suite. Persists until the next announcement.
class SuiteContext {
 public:
  void Set(std::string name) {
    current_ = std::move(name);
  }

  [[nodiscard]] auto Current() const -> const std::optional<std::string>& {
    return current_;
  }

  // Current suite, or kSwiftTestingSuiteLabel when none was announced.
  [[nodiscard]] auto NameOrLabel() const -> std::string;

 private:
  std::optional<std::string> current_;
};

}  // namespace xclog::parse
