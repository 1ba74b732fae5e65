#include "xclog/parse/suite_context.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace xclog::parse {

auto MatchSuiteStarted(std::string_view line) -> std::optional<std::string> {
  if (line.find("Test Suite '") == std::string_view::npos ||
      line.find("' started at") == std::string_view::npos) {
    return std::nullopt;
  }
  // Name sits between the first and second single quote.
  auto open = line.find('\'');
  auto close = line.find('\'', open + 1);
  if (close == std::string_view::npos) {
    return std::string(line.substr(open + 1));
  }
  return std::string(line.substr(open + 1, close - open - 1));
}

auto SuiteContext::NameOrLabel() const -> std::string {
  if (current_) {
    return *current_;
  }
  return std::string(kSwiftTestingSuiteLabel);
}

}  // namespace xclog::parse
