#include "xclog/parse/result_bundle_matcher.hpp"

#include <optional>
#include <string>
#include <string_view>

#include "xclog/parse/text_utils.hpp"

namespace xclog::parse {

auto MatchResultBundlePath(std::string_view line)
    -> std::optional<std::string> {
  std::string_view trimmed = TrimBlanks(line);
  if (!trimmed.ends_with(kResultBundleSuffix) || !trimmed.starts_with('/')) {
    return std::nullopt;
  }
  return std::string(trimmed);
}

}  // namespace xclog::parse
