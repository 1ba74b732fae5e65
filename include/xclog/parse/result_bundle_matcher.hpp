#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace xclog::parse {

inline constexpr std::string_view kResultBundleSuffix = ".xcresult";

// Return the trimmed line when it is an absolute path to an .xcresult bundle.
auto MatchResultBundlePath(std::string_view line) -> std::optional<std::string>;

}  // namespace xclog::parse
