#pragma once

#include <optional>
#include <string_view>

#include "xclog/log/build_diagnostic.hpp"

namespace xclog::parse {

// Marker printed by xcodebuild when the overall build fails.
inline constexpr std::string_view kBuildFailedBanner = "** BUILD FAILED **";

// Recognize a compiler or tool diagnostic.
//
// Tried in order:
// 1. `<path>:<line>:<col>: error|warning: <message>` with full location
// 2. the BUILD FAILED banner, as an unlocated error
// 3. known tool prefixes (clang, ld, swiftc, xcodebuild, fatal error, ...)
//    at the start of the trimmed line, case-insensitive, as unlocated errors
auto MatchDiagnostic(std::string_view line)
    -> std::optional<log::BuildDiagnostic>;

}  // namespace xclog::parse
