#pragma once

#include <optional>
#include <string_view>
#include <vector>

#include "xclog/log/test_outcome.hpp"

namespace xclog::parse {

// Recognize `Test Case '-[<Suite> <test>]' passed|failed (<d> seconds).`
//
// Suite and test names always come from the line itself. XCTest reports the
// failure location on separate lines, so no file/line/message is attached.
auto MatchXcTestResult(std::string_view line)
    -> std::optional<std::vector<log::TestOutcome>>;

}  // namespace xclog::parse
