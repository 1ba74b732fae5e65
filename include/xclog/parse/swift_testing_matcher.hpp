#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include "xclog/log/test_outcome.hpp"

namespace xclog::parse {

// Upper bound on outcomes materialized from one "with N test cases" line.
inline constexpr int64_t kMaxExpandedCases = 100000;

// Swift Testing result matchers. Each takes the suite name to attach (the
// caller resolves the suite context and fallback label) and returns:
// - nullopt when the line is not theirs
// - a vector (possibly empty) when the line is theirs; an empty vector is a
//   deliberate "consumed, record nothing"

// `✘ Test "<name>" recorded an issue ... at <file>:<line>:<col>: <message>`
// Always exactly one failed outcome carrying file, line and message.
auto MatchSwiftTestingIssue(std::string_view line, std::string_view suite)
    -> std::optional<std::vector<log::TestOutcome>>;

// `✔ Test "<name>"|<name>() [with N test cases] passed after <d> seconds.`
// N passed outcomes, suffixed " [case i]" when N > 1. N is capped at
// kMaxExpandedCases.
auto MatchSwiftTestingSuccess(std::string_view line, std::string_view suite)
    -> std::optional<std::vector<log::TestOutcome>>;

// `✗|✘ Test "<name>"|<name>() [with N test cases] failed after <d> seconds`
// Parameterized rollups ("with ... test cases ... issues") are consumed with
// no outcomes: their failures arrive as individual issue lines.
auto MatchSwiftTestingFailure(std::string_view line, std::string_view suite)
    -> std::optional<std::vector<log::TestOutcome>>;

}  // namespace xclog::parse
