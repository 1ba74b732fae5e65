#pragma once

#include <ostream>
#include <string>

#include <nlohmann/json.hpp>

#include "xclog/common/diagnostic/diagnostic.hpp"
#include "xclog/log/report.hpp"

namespace xclog::report {

// Indent passed to nlohmann::json::dump; -1 selects single-line output.
inline constexpr int kDefaultJsonIndent = 2;
inline constexpr int kCompactJsonIndent = -1;

// Build the JSON document. Absent optionals are omitted, not null.
auto ToJson(const log::Report& report) -> nlohmann::ordered_json;

// Serialize the report. Fails (host error) when the report holds text that
// is not valid UTF-8.
auto SerializeReport(const log::Report& report, int indent)
    -> Result<std::string>;

// Serialize and write followed by a newline.
auto WriteReport(const log::Report& report, std::ostream& out, int indent)
    -> Result<void>;

}  // namespace xclog::report
