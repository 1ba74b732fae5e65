#pragma once

#include <argparse/argparse.hpp>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "config.hpp"
#include "xclog/common/diagnostic/diagnostic.hpp"
#include "xclog/report/json_writer.hpp"

namespace xclog::driver {

// Fully resolved options for one invocation.
struct RunOptions {
  bool print_warnings = false;
  int indent = report::kDefaultJsonIndent;
  std::optional<std::filesystem::path> input;   // nullopt reads stdin
  std::optional<std::filesystem::path> output;  // nullopt writes stdout
};

// Expand bundled verbosity flags: -vvv -> -v -v -v
auto PreprocessArgs(std::span<char*> argv) -> std::vector<std::string>;

// Add --print-warnings, --input, --output, --compact, --config, --no-config.
void AddReportFlags(argparse::ArgumentParser& cmd);

// Load the config named by --config, or discover xclog.toml unless
// --no-config was given. nullopt when no config applies.
auto LoadOptionalConfig(const argparse::ArgumentParser& cmd)
    -> Result<std::optional<ProjectConfig>>;

// Merge CLI arguments over config values over built-in defaults.
auto BuildOptions(
    const argparse::ArgumentParser& cmd,
    const std::optional<ProjectConfig>& config) -> RunOptions;

}  // namespace xclog::driver
