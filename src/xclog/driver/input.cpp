#include "input.hpp"

#include <cstddef>
#include <expected>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "argparse/argparse.hpp"
#include "config.hpp"
#include "xclog/common/diagnostic/diagnostic.hpp"
#include "xclog/report/json_writer.hpp"

namespace xclog::driver {

auto PreprocessArgs(std::span<char*> argv) -> std::vector<std::string> {
  std::vector<std::string> result;
  for (char* raw_arg : argv) {
    std::string_view arg = raw_arg;
    if (arg.size() > 2 && arg.starts_with("-v") &&
        arg.find_first_not_of('v', 1) == std::string_view::npos) {
      for (size_t i = 1; i < arg.size(); ++i) {
        result.emplace_back("-v");
      }
    } else {
      result.emplace_back(arg);
    }
  }
  return result;
}

void AddReportFlags(argparse::ArgumentParser& cmd) {
  cmd.add_argument("--print-warnings")
      .default_value(false)
      .implicit_value(true)
      .help("Include the warnings array in the report");
  cmd.add_argument("-i", "--input")
      .metavar("file")
      .help("Read the build log from <file> instead of stdin ('-' for stdin)");
  cmd.add_argument("-o", "--output")
      .metavar("file")
      .help("Write the report to <file> instead of stdout");
  cmd.add_argument("--compact")
      .default_value(false)
      .implicit_value(true)
      .help("Emit the report on a single line");
  cmd.add_argument("--config").metavar("file").help(
      "Read defaults from <file> instead of searching for xclog.toml");
  cmd.add_argument("--no-config")
      .default_value(false)
      .implicit_value(true)
      .help("Ignore xclog.toml");
}

auto LoadOptionalConfig(const argparse::ArgumentParser& cmd)
    -> Result<std::optional<ProjectConfig>> {
  std::optional<std::filesystem::path> config_path;
  if (auto explicit_path = cmd.present<std::string>("--config")) {
    config_path = *explicit_path;
  } else if (!cmd.get<bool>("--no-config")) {
    config_path = FindConfig();
  }

  if (!config_path) {
    return std::nullopt;
  }

  auto config = LoadConfig(*config_path);
  if (!config) {
    return std::unexpected(std::move(config.error()));
  }
  return std::optional<ProjectConfig>(std::move(*config));
}

auto BuildOptions(
    const argparse::ArgumentParser& cmd,
    const std::optional<ProjectConfig>& config) -> RunOptions {
  RunOptions options;

  // Config first, then CLI overrides
  if (config) {
    options.print_warnings = config->print_warnings.value_or(false);
    options.indent = config->indent.value_or(report::kDefaultJsonIndent);
  }
  if (cmd.get<bool>("--print-warnings")) {
    options.print_warnings = true;
  }
  if (cmd.get<bool>("--compact")) {
    options.indent = report::kCompactJsonIndent;
  }

  if (auto input = cmd.present<std::string>("--input")) {
    if (*input != "-") {
      options.input = *input;
    }
  }
  if (auto output = cmd.present<std::string>("--output")) {
    options.output = *output;
  }
  return options;
}

}  // namespace xclog::driver
