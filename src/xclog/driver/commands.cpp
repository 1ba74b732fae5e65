#include "commands.hpp"

#include <unistd.h>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <system_error>
#include <utility>

#include <fmt/core.h>

#include "argparse/argparse.hpp"
#include "input.hpp"
#include "print.hpp"
#include "verbose_logger.hpp"
#include "xclog/common/diagnostic/diagnostic.hpp"
#include "xclog/log/report.hpp"
#include "xclog/report/json_writer.hpp"
#include "xclog/report/log_parser.hpp"

namespace xclog::driver {

namespace {

// A clean parse stops at end of stream; anything else is a read error.
auto ReachedEnd(const std::istream& in) -> bool {
  return !in.bad() && in.eof();
}

auto ParseInput(const RunOptions& options) -> std::optional<log::Report> {
  report::LogParser parser({.print_warnings = options.print_warnings});

  if (options.input) {
    std::string path = options.input->string();
    std::error_code ec;
    if (std::filesystem::is_directory(*options.input, ec)) {
      PrintError(fmt::format("cannot open '{}': is a directory", path));
      return std::nullopt;
    }
    std::ifstream in(*options.input);
    if (!in) {
      PrintError(fmt::format("cannot open '{}'", path));
      return std::nullopt;
    }
    PhaseTimer timer("parse");
    auto report = parser.Parse(in);
    if (!ReachedEnd(in)) {
      PrintError(fmt::format("failed to read '{}'", path));
      return std::nullopt;
    }
    return report;
  }

  if (isatty(STDIN_FILENO) != 0) {
    PrintDiagnostic(
        Diagnostic::Warning(
            "reading build log from the terminal; pipe xcodebuild output or "
            "use --input"));
  }
  PhaseTimer timer("parse", true);
  auto report = parser.Parse(std::cin);
  if (!ReachedEnd(std::cin)) {
    PrintError("failed to read standard input");
    return std::nullopt;
  }
  return report;
}

auto EmitReport(const log::Report& report, const RunOptions& options) -> int {
  PhaseTimer timer("emit");

  if (options.output) {
    std::ofstream out(*options.output);
    if (!out) {
      PrintError(
          fmt::format("cannot open '{}' for writing", options.output->string()));
      return 1;
    }
    auto written = report::WriteReport(report, out, options.indent);
    if (!written) {
      PrintDiagnostic(written.error());
      return 1;
    }
    return 0;
  }

  auto written = report::WriteReport(report, std::cout, options.indent);
  if (!written) {
    PrintDiagnostic(written.error());
    return 1;
  }
  return 0;
}

}  // namespace

auto ParseCommand(const argparse::ArgumentParser& cmd) -> int {
  std::optional<ProjectConfig> config;
  {
    PhaseTimer timer("load_config");
    auto config_result = LoadOptionalConfig(cmd);
    if (!config_result) {
      PrintDiagnostic(config_result.error());
      return 1;
    }
    config = std::move(*config_result);
  }

  auto options = BuildOptions(cmd, config);

  auto report = ParseInput(options);
  if (!report) {
    return 1;
  }
  return EmitReport(*report, options);
}

}  // namespace xclog::driver
