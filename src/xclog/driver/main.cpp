#include <argparse/argparse.hpp>
#include <cstddef>
#include <exception>
#include <iostream>
#include <span>
#include <string>
#include <vector>

#include "commands.hpp"
#include "input.hpp"
#include "print.hpp"
#include "verbose_logger.hpp"

auto main(int argc, char* argv[]) -> int {
  auto args = xclog::driver::PreprocessArgs(
      std::span<char*>(argv, static_cast<size_t>(argc)));

  argparse::ArgumentParser program("xclog", "0.1.0");
  program.add_description(
      "Convert xcodebuild output into a JSON build and test report.\n"
      "Usage: xcodebuild test ... 2>&1 | xclog [--print-warnings]");

  int verbosity = 0;
  program.add_argument("-v", "--verbose")
      .action([&](const auto&) { ++verbosity; })
      .append()
      .default_value(false)
      .implicit_value(true)
      .nargs(0)
      .help("Log progress to stderr (repeatable: -v, -vv, -vvv)");
  xclog::driver::AddReportFlags(program);

  try {
    program.parse_args(args);
  } catch (const std::exception& err) {
    xclog::driver::PrintError(err.what());
    std::cerr << program;
    return 1;
  }

  xclog::driver::ConfigureLogging(verbosity);
  return xclog::driver::ParseCommand(program);
}
