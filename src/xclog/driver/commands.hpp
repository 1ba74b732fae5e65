#pragma once

#include <argparse/argparse.hpp>

namespace xclog::driver {

// Parse a build log and emit the JSON report. Returns the process exit code.
auto ParseCommand(const argparse::ArgumentParser& cmd) -> int;

}  // namespace xclog::driver
