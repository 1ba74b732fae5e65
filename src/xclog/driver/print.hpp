#pragma once

#include <string>

#include "xclog/common/diagnostic/diagnostic.hpp"

namespace xclog::driver {

void PrintError(const std::string& message);
void PrintDiagnostic(const Diagnostic& diag);

}  // namespace xclog::driver
