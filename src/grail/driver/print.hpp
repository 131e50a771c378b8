#pragma once

#include <string>

#include "grail/common/diagnostic.hpp"
#include "grail/common/internal_error.hpp"

namespace grail::driver {

void PrintError(const std::string& message);
void PrintDiagnostic(const Diagnostic& diag);

// Lowering faults are compiler bugs, not query errors; they get their own
// banner so they are never mistaken for a problem in the user's input.
void PrintInternalError(const common::InternalError& error);

}  // namespace grail::driver
