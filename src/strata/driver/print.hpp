#pragma once

#include <cstdio>
#include <string>

#include "strata/common/diagnostic/diagnostic.hpp"
#include "strata/common/diagnostic/diagnostic_set.hpp"
#include "strata/common/source_manager.hpp"

namespace strata::driver {

void PrintError(const std::string& message);
void PrintWarning(const std::string& message);
void PrintDiagnostic(const Diagnostic& diag);
void PrintDiagnostics(
    const DiagnosticSet& diagnostics, const SourceManager* source_manager,
    FILE* sink = stderr);

}  // namespace strata::driver
