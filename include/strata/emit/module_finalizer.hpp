#pragma once

#include <span>

#include "strata/common/diagnostic/diagnostic_set.hpp"
#include "strata/emit/module_build_state.hpp"

namespace strata::emit {

// Completes an Open module whose methods were compiled, then seals it.
//
// Steps, in order:
//   1. attach manifest resources (unnamed or duplicate names: STR0401, the
//      offending resource is skipped);
//   2. generate the documentation document when requested (undocumented
//      publicly visible members: STR0402);
//   3. report imports used neither by declarations nor by method bodies
//      (STR0403), except for metadata-only output;
//   4. seal the module (Open -> Finalized).
//
// Returns true iff no error was reported. Throws common::InvalidStateError if
// the module is not Open or its methods were not compiled, so a second call
// on the same module fails.
auto Finalize(
    ModuleBuildState& module, std::span<const ManifestResource> resources,
    DiagnosticSet& diagnostics) -> bool;

}  // namespace strata::emit
