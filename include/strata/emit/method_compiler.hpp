#pragma once

#include <memory>

#include "strata/common/diagnostic/diagnostic_set.hpp"
#include "strata/emit/emit_options.hpp"
#include "strata/emit/module_build_state.hpp"
#include "strata/source/source_set.hpp"

namespace strata::emit {

// Checks the emit options against the source set and creates the Open
// module for one run. Option errors (STR0201..STR0204) are reported into
// `diagnostics` and yield nullptr.
//
// Declaration binding must have completed (SourceSet::IsBound()); a call
// before that is an invalid-state error.
auto CreateModuleBuildState(
    std::shared_ptr<const SourceSet> sources, const EmitOptions& options,
    DiagnosticSet& diagnostics) -> std::unique_ptr<ModuleBuildState>;

// Lowers every method body of the source set into `module`.
//
// The declaration diagnostics are surfaced first. With declaration errors,
// kFailClosed returns false without touching the module, kEmitAnyway keeps
// going and still returns false. Method bodies are compiled in isolation
// (in parallel when the source set allows it); a failing method reports its
// diagnostics and gets no body, and its siblings are compiled regardless.
// Method diagnostics are sorted by source location.
//
// Returns true iff no error was reported. Throws common::InvalidStateError
// if binding has not completed, the module is not Open, or its methods were
// already compiled.
auto CompileMethods(
    ModuleBuildState& module, EmitPolicy policy, DiagnosticSet& diagnostics)
    -> bool;

struct MethodCompilation {
  std::unique_ptr<ModuleBuildState> module;  // Null if the options were invalid
  bool success = false;
  DiagnosticSet diagnostics;
};

// CreateModuleBuildState followed by CompileMethods.
auto CompileMethods(
    std::shared_ptr<const SourceSet> sources, const EmitOptions& options,
    EmitPolicy policy) -> MethodCompilation;

}  // namespace strata::emit
