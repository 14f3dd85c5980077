#pragma once

#include <memory>
#include <stop_token>
#include <vector>

#include "strata/analysis/diagnostics_engine.hpp"
#include "strata/common/diagnostic/diagnostic_set.hpp"
#include "strata/common/verbose_logger.hpp"
#include "strata/emit/emit_options.hpp"
#include "strata/emit/module_build_state.hpp"
#include "strata/emit/serializer.hpp"
#include "strata/source/source_set.hpp"

namespace strata::pipeline {

// Everything one emit run needs besides the sources.
struct EmitRequest {
  emit::EmitOptions options;
  emit::EmitPolicy policy = emit::EmitPolicy::kFailClosed;
  std::vector<emit::ManifestResource> resources;
  emit::EmitStreams streams;
};

// Declaration binding ("bind" phase); returns the declaration diagnostics.
auto Check(
    const std::shared_ptr<const SourceSet>& sources,
    common::VerboseLogger& vlog) -> DiagnosticSet;

// Binding followed by the analyzer pass ("analyze" phase).
auto Analyze(
    const analysis::DiagnosticsEngine& engine, std::stop_token stop,
    common::VerboseLogger& vlog) -> analysis::AnalysisResult;

// Runs bind, compile_methods, finalize and serialize for one run.
//
// Under kFailClosed, declaration errors end the run after compile_methods
// with nothing written. Under kEmitAnyway the module is still finalized and
// serialized, and the result still reports failure. Invalid emit options
// end the run before any method is compiled. The returned diagnostics hold
// every stage's output in stage order.
auto Emit(
    const std::shared_ptr<const SourceSet>& sources, const EmitRequest& request,
    common::VerboseLogger& vlog) -> emit::SerializationResult;

}  // namespace strata::pipeline
