#include "strata/pipeline/pipeline.hpp"

#include <format>
#include <memory>
#include <stop_token>
#include <utility>

#include "strata/analysis/diagnostics_engine.hpp"
#include "strata/binding/bound_state.hpp"
#include "strata/common/diagnostic/diagnostic_set.hpp"
#include "strata/common/internal_error.hpp"
#include "strata/common/verbose_logger.hpp"
#include "strata/emit/method_compiler.hpp"
#include "strata/emit/module_build_state.hpp"
#include "strata/emit/module_finalizer.hpp"
#include "strata/emit/serializer.hpp"

namespace strata::pipeline {

namespace {

void Bind(const SourceSet& sources, common::VerboseLogger& vlog) {
  common::PhaseTimer timer(vlog, "bind");
  const auto& bound = sources.GetBoundState();
  vlog.Detail(
      "bind", std::format(
                  "{} units, {} types, {} methods, {} diagnostics",
                  sources.Units().size(), bound.Types().size(),
                  bound.Methods().size(), bound.Diagnostics().Size()));
}

}  // namespace

auto Check(
    const std::shared_ptr<const SourceSet>& sources,
    common::VerboseLogger& vlog) -> DiagnosticSet {
  if (sources == nullptr) {
    common::ThrowInternalError("pipeline::Check", "null source set");
  }
  Bind(*sources, vlog);
  analysis::DiagnosticsEngine engine(sources);
  return engine.GetDiagnostics();
}

auto Analyze(
    const analysis::DiagnosticsEngine& engine, std::stop_token stop,
    common::VerboseLogger& vlog) -> analysis::AnalysisResult {
  Bind(engine.Sources(), vlog);
  common::PhaseTimer timer(vlog, "analyze");
  auto result = engine.GetAllDiagnostics(std::move(stop));
  if (result) {
    vlog.Detail(
        "analyze", std::format(
                       "{} analyzers, {} diagnostics", engine.Analyzers().size(),
                       result->Size()));
  } else {
    vlog.Detail("analyze", "cancelled");
  }
  return result;
}

auto Emit(
    const std::shared_ptr<const SourceSet>& sources, const EmitRequest& request,
    common::VerboseLogger& vlog) -> emit::SerializationResult {
  if (sources == nullptr) {
    common::ThrowInternalError("pipeline::Emit", "null source set");
  }
  Bind(*sources, vlog);

  emit::SerializationResult result;
  std::unique_ptr<emit::ModuleBuildState> module;
  bool success = false;
  {
    common::PhaseTimer timer(vlog, "compile_methods");
    module = emit::CreateModuleBuildState(
        sources, request.options, result.diagnostics);
    if (module == nullptr) {
      vlog.Detail("compile_methods", "invalid emit options");
      return result;
    }
    success =
        emit::CompileMethods(*module, request.policy, result.diagnostics);
    vlog.Detail(
        "compile_methods",
        std::format(
            "{} of {} method bodies", module->MethodBodyCount(),
            module->Bound().Methods().size()));
  }
  if (!success && request.policy == emit::EmitPolicy::kFailClosed) {
    // Declaration or method-body errors: nothing is finalized or written.
    vlog.Detail("compile_methods", "errors under fail-closed; not emitting");
    return result;
  }

  {
    common::PhaseTimer timer(vlog, "finalize");
    success = emit::Finalize(*module, request.resources, result.diagnostics) &&
              success;
  }

  {
    common::PhaseTimer timer(vlog, "serialize");
    auto serialized = emit::Serialize(*module, request.streams);
    result.diagnostics.Append(std::move(serialized.diagnostics));
    result.written = serialized.written;
    success = serialized.success && success;
  }

  result.success = success;
  return result;
}

}  // namespace strata::pipeline
