#include "strata/analysis/diagnostics_engine.hpp"

#include <cstddef>
#include <cstdint>
#include <exception>
#include <expected>
#include <format>
#include <future>
#include <memory>
#include <optional>
#include <stop_token>
#include <string_view>
#include <utility>
#include <vector>

#include "strata/binding/bound_state.hpp"
#include "strata/common/diagnostic/diagnostic.hpp"
#include "strata/common/internal_error.hpp"
#include "strata/common/parallel.hpp"

namespace strata::analysis {

namespace {

// One scheduled unit of analyzer work: a single unit for analyzers that
// allow unit concurrency, otherwise every unit in order.
struct WorkItem {
  uint32_t analyzer = 0;
  std::optional<uint32_t> unit;
};

void ReportAnalyzerFailure(
    const Analyzer& analyzer, std::string_view reason, DiagnosticSet& out) {
  out.Report(
      Diagnostic::Warning(
          "STR9001",
          std::format(
              "analyzer '{}' threw an exception and was skipped: {}",
              analyzer.Name(), reason)));
}

void RunWorkItem(
    const Analyzer& analyzer, const WorkItem& item,
    const AnalysisContext& context, DiagnosticSet& out) {
  auto unit_count = static_cast<uint32_t>(context.sources.Units().size());
  try {
    if (item.unit) {
      analyzer.AnalyzeUnit(context, *item.unit, out);
      return;
    }
    for (uint32_t unit = 0; unit < unit_count; ++unit) {
      if (context.stop.stop_requested()) {
        return;
      }
      analyzer.AnalyzeUnit(context, unit, out);
    }
  } catch (const std::exception& e) {
    ReportAnalyzerFailure(analyzer, e.what(), out);
  } catch (...) {
    ReportAnalyzerFailure(analyzer, "unknown exception", out);
  }
}

auto RunAnalyzers(
    const SourceSet& sources,
    const std::vector<std::shared_ptr<const Analyzer>>& analyzers,
    const AnalyzerOptions& options, std::stop_token stop) -> AnalysisResult {
  const binding::BoundDeclarationState& bound = sources.GetBoundState();
  const auto unit_count = static_cast<uint32_t>(sources.Units().size());

  std::vector<WorkItem> items;
  for (uint32_t a = 0; a < analyzers.size(); ++a) {
    if (analyzers[a]->SupportsConcurrentUnits()) {
      for (uint32_t unit = 0; unit < unit_count; ++unit) {
        items.push_back(WorkItem{.analyzer = a, .unit = unit});
      }
    } else {
      items.push_back(WorkItem{.analyzer = a, .unit = std::nullopt});
    }
  }

  AnalysisContext context{
      .sources = sources,
      .bound = bound,
      .options = options,
      .stop = stop,
  };

  std::vector<DiagnosticSet> slots(items.size());
  common::ParallelFor(
      items.size(), sources.Options().Parallelism(), stop, [&](size_t i) {
        RunWorkItem(*analyzers[items[i].analyzer], items[i], context, slots[i]);
      });

  if (stop.stop_requested()) {
    return std::unexpected(AnalysisCancelled{});
  }

  DiagnosticSet merged = bound.Diagnostics();
  const auto& compile_options = sources.Options();
  size_t slot = 0;
  for (uint32_t a = 0; a < analyzers.size(); ++a) {
    DiagnosticSet analyzer_set;
    while (slot < items.size() && items[slot].analyzer == a) {
      analyzer_set.Append(std::move(slots[slot]));
      ++slot;
    }
    if (analyzers[a]->SuppressesDuplicates()) {
      analyzer_set.Deduplicate();
    }
    analyzer_set.ApplyOptions(
        compile_options.suppressed_codes, compile_options.warnings_as_errors);
    merged.Append(std::move(analyzer_set));
  }
  return merged;
}

}  // namespace

DiagnosticsEngine::DiagnosticsEngine(std::shared_ptr<const SourceSet> sources)
    : DiagnosticsEngine(std::move(sources), {}, AnalyzerOptions{}) {
}

DiagnosticsEngine::DiagnosticsEngine(
    std::shared_ptr<const SourceSet> sources,
    std::vector<std::shared_ptr<const Analyzer>> analyzers,
    AnalyzerOptions options)
    : sources_(std::move(sources)),
      analyzers_(std::move(analyzers)),
      options_(std::make_shared<const AnalyzerOptions>(std::move(options))) {
  if (sources_ == nullptr) {
    common::ThrowInternalError("DiagnosticsEngine", "null source set");
  }
  for (const auto& analyzer : analyzers_) {
    if (analyzer == nullptr) {
      common::ThrowInternalError("DiagnosticsEngine", "null analyzer");
    }
  }
}

auto DiagnosticsEngine::GetDiagnostics() const -> const DiagnosticSet& {
  return sources_->GetBoundState().Diagnostics();
}

auto DiagnosticsEngine::GetAllDiagnostics(std::stop_token stop) const
    -> AnalysisResult {
  return RunAnalyzers(*sources_, analyzers_, *options_, std::move(stop));
}

auto DiagnosticsEngine::GetAllDiagnosticsAsync(std::stop_token stop) const
    -> std::future<AnalysisResult> {
  return std::async(
      std::launch::async,
      [sources = sources_, analyzers = analyzers_, options = options_,
       stop = std::move(stop)] {
        return RunAnalyzers(*sources, analyzers, *options, stop);
      });
}

}  // namespace strata::analysis
