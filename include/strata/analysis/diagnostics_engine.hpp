#pragma once

#include <expected>
#include <future>
#include <memory>
#include <span>
#include <stop_token>
#include <vector>

#include "strata/analysis/analyzer.hpp"
#include "strata/common/diagnostic/diagnostic_set.hpp"
#include "strata/source/source_set.hpp"

namespace strata::analysis {

// Outcome of an analyzer run that was stopped before every analyzer
// finished. Carries no diagnostics on purpose: a cancelled run never hands
// out a partial set.
struct AnalysisCancelled {
  auto operator==(const AnalysisCancelled&) const -> bool = default;
};

using AnalysisResult = std::expected<DiagnosticSet, AnalysisCancelled>;

// Produces the diagnostics of a SourceSet.
//
// Plain mode returns the declaration diagnostics, binding on first use.
// Analyzer-augmented mode additionally runs every registered analyzer over
// the bound declarations and merges their output after the declaration
// diagnostics, grouped by analyzer registration order.
class DiagnosticsEngine {
 public:
  explicit DiagnosticsEngine(std::shared_ptr<const SourceSet> sources);
  DiagnosticsEngine(
      std::shared_ptr<const SourceSet> sources,
      std::vector<std::shared_ptr<const Analyzer>> analyzers,
      AnalyzerOptions options);

  // Plain mode. Synchronous; never suspends.
  [[nodiscard]] auto GetDiagnostics() const -> const DiagnosticSet&;

  // Analyzer-augmented mode, blocking the caller until every analyzer
  // completed or `stop` was requested.
  [[nodiscard]] auto GetAllDiagnostics(std::stop_token stop = {}) const
      -> AnalysisResult;

  // Analyzer-augmented mode on a background task. The task keeps its own
  // references to the inputs, so the engine may go away before it ends.
  [[nodiscard]] auto GetAllDiagnosticsAsync(std::stop_token stop = {}) const
      -> std::future<AnalysisResult>;

  [[nodiscard]] auto Sources() const -> const SourceSet& {
    return *sources_;
  }

  [[nodiscard]] auto Analyzers() const
      -> std::span<const std::shared_ptr<const Analyzer>> {
    return analyzers_;
  }

 private:
  std::shared_ptr<const SourceSet> sources_;
  std::vector<std::shared_ptr<const Analyzer>> analyzers_;
  std::shared_ptr<const AnalyzerOptions> options_;
};

}  // namespace strata::analysis
